#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "clouddrive/remote_types.hpp"

namespace clouddrive::client
{

    // Exactly one of the members is set.
    struct ChunkResult
    {
        std::optional<remote::UploadSessionInfo> session;
        std::optional<remote::DriveItem> item;
    };

    struct UploadSessionStatus
    {
        bool complete{};
        // Offset of the first byte the service still expects.
        std::uint64_t watermark{};
    };

    // Remote drive operations used by the long-running-operation machinery. Every failure is
    // thrown as clouddrive::Error.
    class RemoteService
    {
    public:
        virtual ~RemoteService() = default;

        virtual remote::UploadSessionInfo open_upload_session(const std::string &remote_path) = 0;

        // Sends bytes [start, end] of a `total`-byte resource.
        virtual ChunkResult send_chunk(const std::string &upload_handle, std::uint64_t start, std::uint64_t end,
                                       std::uint64_t total, std::span<const std::byte> bytes) = 0;

        virtual UploadSessionStatus query_upload_session(const std::string &upload_handle) = 0;

        virtual void cancel_upload_session(const std::string &upload_handle) = 0;

        // Creates the empty resource an upload session was opened for. Upload sessions reject
        // zero-length ranges, so the session is closed and the resource written directly.
        virtual remote::DriveItem finalize_empty_upload(const std::string &upload_handle,
                                                        const std::string &remote_path) = 0;

        virtual remote::AsyncOperationStatus query_async_operation(const std::string &job_handle) = 0;

        // Starts a server-side copy and returns the job handle (monitor URL).
        virtual std::string start_copy(const std::string &source_path, const std::string &destination_parent,
                                       const std::string &new_name) = 0;

        virtual remote::UserInfo get_me() = 0;
    };

} // namespace clouddrive::client

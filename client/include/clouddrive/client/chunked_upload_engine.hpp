#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>

#include "clouddrive/client/cancellation.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/remote_service.hpp"
#include "clouddrive/client/state_store.hpp"
#include "clouddrive/error_codes.hpp"
#include "clouddrive/remote_types.hpp"

namespace clouddrive::client
{

    // Chunk sizes must be a multiple of this for the Graph upload protocol.
    constexpr std::uint64_t kUploadAlignment = 320 * 1024;
    constexpr std::uint64_t kDefaultChunkSize = 5 * kUploadAlignment;

    struct UploadOptions
    {
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::uint64_t alignment{kUploadAlignment};
        // Called after every accepted chunk with (bytes completed, total size).
        std::function<void(std::uint64_t, std::uint64_t)> on_progress;
        const CancellationToken *cancellation{nullptr};
    };

    enum class UploadStatus : std::uint8_t
    {
        Succeeded,
        Interrupted,
        Failed
    };

    struct UploadOutcome
    {
        UploadStatus status{UploadStatus::Failed};
        std::optional<remote::DriveItem> item;
        std::uint64_t bytes_completed{};
        std::uint64_t total_size{};
        ErrorCode error{ErrorCode::Ok};
        std::string message;
        bool resumed{};
    };

    // Resumable chunked upload. Progress is checkpointed in a CheckpointStore keyed by the
    // (local, remote) fingerprint, so a later call with the same pair continues where the
    // remote service says the previous one stopped.
    class ChunkedUploadEngine
    {
    public:
        ChunkedUploadEngine(RemoteService &remote, CheckpointStore &store, Logger logger);

        // Uploads a local file. The local resource id is its absolute, normalised path.
        UploadOutcome upload(const std::filesystem::path &local_path, const std::string &remote_path,
                             const UploadOptions &options = {});

        // Uploads `total_size` bytes read from a seekable `source`.
        UploadOutcome upload(const std::string &local_resource_id, const std::string &remote_resource_id,
                             std::istream &source, std::uint64_t total_size, const UploadOptions &options = {});

    private:
        struct ResumeResult
        {
            std::optional<TransferCheckpoint> checkpoint;
            // Set when the stored state already settles the call.
            std::optional<UploadOutcome> finished;
        };

        ResumeResult resume_checkpoint(const std::string &fingerprint, const std::string &remote_resource_id,
                                       std::uint64_t total_size);
        // std::nullopt signals that the upload session expired mid-transfer.
        std::optional<UploadOutcome> transfer(TransferCheckpoint &checkpoint, std::istream &source,
                                              const UploadOptions &options, UploadOutcome outcome);

        void persist(const TransferCheckpoint &checkpoint);
        void discard(const std::string &fingerprint);
        void cancel_quietly(const std::string &upload_handle);

        RemoteService &remote_;
        CheckpointStore &store_;
        Logger logger_;
    };

} // namespace clouddrive::client

#pragma once

#include <string>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/credential_refresh_guard.hpp"
#include "clouddrive/client/http_client.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/remote_service.hpp"

namespace clouddrive::client
{

    // RemoteService over the Microsoft Graph drive API.
    class GraphService : public RemoteService
    {
    public:
        GraphService(const HttpClient &http, CredentialRefreshGuard &credentials, HttpSettings settings, Logger logger,
                     std::string base_url = "https://graph.microsoft.com/v1.0/");

        remote::UploadSessionInfo open_upload_session(const std::string &remote_path) override;
        ChunkResult send_chunk(const std::string &upload_handle, std::uint64_t start, std::uint64_t end,
                               std::uint64_t total, std::span<const std::byte> bytes) override;
        UploadSessionStatus query_upload_session(const std::string &upload_handle) override;
        void cancel_upload_session(const std::string &upload_handle) override;
        remote::DriveItem finalize_empty_upload(const std::string &upload_handle,
                                                const std::string &remote_path) override;
        remote::AsyncOperationStatus query_async_operation(const std::string &job_handle) override;
        std::string start_copy(const std::string &source_path, const std::string &destination_parent,
                               const std::string &new_name) override;
        remote::UserInfo get_me() override;

        remote::DriveItem get_item(const std::string &remote_path);

        // "<base>me/drive/root" or "<base>me/drive/root:/<escaped path>".
        std::string path_url(const std::string &remote_path) const;

    private:
        // Bearer-authenticated call with retries on transport errors, 401, 429 and 503.
        HttpResponse authenticated_call(HttpRequest request);
        // Single attempt against a pre-authenticated URL (upload session, monitor).
        HttpResponse unauthenticated_call(const HttpRequest &request);

        const HttpClient &http_;
        CredentialRefreshGuard &credentials_;
        HttpSettings settings_;
        Logger logger_;
        std::string base_url_;
    };

} // namespace clouddrive::client

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/credential_refresh_guard.hpp"
#include "clouddrive/client/graph_service.hpp"
#include "clouddrive/client/http_client.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/oauth_client.hpp"
#include "clouddrive/client/state_store.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitInterrupted = 130;

    // One CLI invocation: runs a single command and returns the process exit code.
    class ClientSession
    {
    public:
        ClientSession(CommandLine command_line, Settings settings, std::filesystem::path config_path, Logger logger);

        int run();

    private:
        int dispatch(const std::string &command, const std::vector<std::string> &args);

        // session_transfers.cpp
        int handle_upload(const std::vector<std::string> &args);
        int handle_upload_status(const std::vector<std::string> &args);
        int handle_cancel_upload(const std::vector<std::string> &args);
        int handle_uploads(const std::vector<std::string> &args);

        // session_jobs.cpp
        int handle_copy(const std::vector<std::string> &args);
        int handle_copy_status(const std::vector<std::string> &args);
        int handle_monitor(const std::vector<std::string> &args);
        int monitor_job(const std::string &job_handle);

        // session_auth.cpp
        int handle_auth(const std::vector<std::string> &args);
        int auth_login();
        int auth_logout();
        int auth_status();
        bool complete_pending_login();
        void persist_credential(const remote::Credential &credential);

        RemoteService &remote();
        void print_help() const;
        void print_error(ErrorCode code, const std::string &message) const;
        bool expect_args(const std::vector<std::string> &args, std::size_t min, std::size_t max,
                         const char *usage) const;

        CommandLine command_line_;
        Settings settings_;
        std::filesystem::path config_path_;
        Logger logger_;
        StateStore state_store_;
        HttpClient http_;
        OAuthClient oauth_;
        std::unique_ptr<RefreshingCredentialSource> credential_source_;
        std::unique_ptr<CredentialRefreshGuard> credentials_;
        std::unique_ptr<GraphService> graph_;
    };

} // namespace clouddrive::client

#include "clouddrive/client/session.hpp"

#include <iostream>

#include "clouddrive/version.hpp"

namespace clouddrive::client
{

    ClientSession::ClientSession(CommandLine command_line, Settings settings, std::filesystem::path config_path,
                                 Logger logger)
        : command_line_(std::move(command_line)),
          settings_(std::move(settings)),
          config_path_(std::move(config_path)),
          logger_(std::move(logger)),
          state_store_(config_path_.parent_path() / "sessions", logger_),
          http_(settings_.http.timeout),
          oauth_(http_, logger_) {}

    int ClientSession::run()
    {
        try
        {
            return dispatch(command_line_.command, command_line_.args);
        }
        catch (const Error &ex)
        {
            print_error(ex.code(), ex.what());
            logger_.log("error", "command failed: ", ex.what());
        }
        catch (const std::exception &ex)
        {
            print_error(ErrorCode::InternalError, ex.what());
            logger_.log("error", "command failed: ", ex.what());
        }
        return kExitFailure;
    }

    int ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "upload")
        {
            return handle_upload(args);
        }
        if (command == "upload-status")
        {
            return handle_upload_status(args);
        }
        if (command == "cancel-upload")
        {
            return handle_cancel_upload(args);
        }
        if (command == "uploads")
        {
            return handle_uploads(args);
        }
        if (command == "copy")
        {
            return handle_copy(args);
        }
        if (command == "copy-status")
        {
            return handle_copy_status(args);
        }
        if (command == "monitor")
        {
            return handle_monitor(args);
        }
        if (command == "auth")
        {
            return handle_auth(args);
        }
        if (command == "help")
        {
            print_help();
            return kExitSuccess;
        }
        if (command == "version")
        {
            std::cout << "clouddrive " << version() << std::endl;
            return kExitSuccess;
        }
        std::cout << "ERROR: unsupported_command" << std::endl;
        print_help();
        return kExitFailure;
    }

    RemoteService &ClientSession::remote()
    {
        if (!graph_)
        {
            credential_source_ = std::make_unique<RefreshingCredentialSource>(settings_.token, oauth_, logger_);
            credentials_ = std::make_unique<CredentialRefreshGuard>(
                *credential_source_, [this](const remote::Credential &credential)
                { persist_credential(credential); },
                logger_, settings_.token);
            graph_ = std::make_unique<GraphService>(http_, *credentials_, settings_.http, logger_);
        }
        return *graph_;
    }

    void ClientSession::print_help() const
    {
        std::cout << "Usage: clouddrive <command> [args] [flags]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  upload <local> [remote-folder]      Resumable chunked upload" << std::endl;
        std::cout << "  upload-status <upload-url>          Show the accepted byte watermark" << std::endl;
        std::cout << "  cancel-upload <upload-url>          Cancel an upload session" << std::endl;
        std::cout << "  uploads                             List interrupted uploads" << std::endl;
        std::cout << "  copy <src> <dest-folder> [name]     Start a server-side copy" << std::endl;
        std::cout << "  copy-status <monitor-url>           Show a copy job's status once" << std::endl;
        std::cout << "  monitor <monitor-url>               Wait for a copy job to finish" << std::endl;
        std::cout << "  auth login|logout|status            Manage the device-code login" << std::endl;
        std::cout << "  version                             Print the version" << std::endl;
        std::cout << "  help                                Show this help" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --log <file>                        Append logs to file\n";
        std::cout << "  --debug                             Verbose logs on stderr\n";
        std::cout << "  --config <file>                     Use another config file\n";
        std::cout << "  --chunk-size <bytes>                Upload chunk size (multiple of 327680)\n";
        std::cout << "  --wait                              copy: wait for the job to finish\n";
    }

    void ClientSession::print_error(ErrorCode code, const std::string &message) const
    {
        std::cout << "ERROR: " << to_string(code) << std::endl;
        if (!message.empty())
        {
            std::cout << message << std::endl;
        }
    }

    bool ClientSession::expect_args(const std::vector<std::string> &args, std::size_t min, std::size_t max,
                                    const char *usage) const
    {
        if (args.size() < min || args.size() > max)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: " << usage << std::endl;
            return false;
        }
        return true;
    }

} // namespace clouddrive::client

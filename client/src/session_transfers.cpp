#include "clouddrive/client/session.hpp"

#include <filesystem>
#include <iostream>

#include "clouddrive/client/cancellation.hpp"
#include "clouddrive/client/chunked_upload_engine.hpp"

namespace clouddrive::client
{

    namespace
    {

        std::string join_remote(const std::string &folder, const std::string &name)
        {
            std::string result = folder.empty() ? "/" : folder;
            if (result.front() != '/')
            {
                result.insert(result.begin(), '/');
            }
            if (result.back() != '/')
            {
                result.push_back('/');
            }
            return result + name;
        }

    } // namespace

    int ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 1, 2, "upload <local_path> [remote_folder]"))
        {
            return kExitFailure;
        }
        const std::filesystem::path local_path(args[0]);
        const auto remote_path = join_remote(args.size() == 2 ? args[1] : "/", local_path.filename().string());

        if (!complete_pending_login())
        {
            return kExitFailure;
        }

        CancellationToken token;
        InterruptListener listener(token, logger_);
        ChunkedUploadEngine engine(remote(), state_store_, logger_);

        UploadOptions options{
            .chunk_size = command_line_.chunk_size.value_or(settings_.upload.chunk_size),
            .on_progress = [](std::uint64_t done, std::uint64_t total)
            { std::cout << "\rUploaded " << done << " / " << total << " bytes" << std::flush; },
            .cancellation = &token,
        };

        const auto outcome = engine.upload(local_path, remote_path, options);
        std::cout << std::endl;
        switch (outcome.status)
        {
        case UploadStatus::Succeeded:
            std::cout << "OK" << std::endl;
            std::cout << "Uploaded " << remote_path << " (" << outcome.item->size << " bytes)";
            if (!outcome.item->id.empty())
            {
                std::cout << ", id " << outcome.item->id;
            }
            std::cout << std::endl;
            return kExitSuccess;
        case UploadStatus::Interrupted:
            std::cout << "Upload interrupted at byte " << outcome.bytes_completed << " of " << outcome.total_size
                      << ". Run the same command again to resume." << std::endl;
            return kExitInterrupted;
        case UploadStatus::Failed:
            break;
        }
        print_error(outcome.error, outcome.message);
        return kExitFailure;
    }

    int ClientSession::handle_upload_status(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 1, 1, "upload-status <upload_url>"))
        {
            return kExitFailure;
        }
        const auto status = remote().query_upload_session(args[0]);
        if (status.complete)
        {
            std::cout << "Upload session complete: every byte has been received." << std::endl;
        }
        else
        {
            std::cout << "Next expected byte: " << status.watermark << std::endl;
        }
        return kExitSuccess;
    }

    int ClientSession::handle_cancel_upload(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 1, 1, "cancel-upload <upload_url>"))
        {
            return kExitFailure;
        }
        remote().cancel_upload_session(args[0]);
        for (const auto &checkpoint : state_store_.pending())
        {
            if (checkpoint.upload_session_handle == args[0])
            {
                state_store_.remove(checkpoint.fingerprint());
            }
        }
        std::cout << "OK" << std::endl;
        return kExitSuccess;
    }

    int ClientSession::handle_uploads(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 0, 0, "uploads"))
        {
            return kExitFailure;
        }
        const auto pending = state_store_.pending();
        if (pending.empty())
        {
            std::cout << "No interrupted uploads." << std::endl;
            return kExitSuccess;
        }
        for (const auto &checkpoint : pending)
        {
            std::cout << checkpoint.local_resource_id << " -> " << checkpoint.remote_resource_id << std::endl;
            std::cout << "  " << checkpoint.bytes_completed << " / " << checkpoint.total_size << " bytes";
            if (checkpoint.session_expiry)
            {
                std::cout << ", session expires " << format_timestamp(*checkpoint.session_expiry);
            }
            std::cout << std::endl;
        }
        return kExitSuccess;
    }

} // namespace clouddrive::client

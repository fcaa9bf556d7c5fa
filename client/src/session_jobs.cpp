#include "clouddrive/client/session.hpp"

#include <iostream>

#include "clouddrive/client/async_operation_poller.hpp"
#include "clouddrive/client/cancellation.hpp"

namespace clouddrive::client
{

    int ClientSession::handle_copy(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 2, 3, "copy <source_path> <destination_folder> [new_name] [--wait]"))
        {
            return kExitFailure;
        }
        if (!complete_pending_login())
        {
            return kExitFailure;
        }
        const auto monitor_url = remote().start_copy(args[0], args[1], args.size() == 3 ? args[2] : std::string{});
        if (!command_line_.wait)
        {
            std::cout << "Copy started. Monitor URL:" << std::endl;
            std::cout << monitor_url << std::endl;
            return kExitSuccess;
        }
        return monitor_job(monitor_url);
    }

    int ClientSession::handle_copy_status(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 1, 1, "copy-status <monitor_url>"))
        {
            return kExitFailure;
        }
        const auto status = remote().query_async_operation(args[0]);
        std::cout << "Status: " << (status.raw_status.empty() ? std::string(remote::to_string(status.state))
                                                               : status.raw_status)
                  << std::endl;
        std::cout << "Progress: " << status.percent_complete << "%" << std::endl;
        if (!status.description.empty())
        {
            std::cout << "Description: " << status.description << std::endl;
        }
        if (!status.result_identifier.empty())
        {
            std::cout << "Result: " << status.result_identifier << std::endl;
        }
        if (!status.failure_detail.empty())
        {
            std::cout << "Error: " << status.failure_detail << std::endl;
        }
        return kExitSuccess;
    }

    int ClientSession::handle_monitor(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 1, 1, "monitor <monitor_url>"))
        {
            return kExitFailure;
        }
        return monitor_job(args[0]);
    }

    int ClientSession::monitor_job(const std::string &job_handle)
    {
        CancellationToken token;
        InterruptListener listener(token, logger_);
        AsyncOperationPoller poller(remote(), logger_);

        PollOptions options{
            .initial_interval = settings_.polling.initial_interval,
            .max_interval = settings_.polling.max_interval,
            .multiplier = settings_.polling.multiplier,
            .on_progress = [](const remote::AsyncOperationStatus &status)
            {
                std::cout << "Status: " << remote::to_string(status.state) << " (" << status.percent_complete << "%)";
                if (!status.description.empty())
                {
                    std::cout << " " << status.description;
                }
                std::cout << std::endl;
            },
            .cancellation = &token,
        };

        const auto outcome = poller.await_completion(job_handle, options);
        switch (outcome.status)
        {
        case JobStatus::Completed:
            std::cout << "Operation completed." << std::endl;
            if (!outcome.result_identifier.empty())
            {
                std::cout << "Result: " << outcome.result_identifier << std::endl;
            }
            return kExitSuccess;
        case JobStatus::Interrupted:
            std::cout << "Stopped monitoring; the job continues on the server." << std::endl;
            return kExitInterrupted;
        case JobStatus::Failed:
            break;
        }
        print_error(ErrorCode::OperationFailed, outcome.failure_detail);
        return kExitFailure;
    }

} // namespace clouddrive::client

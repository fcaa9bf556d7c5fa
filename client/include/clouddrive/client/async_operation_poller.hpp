#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "clouddrive/client/cancellation.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/remote_service.hpp"
#include "clouddrive/remote_types.hpp"

namespace clouddrive::client
{

    struct PollOptions
    {
        std::chrono::milliseconds initial_interval{2000};
        std::chrono::milliseconds max_interval{30000};
        double multiplier{1.5};
        // Receives every non-terminal status.
        std::function<void(const remote::AsyncOperationStatus &)> on_progress;
        const CancellationToken *cancellation{nullptr};
    };

    enum class JobStatus : std::uint8_t
    {
        Completed,
        Failed,
        Interrupted
    };

    struct JobOutcome
    {
        JobStatus status{JobStatus::Failed};
        std::string result_identifier;
        std::string failure_detail;
        remote::AsyncOperationStatus last_status;
        int polls{};
    };

    // Polls a server-side job with capped exponential backoff until it completes or fails.
    class AsyncOperationPoller
    {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        // Without a sleeper the poller sleeps on the calling thread, waking early on cancellation.
        AsyncOperationPoller(RemoteService &remote, Logger logger, Sleeper sleeper = {});

        // Query failures are thrown as clouddrive::Error and end the poll.
        JobOutcome await_completion(const std::string &job_handle, const PollOptions &options);

    private:
        void sleep(std::chrono::milliseconds interval, const CancellationToken *cancellation) const;

        RemoteService &remote_;
        Logger logger_;
        Sleeper sleeper_;
    };

} // namespace clouddrive::client

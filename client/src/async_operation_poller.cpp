#include "clouddrive/client/async_operation_poller.hpp"

#include <algorithm>
#include <thread>

namespace clouddrive::client
{

    namespace
    {

        constexpr std::chrono::milliseconds kSleepSlice{100};
        constexpr std::chrono::milliseconds kMinInterval{1};

        bool cancelled(const CancellationToken *token)
        {
            return token && token->is_cancelled();
        }

        std::chrono::milliseconds next_interval(std::chrono::milliseconds current, double multiplier,
                                                std::chrono::milliseconds max_interval)
        {
            const auto scaled = static_cast<double>(current.count()) * multiplier;
            if (scaled >= static_cast<double>(max_interval.count()))
            {
                return max_interval;
            }
            auto grown = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(scaled)};
            // Truncation must not stall growth at small intervals.
            if (multiplier > 1.0 && grown <= current)
            {
                grown = current + kMinInterval;
            }
            return std::min(std::max(current, grown), max_interval);
        }

    } // namespace

    AsyncOperationPoller::AsyncOperationPoller(RemoteService &remote, Logger logger, Sleeper sleeper)
        : remote_(remote),
          logger_(std::move(logger)),
          sleeper_(std::move(sleeper)) {}

    JobOutcome AsyncOperationPoller::await_completion(const std::string &job_handle, const PollOptions &options)
    {
        // A zero interval would poll the service in a tight loop.
        const auto max_interval = std::max(options.max_interval, kMinInterval);
        const auto multiplier = std::max(options.multiplier, 1.0);
        auto interval = std::clamp(options.initial_interval, kMinInterval, max_interval);

        JobOutcome outcome;
        while (true)
        {
            if (cancelled(options.cancellation))
            {
                outcome.status = JobStatus::Interrupted;
                return outcome;
            }

            outcome.last_status = remote_.query_async_operation(job_handle);
            ++outcome.polls;
            const auto &status = outcome.last_status;

            if (status.state == remote::AsyncOperationState::Completed)
            {
                logger_.log("poll", "operation completed after ", outcome.polls, " polls");
                outcome.status = JobStatus::Completed;
                outcome.result_identifier = status.result_identifier;
                return outcome;
            }
            if (status.state == remote::AsyncOperationState::Failed)
            {
                logger_.warn("poll", "operation failed: ", status.failure_detail);
                outcome.status = JobStatus::Failed;
                outcome.failure_detail = status.failure_detail;
                return outcome;
            }

            if (status.state == remote::AsyncOperationState::Unknown)
            {
                logger_.debug("poll", "unrecognised status '", status.raw_status, "', still waiting");
            }
            logger_.debug("poll", "status ", remote::to_string(status.state), " ", status.percent_complete,
                          "%, next poll in ", interval.count(), "ms");
            if (options.on_progress)
            {
                options.on_progress(status);
            }

            if (cancelled(options.cancellation))
            {
                outcome.status = JobStatus::Interrupted;
                return outcome;
            }
            sleep(interval, options.cancellation);
            interval = next_interval(interval, multiplier, max_interval);
        }
    }

    void AsyncOperationPoller::sleep(std::chrono::milliseconds interval, const CancellationToken *cancellation) const
    {
        if (sleeper_)
        {
            sleeper_(interval);
            return;
        }
        auto remaining = interval;
        while (remaining.count() > 0 && !cancelled(cancellation))
        {
            const auto slice = std::min(remaining, kSleepSlice);
            std::this_thread::sleep_for(slice);
            remaining -= slice;
        }
    }

} // namespace clouddrive::client

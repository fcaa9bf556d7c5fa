#include <cassert>
#include <chrono>
#include <string>
#include <vector>

#include "clouddrive/client/async_operation_poller.hpp"
#include "clouddrive/client/cancellation.hpp"
#include "fake_remote_service.hpp"

using namespace clouddrive;
using namespace clouddrive::client;
using clouddrive::testing::FakeRemoteService;
using namespace std::chrono_literals;

namespace
{

    struct RecordingSleeper
    {
        std::vector<std::chrono::milliseconds> sleeps;

        AsyncOperationPoller::Sleeper callback()
        {
            return [this](std::chrono::milliseconds interval)
            { sleeps.push_back(interval); };
        }
    };

    void test_copy_job_backoff_sequence()
    {
        FakeRemoteService remote;
        remote.statuses = {
            FakeRemoteService::status("notStarted"),
            FakeRemoteService::status("inProgress", 30),
            FakeRemoteService::status("inProgress", 70),
            FakeRemoteService::status("completed", 100, "item-42"),
        };
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        int progress_calls = 0;
        PollOptions options{
            .initial_interval = 1s,
            .max_interval = 8s,
            .multiplier = 2.0,
            .on_progress = [&](const remote::AsyncOperationStatus &status)
            {
                assert(!remote::is_terminal(status.state));
                ++progress_calls;
            },
        };

        const auto outcome = poller.await_completion("https://monitor.example/job", options);
        assert(outcome.status == JobStatus::Completed);
        assert(outcome.result_identifier == "item-42");
        assert(outcome.polls == 4);
        assert(progress_calls == 3);
        assert((sleeper.sleeps == std::vector<std::chrono::milliseconds>{1s, 2s, 4s}));
        assert(remote.queried_jobs.size() == 4);
    }

    void test_interval_is_capped()
    {
        FakeRemoteService remote;
        for (int i = 0; i < 5; ++i)
        {
            remote.statuses.push_back(FakeRemoteService::status("inProgress"));
        }
        remote.statuses.push_back(FakeRemoteService::status("completed", 100, "done"));
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        const auto outcome = poller.await_completion("job", PollOptions{
                                                                .initial_interval = 1s,
                                                                .max_interval = 5s,
                                                                .multiplier = 3.0,
                                                            });
        assert(outcome.status == JobStatus::Completed);
        assert((sleeper.sleeps == std::vector<std::chrono::milliseconds>{1s, 3s, 5s, 5s, 5s}));
        for (std::size_t i = 1; i < sleeper.sleeps.size(); ++i)
        {
            assert(sleeper.sleeps[i] >= sleeper.sleeps[i - 1]);
            assert(sleeper.sleeps[i] <= 5s);
        }
    }

    void test_degenerate_backoff_parameters()
    {
        FakeRemoteService remote;
        remote.statuses = {
            FakeRemoteService::status("waiting"),
            FakeRemoteService::status("waiting"),
            FakeRemoteService::status("completed"),
        };
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        poller.await_completion("job", PollOptions{
                                           .initial_interval = 10s,
                                           .max_interval = 2s,
                                           .multiplier = 0.5,
                                       });
        assert((sleeper.sleeps == std::vector<std::chrono::milliseconds>{2s, 2s}));
    }

    void test_zero_initial_interval_still_backs_off()
    {
        FakeRemoteService remote;
        for (int i = 0; i < 6; ++i)
        {
            remote.statuses.push_back(FakeRemoteService::status("inProgress"));
        }
        remote.statuses.push_back(FakeRemoteService::status("completed", 100, "done"));
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        const auto outcome = poller.await_completion("job", PollOptions{
                                                                .initial_interval = 0ms,
                                                                .max_interval = 10ms,
                                                                .multiplier = 1.5,
                                                            });
        assert(outcome.status == JobStatus::Completed);
        assert((sleeper.sleeps == std::vector<std::chrono::milliseconds>{1ms, 2ms, 3ms, 4ms, 6ms, 9ms}));

        // Both bounds at zero still leave a pause between queries.
        remote.statuses = {FakeRemoteService::status("inProgress"), FakeRemoteService::status("completed")};
        sleeper.sleeps.clear();
        poller.await_completion("job", PollOptions{.initial_interval = 0ms, .max_interval = 0ms});
        assert((sleeper.sleeps == std::vector<std::chrono::milliseconds>{1ms}));
    }

    void test_failed_and_unknown_states()
    {
        FakeRemoteService remote;
        remote.statuses = {
            FakeRemoteService::status("somethingNew"),
            FakeRemoteService::status("failed", 40, "", "Code: nameAlreadyExists, Message: exists"),
        };
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        const auto outcome = poller.await_completion("job", PollOptions{.initial_interval = 1s, .max_interval = 1s});
        assert(outcome.status == JobStatus::Failed);
        assert(outcome.failure_detail == "Code: nameAlreadyExists, Message: exists");
        assert(outcome.last_status.percent_complete == 40);
        assert(sleeper.sleeps.size() == 1);
    }

    void test_query_error_is_fatal()
    {
        FakeRemoteService remote;
        remote.statuses = {FakeRemoteService::status("inProgress")};
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        bool threw = false;
        try
        {
            poller.await_completion("job", PollOptions{.initial_interval = 1s});
        }
        catch (const Error &ex)
        {
            threw = true;
            assert(ex.code() == ErrorCode::DecodingFailed);
        }
        assert(threw);
        assert(remote.queried_jobs.size() == 2);
        assert(sleeper.sleeps.size() == 1);
    }

    void test_cancellation_stops_polling()
    {
        FakeRemoteService remote;
        remote.statuses = {
            FakeRemoteService::status("inProgress"),
            FakeRemoteService::status("completed"),
        };
        RecordingSleeper sleeper;
        AsyncOperationPoller poller(remote, Logger{}, sleeper.callback());

        CancellationToken token;
        PollOptions options{
            .initial_interval = 1s,
            .on_progress = [&](const remote::AsyncOperationStatus &)
            { token.cancel(); },
            .cancellation = &token,
        };
        const auto outcome = poller.await_completion("job", options);
        assert(outcome.status == JobStatus::Interrupted);
        assert(sleeper.sleeps.empty());
        assert(remote.queried_jobs.size() == 1);

        // The built-in sleeper returns promptly once cancelled.
        CancellationToken already;
        already.cancel();
        AsyncOperationPoller real_sleep(remote, Logger{});
        const auto start = std::chrono::steady_clock::now();
        const auto stopped = real_sleep.await_completion("job", PollOptions{.initial_interval = 60s,
                                                                             .cancellation = &already});
        assert(stopped.status == JobStatus::Interrupted);
        assert(std::chrono::steady_clock::now() - start < 5s);
    }

} // namespace

void run_poller_tests()
{
    test_copy_job_backoff_sequence();
    test_interval_is_capped();
    test_degenerate_backoff_parameters();
    test_zero_initial_interval_still_backs_off();
    test_failed_and_unknown_states();
    test_query_error_is_fatal();
    test_cancellation_stops_polling();
}

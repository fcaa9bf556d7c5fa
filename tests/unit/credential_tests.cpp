#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "clouddrive/client/credential_refresh_guard.hpp"
#include "clouddrive/error_codes.hpp"

using namespace clouddrive;
using namespace clouddrive::client;

namespace
{

    remote::Credential credential(const std::string &access, const std::string &refresh = "refresh-1")
    {
        return remote::Credential{.access_token = access, .refresh_token = refresh};
    }

    // Hands out a fixed sequence of tokens, repeating the last one.
    class ScriptedSource : public CredentialSource
    {
    public:
        explicit ScriptedSource(std::vector<std::string> tokens)
            : tokens_(std::move(tokens)) {}

        remote::Credential token() override
        {
            std::lock_guard lock(mutex_);
            if (fail)
            {
                throw Error(ErrorCode::AuthenticationRequired, "refresh rejected");
            }
            const auto index = std::min(calls_++, tokens_.size() - 1);
            return credential(tokens_[index]);
        }

        bool fail{false};

    private:
        std::mutex mutex_;
        std::vector<std::string> tokens_;
        std::size_t calls_{0};
    };

    // The first caller is handed the pre-refresh token but holds it back until a second
    // caller has been served the refreshed one, or until a short timeout.
    class LatchedSource : public CredentialSource
    {
    public:
        remote::Credential token() override
        {
            std::unique_lock lock(mutex_);
            if (++calls_ == 1)
            {
                first_started_ = true;
                changed_.notify_all();
                changed_.wait_for(lock, std::chrono::milliseconds{300}, [this]
                                  { return second_served_; });
                return credential("old");
            }
            second_served_ = true;
            changed_.notify_all();
            return credential("new");
        }

        void wait_for_first_call()
        {
            std::unique_lock lock(mutex_);
            changed_.wait(lock, [this]
                          { return first_started_; });
        }

    private:
        std::mutex mutex_;
        std::condition_variable changed_;
        int calls_{0};
        bool first_started_{false};
        bool second_served_{false};
    };

    class CountingRefresher : public TokenRefresher
    {
    public:
        remote::Credential refresh(const remote::Credential &current) override
        {
            ++calls;
            seen_refresh_token = current.refresh_token;
            if (fail)
            {
                throw Error(ErrorCode::AuthenticationRequired, "invalid_grant");
            }
            remote::Credential next;
            next.access_token = "refreshed-" + std::to_string(calls);
            next.expiry = std::chrono::system_clock::now() + std::chrono::hours{1};
            return next;
        }

        int calls{0};
        bool fail{false};
        std::string seen_refresh_token;
    };

    void test_persists_once_per_change()
    {
        ScriptedSource source({"token-a", "token-a", "token-a", "token-b", "token-b"});
        std::vector<std::string> persisted;
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &c)
            { persisted.push_back(c.access_token); },
            Logger{});

        for (int i = 0; i < 5; ++i)
        {
            const auto current = guard.current_credential();
            assert(!current.access_token.empty());
        }
        assert((persisted == std::vector<std::string>{"token-a", "token-b"}));
    }

    void test_seeded_token_is_not_persisted()
    {
        ScriptedSource source({"stored"});
        int persisted = 0;
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &)
            { ++persisted; },
            Logger{}, credential("stored"));

        for (int i = 0; i < 10; ++i)
        {
            assert(guard.current_credential().access_token == "stored");
        }
        assert(persisted == 0);
    }

    void test_persist_failure_is_swallowed()
    {
        ScriptedSource source({"token-a", "token-b"});
        int attempts = 0;
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &)
            {
                ++attempts;
                throw Error(ErrorCode::StateStoreFailure, "read-only config"); },
            Logger{});

        assert(guard.current_credential().access_token == "token-a");
        assert(guard.current_credential().access_token == "token-b");
        assert(guard.current_credential().access_token == "token-b");
        assert(attempts == 2);
    }

    void test_source_failure_propagates()
    {
        ScriptedSource source({"token-a"});
        source.fail = true;
        int persisted = 0;
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &)
            { ++persisted; },
            Logger{});

        bool threw = false;
        try
        {
            guard.current_credential();
        }
        catch (const Error &ex)
        {
            threw = true;
            assert(ex.code() == ErrorCode::AuthenticationRequired);
        }
        assert(threw);
        assert(persisted == 0);
    }

    void test_concurrent_callers_persist_once()
    {
        ScriptedSource source({"shared-token"});
        std::atomic<int> persisted{0};
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &)
            { ++persisted; },
            Logger{});

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t)
        {
            threads.emplace_back([&]
                                 {
                for (int i = 0; i < 50; ++i) {
                    guard.current_credential();
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(persisted.load() == 1);
    }

    void test_older_token_never_persisted_after_newer()
    {
        LatchedSource source;
        std::mutex persisted_mutex;
        std::vector<std::string> persisted;
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &c)
            {
                std::lock_guard lock(persisted_mutex);
                persisted.push_back(c.access_token); },
            Logger{}, credential("seed"));

        std::thread first([&]
                          { guard.current_credential(); });
        source.wait_for_first_call();
        std::thread second([&]
                           { guard.current_credential(); });
        first.join();
        second.join();

        assert(!persisted.empty());
        assert(persisted.back() == "new");
        assert((persisted == std::vector<std::string>{"old", "new"}));
    }

    void test_refreshing_source()
    {
        CountingRefresher refresher;

        remote::Credential fresh = credential("valid", "refresh-keep");
        fresh.expiry = std::chrono::system_clock::now() + std::chrono::hours{1};
        RefreshingCredentialSource valid(fresh, refresher, Logger{});
        assert(valid.token().access_token == "valid");
        assert(refresher.calls == 0);

        remote::Credential expiring = credential("old", "refresh-keep");
        expiring.expiry = std::chrono::system_clock::now() + std::chrono::seconds{30};
        RefreshingCredentialSource source(expiring, refresher, Logger{});
        const auto refreshed = source.token();
        assert(refreshed.access_token == "refreshed-1");
        assert(refreshed.refresh_token == "refresh-keep");
        assert(refresher.seen_refresh_token == "refresh-keep");
        assert(source.token().access_token == "refreshed-1");
        assert(refresher.calls == 1);

        RefreshingCredentialSource no_expiry(credential("forever"), refresher, Logger{});
        assert(no_expiry.token().access_token == "forever");
        assert(refresher.calls == 1);

        RefreshingCredentialSource logged_out(remote::Credential{}, refresher, Logger{});
        bool threw = false;
        try
        {
            logged_out.token();
        }
        catch (const Error &ex)
        {
            threw = ex.code() == ErrorCode::AuthenticationRequired;
        }
        assert(threw);

        refresher.fail = true;
        remote::Credential expired = credential("old");
        expired.expiry = std::chrono::system_clock::now() - std::chrono::minutes{1};
        RefreshingCredentialSource rejected(expired, refresher, Logger{});
        threw = false;
        try
        {
            rejected.token();
        }
        catch (const Error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_guard_over_refreshing_source()
    {
        CountingRefresher refresher;
        remote::Credential stored = credential("old");
        stored.expiry = std::chrono::system_clock::now() - std::chrono::minutes{1};
        RefreshingCredentialSource source(stored, refresher, Logger{});

        std::vector<remote::Credential> persisted;
        CredentialRefreshGuard guard(
            source, [&](const remote::Credential &c)
            { persisted.push_back(c); },
            Logger{}, stored);

        for (int i = 0; i < 3; ++i)
        {
            assert(guard.current_credential().access_token == "refreshed-1");
        }
        assert(persisted.size() == 1);
        assert(persisted.front().refresh_token == "refresh-1");
        assert(persisted.front().expiry.has_value());
    }

} // namespace

void run_credential_tests()
{
    test_persists_once_per_change();
    test_seeded_token_is_not_persisted();
    test_persist_failure_is_swallowed();
    test_source_failure_propagates();
    test_concurrent_callers_persist_once();
    test_older_token_never_persisted_after_newer();
    test_refreshing_source();
    test_guard_over_refreshing_source();
}

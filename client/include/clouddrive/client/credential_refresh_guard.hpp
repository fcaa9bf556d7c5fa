#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

#include "clouddrive/client/logger.hpp"
#include "clouddrive/remote_types.hpp"

namespace clouddrive::client
{

    // Anything that can hand out a usable credential, refreshing it when needed.
    class CredentialSource
    {
    public:
        virtual ~CredentialSource() = default;
        virtual remote::Credential token() = 0;
    };

    // Exchanges a refresh capability for a new credential.
    class TokenRefresher
    {
    public:
        virtual ~TokenRefresher() = default;
        virtual remote::Credential refresh(const remote::Credential &credential) = 0;
    };

    // Caches a credential and refreshes it shortly before it expires.
    class RefreshingCredentialSource : public CredentialSource
    {
    public:
        RefreshingCredentialSource(remote::Credential initial, TokenRefresher &refresher, Logger logger,
                                   std::chrono::seconds expiry_skew = std::chrono::seconds{60});

        // Throws clouddrive::Error(AuthenticationRequired) without a credential, and propagates
        // refresh failures.
        remote::Credential token() override;

    private:
        bool usable(TimePoint now) const;

        std::mutex mutex_;
        remote::Credential current_;
        TokenRefresher &refresher_;
        Logger logger_;
        std::chrono::seconds expiry_skew_;
    };

    // Front for the request layer: returns the source's credential and persists it whenever its
    // access token differs from the last one seen.
    class CredentialRefreshGuard
    {
    public:
        using PersistCallback = std::function<void(const remote::Credential &)>;

        // `seed` is the credential already in durable storage.
        CredentialRefreshGuard(CredentialSource &source, PersistCallback persist, Logger logger,
                               const remote::Credential &seed = {});

        // Source failures propagate. Persistence failures are logged only.
        remote::Credential current_credential();

    private:
        CredentialSource &source_;
        PersistCallback persist_;
        Logger logger_;
        std::mutex mutex_;
        std::string last_seen_token_;
    };

} // namespace clouddrive::client

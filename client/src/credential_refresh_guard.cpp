#include "clouddrive/client/credential_refresh_guard.hpp"

#include <exception>
#include <utility>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    RefreshingCredentialSource::RefreshingCredentialSource(remote::Credential initial, TokenRefresher &refresher,
                                                           Logger logger, std::chrono::seconds expiry_skew)
        : current_(std::move(initial)),
          refresher_(refresher),
          logger_(std::move(logger)),
          expiry_skew_(expiry_skew) {}

    remote::Credential RefreshingCredentialSource::token()
    {
        std::lock_guard lock(mutex_);
        if (current_.empty())
        {
            throw Error(ErrorCode::AuthenticationRequired, "not logged in; run 'clouddrive auth login'");
        }
        if (usable(std::chrono::system_clock::now()))
        {
            return current_;
        }
        if (current_.refresh_token.empty())
        {
            throw Error(ErrorCode::AuthenticationRequired, "access token expired and no refresh token is available");
        }

        logger_.log("auth", "access token expires soon, refreshing");
        auto refreshed = refresher_.refresh(current_);
        if (refreshed.refresh_token.empty())
        {
            refreshed.refresh_token = current_.refresh_token;
        }
        current_ = std::move(refreshed);
        return current_;
    }

    bool RefreshingCredentialSource::usable(TimePoint now) const
    {
        return !current_.expiry || *current_.expiry - expiry_skew_ > now;
    }

    CredentialRefreshGuard::CredentialRefreshGuard(CredentialSource &source, PersistCallback persist, Logger logger,
                                                   const remote::Credential &seed)
        : source_(source),
          persist_(std::move(persist)),
          logger_(std::move(logger)),
          last_seen_token_(seed.access_token) {}

    remote::Credential CredentialRefreshGuard::current_credential()
    {
        // Held across the source call so a credential obtained earlier is never compared or
        // persisted after one obtained later.
        std::lock_guard lock(mutex_);
        auto credential = source_.token();
        if (credential.access_token == last_seen_token_)
        {
            return credential;
        }
        last_seen_token_ = credential.access_token;
        logger_.log("auth", "credential changed, persisting");
        if (!persist_)
        {
            return credential;
        }
        try
        {
            persist_(credential);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("auth", "failed to persist refreshed credential: ", ex.what());
        }
        return credential;
    }

} // namespace clouddrive::client

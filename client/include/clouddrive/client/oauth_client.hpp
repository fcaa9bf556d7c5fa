#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "clouddrive/client/credential_refresh_guard.hpp"
#include "clouddrive/client/http_client.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/remote_types.hpp"

namespace clouddrive::client
{

    // Device-code flow and token refresh against the Microsoft identity platform.
    class OAuthClient : public TokenRefresher
    {
    public:
        OAuthClient(const HttpClient &http, Logger logger,
                    std::string authority = "https://login.microsoftonline.com/common/oauth2/v2.0");

        remote::DeviceCodeResponse start_device_code();

        // Throws clouddrive::Error(AuthorizationPending) until the user has approved the code.
        remote::Credential verify_device_code(const std::string &device_code);

        remote::Credential refresh(const remote::Credential &credential) override;

    private:
        nlohmann::json post_form(const std::string &endpoint,
                                 const std::vector<std::pair<std::string, std::string>> &fields);

        const HttpClient &http_;
        Logger logger_;
        std::string authority_;
    };

} // namespace clouddrive::client

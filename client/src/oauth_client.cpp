#include "clouddrive/client/oauth_client.hpp"

#include <array>
#include <chrono>
#include <string_view>

#include <nlohmann/json.hpp>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        constexpr const char *kClientId = "57caa7f2-c679-440c-8de2-f8ec86510722";
        constexpr const char *kScopes = "offline_access files.readwrite.all user.read email openid profile";
        constexpr const char *kDeviceCodeGrant = "urn:ietf:params:oauth:grant-type:device_code";

        struct OAuthErrorMapping
        {
            std::string_view error;
            ErrorCode code;
            std::string_view message;
        };

        constexpr std::array<OAuthErrorMapping, 5> kOAuthErrors{{
            {"authorization_pending", ErrorCode::AuthorizationPending, "authorization pending"},
            {"authorization_declined", ErrorCode::AuthenticationRequired, "authorization declined by user"},
            {"expired_token", ErrorCode::AuthenticationRequired, "device code expired"},
            {"invalid_grant", ErrorCode::AuthenticationRequired, "grant rejected"},
            {"invalid_request", ErrorCode::InvalidRequest, "invalid request"},
        }};

        [[noreturn]] void throw_oauth_error(const HttpResponse &response)
        {
            const auto json = nlohmann::json::parse(response.body, nullptr, false);
            if (!json.is_discarded() && json.is_object() && json.contains("error") && json["error"].is_string())
            {
                const auto error = json["error"].get<std::string>();
                const auto description = json.value("error_description", std::string{});
                for (const auto &mapping : kOAuthErrors)
                {
                    if (mapping.error == error)
                    {
                        std::string message(mapping.message);
                        if (!description.empty())
                        {
                            message += ": " + description;
                        }
                        throw Error(mapping.code, message, static_cast<int>(response.status));
                    }
                }
                throw Error(ErrorCode::OperationFailed, "OAuth error '" + error + "': " + description,
                            static_cast<int>(response.status));
            }
            throw Error(error_code_from_http_status(static_cast<int>(response.status)),
                        "HTTP " + std::to_string(response.status) + " from identity platform",
                        static_cast<int>(response.status));
        }

    } // namespace

    OAuthClient::OAuthClient(const HttpClient &http, Logger logger, std::string authority)
        : http_(http),
          logger_(std::move(logger)),
          authority_(std::move(authority)) {}

    remote::DeviceCodeResponse OAuthClient::start_device_code()
    {
        const auto json = post_form("/devicecode", {{"client_id", kClientId}, {"scope", kScopes}});
        try
        {
            return json.get<remote::DeviceCodeResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::DecodingFailed, std::string("device code response: ") + ex.what());
        }
    }

    remote::Credential OAuthClient::verify_device_code(const std::string &device_code)
    {
        const auto json = post_form("/token", {
                                                  {"client_id", kClientId},
                                                  {"grant_type", kDeviceCodeGrant},
                                                  {"device_code", device_code},
                                              });
        try
        {
            return remote::credential_from_token_response(json, std::chrono::system_clock::now());
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::DecodingFailed, std::string("token response: ") + ex.what());
        }
    }

    remote::Credential OAuthClient::refresh(const remote::Credential &credential)
    {
        if (credential.refresh_token.empty())
        {
            throw Error(ErrorCode::AuthenticationRequired, "no refresh token available");
        }
        const auto json = post_form("/token", {
                                                  {"client_id", kClientId},
                                                  {"grant_type", "refresh_token"},
                                                  {"refresh_token", credential.refresh_token},
                                                  {"scope", kScopes},
                                              });
        try
        {
            auto refreshed = remote::credential_from_token_response(json, std::chrono::system_clock::now());
            if (refreshed.refresh_token.empty())
            {
                refreshed.refresh_token = credential.refresh_token;
            }
            logger_.log("auth", "access token refreshed");
            return refreshed;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::DecodingFailed, std::string("token response: ") + ex.what());
        }
    }

    nlohmann::json OAuthClient::post_form(const std::string &endpoint,
                                          const std::vector<std::pair<std::string, std::string>> &fields)
    {
        HttpRequest request{
            .method = "POST",
            .url = authority_ + endpoint,
            .headers = {{"Content-Type", "application/x-www-form-urlencoded"}},
            .body = HttpClient::form_encode(fields),
        };
        logger_.debug("auth", "POST ", request.url);
        const auto response = http_.perform(request);
        if (response.status >= 400)
        {
            throw_oauth_error(response);
        }
        auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw Error(ErrorCode::DecodingFailed, "malformed response from " + request.url,
                        static_cast<int>(response.status));
        }
        return json;
    }

} // namespace clouddrive::client

#include "clouddrive/remote_types.hpp"

#include <array>
#include <charconv>

namespace clouddrive::remote
{

    namespace
    {

        struct StateMapping
        {
            AsyncOperationState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 6> kStateMappings{{
            {AsyncOperationState::NotStarted, "notStarted"},
            {AsyncOperationState::Waiting, "waiting"},
            {AsyncOperationState::InProgress, "inProgress"},
            {AsyncOperationState::Completed, "completed"},
            {AsyncOperationState::Failed, "failed"},
            {AsyncOperationState::Unknown, "unknown"},
        }};

        std::string string_or_empty(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end() || !it->is_string())
            {
                return {};
            }
            return it->get<std::string>();
        }

        std::optional<long long> integer_field(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end())
            {
                return std::nullopt;
            }
            if (it->is_number())
            {
                return static_cast<long long>(it->get<double>());
            }
            if (it->is_string())
            {
                const auto text = it->get<std::string>();
                long long value = 0;
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec == std::errc{} && ptr == text.data() + text.size())
                {
                    return value;
                }
            }
            return std::nullopt;
        }

    } // namespace

    void to_json(nlohmann::json &json, const Credential &credential)
    {
        json = {
            {"access_token", credential.access_token},
            {"refresh_token", credential.refresh_token},
            {"token_type", credential.token_type},
        };
        if (credential.expiry)
        {
            json["expiry"] = format_timestamp(*credential.expiry);
        }
    }

    void from_json(const nlohmann::json &json, Credential &credential)
    {
        credential.access_token = string_or_empty(json, "access_token");
        credential.refresh_token = string_or_empty(json, "refresh_token");
        credential.token_type = json.value("token_type", std::string{"Bearer"});
        credential.expiry.reset();
        if (const auto expiry = string_or_empty(json, "expiry"); !expiry.empty())
        {
            credential.expiry = parse_timestamp(expiry);
        }
    }

    Credential credential_from_token_response(const nlohmann::json &json, TimePoint now)
    {
        Credential credential;
        credential.access_token = json.at("access_token").get<std::string>();
        credential.refresh_token = string_or_empty(json, "refresh_token");
        if (auto type = string_or_empty(json, "token_type"); !type.empty())
        {
            credential.token_type = std::move(type);
        }
        if (const auto expires_in = integer_field(json, "expires_in"); expires_in && *expires_in > 0)
        {
            credential.expiry = now + std::chrono::seconds{*expires_in};
        }
        return credential;
    }

    void to_json(nlohmann::json &json, const UploadSessionInfo &session)
    {
        json = {
            {"uploadUrl", session.upload_url},
            {"nextExpectedRanges", session.next_expected_ranges},
        };
        if (session.expiration)
        {
            json["expirationDateTime"] = format_timestamp(*session.expiration);
        }
    }

    void from_json(const nlohmann::json &json, UploadSessionInfo &session)
    {
        session.upload_url = string_or_empty(json, "uploadUrl");
        session.expiration.reset();
        if (const auto expiry = string_or_empty(json, "expirationDateTime"); !expiry.empty())
        {
            session.expiration = parse_timestamp(expiry);
        }
        session.next_expected_ranges.clear();
        if (auto it = json.find("nextExpectedRanges"); it != json.end() && it->is_array())
        {
            for (const auto &range : *it)
            {
                if (range.is_string())
                {
                    session.next_expected_ranges.push_back(range.get<std::string>());
                }
            }
        }
    }

    std::optional<std::uint64_t> range_start(std::string_view range)
    {
        const auto dash = range.find('-');
        const auto digits = range.substr(0, dash);
        if (digits.empty())
        {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{} || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        return value;
    }

    void to_json(nlohmann::json &json, const DriveItem &item)
    {
        json = {
            {"id", item.id},
            {"name", item.name},
            {"size", item.size},
            {"webUrl", item.web_url},
        };
    }

    void from_json(const nlohmann::json &json, DriveItem &item)
    {
        item.id = string_or_empty(json, "id");
        item.name = string_or_empty(json, "name");
        item.size = static_cast<std::uint64_t>(integer_field(json, "size").value_or(0));
        item.web_url = string_or_empty(json, "webUrl");
    }

    std::string_view to_string(AsyncOperationState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    AsyncOperationState async_operation_state_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.label == value)
            {
                return mapping.state;
            }
        }
        return AsyncOperationState::Unknown;
    }

    void from_json(const nlohmann::json &json, AsyncOperationStatus &status)
    {
        status.raw_status = string_or_empty(json, "status");
        status.state = async_operation_state_from_string(status.raw_status);
        status.percent_complete = static_cast<int>(integer_field(json, "percentageComplete").value_or(0));
        status.description = string_or_empty(json, "statusDescription");
        status.result_identifier.clear();
        status.failure_detail.clear();

        if (status.state == AsyncOperationState::Completed)
        {
            status.result_identifier = string_or_empty(json, "resourceId");
            if (status.result_identifier.empty())
            {
                status.result_identifier = string_or_empty(json, "resourceLocation");
            }
        }
        else if (status.state == AsyncOperationState::Failed)
        {
            if (auto it = json.find("error"); it != json.end() && it->is_object())
            {
                status.failure_detail = "Code: " + string_or_empty(*it, "code") + ", Message: " +
                                        string_or_empty(*it, "message");
            }
            else
            {
                status.failure_detail = status.description;
            }
        }
    }

    void from_json(const nlohmann::json &json, DeviceCodeResponse &response)
    {
        response.device_code = json.at("device_code").get<std::string>();
        response.user_code = json.at("user_code").get<std::string>();
        response.verification_uri = json.at("verification_uri").get<std::string>();
        response.expires_in = static_cast<int>(integer_field(json, "expires_in").value_or(0));
        response.interval = static_cast<int>(integer_field(json, "interval").value_or(5));
        response.message = string_or_empty(json, "message");
    }

    void from_json(const nlohmann::json &json, UserInfo &user)
    {
        user.display_name = string_or_empty(json, "displayName");
        user.user_principal_name = string_or_empty(json, "userPrincipalName");
    }

} // namespace clouddrive::remote

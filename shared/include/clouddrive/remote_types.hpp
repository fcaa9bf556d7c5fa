/**
 * clouddrive - Data exchanged with the remote drive service and its identity platform,
 * with JSON mapping for the wire format and for local persistence.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "clouddrive/timestamp.hpp"

namespace clouddrive::remote
{

    struct Credential
    {
        std::string access_token{};
        std::string refresh_token{};
        std::string token_type{"Bearer"};
        std::optional<TimePoint> expiry{};

        bool empty() const noexcept { return access_token.empty(); }
    };

    // Persisted form (config file): expiry is an RFC 3339 string.
    void to_json(nlohmann::json &json, const Credential &credential);
    void from_json(const nlohmann::json &json, Credential &credential);

    // Token endpoint response: {access_token, refresh_token, token_type, expires_in}.
    Credential credential_from_token_response(const nlohmann::json &json, TimePoint now);

    struct UploadSessionInfo
    {
        std::string upload_url{};
        std::optional<TimePoint> expiration{};
        std::vector<std::string> next_expected_ranges{};
    };

    void to_json(nlohmann::json &json, const UploadSessionInfo &session);
    void from_json(const nlohmann::json &json, UploadSessionInfo &session);

    // Start offset of a "start-" or "start-end" range.
    std::optional<std::uint64_t> range_start(std::string_view range);

    struct DriveItem
    {
        std::string id{};
        std::string name{};
        std::uint64_t size{};
        std::string web_url{};
    };

    void to_json(nlohmann::json &json, const DriveItem &item);
    void from_json(const nlohmann::json &json, DriveItem &item);

    enum class AsyncOperationState : std::uint8_t
    {
        NotStarted,
        Waiting,
        InProgress,
        Completed,
        Failed,
        Unknown
    };

    std::string_view to_string(AsyncOperationState state) noexcept;
    // Unrecognised labels map to Unknown.
    AsyncOperationState async_operation_state_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(AsyncOperationState state) noexcept
    {
        return state == AsyncOperationState::Completed || state == AsyncOperationState::Failed;
    }

    struct AsyncOperationStatus
    {
        AsyncOperationState state{AsyncOperationState::Unknown};
        std::string raw_status{};
        int percent_complete{};
        std::string description{};
        std::string result_identifier{};
        std::string failure_detail{};
    };

    void from_json(const nlohmann::json &json, AsyncOperationStatus &status);

    struct DeviceCodeResponse
    {
        std::string device_code{};
        std::string user_code{};
        std::string verification_uri{};
        int expires_in{};
        int interval{};
        std::string message{};
    };

    void from_json(const nlohmann::json &json, DeviceCodeResponse &response);

    struct UserInfo
    {
        std::string display_name{};
        std::string user_principal_name{};
    };

    void from_json(const nlohmann::json &json, UserInfo &user);

} // namespace clouddrive::remote

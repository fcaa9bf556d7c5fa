#include "clouddrive/error_codes.hpp"

#include <array>

namespace clouddrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 17> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::NetworkFailure, "network_failure"},
            {ErrorCode::InvalidRequest, "invalid_request"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::AuthorizationPending, "authorization_pending"},
            {ErrorCode::AccessDenied, "access_denied"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::QuotaExceeded, "quota_exceeded"},
            {ErrorCode::RetryLater, "retry_later"},
            {ErrorCode::SessionExpired, "session_expired"},
            {ErrorCode::DecodingFailed, "decoding_failed"},
            {ErrorCode::SourceUnreadable, "source_unreadable"},
            {ErrorCode::StateStoreFailure, "state_store_failure"},
            {ErrorCode::OperationFailed, "operation_failed"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    ErrorCode error_code_from_http_status(int status) noexcept
    {
        switch (status)
        {
        case 400:
            return ErrorCode::InvalidRequest;
        case 401:
            return ErrorCode::AuthenticationRequired;
        case 403:
            return ErrorCode::AccessDenied;
        case 404:
            return ErrorCode::NotFound;
        case 409:
            return ErrorCode::Conflict;
        case 413:
        case 507:
            return ErrorCode::QuotaExceeded;
        case 429:
        case 503:
            return ErrorCode::RetryLater;
        default:
            return status >= 400 ? ErrorCode::OperationFailed : ErrorCode::Ok;
        }
    }

    Error::Error(ErrorCode code, const std::string &message, int http_status)
        : std::runtime_error(message),
          code_(code),
          http_status_(http_status)
    {
    }

} // namespace clouddrive

/**
 * clouddrive - Error codes and the exception type shared by every layer.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace clouddrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        NetworkFailure = 2,
        InvalidRequest = 3,
        AuthenticationRequired = 4,
        AuthorizationPending = 5,
        AccessDenied = 6,
        NotFound = 7,
        Conflict = 8,
        QuotaExceeded = 9,
        RetryLater = 10,
        SessionExpired = 11,
        DecodingFailed = 12,
        SourceUnreadable = 13,
        StateStoreFailure = 14,
        OperationFailed = 15,
        InternalError = 16
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Maps a Graph / OAuth HTTP status (>= 400) onto the taxonomy.
    ErrorCode error_code_from_http_status(int status) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message, int http_status = 0);

        ErrorCode code() const noexcept { return code_; }
        int http_status() const noexcept { return http_status_; }

    private:
        ErrorCode code_;
        int http_status_;
    };

} // namespace clouddrive

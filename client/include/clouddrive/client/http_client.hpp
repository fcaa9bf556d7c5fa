#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clouddrive::client
{

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        bool follow_redirects{true};
    };

    struct HttpResponse
    {
        long status{};
        // Names are lower-cased.
        std::map<std::string, std::string> headers;
        std::string body;

        std::string header(std::string_view name) const;
        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    // Blocking HTTP(S) over libcurl. Transport failures throw clouddrive::Error(NetworkFailure);
    // HTTP error statuses are returned, not thrown.
    class HttpClient
    {
    public:
        explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds{30});

        HttpResponse perform(const HttpRequest &request) const;

        // Percent-encodes every path segment, keeping the '/' separators.
        static std::string escape_path(std::string_view path);
        // application/x-www-form-urlencoded body from key/value pairs.
        static std::string form_encode(const std::vector<std::pair<std::string, std::string>> &fields);

    private:
        std::chrono::seconds timeout_;
    };

} // namespace clouddrive::client

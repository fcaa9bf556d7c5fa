#include "clouddrive/client/http_client.hpp"

#include <curl/curl.h>

#include <cctype>
#include <memory>
#include <mutex>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        struct EasyDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        struct CurlStringDeleter
        {
            void operator()(char *text) const noexcept { curl_free(text); }
        };

        using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
        using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

        void ensure_curl_init()
        {
            static std::once_flag flag;
            static CURLcode result = CURLE_OK;
            std::call_once(flag, []
                           { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
            if (result != CURLE_OK)
            {
                throw Error(ErrorCode::InternalError,
                            std::string("curl_global_init failed: ") + curl_easy_strerror(result));
            }
        }

        EasyHandle make_handle()
        {
            ensure_curl_init();
            EasyHandle handle(curl_easy_init());
            if (!handle)
            {
                throw Error(ErrorCode::InternalError, "curl_easy_init failed");
            }
            return handle;
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::size_t write_body(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            auto *body = static_cast<std::string *>(userdata);
            body->append(data, size * count);
            return size * count;
        }

        std::size_t write_header(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            auto *response = static_cast<HttpResponse *>(userdata);
            const std::string line(data, size * count);
            if (line.starts_with("HTTP/"))
            {
                // A new status line starts a new header block (redirects, 100-continue).
                response->headers.clear();
                return size * count;
            }
            const auto colon = line.find(':');
            if (colon != std::string::npos)
            {
                response->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
            }
            return size * count;
        }

        std::string escape(CURL *handle, std::string_view text)
        {
            // curl treats a zero length as "use strlen".
            if (text.empty())
            {
                return {};
            }
            std::unique_ptr<char, CurlStringDeleter> escaped(
                curl_easy_escape(handle, text.data(), static_cast<int>(text.size())));
            if (!escaped)
            {
                throw Error(ErrorCode::InternalError, "curl_easy_escape failed");
            }
            return std::string(escaped.get());
        }

    } // namespace

    std::string HttpResponse::header(std::string_view name) const
    {
        auto it = headers.find(to_lower(std::string(name)));
        return it == headers.end() ? std::string{} : it->second;
    }

    HttpClient::HttpClient(std::chrono::seconds timeout)
        : timeout_(timeout) {}

    HttpResponse HttpClient::perform(const HttpRequest &request) const
    {
        auto handle = make_handle();
        CURL *curl = handle.get();

        HeaderList headers;
        for (const auto &[name, value] : request.headers)
        {
            const auto line = name + ": " + value;
            auto *appended = curl_slist_append(headers.get(), line.c_str());
            if (!appended)
            {
                throw Error(ErrorCode::InternalError, "curl_slist_append failed");
            }
            headers.release();
            headers.reset(appended);
        }

        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);

        if (request.method == "GET")
        {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            if (request.method != "DELETE" || !request.body.empty())
            {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            }
        }

        const auto result = curl_easy_perform(curl);
        if (result != CURLE_OK)
        {
            throw Error(ErrorCode::NetworkFailure,
                        request.method + " " + request.url + " failed: " + curl_easy_strerror(result));
        }
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

    std::string HttpClient::escape_path(std::string_view path)
    {
        auto handle = make_handle();
        std::string result;
        std::size_t begin = 0;
        while (begin <= path.size())
        {
            const auto slash = path.find('/', begin);
            const auto end = slash == std::string_view::npos ? path.size() : slash;
            result += escape(handle.get(), path.substr(begin, end - begin));
            if (slash == std::string_view::npos)
            {
                break;
            }
            result += '/';
            begin = slash + 1;
        }
        return result;
    }

    std::string HttpClient::form_encode(const std::vector<std::pair<std::string, std::string>> &fields)
    {
        auto handle = make_handle();
        std::string result;
        for (const auto &[key, value] : fields)
        {
            if (!result.empty())
            {
                result += '&';
            }
            result += escape(handle.get(), key);
            result += '=';
            result += escape(handle.get(), value);
        }
        return result;
    }

} // namespace clouddrive::client

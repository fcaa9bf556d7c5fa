#include "clouddrive/client/graph_service.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        std::string graph_error_message(const HttpResponse &response)
        {
            std::string message = "HTTP " + std::to_string(response.status);
            const auto json = nlohmann::json::parse(response.body, nullptr, false);
            if (json.is_discarded() || !json.is_object())
            {
                return message;
            }
            if (auto it = json.find("error"); it != json.end() && it->is_object())
            {
                const auto code = it->value("code", std::string{});
                const auto text = it->value("message", std::string{});
                if (!code.empty())
                {
                    message += " " + code;
                }
                if (!text.empty())
                {
                    message += ": " + text;
                }
            }
            return message;
        }

        [[noreturn]] void throw_http_error(const HttpResponse &response, const std::string &context)
        {
            throw Error(error_code_from_http_status(static_cast<int>(response.status)),
                        context + ": " + graph_error_message(response), static_cast<int>(response.status));
        }

        // On an upload session URL a 404 means the session is gone.
        [[noreturn]] void throw_upload_error(const HttpResponse &response, const std::string &context)
        {
            if (response.status == 404)
            {
                throw Error(ErrorCode::SessionExpired, context + ": upload session no longer exists", 404);
            }
            throw_http_error(response, context);
        }

        template <typename T>
        T decode(const HttpResponse &response, const std::string &context)
        {
            try
            {
                return nlohmann::json::parse(response.body).get<T>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw Error(ErrorCode::DecodingFailed, context + ": " + ex.what(), static_cast<int>(response.status));
            }
        }

        std::string trim_slashes(const std::string &path)
        {
            const auto begin = path.find_first_not_of('/');
            if (begin == std::string::npos)
            {
                return {};
            }
            const auto end = path.find_last_not_of('/');
            return path.substr(begin, end - begin + 1);
        }

    } // namespace

    GraphService::GraphService(const HttpClient &http, CredentialRefreshGuard &credentials, HttpSettings settings,
                               Logger logger, std::string base_url)
        : http_(http),
          credentials_(credentials),
          settings_(settings),
          logger_(std::move(logger)),
          base_url_(std::move(base_url)) {}

    std::string GraphService::path_url(const std::string &remote_path) const
    {
        const auto trimmed = trim_slashes(remote_path);
        if (trimmed.empty())
        {
            return base_url_ + "me/drive/root";
        }
        return base_url_ + "me/drive/root:/" + HttpClient::escape_path(trimmed);
    }

    remote::UploadSessionInfo GraphService::open_upload_session(const std::string &remote_path)
    {
        const nlohmann::json body = {{"item", {{"@microsoft.graph.conflictBehavior", "replace"}}}};
        auto response = authenticated_call(HttpRequest{
            .method = "POST",
            .url = path_url(remote_path) + ":/createUploadSession",
            .headers = {{"Content-Type", "application/json"}},
            .body = body.dump(),
        });
        auto session = decode<remote::UploadSessionInfo>(response, "create upload session for " + remote_path);
        if (session.upload_url.empty())
        {
            throw Error(ErrorCode::DecodingFailed, "create upload session for " + remote_path + ": missing uploadUrl");
        }
        logger_.log("graph", "opened upload session for ", remote_path);
        return session;
    }

    ChunkResult GraphService::send_chunk(const std::string &upload_handle, std::uint64_t start, std::uint64_t end,
                                         std::uint64_t total, std::span<const std::byte> bytes)
    {
        const auto range = "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
        HttpRequest request{
            .method = "PUT",
            .url = upload_handle,
            .headers = {{"Content-Range", range}, {"Content-Type", "application/octet-stream"}},
            .body = std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size()),
        };
        const auto response = unauthenticated_call(request);
        const auto context = "upload chunk " + range;
        if (response.status == 202)
        {
            return ChunkResult{.session = decode<remote::UploadSessionInfo>(response, context)};
        }
        if (response.status == 200 || response.status == 201)
        {
            return ChunkResult{.item = decode<remote::DriveItem>(response, context)};
        }
        throw_upload_error(response, context);
    }

    UploadSessionStatus GraphService::query_upload_session(const std::string &upload_handle)
    {
        const auto response = unauthenticated_call(HttpRequest{.method = "GET", .url = upload_handle});
        if (!response.ok())
        {
            throw_upload_error(response, "query upload session");
        }
        const auto session = decode<remote::UploadSessionInfo>(response, "query upload session");
        if (session.next_expected_ranges.empty())
        {
            return UploadSessionStatus{.complete = true};
        }
        const auto start = remote::range_start(session.next_expected_ranges.front());
        if (!start)
        {
            throw Error(ErrorCode::DecodingFailed,
                        "query upload session: bad range '" + session.next_expected_ranges.front() + "'");
        }
        return UploadSessionStatus{.complete = false, .watermark = *start};
    }

    void GraphService::cancel_upload_session(const std::string &upload_handle)
    {
        const auto response = unauthenticated_call(HttpRequest{.method = "DELETE", .url = upload_handle});
        if (!response.ok())
        {
            throw_upload_error(response, "cancel upload session");
        }
        logger_.log("graph", "cancelled upload session");
    }

    remote::DriveItem GraphService::finalize_empty_upload(const std::string &upload_handle,
                                                          const std::string &remote_path)
    {
        try
        {
            cancel_upload_session(upload_handle);
        }
        catch (const Error &ex)
        {
            if (ex.code() != ErrorCode::SessionExpired)
            {
                throw;
            }
        }
        const auto response = authenticated_call(HttpRequest{
            .method = "PUT",
            .url = path_url(remote_path) + ":/content",
            .headers = {{"Content-Type", "application/octet-stream"}},
        });
        auto item = decode<remote::DriveItem>(response, "create empty " + remote_path);
        logger_.log("graph", "created empty ", remote_path);
        return item;
    }

    remote::AsyncOperationStatus GraphService::query_async_operation(const std::string &job_handle)
    {
        const auto response = unauthenticated_call(HttpRequest{
            .method = "GET",
            .url = job_handle,
            .follow_redirects = false,
        });
        if (response.status == 303)
        {
            remote::AsyncOperationStatus status;
            status.state = remote::AsyncOperationState::Completed;
            status.raw_status = "completed";
            status.percent_complete = 100;
            status.result_identifier = response.header("location");
            return status;
        }
        if (response.status != 200 && response.status != 202)
        {
            throw_http_error(response, "query operation status");
        }
        return decode<remote::AsyncOperationStatus>(response, "query operation status");
    }

    remote::DriveItem GraphService::get_item(const std::string &remote_path)
    {
        const auto response = authenticated_call(HttpRequest{.method = "GET", .url = path_url(remote_path)});
        return decode<remote::DriveItem>(response, "get item " + remote_path);
    }

    std::string GraphService::start_copy(const std::string &source_path, const std::string &destination_parent,
                                         const std::string &new_name)
    {
        const auto source = get_item(source_path);
        nlohmann::json body = {
            {"parentReference", {{"path", "/drive/root:/" + trim_slashes(destination_parent)}}},
        };
        if (!new_name.empty())
        {
            body["name"] = new_name;
        }
        const auto response = authenticated_call(HttpRequest{
            .method = "POST",
            .url = base_url_ + "me/drive/items/" + source.id + "/copy",
            .headers = {{"Content-Type", "application/json"}},
            .body = body.dump(),
        });
        if (response.status != 202)
        {
            throw Error(ErrorCode::OperationFailed,
                        "copy " + source_path + ": expected 202 Accepted, got " + std::to_string(response.status),
                        static_cast<int>(response.status));
        }
        auto monitor = response.header("location");
        if (monitor.empty())
        {
            throw Error(ErrorCode::DecodingFailed, "copy " + source_path + ": response has no Location header");
        }
        logger_.log("graph", "copy of ", source_path, " accepted");
        return monitor;
    }

    remote::UserInfo GraphService::get_me()
    {
        const auto response = authenticated_call(HttpRequest{.method = "GET", .url = base_url_ + "me"});
        return decode<remote::UserInfo>(response, "get user");
    }

    HttpResponse GraphService::authenticated_call(HttpRequest request)
    {
        const int attempts = std::max(1, settings_.retry_attempts);
        const auto auth_index = request.headers.size();
        request.headers.emplace_back("Authorization", "");

        for (int attempt = 0;; ++attempt)
        {
            const bool last = attempt + 1 >= attempts;
            const auto credential = credentials_.current_credential();
            request.headers[auth_index].second = credential.token_type + " " + credential.access_token;

            logger_.debug("graph", request.method, " ", request.url, " attempt ", attempt + 1);
            HttpResponse response;
            try
            {
                response = http_.perform(request);
            }
            catch (const Error &ex)
            {
                if (ex.code() != ErrorCode::NetworkFailure || last)
                {
                    throw;
                }
                logger_.warn("graph", ex.what(), ", retrying");
                std::this_thread::sleep_for(settings_.retry_delay);
                continue;
            }

            if (response.ok())
            {
                return response;
            }
            const bool retryable = response.status == 401 || response.status == 429 || response.status == 503;
            if (!retryable || last)
            {
                throw_http_error(response, request.method + " " + request.url);
            }
            auto delay = settings_.retry_delay;
            if (response.status == 429)
            {
                delay = std::min(settings_.retry_delay * (2 * (attempt + 1)), settings_.max_retry_delay);
            }
            logger_.warn("graph", "HTTP ", response.status, " from ", request.url, ", retrying in ", delay.count(),
                         "ms");
            std::this_thread::sleep_for(delay);
        }
    }

    HttpResponse GraphService::unauthenticated_call(const HttpRequest &request)
    {
        logger_.debug("graph", request.method, " ", request.url);
        return http_.perform(request);
    }

} // namespace clouddrive::client

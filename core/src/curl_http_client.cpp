#include "chunkup/curl_http_client.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "chunkup/errors.hpp"

namespace chunkup
{

    namespace
    {

        struct TransferContext
        {
            std::span<const std::byte> body;
            std::size_t offset{0};
            const TransferProgressHandler *progress{nullptr};
            const CancellationToken *token{nullptr};
            std::uint64_t last_reported{0};
            std::string status_line;
            std::string response_body;
        };

        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        constexpr std::size_t kMaxResponseBody = 16 * 1024;

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
                {
                    throw std::runtime_error("curl_global_init failed");
                } });
        }

        std::string trim(std::string value)
        {
            const auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(begin, end - begin + 1);
        }

        // "HTTP/1.1 503 Service Unavailable" -> "Service Unavailable"
        std::string reason_phrase(const std::string &status_line)
        {
            const auto first_space = status_line.find(' ');
            if (first_space == std::string::npos)
            {
                return "";
            }
            const auto second_space = status_line.find(' ', first_space + 1);
            if (second_space == std::string::npos)
            {
                return "";
            }
            return trim(status_line.substr(second_space + 1));
        }

        std::size_t read_body(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            if (context->token->is_cancelled())
            {
                return CURL_READFUNC_ABORT;
            }
            const auto capacity = size * nitems;
            const auto remaining = context->body.size() - context->offset;
            const auto count = std::min(capacity, remaining);
            if (count > 0)
            {
                std::memcpy(buffer, context->body.data() + context->offset, count);
                context->offset += count;
            }
            return count;
        }

        std::size_t write_body(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            const auto total = size * nmemb;
            if (context->response_body.size() < kMaxResponseBody)
            {
                context->response_body.append(ptr, std::min(total, kMaxResponseBody - context->response_body.size()));
            }
            return total;
        }

        std::size_t read_header(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            const auto total = size * nitems;
            const std::string line(buffer, total);
            // Redirects and 100-continue produce several status lines; keep the last.
            if (line.rfind("HTTP/", 0) == 0)
            {
                context->status_line = trim(line);
            }
            return total;
        }

        int report_progress(void *clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                            curl_off_t ulnow)
        {
            auto *context = static_cast<TransferContext *>(clientp);
            if (context->token->is_cancelled())
            {
                return 1;
            }
            const auto sent = static_cast<std::uint64_t>(ulnow);
            if (sent > context->last_reported && context->progress && *context->progress)
            {
                context->last_reported = sent;
                (*context->progress)(sent);
            }
            return 0;
        }

    } // namespace

    CurlHttpClient::CurlHttpClient()
        : CurlHttpClient(Settings{})
    {
    }

    CurlHttpClient::CurlHttpClient(Settings settings)
        : settings_(std::move(settings))
    {
        ensure_curl_global_init();
    }

    HttpResponse CurlHttpClient::perform(const HttpRequest &request, const TransferProgressHandler &progress,
                                         const CancellationToken &token)
    {
        token.throw_if_cancelled();

        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
        {
            throw ConnectionError("Cannot initialize curl");
        }

        HeaderList headers(nullptr, &curl_slist_free_all);
        for (const auto &[name, value] : request.headers)
        {
            const auto header = name + ": " + value;
            auto *appended = curl_slist_append(headers.get(), header.c_str());
            if (!appended)
            {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers.release();
            headers.reset(appended);
        }
        // Send the body right away instead of waiting for 100-continue.
        auto *appended = curl_slist_append(headers.get(), "Expect:");
        if (appended)
        {
            headers.release();
            headers.reset(appended);
        }

        TransferContext context;
        context.body = request.body;
        context.progress = &progress;
        context.token = &token;

        auto *handle = curl.get();
        const auto body_size = static_cast<curl_off_t>(request.body.size());
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_USERAGENT, settings_.user_agent.c_str());
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.connect_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, settings_.low_speed_limit);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(settings_.low_speed_time.count()));

        if (request.method == "POST")
        {
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, body_size);
        }
        else
        {
            curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, body_size);
            if (request.method != "PUT")
            {
                curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
        }
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, &read_body);
        curl_easy_setopt(handle, CURLOPT_READDATA, &context);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &write_body);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &read_header);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &context);
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &report_progress);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &context);

        const CURLcode res = curl_easy_perform(handle);
        if (res == CURLE_ABORTED_BY_CALLBACK || (res == CURLE_READ_ERROR && token.is_cancelled()))
        {
            spdlog::debug("{} {} aborted", request.method, request.url);
            throw CancellationError();
        }
        if (res != CURLE_OK)
        {
            throw ConnectionError(std::string("curl: ") + curl_easy_strerror(res));
        }

        HttpResponse response;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.status_message = reason_phrase(context.status_line);
        response.body = std::move(context.response_body);
        spdlog::debug("{} {} -> {} {}", request.method, request.url, response.status_code, response.status_message);
        return response;
    }

} // namespace chunkup

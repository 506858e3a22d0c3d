#pragma once

#include <chrono>

#include "chunkup/http_client.hpp"

namespace chunkup
{

    class CurlHttpClient : public HttpClient
    {
    public:
        struct Settings
        {
            std::chrono::seconds connect_timeout{std::chrono::seconds{30}};
            // Abort when fewer than `low_speed_limit` bytes/s flow for `low_speed_time`.
            long low_speed_limit{1};
            std::chrono::seconds low_speed_time{std::chrono::seconds{60}};
            std::string user_agent{"chunkup"};
        };

        CurlHttpClient();
        explicit CurlHttpClient(Settings settings);

        HttpResponse perform(const HttpRequest &request, const TransferProgressHandler &progress,
                             const CancellationToken &token) override;

    private:
        Settings settings_;
    };

} // namespace chunkup

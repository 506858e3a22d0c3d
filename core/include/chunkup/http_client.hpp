/**
 * chunkup - Blocking HTTP request interface used by the chunk transport and
 * the event reporter.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "chunkup/cancellation.hpp"

namespace chunkup
{

    struct HttpRequest
    {
        std::string method{"PUT"};
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::span<const std::byte> body;
    };

    struct HttpResponse
    {
        long status_code{};
        std::string status_message;
        std::string body;
    };

    // Called with the number of body bytes sent so far in the current request.
    using TransferProgressHandler = std::function<void(std::uint64_t)>;

    class HttpClient
    {
    public:
        virtual ~HttpClient() = default;

        // Performs one request. Throws ConnectionError when no HTTP response
        // was received and CancellationError when `token` aborted the transfer.
        virtual HttpResponse perform(const HttpRequest &request, const TransferProgressHandler &progress,
                                     const CancellationToken &token) = 0;
    };

} // namespace chunkup

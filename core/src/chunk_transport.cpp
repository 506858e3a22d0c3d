#include "chunkup/chunk_transport.hpp"

#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkup/errors.hpp"

namespace chunkup
{

    ResponseDisposition classify_status(long status_code) noexcept
    {
        // 308 is "Resume Incomplete" for resumable upload servers.
        if ((status_code >= 200 && status_code < 300) || status_code == 308)
        {
            return ResponseDisposition::Proceed;
        }
        if (status_code == 408 || status_code == 429 || (status_code >= 500 && status_code < 600))
        {
            return ResponseDisposition::Retry;
        }
        return ResponseDisposition::Error;
    }

    std::string content_range(const FileChunk &chunk)
    {
        const auto total = std::to_string(chunk.total_file_size);
        if (chunk.size() == 0)
        {
            return "bytes */" + total;
        }
        return "bytes " + std::to_string(chunk.start_byte) + "-" + std::to_string(chunk.end_byte - 1) + "/" + total;
    }

    ChunkTransport::ChunkTransport(std::shared_ptr<HttpClient> client, int max_retries)
        : client_(std::move(client)),
          max_retries_(max_retries)
    {
        if (!client_)
        {
            throw std::invalid_argument("ChunkTransport requires an HTTP client");
        }
        if (max_retries_ < 0)
        {
            throw std::invalid_argument("Retries per chunk cannot be negative");
        }
    }

    ChunkUploadResult ChunkTransport::upload(const FileChunk &chunk, const std::string &upload_url,
                                             const CancellationToken &token, const TransferProgressHandler &progress)
    {
        HttpRequest request{
            .method = "PUT",
            .url = upload_url,
            .headers = {{"Content-Type", "application/octet-stream"}, {"Content-Range", content_range(chunk)}},
            .body = std::span<const std::byte>(chunk.data),
        };

        const int max_attempts = max_retries_ + 1;
        std::optional<HttpError> last_http_error;
        std::string last_error = "no attempt made";
        for (int attempt = 1; attempt <= max_attempts; ++attempt)
        {
            token.throw_if_cancelled();
            try
            {
                const auto response = client_->perform(request, progress, token);
                const HttpError http_error{response.status_code, response.status_message};
                switch (classify_status(response.status_code))
                {
                case ResponseDisposition::Proceed:
                    spdlog::debug("Chunk {} accepted with {} after {} attempt(s)", request.headers[1].second,
                                  response.status_code, attempt);
                    return {.attempts = attempt, .status_code = response.status_code};
                case ResponseDisposition::Retry:
                    spdlog::warn("Chunk {} attempt {}/{} failed: {}", request.headers[1].second, attempt, max_attempts,
                                 http_error.describe());
                    last_http_error = http_error;
                    last_error = http_error.describe();
                    break;
                case ResponseDisposition::Error:
                    spdlog::error("Chunk {} rejected: {}", request.headers[1].second, http_error.describe());
                    throw ChunkTransportError("Chunk upload rejected: " + http_error.describe(), http_error, attempt);
                }
            }
            catch (const ConnectionError &ex)
            {
                spdlog::warn("Chunk {} attempt {}/{} failed: {}", request.headers[1].second, attempt, max_attempts,
                             ex.what());
                last_http_error.reset();
                last_error = ex.what();
            }
        }

        throw ChunkTransportError("Failed to upload chunk after " + std::to_string(max_attempts) +
                                      " attempt(s): " + last_error,
                                  last_http_error, max_attempts);
    }

    ChunkUploadResult ChunkTransport::signal_completion(std::uint64_t total_file_size, const std::string &upload_url,
                                                        const CancellationToken &token)
    {
        const FileChunk terminal{
            .start_byte = total_file_size,
            .end_byte = total_file_size,
            .total_file_size = total_file_size,
            .data = {},
        };
        return upload(terminal, upload_url, token, TransferProgressHandler{});
    }

} // namespace chunkup

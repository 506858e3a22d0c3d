/**
 * chunkup - Sends one chunk per HTTP request with bounded, immediate retries.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "chunkup/cancellation.hpp"
#include "chunkup/chunked_file.hpp"
#include "chunkup/http_client.hpp"

namespace chunkup
{

    enum class ResponseDisposition : std::uint8_t
    {
        Proceed,
        Retry,
        Error
    };

    ResponseDisposition classify_status(long status_code) noexcept;

    // "bytes <first>-<last>/<total>", or "bytes */<total>" for an empty chunk.
    std::string content_range(const FileChunk &chunk);

    struct ChunkUploadResult
    {
        int attempts{};
        long status_code{};
    };

    class ChunkTransport
    {
    public:
        ChunkTransport(std::shared_ptr<HttpClient> client, int max_retries);

        // Throws ChunkTransportError once every attempt failed, CancellationError
        // when `token` fires. `progress` receives bytes sent within the current attempt.
        ChunkUploadResult upload(const FileChunk &chunk, const std::string &upload_url, const CancellationToken &token,
                                 const TransferProgressHandler &progress);

        // Empty terminal request announcing the final size.
        ChunkUploadResult signal_completion(std::uint64_t total_file_size, const std::string &upload_url,
                                            const CancellationToken &token);

        int max_retries() const noexcept { return max_retries_; }

    private:
        std::shared_ptr<HttpClient> client_;
        int max_retries_;
    };

} // namespace chunkup

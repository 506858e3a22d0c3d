/**
 * chunkup - Exceptions raised by the chunker, the transport and the worker loop.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace chunkup
{

    class UploadException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The local file could not be stat'ed, opened or read.
    class FileAccessError : public UploadException
    {
    public:
        using UploadException::UploadException;
    };

    // A method was called out of order, e.g. reading before open().
    class InvalidStateError : public UploadException
    {
    public:
        using UploadException::UploadException;
    };

    // Transport-level failure below HTTP: DNS, connect, TLS, reset.
    class ConnectionError : public UploadException
    {
    public:
        using UploadException::UploadException;
    };

    // User-initiated abort. Never retried and never reported as a failure.
    class CancellationError : public UploadException
    {
    public:
        CancellationError() : UploadException("Upload cancelled") {}
    };

    struct HttpError
    {
        long status_code{};
        std::string message;

        std::string describe() const;
    };

    // A chunk could not be delivered after every permitted attempt.
    class ChunkTransportError : public UploadException
    {
    public:
        ChunkTransportError(const std::string &message, std::optional<HttpError> http_error, int attempts);

        const std::optional<HttpError> &http_error() const noexcept { return http_error_; }
        int attempts() const noexcept { return attempts_; }

    private:
        std::optional<HttpError> http_error_;
        int attempts_{};
    };

} // namespace chunkup

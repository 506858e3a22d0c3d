#include "chunkup/errors.hpp"

namespace chunkup
{

    std::string HttpError::describe() const
    {
        if (message.empty())
        {
            return "HTTP " + std::to_string(status_code);
        }
        return "HTTP " + std::to_string(status_code) + ": " + message;
    }

    ChunkTransportError::ChunkTransportError(const std::string &message, std::optional<HttpError> http_error,
                                             int attempts)
        : UploadException(message),
          http_error_(std::move(http_error)),
          attempts_(attempts)
    {
    }

} // namespace chunkup

#include "chunkup/chunked_file.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkup/errors.hpp"

namespace chunkup
{

    ChunkedFile::ChunkedFile(std::size_t chunk_size)
        : chunk_size_(chunk_size)
    {
        if (chunk_size_ == 0)
        {
            throw std::invalid_argument("Chunk size must be greater than zero");
        }
    }

    void ChunkedFile::open(const std::filesystem::path &path)
    {
        if (stream_.is_open())
        {
            return;
        }

        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw FileAccessError("Cannot retrieve file size of " + path.string() + ": " + ec.message());
        }

        stream_.open(path, std::ios::binary);
        if (!stream_.is_open())
        {
            throw FileAccessError("Could not open " + path.string() + " for reading");
        }
        path_ = path;
        file_size_ = size;
        position_ = 0;
        spdlog::debug("Opened {} with size {}", path.string(), size);
    }

    void ChunkedFile::seek(std::uint64_t byte)
    {
        if (!stream_.is_open())
        {
            throw InvalidStateError("seek() called but the file was not open");
        }
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(byte));
        if (!stream_)
        {
            // Seeking past the end is allowed; the next read reports end of file.
            stream_.clear();
        }
        position_ = byte;
    }

    FileChunk ChunkedFile::read_next_chunk()
    {
        if (!stream_.is_open())
        {
            throw InvalidStateError("read_next_chunk() called but the file was not open");
        }

        if (position_ >= file_size_)
        {
            return FileChunk{
                .start_byte = file_size_,
                .end_byte = file_size_,
                .total_file_size = file_size_,
                .data = {},
            };
        }

        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_, file_size_ - position_));
        std::vector<std::byte> buffer(wanted);
        stream_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(wanted));
        if (stream_.bad())
        {
            throw FileAccessError("Couldn't read " + path_.string() + " at byte " + std::to_string(position_));
        }
        const auto read_count = static_cast<std::size_t>(stream_.gcount());
        stream_.clear();
        if (read_count < wanted)
        {
            throw FileAccessError(path_.string() + " changed size during upload: expected " +
                                  std::to_string(file_size_) + " bytes, got " +
                                  std::to_string(position_ + read_count));
        }

        FileChunk chunk{
            .start_byte = position_,
            .end_byte = position_ + read_count,
            .total_file_size = file_size_,
            .data = std::move(buffer),
        };
        position_ = chunk.end_byte;
        return chunk;
    }

    void ChunkedFile::close() noexcept
    {
        if (stream_.is_open())
        {
            stream_.close();
        }
        stream_.clear();
        position_ = 0;
        file_size_ = kSizeUnknown;
    }

} // namespace chunkup

/**
 * chunkup - Splits a local file into fixed-size byte ranges.
 *
 * ChunkedFile does synchronous, blocking I/O and is not thread-safe. It is
 * owned by one UploadWorker and only touched from that worker's loop.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace chunkup
{

    struct FileChunk
    {
        std::uint64_t start_byte{};      // inclusive
        std::uint64_t end_byte{};        // exclusive
        std::uint64_t total_file_size{};
        std::vector<std::byte> data;

        std::size_t size() const noexcept { return static_cast<std::size_t>(end_byte - start_byte); }

        // The zero-length chunk returned once the cursor reaches the end of the file.
        bool is_end_of_file() const noexcept { return start_byte == end_byte; }
    };

    class ChunkedFile
    {
    public:
        static constexpr std::uint64_t kSizeUnknown = 0;

        explicit ChunkedFile(std::size_t chunk_size);

        // Stats and opens the file. Does nothing if a file is already open.
        void open(const std::filesystem::path &path);

        void seek(std::uint64_t byte);

        // Throws FileAccessError when the file turns out shorter than the size seen by open().
        FileChunk read_next_chunk();

        void close() noexcept;

        bool is_open() const noexcept { return stream_.is_open(); }
        std::uint64_t file_size() const noexcept { return file_size_; }
        std::uint64_t position() const noexcept { return position_; }
        std::size_t chunk_size() const noexcept { return chunk_size_; }

    private:
        std::size_t chunk_size_;
        std::ifstream stream_;
        std::filesystem::path path_;
        std::uint64_t position_{0};
        std::uint64_t file_size_{kSizeUnknown};
    };

} // namespace chunkup

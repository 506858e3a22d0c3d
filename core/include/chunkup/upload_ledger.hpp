/**
 * chunkup - On-disk record of uploads that may be resumed after a restart.
 *
 * Stored as a JSON array. Entries older than the TTL are dropped on load.
 * Not thread-safe; the UploadManager serializes access.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunkup/upload_info.hpp"

namespace chunkup
{

    class UploadLedger
    {
    public:
        enum class StateCode : int
        {
            WasInProgress = 0,
            WasPaused = 1
        };

        struct Entry
        {
            std::string id;
            Clock::time_point saved_at{};
            StateCode state_code{StateCode::WasInProgress};
            std::uint64_t last_successful_byte{};
            UploadInfo upload_info;
        };

        static constexpr std::chrono::hours kDefaultTimeToLive{24 * 3};

        explicit UploadLedger(std::filesystem::path path = default_ledger_path(),
                              std::chrono::seconds time_to_live = kDefaultTimeToLive);

        std::vector<Entry> read_all();
        std::optional<Entry> read_entry(const std::string &id);

        // Inserts or replaces the entry with the same id.
        void write(Entry entry);

        void remove(const std::string &id);
        void clear();

        const std::filesystem::path &path() const noexcept { return path_; }

        static std::filesystem::path default_ledger_path();

    private:
        void ensure_loaded();
        void save() const;

        std::filesystem::path path_;
        std::chrono::seconds time_to_live_;
        bool loaded_{false};
        std::vector<Entry> entries_;
    };

} // namespace chunkup

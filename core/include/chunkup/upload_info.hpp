#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkup/upload_options.hpp"

namespace chunkup
{

    using Clock = std::chrono::system_clock;

    // The (remote URL, local file) pair that deduplicates uploads.
    struct UploadIdentity
    {
        std::string upload_url;
        std::filesystem::path input_file;

        // Stable digest of both parts, used as the ledger key.
        std::string key() const;

        bool operator==(const UploadIdentity &) const = default;
    };

    struct UploadInfo
    {
        std::string upload_url;
        std::filesystem::path input_file;
        UploadOptions options;

        UploadIdentity identity() const;
    };

    // Absolute, lexically normal form used for every stored file path.
    std::filesystem::path normalize_path(const std::filesystem::path &path);

    void to_json(nlohmann::json &json, const UploadInfo &info);
    void from_json(const nlohmann::json &json, UploadInfo &info);

    struct UploadProgress
    {
        std::uint64_t completed_bytes{};
        std::uint64_t total_bytes{};
        Clock::time_point start_time{};
        Clock::time_point updated_time{};

        double fraction_completed() const noexcept
        {
            if (total_bytes == 0)
            {
                return 0.0;
            }
            return static_cast<double>(completed_bytes) / static_cast<double>(total_bytes);
        }
    };

} // namespace chunkup

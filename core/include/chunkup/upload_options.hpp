/**
 * chunkup - Per-upload configuration and its JSON representation.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chunkup
{

    // How the end of the file is communicated to the server.
    enum class EndOfFileSignal : std::uint8_t
    {
        // Stop after the last non-empty chunk.
        StopSending,
        // Follow the last chunk with an empty request carrying "bytes */<total>".
        SendEmptyChunk
    };

    enum class MaximumResolution : std::uint8_t
    {
        Default,
        Preset1280x720,
        Preset1920x1080
    };

    std::string_view to_string(EndOfFileSignal signal) noexcept;
    std::optional<EndOfFileSignal> end_of_file_signal_from_string(std::string_view value) noexcept;

    std::string_view to_string(MaximumResolution resolution) noexcept;
    std::optional<MaximumResolution> maximum_resolution_from_string(std::string_view value) noexcept;

    struct UploadOptions
    {
        static constexpr std::size_t kDefaultChunkSize = 8 * 1024 * 1024;
        static constexpr std::size_t kMinimumChunkSize = 256 * 1024;
        static constexpr int kDefaultRetriesPerChunk = 3;

        struct Transport
        {
            std::size_t chunk_size_in_bytes{kDefaultChunkSize};
            int retries_per_chunk{kDefaultRetriesPerChunk};
            EndOfFileSignal end_of_file_signal{EndOfFileSignal::StopSending};

            bool operator==(const Transport &) const = default;
        };

        struct InputStandardization
        {
            bool requested{true};
            MaximumResolution maximum_resolution{MaximumResolution::Default};

            bool operator==(const InputStandardization &) const = default;
        };

        struct EventTracking
        {
            bool opted_out{false};

            bool operator==(const EventTracking &) const = default;
        };

        Transport transport;
        InputStandardization input_standardization;
        EventTracking event_tracking;

        bool operator==(const UploadOptions &) const = default;
    };

    // Throws std::invalid_argument for a chunk size below kMinimumChunkSize
    // or a negative retry count.
    void validate(const UploadOptions &options);

    void to_json(nlohmann::json &json, const UploadOptions &options);
    void from_json(const nlohmann::json &json, UploadOptions &options);

} // namespace chunkup

#include "chunkup/upload_options.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkup
{

    namespace
    {
        constexpr std::array<std::pair<EndOfFileSignal, std::string_view>, 2> kEofSignalNames{{
            {EndOfFileSignal::StopSending, "stop_sending"},
            {EndOfFileSignal::SendEmptyChunk, "send_empty_chunk"},
        }};

        constexpr std::array<std::pair<MaximumResolution, std::string_view>, 3> kResolutionNames{{
            {MaximumResolution::Default, "default"},
            {MaximumResolution::Preset1280x720, "preset1280x720"},
            {MaximumResolution::Preset1920x1080, "preset1920x1080"},
        }};
    } // namespace

    std::string_view to_string(EndOfFileSignal signal) noexcept
    {
        for (const auto &[value, name] : kEofSignalNames)
        {
            if (value == signal)
            {
                return name;
            }
        }
        return "stop_sending";
    }

    std::optional<EndOfFileSignal> end_of_file_signal_from_string(std::string_view value) noexcept
    {
        for (const auto &[signal, name] : kEofSignalNames)
        {
            if (name == value)
            {
                return signal;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(MaximumResolution resolution) noexcept
    {
        for (const auto &[value, name] : kResolutionNames)
        {
            if (value == resolution)
            {
                return name;
            }
        }
        return "default";
    }

    std::optional<MaximumResolution> maximum_resolution_from_string(std::string_view value) noexcept
    {
        for (const auto &[resolution, name] : kResolutionNames)
        {
            if (name == value)
            {
                return resolution;
            }
        }
        return std::nullopt;
    }

    void validate(const UploadOptions &options)
    {
        if (options.transport.chunk_size_in_bytes < UploadOptions::kMinimumChunkSize)
        {
            throw std::invalid_argument("Chunk size must be at least " +
                                        std::to_string(UploadOptions::kMinimumChunkSize) + " bytes");
        }
        if (options.transport.retries_per_chunk < 0)
        {
            throw std::invalid_argument("Retries per chunk cannot be negative");
        }
    }

    void to_json(nlohmann::json &json, const UploadOptions &options)
    {
        json = nlohmann::json{
            {"transport",
             {{"chunk_size", options.transport.chunk_size_in_bytes},
              {"retries_per_chunk", options.transport.retries_per_chunk},
              {"end_of_file_signal", std::string(to_string(options.transport.end_of_file_signal))}}},
            {"input_standardization",
             {{"requested", options.input_standardization.requested},
              {"maximum_resolution", std::string(to_string(options.input_standardization.maximum_resolution))}}},
            {"event_tracking", {{"opted_out", options.event_tracking.opted_out}}},
        };
    }

    void from_json(const nlohmann::json &json, UploadOptions &options)
    {
        options = UploadOptions{};
        if (const auto it = json.find("transport"); it != json.end())
        {
            options.transport.chunk_size_in_bytes = it->value("chunk_size", UploadOptions::kDefaultChunkSize);
            options.transport.retries_per_chunk = it->value("retries_per_chunk", UploadOptions::kDefaultRetriesPerChunk);
            const auto signal = end_of_file_signal_from_string(it->value("end_of_file_signal", std::string{}));
            options.transport.end_of_file_signal = signal.value_or(EndOfFileSignal::StopSending);
        }
        if (const auto it = json.find("input_standardization"); it != json.end())
        {
            options.input_standardization.requested = it->value("requested", true);
            const auto resolution = maximum_resolution_from_string(it->value("maximum_resolution", std::string{}));
            options.input_standardization.maximum_resolution = resolution.value_or(MaximumResolution::Default);
        }
        if (const auto it = json.find("event_tracking"); it != json.end())
        {
            options.event_tracking.opted_out = it->value("opted_out", false);
        }
    }

} // namespace chunkup

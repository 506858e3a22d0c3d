#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "chunkup/upload_options.hpp"

namespace chunkup::client
{

    enum class Command
    {
        Help,
        Upload,
        Resume,
        List,
        Discard
    };

    struct ClientConfig
    {
        Command command{Command::Help};
        std::string upload_url;
        std::optional<std::filesystem::path> file;
        bool discard_all{false};
        UploadOptions options;
        std::optional<std::filesystem::path> state_path;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::string> events_url;
        bool verbose{false};
    };

    // Throws std::runtime_error on malformed usage.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(std::string_view program_name);

} // namespace chunkup::client

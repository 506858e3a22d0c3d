#include "chunkup/client/config.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkup::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag, const char *what)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires " + what);
            }
            return argv[index++];
        }

        Command parse_command(const std::string &name)
        {
            if (name == "upload")
            {
                return Command::Upload;
            }
            if (name == "resume")
            {
                return Command::Resume;
            }
            if (name == "list")
            {
                return Command::List;
            }
            if (name == "discard")
            {
                return Command::Discard;
            }
            if (name == "help" || name == "--help" || name == "-h")
            {
                return Command::Help;
            }
            throw std::runtime_error("Unknown command: " + name);
        }

        MaximumResolution parse_resolution(const std::string &value)
        {
            if (value == "default")
            {
                return MaximumResolution::Default;
            }
            if (value == "720p")
            {
                return MaximumResolution::Preset1280x720;
            }
            if (value == "1080p")
            {
                return MaximumResolution::Preset1920x1080;
            }
            throw std::runtime_error("--max-resolution expects default, 720p or 1080p");
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage(argc > 0 ? argv[0] : "chunkup"));
        }

        ClientConfig config;
        int index = 1;
        config.command = parse_command(argv[index++]);

        std::vector<std::string> positional;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--chunk-size")
            {
                const auto value = require_value(index, argc, argv, arg, "a size in bytes");
                config.options.transport.chunk_size_in_bytes = static_cast<std::size_t>(std::stoull(value));
            }
            else if (arg == "--retries")
            {
                config.options.transport.retries_per_chunk = std::stoi(require_value(index, argc, argv, arg, "a count"));
            }
            else if (arg == "--state")
            {
                config.state_path = std::filesystem::path(require_value(index, argc, argv, arg, "a file path"));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg, "a file path"));
            }
            else if (arg == "--events-url")
            {
                config.events_url = require_value(index, argc, argv, arg, "a URL");
            }
            else if (arg == "--max-resolution")
            {
                config.options.input_standardization.maximum_resolution =
                    parse_resolution(require_value(index, argc, argv, arg, "a resolution"));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--no-tracking")
            {
                config.options.event_tracking.opted_out = true;
            }
            else if (arg == "--no-standardize")
            {
                config.options.input_standardization.requested = false;
            }
            else if (arg == "--send-empty-final-chunk")
            {
                config.options.transport.end_of_file_signal = EndOfFileSignal::SendEmptyChunk;
            }
            else if (arg == "--all")
            {
                config.discard_all = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        switch (config.command)
        {
        case Command::Help:
            break;
        case Command::Upload:
            if (positional.size() != 2)
            {
                throw std::runtime_error("upload expects <upload-url> <file>");
            }
            config.upload_url = positional[0];
            config.file = std::filesystem::path(positional[1]);
            break;
        case Command::Resume:
            if (positional.size() > 1)
            {
                throw std::runtime_error("resume expects at most one file");
            }
            if (!positional.empty())
            {
                config.file = std::filesystem::path(positional[0]);
            }
            break;
        case Command::List:
            if (!positional.empty())
            {
                throw std::runtime_error("list takes no arguments");
            }
            break;
        case Command::Discard:
            if (config.discard_all == !positional.empty() || positional.size() > 1)
            {
                throw std::runtime_error("discard expects a file or --all");
            }
            if (!positional.empty())
            {
                config.file = std::filesystem::path(positional[0]);
            }
            break;
        }

        return config;
    }

    std::string usage(std::string_view program_name)
    {
        std::ostringstream out;
        out << "Usage:\n"
            << "  " << program_name << " upload <upload-url> <file> [options]\n"
            << "  " << program_name << " resume [<file>] [options]\n"
            << "  " << program_name << " list [options]\n"
            << "  " << program_name << " discard (<file> | --all) [options]\n"
            << "Options:\n"
            << "  --chunk-size <bytes>       bytes per request (default 8388608, minimum 262144)\n"
            << "  --retries <n>              retries per chunk (default 3)\n"
            << "  --state <file>             resumable upload ledger\n"
            << "  --log <file>               also write the log to <file>\n"
            << "  --verbose                  debug logging\n"
            << "  --events-url <url>         post upload events to <url>\n"
            << "  --no-tracking              never post upload events\n"
            << "  --no-standardize           skip input inspection\n"
            << "  --max-resolution <default|720p|1080p>\n"
            << "  --send-empty-final-chunk   finish with an empty \"bytes */<total>\" request\n"
            << "  --help\n";
        return out.str();
    }

} // namespace chunkup::client

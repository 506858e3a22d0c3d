#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkup/client/config.hpp"

using namespace chunkup;
using namespace chunkup::client;

namespace
{

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "chunkup");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            parse(std::move(args));
        }
        catch (const std::exception &)
        {
            return true;
        }
        return false;
    }

    void test_upload_command()
    {
        const auto config = parse({"upload", "https://upload.example/x", "movie.mp4", "--chunk-size", "1048576",
                                   "--retries", "5", "--send-empty-final-chunk", "--max-resolution", "720p",
                                   "--no-tracking", "--state", "/tmp/ledger.json", "--verbose"});
        assert(config.command == Command::Upload);
        assert(config.upload_url == "https://upload.example/x");
        assert(config.file == std::filesystem::path("movie.mp4"));
        assert(config.options.transport.chunk_size_in_bytes == 1048576);
        assert(config.options.transport.retries_per_chunk == 5);
        assert(config.options.transport.end_of_file_signal == EndOfFileSignal::SendEmptyChunk);
        assert(config.options.input_standardization.maximum_resolution == MaximumResolution::Preset1280x720);
        assert(config.options.event_tracking.opted_out);
        assert(config.state_path == std::filesystem::path("/tmp/ledger.json"));
        assert(config.verbose);
    }

    void test_defaults()
    {
        const auto config = parse({"upload", "https://upload.example/x", "movie.mp4"});
        assert(config.options == UploadOptions{});
        assert(!config.state_path);
        assert(!config.log_path);
        assert(!config.events_url);
        assert(!config.verbose);
    }

    void test_other_commands()
    {
        assert(parse({"list"}).command == Command::List);
        assert(parse({"help"}).command == Command::Help);
        assert(parse({"list", "--help"}).command == Command::Help);

        const auto resume_all = parse({"resume", "--no-standardize"});
        assert(resume_all.command == Command::Resume);
        assert(!resume_all.file);
        assert(!resume_all.options.input_standardization.requested);

        const auto resume_one = parse({"resume", "movie.mp4", "--events-url", "https://events.example"});
        assert(resume_one.file == std::filesystem::path("movie.mp4"));
        assert(resume_one.events_url == std::string("https://events.example"));

        const auto discard_all = parse({"discard", "--all"});
        assert(discard_all.discard_all);
        assert(!discard_all.file);
        const auto discard_one = parse({"discard", "movie.mp4", "--log", "out.log"});
        assert(discard_one.file == std::filesystem::path("movie.mp4"));
        assert(discard_one.log_path == std::filesystem::path("out.log"));
    }

    void test_usage_errors()
    {
        assert(parse_fails({}));
        assert(parse_fails({"download"}));
        assert(parse_fails({"upload", "https://upload.example/x"}));
        assert(parse_fails({"upload", "https://upload.example/x", "a", "b"}));
        assert(parse_fails({"upload", "https://upload.example/x", "a", "--retries"}));
        assert(parse_fails({"upload", "https://upload.example/x", "a", "--max-resolution", "4k"}));
        assert(parse_fails({"upload", "https://upload.example/x", "a", "--bogus"}));
        assert(parse_fails({"list", "extra"}));
        assert(parse_fails({"discard"}));
        assert(parse_fails({"discard", "a", "--all"}));
    }

} // namespace

void run_client_config_tests()
{
    test_upload_command();
    test_defaults();
    test_other_commands();
    test_usage_errors();
}

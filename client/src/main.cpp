#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "chunkup/client/config.hpp"
#include "chunkup/client/session.hpp"
#include "chunkup/version.hpp"

int main(int argc, char *argv[])
{
    using chunkup::client::ClientConfig;
    using chunkup::client::UploadSession;

    ClientConfig config;
    try
    {
        config = chunkup::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        if (argc >= 2)
        {
            std::cerr << chunkup::client::usage(argv[0]);
        }
        return EXIT_FAILURE;
    }

    if (config.command == chunkup::client::Command::Help)
    {
        std::cout << "chunkup " << chunkup::version() << "\n"
                  << chunkup::client::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        const auto console_level = config.verbose ? spdlog::level::debug : spdlog::level::warn;
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        sinks.back()->set_level(console_level);
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), true));
            sinks.back()->set_level(spdlog::level::debug);
        }
        auto logger = std::make_shared<spdlog::logger>("chunkup", sinks.begin(), sinks.end());
        logger->set_level(config.log_path ? spdlog::level::debug : console_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::debug("chunkup {}", chunkup::version());

        UploadSession session(std::move(config));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "chunkup failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "mirrorsync/crypto.hpp"
#include "mirrorsync/server/catalog.hpp"
#include "mirrorsync/server/config.hpp"
#include "mirrorsync/server/server.hpp"
#include "mirrorsync/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void configure_logging(const mirrorsync::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] [%n] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using mirrorsync::server::Server;
    using mirrorsync::server::ServerConfig;

    ServerConfig config;
    try
    {
        config = mirrorsync::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << mirrorsync::server::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.show_help)
    {
        std::cout << mirrorsync::server::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        configure_logging(config);
        spdlog::info("Starting MirrorSync server {} on {}:{}", mirrorsync::version(), config.address, config.port);

        mirrorsync::crypto::ensure_sodium_init();
        auto catalog = mirrorsync::server::build_catalog(config.root, config.managed_directories);
        spdlog::info("Catalog ready: {} files in {} managed directories", catalog.size(),
                     config.managed_directories.size());

        Server server(std::move(config), std::move(catalog));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

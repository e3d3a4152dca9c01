#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "mirrorsync/protocol.hpp"

namespace mirrorsync::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root{"."};
        std::vector<std::string> managed_directories;
        std::size_t worker_threads{0};
        std::chrono::milliseconds idle_timeout{protocol::kDefaultIdleTimeout};
        std::chrono::milliseconds transfer_timeout{protocol::kTransferIdleTimeout};
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> connection_log_dir;
        bool verbose{false};
        bool show_help{false};
    };

    // Merges the keys present in a JSON config file into config.
    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

    // --config is applied first so that the remaining flags override it.
    ServerConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace mirrorsync::server

#include "mirrorsync/server/config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "mirrorsync/version.hpp"

namespace mirrorsync::server
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + flag);
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_number(const std::string &value, const std::string &flag, std::uint64_t max)
        {
            std::size_t consumed = 0;
            std::uint64_t parsed = 0;
            try
            {
                parsed = std::stoull(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
            if (consumed != value.size() || value.front() == '-' || parsed > max)
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + value);
            }
            return parsed;
        }

        std::uint16_t parse_port(const std::string &value, const std::string &flag)
        {
            return static_cast<std::uint16_t>(parse_number(value, flag, std::numeric_limits<std::uint16_t>::max()));
        }

        std::chrono::milliseconds parse_timeout(const std::string &value, const std::string &flag)
        {
            const auto millis = parse_number(value, flag, std::numeric_limits<std::uint32_t>::max());
            if (millis == 0)
            {
                throw std::runtime_error(flag + " must be greater than zero");
            }
            return std::chrono::milliseconds(static_cast<std::int64_t>(millis));
        }

    } // namespace

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open config file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Failed to parse config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object: " + path.string());
        }

        try
        {
            config.address = json.value("address", config.address);
            config.port = json.value("port", config.port);
            if (auto it = json.find("root"); it != json.end())
            {
                config.root = std::filesystem::path(it->get<std::string>());
            }
            if (auto it = json.find("directories"); it != json.end())
            {
                config.managed_directories = it->get<std::vector<std::string>>();
            }
            config.worker_threads = json.value("threads", config.worker_threads);
            if (auto it = json.find("timeout_ms"); it != json.end())
            {
                config.idle_timeout = std::chrono::milliseconds(it->get<std::int64_t>());
            }
            if (auto it = json.find("transfer_timeout_ms"); it != json.end())
            {
                config.transfer_timeout = std::chrono::milliseconds(it->get<std::int64_t>());
            }
            if (auto it = json.find("log_file"); it != json.end())
            {
                config.log_file = std::filesystem::path(it->get<std::string>());
            }
            if (auto it = json.find("connection_log_dir"); it != json.end())
            {
                config.connection_log_dir = std::filesystem::path(it->get<std::string>());
            }
            config.verbose = json.value("verbose", config.verbose);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }

        if (config.idle_timeout.count() <= 0 || config.transfer_timeout.count() <= 0)
        {
            throw std::runtime_error("Timeouts in " + path.string() + " must be greater than zero");
        }
    }

    ServerConfig parse_arguments(int argc, char *argv[])
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                load_config_file(require_value(i, argc, argv, "--config"), config);
            }
        }

        bool directories_from_flags = false;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--port")
            {
                config.port = parse_port(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--directory")
            {
                if (!directories_from_flags)
                {
                    config.managed_directories.clear();
                    directories_from_flags = true;
                }
                config.managed_directories.push_back(require_value(i, argc, argv, arg));
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(
                    parse_number(require_value(i, argc, argv, arg), arg, 1024));
            }
            else if (arg == "--timeout")
            {
                config.idle_timeout = parse_timeout(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--transfer-timeout")
            {
                config.transfer_timeout = parse_timeout(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--connection-logs")
            {
                config.connection_log_dir = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (!config.show_help && config.port == 0)
        {
            throw std::runtime_error("A listening port is required (--port)");
        }
        return config;
    }

    std::string usage(const char *program_name)
    {
        return "MirrorSync server " + std::string(mirrorsync::version()) + "\n" +
               "Usage: " + program_name +
               " --port <PORT> [--root <DIR>] [--directory <DIR>]... [--address <ADDRESS>] [--threads <N>]\n"
               "       [--timeout <ms>] [--transfer-timeout <ms>] [--config <FILE>] [--log <FILE>]\n"
               "       [--connection-logs <DIR>] [--verbose]\n";
    }

} // namespace mirrorsync::server

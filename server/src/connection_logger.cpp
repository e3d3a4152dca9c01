#include "mirrorsync/server/connection_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace mirrorsync::server
{

    namespace
    {
        constexpr std::string_view kIdentityPrefix = "server-connection-from-";
        constexpr std::string_view kReplacedCharacters = "/\\.:@?|*\"";
    } // namespace

    std::string connection_identity(std::string_view address)
    {
        std::string identity(kIdentityPrefix);
        identity.reserve(kIdentityPrefix.size() + address.size());
        for (const char ch : address)
        {
            identity.push_back(kReplacedCharacters.find(ch) == std::string_view::npos ? ch : '-');
        }
        return identity;
    }

    std::shared_ptr<spdlog::logger> make_connection_logger(const std::string &identity,
                                                           const std::optional<std::filesystem::path> &log_dir)
    {
        const auto defaults = spdlog::default_logger();
        std::vector<spdlog::sink_ptr> sinks(defaults->sinks().begin(), defaults->sinks().end());
        if (log_dir)
        {
            try
            {
                std::filesystem::create_directories(*log_dir);
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    (*log_dir / (identity + ".log")).string(), false);
                file_sink->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
                sinks.push_back(std::move(file_sink));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Connection log for {} unavailable: {}", identity, ex.what());
            }
        }
        auto logger = std::make_shared<spdlog::logger>(identity, sinks.begin(), sinks.end());
        logger->set_level(defaults->level());
        return logger;
    }

} // namespace mirrorsync::server

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace mirrorsync::server
{

    // "server-connection-from-<address>" with path and separator characters
    // replaced so the result is usable as a file name.
    std::string connection_identity(std::string_view address);

    // Logger that writes to the default logger's sinks and, when log_dir is
    // set, to <log_dir>/<identity>.log.
    std::shared_ptr<spdlog::logger> make_connection_logger(const std::string &identity,
                                                           const std::optional<std::filesystem::path> &log_dir);

} // namespace mirrorsync::server

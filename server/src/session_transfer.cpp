#include "mirrorsync/server/session.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "mirrorsync/error_codes.hpp"

namespace mirrorsync::server
{

    namespace
    {

        mirrorsync::ErrorCode classify(const std::error_code &ec)
        {
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            {
                return mirrorsync::ErrorCode::NotFound;
            }
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            {
                return mirrorsync::ErrorCode::PermissionDenied;
            }
            return mirrorsync::ErrorCode::InternalError;
        }

        std::string describe(mirrorsync::ErrorCode code, const std::filesystem::path &file)
        {
            switch (code)
            {
            case mirrorsync::ErrorCode::NotFound:
                return "File " + file.string() + " is listed but missing on the server";
            case mirrorsync::ErrorCode::PermissionDenied:
                return "Permission denied reading " + file.string() + " on the server";
            default:
                return "Unable to read " + file.string() + " on the server";
            }
        }

    } // namespace

    // The path comes from the catalog, so it is not checked against it again.
    // A length promise that cannot be kept is not corrected; the peer relies on
    // reading exactly that many bytes.
    void Session::transfer_file(const std::string &path)
    {
        const auto file = context_.root / path;
        logger_->info("Writing {} to client {}...", file.string(), endpoint_);

        std::uint64_t size = 0;
        std::error_code ec;
        const auto stat_size = std::filesystem::file_size(file, ec);
        if (ec)
        {
            const auto code = classify(ec);
            logger_->debug("file_size({}) failed: {}", file.string(), ec.message());
            const auto message = describe(code, file);
            logger_->error("{} ({})", message, mirrorsync::to_string(code));
            spdlog::error("{}", message);
        }
        else
        {
            size = static_cast<std::uint64_t>(stat_size);
        }
        logger_->debug("File size is: {}", size);
        stream_.write_int64(static_cast<std::int64_t>(size));
        stream_.flush();

        if (size > 0)
        {
            std::uint64_t sent = 0;
            try
            {
                std::ifstream in(file, std::ios::binary);
                if (!in.is_open())
                {
                    throw std::system_error(std::make_error_code(std::errc::io_error), "open failed");
                }
                std::vector<std::byte> buffer(stream_.buffer_capacity());
                while (in && sent < size)
                {
                    const auto wanted = static_cast<std::size_t>(
                        std::min<std::uint64_t>(buffer.size(), size - sent));
                    in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(wanted));
                    const auto read_count = static_cast<std::size_t>(in.gcount());
                    if (read_count == 0)
                    {
                        break;
                    }
                    stream_.write_bytes(std::span<const std::byte>(buffer.data(), read_count));
                    sent += read_count;
                }
                if (in.bad())
                {
                    throw std::system_error(std::make_error_code(std::errc::io_error), "read failed");
                }
            }
            catch (const std::exception &ex)
            {
                logger_->debug("Failed to write file: {}", file.string());
                logger_->debug("{}", ex.what());
            }
            if (sent != size)
            {
                logger_->warn("Sent {} of {} promised bytes for {}", sent, size, file.string());
            }
        }

        stream_.flush();
        logger_->info("Finished writing: {}, to client: {}", file.string(), endpoint_);
    }

} // namespace mirrorsync::server

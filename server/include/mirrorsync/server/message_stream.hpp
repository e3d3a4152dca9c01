#pragma once

#include <asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "mirrorsync/error_codes.hpp"

namespace mirrorsync::server
{

    // The connection is unusable: peer closed, reset, or the socket was shut
    // down locally.
    class TransportError : public std::runtime_error
    {
    public:
        TransportError(std::error_code code, const std::string &context);

        std::error_code code() const noexcept { return code_; }

    private:
        std::error_code code_;
    };

    // A complete message arrived but could not be decoded. The stream is still
    // aligned on the next message.
    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(mirrorsync::ErrorCode code, std::string message);

        mirrorsync::ErrorCode code() const noexcept { return code_; }

    private:
        mirrorsync::ErrorCode code_;
    };

    // Blocking reader and buffered writer over a connected socket. Writes are
    // queued until flush() or until the queue reaches the socket's send buffer
    // size.
    class MessageStream
    {
    public:
        explicit MessageStream(asio::ip::tcp::socket &socket);

        // nullopt for a JSON null token.
        std::optional<std::string> read_message();
        std::int32_t read_int32();

        void write_frame(const nlohmann::json &message);
        void write_bool(bool value);
        void write_int32(std::int32_t value);
        void write_int64(std::int64_t value);
        void write_utf(std::string_view value);
        void write_bytes(std::span<const std::byte> data);

        void flush();

        std::size_t buffer_capacity() const noexcept { return capacity_; }

    private:
        void read_exact(std::span<std::uint8_t> buffer);
        void discard(std::size_t size);
        void drain_if_full();

        asio::ip::tcp::socket &socket_;
        std::vector<std::uint8_t> pending_;
        std::size_t capacity_;
    };

} // namespace mirrorsync::server

#include "mirrorsync/server/message_stream.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>

#include "mirrorsync/framing.hpp"

namespace mirrorsync::server
{

    namespace
    {
        constexpr std::size_t kFallbackBufferSize = 64 * 1024;
        constexpr std::size_t kDiscardChunk = 64 * 1024;

        std::size_t query_send_buffer_size(asio::ip::tcp::socket &socket)
        {
            asio::socket_base::send_buffer_size option;
            std::error_code ec;
            socket.get_option(option, ec);
            if (ec || option.value() <= 0)
            {
                return kFallbackBufferSize;
            }
            return static_cast<std::size_t>(option.value());
        }
    } // namespace

    TransportError::TransportError(std::error_code code, const std::string &context)
        : std::runtime_error(context + ": " + code.message()), code_(code) {}

    ProtocolError::ProtocolError(mirrorsync::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    MessageStream::MessageStream(asio::ip::tcp::socket &socket)
        : socket_(socket), capacity_(query_send_buffer_size(socket))
    {
        pending_.reserve(capacity_);
    }

    std::optional<std::string> MessageStream::read_message()
    {
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        read_exact(header);
        const auto size = protocol::decode_u32(header);
        if (size > protocol::kMaxFrameSize)
        {
            discard(size);
            throw ProtocolError(mirrorsync::ErrorCode::InvalidPayload,
                                "Frame of " + std::to_string(size) + " bytes exceeds the limit");
        }

        std::vector<std::uint8_t> payload(size);
        read_exact(payload);

        nlohmann::json message;
        try
        {
            message = nlohmann::json::parse(payload.begin(), payload.end());
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ProtocolError(mirrorsync::ErrorCode::InvalidPayload, ex.what());
        }

        if (message.is_null())
        {
            return std::nullopt;
        }
        if (!message.is_string())
        {
            throw ProtocolError(mirrorsync::ErrorCode::InvalidPayload,
                                std::string("Expected a message token, got ") + message.type_name());
        }
        return message.get<std::string>();
    }

    std::int32_t MessageStream::read_int32()
    {
        std::array<std::uint8_t, 4> buffer{};
        read_exact(buffer);
        return protocol::decode_i32(buffer);
    }

    void MessageStream::write_frame(const nlohmann::json &message)
    {
        const auto frame = protocol::encode_frame(message);
        pending_.insert(pending_.end(), frame.begin(), frame.end());
        drain_if_full();
    }

    void MessageStream::write_bool(bool value)
    {
        protocol::append_bool(pending_, value);
        drain_if_full();
    }

    void MessageStream::write_int32(std::int32_t value)
    {
        protocol::append_i32(pending_, value);
        drain_if_full();
    }

    void MessageStream::write_int64(std::int64_t value)
    {
        protocol::append_i64(pending_, value);
        drain_if_full();
    }

    void MessageStream::write_utf(std::string_view value)
    {
        protocol::append_utf(pending_, value);
        drain_if_full();
    }

    void MessageStream::write_bytes(std::span<const std::byte> data)
    {
        const auto *begin = reinterpret_cast<const std::uint8_t *>(data.data());
        pending_.insert(pending_.end(), begin, begin + data.size());
        drain_if_full();
    }

    void MessageStream::flush()
    {
        if (pending_.empty())
        {
            return;
        }
        std::error_code ec;
        asio::write(socket_, asio::buffer(pending_), ec);
        pending_.clear();
        if (ec)
        {
            throw TransportError(ec, "write failed");
        }
    }

    void MessageStream::read_exact(std::span<std::uint8_t> buffer)
    {
        std::error_code ec;
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()), ec);
        if (ec)
        {
            throw TransportError(ec, "read failed");
        }
    }

    void MessageStream::discard(std::size_t size)
    {
        std::vector<std::uint8_t> sink(std::min(size, kDiscardChunk));
        while (size > 0)
        {
            const auto chunk = std::min(size, sink.size());
            read_exact(std::span<std::uint8_t>(sink.data(), chunk));
            size -= chunk;
        }
    }

    void MessageStream::drain_if_full()
    {
        if (pending_.size() >= capacity_)
        {
            flush();
        }
    }

} // namespace mirrorsync::server

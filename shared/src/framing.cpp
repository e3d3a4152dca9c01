#include "mirrorsync/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace mirrorsync::protocol
{

    namespace
    {

        template <typename T>
        void append_be(std::vector<std::uint8_t> &out, T value)
        {
            for (std::size_t i = sizeof(T); i > 0; --i)
            {
                out.push_back(static_cast<std::uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
            }
        }

        template <typename T>
        T read_be(std::span<const std::uint8_t> buffer)
        {
            if (buffer.size() < sizeof(T))
            {
                throw std::out_of_range("Buffer too short for a " + std::to_string(sizeof(T)) + "-byte value");
            }
            T value = 0;
            for (std::size_t i = 0; i < sizeof(T); ++i)
            {
                value = static_cast<T>((value << 8) | static_cast<T>(buffer[i]));
            }
            return value;
        }

    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        if (text.size() > kMaxFrameSize)
        {
            throw std::length_error("JSON message too large to frame");
        }
        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + text.size());
        append_u32(frame, static_cast<std::uint32_t>(text.size()));
        frame.insert(frame.end(), text.begin(), text.end());
        return frame;
    }

    void append_bool(std::vector<std::uint8_t> &out, bool value)
    {
        out.push_back(value ? 0x01 : 0x00);
    }

    void append_u16(std::vector<std::uint8_t> &out, std::uint16_t value)
    {
        append_be(out, value);
    }

    void append_u32(std::vector<std::uint8_t> &out, std::uint32_t value)
    {
        append_be(out, value);
    }

    void append_i32(std::vector<std::uint8_t> &out, std::int32_t value)
    {
        append_be(out, static_cast<std::uint32_t>(value));
    }

    void append_i64(std::vector<std::uint8_t> &out, std::int64_t value)
    {
        append_be(out, static_cast<std::uint64_t>(value));
    }

    void append_utf(std::vector<std::uint8_t> &out, std::string_view value)
    {
        if (value.size() > kMaxUtfLength)
        {
            throw std::length_error("String too long for UTF encoding: " + std::to_string(value.size()) + " bytes");
        }
        append_u16(out, static_cast<std::uint16_t>(value.size()));
        out.insert(out.end(), value.begin(), value.end());
    }

    bool decode_bool(std::span<const std::uint8_t> buffer)
    {
        return read_be<std::uint8_t>(buffer) != 0;
    }

    std::uint16_t decode_u16(std::span<const std::uint8_t> buffer)
    {
        return read_be<std::uint16_t>(buffer);
    }

    std::uint32_t decode_u32(std::span<const std::uint8_t> buffer)
    {
        return read_be<std::uint32_t>(buffer);
    }

    std::int32_t decode_i32(std::span<const std::uint8_t> buffer)
    {
        return static_cast<std::int32_t>(read_be<std::uint32_t>(buffer));
    }

    std::int64_t decode_i64(std::span<const std::uint8_t> buffer)
    {
        return static_cast<std::int64_t>(read_be<std::uint64_t>(buffer));
    }

} // namespace mirrorsync::protocol

/**
 * MirrorSync - Length-prefixed JSON framing and big-endian primitive encoders.
 *
 * Frames carry structured messages (tokens, vocabulary, directory lists,
 * errors). The file negotiation uses the bare primitives so a peer can read
 * them without a JSON parser.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mirrorsync::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::size_t kMaxFrameSize = 1 << 20; // 1 MiB
    inline constexpr std::size_t kMaxUtfLength = 0xFFFF;

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    void append_bool(std::vector<std::uint8_t> &out, bool value);
    void append_u16(std::vector<std::uint8_t> &out, std::uint16_t value);
    void append_u32(std::vector<std::uint8_t> &out, std::uint32_t value);
    void append_i32(std::vector<std::uint8_t> &out, std::int32_t value);
    void append_i64(std::vector<std::uint8_t> &out, std::int64_t value);

    // Throws std::length_error when the UTF-8 form exceeds kMaxUtfLength bytes.
    void append_utf(std::vector<std::uint8_t> &out, std::string_view value);

    // Decoders read from the front of the buffer and throw std::out_of_range
    // when it is too short.
    bool decode_bool(std::span<const std::uint8_t> buffer);
    std::uint16_t decode_u16(std::span<const std::uint8_t> buffer);
    std::uint32_t decode_u32(std::span<const std::uint8_t> buffer);
    std::int32_t decode_i32(std::span<const std::uint8_t> buffer);
    std::int64_t decode_i64(std::span<const std::uint8_t> buffer);

} // namespace mirrorsync::protocol

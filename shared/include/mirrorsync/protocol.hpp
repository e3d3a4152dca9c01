/**
 * MirrorSync - Message vocabulary and structured protocol messages.
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mirrorsync/error_codes.hpp"

namespace mirrorsync::protocol
{

    inline constexpr std::uint32_t kProtocolVersion = 1;

    inline constexpr std::chrono::milliseconds kDefaultIdleTimeout{120000};
    inline constexpr std::chrono::milliseconds kTransferIdleTimeout{600000};

    enum class MessageKind : std::uint8_t
    {
        Handshake,
        SyncFiles,
        GetManagedDirectories,
        GetNumberOfManagedFiles,
        Exit
    };

    inline constexpr std::array<MessageKind, 5> kAllMessageKinds{
        MessageKind::Handshake,
        MessageKind::SyncFiles,
        MessageKind::GetManagedDirectories,
        MessageKind::GetNumberOfManagedFiles,
        MessageKind::Exit,
    };

    // Kind name, e.g. "SYNC_FILES". Used as the key in the handshake reply.
    std::string_view to_string(MessageKind kind) noexcept;
    std::optional<MessageKind> message_kind_from_string(std::string_view value) noexcept;

    // Token the peer sends on the wire, e.g. "sync_files".
    std::string_view literal(MessageKind kind) noexcept;
    std::optional<MessageKind> message_kind_from_literal(std::string_view value) noexcept;

    enum class BinaryAnswer : std::int32_t
    {
        No = 0,
        Yes = 1
    };

    constexpr std::int32_t to_int(BinaryAnswer answer) noexcept
    {
        return static_cast<std::int32_t>(answer);
    }

    // Anything other than No counts as Yes.
    BinaryAnswer binary_answer_from_int(std::int32_t value) noexcept;

    std::string_view to_string(BinaryAnswer answer) noexcept;

    // int32 count field. Saturates at INT32_MAX instead of wrapping.
    std::int32_t file_count_field(std::size_t count) noexcept;

    struct VocabularyMessage
    {
        std::uint32_t version{kProtocolVersion};
        std::map<MessageKind, std::string> messages;
    };

    VocabularyMessage make_vocabulary_message();

    void to_json(nlohmann::json &json, const VocabularyMessage &message);
    void from_json(const nlohmann::json &json, VocabularyMessage &message);

    struct UnknownMessageError
    {
        std::string received;
    };

    void to_json(nlohmann::json &json, const UnknownMessageError &error);
    void from_json(const nlohmann::json &json, UnknownMessageError &error);

} // namespace mirrorsync::protocol

#include "mirrorsync/protocol.hpp"

#include <limits>
#include <stdexcept>

namespace mirrorsync::protocol
{

    namespace
    {

        struct MessageMapping
        {
            MessageKind kind;
            std::string_view name;
            std::string_view literal;
        };

        constexpr std::array<MessageMapping, 5> kMessageMappings{{
            {MessageKind::Handshake, "HANDSHAKE", "handshake"},
            {MessageKind::SyncFiles, "SYNC_FILES", "sync_files"},
            {MessageKind::GetManagedDirectories, "GET_MANAGED_DIRECTORIES", "get_managed_directories"},
            {MessageKind::GetNumberOfManagedFiles, "GET_NUMBER_OF_MANAGED_FILES", "get_number_of_managed_files"},
            {MessageKind::Exit, "EXIT", "exit"},
        }};

        struct BinaryAnswerMapping
        {
            BinaryAnswer answer;
            std::string_view label;
        };

        constexpr std::array<BinaryAnswerMapping, 2> kAnswerMappings{{
            {BinaryAnswer::No, "NO"},
            {BinaryAnswer::Yes, "YES"},
        }};

    } // namespace

    std::string_view to_string(MessageKind kind) noexcept
    {
        for (const auto &mapping : kMessageMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.name;
            }
        }
        return "UNKNOWN";
    }

    std::optional<MessageKind> message_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageMappings)
        {
            if (mapping.name == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view literal(MessageKind kind) noexcept
    {
        for (const auto &mapping : kMessageMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.literal;
            }
        }
        return {};
    }

    std::optional<MessageKind> message_kind_from_literal(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageMappings)
        {
            if (mapping.literal == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    BinaryAnswer binary_answer_from_int(std::int32_t value) noexcept
    {
        return value == to_int(BinaryAnswer::No) ? BinaryAnswer::No : BinaryAnswer::Yes;
    }

    std::int32_t file_count_field(std::size_t count) noexcept
    {
        constexpr auto max = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());
        return static_cast<std::int32_t>(count > max ? max : count);
    }

    std::string_view to_string(BinaryAnswer answer) noexcept
    {
        for (const auto &mapping : kAnswerMappings)
        {
            if (mapping.answer == answer)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    VocabularyMessage make_vocabulary_message()
    {
        VocabularyMessage message;
        for (const auto &mapping : kMessageMappings)
        {
            message.messages.emplace(mapping.kind, std::string(mapping.literal));
        }
        return message;
    }

    void to_json(nlohmann::json &json, const VocabularyMessage &message)
    {
        nlohmann::json messages = nlohmann::json::object();
        for (const auto &[kind, token] : message.messages)
        {
            messages[std::string(to_string(kind))] = token;
        }
        json = {
            {"version", message.version},
            {"messages", std::move(messages)},
        };
    }

    void from_json(const nlohmann::json &json, VocabularyMessage &message)
    {
        message.version = json.at("version").get<std::uint32_t>();
        message.messages.clear();
        for (const auto &[name, token] : json.at("messages").items())
        {
            auto kind = message_kind_from_string(name);
            if (!kind)
            {
                throw std::runtime_error("Unknown message kind: " + name);
            }
            message.messages.emplace(*kind, token.get<std::string>());
        }
    }

    void to_json(nlohmann::json &json, const UnknownMessageError &error)
    {
        json = {
            {"status", "ERROR"},
            {"error", mirrorsync::to_int(ErrorCode::UnknownMessage)},
            {"code", mirrorsync::to_string(ErrorCode::UnknownMessage)},
            {"message", "Unknown message: " + error.received},
            {"received", error.received},
        };
    }

    void from_json(const nlohmann::json &json, UnknownMessageError &error)
    {
        const auto code = error_code_from_int(json.value("error", std::uint16_t{0}));
        if (code != ErrorCode::UnknownMessage)
        {
            throw std::runtime_error("Not an unknown-message error: " + std::string(mirrorsync::to_string(code)));
        }
        error.received = json.at("received").get<std::string>();
    }

} // namespace mirrorsync::protocol

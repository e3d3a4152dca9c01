#include <algorithm>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mirrorsync/crypto.hpp"
#include "mirrorsync/error_codes.hpp"
#include "mirrorsync/framing.hpp"
#include "mirrorsync/protocol.hpp"

using namespace mirrorsync;
using namespace mirrorsync::protocol;

void run_server_component_tests();
void run_session_tests();

namespace
{

    void test_message_vocabulary()
    {
        for (const auto kind : kAllMessageKinds)
        {
            const auto token = literal(kind);
            assert(!token.empty());
            assert(message_kind_from_literal(token) == kind);
            assert(message_kind_from_string(to_string(kind)) == kind);
        }
        assert(literal(MessageKind::SyncFiles) == "sync_files");
        assert(to_string(MessageKind::GetNumberOfManagedFiles) == "GET_NUMBER_OF_MANAGED_FILES");
        assert(!message_kind_from_literal("frobnicate"));
        // Names and tokens are different tables.
        assert(!message_kind_from_literal("SYNC_FILES"));
    }

    void test_vocabulary_message()
    {
        const auto message = make_vocabulary_message();
        assert(message.version == kProtocolVersion);
        assert(message.messages.size() == kAllMessageKinds.size());

        const nlohmann::json json = message;
        assert(json.at("version") == kProtocolVersion);
        assert(json.at("messages").at("HANDSHAKE") == "handshake");
        assert(json.at("messages").at("EXIT") == "exit");

        const auto decoded = json.get<VocabularyMessage>();
        assert(decoded.messages == message.messages);

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"version", 1}, {"messages", {{"TELEPORT", "teleport"}}}}.get<VocabularyMessage>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_binary_answer()
    {
        assert(to_int(BinaryAnswer::No) == 0);
        assert(to_int(BinaryAnswer::Yes) == 1);
        assert(binary_answer_from_int(0) == BinaryAnswer::No);
        assert(binary_answer_from_int(1) == BinaryAnswer::Yes);
        assert(binary_answer_from_int(-7) == BinaryAnswer::Yes);
        assert(to_string(BinaryAnswer::No) == "NO");
    }

    void test_file_count_field()
    {
        assert(file_count_field(0) == 0);
        assert(file_count_field(42) == 42);
        const auto max = std::numeric_limits<std::int32_t>::max();
        assert(file_count_field(static_cast<std::size_t>(max)) == max);
        assert(file_count_field(static_cast<std::size_t>(max) + 1) == max);
        assert(file_count_field(std::numeric_limits<std::size_t>::max()) == max);
    }

    void test_unknown_message_error()
    {
        const nlohmann::json json = UnknownMessageError{.received = "frobnicate"};
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == mirrorsync::to_int(ErrorCode::UnknownMessage));
        assert(json.at("code") == "unknown_message");
        assert(json.at("received") == "frobnicate");

        const auto decoded = json.get<UnknownMessageError>();
        assert(decoded.received == "frobnicate");
    }

    void test_error_codes()
    {
        assert(mirrorsync::to_string(ErrorCode::PermissionDenied) == "permission_denied");
        assert(error_code_from_int(mirrorsync::to_int(ErrorCode::NotFound)) == ErrorCode::NotFound);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_framing()
    {
        const nlohmann::json message = std::string(literal(MessageKind::Handshake));
        const auto frame = encode_frame(message);
        assert(frame.size() == kFrameHeaderSize + message.dump().size());
        assert(decode_u32(frame) == message.dump().size());

        const std::span<const std::uint8_t> view(frame);
        const auto payload = view.subspan(kFrameHeaderSize);
        assert(nlohmann::json::parse(payload.begin(), payload.end()) == "handshake");

        bool caught = false;
        try
        {
            (void)encode_frame(std::string(kMaxFrameSize, 'x'));
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_primitives()
    {
        std::vector<std::uint8_t> out;
        append_bool(out, true);
        append_i32(out, -2);
        append_i64(out, 0x0102030405060708LL);
        append_utf(out, "mods/a.jar");

        const std::vector<std::uint8_t> expected_head = {
            0x01,
            0xFF, 0xFF, 0xFF, 0xFE,
            0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
            0x00, 0x0A};
        assert(std::equal(expected_head.begin(), expected_head.end(), out.begin()));
        assert(out.size() == expected_head.size() + 10);

        const std::span<const std::uint8_t> view(out);
        assert(decode_bool(view));
        assert(decode_i32(view.subspan(1)) == -2);
        assert(decode_i64(view.subspan(5)) == 0x0102030405060708LL);
        assert(decode_u16(view.subspan(13)) == 10);
        assert(std::string(out.begin() + 15, out.end()) == "mods/a.jar");

        bool caught = false;
        try
        {
            (void)decode_i64(view.subspan(out.size() - 4));
        }
        catch (const std::out_of_range &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            std::vector<std::uint8_t> sink;
            append_utf(sink, std::string(kMaxUtfLength + 1, 'x'));
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_crypto()
    {
        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto chunk_hash = crypto::hash_stream(stream);
        assert(chunk_hash.size() == 64);

        std::istringstream other(std::string("\xDE\xAD\xBE\xEE", 4));
        assert(crypto::hash_stream(other) != chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "mirrorsync_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);
        std::filesystem::remove(file_path);

        bool caught = false;
        try
        {
            (void)crypto::hash_file(file_path);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

} // namespace

int main()
{
    try
    {
        test_message_vocabulary();
        test_vocabulary_message();
        test_binary_answer();
        test_file_count_field();
        test_unknown_message_error();
        test_error_codes();
        test_framing();
        test_primitives();
        test_crypto();
        run_server_component_tests();
        run_session_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}

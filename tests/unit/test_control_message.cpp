#include <catch2/catch_test_macros.hpp>
#include "airlink/protocol/control_message.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace airlink;
using namespace airlink::protocol;

namespace {
    std::vector<uint8_t> Json(std::string_view text) {
        return {text.begin(), text.end()};
    }

    std::string Text(const std::vector<uint8_t>& bytes) {
        return {bytes.begin(), bytes.end()};
    }
}

TEST_CASE("ControlMessage - camelCase keys and byte arrays", "[protocol][control]") {
    const ControlMessage message = HandshakeMessage{"s-1", {0, 127, 255}};
    auto encoded = ControlMessageCodec::Encode(message);
    REQUIRE(encoded.IsOk());
    const std::string json = Text(encoded.Unwrap());

    REQUIRE(json.front() == '{');
    REQUIRE(json.find("\"type\":\"handshake\"") != std::string::npos);
    REQUIRE(json.find("\"sessionId\":\"s-1\"") != std::string::npos);
    REQUIRE(json.find("\"publicKey\":[0,127,255]") != std::string::npos);
    REQUIRE(json.find("session_id") == std::string::npos);

    auto decoded = ControlMessageCodec::Decode(encoded.Unwrap());
    REQUIRE(decoded.IsOk());
    const auto* handshake = std::get_if<HandshakeMessage>(&decoded.Unwrap());
    REQUIRE(handshake != nullptr);
    REQUIRE(handshake->public_key == std::vector<uint8_t>{0, 127, 255});
    REQUIRE(ControlMessageCodec::TypeName(decoded.Unwrap()) == "handshake");
    REQUIRE(ControlMessageCodec::SessionId(decoded.Unwrap()) == "s-1");
}

TEST_CASE("ControlMessage - File messages", "[protocol][control]") {
    SECTION("file_meta keeps an optional checksum") {
        FileMetaMessage meta{"s", "file-1", "a.txt", 42, std::string("abcd"), "text/plain", 16};
        auto decoded = ControlMessageCodec::Decode(ControlMessageCodec::Encode(meta).Unwrap()).Unwrap();
        const auto& round = std::get<FileMetaMessage>(decoded);
        REQUIRE(round.file_id == "file-1");
        REQUIRE(round.chunk_size == 16);
        REQUIRE(round.name == "a.txt");
        REQUIRE(round.size == 42);
        REQUIRE(round.checksum == std::optional<std::string>("abcd"));
        REQUIRE(round.mime_type == "text/plain");

        meta.checksum.reset();
        auto without = ControlMessageCodec::Decode(ControlMessageCodec::Encode(meta).Unwrap()).Unwrap();
        REQUIRE_FALSE(std::get<FileMetaMessage>(without).checksum.has_value());
    }

    SECTION("file_chunk carries data, offset and the encrypted flag") {
        FileChunkMessage chunk{"s", "file-2", {9, 8, 7}, 65536, 3, true};
        const auto json = Text(ControlMessageCodec::Encode(chunk).Unwrap());
        REQUIRE(json.find("\"fileId\":\"file-2\"") != std::string::npos);
        REQUIRE(json.find("\"data\":[9,8,7]") != std::string::npos);

        const auto decoded = ControlMessageCodec::Decode(Json(json)).Unwrap();
        const auto& round = std::get<FileChunkMessage>(decoded);
        REQUIRE(round.offset == 65536);
        REQUIRE(round.encrypted);
        REQUIRE(round.data == std::vector<uint8_t>{9, 8, 7});
    }

    SECTION("file_ready lists the chunks still missing") {
        FileReadyMessage ready{"s", "file-4", true, {1, 5, 6}};
        const auto json = Text(ControlMessageCodec::Encode(ready).Unwrap());
        REQUIRE(json.find("\"type\":\"file_ready\"") != std::string::npos);
        REQUIRE(json.find("\"missingChunks\":[1,5,6]") != std::string::npos);

        const auto decoded = ControlMessageCodec::Decode(Json(json)).Unwrap();
        const auto& round = std::get<FileReadyMessage>(decoded);
        REQUIRE(round.resumed);
        REQUIRE(round.missing_chunks == std::vector<uint32_t>{1, 5, 6});
        REQUIRE(ControlMessageCodec::TypeName(decoded) == "file_ready");
    }

    SECTION("file_result reason survives") {
        FileResultMessage result{"s", "file-3", false, "CHECKSUM_MISMATCH: digest differs"};
        const auto decoded = ControlMessageCodec::Decode(ControlMessageCodec::Encode(result).Unwrap()).Unwrap();
        const auto& round = std::get<FileResultMessage>(decoded);
        REQUIRE_FALSE(round.success);
        REQUIRE(round.reason == "CHECKSUM_MISMATCH: digest differs");
    }
}

TEST_CASE("ControlMessage - Verify payload", "[protocol][control]") {
    VerifyMessage verify;
    verify.session_id = "s";
    verify.payload.aad = {1};
    verify.payload.iv = std::vector<uint8_t>(12, 2);
    verify.payload.tag = std::vector<uint8_t>(16, 3);
    verify.payload.ciphertext = {4, 5};
    const auto decoded = ControlMessageCodec::Decode(ControlMessageCodec::Encode(verify).Unwrap()).Unwrap();
    const auto& round = std::get<VerifyMessage>(decoded);
    REQUIRE(round.payload.iv == verify.payload.iv);
    REQUIRE(round.payload.tag == verify.payload.tag);
    REQUIRE(round.payload.ciphertext == verify.payload.ciphertext);

    REQUIRE(ControlMessageCodec::Decode(Json(R"({"type":"verify","sessionId":"s"})")).IsErr());
}

TEST_CASE("ControlMessage - Hand-written JSON from a peer", "[protocol][control]") {
    auto decoded = ControlMessageCodec::Decode(
        Json(R"({"type":"file_end","sessionId":"abc","fileId":"f","extra":true})"));
    REQUIRE(decoded.IsOk());
    REQUIRE(std::get<FileEndMessage>(decoded.Unwrap()).file_id == "f");

    auto ack = ControlMessageCodec::Decode(Json(R"({"type":"verify_ack","sessionId":"abc"})"));
    REQUIRE(std::holds_alternative<VerifyAckMessage>(ack.Unwrap()));
}

TEST_CASE("ControlMessage - Decode rejects malformed messages", "[protocol][control][validation]") {
    SECTION("Not JSON") {
        REQUIRE(ControlMessageCodec::Decode(std::vector<uint8_t>{1, 2, 3}).IsErr());
        REQUIRE(ControlMessageCodec::Decode(std::vector<uint8_t>{}).IsErr());
    }

    SECTION("Broken JSON") {
        REQUIRE(ControlMessageCodec::Decode(Json(R"({"type":"handshake",)")).IsErr());
    }

    SECTION("Missing sessionId") {
        auto result = ControlMessageCodec::Decode(Json(R"({"type":"handshake","publicKey":[1,2]})"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == HandshakeFailureType::Decode);
    }

    SECTION("Byte value above 255") {
        REQUIRE(ControlMessageCodec::Decode(
            Json(R"({"type":"handshake","sessionId":"s","publicKey":[1,256]})")).IsErr());
    }

    SECTION("Unknown type") {
        REQUIRE(ControlMessageCodec::Decode(Json(R"({"type":"ping","sessionId":"s"})")).IsErr());
    }

    SECTION("File message without fileId") {
        REQUIRE(ControlMessageCodec::Decode(Json(R"({"type":"file_end","sessionId":"s"})")).IsErr());
    }

    SECTION("Chunk size that disagrees with its data") {
        auto larger = ControlMessageCodec::Decode(Json(
            R"({"type":"file_chunk","sessionId":"s","fileId":"f","data":[1,2,3],"offset":"0","size":"4"})"));
        REQUIRE(larger.IsErr());
        REQUIRE(larger.UnwrapErr().type == HandshakeFailureType::Decode);

        REQUIRE(ControlMessageCodec::Decode(Json(
            R"({"type":"file_chunk","sessionId":"s","fileId":"f","data":[1,2,3],"offset":"0","size":"2"})")).IsErr());
        REQUIRE(ControlMessageCodec::Decode(Json(
            R"({"type":"file_chunk","sessionId":"s","fileId":"f","data":[1,2,3],"size":"9","encrypted":true})")).IsErr());

        auto sealed = ControlMessageCodec::Decode(Json(
            R"({"type":"file_chunk","sessionId":"s","fileId":"f","data":[1,2,3],"size":"1","encrypted":true})"));
        REQUIRE(sealed.IsOk());
        REQUIRE(std::get<FileChunkMessage>(sealed.Unwrap()).size == 1);
    }
}

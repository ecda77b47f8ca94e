#include <catch2/catch_test_macros.hpp>
#include "airlink/protocol/chunk_frame.hpp"
#include "airlink/protocol/control_message.hpp"
#include "airlink/core/constants.hpp"
#include <string>
#include <vector>

using namespace airlink;
using namespace airlink::protocol;

TEST_CASE("ChunkFrame - Layout", "[protocol][chunk]") {
    ChunkFrame frame{"f1", 0x0102030405060708ULL, {0xAA, 0xBB, 0xCC}};
    auto encoded = ChunkFrameCodec::Encode(frame);
    REQUIRE(encoded.IsOk());
    const auto bytes = encoded.Unwrap();

    const std::vector<uint8_t> expected = {
        kChunkFrameTypeFileChunk, 2, 'f', '1',
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
        0x00, 0x00, 0x00, 0x03,
        0xAA, 0xBB, 0xCC};
    REQUIRE(bytes == expected);
    REQUIRE_FALSE(ControlMessageCodec::IsJsonFrame(bytes));

    auto decoded = ChunkFrameCodec::Decode(bytes);
    REQUIRE(decoded.IsOk());
    REQUIRE(decoded.Unwrap().file_id == "f1");
    REQUIRE(decoded.Unwrap().offset == 0x0102030405060708ULL);
    REQUIRE(decoded.Unwrap().data == frame.data);
}

TEST_CASE("ChunkFrame - Empty data is allowed", "[protocol][chunk]") {
    auto bytes = ChunkFrameCodec::Encode(ChunkFrame{"file", 0, {}}).Unwrap();
    REQUIRE(bytes.size() == kChunkFrameFixedBytes + 4);
    REQUIRE(ChunkFrameCodec::Decode(bytes).Unwrap().data.empty());
}

TEST_CASE("ChunkFrame - Encode rejects bad file ids", "[protocol][chunk][validation]") {
    REQUIRE(ChunkFrameCodec::Encode(ChunkFrame{"", 0, {1}}).IsErr());
    REQUIRE(ChunkFrameCodec::Encode(ChunkFrame{std::string(kChunkFrameMaxFileIdBytes, 'x'), 0, {1}}).IsOk());
    REQUIRE(ChunkFrameCodec::Encode(ChunkFrame{std::string(kChunkFrameMaxFileIdBytes + 1, 'x'), 0, {1}}).IsErr());
}

TEST_CASE("ChunkFrame - Decode rejects malformed input", "[protocol][chunk][validation]") {
    const auto good = ChunkFrameCodec::Encode(ChunkFrame{"abc", 7, {1, 2, 3, 4}}).Unwrap();

    SECTION("Shorter than the prefix") {
        REQUIRE(ChunkFrameCodec::Decode(std::vector<uint8_t>{kChunkFrameTypeFileChunk}).IsErr());
    }

    SECTION("Unknown frame type") {
        auto bytes = good;
        bytes[0] = 0x02;
        auto result = ChunkFrameCodec::Decode(bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == HandshakeFailureType::Decode);
    }

    SECTION("Empty file id") {
        auto bytes = good;
        bytes[1] = 0;
        REQUIRE(ChunkFrameCodec::Decode(bytes).IsErr());
    }

    SECTION("Every truncation fails") {
        for (size_t length = 0; length < good.size(); ++length) {
            const std::vector<uint8_t> prefix(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(length));
            REQUIRE(ChunkFrameCodec::Decode(prefix).IsErr());
        }
    }

    SECTION("Trailing bytes after the data are ignored") {
        auto bytes = good;
        bytes.push_back(0xFF);
        REQUIRE(ChunkFrameCodec::Decode(bytes).Unwrap().data == std::vector<uint8_t>{1, 2, 3, 4});
    }
}

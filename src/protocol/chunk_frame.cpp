#include "airlink/protocol/chunk_frame.hpp"
#include "airlink/core/constants.hpp"
#include <format>

namespace airlink::protocol {
    Result<std::vector<uint8_t>, HandshakeFailure> ChunkFrameCodec::Encode(const ChunkFrame& frame) {
        if (frame.file_id.empty() || frame.file_id.size() > kChunkFrameMaxFileIdBytes) {
            return Result<std::vector<uint8_t>, HandshakeFailure>::Err(
                HandshakeFailure::Encode(std::format("File id length {} outside 1..{}",
                                                     frame.file_id.size(), kChunkFrameMaxFileIdBytes)));
        }
        if (frame.data.size() > UINT32_MAX) {
            return Result<std::vector<uint8_t>, HandshakeFailure>::Err(
                HandshakeFailure::Encode("Chunk data exceeds 32-bit length field"));
        }
        std::vector<uint8_t> out;
        out.reserve(kChunkFrameFixedBytes + frame.file_id.size() + frame.data.size());
        out.push_back(kChunkFrameTypeFileChunk);
        out.push_back(static_cast<uint8_t>(frame.file_id.size()));
        out.insert(out.end(), frame.file_id.begin(), frame.file_id.end());
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>(frame.offset >> shift));
        }
        const auto length = static_cast<uint32_t>(frame.data.size());
        for (int shift = 24; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>(length >> shift));
        }
        out.insert(out.end(), frame.data.begin(), frame.data.end());
        return Result<std::vector<uint8_t>, HandshakeFailure>::Ok(std::move(out));
    }

    Result<ChunkFrame, HandshakeFailure> ChunkFrameCodec::Decode(std::span<const uint8_t> bytes) {
        using R = Result<ChunkFrame, HandshakeFailure>;
        if (bytes.size() < 2) {
            return R::Err(HandshakeFailure::Decode("Chunk frame shorter than its prefix"));
        }
        if (bytes[0] != kChunkFrameTypeFileChunk) {
            return R::Err(HandshakeFailure::Decode(std::format("Unknown binary frame type {}", bytes[0])));
        }
        const size_t id_length = bytes[1];
        if (id_length == 0) {
            return R::Err(HandshakeFailure::Decode("Chunk frame with empty file id"));
        }
        if (bytes.size() < kChunkFrameFixedBytes + id_length) {
            return R::Err(HandshakeFailure::Decode(
                std::format("Chunk frame truncated: {} bytes, header needs {}",
                            bytes.size(), kChunkFrameFixedBytes + id_length)));
        }
        size_t pos = 2;
        ChunkFrame frame;
        frame.file_id.assign(reinterpret_cast<const char*>(bytes.data() + pos), id_length);
        pos += id_length;
        for (int i = 0; i < 8; ++i) {
            frame.offset = (frame.offset << 8) | bytes[pos++];
        }
        uint32_t length = 0;
        for (int i = 0; i < 4; ++i) {
            length = (length << 8) | bytes[pos++];
        }
        if (bytes.size() - pos < length) {
            return R::Err(HandshakeFailure::Decode(
                std::format("Chunk frame truncated: {} data bytes declared, {} present", length, bytes.size() - pos)));
        }
        frame.data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(pos),
                          bytes.begin() + static_cast<std::ptrdiff_t>(pos + length));
        return R::Ok(std::move(frame));
    }
}

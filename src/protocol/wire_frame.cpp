#include "airlink/protocol/wire_frame.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/crypto/crypto_primitives.hpp"
#include <algorithm>
#include <format>

namespace airlink::protocol {
    using crypto::CryptoPrimitives;

    namespace {
        constexpr size_t kChecksumBytes = 4;

        void PutU16(std::vector<uint8_t>& out, const uint16_t value) {
            out.push_back(static_cast<uint8_t>(value >> 8));
            out.push_back(static_cast<uint8_t>(value));
        }

        void PutU32(std::vector<uint8_t>& out, const uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        uint16_t GetU16(std::span<const uint8_t> bytes, const size_t pos) {
            return static_cast<uint16_t>((bytes[pos] << 8) | bytes[pos + 1]);
        }

        uint32_t GetU32(std::span<const uint8_t> bytes, const size_t pos) {
            return (static_cast<uint32_t>(bytes[pos]) << 24) |
                   (static_cast<uint32_t>(bytes[pos + 1]) << 16) |
                   (static_cast<uint32_t>(bytes[pos + 2]) << 8) |
                   static_cast<uint32_t>(bytes[pos + 3]);
        }

        Result<std::vector<uint8_t>, HandshakeFailure> Digest(std::span<const uint8_t> payload) {
            return CryptoPrimitives::Sha256(payload).MapErr([](CryptoFailure&& failure) {
                return HandshakeFailure::Encode("Wire checksum: " + failure.message);
            });
        }
    }

    bool WireFrame::HasFooter() const noexcept {
        return (flags & kWireFlagHasFooter) != 0;
    }

    bool WireFrame::IsEncrypted() const noexcept {
        return (flags & kWireFlagEncrypted) != 0;
    }

    Result<std::vector<uint8_t>, HandshakeFailure> WireFrameCodec::Encode(const WireFrame& frame) {
        if (frame.payload.size() > kWireMaxPayloadBytes) {
            return Result<std::vector<uint8_t>, HandshakeFailure>::Err(
                HandshakeFailure::Encode(std::format("Wire payload of {} bytes exceeds {}",
                                                     frame.payload.size(), kWireMaxPayloadBytes)));
        }
        auto digest_result = Digest(frame.payload);
        if (digest_result.IsErr()) {
            return Result<std::vector<uint8_t>, HandshakeFailure>::Err(std::move(digest_result).UnwrapErr());
        }
        const std::vector<uint8_t> digest = std::move(digest_result).Unwrap();

        std::vector<uint8_t> out;
        out.reserve(kWireHeaderBytes + frame.payload.size() + (frame.HasFooter() ? kWireFooterBytes : 0));
        PutU32(out, kWireMagic);
        PutU16(out, kProtocolVersion);
        PutU16(out, static_cast<uint16_t>(frame.type));
        PutU16(out, frame.flags);
        PutU32(out, frame.sequence);
        PutU32(out, frame.chunk_index);
        PutU32(out, frame.total_chunks);
        PutU32(out, static_cast<uint32_t>(frame.payload.size()));
        out.insert(out.end(), digest.begin(), digest.begin() + kChecksumBytes);
        PutU16(out, 0);
        out.insert(out.end(), frame.payload.begin(), frame.payload.end());
        if (frame.HasFooter()) {
            out.insert(out.end(), digest.begin(), digest.end());
        }
        return Result<std::vector<uint8_t>, HandshakeFailure>::Ok(std::move(out));
    }

    Result<WireFrame, HandshakeFailure> WireFrameCodec::Decode(std::span<const uint8_t> bytes) {
        using R = Result<WireFrame, HandshakeFailure>;
        if (bytes.size() < kWireHeaderBytes) {
            return R::Err(HandshakeFailure::Decode(
                std::format("Wire frame truncated: {} bytes, header is {}", bytes.size(), kWireHeaderBytes)));
        }
        if (GetU32(bytes, 0) != kWireMagic) {
            return R::Err(HandshakeFailure::Decode("Wire frame magic mismatch"));
        }
        if (const uint16_t version = GetU16(bytes, 4); version != kProtocolVersion) {
            return R::Err(HandshakeFailure::Decode(std::format("Unsupported wire version {}", version)));
        }
        const uint16_t raw_type = GetU16(bytes, 6);
        if (raw_type > static_cast<uint16_t>(WireFrameType::Data)) {
            return R::Err(HandshakeFailure::Decode(std::format("Unknown wire frame type {}", raw_type)));
        }
        WireFrame frame;
        frame.type = static_cast<WireFrameType>(raw_type);
        frame.flags = GetU16(bytes, 8);
        frame.sequence = GetU32(bytes, 10);
        frame.chunk_index = GetU32(bytes, 14);
        frame.total_chunks = GetU32(bytes, 18);
        const uint32_t length = GetU32(bytes, 22);
        const std::span<const uint8_t> checksum = bytes.subspan(26, kChecksumBytes);

        if (length > kWireMaxPayloadBytes) {
            return R::Err(HandshakeFailure::Decode(
                std::format("Wire payload length {} exceeds {}", length, kWireMaxPayloadBytes)));
        }
        const size_t footer = frame.HasFooter() ? kWireFooterBytes : 0;
        if (bytes.size() < kWireHeaderBytes + length + footer) {
            return R::Err(HandshakeFailure::Decode(
                std::format("Wire frame truncated: {} bytes, need {}", bytes.size(), kWireHeaderBytes + length + footer)));
        }
        const std::span<const uint8_t> payload = bytes.subspan(kWireHeaderBytes, length);
        auto digest_result = Digest(payload);
        if (digest_result.IsErr()) {
            return R::Err(std::move(digest_result).UnwrapErr());
        }
        const std::vector<uint8_t> digest = std::move(digest_result).Unwrap();
        if (!std::equal(checksum.begin(), checksum.end(), digest.begin())) {
            return R::Err(HandshakeFailure::Decode("Wire payload checksum mismatch"));
        }
        if (footer != 0 &&
            !CryptoPrimitives::ConstantTimeEquals(bytes.subspan(kWireHeaderBytes + length, kWireFooterBytes), digest)) {
            return R::Err(HandshakeFailure::Decode("Wire footer digest mismatch"));
        }
        frame.payload.assign(payload.begin(), payload.end());
        return R::Ok(std::move(frame));
    }
}

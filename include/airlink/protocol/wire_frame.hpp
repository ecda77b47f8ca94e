#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace airlink::protocol {

enum class WireFrameType : uint16_t {
    Control = 0,
    Data = 1
};

/**
 * @brief Binary wire envelope
 *
 * 32-byte big-endian header:
 *   magic(4) version(2) type(2) flags(2) sequence(4) chunk_index(4)
 *   total_chunks(4) payload_length(4) checksum(4) reserved(2)
 * then the payload and, when kWireFlagHasFooter is set, the full 32-byte
 * SHA-256 of the payload. The header checksum is the first 4 digest bytes.
 */
struct WireFrame {
    WireFrameType type = WireFrameType::Control;
    uint16_t flags = 0;
    uint32_t sequence = 0;
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    std::vector<uint8_t> payload;

    [[nodiscard]] bool HasFooter() const noexcept;
    [[nodiscard]] bool IsEncrypted() const noexcept;
};

class WireFrameCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, HandshakeFailure> Encode(const WireFrame& frame);

    /// Rejects bad magic or version, oversize or truncated payloads, and checksum or footer mismatches.
    [[nodiscard]] static Result<WireFrame, HandshakeFailure> Decode(std::span<const uint8_t> bytes);

private:
    WireFrameCodec() = delete;
};

}

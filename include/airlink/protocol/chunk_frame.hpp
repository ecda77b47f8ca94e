#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace airlink::protocol {

/// Binary file chunk: [type:1][idLen:1][fileId][offset:8 BE][dataLen:4 BE][data]
struct ChunkFrame {
    std::string file_id;
    uint64_t offset = 0;
    std::vector<uint8_t> data;
};

class ChunkFrameCodec {
public:
    /// Fails when the file id does not fit the one-byte length prefix.
    [[nodiscard]] static Result<std::vector<uint8_t>, HandshakeFailure> Encode(const ChunkFrame& frame);

    [[nodiscard]] static Result<ChunkFrame, HandshakeFailure> Decode(std::span<const uint8_t> bytes);

private:
    ChunkFrameCodec() = delete;
};

}

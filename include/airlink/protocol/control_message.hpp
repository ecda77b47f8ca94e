#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/session/secure_session.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
namespace airlink::protocol {

struct HandshakeMessage {
    std::string session_id;
    std::vector<uint8_t> public_key;
};

struct HandshakeResponseMessage {
    std::string session_id;
    std::vector<uint8_t> public_key;
};

struct VerifyMessage {
    std::string session_id;
    session::VerificationPayload payload;
};

struct VerifyAckMessage {
    std::string session_id;
};

struct VerifyFailMessage {
    std::string session_id;
};

struct FileMetaMessage {
    std::string session_id;
    std::string file_id;
    std::string name;
    uint64_t size = 0;
    std::optional<std::string> checksum;
    std::string mime_type;
    /// Chunk i starts at i * chunk_size; zero only for empty files.
    uint32_t chunk_size = 0;
};

/// Receiver's answer to file_meta. When resumed, only missing_chunks are sent.
struct FileReadyMessage {
    std::string session_id;
    std::string file_id;
    bool resumed = false;
    std::vector<uint32_t> missing_chunks;
};

struct FileChunkMessage {
    std::string session_id;
    std::string file_id;
    std::vector<uint8_t> data;
    uint64_t offset = 0;
    /// Plaintext length; equals data.size() unless the chunk is sealed.
    uint64_t size = 0;
    bool encrypted = false;
};

struct FileEndMessage {
    std::string session_id;
    std::string file_id;
};

struct FileResultMessage {
    std::string session_id;
    std::string file_id;
    bool success = false;
    std::string reason;
};

struct TransferEndMessage {
    std::string session_id;
};

struct RekeyMessage {
    std::string session_id;
    std::vector<uint8_t> public_key;
};

struct RekeyResponseMessage {
    std::string session_id;
    std::vector<uint8_t> public_key;
};

using ControlMessage = std::variant<
    HandshakeMessage,
    HandshakeResponseMessage,
    VerifyMessage,
    VerifyAckMessage,
    VerifyFailMessage,
    FileMetaMessage,
    FileReadyMessage,
    FileChunkMessage,
    FileEndMessage,
    FileResultMessage,
    TransferEndMessage,
    RekeyMessage,
    RekeyResponseMessage>;

/**
 * @brief JSON text codec for control messages
 *
 * The schema is airlink.proto.protocol.ControlFrame; protobuf's JSON mapping
 * produces camelCase keys ("sessionId", "publicKey", "fileId") and renders
 * every byte field as an array of numbers 0-255.
 */
class ControlMessageCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, HandshakeFailure> Encode(const ControlMessage& message);

    [[nodiscard]] static Result<ControlMessage, HandshakeFailure> Decode(std::span<const uint8_t> bytes);

    [[nodiscard]] static std::string_view TypeName(const ControlMessage& message) noexcept;

    [[nodiscard]] static const std::string& SessionId(const ControlMessage& message) noexcept;

    /// JSON control frames start with '{'; anything else is a binary chunk frame.
    [[nodiscard]] static bool IsJsonFrame(std::span<const uint8_t> bytes) noexcept;

private:
    ControlMessageCodec() = delete;
};

}

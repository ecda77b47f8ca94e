#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace airlink::interfaces {

struct TransportCapabilities {
    /// Transport moves whole files itself and reports progress through NextProgress
    bool native_file_transfer = false;
    /// Small MTU link; file chunks travel as binary frames instead of JSON
    bool constrained_frames = false;
    /// Transport can encrypt on the link once handed the session key
    bool encryption_offload = false;
};

/// Result of a native AES-GCM round-trip over a known test payload.
struct NativeVerification {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> tag;
};

enum class NativeTransferState : uint8_t {
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled
};

struct NativeProgress {
    int64_t transfer_id = 0;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    NativeTransferState state = NativeTransferState::Running;
    std::optional<std::string> error;
};

struct NativeTransferRequest {
    std::string connection_token;
    std::string connection_method;
    int64_t transfer_id = 0;
    std::string file_path;
    std::string file_name;
    uint64_t file_size = 0;
};

/**
 * @brief Platform link the engine runs over (Wi-Fi peer socket, BLE GATT, P2P session)
 *
 * Implementations must be safe to call from several threads. Receive() and
 * NextProgress() block for at most @p timeout and return nullopt when
 * nothing arrived.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual bool Send(const std::string& connection_token, std::span<const uint8_t> bytes) = 0;

    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> Receive(
        const std::string& connection_token,
        std::chrono::milliseconds timeout) = 0;

    virtual bool StartTransfer(const NativeTransferRequest& request) = 0;

    virtual bool StartReceive(
        const std::string& connection_token,
        int64_t transfer_id,
        const std::string& save_path) = 0;

    virtual bool Pause(int64_t transfer_id) = 0;
    virtual bool Resume(int64_t transfer_id) = 0;
    virtual bool Cancel(int64_t transfer_id) = 0;

    virtual void CloseConnection(const std::string& connection_token) = 0;

    virtual bool SetEncryptionKey(const std::string& connection_token, std::span<const uint8_t> key) = 0;

    [[nodiscard]] virtual std::optional<NativeVerification> VerifyEncryptionKey(
        const std::string& connection_token,
        std::span<const uint8_t> test_payload) = 0;

    [[nodiscard]] virtual std::optional<NativeProgress> NextProgress(
        int64_t transfer_id,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual TransportCapabilities GetCapabilities(std::string_view connection_method) const = 0;
};

}

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace airlink::session {

/// How payload bytes of a ready session are protected.
enum class PayloadProtection : uint8_t {
    /// Encryption disabled by policy
    Passthrough,
    /// AES-256-GCM in-process under the session key
    Local,
    /// Transport encrypts on the link with the verified session key
    Native
};

/// Authenticated "ok" challenge carried by the verify control message.
struct VerificationPayload {
    std::vector<uint8_t> aad;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> tag;
    std::vector<uint8_t> ciphertext;
};

/// Snapshot of one secure session. Key material stays in KeyManager.
struct SecureSession {
    std::string session_id;
    std::string device_id;
    std::optional<std::vector<uint8_t>> remote_public_key;
    bool is_handshake_complete = false;
    std::chrono::steady_clock::time_point created_at;
    std::optional<std::string> connection_token;
    std::optional<std::string> connection_method;
    bool native_key_verified = false;

    [[nodiscard]] bool IsReady() const noexcept {
        return is_handshake_complete && remote_public_key.has_value();
    }
};

}

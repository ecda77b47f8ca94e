#pragma once

#include "airlink/core/constants.hpp"

#include <chrono>
#include <cstdint>

namespace airlink::configuration {

/// Where payload encryption happens once a session key exists.
enum class EncryptionMode : uint8_t {
    /// Offload to the transport when it advertises encryption_offload, else encrypt locally
    Auto = 0,
    /// Always hand the key to the transport; fail the session if it is rejected
    Native = 1,
    /// Always encrypt in-process with AES-256-GCM
    Local = 2
};

/**
 * @brief Secure session policy
 *
 * Covers whether traffic must be encrypted at all, who performs the
 * encryption, and how the native key hand-off is verified.
 */
class SessionConfig {
public:
    [[nodiscard]] static SessionConfig Default() noexcept {
        return SessionConfig();
    }

    [[nodiscard]] SessionConfig WithRequireEncryption(const bool required) const noexcept {
        SessionConfig copy = *this;
        copy.require_encryption_ = required;
        return copy;
    }

    [[nodiscard]] SessionConfig WithEncryptionMode(const EncryptionMode mode) const noexcept {
        SessionConfig copy = *this;
        copy.encryption_mode_ = mode;
        return copy;
    }

    /// Number of native key verification round-trips before the key is rejected.
    [[nodiscard]] SessionConfig WithVerificationAttempts(const uint32_t attempts) const noexcept {
        SessionConfig copy = *this;
        copy.verification_attempts_ = attempts == 0 ? 1 : attempts;
        return copy;
    }

    [[nodiscard]] SessionConfig WithVerificationBackoff(const std::chrono::milliseconds backoff) const noexcept {
        SessionConfig copy = *this;
        copy.verification_backoff_ = backoff;
        return copy;
    }

    [[nodiscard]] SessionConfig WithVerificationTimeout(const std::chrono::milliseconds timeout) const noexcept {
        SessionConfig copy = *this;
        copy.verification_timeout_ = timeout;
        return copy;
    }

    [[nodiscard]] bool GetRequireEncryption() const noexcept { return require_encryption_; }
    [[nodiscard]] EncryptionMode GetEncryptionMode() const noexcept { return encryption_mode_; }
    [[nodiscard]] uint32_t GetVerificationAttempts() const noexcept { return verification_attempts_; }
    [[nodiscard]] std::chrono::milliseconds GetVerificationBackoff() const noexcept { return verification_backoff_; }
    [[nodiscard]] std::chrono::milliseconds GetVerificationTimeout() const noexcept { return verification_timeout_; }

    [[nodiscard]] bool operator==(const SessionConfig& other) const noexcept = default;

private:
    SessionConfig() noexcept = default;

    bool require_encryption_{true};
    EncryptionMode encryption_mode_{EncryptionMode::Auto};
    uint32_t verification_attempts_{kDefaultVerificationAttempts};
    std::chrono::milliseconds verification_backoff_{kDefaultVerificationBackoff};
    std::chrono::milliseconds verification_timeout_{kDefaultVerificationTimeout};
};

} // namespace airlink::configuration

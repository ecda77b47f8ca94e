#pragma once

#include "airlink/core/constants.hpp"

#include <chrono>
#include <cstdint>

namespace airlink::configuration {

/**
 * @brief Policy for when an ephemeral session key pair is refreshed
 *
 * A key should rotate when EITHER:
 * 1. it is older than max_key_age, or
 * 2. it has been used for more than max_key_usage encryptions.
 *
 * Rotation only refreshes the asymmetric material. The symmetric session
 * key survives until a renegotiation completes.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = KeyRotationConfig::Default()
 *     .WithMaxKeyUsage(50)
 *     .WithAutoRotateOnEncrypt(true);
 * ```
 */
class KeyRotationConfig {
public:
    /// 24h age, 100 uses, no automatic rotation, 24h session lifetime.
    [[nodiscard]] static KeyRotationConfig Default() noexcept {
        return KeyRotationConfig();
    }

    [[nodiscard]] KeyRotationConfig WithMaxKeyAge(const std::chrono::milliseconds age) const noexcept {
        KeyRotationConfig copy = *this;
        copy.max_key_age_ = age;
        return copy;
    }

    [[nodiscard]] KeyRotationConfig WithMaxKeyUsage(const uint32_t usage) const noexcept {
        KeyRotationConfig copy = *this;
        copy.max_key_usage_ = usage;
        return copy;
    }

    /**
     * @brief Rotate inside EncryptWithSessionKey once ShouldRotateKey() holds
     *
     * Off by default: a rotation is only useful once the peer has seen the
     * new public key, which the handshake layer does through Renegotiate().
     */
    [[nodiscard]] KeyRotationConfig WithAutoRotateOnEncrypt(const bool enabled) const noexcept {
        KeyRotationConfig copy = *this;
        copy.auto_rotate_on_encrypt_ = enabled;
        return copy;
    }

    [[nodiscard]] KeyRotationConfig WithSessionMaxAge(const std::chrono::milliseconds age) const noexcept {
        KeyRotationConfig copy = *this;
        copy.session_max_age_ = age;
        return copy;
    }

    [[nodiscard]] bool ShouldRotate(
        const std::chrono::milliseconds age,
        const uint32_t usage_count) const noexcept {
        return age > max_key_age_ || usage_count > max_key_usage_;
    }

    [[nodiscard]] std::chrono::milliseconds GetMaxKeyAge() const noexcept { return max_key_age_; }
    [[nodiscard]] uint32_t GetMaxKeyUsage() const noexcept { return max_key_usage_; }
    [[nodiscard]] bool GetAutoRotateOnEncrypt() const noexcept { return auto_rotate_on_encrypt_; }
    [[nodiscard]] std::chrono::milliseconds GetSessionMaxAge() const noexcept { return session_max_age_; }

    [[nodiscard]] bool operator==(const KeyRotationConfig& other) const noexcept = default;

private:
    KeyRotationConfig() noexcept = default;

    std::chrono::milliseconds max_key_age_{kDefaultKeyMaxAge};
    uint32_t max_key_usage_{kDefaultKeyUsageLimit};
    bool auto_rotate_on_encrypt_{false};
    std::chrono::milliseconds session_max_age_{kDefaultSessionMaxAge};
};

} // namespace airlink::configuration

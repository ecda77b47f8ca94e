#pragma once

#include "airlink/core/constants.hpp"

#include <chrono>

namespace airlink::configuration {

/// Per-step timeouts of the handshake and rekey exchanges.
class HandshakeConfig {
public:
    [[nodiscard]] static HandshakeConfig Default() noexcept {
        return HandshakeConfig();
    }

    [[nodiscard]] HandshakeConfig WithHandshakeTimeout(const std::chrono::milliseconds timeout) const noexcept {
        HandshakeConfig copy = *this;
        copy.handshake_timeout_ = timeout;
        return copy;
    }

    [[nodiscard]] HandshakeConfig WithVerifyTimeout(const std::chrono::milliseconds timeout) const noexcept {
        HandshakeConfig copy = *this;
        copy.verify_timeout_ = timeout;
        return copy;
    }

    [[nodiscard]] HandshakeConfig WithRenegotiationTimeout(const std::chrono::milliseconds timeout) const noexcept {
        HandshakeConfig copy = *this;
        copy.renegotiation_timeout_ = timeout;
        return copy;
    }

    [[nodiscard]] std::chrono::milliseconds GetHandshakeTimeout() const noexcept { return handshake_timeout_; }
    [[nodiscard]] std::chrono::milliseconds GetVerifyTimeout() const noexcept { return verify_timeout_; }
    [[nodiscard]] std::chrono::milliseconds GetRenegotiationTimeout() const noexcept { return renegotiation_timeout_; }

    [[nodiscard]] bool operator==(const HandshakeConfig& other) const noexcept = default;

private:
    HandshakeConfig() noexcept = default;

    std::chrono::milliseconds handshake_timeout_{kDefaultHandshakeTimeout};
    std::chrono::milliseconds verify_timeout_{kDefaultVerifyTimeout};
    std::chrono::milliseconds renegotiation_timeout_{kDefaultRenegotiationTimeout};
};

} // namespace airlink::configuration

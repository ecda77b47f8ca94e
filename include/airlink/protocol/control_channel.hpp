#pragma once
#include "airlink/core/constants.hpp"
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/interfaces/i_transport.hpp"
#include "airlink/protocol/chunk_frame.hpp"
#include "airlink/protocol/control_message.hpp"
#include "airlink/protocol/wire_frame.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
namespace airlink::protocol {
using interfaces::ITransport;

/**
 * @brief Typed control-message I/O over one transport connection
 *
 * Await() pulls frames until one of the accepted message types arrives for
 * the given session. Frames for other sessions, binary frames and
 * undecodable text are dropped with a debug log line.
 *
 * Binary file chunks travel as a ChunkFrame inside a WireFrame envelope.
 */
class ControlChannel {
public:
    explicit ControlChannel(std::shared_ptr<ITransport> transport);

    [[nodiscard]] Result<Unit, HandshakeFailure> Send(
        const std::string& connection_token,
        const ControlMessage& message) const;

    /// Sends @p frame as the payload of @p envelope; type, flags and chunk numbering come from the caller.
    [[nodiscard]] Result<Unit, HandshakeFailure> SendChunk(
        const std::string& connection_token,
        const ChunkFrame& frame,
        WireFrame envelope) const;

    template<typename... Accepted>
    [[nodiscard]] Result<ControlMessage, HandshakeFailure> Await(
        const std::string& connection_token,
        const std::string& session_id,
        std::chrono::milliseconds timeout,
        const std::atomic<bool>* cancelled = nullptr) const;

    [[nodiscard]] ITransport& Transport() const noexcept { return *transport_; }

private:
    [[nodiscard]] Result<Unit, HandshakeFailure> SendRaw(
        const std::string& connection_token,
        std::span<const uint8_t> bytes,
        std::string_view what) const;

    std::shared_ptr<ITransport> transport_;
};

template<typename... Accepted>
Result<ControlMessage, HandshakeFailure> ControlChannel::Await(
    const std::string& connection_token,
    const std::string& session_id,
    const std::chrono::milliseconds timeout,
    const std::atomic<bool>* cancelled) const {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (cancelled != nullptr && cancelled->load()) {
            return Result<ControlMessage, HandshakeFailure>::Err(
                HandshakeFailure::Transport(std::format("Session {} cancelled while waiting", session_id)));
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return Result<ControlMessage, HandshakeFailure>::Err(
                HandshakeFailure::Timeout(std::format("No reply for session {} within {}ms",
                                                      session_id, timeout.count())));
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto frame = transport_->Receive(connection_token, std::min(remaining, kReceivePollInterval));
        if (!frame.has_value()) {
            continue;
        }
        if (!ControlMessageCodec::IsJsonFrame(*frame)) {
            logging::Get()->debug("Dropping {}-byte binary frame while awaiting control reply", frame->size());
            continue;
        }
        auto decoded = ControlMessageCodec::Decode(*frame);
        if (decoded.IsErr()) {
            logging::Get()->debug("Dropping control frame: {}", decoded.UnwrapErr().message);
            continue;
        }
        ControlMessage message = std::move(decoded).Unwrap();
        if (ControlMessageCodec::SessionId(message) != session_id) {
            continue;
        }
        if ((std::holds_alternative<Accepted>(message) || ...)) {
            return Result<ControlMessage, HandshakeFailure>::Ok(std::move(message));
        }
        logging::Get()->debug("Session {}: ignoring '{}' while awaiting reply",
                              session_id, ControlMessageCodec::TypeName(message));
    }
}

}

#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/configuration/handshake_config.hpp"
#include "airlink/interfaces/i_key_event_handler.hpp"
#include "airlink/protocol/control_channel.hpp"
#include "airlink/protocol/control_message.hpp"
#include "airlink/session/secure_session_manager.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
namespace airlink::protocol {
using configuration::HandshakeConfig;
using session::PayloadProtection;
using session::SecureSessionManager;

/**
 * @brief Key agreement and verification over control messages
 *
 * Initiator: handshake -> handshake_response -> derive -> verify -> verify_ack
 * -> key propagation. The responder mirrors it through HandleMessage().
 *
 * Also the KeyManager observer: a rotated key pair marks the session, and
 * Renegotiate() runs the rekey / rekey_response exchange so both peers move
 * to a fresh symmetric key derived from the staged public keys.
 */
class HandshakeProtocol final : public interfaces::IKeyEventHandler {
public:
    [[nodiscard]] static Result<std::shared_ptr<HandshakeProtocol>, HandshakeFailure> Create(
        SecureSessionManager& sessions,
        std::shared_ptr<ITransport> transport,
        HandshakeConfig config = HandshakeConfig::Default());

    /// The session must already exist in the session manager.
    [[nodiscard]] Result<PayloadProtection, HandshakeFailure> RunInitiator(
        const std::string& session_id,
        const std::string& connection_token);

    /**
     * @brief Responder side of the handshake and rekey exchanges
     *
     * A handshake for an unknown session id creates the session under that
     * id, so both peers key the same entry.
     *
     * @return true when the message belonged to the key exchange and was consumed.
     */
    [[nodiscard]] Result<bool, HandshakeFailure> HandleMessage(
        const std::string& connection_token,
        const std::string& connection_method,
        const std::string& device_id,
        const ControlMessage& message);

    /// Initiator side of the rekey exchange. The caller owns reads on the connection meanwhile.
    [[nodiscard]] Result<Unit, HandshakeFailure> Renegotiate(const std::string& session_id);

    [[nodiscard]] bool NeedsRenegotiation(const std::string& session_id) const;

    /// Drops handshake bookkeeping for the session. Key material is owned elsewhere.
    void Forget(const std::string& session_id);

    /// Peer keys must be 32 bytes and not all zero.
    [[nodiscard]] static Result<Unit, HandshakeFailure> ValidatePeerKey(std::span<const uint8_t> public_key);

    void OnKeyRotated(const std::string& session_id, std::span<const uint8_t> new_public_key) override;
    void OnRenegotiationStarted(const std::string& session_id, std::span<const uint8_t> staged_public_key) override;
    void OnRenegotiationCompleted(const std::string& session_id) override;

    HandshakeProtocol(const HandshakeProtocol&) = delete;
    HandshakeProtocol& operator=(const HandshakeProtocol&) = delete;
    HandshakeProtocol(HandshakeProtocol&&) = delete;
    HandshakeProtocol& operator=(HandshakeProtocol&&) = delete;
    ~HandshakeProtocol() override = default;

private:
    HandshakeProtocol(SecureSessionManager& sessions, std::shared_ptr<ITransport> transport, HandshakeConfig config);

    [[nodiscard]] Result<Unit, HandshakeFailure> RespondToHandshake(
        const std::string& connection_token,
        const std::string& connection_method,
        const std::string& device_id,
        const HandshakeMessage& message);

    [[nodiscard]] Result<Unit, HandshakeFailure> RespondToVerify(
        const std::string& connection_token,
        const VerifyMessage& message);

    [[nodiscard]] Result<Unit, HandshakeFailure> RespondToRekey(
        const std::string& connection_token,
        const RekeyMessage& message);

    /// ECDH over the staged pair, then HKDF with the symmetric salt and the rekey info string.
    [[nodiscard]] Result<Unit, HandshakeFailure> CompleteRekey(
        const std::string& session_id,
        std::span<const uint8_t> local_staged_key,
        std::span<const uint8_t> remote_staged_key);

    [[nodiscard]] Result<PayloadProtection, HandshakeFailure> Propagate(const std::string& session_id);

    [[nodiscard]] std::optional<std::string> TokenFor(const std::string& session_id) const;

    void BindToken(const std::string& session_id, const std::string& connection_token);

    SecureSessionManager& sessions_;
    ControlChannel channel_;
    HandshakeConfig config_;
    mutable std::mutex lock_;
    std::unordered_map<std::string, std::string> tokens_;
    std::unordered_set<std::string> pending_rekey_;
};

}

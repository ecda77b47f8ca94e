#include "airlink/protocol/handshake_protocol.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/crypto/scoped_wipe.hpp"
#include <format>

namespace airlink::protocol {
    using crypto::CryptoPrimitives;
    using crypto::ScopedWipe;

    namespace {
        HandshakeFailure FromKeyManager(const KeyManagerFailure& failure) {
            return HandshakeFailure::FromSessionFailure(SessionFailure::FromKeyManagerFailure(failure));
        }

        HandshakeFailure FromCrypto(const CryptoFailure& failure) {
            return HandshakeFailure::FromSessionFailure(SessionFailure::FromCryptoFailure(failure));
        }

        std::vector<uint8_t> RekeyInfo(const std::string& session_id) {
            std::vector<uint8_t> info(kRekeyInfoPrefix.begin(), kRekeyInfoPrefix.end());
            info.insert(info.end(), session_id.begin(), session_id.end());
            return info;
        }
    }

    Result<std::shared_ptr<HandshakeProtocol>, HandshakeFailure> HandshakeProtocol::Create(
        SecureSessionManager& sessions,
        std::shared_ptr<ITransport> transport,
        HandshakeConfig config) {
        if (!transport) {
            return Result<std::shared_ptr<HandshakeProtocol>, HandshakeFailure>::Err(
                HandshakeFailure::Transport("A transport is required"));
        }
        return Result<std::shared_ptr<HandshakeProtocol>, HandshakeFailure>::Ok(
            std::shared_ptr<HandshakeProtocol>(
                new HandshakeProtocol(sessions, std::move(transport), std::move(config))));
    }

    HandshakeProtocol::HandshakeProtocol(
        SecureSessionManager& sessions,
        std::shared_ptr<ITransport> transport,
        HandshakeConfig config)
        : sessions_(sessions)
          , channel_(std::move(transport))
          , config_(std::move(config)) {
    }

    Result<Unit, HandshakeFailure> HandshakeProtocol::ValidatePeerKey(std::span<const uint8_t> public_key) {
        if (public_key.size() != kX25519PublicKeyBytes) {
            return Result<Unit, HandshakeFailure>::Err(HandshakeFailure::InvalidPeerKey(
                std::format("Peer public key must be {} bytes, got {}", kX25519PublicKeyBytes, public_key.size())));
        }
        if (CryptoPrimitives::IsAllZero(public_key)) {
            return Result<Unit, HandshakeFailure>::Err(HandshakeFailure::InvalidPeerKey("Peer public key is all zeros"));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<PayloadProtection, HandshakeFailure> HandshakeProtocol::RunInitiator(
        const std::string& session_id,
        const std::string& connection_token) {
        auto local_key = sessions_.GetLocalPublicKey(session_id);
        if (local_key.IsErr()) {
            return Result<PayloadProtection, HandshakeFailure>::Err(
                HandshakeFailure::FromSessionFailure(local_key.UnwrapErr()));
        }
        BindToken(session_id, connection_token);

        AIRLINK_TRY(channel_.Send(connection_token, HandshakeMessage{session_id, std::move(local_key).Unwrap()}));
        logging::Get()->debug("Session {}: handshake sent", session_id);

        auto reply = channel_.Await<HandshakeResponseMessage>(
            connection_token, session_id, config_.GetHandshakeTimeout());
        if (reply.IsErr()) {
            return Result<PayloadProtection, HandshakeFailure>::Err(std::move(reply).UnwrapErr());
        }
        const auto& response = std::get<HandshakeResponseMessage>(reply.Unwrap());
        AIRLINK_TRY(ValidatePeerKey(response.public_key));

        if (auto completed = sessions_.CompleteHandshake(session_id, response.public_key); completed.IsErr()) {
            return Result<PayloadProtection, HandshakeFailure>::Err(
                HandshakeFailure::FromSessionFailure(completed.UnwrapErr()));
        }

        auto payload = sessions_.GenerateVerificationPayload(session_id);
        if (payload.IsErr()) {
            return Result<PayloadProtection, HandshakeFailure>::Err(
                HandshakeFailure::FromSessionFailure(payload.UnwrapErr()));
        }
        AIRLINK_TRY(channel_.Send(connection_token, VerifyMessage{session_id, std::move(payload).Unwrap()}));

        auto verdict = channel_.Await<VerifyAckMessage, VerifyFailMessage>(
            connection_token, session_id, config_.GetVerifyTimeout());
        if (verdict.IsErr()) {
            const HandshakeFailure& failure = verdict.UnwrapErr();
            if (failure.type == HandshakeFailureType::Timeout) {
                return Result<PayloadProtection, HandshakeFailure>::Err(
                    HandshakeFailure::VerifyFailed(std::format("No verify_ack for session {}", session_id)));
            }
            return Result<PayloadProtection, HandshakeFailure>::Err(failure);
        }
        if (std::holds_alternative<VerifyFailMessage>(verdict.Unwrap())) {
            return Result<PayloadProtection, HandshakeFailure>::Err(
                HandshakeFailure::VerifyFailed(std::format("Peer rejected verification for session {}", session_id)));
        }
        logging::Get()->info("Session {}: peer verified session key", session_id);
        return Propagate(session_id);
    }

    Result<bool, HandshakeFailure> HandshakeProtocol::HandleMessage(
        const std::string& connection_token,
        const std::string& connection_method,
        const std::string& device_id,
        const ControlMessage& message) {
        if (const auto* handshake = std::get_if<HandshakeMessage>(&message)) {
            AIRLINK_TRY(RespondToHandshake(connection_token, connection_method, device_id, *handshake));
            return Result<bool, HandshakeFailure>::Ok(true);
        }
        if (const auto* verify = std::get_if<VerifyMessage>(&message)) {
            AIRLINK_TRY(RespondToVerify(connection_token, *verify));
            return Result<bool, HandshakeFailure>::Ok(true);
        }
        if (const auto* rekey = std::get_if<RekeyMessage>(&message)) {
            AIRLINK_TRY(RespondToRekey(connection_token, *rekey));
            return Result<bool, HandshakeFailure>::Ok(true);
        }
        return Result<bool, HandshakeFailure>::Ok(false);
    }

    Result<Unit, HandshakeFailure> HandshakeProtocol::RespondToHandshake(
        const std::string& connection_token,
        const std::string& connection_method,
        const std::string& device_id,
        const HandshakeMessage& message) {
        AIRLINK_TRY(ValidatePeerKey(message.public_key));
        const std::string& session_id = message.session_id;
        if (!sessions_.HasSession(session_id)) {
            auto created = sessions_.CreateSession(session_id, device_id, connection_token, connection_method);
            if (created.IsErr()) {
                return Result<Unit, HandshakeFailure>::Err(HandshakeFailure::FromSessionFailure(created.UnwrapErr()));
            }
        } else {
            sessions_.SetNativeConnectionInfo(session_id, connection_token, connection_method);
        }
        BindToken(session_id, connection_token);

        if (auto completed = sessions_.CompleteHandshake(session_id, message.public_key); completed.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(HandshakeFailure::FromSessionFailure(completed.UnwrapErr()));
        }
        auto local_key = sessions_.GetLocalPublicKey(session_id);
        if (local_key.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(HandshakeFailure::FromSessionFailure(local_key.UnwrapErr()));
        }
        logging::Get()->debug("Session {}: answering handshake from {}", session_id, device_id);
        return channel_.Send(connection_token, HandshakeResponseMessage{session_id, std::move(local_key).Unwrap()});
    }

    Result<Unit, HandshakeFailure> HandshakeProtocol::RespondToVerify(
        const std::string& connection_token,
        const VerifyMessage& message) {
        const std::string& session_id = message.session_id;
        if (!sessions_.VerifyIncomingPayload(session_id, message.payload)) {
            logging::Get()->warn("Session {}: verification payload rejected", session_id);
            AIRLINK_TRY(channel_.Send(connection_token, VerifyFailMessage{session_id}));
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::VerifyFailed(std::format("Verification payload rejected for session {}", session_id)));
        }
        AIRLINK_TRY(channel_.Send(connection_token, VerifyAckMessage{session_id}));
        auto propagated = Propagate(session_id);
        if (propagated.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(std::move(propagated).UnwrapErr());
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<Unit, HandshakeFailure> HandshakeProtocol::RespondToRekey(
        const std::string& connection_token,
        const RekeyMessage& message) {
        AIRLINK_TRY(ValidatePeerKey(message.public_key));
        const std::string& session_id = message.session_id;
        security::KeyManager& keys = sessions_.GetKeyManager();

        auto staged = keys.StartSymmetricKeyRenegotiation(session_id);
        if (staged.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(FromKeyManager(staged.UnwrapErr()));
        }
        const std::vector<uint8_t> staged_key = std::move(staged).Unwrap();
        if (auto done = CompleteRekey(session_id, staged_key, message.public_key); done.IsErr()) {
            keys.CancelSymmetricKeyRenegotiation(session_id);
            return done;
        }
        AIRLINK_TRY(channel_.Send(connection_token, RekeyResponseMessage{session_id, staged_key}));
        auto propagated = Propagate(session_id);
        if (propagated.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(std::move(propagated).UnwrapErr());
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<Unit, HandshakeFailure> HandshakeProtocol::Renegotiate(const std::string& session_id) {
        const auto token = TokenFor(session_id);
        if (!token.has_value()) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::Transport(std::format("No connection bound to session {}", session_id)));
        }
        security::KeyManager& keys = sessions_.GetKeyManager();
        auto staged = keys.StartSymmetricKeyRenegotiation(session_id);
        if (staged.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(FromKeyManager(staged.UnwrapErr()));
        }
        const std::vector<uint8_t> staged_key = std::move(staged).Unwrap();

        const auto abort = [&](HandshakeFailure failure) {
            keys.CancelSymmetricKeyRenegotiation(session_id);
            logging::Get()->warn("Session {}: renegotiation abandoned: {}", session_id, failure.message);
            return Result<Unit, HandshakeFailure>::Err(std::move(failure));
        };

        if (auto sent = channel_.Send(*token, RekeyMessage{session_id, staged_key}); sent.IsErr()) {
            return abort(std::move(sent).UnwrapErr());
        }
        auto reply = channel_.Await<RekeyResponseMessage>(*token, session_id, config_.GetRenegotiationTimeout());
        if (reply.IsErr()) {
            return abort(std::move(reply).UnwrapErr());
        }
        const auto& response = std::get<RekeyResponseMessage>(reply.Unwrap());
        if (auto valid = ValidatePeerKey(response.public_key); valid.IsErr()) {
            return abort(std::move(valid).UnwrapErr());
        }
        if (auto done = CompleteRekey(session_id, staged_key, response.public_key); done.IsErr()) {
            return abort(std::move(done).UnwrapErr());
        }
        auto propagated = Propagate(session_id);
        if (propagated.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(std::move(propagated).UnwrapErr());
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<Unit, HandshakeFailure> HandshakeProtocol::CompleteRekey(
        const std::string& session_id,
        std::span<const uint8_t> local_staged_key,
        std::span<const uint8_t> remote_staged_key) {
        security::KeyManager& keys = sessions_.GetKeyManager();
        auto secret_result = keys.ComputeRenegotiationSecret(session_id, remote_staged_key);
        if (secret_result.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(FromKeyManager(secret_result.UnwrapErr()));
        }
        std::vector<uint8_t> secret = std::move(secret_result).Unwrap();
        ScopedWipe wipe_secret(secret);

        auto salt = CryptoPrimitives::SymmetricSalt(local_staged_key, remote_staged_key, session_id);
        if (salt.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(FromCrypto(salt.UnwrapErr()));
        }
        const std::vector<uint8_t> info = RekeyInfo(session_id);
        const std::vector<uint8_t>& salt_bytes = salt.Unwrap();
        if (auto completed = keys.CompleteSymmetricKeyRenegotiation(
                session_id, secret, info, std::span<const uint8_t>(salt_bytes));
            completed.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(FromKeyManager(completed.UnwrapErr()));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<PayloadProtection, HandshakeFailure> HandshakeProtocol::Propagate(const std::string& session_id) {
        return sessions_.PropagateKeyToTransport(session_id).MapErr([](SessionFailure&& failure) {
            return HandshakeFailure::FromSessionFailure(failure);
        });
    }

    bool HandshakeProtocol::NeedsRenegotiation(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        return pending_rekey_.contains(session_id);
    }

    void HandshakeProtocol::Forget(const std::string& session_id) {
        std::lock_guard guard(lock_);
        tokens_.erase(session_id);
        pending_rekey_.erase(session_id);
    }

    std::optional<std::string> HandshakeProtocol::TokenFor(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        if (const auto it = tokens_.find(session_id); it != tokens_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void HandshakeProtocol::BindToken(const std::string& session_id, const std::string& connection_token) {
        std::lock_guard guard(lock_);
        tokens_[session_id] = connection_token;
    }

    void HandshakeProtocol::OnKeyRotated(const std::string& session_id, std::span<const uint8_t> new_public_key) {
        std::lock_guard guard(lock_);
        pending_rekey_.insert(session_id);
        logging::Get()->info("Session {}: key pair rotated ({} byte public key), renegotiation pending",
                             session_id, new_public_key.size());
    }

    void HandshakeProtocol::OnRenegotiationStarted(const std::string& session_id, std::span<const uint8_t>) {
        logging::Get()->debug("Session {}: renegotiation staged", session_id);
    }

    void HandshakeProtocol::OnRenegotiationCompleted(const std::string& session_id) {
        std::lock_guard guard(lock_);
        pending_rekey_.erase(session_id);
        logging::Get()->info("Session {}: symmetric key renegotiated", session_id);
    }
}

#include "airlink/session/secure_session_manager.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/crypto/scoped_wipe.hpp"
#include <algorithm>
#include <format>
#include <thread>

namespace airlink::session {
    using crypto::CryptoPrimitives;
    using crypto::ScopedWipe;

    namespace {
        SessionFailure NotFound(const std::string& session_id) {
            return SessionFailure::SessionNotFound(std::format("Session not found: {}", session_id));
        }

        EncryptedPayload PassthroughPayload(std::span<const uint8_t> data) {
            EncryptedPayload payload;
            payload.ciphertext.assign(data.begin(), data.end());
            payload.iv.assign(kAesGcmNonceBytes, 0);
            payload.tag.assign(kAesGcmTagBytes, 0);
            return payload;
        }
    }

    Result<std::unique_ptr<SecureSessionManager>, SessionFailure> SecureSessionManager::Create(
        KeyManager& key_manager,
        std::shared_ptr<ITransport> transport,
        SessionConfig config) {
        if (!transport) {
            return Result<std::unique_ptr<SecureSessionManager>, SessionFailure>::Err(
                SessionFailure::NotReady("A transport is required"));
        }
        return Result<std::unique_ptr<SecureSessionManager>, SessionFailure>::Ok(
            std::unique_ptr<SecureSessionManager>(
                new SecureSessionManager(key_manager, std::move(transport), std::move(config))));
    }

    SecureSessionManager::SecureSessionManager(
        KeyManager& key_manager,
        std::shared_ptr<ITransport> transport,
        SessionConfig config)
        : key_manager_(key_manager)
          , transport_(std::move(transport))
          , config_(std::move(config)) {
    }

    SecureSessionManager::~SecureSessionManager() {
        std::lock_guard guard(lock_);
        for (const auto& [session_id, session] : sessions_) {
            key_manager_.EndSession(session_id);
        }
        sessions_.clear();
    }

    void SecureSessionManager::SetEventHandler(std::shared_ptr<ISessionEventHandler> handler) {
        std::lock_guard guard(lock_);
        event_handler_ = std::move(handler);
    }

    std::shared_ptr<ISessionEventHandler> SecureSessionManager::Handler() const {
        std::lock_guard guard(lock_);
        return event_handler_;
    }

    Result<std::vector<uint8_t>, SessionFailure> SecureSessionManager::CreateSession(
        const std::string& session_id,
        const std::string& device_id,
        std::optional<std::string> connection_token,
        std::optional<std::string> connection_method) {
        {
            std::lock_guard guard(lock_);
            if (sessions_.contains(session_id)) {
                return Result<std::vector<uint8_t>, SessionFailure>::Err(
                    SessionFailure::SessionExists(std::format("Session already exists: {}", session_id)));
            }
        }
        auto key_result = key_manager_.GenerateEphemeralKeyPair(session_id);
        if (key_result.IsErr()) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(
                SessionFailure::FromKeyManagerFailure(key_result.UnwrapErr()));
        }
        std::vector<uint8_t> public_key = std::move(key_result).Unwrap();

        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            SecureSession session;
            session.session_id = session_id;
            session.device_id = device_id;
            session.created_at = std::chrono::steady_clock::now();
            session.connection_token = std::move(connection_token);
            session.connection_method = std::move(connection_method);
            sessions_.insert_or_assign(session_id, std::move(session));
            handler = event_handler_;
        }
        logging::Get()->info("Secure session {} created for device {}", session_id, device_id);
        if (handler) {
            handler->OnSessionCreated(session_id, device_id);
        }
        return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(public_key));
    }

    bool SecureSessionManager::HasSession(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        return sessions_.contains(session_id);
    }

    Option<SecureSession> SecureSessionManager::GetSession(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Result<std::vector<uint8_t>, SessionFailure> SecureSessionManager::GetLocalPublicKey(
        const std::string& session_id) const {
        if (!HasSession(session_id)) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(NotFound(session_id));
        }
        // Rotation and renegotiation replace the pair in KeyManager; never cache it here.
        Option<std::vector<uint8_t>> public_key = key_manager_.GetPublicKey(session_id);
        if (!public_key.has_value()) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(
                SessionFailure::NotReady(std::format("No key pair for session {}", session_id)));
        }
        return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(*public_key));
    }

    void SecureSessionManager::SetNativeConnectionInfo(
        const std::string& session_id,
        const std::string& connection_token,
        const std::string& connection_method) {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        it->second.connection_token = connection_token;
        it->second.connection_method = connection_method;
        logging::Get()->debug("Session {} bound to {} connection", session_id, connection_method);
    }

    Result<Unit, SessionFailure> SecureSessionManager::CompleteHandshake(
        const std::string& session_id,
        std::span<const uint8_t> remote_public_key) {
        auto local_key_result = GetLocalPublicKey(session_id);
        if (local_key_result.IsErr()) {
            return Result<Unit, SessionFailure>::Err(std::move(local_key_result).UnwrapErr());
        }
        const std::vector<uint8_t> local_public_key = std::move(local_key_result).Unwrap();

        auto secret_result = key_manager_.ComputeSharedSecret(session_id, remote_public_key);
        if (secret_result.IsErr()) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::FromKeyManagerFailure(secret_result.UnwrapErr()));
        }
        std::vector<uint8_t> shared_secret = std::move(secret_result).Unwrap();
        ScopedWipe wipe_secret(shared_secret);

        auto derived_result = CryptoPrimitives::DeriveSessionKey(
            shared_secret, session_id, local_public_key, remote_public_key);
        if (derived_result.IsErr()) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::FromCryptoFailure(derived_result.UnwrapErr()));
        }
        std::vector<uint8_t> session_key = std::move(derived_result).Unwrap();
        ScopedWipe wipe_key(session_key);

        if (auto store_result = key_manager_.SetSymmetricKey(session_id, session_key); store_result.IsErr()) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::FromKeyManagerFailure(store_result.UnwrapErr()));
        }

        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return Result<Unit, SessionFailure>::Err(NotFound(session_id));
            }
            it->second.remote_public_key = std::vector<uint8_t>(remote_public_key.begin(), remote_public_key.end());
            it->second.is_handshake_complete = true;
            it->second.native_key_verified = false;
            handler = event_handler_;
        }
        logging::Get()->info("Handshake completed for session {}", session_id);
        if (handler) {
            handler->OnHandshakeCompleted(session_id);
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    std::vector<uint8_t> SecureSessionManager::NativeVerificationPayload() {
        std::vector<uint8_t> payload(kNativeVerifyPayloadBytes);
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<uint8_t>((i * kNativeVerifyMultiplier + kNativeVerifyOffset) & 0xFF);
        }
        return payload;
    }

    bool SecureSessionManager::VerifyNativeKey(
        const std::string& session_id,
        const std::string& connection_token) {
        const std::vector<uint8_t> expected = NativeVerificationPayload();
        const auto deadline = std::chrono::steady_clock::now() + config_.GetVerificationTimeout();
        const uint32_t attempts = config_.GetVerificationAttempts();

        for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
            if (std::chrono::steady_clock::now() >= deadline) {
                logging::Get()->warn("Native key verification for session {} timed out", session_id);
                return false;
            }
            if (const auto response = transport_->VerifyEncryptionKey(connection_token, expected)) {
                const EncryptedPayload payload{
                    .ciphertext = response->ciphertext,
                    .tag = response->tag,
                    .iv = response->iv,
                };
                auto decrypted = key_manager_.DecryptWithSessionKey(session_id, payload);
                if (decrypted.IsOk() && CryptoPrimitives::ConstantTimeEquals(decrypted.Unwrap(), expected)) {
                    return true;
                }
                logging::Get()->warn("Native key verification attempt {} for session {} did not match",
                                     attempt, session_id);
            } else {
                logging::Get()->warn("Native key verification attempt {} for session {} got no answer",
                                     attempt, session_id);
            }
            if (attempt < attempts) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                std::this_thread::sleep_for(std::clamp(
                    remaining, std::chrono::milliseconds(0), config_.GetVerificationBackoff()));
            }
        }
        return false;
    }

    Result<PayloadProtection, SessionFailure> SecureSessionManager::PropagateKeyToTransport(
        const std::string& session_id) {
        std::optional<std::string> token;
        std::string method;
        {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return Result<PayloadProtection, SessionFailure>::Err(NotFound(session_id));
            }
            if (!it->second.IsReady()) {
                return Result<PayloadProtection, SessionFailure>::Err(
                    SessionFailure::NotReady(std::format("Handshake not complete for session: {}", session_id)));
            }
            token = it->second.connection_token;
            method = it->second.connection_method.value_or("");
        }

        if (!config_.GetRequireEncryption()) {
            return Result<PayloadProtection, SessionFailure>::Ok(PayloadProtection::Passthrough);
        }
        const EncryptionMode mode = config_.GetEncryptionMode();
        if (mode == EncryptionMode::Local) {
            return Result<PayloadProtection, SessionFailure>::Ok(PayloadProtection::Local);
        }

        const auto fallback = [&](const std::string& reason) {
            if (mode == EncryptionMode::Native) {
                return Result<PayloadProtection, SessionFailure>::Err(SessionFailure::NativeKeyRejected(reason));
            }
            logging::Get()->warn("Session {}: {}; encrypting locally", session_id, reason);
            return Result<PayloadProtection, SessionFailure>::Ok(PayloadProtection::Local);
        };

        if (!transport_->GetCapabilities(method).encryption_offload) {
            return fallback(std::format("transport '{}' does not offload encryption", method));
        }
        if (!token.has_value() || token->empty()) {
            return fallback("no connection token to bind the key to");
        }

        Option<std::vector<uint8_t>> key = key_manager_.GetSymmetricKey(session_id);
        if (!key.has_value()) {
            return Result<PayloadProtection, SessionFailure>::Err(
                SessionFailure::NotReady(std::format("No session key for {}", session_id)));
        }
        bool accepted = false;
        {
            ScopedWipe wipe_key(*key);
            accepted = transport_->SetEncryptionKey(*token, *key);
        }
        if (!accepted) {
            return fallback("transport refused the session key");
        }

        const bool verified = VerifyNativeKey(session_id, *token);
        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            if (const auto it = sessions_.find(session_id); it != sessions_.end()) {
                it->second.native_key_verified = verified;
            }
            handler = event_handler_;
        }
        if (handler) {
            handler->OnKeyPropagated(session_id, verified);
        }
        if (!verified) {
            return fallback("native key verification failed");
        }
        logging::Get()->info("Session {} key offloaded to {} transport", session_id, method);
        return Result<PayloadProtection, SessionFailure>::Ok(PayloadProtection::Native);
    }

    std::vector<uint8_t> SecureSessionManager::VerificationAad(const std::string& session_id) {
        std::vector<uint8_t> aad(kVerifyAadPrefix.begin(), kVerifyAadPrefix.end());
        aad.insert(aad.end(), session_id.begin(), session_id.end());
        return aad;
    }

    Result<VerificationPayload, SessionFailure> SecureSessionManager::GenerateVerificationPayload(
        const std::string& session_id) {
        if (auto ready = RequireReady(session_id); ready.IsErr()) {
            return Result<VerificationPayload, SessionFailure>::Err(std::move(ready).UnwrapErr());
        }
        const std::vector<uint8_t> aad = VerificationAad(session_id);
        const std::vector<uint8_t> plaintext(kVerifyPlaintext.begin(), kVerifyPlaintext.end());
        auto sealed = key_manager_.EncryptWithSessionKey(session_id, plaintext, aad);
        if (sealed.IsErr()) {
            return Result<VerificationPayload, SessionFailure>::Err(
                SessionFailure::FromKeyManagerFailure(sealed.UnwrapErr()));
        }
        EncryptedPayload payload = std::move(sealed).Unwrap();
        return Result<VerificationPayload, SessionFailure>::Ok(VerificationPayload{
            .aad = aad,
            .iv = std::move(payload.iv),
            .tag = std::move(payload.tag),
            .ciphertext = std::move(payload.ciphertext),
        });
    }

    bool SecureSessionManager::VerifyIncomingPayload(
        const std::string& session_id,
        const VerificationPayload& payload) const {
        if (RequireReady(session_id).IsErr()) {
            return false;
        }
        if (!CryptoPrimitives::ConstantTimeEquals(payload.aad, VerificationAad(session_id))) {
            logging::Get()->warn("Verify payload for session {} carries a foreign AAD", session_id);
            return false;
        }
        const EncryptedPayload sealed{
            .ciphertext = payload.ciphertext,
            .tag = payload.tag,
            .iv = payload.iv,
        };
        auto opened = key_manager_.DecryptWithSessionKey(session_id, sealed, payload.aad);
        if (opened.IsErr()) {
            logging::Get()->warn("Verify payload for session {} failed to decrypt: {}",
                                 session_id, opened.UnwrapErr().message);
            return false;
        }
        const std::vector<uint8_t> expected(kVerifyPlaintext.begin(), kVerifyPlaintext.end());
        return CryptoPrimitives::ConstantTimeEquals(opened.Unwrap(), expected);
    }

    Result<Unit, SessionFailure> SecureSessionManager::RequireReady(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return Result<Unit, SessionFailure>::Err(NotFound(session_id));
        }
        if (!it->second.IsReady()) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::NotReady(std::format("Handshake not complete for session: {}", session_id)));
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    PayloadProtection SecureSessionManager::ProtectionLocked(const SecureSession& session) const {
        if (!config_.GetRequireEncryption()) {
            return PayloadProtection::Passthrough;
        }
        if (session.native_key_verified && config_.GetEncryptionMode() != EncryptionMode::Local) {
            return PayloadProtection::Native;
        }
        return PayloadProtection::Local;
    }

    PayloadProtection SecureSessionManager::GetPayloadProtection(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return config_.GetRequireEncryption() ? PayloadProtection::Local : PayloadProtection::Passthrough;
        }
        return ProtectionLocked(it->second);
    }

    bool SecureSessionManager::UsesLocalEncryption(const std::string& session_id) const {
        return GetPayloadProtection(session_id) == PayloadProtection::Local;
    }

    Result<EncryptedPayload, SessionFailure> SecureSessionManager::EncryptData(
        const std::string& session_id,
        std::span<const uint8_t> data,
        std::span<const uint8_t> aad) {
        if (auto ready = RequireReady(session_id); ready.IsErr()) {
            return Result<EncryptedPayload, SessionFailure>::Err(std::move(ready).UnwrapErr());
        }
        if (GetPayloadProtection(session_id) != PayloadProtection::Local) {
            return Result<EncryptedPayload, SessionFailure>::Ok(PassthroughPayload(data));
        }
        return key_manager_.EncryptWithSessionKey(session_id, data, aad)
            .MapErr([](const KeyManagerFailure& failure) { return SessionFailure::FromKeyManagerFailure(failure); });
    }

    Result<std::vector<uint8_t>, SessionFailure> SecureSessionManager::DecryptData(
        const std::string& session_id,
        const EncryptedPayload& payload,
        std::span<const uint8_t> aad) const {
        if (auto ready = RequireReady(session_id); ready.IsErr()) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(std::move(ready).UnwrapErr());
        }
        if (GetPayloadProtection(session_id) != PayloadProtection::Local) {
            return Result<std::vector<uint8_t>, SessionFailure>::Ok(payload.ciphertext);
        }
        return key_manager_.DecryptWithSessionKey(session_id, payload, aad)
            .MapErr([](const KeyManagerFailure& failure) { return SessionFailure::FromKeyManagerFailure(failure); });
    }

    void SecureSessionManager::EndSession(const std::string& session_id) {
        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            if (sessions_.erase(session_id) == 0) {
                return;
            }
            handler = event_handler_;
        }
        key_manager_.EndSession(session_id);
        logging::Get()->info("Secure session {} ended", session_id);
        if (handler) {
            handler->OnSessionEnded(session_id);
        }
    }

    void SecureSessionManager::EndAllSessions() {
        for (const auto& session_id : GetActiveSessions()) {
            EndSession(session_id);
        }
        key_manager_.EndAllSessions();
    }

    size_t SecureSessionManager::GetActiveSessionCount() const {
        std::lock_guard guard(lock_);
        return sessions_.size();
    }

    std::vector<std::string> SecureSessionManager::GetActiveSessions() const {
        std::lock_guard guard(lock_);
        std::vector<std::string> ids;
        ids.reserve(sessions_.size());
        for (const auto& [session_id, session] : sessions_) {
            ids.push_back(session_id);
        }
        return ids;
    }

    size_t SecureSessionManager::CleanupExpiredSessions(std::optional<std::chrono::milliseconds> max_age) {
        key_manager_.CleanupExpiredSessions(max_age);
        std::vector<std::string> expired;
        std::shared_ptr<ISessionEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            for (auto it = sessions_.begin(); it != sessions_.end();) {
                if (!key_manager_.HasSession(it->first)) {
                    expired.push_back(it->first);
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
            handler = event_handler_;
        }
        if (handler) {
            for (const auto& session_id : expired) {
                handler->OnSessionEnded(session_id);
            }
        }
        return expired.size();
    }

    KeyManager& SecureSessionManager::GetKeyManager() noexcept {
        return key_manager_;
    }

    const SessionConfig& SecureSessionManager::GetConfig() const noexcept {
        return config_;
    }
}

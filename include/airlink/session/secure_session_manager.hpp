#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/option.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/configuration/session_config.hpp"
#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/interfaces/i_session_event_handler.hpp"
#include "airlink/interfaces/i_transport.hpp"
#include "airlink/security/key_manager.hpp"
#include "airlink/session/secure_session.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>
namespace airlink::session {
using configuration::EncryptionMode;
using configuration::SessionConfig;
using crypto::EncryptedPayload;
using interfaces::ISessionEventHandler;
using interfaces::ITransport;
using security::KeyManager;

/**
 * @brief Secure sessions on top of KeyManager
 *
 * Owns the handshake completion step (ECDH plus symmetric-salt derivation),
 * the verify challenge, and the decision whether payload encryption runs
 * locally or inside the transport.
 *
 * A session accepts EncryptData/DecryptData only once it is ready: the
 * handshake completed and the peer public key is recorded.
 */
class SecureSessionManager {
public:
    [[nodiscard]] static Result<std::unique_ptr<SecureSessionManager>, SessionFailure> Create(
        KeyManager& key_manager,
        std::shared_ptr<ITransport> transport,
        SessionConfig config = SessionConfig::Default());

    void SetEventHandler(std::shared_ptr<ISessionEventHandler> handler);

    /// Generates the session key pair. Returns the local public key.
    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> CreateSession(
        const std::string& session_id,
        const std::string& device_id,
        std::optional<std::string> connection_token = std::nullopt,
        std::optional<std::string> connection_method = std::nullopt);

    [[nodiscard]] bool HasSession(const std::string& session_id) const;

    [[nodiscard]] Option<SecureSession> GetSession(const std::string& session_id) const;

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> GetLocalPublicKey(
        const std::string& session_id) const;

    void SetNativeConnectionInfo(
        const std::string& session_id,
        const std::string& connection_token,
        const std::string& connection_method);

    /**
     * @brief Derive and store the session key from the peer public key
     *
     * Uses CryptoPrimitives::DeriveSessionKey, so both peers reach the same
     * key whichever of them initiated.
     */
    [[nodiscard]] Result<Unit, SessionFailure> CompleteHandshake(
        const std::string& session_id,
        std::span<const uint8_t> remote_public_key);

    /**
     * @brief Hand the session key to the transport when policy and capability allow
     *
     * After a successful SetEncryptionKey the transport is asked to encrypt a
     * known 32-byte payload; the answer must decrypt under the session key.
     * Up to verification_attempts tries, verification_backoff apart, all
     * within verification_timeout.
     *
     * @return PayloadProtection in force afterwards. Native mode fails with
     *         NativeKeyRejected instead of falling back to Local.
     */
    [[nodiscard]] Result<PayloadProtection, SessionFailure> PropagateKeyToTransport(
        const std::string& session_id);

    /// Encrypts "ok" under the session key with AAD "airlink/verify:<id>".
    [[nodiscard]] Result<VerificationPayload, SessionFailure> GenerateVerificationPayload(
        const std::string& session_id);

    /// True only when @p payload decrypts to "ok" with the expected AAD.
    [[nodiscard]] bool VerifyIncomingPayload(
        const std::string& session_id,
        const VerificationPayload& payload) const;

    [[nodiscard]] Result<EncryptedPayload, SessionFailure> EncryptData(
        const std::string& session_id,
        std::span<const uint8_t> data,
        std::span<const uint8_t> aad = {});

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> DecryptData(
        const std::string& session_id,
        const EncryptedPayload& payload,
        std::span<const uint8_t> aad = {}) const;

    [[nodiscard]] PayloadProtection GetPayloadProtection(const std::string& session_id) const;

    [[nodiscard]] bool UsesLocalEncryption(const std::string& session_id) const;

    void EndSession(const std::string& session_id);

    void EndAllSessions();

    [[nodiscard]] size_t GetActiveSessionCount() const;

    [[nodiscard]] std::vector<std::string> GetActiveSessions() const;

    /// Expires key material through KeyManager and drops the matching sessions.
    size_t CleanupExpiredSessions(std::optional<std::chrono::milliseconds> max_age = std::nullopt);

    [[nodiscard]] KeyManager& GetKeyManager() noexcept;

    [[nodiscard]] const SessionConfig& GetConfig() const noexcept;

    SecureSessionManager(const SecureSessionManager&) = delete;
    SecureSessionManager& operator=(const SecureSessionManager&) = delete;
    SecureSessionManager(SecureSessionManager&&) = delete;
    SecureSessionManager& operator=(SecureSessionManager&&) = delete;
    ~SecureSessionManager();

private:
    SecureSessionManager(KeyManager& key_manager, std::shared_ptr<ITransport> transport, SessionConfig config);

    [[nodiscard]] static std::vector<uint8_t> NativeVerificationPayload();

    [[nodiscard]] static std::vector<uint8_t> VerificationAad(const std::string& session_id);

    [[nodiscard]] bool VerifyNativeKey(
        const std::string& session_id,
        const std::string& connection_token);

    [[nodiscard]] Result<Unit, SessionFailure> RequireReady(const std::string& session_id) const;

    [[nodiscard]] PayloadProtection ProtectionLocked(const SecureSession& session) const;

    [[nodiscard]] std::shared_ptr<ISessionEventHandler> Handler() const;

    KeyManager& key_manager_;
    std::shared_ptr<ITransport> transport_;
    SessionConfig config_;
    mutable std::mutex lock_;
    std::unordered_map<std::string, SecureSession> sessions_;
    std::shared_ptr<ISessionEventHandler> event_handler_;
};
}

#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/option.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/configuration/key_rotation_config.hpp"
#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/crypto/secure_memory_handle.hpp"
#include "airlink/interfaces/i_key_event_handler.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
namespace airlink::security {
using configuration::KeyRotationConfig;
using crypto::EncryptedPayload;
using crypto::KeyPair;
using crypto::SecureMemoryHandle;
using interfaces::IKeyEventHandler;

enum class KeySessionState : uint8_t {
    None,
    Keyed,
    SymmetricKeyed,
    Rotating,
    Ended
};

struct KeyManagerStats {
    size_t active_sessions = 0;
    size_t sessions_with_symmetric_key = 0;
    size_t pending_renegotiations = 0;
};

struct KeyRotationStatus {
    std::chrono::milliseconds age{0};
    uint32_t usage_count = 0;
    bool should_rotate = false;
    bool renegotiating = false;
};

/**
 * @brief Per-session ephemeral key pairs and symmetric keys
 *
 * Lifecycle per session id: None -> Keyed -> SymmetricKeyed -> Rotating -> Ended.
 * Rotating is the window between StartSymmetricKeyRenegotiation() and
 * CompleteSymmetricKeyRenegotiation(); the old key stays usable during it.
 *
 * Symmetric keys live in sodium_malloc'd handles. EndSession() zeroes them
 * in place before releasing, so no copy of a retired key survives.
 *
 * Events are delivered to the handler after the internal lock is released.
 */
class KeyManager {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    [[nodiscard]] static Result<std::unique_ptr<KeyManager>, KeyManagerFailure> Create(
        KeyRotationConfig config = KeyRotationConfig::Default(),
        Clock clock = {});

    void SetEventHandler(std::shared_ptr<IKeyEventHandler> handler);

    /// Creates the session entry. Returns the new public key.
    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> GenerateEphemeralKeyPair(
        const std::string& session_id);

    [[nodiscard]] Result<Unit, KeyManagerFailure> DeriveAndStoreSymmetricKey(
        const std::string& session_id,
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> info,
        Option<std::span<const uint8_t>> salt = std::nullopt);

    [[nodiscard]] Result<Unit, KeyManagerFailure> SetSymmetricKey(
        const std::string& session_id,
        std::span<const uint8_t> symmetric_key);

    [[nodiscard]] Option<std::vector<uint8_t>> GetSymmetricKey(const std::string& session_id) const;

    [[nodiscard]] Option<std::vector<uint8_t>> GetPublicKey(const std::string& session_id) const;

    /// ECDH between the session's current private key and @p remote_public_key.
    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> ComputeSharedSecret(
        const std::string& session_id,
        std::span<const uint8_t> remote_public_key) const;

    [[nodiscard]] Result<EncryptedPayload, KeyManagerFailure> EncryptWithSessionKey(
        const std::string& session_id,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad = {});

    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> DecryptWithSessionKey(
        const std::string& session_id,
        const EncryptedPayload& payload,
        std::span<const uint8_t> aad = {}) const;

    [[nodiscard]] bool ShouldRotateKey(const std::string& session_id) const;

    /**
     * @brief Replace the session key pair, keeping the symmetric key
     *
     * The old private key is released (sodium_free zeroes it), the usage
     * counter and key age restart, and OnKeyRotated() fires with the new
     * public key.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> RotateSessionKey(
        const std::string& session_id);

    /// Stage a fresh pair for a new symmetric key. Returns the staged public key.
    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> StartSymmetricKeyRenegotiation(
        const std::string& session_id);

    /// ECDH between the staged private key and the peer's staged public key.
    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> ComputeRenegotiationSecret(
        const std::string& session_id,
        std::span<const uint8_t> remote_public_key) const;

    [[nodiscard]] Option<std::vector<uint8_t>> GetStagedPublicKey(const std::string& session_id) const;

    /**
     * @brief Swap in the key derived from @p new_shared_secret
     *
     * The previous symmetric key is zeroed in place, the staged pair becomes
     * the session pair, and staging is cleared.
     */
    [[nodiscard]] Result<Unit, KeyManagerFailure> CompleteSymmetricKeyRenegotiation(
        const std::string& session_id,
        std::span<const uint8_t> new_shared_secret,
        std::span<const uint8_t> info,
        Option<std::span<const uint8_t>> salt = std::nullopt);

    /// Abandon a staged renegotiation; the current key stays in force.
    void CancelSymmetricKeyRenegotiation(const std::string& session_id);

    void EndSession(const std::string& session_id);

    void EndAllSessions();

    /// Ends every session older than @p max_age. Returns how many were ended.
    size_t CleanupExpiredSessions(std::optional<std::chrono::milliseconds> max_age = std::nullopt);

    [[nodiscard]] bool HasSession(const std::string& session_id) const;

    [[nodiscard]] KeySessionState GetState(const std::string& session_id) const;

    [[nodiscard]] KeyManagerStats GetStats() const;

    [[nodiscard]] Option<KeyRotationStatus> GetKeyRotationStatus(const std::string& session_id) const;

#ifdef AIRLINK_TEST_BUILD
    [[nodiscard]] std::shared_ptr<const SecureMemoryHandle> DebugSymmetricKeyHandle(
        const std::string& session_id) const;
#endif

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    KeyManager(KeyManager&&) = delete;
    KeyManager& operator=(KeyManager&&) = delete;
    ~KeyManager();

private:
    struct SessionKeyEntry {
        KeyPair key_pair;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point key_created_at;
        uint32_t usage_count = 0;
        std::shared_ptr<SecureMemoryHandle> symmetric_key;
        std::optional<KeyPair> staged_pair;
        KeySessionState state = KeySessionState::Keyed;
    };

    KeyManager(KeyRotationConfig config, Clock clock);

    [[nodiscard]] std::chrono::steady_clock::time_point Now() const;

    [[nodiscard]] static Result<std::shared_ptr<SecureMemoryHandle>, KeyManagerFailure> SealKey(
        std::span<const uint8_t> key_bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, KeyManagerFailure> ReadKey(
        const SecureMemoryHandle& handle);

    static void RetireKey(std::shared_ptr<SecureMemoryHandle>& handle) noexcept;

    static void RetireEntry(SessionKeyEntry& entry) noexcept;

    [[nodiscard]] bool ShouldRotateLocked(const SessionKeyEntry& entry) const;

    [[nodiscard]] Result<std::vector<uint8_t>, KeyManagerFailure> RotateLocked(
        const std::string& session_id,
        SessionKeyEntry& entry);

    [[nodiscard]] std::shared_ptr<IKeyEventHandler> Handler() const;

    KeyRotationConfig config_;
    Clock clock_;
    mutable std::mutex lock_;
    std::unordered_map<std::string, SessionKeyEntry> sessions_;
    std::unordered_set<std::string> ended_sessions_;
    std::shared_ptr<IKeyEventHandler> event_handler_;
};
}

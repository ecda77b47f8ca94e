#include "airlink/security/key_manager.hpp"
#include "airlink/core/constants.hpp"
#include "airlink/core/logging.hpp"
#include "airlink/crypto/scoped_wipe.hpp"
#include <format>

namespace airlink::security {
    using crypto::CryptoPrimitives;
    using crypto::ScopedWipe;

    namespace {
        std::string_view StateName(const KeySessionState state) {
            switch (state) {
                case KeySessionState::None: return "none";
                case KeySessionState::Keyed: return "keyed";
                case KeySessionState::SymmetricKeyed: return "symmetric-keyed";
                case KeySessionState::Rotating: return "rotating";
                case KeySessionState::Ended: return "ended";
            }
            return "unknown";
        }
    }

    Result<std::unique_ptr<KeyManager>, KeyManagerFailure> KeyManager::Create(
        KeyRotationConfig config,
        Clock clock) {
        if (!clock) {
            clock = [] { return std::chrono::steady_clock::now(); };
        }
        return Result<std::unique_ptr<KeyManager>, KeyManagerFailure>::Ok(
            std::unique_ptr<KeyManager>(new KeyManager(std::move(config), std::move(clock))));
    }

    KeyManager::KeyManager(KeyRotationConfig config, Clock clock)
        : config_(std::move(config))
          , clock_(std::move(clock)) {
    }

    KeyManager::~KeyManager() {
        EndAllSessions();
    }

    void KeyManager::SetEventHandler(std::shared_ptr<IKeyEventHandler> handler) {
        std::lock_guard guard(lock_);
        event_handler_ = std::move(handler);
    }

    std::shared_ptr<IKeyEventHandler> KeyManager::Handler() const {
        std::lock_guard guard(lock_);
        return event_handler_;
    }

    std::chrono::steady_clock::time_point KeyManager::Now() const {
        return clock_();
    }

    Result<std::shared_ptr<SecureMemoryHandle>, KeyManagerFailure> KeyManager::SealKey(
        std::span<const uint8_t> key_bytes) {
        if (key_bytes.size() != kSessionKeyBytes) {
            return Result<std::shared_ptr<SecureMemoryHandle>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromCryptoFailure(CryptoFailure::InvalidKeyLength(
                    std::format("Session key must be {} bytes, got {}", kSessionKeyBytes, key_bytes.size()))));
        }
        auto alloc_result = SecureMemoryHandle::Allocate(kSessionKeyBytes);
        if (alloc_result.IsErr()) {
            return Result<std::shared_ptr<SecureMemoryHandle>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromSodiumFailure(alloc_result.UnwrapErr()));
        }
        auto handle = std::make_shared<SecureMemoryHandle>(std::move(alloc_result).Unwrap());
        if (auto write_result = handle->Write(key_bytes); write_result.IsErr()) {
            return Result<std::shared_ptr<SecureMemoryHandle>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return Result<std::shared_ptr<SecureMemoryHandle>, KeyManagerFailure>::Ok(std::move(handle));
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::ReadKey(const SecureMemoryHandle& handle) {
        auto read_result = handle.ReadBytes(handle.Size());
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, KeyManagerFailure>::Ok(std::move(read_result).Unwrap());
    }

    void KeyManager::RetireKey(std::shared_ptr<SecureMemoryHandle>& handle) noexcept {
        if (handle) {
            handle->Wipe();
            handle.reset();
        }
    }

    void KeyManager::RetireEntry(SessionKeyEntry& entry) noexcept {
        RetireKey(entry.symmetric_key);
        entry.key_pair.private_key.Wipe();
        if (entry.staged_pair.has_value()) {
            entry.staged_pair->private_key.Wipe();
            entry.staged_pair.reset();
        }
        entry.state = KeySessionState::Ended;
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::GenerateEphemeralKeyPair(
        const std::string& session_id) {
        auto pair_result = CryptoPrimitives::GenerateKeyPair(kPurposeEphemeral);
        if (pair_result.IsErr()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromCryptoFailure(pair_result.UnwrapErr()));
        }
        KeyPair pair = std::move(pair_result).Unwrap();
        std::vector<uint8_t> public_key = pair.public_key;

        std::lock_guard guard(lock_);
        if (const auto it = sessions_.find(session_id); it != sessions_.end()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::InvalidState(
                    std::format("Session {} already holds a key pair ({})",
                                session_id, StateName(it->second.state))));
        }
        const auto now = Now();
        SessionKeyEntry entry{
            .key_pair = std::move(pair),
            .created_at = now,
            .key_created_at = now,
        };
        sessions_.emplace(session_id, std::move(entry));
        ended_sessions_.erase(session_id);
        logging::Get()->debug("Key pair generated for session {}", session_id);
        return Result<std::vector<uint8_t>, KeyManagerFailure>::Ok(std::move(public_key));
    }

    Result<Unit, KeyManagerFailure> KeyManager::DeriveAndStoreSymmetricKey(
        const std::string& session_id,
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> info,
        Option<std::span<const uint8_t>> salt) {
        auto derived_result = CryptoPrimitives::Hkdf(shared_secret, info, salt);
        if (derived_result.IsErr()) {
            return Result<Unit, KeyManagerFailure>::Err(
                KeyManagerFailure::FromCryptoFailure(derived_result.UnwrapErr()));
        }
        std::vector<uint8_t> derived = std::move(derived_result).Unwrap();
        ScopedWipe wipe_derived(derived);
        return SetSymmetricKey(session_id, derived);
    }

    Result<Unit, KeyManagerFailure> KeyManager::SetSymmetricKey(
        const std::string& session_id,
        std::span<const uint8_t> symmetric_key) {
        auto sealed_result = SealKey(symmetric_key);
        if (sealed_result.IsErr()) {
            return Result<Unit, KeyManagerFailure>::Err(std::move(sealed_result).UnwrapErr());
        }
        auto sealed = std::move(sealed_result).Unwrap();

        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return Result<Unit, KeyManagerFailure>::Err(
                KeyManagerFailure::SessionNotFound(std::format("No key entry for session {}", session_id)));
        }
        SessionKeyEntry& entry = it->second;
        if (entry.state != KeySessionState::Keyed && entry.state != KeySessionState::SymmetricKeyed) {
            return Result<Unit, KeyManagerFailure>::Err(
                KeyManagerFailure::InvalidState(
                    std::format("Cannot store a symmetric key for session {} in state {}",
                                session_id, StateName(entry.state))));
        }
        RetireKey(entry.symmetric_key);
        entry.symmetric_key = std::move(sealed);
        entry.state = KeySessionState::SymmetricKeyed;
        entry.usage_count = 0;
        entry.key_created_at = Now();
        logging::Get()->debug("Symmetric key stored for session {}", session_id);
        return Result<Unit, KeyManagerFailure>::Ok(unit);
    }

    Option<std::vector<uint8_t>> KeyManager::GetSymmetricKey(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end() || !it->second.symmetric_key) {
            return std::nullopt;
        }
        auto key_result = ReadKey(*it->second.symmetric_key);
        if (key_result.IsErr()) {
            return std::nullopt;
        }
        return std::move(key_result).Unwrap();
    }

    Option<std::vector<uint8_t>> KeyManager::GetPublicKey(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second.key_pair.public_key;
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::ComputeSharedSecret(
        const std::string& session_id,
        std::span<const uint8_t> remote_public_key) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::SessionNotFound(std::format("No key entry for session {}", session_id)));
        }
        return CryptoPrimitives::ComputeSharedSecret(it->second.key_pair.private_key, remote_public_key)
            .MapErr([](const CryptoFailure& failure) { return KeyManagerFailure::FromCryptoFailure(failure); });
    }

    Result<EncryptedPayload, KeyManagerFailure> KeyManager::EncryptWithSessionKey(
        const std::string& session_id,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad) {
        Option<std::vector<uint8_t>> rotated_public_key;
        std::shared_ptr<IKeyEventHandler> handler;
        Result<EncryptedPayload, KeyManagerFailure> outcome = [&]() {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end() || !it->second.symmetric_key) {
                return Result<EncryptedPayload, KeyManagerFailure>::Err(
                    KeyManagerFailure::NoSessionKey(std::format("No symmetric key for session {}", session_id)));
            }
            SessionKeyEntry& entry = it->second;
            if (config_.GetAutoRotateOnEncrypt()
                && entry.state == KeySessionState::SymmetricKeyed
                && ShouldRotateLocked(entry)) {
                auto rotate_result = RotateLocked(session_id, entry);
                if (rotate_result.IsErr()) {
                    return Result<EncryptedPayload, KeyManagerFailure>::Err(std::move(rotate_result).UnwrapErr());
                }
                rotated_public_key = std::move(rotate_result).Unwrap();
                handler = event_handler_;
            }
            auto key_result = ReadKey(*entry.symmetric_key);
            if (key_result.IsErr()) {
                return Result<EncryptedPayload, KeyManagerFailure>::Err(std::move(key_result).UnwrapErr());
            }
            std::vector<uint8_t> key = std::move(key_result).Unwrap();
            ScopedWipe wipe_key(key);
            ++entry.usage_count;
            return CryptoPrimitives::Encrypt(key, plaintext, aad)
                .MapErr([](const CryptoFailure& failure) { return KeyManagerFailure::FromCryptoFailure(failure); });
        }();
        if (rotated_public_key.has_value() && handler) {
            handler->OnKeyRotated(session_id, *rotated_public_key);
        }
        return outcome;
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::DecryptWithSessionKey(
        const std::string& session_id,
        const EncryptedPayload& payload,
        std::span<const uint8_t> aad) const {
        std::vector<uint8_t> key;
        ScopedWipe wipe_key(key);
        {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end() || !it->second.symmetric_key) {
                return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                    KeyManagerFailure::NoSessionKey(std::format("No symmetric key for session {}", session_id)));
            }
            auto key_result = ReadKey(*it->second.symmetric_key);
            if (key_result.IsErr()) {
                return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(std::move(key_result).UnwrapErr());
            }
            key = std::move(key_result).Unwrap();
        }
        return CryptoPrimitives::Decrypt(key, payload, aad)
            .MapErr([](const CryptoFailure& failure) { return KeyManagerFailure::FromCryptoFailure(failure); });
    }

    bool KeyManager::ShouldRotateLocked(const SessionKeyEntry& entry) const {
        const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - entry.key_created_at);
        return config_.ShouldRotate(age, entry.usage_count);
    }

    bool KeyManager::ShouldRotateKey(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        return ShouldRotateLocked(it->second);
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::RotateLocked(
        const std::string& session_id,
        SessionKeyEntry& entry) {
        auto pair_result = CryptoPrimitives::GenerateKeyPair(kPurposeRotation);
        if (pair_result.IsErr()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromCryptoFailure(pair_result.UnwrapErr()));
        }
        KeyPair fresh = std::move(pair_result).Unwrap();
        std::vector<uint8_t> public_key = fresh.public_key;
        entry.key_pair.private_key.Wipe();
        entry.key_pair = std::move(fresh);
        entry.key_created_at = Now();
        entry.usage_count = 0;
        logging::Get()->info("Session {} key pair rotated", session_id);
        return Result<std::vector<uint8_t>, KeyManagerFailure>::Ok(std::move(public_key));
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::RotateSessionKey(const std::string& session_id) {
        std::shared_ptr<IKeyEventHandler> handler;
        std::vector<uint8_t> public_key;
        {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                    KeyManagerFailure::SessionNotFound(std::format("No key entry for session {}", session_id)));
            }
            SessionKeyEntry& entry = it->second;
            if (entry.state == KeySessionState::Rotating) {
                return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                    KeyManagerFailure::InvalidState(
                        std::format("Session {} is renegotiating; rotation deferred", session_id)));
            }
            auto rotate_result = RotateLocked(session_id, entry);
            if (rotate_result.IsErr()) {
                return rotate_result;
            }
            public_key = std::move(rotate_result).Unwrap();
            handler = event_handler_;
        }
        if (handler) {
            handler->OnKeyRotated(session_id, public_key);
        }
        return Result<std::vector<uint8_t>, KeyManagerFailure>::Ok(std::move(public_key));
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::StartSymmetricKeyRenegotiation(
        const std::string& session_id) {
        auto pair_result = CryptoPrimitives::GenerateKeyPair(kPurposeRenegotiation);
        if (pair_result.IsErr()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::FromCryptoFailure(pair_result.UnwrapErr()));
        }
        KeyPair staged = std::move(pair_result).Unwrap();
        std::vector<uint8_t> staged_public = staged.public_key;
        std::shared_ptr<IKeyEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                    KeyManagerFailure::SessionNotFound(std::format("No key entry for session {}", session_id)));
            }
            SessionKeyEntry& entry = it->second;
            if (entry.state != KeySessionState::SymmetricKeyed) {
                return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                    KeyManagerFailure::InvalidState(
                        std::format("Cannot renegotiate session {} in state {}",
                                    session_id, StateName(entry.state))));
            }
            entry.staged_pair = std::move(staged);
            entry.state = KeySessionState::Rotating;
            handler = event_handler_;
        }
        logging::Get()->info("Key renegotiation started for session {}", session_id);
        if (handler) {
            handler->OnRenegotiationStarted(session_id, staged_public);
        }
        return Result<std::vector<uint8_t>, KeyManagerFailure>::Ok(std::move(staged_public));
    }

    Result<std::vector<uint8_t>, KeyManagerFailure> KeyManager::ComputeRenegotiationSecret(
        const std::string& session_id,
        std::span<const uint8_t> remote_public_key) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::SessionNotFound(std::format("No key entry for session {}", session_id)));
        }
        if (!it->second.staged_pair.has_value()) {
            return Result<std::vector<uint8_t>, KeyManagerFailure>::Err(
                KeyManagerFailure::InvalidState(
                    std::format("Session {} has no staged renegotiation key", session_id)));
        }
        return CryptoPrimitives::ComputeSharedSecret(it->second.staged_pair->private_key, remote_public_key)
            .MapErr([](const CryptoFailure& failure) { return KeyManagerFailure::FromCryptoFailure(failure); });
    }

    Option<std::vector<uint8_t>> KeyManager::GetStagedPublicKey(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end() || !it->second.staged_pair.has_value()) {
            return std::nullopt;
        }
        return it->second.staged_pair->public_key;
    }

    Result<Unit, KeyManagerFailure> KeyManager::CompleteSymmetricKeyRenegotiation(
        const std::string& session_id,
        std::span<const uint8_t> new_shared_secret,
        std::span<const uint8_t> info,
        Option<std::span<const uint8_t>> salt) {
        auto derived_result = CryptoPrimitives::Hkdf(new_shared_secret, info, salt);
        if (derived_result.IsErr()) {
            return Result<Unit, KeyManagerFailure>::Err(
                KeyManagerFailure::FromCryptoFailure(derived_result.UnwrapErr()));
        }
        std::vector<uint8_t> derived = std::move(derived_result).Unwrap();
        ScopedWipe wipe_derived(derived);
        auto sealed_result = SealKey(derived);
        if (sealed_result.IsErr()) {
            return Result<Unit, KeyManagerFailure>::Err(std::move(sealed_result).UnwrapErr());
        }
        auto sealed = std::move(sealed_result).Unwrap();

        std::shared_ptr<IKeyEventHandler> handler;
        {
            std::lock_guard guard(lock_);
            const auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return Result<Unit, KeyManagerFailure>::Err(
                    KeyManagerFailure::SessionNotFound(std::format("No key entry for session {}", session_id)));
            }
            SessionKeyEntry& entry = it->second;
            if (entry.state != KeySessionState::Rotating || !entry.staged_pair.has_value()) {
                return Result<Unit, KeyManagerFailure>::Err(
                    KeyManagerFailure::InvalidState(
                        std::format("Session {} has no renegotiation in progress", session_id)));
            }
            RetireKey(entry.symmetric_key);
            entry.symmetric_key = std::move(sealed);
            entry.key_pair.private_key.Wipe();
            entry.key_pair = std::move(*entry.staged_pair);
            entry.staged_pair.reset();
            entry.key_created_at = Now();
            entry.usage_count = 0;
            entry.state = KeySessionState::SymmetricKeyed;
            handler = event_handler_;
        }
        logging::Get()->info("Key renegotiation completed for session {}", session_id);
        if (handler) {
            handler->OnRenegotiationCompleted(session_id);
        }
        return Result<Unit, KeyManagerFailure>::Ok(unit);
    }

    void KeyManager::CancelSymmetricKeyRenegotiation(const std::string& session_id) {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second.state != KeySessionState::Rotating) {
            return;
        }
        if (it->second.staged_pair.has_value()) {
            it->second.staged_pair->private_key.Wipe();
            it->second.staged_pair.reset();
        }
        it->second.state = KeySessionState::SymmetricKeyed;
    }

    void KeyManager::EndSession(const std::string& session_id) {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        RetireEntry(it->second);
        sessions_.erase(it);
        ended_sessions_.insert(session_id);
        logging::Get()->debug("Key material for session {} erased", session_id);
    }

    void KeyManager::EndAllSessions() {
        std::lock_guard guard(lock_);
        for (auto& [session_id, entry] : sessions_) {
            RetireEntry(entry);
            ended_sessions_.insert(session_id);
        }
        sessions_.clear();
    }

    size_t KeyManager::CleanupExpiredSessions(std::optional<std::chrono::milliseconds> max_age) {
        const auto limit = max_age.value_or(config_.GetSessionMaxAge());
        std::lock_guard guard(lock_);
        const auto now = Now();
        size_t removed = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.created_at > limit) {
                RetireEntry(it->second);
                ended_sessions_.insert(it->first);
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            logging::Get()->info("Expired {} key session(s)", removed);
        }
        return removed;
    }

    bool KeyManager::HasSession(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        return sessions_.contains(session_id);
    }

    KeySessionState KeyManager::GetState(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        if (const auto it = sessions_.find(session_id); it != sessions_.end()) {
            return it->second.state;
        }
        return ended_sessions_.contains(session_id) ? KeySessionState::Ended : KeySessionState::None;
    }

    KeyManagerStats KeyManager::GetStats() const {
        std::lock_guard guard(lock_);
        KeyManagerStats stats;
        stats.active_sessions = sessions_.size();
        for (const auto& [session_id, entry] : sessions_) {
            if (entry.symmetric_key) {
                ++stats.sessions_with_symmetric_key;
            }
            if (entry.staged_pair.has_value()) {
                ++stats.pending_renegotiations;
            }
        }
        return stats;
    }

    Option<KeyRotationStatus> KeyManager::GetKeyRotationStatus(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        const SessionKeyEntry& entry = it->second;
        return KeyRotationStatus{
            .age = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - entry.key_created_at),
            .usage_count = entry.usage_count,
            .should_rotate = ShouldRotateLocked(entry),
            .renegotiating = entry.state == KeySessionState::Rotating,
        };
    }

#ifdef AIRLINK_TEST_BUILD
    std::shared_ptr<const SecureMemoryHandle> KeyManager::DebugSymmetricKeyHandle(
        const std::string& session_id) const {
        std::lock_guard guard(lock_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return nullptr;
        }
        return it->second.symmetric_key;
    }
#endif
}

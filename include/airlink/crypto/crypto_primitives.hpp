#pragma once

#include "airlink/core/result.hpp"
#include "airlink/core/option.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/crypto/secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace airlink::crypto {

/// Ephemeral X25519 pair. The private scalar never leaves guarded memory.
struct KeyPair {
    SecureMemoryHandle private_key;
    std::vector<uint8_t> public_key;
};

/// AES-256-GCM output split into its parts. Wire form is iv || ciphertext || tag.
struct EncryptedPayload {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
    std::vector<uint8_t> iv;

    [[nodiscard]] std::vector<uint8_t> Combined() const;

    [[nodiscard]] static Result<EncryptedPayload, CryptoFailure> FromCombined(std::span<const uint8_t> combined);
};

/**
 * @brief Stateless session cryptography: X25519, HKDF-SHA256, AES-256-GCM, SHA-256.
 */
class CryptoPrimitives {
public:
    [[nodiscard]] static Result<KeyPair, CryptoFailure> GenerateKeyPair(
        std::string_view purpose = "ephemeral-x25519");

    /**
     * @brief X25519 ECDH.
     *
     * Fails with InvalidKeyLength unless both keys are 32 bytes, and with
     * WeakSecret when the result is all-zero (low-order peer point).
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> ComputeSharedSecret(
        std::span<const uint8_t> local_private,
        std::span<const uint8_t> remote_public);

    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> ComputeSharedSecret(
        const SecureMemoryHandle& local_private,
        std::span<const uint8_t> remote_public);

    /// SHA256(min(pk_a, pk_b) || max(pk_a, pk_b) || session_id). Independent of argument order.
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> SymmetricSalt(
        std::span<const uint8_t> public_key_a,
        std::span<const uint8_t> public_key_b,
        std::string_view session_id);

    [[nodiscard]] static std::vector<uint8_t> SessionInfo(std::string_view session_id);

    /**
     * @brief Derive the 32-byte session key both peers agree on.
     *
     * HKDF-SHA256 over the shared secret with SymmetricSalt() and
     * info "airlink/v1/session:<session_id>", so either side may initiate.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> DeriveSessionKey(
        std::span<const uint8_t> shared_secret,
        std::string_view session_id,
        std::span<const uint8_t> local_public_key,
        std::span<const uint8_t> remote_public_key);

    /// 32-byte HKDF-SHA256. An absent salt means 32 zero bytes. All-zero output is rejected.
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Hkdf(
        std::span<const uint8_t> secret,
        std::span<const uint8_t> info,
        Option<std::span<const uint8_t>> salt = std::nullopt);

    /// Rejects an all-zero key or IV before encrypting.
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> AesGcmEncrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> aad,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> AesGcmDecrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> aad,
        std::span<const uint8_t> ciphertext_with_tag);

    /// Encrypt under a fresh random IV. Empty plaintext is rejected.
    [[nodiscard]] static Result<EncryptedPayload, CryptoFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Decrypt(
        std::span<const uint8_t> key,
        const EncryptedPayload& payload,
        std::span<const uint8_t> aad = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Sha256(std::span<const uint8_t> data);

    [[nodiscard]] static std::vector<uint8_t> GenerateIv();

    static void SecureZero(std::span<uint8_t> buffer) noexcept;

    [[nodiscard]] static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    [[nodiscard]] static bool IsAllZero(std::span<const uint8_t> data) noexcept;

private:
    CryptoPrimitives() = delete;
};

} // namespace airlink::crypto

#include "airlink/crypto/crypto_primitives.hpp"
#include "airlink/crypto/aes_gcm.hpp"
#include "airlink/crypto/hkdf.hpp"
#include "airlink/crypto/sha256.hpp"
#include "airlink/crypto/sodium_interop.hpp"
#include "airlink/core/constants.hpp"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <format>

namespace airlink::crypto {

std::vector<uint8_t> EncryptedPayload::Combined() const {
    std::vector<uint8_t> combined;
    combined.reserve(iv.size() + ciphertext.size() + tag.size());
    combined.insert(combined.end(), iv.begin(), iv.end());
    combined.insert(combined.end(), ciphertext.begin(), ciphertext.end());
    combined.insert(combined.end(), tag.begin(), tag.end());
    return combined;
}

Result<EncryptedPayload, CryptoFailure> EncryptedPayload::FromCombined(std::span<const uint8_t> combined) {
    if (combined.size() < kAesGcmNonceBytes + kAesGcmTagBytes) {
        return Result<EncryptedPayload, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                std::format("Combined payload of {} bytes is shorter than IV and tag", combined.size())));
    }
    EncryptedPayload payload;
    const auto ct_end = combined.end() - static_cast<std::ptrdiff_t>(kAesGcmTagBytes);
    payload.iv.assign(combined.begin(), combined.begin() + kAesGcmNonceBytes);
    payload.ciphertext.assign(combined.begin() + kAesGcmNonceBytes, ct_end);
    payload.tag.assign(ct_end, combined.end());
    return Result<EncryptedPayload, CryptoFailure>::Ok(std::move(payload));
}

Result<KeyPair, CryptoFailure> CryptoPrimitives::GenerateKeyPair(std::string_view purpose) {
    auto pair_result = SodiumInterop::GenerateX25519KeyPair(purpose);
    if (pair_result.IsErr()) {
        return Result<KeyPair, CryptoFailure>::Err(std::move(pair_result).UnwrapErr());
    }
    auto [private_key, public_key] = std::move(pair_result).Unwrap();
    return Result<KeyPair, CryptoFailure>::Ok(KeyPair{std::move(private_key), std::move(public_key)});
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::ComputeSharedSecret(
    std::span<const uint8_t> local_private,
    std::span<const uint8_t> remote_public) {

    if (local_private.size() != kX25519PrivateKeyBytes) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength(
                std::format("Private key must be {} bytes, got {}", kX25519PrivateKeyBytes, local_private.size())));
    }
    if (remote_public.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength(
                std::format("Public key must be {} bytes, got {}", kX25519PublicKeyBytes, remote_public.size())));
    }

    std::vector<uint8_t> shared(kX25519SharedSecretBytes);
    // libsodium itself refuses an all-zero result; both outcomes are a weak secret.
    if (crypto_scalarmult(shared.data(), local_private.data(), remote_public.data()) != 0
        || IsAllZero(shared)) {
        SecureZero(shared);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::WeakSecret("ECDH produced an all-zero shared secret"));
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(shared));
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::ComputeSharedSecret(
    const SecureMemoryHandle& local_private,
    std::span<const uint8_t> remote_public) {

    auto read_result = local_private.WithReadAccess([&remote_public](std::span<const uint8_t> sk) {
        return ComputeSharedSecret(sk, remote_public);
    });
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return std::move(read_result).Unwrap();
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::SymmetricSalt(
    std::span<const uint8_t> public_key_a,
    std::span<const uint8_t> public_key_b,
    std::string_view session_id) {

    const bool a_first = !std::lexicographical_compare(
        public_key_b.begin(), public_key_b.end(),
        public_key_a.begin(), public_key_a.end());
    const auto first = a_first ? public_key_a : public_key_b;
    const auto second = a_first ? public_key_b : public_key_a;

    auto hasher_result = Sha256Hasher::Create();
    if (hasher_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(hasher_result).UnwrapErr());
    }
    Sha256Hasher hasher = std::move(hasher_result).Unwrap();
    AIRLINK_TRY(hasher.Update(first));
    AIRLINK_TRY(hasher.Update(second));
    AIRLINK_TRY(hasher.Update(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(session_id.data()), session_id.size())));
    return hasher.Finalize();
}

std::vector<uint8_t> CryptoPrimitives::SessionInfo(std::string_view session_id) {
    std::vector<uint8_t> info;
    info.reserve(kSessionInfoPrefix.size() + session_id.size());
    info.insert(info.end(), kSessionInfoPrefix.begin(), kSessionInfoPrefix.end());
    info.insert(info.end(), session_id.begin(), session_id.end());
    return info;
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::DeriveSessionKey(
    std::span<const uint8_t> shared_secret,
    std::string_view session_id,
    std::span<const uint8_t> local_public_key,
    std::span<const uint8_t> remote_public_key) {

    if (local_public_key.size() != kX25519PublicKeyBytes || remote_public_key.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidKeyLength("Session key derivation requires two 32-byte public keys"));
    }
    auto salt_result = SymmetricSalt(local_public_key, remote_public_key, session_id);
    if (salt_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(salt_result).UnwrapErr());
    }
    const std::vector<uint8_t> salt = std::move(salt_result).Unwrap();
    const std::vector<uint8_t> info = SessionInfo(session_id);
    return Hkdf(shared_secret, info, std::span<const uint8_t>(salt));
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::Hkdf(
    std::span<const uint8_t> secret,
    std::span<const uint8_t> info,
    Option<std::span<const uint8_t>> salt) {

    static constexpr std::array<uint8_t, kHkdfDefaultSaltBytes> kZeroSalt{};
    const std::span<const uint8_t> effective_salt =
        salt.has_value() && !salt->empty() ? *salt : std::span<const uint8_t>(kZeroSalt);

    auto derived = crypto::Hkdf::DeriveKeyBytes(secret, kSessionKeyBytes, effective_salt, info);
    if (derived.IsErr()) {
        return derived;
    }
    if (IsAllZero(derived.Unwrap())) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::WeakKey("HKDF produced an all-zero key"));
    }
    return derived;
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::AesGcmEncrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> aad,
    std::span<const uint8_t> plaintext) {

    if (key.size() == kAesKeyBytes && IsAllZero(key)) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::WeakKey("Refusing to encrypt under an all-zero key"));
    }
    if (iv.size() == kAesGcmNonceBytes && IsAllZero(iv)) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidInput("Refusing to encrypt under an all-zero IV"));
    }
    return AesGcm::Encrypt(key, iv, plaintext, aad);
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::AesGcmDecrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> aad,
    std::span<const uint8_t> ciphertext_with_tag) {

    if (key.size() == kAesKeyBytes && IsAllZero(key)) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::WeakKey("Refusing to decrypt under an all-zero key"));
    }
    if (iv.size() == kAesGcmNonceBytes && IsAllZero(iv)) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidInput("Refusing to decrypt under an all-zero IV"));
    }
    return AesGcm::Decrypt(key, iv, ciphertext_with_tag, aad);
}

Result<EncryptedPayload, CryptoFailure> CryptoPrimitives::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad) {

    if (plaintext.empty()) {
        return Result<EncryptedPayload, CryptoFailure>::Err(
            CryptoFailure::InvalidInput("Plaintext cannot be empty"));
    }
    std::vector<uint8_t> iv = GenerateIv();
    auto sealed = AesGcmEncrypt(key, iv, aad, plaintext);
    if (sealed.IsErr()) {
        return Result<EncryptedPayload, CryptoFailure>::Err(std::move(sealed).UnwrapErr());
    }
    std::vector<uint8_t> ct_and_tag = std::move(sealed).Unwrap();

    EncryptedPayload payload;
    const auto tag_begin = ct_and_tag.end() - static_cast<std::ptrdiff_t>(kAesGcmTagBytes);
    payload.ciphertext.assign(ct_and_tag.begin(), tag_begin);
    payload.tag.assign(tag_begin, ct_and_tag.end());
    payload.iv = std::move(iv);
    return Result<EncryptedPayload, CryptoFailure>::Ok(std::move(payload));
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::Decrypt(
    std::span<const uint8_t> key,
    const EncryptedPayload& payload,
    std::span<const uint8_t> aad) {

    if (payload.tag.size() != kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                std::format("Tag must be {} bytes, got {}", kAesGcmTagBytes, payload.tag.size())));
    }
    std::vector<uint8_t> ct_and_tag;
    ct_and_tag.reserve(payload.ciphertext.size() + payload.tag.size());
    ct_and_tag.insert(ct_and_tag.end(), payload.ciphertext.begin(), payload.ciphertext.end());
    ct_and_tag.insert(ct_and_tag.end(), payload.tag.begin(), payload.tag.end());
    return AesGcmDecrypt(key, payload.iv, aad, ct_and_tag);
}

Result<std::vector<uint8_t>, CryptoFailure> CryptoPrimitives::Sha256(std::span<const uint8_t> data) {
    return Sha256Hasher::Hash(data);
}

std::vector<uint8_t> CryptoPrimitives::GenerateIv() {
    std::vector<uint8_t> iv;
    do {
        iv = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    } while (IsAllZero(iv));
    return iv;
}

void CryptoPrimitives::SecureZero(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

bool CryptoPrimitives::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    return SodiumInterop::ConstantTimeEquals(a, b);
}

bool CryptoPrimitives::IsAllZero(std::span<const uint8_t> data) noexcept {
    return SodiumInterop::IsAllZero(data);
}

} // namespace airlink::crypto

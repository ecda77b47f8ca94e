#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace airlink::crypto {

/**
 * AES-256-GCM over OpenSSL EVP.
 *
 * Stateless: the caller owns nonce uniqueness. Session traffic uses a fresh
 * random 96-bit IV per message (see CryptoPrimitives::Encrypt).
 *
 * Output of Encrypt is ciphertext || tag(16). A tag mismatch on Decrypt
 * returns CryptoFailureType::AuthenticationFailed and no plaintext.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}

#include "airlink/crypto/aes_gcm.hpp"
#include "airlink/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <sodium.h>
#include <format>
#include <memory>
#include <string>
namespace airlink::crypto {
namespace {
    constexpr int kOpenSslSuccess = 1;

    using CipherResult = Result<std::vector<uint8_t>, CryptoFailure>;

    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == 0) {
            return "Unknown OpenSSL error";
        }
        char buffer[kOpenSslErrorBufferBytes];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    void WipeOutput(std::vector<uint8_t>& output) {
        if (!output.empty()) {
            sodium_memzero(output.data(), output.size());
        }
        output.clear();
    }

    CipherResult ValidateKeyAndNonce(std::span<const uint8_t> key, std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return CipherResult::Err(
                CryptoFailure::InvalidKeyLength(
                    std::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return CipherResult::Err(
                CryptoFailure::InvalidInput(
                    std::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
        }
        return CipherResult::Ok({});
    }
}

CipherResult AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return check;
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != kOpenSslSuccess ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != kOpenSslSuccess) {
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != kOpenSslSuccess) {
            return CipherResult::Err(CryptoFailure::Generic(
                std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != kOpenSslSuccess) {
        WipeOutput(output);
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != kOpenSslSuccess) {
        WipeOutput(output);
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != kOpenSslSuccess) {
        WipeOutput(output);
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return CipherResult::Ok(std::move(output));
}

CipherResult AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return check;
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return CipherResult::Err(CryptoFailure::InvalidInput(
            std::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                        ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != kOpenSslSuccess ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != kOpenSslSuccess) {
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != kOpenSslSuccess) {
            return CipherResult::Err(CryptoFailure::Generic(
                std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != kOpenSslSuccess) {
        WipeOutput(output);
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Decryption failed: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes), tag.data()) != kOpenSslSuccess) {
        WipeOutput(output);
        return CipherResult::Err(CryptoFailure::Generic(
            std::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != kOpenSslSuccess) {
        WipeOutput(output);
        return CipherResult::Err(CryptoFailure::AuthenticationFailed(
            "Authentication tag verification failed - data may have been tampered with"));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return CipherResult::Ok(std::move(output));
}
}

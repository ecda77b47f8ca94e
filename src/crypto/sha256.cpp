#include "airlink/crypto/sha256.hpp"
#include "airlink/core/constants.hpp"

#include <openssl/evp.h>

#include <array>

namespace airlink::crypto {

void Sha256Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    if (ctx) {
        EVP_MD_CTX_free(ctx);
    }
}

Result<Sha256Hasher, CryptoFailure> Sha256Hasher::Create() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return Result<Sha256Hasher, CryptoFailure>::Err(
            CryptoFailure::Generic("Failed to create digest context"));
    }
    Sha256Hasher hasher(ctx);
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        return Result<Sha256Hasher, CryptoFailure>::Err(
            CryptoFailure::Generic("Failed to initialize SHA-256"));
    }
    return Result<Sha256Hasher, CryptoFailure>::Ok(std::move(hasher));
}

Result<Unit, CryptoFailure> Sha256Hasher::Update(std::span<const uint8_t> data) {
    if (!ctx_) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::Generic("SHA-256 hasher already finalized"));
    }
    if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::Generic("SHA-256 update failed"));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CryptoFailure> Sha256Hasher::Finalize() {
    if (!ctx_) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Generic("SHA-256 hasher already finalized"));
    }
    std::vector<uint8_t> digest(kSha256Bytes);
    unsigned int digest_len = 0;
    const int rc = EVP_DigestFinal_ex(ctx_.get(), digest.data(), &digest_len);
    ctx_.reset();
    if (rc != 1 || digest_len != kSha256Bytes) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Generic("SHA-256 finalization failed"));
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(digest));
}

Result<std::vector<uint8_t>, CryptoFailure> Sha256Hasher::Hash(std::span<const uint8_t> data) {
    auto hasher_result = Create();
    if (hasher_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(hasher_result).UnwrapErr());
    }
    Sha256Hasher hasher = std::move(hasher_result).Unwrap();
    AIRLINK_TRY(hasher.Update(data));
    return hasher.Finalize();
}

std::string Sha256Hasher::ToHex(std::span<const uint8_t> digest) {
    static constexpr std::array<char, 16> kHexDigits = {
        '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (const uint8_t byte : digest) {
        hex.push_back(kHexDigits[byte >> 4]);
        hex.push_back(kHexDigits[byte & 0x0F]);
    }
    return hex;
}

} // namespace airlink::crypto

#pragma once

#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace airlink::crypto {

/// Incremental SHA-256 over OpenSSL EVP_MD. One-shot use: Finalize() ends the hasher.
class Sha256Hasher {
public:
    [[nodiscard]] static Result<Sha256Hasher, CryptoFailure> Create();

    Result<Unit, CryptoFailure> Update(std::span<const uint8_t> data);

    [[nodiscard]] Result<std::vector<uint8_t>, CryptoFailure> Finalize();

    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Hash(std::span<const uint8_t> data);

    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> digest);

    Sha256Hasher(Sha256Hasher&&) noexcept = default;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept = default;
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    ~Sha256Hasher() = default;

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    explicit Sha256Hasher(evp_md_ctx_st* ctx) noexcept : ctx_(ctx) {}

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

} // namespace airlink::crypto

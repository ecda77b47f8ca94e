#pragma once

#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace airlink::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) through the OpenSSL 3 EVP_KDF interface.
 */
class Hkdf {
public:
    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

    /**
     * @brief Extract-then-expand into @p output.
     *
     * An empty @p salt is passed to OpenSSL as absent, which RFC 5869 defines as
     * HASH_LEN zero bytes.
     */
    [[nodiscard]] static Result<Unit, CryptoFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

private:
    Hkdf() = delete;
};

} // namespace airlink::crypto

#pragma once

#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace airlink::crypto {

class SecureMemoryHandle;

/**
 * @brief Thin wrapper over the libsodium calls used by the library.
 *
 * Initialize() must succeed before any other call. It is thread-safe and idempotent.
 */
class SodiumInterop {
public:
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer.
     *
     * Small buffers are cleared through a volatile pointer, larger ones with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Constant-time comparison. Buffers of different sizes compare unequal.
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /// True when every byte is zero (sodium_is_zero, constant time).
    static bool IsAllZero(std::span<const uint8_t> buffer) noexcept;

    /**
     * @brief Generate an X25519 key pair.
     *
     * The private scalar goes straight into guarded memory; the temporary is wiped.
     * A pair whose public key is all-zero is rejected.
     *
     * @param key_purpose Used in error messages only
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, CryptoFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace airlink::crypto

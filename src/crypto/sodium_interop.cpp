#include "airlink/crypto/sodium_interop.hpp"
#include "airlink/crypto/secure_memory_handle.hpp"

#include <format>
#include <string>

namespace airlink::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium initialization failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium is not initialized"));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > kMaxSecureBufferBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}", buffer.size(), kMaxSecureBufferBytes)));
    }
    if (buffer.size() <= kSmallBufferThreshold) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool SodiumInterop::IsAllZero(std::span<const uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return true;
    }
    return sodium_is_zero(buffer.data(), buffer.size()) == 1;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, CryptoFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, CryptoFailure>;

    auto alloc_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (alloc_result.IsErr()) {
        return KeyPairResult::Err(CryptoFailure::FromSodiumFailure(alloc_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(alloc_result).Unwrap();

    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    auto derive_result = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return crypto_scalarmult_base(pk_bytes.data(), sk.data()) == 0;
    });
    if (derive_result.IsErr()) {
        return KeyPairResult::Err(CryptoFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (!derive_result.Unwrap()) {
        return KeyPairResult::Err(
            CryptoFailure::KeyGeneration(
                std::format("Failed to derive {} public key", key_purpose)));
    }
    if (IsAllZero(pk_bytes)) {
        return KeyPairResult::Err(
            CryptoFailure::WeakKey(
                std::format("Generated {} public key is all zeros", key_purpose)));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace airlink::crypto

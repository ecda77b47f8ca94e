#pragma once

#include <sodium.h>

#include <cstdint>
#include <vector>

namespace airlink::crypto {

/// Zeroes a heap buffer holding secret material when the scope exits.
class ScopedWipe {
public:
    explicit ScopedWipe(std::vector<uint8_t>& buffer) noexcept
        : buffer_(buffer) {}

    ~ScopedWipe() {
        if (!buffer_.empty()) {
            sodium_memzero(buffer_.data(), buffer_.size());
        }
    }

    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;

private:
    std::vector<uint8_t>& buffer_;
};

} // namespace airlink::crypto

#pragma once

#include "airlink/core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace airlink::configuration {

/**
 * @brief Limits and timings of the transfer orchestrator
 *
 * Admission is checked in a fixed order: per-device rate, global rate,
 * concurrent session cap. The first limit hit decides the failure code.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = TransferConfig::Default()
 *     .WithPerDeviceLimit(1)
 *     .WithStallThreshold(std::chrono::seconds(5));
 * ```
 */
class TransferConfig {
public:
    [[nodiscard]] static TransferConfig Default() noexcept {
        return TransferConfig();
    }

    [[nodiscard]] TransferConfig WithPerDeviceLimit(const uint32_t requests) const noexcept {
        TransferConfig copy = *this;
        copy.per_device_limit_ = requests;
        return copy;
    }

    [[nodiscard]] TransferConfig WithGlobalLimit(const uint32_t requests) const noexcept {
        TransferConfig copy = *this;
        copy.global_limit_ = requests;
        return copy;
    }

    [[nodiscard]] TransferConfig WithRateWindow(const std::chrono::milliseconds window) const noexcept {
        TransferConfig copy = *this;
        copy.rate_window_ = window;
        return copy;
    }

    [[nodiscard]] TransferConfig WithMaxConcurrentSessions(const uint32_t sessions) const noexcept {
        TransferConfig copy = *this;
        copy.max_concurrent_sessions_ = sessions;
        return copy;
    }

    [[nodiscard]] TransferConfig WithStatusDebounce(const std::chrono::milliseconds debounce) const noexcept {
        TransferConfig copy = *this;
        copy.status_debounce_ = debounce;
        return copy;
    }

    [[nodiscard]] TransferConfig WithStallThreshold(const std::chrono::milliseconds threshold) const noexcept {
        TransferConfig copy = *this;
        copy.stall_threshold_ = threshold;
        return copy;
    }

    [[nodiscard]] TransferConfig WithRetryAttempts(const uint32_t attempts) const noexcept {
        TransferConfig copy = *this;
        copy.retry_attempts_ = attempts == 0 ? 1 : attempts;
        return copy;
    }

    [[nodiscard]] TransferConfig WithRetryBackoff(const std::chrono::milliseconds backoff) const noexcept {
        TransferConfig copy = *this;
        copy.retry_backoff_ = backoff;
        return copy;
    }

    [[nodiscard]] TransferConfig WithChunkSize(const size_t bytes) const noexcept {
        TransferConfig copy = *this;
        copy.chunk_size_ = bytes == 0 ? kDefaultChunkBytes : bytes;
        return copy;
    }

    [[nodiscard]] TransferConfig WithHistoryRetention(const std::chrono::milliseconds retention) const noexcept {
        TransferConfig copy = *this;
        copy.history_retention_ = retention;
        return copy;
    }

    /// How long the sender waits for the receiver's file_result after file_end.
    [[nodiscard]] TransferConfig WithFileResultTimeout(const std::chrono::milliseconds timeout) const noexcept {
        TransferConfig copy = *this;
        copy.file_result_timeout_ = timeout;
        return copy;
    }

    [[nodiscard]] uint32_t GetPerDeviceLimit() const noexcept { return per_device_limit_; }
    [[nodiscard]] uint32_t GetGlobalLimit() const noexcept { return global_limit_; }
    [[nodiscard]] std::chrono::milliseconds GetRateWindow() const noexcept { return rate_window_; }
    [[nodiscard]] uint32_t GetMaxConcurrentSessions() const noexcept { return max_concurrent_sessions_; }
    [[nodiscard]] std::chrono::milliseconds GetStatusDebounce() const noexcept { return status_debounce_; }
    [[nodiscard]] std::chrono::milliseconds GetStallThreshold() const noexcept { return stall_threshold_; }
    [[nodiscard]] uint32_t GetRetryAttempts() const noexcept { return retry_attempts_; }
    [[nodiscard]] std::chrono::milliseconds GetRetryBackoff() const noexcept { return retry_backoff_; }
    [[nodiscard]] size_t GetChunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] std::chrono::milliseconds GetHistoryRetention() const noexcept { return history_retention_; }
    [[nodiscard]] std::chrono::milliseconds GetFileResultTimeout() const noexcept { return file_result_timeout_; }

    [[nodiscard]] bool operator==(const TransferConfig& other) const noexcept = default;

private:
    TransferConfig() noexcept = default;

    uint32_t per_device_limit_{kDefaultPerDeviceTransfers};
    uint32_t global_limit_{kDefaultGlobalTransfers};
    std::chrono::milliseconds rate_window_{kRateLimitWindow};
    uint32_t max_concurrent_sessions_{kDefaultMaxConcurrentSessions};
    std::chrono::milliseconds status_debounce_{kDefaultStatusDebounce};
    std::chrono::milliseconds stall_threshold_{kDefaultStallThreshold};
    uint32_t retry_attempts_{kDefaultRetryAttempts};
    std::chrono::milliseconds retry_backoff_{kDefaultRetryBackoff};
    size_t chunk_size_{kDefaultChunkBytes};
    std::chrono::milliseconds history_retention_{kDefaultHistoryRetention};
    std::chrono::milliseconds file_result_timeout_{std::chrono::seconds(60)};
};

} // namespace airlink::configuration

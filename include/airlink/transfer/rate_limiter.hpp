#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
namespace airlink::transfer {

struct RateLimitDecision {
    bool allowed = true;
    /// Time until the oldest request in the window expires; set only when denied.
    std::optional<std::chrono::milliseconds> retry_after;
};

/**
 * @brief Sliding-window request counter keyed by device id (or a single global key)
 *
 * Check() only inspects; Record() counts a request. Callers check every
 * limiter first and record only when all of them allow.
 */
class SlidingWindowLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    SlidingWindowLimiter(uint32_t limit, std::chrono::milliseconds window, Clock clock = {});

    [[nodiscard]] RateLimitDecision Check(const std::string& key) const;

    std::chrono::steady_clock::time_point Record(const std::string& key);

    [[nodiscard]] size_t CountInWindow(const std::string& key) const;

    void Reset(const std::string& key);

private:
    [[nodiscard]] std::chrono::steady_clock::time_point Now() const;

    void PruneLocked(std::deque<std::chrono::steady_clock::time_point>& stamps,
                     std::chrono::steady_clock::time_point now) const;

    uint32_t limit_;
    std::chrono::milliseconds window_;
    Clock clock_;
    mutable std::mutex lock_;
    mutable std::unordered_map<std::string, std::deque<std::chrono::steady_clock::time_point>> requests_;
};

}

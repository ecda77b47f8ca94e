#include "airlink/transfer/rate_limiter.hpp"

namespace airlink::transfer {
    SlidingWindowLimiter::SlidingWindowLimiter(const uint32_t limit, const std::chrono::milliseconds window, Clock clock)
        : limit_(limit)
          , window_(window)
          , clock_(std::move(clock)) {
    }

    std::chrono::steady_clock::time_point SlidingWindowLimiter::Now() const {
        return clock_ ? clock_() : std::chrono::steady_clock::now();
    }

    void SlidingWindowLimiter::PruneLocked(
        std::deque<std::chrono::steady_clock::time_point>& stamps,
        const std::chrono::steady_clock::time_point now) const {
        while (!stamps.empty() && now - stamps.front() >= window_) {
            stamps.pop_front();
        }
    }

    RateLimitDecision SlidingWindowLimiter::Check(const std::string& key) const {
        std::lock_guard guard(lock_);
        const auto it = requests_.find(key);
        if (it == requests_.end()) {
            return RateLimitDecision{true, std::nullopt};
        }
        const auto now = Now();
        PruneLocked(it->second, now);
        if (it->second.size() < limit_) {
            return RateLimitDecision{true, std::nullopt};
        }
        const auto retry = std::chrono::ceil<std::chrono::milliseconds>(it->second.front() + window_ - now);
        return RateLimitDecision{false, retry};
    }

    std::chrono::steady_clock::time_point SlidingWindowLimiter::Record(const std::string& key) {
        std::lock_guard guard(lock_);
        const auto now = Now();
        auto& stamps = requests_[key];
        PruneLocked(stamps, now);
        stamps.push_back(now);
        return now;
    }

    size_t SlidingWindowLimiter::CountInWindow(const std::string& key) const {
        std::lock_guard guard(lock_);
        const auto it = requests_.find(key);
        if (it == requests_.end()) {
            return 0;
        }
        PruneLocked(it->second, Now());
        return it->second.size();
    }

    void SlidingWindowLimiter::Reset(const std::string& key) {
        std::lock_guard guard(lock_);
        requests_.erase(key);
    }
}

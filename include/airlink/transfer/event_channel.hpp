#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>
namespace airlink::transfer {

using SubscriptionId = uint64_t;

/// Ids are unique across every channel in the process.
inline SubscriptionId NextSubscriptionId() noexcept {
    static std::atomic<SubscriptionId> next{1};
    return next.fetch_add(1);
}

/// Observer registry. Handlers run on the publishing thread, outside the registry lock.
template<typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;

    SubscriptionId Subscribe(Handler handler) {
        const SubscriptionId id = NextSubscriptionId();
        std::lock_guard guard(lock_);
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    bool Unsubscribe(const SubscriptionId id) {
        std::lock_guard guard(lock_);
        return handlers_.erase(id) > 0;
    }

    void Publish(const Event& event) const {
        std::vector<Handler> snapshot;
        {
            std::lock_guard guard(lock_);
            snapshot.reserve(handlers_.size());
            for (const auto& [id, handler] : handlers_) {
                snapshot.push_back(handler);
            }
        }
        for (const Handler& handler : snapshot) {
            handler(event);
        }
    }

    [[nodiscard]] size_t SubscriberCount() const {
        std::lock_guard guard(lock_);
        return handlers_.size();
    }

    void Clear() {
        std::lock_guard guard(lock_);
        handlers_.clear();
    }

private:
    mutable std::mutex lock_;
    std::map<SubscriptionId, Handler> handlers_;
};

}

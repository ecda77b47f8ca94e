#pragma once
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include "airlink/transfer/transfer_models.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
namespace airlink::transfer {

/**
 * @brief Transfer status validation and debounced commit
 *
 * pending -> connecting -> handshaking -> transferring -> completed | failed | cancelled
 * transferring -> paused -> resuming -> transferring
 * Every non-terminal status may also go straight to failed or cancelled.
 *
 * Accepted statuses are committed after the debounce window; a newer status
 * inside the window replaces the pending one, so observers only see the last.
 * Terminal statuses are committed at once and discard anything pending.
 * The commit callback runs without the machine's lock held, either on the
 * worker thread or on the caller's thread for terminal statuses.
 */
class StatusMachine {
public:
    using CommitCallback = std::function<void(const StatusUpdate&)>;

    StatusMachine(std::chrono::milliseconds debounce, CommitCallback on_commit);

    [[nodiscard]] static bool IsValidTransition(TransferStatus from, TransferStatus to) noexcept;

    /// Starts tracking @p session_id at @p initial and commits it immediately.
    void Register(const std::string& session_id, TransferStatus initial = TransferStatus::Pending);

    /// Re-entering the current non-terminal status is a no-op.
    [[nodiscard]] Result<Unit, TransferFailure> Transition(
        const std::string& session_id,
        TransferStatus to,
        std::optional<std::string> message = std::nullopt);

    /// Latest accepted status, committed or not.
    [[nodiscard]] std::optional<TransferStatus> Current(const std::string& session_id) const;

    /// Stops tracking and drops any pending commit.
    void Forget(const std::string& session_id);

    StatusMachine(const StatusMachine&) = delete;
    StatusMachine& operator=(const StatusMachine&) = delete;
    ~StatusMachine();

private:
    struct Tracked {
        TransferStatus current = TransferStatus::Pending;
        std::optional<StatusUpdate> pending;
        std::chrono::steady_clock::time_point due;
    };

    void Run();

    std::chrono::milliseconds debounce_;
    CommitCallback on_commit_;
    mutable std::mutex lock_;
    std::condition_variable wake_;
    std::unordered_map<std::string, Tracked> tracked_;
    bool stopping_ = false;
    std::thread worker_;
};

}

#include "airlink/transfer/status_machine.hpp"
#include "airlink/core/logging.hpp"
#include <format>
#include <vector>

namespace airlink::transfer {
    StatusMachine::StatusMachine(std::chrono::milliseconds debounce, CommitCallback on_commit)
        : debounce_(debounce)
          , on_commit_(std::move(on_commit)) {
        worker_ = std::thread([this] { Run(); });
    }

    StatusMachine::~StatusMachine() {
        {
            std::lock_guard guard(lock_);
            stopping_ = true;
        }
        wake_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool StatusMachine::IsValidTransition(const TransferStatus from, const TransferStatus to) noexcept {
        if (IsTerminal(from)) {
            return false;
        }
        if (to == TransferStatus::Failed || to == TransferStatus::Cancelled) {
            return true;
        }
        switch (from) {
            case TransferStatus::Pending:
                return to == TransferStatus::Connecting;
            case TransferStatus::Connecting:
                return to == TransferStatus::Handshaking;
            case TransferStatus::Handshaking:
                return to == TransferStatus::Transferring;
            case TransferStatus::Transferring:
                return to == TransferStatus::Paused || to == TransferStatus::Completed;
            case TransferStatus::Paused:
                return to == TransferStatus::Resuming;
            case TransferStatus::Resuming:
                return to == TransferStatus::Transferring;
            default:
                return false;
        }
    }

    void StatusMachine::Register(const std::string& session_id, const TransferStatus initial) {
        {
            std::lock_guard guard(lock_);
            tracked_[session_id] = Tracked{initial, std::nullopt, {}};
        }
        on_commit_(StatusUpdate{session_id, initial, std::nullopt});
    }

    Result<Unit, TransferFailure> StatusMachine::Transition(
        const std::string& session_id,
        const TransferStatus to,
        std::optional<std::string> message) {
        std::optional<StatusUpdate> commit_now;
        {
            std::lock_guard guard(lock_);
            const auto it = tracked_.find(session_id);
            if (it == tracked_.end()) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::SessionNotFound(std::format("No status tracked for {}", session_id)));
            }
            Tracked& tracked = it->second;
            if (tracked.current == to && !IsTerminal(to)) {
                return Result<Unit, TransferFailure>::Ok(unit);
            }
            if (!IsValidTransition(tracked.current, to)) {
                return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidTransition(
                    std::format("Session {}: {} -> {} not allowed", session_id, ToString(tracked.current), ToString(to))));
            }
            tracked.current = to;
            StatusUpdate update{session_id, to, std::move(message)};
            if (IsTerminal(to)) {
                tracked.pending.reset();
                commit_now = std::move(update);
            } else {
                tracked.pending = std::move(update);
                tracked.due = std::chrono::steady_clock::now() + debounce_;
            }
        }
        if (commit_now.has_value()) {
            logging::Get()->debug("Session {} -> {}", session_id, ToString(commit_now->status));
            on_commit_(*commit_now);
        } else {
            wake_.notify_all();
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    std::optional<TransferStatus> StatusMachine::Current(const std::string& session_id) const {
        std::lock_guard guard(lock_);
        if (const auto it = tracked_.find(session_id); it != tracked_.end()) {
            return it->second.current;
        }
        return std::nullopt;
    }

    void StatusMachine::Forget(const std::string& session_id) {
        std::lock_guard guard(lock_);
        tracked_.erase(session_id);
    }

    void StatusMachine::Run() {
        std::unique_lock lock(lock_);
        while (!stopping_) {
            const auto now = std::chrono::steady_clock::now();
            std::vector<StatusUpdate> due;
            std::optional<std::chrono::steady_clock::time_point> next_due;
            for (auto& [session_id, tracked] : tracked_) {
                if (!tracked.pending.has_value()) {
                    continue;
                }
                if (tracked.due <= now) {
                    due.push_back(std::move(*tracked.pending));
                    tracked.pending.reset();
                } else if (!next_due.has_value() || tracked.due < *next_due) {
                    next_due = tracked.due;
                }
            }
            if (!due.empty()) {
                lock.unlock();
                for (const StatusUpdate& update : due) {
                    logging::Get()->debug("Session {} -> {}", update.session_id, ToString(update.status));
                    on_commit_(update);
                }
                lock.lock();
                continue;
            }
            if (next_due.has_value()) {
                wake_.wait_until(lock, *next_due);
            } else {
                wake_.wait(lock);
            }
        }
    }
}

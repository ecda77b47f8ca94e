#include <catch2/catch_test_macros.hpp>
#include "airlink/transfer/status_machine.hpp"
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace airlink;
using namespace airlink::transfer;
using namespace std::chrono_literals;

namespace {
    class CommitLog {
    public:
        StatusMachine::CommitCallback Callback() {
            return [this](const StatusUpdate& update) {
                std::lock_guard guard(lock_);
                updates_.push_back(update);
            };
        }

        std::vector<TransferStatus> Statuses() const {
            std::lock_guard guard(lock_);
            std::vector<TransferStatus> out;
            for (const auto& update : updates_) {
                out.push_back(update.status);
            }
            return out;
        }

        StatusUpdate Last() const {
            std::lock_guard guard(lock_);
            return updates_.back();
        }

    private:
        mutable std::mutex lock_;
        std::vector<StatusUpdate> updates_;
    };
}

TEST_CASE("StatusMachine - Transition table", "[transfer][status]") {
    using S = TransferStatus;

    SECTION("Forward path") {
        REQUIRE(StatusMachine::IsValidTransition(S::Pending, S::Connecting));
        REQUIRE(StatusMachine::IsValidTransition(S::Connecting, S::Handshaking));
        REQUIRE(StatusMachine::IsValidTransition(S::Handshaking, S::Transferring));
        REQUIRE(StatusMachine::IsValidTransition(S::Transferring, S::Completed));
        REQUIRE(StatusMachine::IsValidTransition(S::Transferring, S::Paused));
        REQUIRE(StatusMachine::IsValidTransition(S::Paused, S::Resuming));
        REQUIRE(StatusMachine::IsValidTransition(S::Resuming, S::Transferring));
    }

    SECTION("No skipping and no going back") {
        REQUIRE_FALSE(StatusMachine::IsValidTransition(S::Pending, S::Transferring));
        REQUIRE_FALSE(StatusMachine::IsValidTransition(S::Handshaking, S::Connecting));
        REQUIRE_FALSE(StatusMachine::IsValidTransition(S::Paused, S::Transferring));
        REQUIRE_FALSE(StatusMachine::IsValidTransition(S::Pending, S::Paused));
    }

    SECTION("Any live status may fail or be cancelled") {
        for (const S from : {S::Pending, S::Connecting, S::Handshaking, S::Transferring, S::Paused, S::Resuming}) {
            REQUIRE(StatusMachine::IsValidTransition(from, S::Failed));
            REQUIRE(StatusMachine::IsValidTransition(from, S::Cancelled));
        }
    }

    SECTION("Terminal statuses accept nothing") {
        for (const S from : {S::Completed, S::Failed, S::Cancelled}) {
            for (const S to : {S::Pending, S::Connecting, S::Transferring, S::Completed, S::Failed, S::Cancelled}) {
                REQUIRE_FALSE(StatusMachine::IsValidTransition(from, to));
            }
        }
    }
}

TEST_CASE("StatusMachine - Debounce keeps only the last status", "[transfer][status]") {
    CommitLog log;
    StatusMachine machine(200ms, log.Callback());

    machine.Register("s1");
    REQUIRE(log.Statuses() == std::vector{TransferStatus::Pending});

    REQUIRE(machine.Transition("s1", TransferStatus::Connecting).IsOk());
    REQUIRE(machine.Transition("s1", TransferStatus::Handshaking).IsOk());
    REQUIRE(machine.Transition("s1", TransferStatus::Transferring).IsOk());
    REQUIRE(machine.Current("s1") == TransferStatus::Transferring);

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (log.Statuses().size() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(log.Statuses() == std::vector{TransferStatus::Pending, TransferStatus::Transferring});
}

TEST_CASE("StatusMachine - Terminal status commits at once", "[transfer][status]") {
    CommitLog log;
    StatusMachine machine(10s, log.Callback());
    machine.Register("s1");

    REQUIRE(machine.Transition("s1", TransferStatus::Connecting).IsOk());
    REQUIRE(machine.Transition("s1", TransferStatus::Failed, std::string("link lost")).IsOk());

    REQUIRE(log.Statuses() == std::vector{TransferStatus::Pending, TransferStatus::Failed});
    REQUIRE(log.Last().message == std::optional<std::string>("link lost"));

    SECTION("Nothing follows a terminal status") {
        auto again = machine.Transition("s1", TransferStatus::Cancelled);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == TransferFailureType::InvalidTransition);
        REQUIRE(machine.Transition("s1", TransferStatus::Failed).IsErr());
    }
}

TEST_CASE("StatusMachine - Bookkeeping", "[transfer][status]") {
    CommitLog log;
    StatusMachine machine(10s, log.Callback());

    SECTION("Unknown session") {
        auto result = machine.Transition("missing", TransferStatus::Connecting);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::SessionNotFound);
        REQUIRE_FALSE(machine.Current("missing").has_value());
    }

    SECTION("Invalid transition leaves the status unchanged") {
        machine.Register("s1");
        REQUIRE(machine.Transition("s1", TransferStatus::Completed).IsErr());
        REQUIRE(machine.Current("s1") == TransferStatus::Pending);
    }

    SECTION("Re-entering the same status is a no-op") {
        CommitLog quick_log;
        StatusMachine quick(20ms, quick_log.Callback());
        quick.Register("s1");
        REQUIRE(quick.Transition("s1", TransferStatus::Connecting).IsOk());
        REQUIRE(quick.Transition("s1", TransferStatus::Connecting).IsOk());
        std::this_thread::sleep_for(200ms);
        REQUIRE(quick_log.Statuses() == std::vector{TransferStatus::Pending, TransferStatus::Connecting});
    }

    SECTION("Forget drops the pending commit") {
        CommitLog quick_log;
        StatusMachine quick(50ms, quick_log.Callback());
        quick.Register("s1");
        REQUIRE(quick.Transition("s1", TransferStatus::Connecting).IsOk());
        quick.Forget("s1");
        std::this_thread::sleep_for(200ms);
        REQUIRE(quick_log.Statuses().size() == 1);
        REQUIRE_FALSE(quick.Current("s1").has_value());
    }
}

#include <catch2/catch_test_macros.hpp>
#include "airlink/crypto/sodium_interop.hpp"
#include "helpers/transfer_peer.hpp"
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace airlink;
using namespace airlink::test_helpers;
using namespace airlink::transfer;
using airlink::interfaces::ConnectionInfo;

namespace {
    struct AdmissionFixture {
        std::shared_ptr<std::chrono::steady_clock::time_point> now =
            std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
        std::shared_ptr<LoopbackTransport> transport = LoopbackTransport::CreatePair().first;
        TransferPeer peer;

        explicit AdmissionFixture(const TransferConfig& config) {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            auto clock = now;
            peer = TransferPeer::Create(transport, config, SessionConfig::Default(), std::nullopt,
                                        [clock] { return *clock; });
        }

        [[nodiscard]] TransferOrchestrator& Orchestrator() const { return peer.Orchestrator(); }
    };
}

TEST_CASE("Transfer Admission - Per-device window", "[integration][admission]") {
    AdmissionFixture fixture(TransferConfig::Default().WithPerDeviceLimit(2));
    auto& orchestrator = fixture.Orchestrator();

    REQUIRE(orchestrator.StartSession("tablet", "p2p", {}).IsOk());
    REQUIRE(orchestrator.StartSession("tablet", "p2p", {}).IsOk());

    auto third = orchestrator.StartSession("tablet", "p2p", {});
    REQUIRE(third.IsErr());
    REQUIRE(third.UnwrapErr().type == TransferFailureType::RateLimitedDevice);
    REQUIRE(third.UnwrapErr().retry_after == std::chrono::milliseconds(60000));

    SECTION("Other devices are unaffected") {
        REQUIRE(orchestrator.StartSession("laptop", "p2p", {}).IsOk());
    }

    SECTION("retry_after shrinks as the window slides") {
        *fixture.now += std::chrono::seconds(15);
        auto later = orchestrator.StartSession("tablet", "p2p", {});
        REQUIRE(later.UnwrapErr().retry_after == std::chrono::milliseconds(45000));
    }

    SECTION("The window reopens") {
        *fixture.now += std::chrono::seconds(60);
        REQUIRE(orchestrator.StartSession("tablet", "p2p", {}).IsOk());
    }
}

TEST_CASE("Transfer Admission - Global window", "[integration][admission]") {
    AdmissionFixture fixture(TransferConfig::Default().WithGlobalLimit(3).WithMaxConcurrentSessions(10));
    auto& orchestrator = fixture.Orchestrator();

    REQUIRE(orchestrator.StartSession("a", "p2p", {}).IsOk());
    REQUIRE(orchestrator.StartSession("b", "p2p", {}).IsOk());
    REQUIRE(orchestrator.StartSession("c", "p2p", {}).IsOk());

    auto fourth = orchestrator.StartSession("d", "p2p", {});
    REQUIRE(fourth.IsErr());
    REQUIRE(fourth.UnwrapErr().type == TransferFailureType::RateLimitedGlobal);
    REQUIRE(fourth.UnwrapErr().retry_after.has_value());
    REQUIRE(orchestrator.GetActiveTransferCount() == 3);
}

TEST_CASE("Transfer Admission - Concurrent session cap", "[integration][admission]") {
    AdmissionFixture fixture(TransferConfig::Default().WithMaxConcurrentSessions(2));
    auto& orchestrator = fixture.Orchestrator();

    const std::string first = orchestrator.StartSession("a", "p2p", {}).Unwrap();
    const std::string second = orchestrator.StartSession("b", "p2p", {}).Unwrap();
    REQUIRE(first != second);

    auto refused = orchestrator.StartSession("c", "p2p", {});
    REQUIRE(refused.IsErr());
    REQUIRE(refused.UnwrapErr().type == TransferFailureType::ConcurrencyLimit);

    REQUIRE(orchestrator.CancelTransfer(first).IsOk());
    REQUIRE(orchestrator.GetActiveTransferCount() == 1);
    REQUIRE(orchestrator.GetTransfer(first)->status == TransferStatus::Cancelled);

    const std::string third = orchestrator.StartSession("c", "p2p", {}).Unwrap();
    REQUIRE(orchestrator.GetActiveTransferCount() == 2);

    SECTION("Transport ids are never reused") {
        std::set<int64_t> ids;
        ids.insert(orchestrator.GetTransfer(first)->transfer_id);
        ids.insert(orchestrator.GetTransfer(second)->transfer_id);
        ids.insert(orchestrator.GetTransfer(third)->transfer_id);
        REQUIRE(ids.size() == 3);
    }

    SECTION("Cancelled sessions move to history") {
        REQUIRE(orchestrator.CancelTransfer(second).IsOk());
        REQUIRE(orchestrator.GetTransferHistory().size() == 2);
    }
}

TEST_CASE("Transfer Admission - New sessions", "[integration][admission]") {
    AdmissionFixture fixture(TransferConfig::Default());
    auto& orchestrator = fixture.Orchestrator();

    TransferFile file;
    file.path = "/nonexistent/dir/holiday.png";
    const std::string sid = orchestrator.StartSession("tablet", "p2p", {file}).Unwrap();

    // Random v4 UUID.
    REQUIRE(sid.size() == 36);
    REQUIRE(sid[14] == '4');

    const auto session = orchestrator.GetTransfer(sid).value();
    REQUIRE(session.status == TransferStatus::Pending);
    REQUIRE(session.direction == TransferDirection::Outgoing);
    REQUIRE(session.target_device_id == "tablet");
    REQUIRE(session.files.size() == 1);
    REQUIRE(session.files.front().name == "holiday.png");
    REQUIRE_FALSE(session.files.front().id.empty());
    REQUIRE(orchestrator.GetActiveTransfers().size() == 1);
}

TEST_CASE("Transfer Admission - Connection lookup failures", "[integration][admission]") {
    AdmissionFixture fixture(TransferConfig::Default());
    auto& orchestrator = fixture.Orchestrator();

    SECTION("Unknown device") {
        const std::string sid = orchestrator.StartSession("ghost", "p2p", {}).Unwrap();
        auto sent = orchestrator.SendFiles(sid);
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == TransferFailureType::ConnectionInfoNotFound);

        const auto session = orchestrator.GetTransfer(sid).value();
        REQUIRE(session.status == TransferStatus::Failed);
        REQUIRE(session.error_message.has_value());
        REQUIRE(orchestrator.GetActiveTransferCount() == 0);
    }

    SECTION("BLE without a token") {
        fixture.peer.directory->Add("watch", ConnectionInfo{std::nullopt, "ble"});
        const std::string sid = orchestrator.StartSession("watch", "ble", {}).Unwrap();
        auto sent = orchestrator.SendFiles(sid);
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == TransferFailureType::MissingConnectionToken);
        REQUIRE(fixture.transport->SentTokens().empty());
    }

    SECTION("Wi-Fi Aware with an empty token") {
        fixture.peer.directory->Add("tv", ConnectionInfo{std::string(), "wifi_aware"});
        const std::string sid = orchestrator.StartSession("tv", "wifi_aware", {}).Unwrap();
        REQUIRE(orchestrator.SendFiles(sid).UnwrapErr().type == TransferFailureType::MissingConnectionToken);
    }

    SECTION("Unknown session") {
        REQUIRE(orchestrator.SendFiles("no-such-session").UnwrapErr().type == TransferFailureType::SessionNotFound);
    }
}

TEST_CASE("Transfer Admission - Control operations respect the status machine", "[integration][admission]") {
    AdmissionFixture fixture(TransferConfig::Default());
    auto& orchestrator = fixture.Orchestrator();
    const std::string sid = orchestrator.StartSession("tablet", "p2p", {}).Unwrap();

    auto paused = orchestrator.PauseTransfer(sid);
    REQUIRE(paused.IsErr());
    REQUIRE(paused.UnwrapErr().type == TransferFailureType::InvalidTransition);

    auto resumed = orchestrator.ResumeTransfer(sid);
    REQUIRE(resumed.IsErr());
    REQUIRE(resumed.UnwrapErr().type == TransferFailureType::InvalidTransition);

    REQUIRE(orchestrator.PauseTransfer("missing").UnwrapErr().type == TransferFailureType::SessionNotFound);
    REQUIRE(orchestrator.ResumeTransfer("missing").UnwrapErr().type == TransferFailureType::SessionNotFound);
    REQUIRE(orchestrator.CancelTransfer("missing").UnwrapErr().type == TransferFailureType::SessionNotFound);
}

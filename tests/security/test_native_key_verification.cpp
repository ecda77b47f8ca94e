#include <catch2/catch_test_macros.hpp>
#include "airlink/session/secure_session_manager.hpp"
#include "airlink/crypto/sodium_interop.hpp"
#include "helpers/loopback_transport.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace airlink;
using namespace airlink::session;
using airlink::configuration::EncryptionMode;
using airlink::configuration::SessionConfig;
using airlink::interfaces::TransportCapabilities;
using airlink::security::KeyManager;
using airlink::test_helpers::LoopbackTransport;

namespace {
    constexpr auto kToken = "wifi-token-1";

    SessionConfig Offload(const EncryptionMode mode) {
        return SessionConfig::Default()
            .WithEncryptionMode(mode)
            .WithVerificationAttempts(3)
            .WithVerificationBackoff(std::chrono::milliseconds(5))
            .WithVerificationTimeout(std::chrono::seconds(2));
    }

    /// One side of a keyed session whose transport can take the key.
    struct NativeFixture {
        std::shared_ptr<LoopbackTransport> transport;
        std::shared_ptr<LoopbackTransport> remote;
        std::unique_ptr<KeyManager> keys;
        std::unique_ptr<SecureSessionManager> sessions;
        std::unique_ptr<KeyManager> peer_keys;

        explicit NativeFixture(const SessionConfig& config, const bool offload = true) {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            std::tie(transport, remote) = LoopbackTransport::CreatePair();
            TransportCapabilities capabilities;
            capabilities.encryption_offload = offload;
            transport->SetCapabilities(capabilities);

            keys = KeyManager::Create().Unwrap();
            sessions = SecureSessionManager::Create(*keys, transport, config).Unwrap();
            peer_keys = KeyManager::Create().Unwrap();

            const auto local_public = sessions->CreateSession("native", "peer", std::string(kToken), "wifi").Unwrap();
            const auto remote_public = peer_keys->GenerateEphemeralKeyPair("native").Unwrap();
            REQUIRE(local_public.size() == remote_public.size());
            REQUIRE(sessions->CompleteHandshake("native", remote_public).IsOk());
        }
    };
}

TEST_CASE("Native Key - Verified hand-off", "[security][native]") {
    NativeFixture fixture(Offload(EncryptionMode::Auto));

    auto protection = fixture.sessions->PropagateKeyToTransport("native");
    REQUIRE(protection.IsOk());
    REQUIRE(protection.Unwrap() == PayloadProtection::Native);
    REQUIRE(fixture.transport->VerifyCalls() == 1);
    REQUIRE(fixture.transport->NativeKey() == fixture.keys->GetSymmetricKey("native").value());
    REQUIRE(fixture.sessions->GetSession("native").value().native_key_verified);
    REQUIRE(fixture.sessions->GetPayloadProtection("native") == PayloadProtection::Native);

    SECTION("Payloads pass through once the link encrypts") {
        const std::vector<uint8_t> data = {4, 5, 6};
        const EncryptedPayload payload = fixture.sessions->EncryptData("native", data).Unwrap();
        REQUIRE(payload.ciphertext == data);
    }
}

TEST_CASE("Native Key - Retries before giving up", "[security][native]") {
    NativeFixture fixture(Offload(EncryptionMode::Auto));

    SECTION("Two silent attempts then success") {
        fixture.transport->FailNextVerifications(2);
        REQUIRE(fixture.sessions->PropagateKeyToTransport("native").Unwrap() == PayloadProtection::Native);
        REQUIRE(fixture.transport->VerifyCalls() == 3);
    }

    SECTION("Every attempt silent falls back to local encryption") {
        fixture.transport->FailNextVerifications(3);
        REQUIRE(fixture.sessions->PropagateKeyToTransport("native").Unwrap() == PayloadProtection::Local);
        REQUIRE(fixture.transport->VerifyCalls() == 3);
        REQUIRE_FALSE(fixture.sessions->GetSession("native").value().native_key_verified);
        REQUIRE(fixture.sessions->UsesLocalEncryption("native"));
    }
}

TEST_CASE("Native Key - Refused key", "[security][native]") {
    SECTION("Native mode fails the session") {
        NativeFixture fixture(Offload(EncryptionMode::Native));
        fixture.transport->SetAcceptKey(false);
        auto protection = fixture.sessions->PropagateKeyToTransport("native");
        REQUIRE(protection.IsErr());
        REQUIRE(protection.UnwrapErr().type == SessionFailureType::NativeKeyRejected);
        REQUIRE(fixture.transport->VerifyCalls() == 0);
    }

    SECTION("Auto mode encrypts locally instead") {
        NativeFixture fixture(Offload(EncryptionMode::Auto));
        fixture.transport->SetAcceptKey(false);
        REQUIRE(fixture.sessions->PropagateKeyToTransport("native").Unwrap() == PayloadProtection::Local);
        REQUIRE(fixture.transport->NativeKey().empty());
    }

    SECTION("Native mode with failed verification") {
        NativeFixture fixture(Offload(EncryptionMode::Native));
        fixture.transport->FailNextVerifications(10);
        auto protection = fixture.sessions->PropagateKeyToTransport("native");
        REQUIRE(protection.IsErr());
        REQUIRE(protection.UnwrapErr().type == SessionFailureType::NativeKeyRejected);
    }
}

TEST_CASE("Native Key - Policy short-circuits", "[security][native]") {
    SECTION("No offload capability") {
        NativeFixture fixture(Offload(EncryptionMode::Auto), false);
        REQUIRE(fixture.sessions->PropagateKeyToTransport("native").Unwrap() == PayloadProtection::Local);
        REQUIRE(fixture.transport->NativeKey().empty());
    }

    SECTION("Local mode never touches the transport") {
        NativeFixture fixture(Offload(EncryptionMode::Local));
        REQUIRE(fixture.sessions->PropagateKeyToTransport("native").Unwrap() == PayloadProtection::Local);
        REQUIRE(fixture.transport->VerifyCalls() == 0);
        REQUIRE(fixture.transport->NativeKey().empty());
    }

    SECTION("Not ready sessions are refused") {
        NativeFixture fixture(Offload(EncryptionMode::Auto));
        REQUIRE(fixture.sessions->CreateSession("fresh", "peer", std::string(kToken), "wifi").IsOk());
        auto protection = fixture.sessions->PropagateKeyToTransport("fresh");
        REQUIRE(protection.IsErr());
        REQUIRE(protection.UnwrapErr().type == SessionFailureType::NotReady);
    }
}

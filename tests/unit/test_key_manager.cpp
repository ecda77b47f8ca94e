#include <catch2/catch_test_macros.hpp>
#include "airlink/security/key_manager.hpp"
#include "airlink/crypto/sodium_interop.hpp"
#include <chrono>
#include <string>
#include <vector>

using namespace airlink;
using namespace airlink::security;
using namespace airlink::crypto;
using airlink::configuration::KeyRotationConfig;

namespace {
    std::vector<uint8_t> Info(const std::string& session_id) {
        return CryptoPrimitives::SessionInfo(session_id);
    }

    /// Two managers that completed an ECDH exchange for @p session_id.
    void Pair(KeyManager& alice, KeyManager& bob, const std::string& session_id) {
        auto alice_pk = alice.GenerateEphemeralKeyPair(session_id).Unwrap();
        auto bob_pk = bob.GenerateEphemeralKeyPair(session_id).Unwrap();
        auto alice_secret = alice.ComputeSharedSecret(session_id, bob_pk).Unwrap();
        auto bob_secret = bob.ComputeSharedSecret(session_id, alice_pk).Unwrap();
        REQUIRE(alice.DeriveAndStoreSymmetricKey(session_id, alice_secret, Info(session_id)).IsOk());
        REQUIRE(bob.DeriveAndStoreSymmetricKey(session_id, bob_secret, Info(session_id)).IsOk());
    }

    class RecordingHandler final : public interfaces::IKeyEventHandler {
    public:
        void OnKeyRotated(const std::string&, std::span<const uint8_t> key) override {
            rotated.assign(key.begin(), key.end());
        }
        void OnRenegotiationStarted(const std::string&, std::span<const uint8_t> key) override {
            staged.assign(key.begin(), key.end());
        }
        void OnRenegotiationCompleted(const std::string&) override { ++completed; }

        std::vector<uint8_t> rotated;
        std::vector<uint8_t> staged;
        int completed = 0;
    };
}

TEST_CASE("KeyManager - Session lifecycle", "[keys][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = KeyManager::Create().Unwrap();
    auto bob = KeyManager::Create().Unwrap();
    const std::string sid = "session-lifecycle";

    REQUIRE(alice->GetState(sid) == KeySessionState::None);
    Pair(*alice, *bob, sid);
    REQUIRE(alice->GetState(sid) == KeySessionState::SymmetricKeyed);
    REQUIRE(alice->GetSymmetricKey(sid) == bob->GetSymmetricKey(sid));

    SECTION("A second key pair for a live session is refused") {
        auto again = alice->GenerateEphemeralKeyPair(sid);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == KeyManagerFailureType::InvalidState);
    }

    SECTION("Traffic decrypts on the other side") {
        const std::vector<uint8_t> data = {'h', 'i'};
        auto sealed = alice->EncryptWithSessionKey(sid, data).Unwrap();
        REQUIRE(bob->DecryptWithSessionKey(sid, sealed).Unwrap() == data);
    }

    SECTION("EndSession zeroes the key in place") {
        const auto handle = alice->DebugSymmetricKeyHandle(sid);
        REQUIRE(handle != nullptr);
        REQUIRE_FALSE(handle->IsZero());

        alice->EndSession(sid);

        REQUIRE(handle->IsZero());
        REQUIRE_FALSE(alice->GetSymmetricKey(sid).has_value());
        REQUIRE(alice->GetState(sid) == KeySessionState::Ended);
        REQUIRE_FALSE(alice->HasSession(sid));
        REQUIRE(alice->EncryptWithSessionKey(sid, std::vector<uint8_t>{1}).IsErr());
    }

    SECTION("An ended session id can be keyed again") {
        alice->EndSession(sid);
        REQUIRE(alice->GenerateEphemeralKeyPair(sid).IsOk());
        REQUIRE(alice->GetState(sid) == KeySessionState::Keyed);
    }
}

TEST_CASE("KeyManager - Unknown sessions", "[keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keys = KeyManager::Create().Unwrap();
    const std::vector<uint8_t> key(32, 0x11);

    auto stored = keys->SetSymmetricKey("missing", key);
    REQUIRE(stored.IsErr());
    REQUIRE(stored.UnwrapErr().type == KeyManagerFailureType::SessionNotFound);
    REQUIRE_FALSE(keys->GetPublicKey("missing").has_value());
    REQUIRE_FALSE(keys->ShouldRotateKey("missing"));
    REQUIRE(keys->RotateSessionKey("missing").IsErr());
    keys->EndSession("missing");
    REQUIRE(keys->GetState("missing") == KeySessionState::None);
}

TEST_CASE("KeyManager - Rotation keeps the symmetric key", "[keys][rotation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = KeyManager::Create(KeyRotationConfig::Default().WithMaxKeyUsage(2)).Unwrap();
    auto bob = KeyManager::Create().Unwrap();
    auto handler = std::make_shared<RecordingHandler>();
    alice->SetEventHandler(handler);
    const std::string sid = "session-rotation";
    Pair(*alice, *bob, sid);

    const std::vector<uint8_t> data = {1, 2, 3};
    for (int i = 0; i < 3; ++i) {
        REQUIRE(alice->EncryptWithSessionKey(sid, data).IsOk());
    }
    REQUIRE(alice->ShouldRotateKey(sid));
    REQUIRE(alice->GetKeyRotationStatus(sid)->usage_count == 3);

    const auto old_public = alice->GetPublicKey(sid).value();
    const auto symmetric = alice->GetSymmetricKey(sid).value();
    auto rotated = alice->RotateSessionKey(sid);
    REQUIRE(rotated.IsOk());
    REQUIRE(rotated.Unwrap() != old_public);
    REQUIRE(handler->rotated == rotated.Unwrap());
    REQUIRE(alice->GetSymmetricKey(sid).value() == symmetric);
    REQUIRE_FALSE(alice->ShouldRotateKey(sid));

    auto sealed = alice->EncryptWithSessionKey(sid, data).Unwrap();
    REQUIRE(bob->DecryptWithSessionKey(sid, sealed).Unwrap() == data);
}

TEST_CASE("KeyManager - Age-based rotation with an injected clock", "[keys][rotation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto now = std::chrono::steady_clock::now();
    auto keys = KeyManager::Create(
        KeyRotationConfig::Default().WithMaxKeyAge(std::chrono::minutes(5)),
        [&now] { return now; }).Unwrap();
    REQUIRE(keys->GenerateEphemeralKeyPair("aged").IsOk());
    REQUIRE(keys->SetSymmetricKey("aged", std::vector<uint8_t>(32, 0x21)).IsOk());

    REQUIRE_FALSE(keys->ShouldRotateKey("aged"));
    now += std::chrono::minutes(6);
    REQUIRE(keys->ShouldRotateKey("aged"));

    SECTION("Expired sessions are cleaned up") {
        REQUIRE(keys->CleanupExpiredSessions(std::chrono::minutes(1)) == 1);
        REQUIRE(keys->GetState("aged") == KeySessionState::Ended);
    }
}

TEST_CASE("KeyManager - Symmetric key renegotiation", "[keys][renegotiation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = KeyManager::Create().Unwrap();
    auto bob = KeyManager::Create().Unwrap();
    auto handler = std::make_shared<RecordingHandler>();
    alice->SetEventHandler(handler);
    const std::string sid = "session-renegotiate";
    Pair(*alice, *bob, sid);
    const auto original = alice->GetSymmetricKey(sid).value();

    auto alice_staged = alice->StartSymmetricKeyRenegotiation(sid).Unwrap();
    auto bob_staged = bob->StartSymmetricKeyRenegotiation(sid).Unwrap();
    REQUIRE(handler->staged == alice_staged);
    REQUIRE(alice->GetState(sid) == KeySessionState::Rotating);
    REQUIRE(alice->GetStats().pending_renegotiations == 1);
    REQUIRE(alice->GetStagedPublicKey(sid).value() == alice_staged);

    SECTION("Old key stays usable while staged") {
        REQUIRE(alice->GetSymmetricKey(sid).value() == original);
        REQUIRE(alice->RotateSessionKey(sid).IsErr());
        REQUIRE(alice->StartSymmetricKeyRenegotiation(sid).IsErr());
    }

    SECTION("Completion installs a shared new key") {
        auto alice_secret = alice->ComputeRenegotiationSecret(sid, bob_staged).Unwrap();
        auto bob_secret = bob->ComputeRenegotiationSecret(sid, alice_staged).Unwrap();
        const auto info = Info(sid);
        REQUIRE(alice->CompleteSymmetricKeyRenegotiation(sid, alice_secret, info).IsOk());
        REQUIRE(bob->CompleteSymmetricKeyRenegotiation(sid, bob_secret, info).IsOk());

        REQUIRE(alice->GetSymmetricKey(sid).value() == bob->GetSymmetricKey(sid).value());
        REQUIRE(alice->GetSymmetricKey(sid).value() != original);
        REQUIRE(alice->GetPublicKey(sid).value() == alice_staged);
        REQUIRE(alice->GetState(sid) == KeySessionState::SymmetricKeyed);
        REQUIRE_FALSE(alice->GetStagedPublicKey(sid).has_value());
        REQUIRE(handler->completed == 1);
    }

    SECTION("Cancel keeps the current key") {
        alice->CancelSymmetricKeyRenegotiation(sid);
        REQUIRE(alice->GetState(sid) == KeySessionState::SymmetricKeyed);
        REQUIRE(alice->GetSymmetricKey(sid).value() == original);
        REQUIRE(alice->ComputeRenegotiationSecret(sid, bob_staged).IsErr());
    }
}

TEST_CASE("KeyManager - Stats", "[keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keys = KeyManager::Create().Unwrap();
    REQUIRE(keys->GenerateEphemeralKeyPair("a").IsOk());
    REQUIRE(keys->GenerateEphemeralKeyPair("b").IsOk());
    REQUIRE(keys->SetSymmetricKey("a", std::vector<uint8_t>(32, 0x33)).IsOk());

    auto stats = keys->GetStats();
    REQUIRE(stats.active_sessions == 2);
    REQUIRE(stats.sessions_with_symmetric_key == 1);

    keys->EndAllSessions();
    REQUIRE(keys->GetStats().active_sessions == 0);
    REQUIRE(keys->GetState("b") == KeySessionState::Ended);
}

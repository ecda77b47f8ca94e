#include <catch2/catch_test_macros.hpp>
#include "airlink/configuration/handshake_config.hpp"
#include "airlink/configuration/key_rotation_config.hpp"
#include "airlink/configuration/session_config.hpp"
#include "airlink/configuration/transfer_config.hpp"

using namespace airlink;
using namespace airlink::configuration;
using namespace std::chrono_literals;

TEST_CASE("TransferConfig - Defaults", "[config][transfer]") {
    const auto config = TransferConfig::Default();
    REQUIRE(config.GetPerDeviceLimit() == 10);
    REQUIRE(config.GetGlobalLimit() == 50);
    REQUIRE(config.GetRateWindow() == 60s);
    REQUIRE(config.GetMaxConcurrentSessions() == 5);
    REQUIRE(config.GetStatusDebounce() == 100ms);
    REQUIRE(config.GetStallThreshold() == 60s);
    REQUIRE(config.GetRetryAttempts() == 3);
    REQUIRE(config.GetChunkSize() == 64 * 1024);
    REQUIRE(config.GetHistoryRetention() == 24h);
}

TEST_CASE("TransferConfig - Builders", "[config][transfer]") {
    const auto base = TransferConfig::Default();

    SECTION("With* returns a modified copy") {
        const auto tuned = base.WithPerDeviceLimit(1).WithStallThreshold(5s).WithChunkSize(4096);
        REQUIRE(tuned.GetPerDeviceLimit() == 1);
        REQUIRE(tuned.GetStallThreshold() == 5s);
        REQUIRE(tuned.GetChunkSize() == 4096);
        REQUIRE(base.GetPerDeviceLimit() == 10);
        REQUIRE_FALSE(tuned == base);
    }

    SECTION("Zero retry attempts still tries once") {
        REQUIRE(base.WithRetryAttempts(0).GetRetryAttempts() == 1);
    }

    SECTION("Zero chunk size falls back to the default") {
        REQUIRE(base.WithChunkSize(0).GetChunkSize() == kDefaultChunkBytes);
    }
}

TEST_CASE("SessionConfig - Encryption policy", "[config][session]") {
    const auto config = SessionConfig::Default();
    REQUIRE(config.GetRequireEncryption());
    REQUIRE(config.GetEncryptionMode() == EncryptionMode::Auto);
    REQUIRE(config.GetVerificationAttempts() == 3);

    const auto local = config.WithEncryptionMode(EncryptionMode::Local).WithRequireEncryption(false);
    REQUIRE(local.GetEncryptionMode() == EncryptionMode::Local);
    REQUIRE_FALSE(local.GetRequireEncryption());
}

TEST_CASE("KeyRotationConfig - Rotation threshold", "[config][keys]") {
    const auto config = KeyRotationConfig::Default().WithMaxKeyUsage(10).WithMaxKeyAge(1h);
    REQUIRE_FALSE(config.ShouldRotate(0ms, 10));
    REQUIRE(config.ShouldRotate(0ms, 11));
    REQUIRE(config.ShouldRotate(1h + 1ms, 0));
    REQUIRE_FALSE(config.GetAutoRotateOnEncrypt());
}

TEST_CASE("HandshakeConfig - Timeouts", "[config][handshake]") {
    const auto config = HandshakeConfig::Default().WithHandshakeTimeout(2s);
    REQUIRE(config.GetHandshakeTimeout() == 2s);
    REQUIRE(config.GetVerifyTimeout() == 30s);
    REQUIRE(config.GetRenegotiationTimeout() == 10s);
}

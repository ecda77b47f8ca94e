#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace airlink {

inline constexpr uint16_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kSessionKeyBytes = 32;
inline constexpr size_t kHkdfDefaultSaltBytes = 32;
inline constexpr size_t kSha256Bytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kSmallBufferThreshold = 1024;
inline constexpr size_t kMaxSecureBufferBytes = 1'000'000'000;
inline constexpr size_t kOpenSslErrorBufferBytes = 256;
inline constexpr size_t kFileReadBufferBytes = 64 * 1024;

inline constexpr std::string_view kSessionInfoPrefix = "airlink/v1/session:";
inline constexpr std::string_view kVerifyAadPrefix = "airlink/verify:";
inline constexpr std::string_view kVerifyPlaintext = "ok";
inline constexpr std::string_view kRekeyInfoPrefix = "airlink/v1/rekey:";

// Key derivation purpose strings
inline constexpr std::string_view kPurposeEphemeral = "ephemeral-x25519";
inline constexpr std::string_view kPurposeRotation = "rotation-x25519";
inline constexpr std::string_view kPurposeRenegotiation = "renegotiation-x25519";

// Native key verification test payload: byte i = (i * 7 + 13) & 0xFF
inline constexpr size_t kNativeVerifyPayloadBytes = 32;
inline constexpr uint32_t kNativeVerifyMultiplier = 7;
inline constexpr uint32_t kNativeVerifyOffset = 13;

// Wire envelope
inline constexpr uint32_t kWireMagic = 0xA1524C4B;
inline constexpr size_t kWireHeaderBytes = 32;
inline constexpr size_t kWireMaxPayloadBytes = 262'144;
inline constexpr size_t kWireFooterBytes = 32;
inline constexpr uint16_t kWireFlagHasFooter = 0x0001;
inline constexpr uint16_t kWireFlagEncrypted = 0x0002;

// Binary chunk frame
inline constexpr uint8_t kChunkFrameTypeFileChunk = 1;
inline constexpr size_t kChunkFrameFixedBytes = 1 + 1 + 8 + 4;
inline constexpr size_t kChunkFrameMaxFileIdBytes = 255;
inline constexpr uint8_t kJsonFrameLeadByte = 0x7B;
// Largest plaintext chunk whose sealed chunk frame still fits one wire payload.
inline constexpr size_t kWireMaxChunkDataBytes =
    kWireMaxPayloadBytes - kChunkFrameFixedBytes - kChunkFrameMaxFileIdBytes - kAesGcmNonceBytes - kAesGcmTagBytes;

// Received bytes stay in <destination>.part until the checksum verifies
inline constexpr std::string_view kPartialFileSuffix = ".part";

// Connection methods
inline constexpr std::string_view kMethodBle = "ble";
inline constexpr std::string_view kMethodWifiAware = "wifi_aware";
inline constexpr std::string_view kMethodP2p = "p2p";

// Transfer defaults
inline constexpr size_t kDefaultChunkBytes = 64 * 1024;
inline constexpr uint32_t kDefaultPerDeviceTransfers = 10;
inline constexpr uint32_t kDefaultGlobalTransfers = 50;
inline constexpr uint32_t kDefaultMaxConcurrentSessions = 5;
inline constexpr uint32_t kDefaultRetryAttempts = 3;
inline constexpr uint32_t kDefaultKeyUsageLimit = 100;
inline constexpr uint32_t kDefaultVerificationAttempts = 3;

inline constexpr std::chrono::seconds kRateLimitWindow{60};
inline constexpr std::chrono::hours kDefaultKeyMaxAge{24};
inline constexpr std::chrono::hours kDefaultSessionMaxAge{24};
inline constexpr std::chrono::hours kDefaultHistoryRetention{24};
inline constexpr std::chrono::milliseconds kDefaultStatusDebounce{100};
inline constexpr std::chrono::seconds kDefaultStallThreshold{60};
inline constexpr std::chrono::seconds kDefaultRetryBackoff{2};
inline constexpr std::chrono::seconds kDefaultHandshakeTimeout{10};
inline constexpr std::chrono::seconds kDefaultVerifyTimeout{30};
inline constexpr std::chrono::seconds kDefaultRenegotiationTimeout{10};
inline constexpr std::chrono::milliseconds kDefaultVerificationBackoff{200};
inline constexpr std::chrono::seconds kDefaultVerificationTimeout{5};
inline constexpr std::chrono::milliseconds kReceivePollInterval{50};

}  // namespace airlink

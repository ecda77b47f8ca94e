#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
namespace airlink {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class CryptoFailureType {
    InvalidKeyLength,
    WeakSecret,
    WeakKey,
    AuthenticationFailed,
    InvalidInput,
    KeyGeneration,
    DeriveKey,
    Generic
};
enum class KeyManagerFailureType {
    NoSessionKey,
    SessionNotFound,
    InvalidState,
    Crypto
};
enum class SessionFailureType {
    SessionNotFound,
    SessionExists,
    NotReady,
    VerificationFailed,
    NativeKeyRejected,
    Crypto
};
enum class HandshakeFailureType {
    Timeout,
    InvalidPeerKey,
    VerifyFailed,
    Decode,
    Encode,
    Transport,
    Session
};
enum class TransferFailureType {
    RateLimitedDevice,
    RateLimitedGlobal,
    ConcurrencyLimit,
    SessionNotFound,
    ConnectionInfoNotFound,
    MissingConnectionToken,
    Stalled,
    NativeFailure,
    HandshakeFailed,
    InvalidTransition,
    Io,
    PartialFailure,
    ChecksumMismatch,
    Rejected,
    Cancelled
};
enum class ValidationFailureType {
    ChecksumMismatch,
    MissingChecksum,
    Io
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure InvalidKeyLength(std::string msg) {
        return {CryptoFailureType::InvalidKeyLength, std::move(msg)};
    }
    static CryptoFailure WeakSecret(std::string msg) {
        return {CryptoFailureType::WeakSecret, std::move(msg)};
    }
    static CryptoFailure WeakKey(std::string msg) {
        return {CryptoFailureType::WeakKey, std::move(msg)};
    }
    static CryptoFailure AuthenticationFailed(std::string msg) {
        return {CryptoFailureType::AuthenticationFailed, std::move(msg)};
    }
    static CryptoFailure InvalidInput(std::string msg) {
        return {CryptoFailureType::InvalidInput, std::move(msg)};
    }
    static CryptoFailure KeyGeneration(std::string msg) {
        return {CryptoFailureType::KeyGeneration, std::move(msg)};
    }
    static CryptoFailure DeriveKey(std::string msg) {
        return {CryptoFailureType::DeriveKey, std::move(msg)};
    }
    static CryptoFailure Generic(std::string msg) {
        return {CryptoFailureType::Generic, std::move(msg)};
    }
    static CryptoFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case CryptoFailureType::InvalidKeyLength: return "CRYPTO_INVALID_KEY_LENGTH";
            case CryptoFailureType::WeakSecret: return "CRYPTO_WEAK_SECRET";
            case CryptoFailureType::WeakKey: return "CRYPTO_WEAK_KEY";
            case CryptoFailureType::AuthenticationFailed: return "CRYPTO_AUTH_FAILED";
            case CryptoFailureType::InvalidInput: return "CRYPTO_INVALID_INPUT";
            case CryptoFailureType::KeyGeneration: return "CRYPTO_KEY_GENERATION";
            case CryptoFailureType::DeriveKey: return "CRYPTO_DERIVE_KEY";
            case CryptoFailureType::Generic: return "CRYPTO_ERROR";
        }
        return "CRYPTO_ERROR";
    }
};

class KeyManagerFailure {
public:
    KeyManagerFailureType type;
    std::string message;
    KeyManagerFailure(const KeyManagerFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static KeyManagerFailure NoSessionKey(std::string msg) {
        return {KeyManagerFailureType::NoSessionKey, std::move(msg)};
    }
    static KeyManagerFailure SessionNotFound(std::string msg) {
        return {KeyManagerFailureType::SessionNotFound, std::move(msg)};
    }
    static KeyManagerFailure InvalidState(std::string msg) {
        return {KeyManagerFailureType::InvalidState, std::move(msg)};
    }
    static KeyManagerFailure FromCryptoFailure(const CryptoFailure& cf) {
        return {KeyManagerFailureType::Crypto, cf.message};
    }
    static KeyManagerFailure FromSodiumFailure(const SodiumFailure& sf) {
        return {KeyManagerFailureType::Crypto, sf.message};
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case KeyManagerFailureType::NoSessionKey: return "NO_SESSION_KEY";
            case KeyManagerFailureType::SessionNotFound: return "KEY_SESSION_NOT_FOUND";
            case KeyManagerFailureType::InvalidState: return "KEY_INVALID_STATE";
            case KeyManagerFailureType::Crypto: return "KEY_CRYPTO_ERROR";
        }
        return "KEY_CRYPTO_ERROR";
    }
};

class SessionFailure {
public:
    SessionFailureType type;
    std::string message;
    SessionFailure(const SessionFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SessionFailure SessionNotFound(std::string msg) {
        return {SessionFailureType::SessionNotFound, std::move(msg)};
    }
    static SessionFailure SessionExists(std::string msg) {
        return {SessionFailureType::SessionExists, std::move(msg)};
    }
    static SessionFailure NotReady(std::string msg) {
        return {SessionFailureType::NotReady, std::move(msg)};
    }
    static SessionFailure VerificationFailed(std::string msg) {
        return {SessionFailureType::VerificationFailed, std::move(msg)};
    }
    static SessionFailure NativeKeyRejected(std::string msg) {
        return {SessionFailureType::NativeKeyRejected, std::move(msg)};
    }
    static SessionFailure FromCryptoFailure(const CryptoFailure& cf) {
        return {SessionFailureType::Crypto, cf.message};
    }
    static SessionFailure FromKeyManagerFailure(const KeyManagerFailure& kf) {
        if (kf.type == KeyManagerFailureType::SessionNotFound) {
            return SessionNotFound(kf.message);
        }
        return {SessionFailureType::Crypto, kf.message};
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case SessionFailureType::SessionNotFound: return "SESSION_NOT_FOUND";
            case SessionFailureType::SessionExists: return "SESSION_EXISTS";
            case SessionFailureType::NotReady: return "SESSION_NOT_READY";
            case SessionFailureType::VerificationFailed: return "SESSION_VERIFY_FAILED";
            case SessionFailureType::NativeKeyRejected: return "NATIVE_KEY_REJECTED";
            case SessionFailureType::Crypto: return "SESSION_CRYPTO_ERROR";
        }
        return "SESSION_CRYPTO_ERROR";
    }
};

class HandshakeFailure {
public:
    HandshakeFailureType type;
    std::string message;
    HandshakeFailure(const HandshakeFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static HandshakeFailure Timeout(std::string msg) {
        return {HandshakeFailureType::Timeout, std::move(msg)};
    }
    static HandshakeFailure InvalidPeerKey(std::string msg) {
        return {HandshakeFailureType::InvalidPeerKey, std::move(msg)};
    }
    static HandshakeFailure VerifyFailed(std::string msg) {
        return {HandshakeFailureType::VerifyFailed, std::move(msg)};
    }
    static HandshakeFailure Decode(std::string msg) {
        return {HandshakeFailureType::Decode, std::move(msg)};
    }
    static HandshakeFailure Encode(std::string msg) {
        return {HandshakeFailureType::Encode, std::move(msg)};
    }
    static HandshakeFailure Transport(std::string msg) {
        return {HandshakeFailureType::Transport, std::move(msg)};
    }
    static HandshakeFailure FromSessionFailure(const SessionFailure& sf) {
        return {HandshakeFailureType::Session, sf.message};
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case HandshakeFailureType::Timeout: return "HANDSHAKE_TIMEOUT";
            case HandshakeFailureType::InvalidPeerKey: return "INVALID_PEER_KEY";
            case HandshakeFailureType::VerifyFailed: return "VERIFY_FAILED";
            case HandshakeFailureType::Decode: return "HANDSHAKE_DECODE";
            case HandshakeFailureType::Encode: return "HANDSHAKE_ENCODE";
            case HandshakeFailureType::Transport: return "HANDSHAKE_TRANSPORT";
            case HandshakeFailureType::Session: return "HANDSHAKE_FAILED";
        }
        return "HANDSHAKE_FAILED";
    }
};

class ValidationFailure {
public:
    ValidationFailureType type;
    std::string message;
    ValidationFailure(const ValidationFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ValidationFailure ChecksumMismatch(std::string msg) {
        return {ValidationFailureType::ChecksumMismatch, std::move(msg)};
    }
    static ValidationFailure MissingChecksum(std::string msg) {
        return {ValidationFailureType::MissingChecksum, std::move(msg)};
    }
    static ValidationFailure Io(std::string msg) {
        return {ValidationFailureType::Io, std::move(msg)};
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case ValidationFailureType::ChecksumMismatch: return "CHECKSUM_MISMATCH";
            case ValidationFailureType::MissingChecksum: return "CHECKSUM_MISSING";
            case ValidationFailureType::Io: return "CHECKSUM_IO";
        }
        return "CHECKSUM_IO";
    }
};

class TransferFailure {
public:
    TransferFailureType type;
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after;
    TransferFailure(const TransferFailureType t, std::string msg,
                    std::optional<std::chrono::milliseconds> retry = std::nullopt)
        : type(t), message(std::move(msg)), retry_after(retry) {}
    static TransferFailure RateLimitedDevice(std::string msg, std::chrono::milliseconds retry) {
        return {TransferFailureType::RateLimitedDevice, std::move(msg), retry};
    }
    static TransferFailure RateLimitedGlobal(std::string msg, std::chrono::milliseconds retry) {
        return {TransferFailureType::RateLimitedGlobal, std::move(msg), retry};
    }
    static TransferFailure ConcurrencyLimit(std::string msg) {
        return {TransferFailureType::ConcurrencyLimit, std::move(msg)};
    }
    static TransferFailure SessionNotFound(std::string msg) {
        return {TransferFailureType::SessionNotFound, std::move(msg)};
    }
    static TransferFailure ConnectionInfoNotFound(std::string msg) {
        return {TransferFailureType::ConnectionInfoNotFound, std::move(msg)};
    }
    static TransferFailure MissingConnectionToken(std::string msg) {
        return {TransferFailureType::MissingConnectionToken, std::move(msg)};
    }
    static TransferFailure Stalled(std::string msg) {
        return {TransferFailureType::Stalled, std::move(msg)};
    }
    static TransferFailure NativeFailure(std::string msg) {
        return {TransferFailureType::NativeFailure, std::move(msg)};
    }
    static TransferFailure HandshakeFailed(std::string msg) {
        return {TransferFailureType::HandshakeFailed, std::move(msg)};
    }
    static TransferFailure InvalidTransition(std::string msg) {
        return {TransferFailureType::InvalidTransition, std::move(msg)};
    }
    static TransferFailure Io(std::string msg) {
        return {TransferFailureType::Io, std::move(msg)};
    }
    static TransferFailure PartialFailure(std::string msg) {
        return {TransferFailureType::PartialFailure, std::move(msg)};
    }
    static TransferFailure ChecksumMismatch(std::string msg) {
        return {TransferFailureType::ChecksumMismatch, std::move(msg)};
    }
    static TransferFailure Rejected(std::string msg) {
        return {TransferFailureType::Rejected, std::move(msg)};
    }
    static TransferFailure Cancelled(std::string msg) {
        return {TransferFailureType::Cancelled, std::move(msg)};
    }
    static TransferFailure FromHandshakeFailure(const HandshakeFailure& hf) {
        return HandshakeFailed(std::string(hf.Code()) + ": " + hf.message);
    }
    static TransferFailure FromSessionFailure(const SessionFailure& sf) {
        return NativeFailure(std::string(sf.Code()) + ": " + sf.message);
    }
    static TransferFailure FromValidationFailure(const ValidationFailure& vf) {
        if (vf.type == ValidationFailureType::ChecksumMismatch) {
            return ChecksumMismatch(vf.message);
        }
        return Io(vf.message);
    }
    [[nodiscard]] bool IsTransient() const noexcept {
        return type == TransferFailureType::NativeFailure || type == TransferFailureType::Io;
    }
    [[nodiscard]] std::string_view Code() const noexcept {
        switch (type) {
            case TransferFailureType::RateLimitedDevice: return "RATE_LIMIT_DEVICE";
            case TransferFailureType::RateLimitedGlobal: return "RATE_LIMIT_GLOBAL";
            case TransferFailureType::ConcurrencyLimit: return "CONCURRENT_LIMIT";
            case TransferFailureType::SessionNotFound: return "SESSION_NOT_FOUND";
            case TransferFailureType::ConnectionInfoNotFound: return "CONNECTION_INFO_NOT_FOUND";
            case TransferFailureType::MissingConnectionToken: return "MISSING_CONNECTION_TOKEN";
            case TransferFailureType::Stalled: return "TRANSFER_STALLED";
            case TransferFailureType::NativeFailure: return "NATIVE_FAILURE";
            case TransferFailureType::HandshakeFailed: return "HANDSHAKE_FAILED";
            case TransferFailureType::InvalidTransition: return "INVALID_TRANSITION";
            case TransferFailureType::Io: return "TRANSFER_IO";
            case TransferFailureType::PartialFailure: return "PARTIAL_FAILURE";
            case TransferFailureType::ChecksumMismatch: return "CHECKSUM_MISMATCH";
            case TransferFailureType::Rejected: return "FILE_REJECTED";
            case TransferFailureType::Cancelled: return "TRANSFER_CANCELLED";
        }
        return "TRANSFER_ERROR";
    }
};
}

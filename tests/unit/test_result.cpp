#include <catch2/catch_test_macros.hpp>
#include "airlink/core/result.hpp"
#include "airlink/core/failures.hpp"
#include <string>

using namespace airlink;

namespace {
    Result<int, std::string> ParsePositive(const int value) {
        if (value <= 0) {
            return Result<int, std::string>::Err("not positive");
        }
        return Result<int, std::string>::Ok(value);
    }

    Result<std::string, std::string> Describe(const int value) {
        AIRLINK_TRY(ParsePositive(value));
        return Result<std::string, std::string>::Ok("positive " + std::to_string(value));
    }
}

TEST_CASE("Result - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }

    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }

    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }

    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
}

TEST_CASE("Result - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }

    SECTION("MapErr transforms Err value") {
        auto mapped = Result<int, std::string>::Err("error").MapErr([](std::string s) { return s + "!"; });
        REQUIRE(mapped.UnwrapErr() == "error!");
    }

    SECTION("Bind chains operations") {
        auto bound = Result<int, std::string>::Ok(10).Bind([](int x) { return ParsePositive(x - 20); });
        REQUIRE(bound.IsErr());
        REQUIRE(bound.UnwrapErr() == "not positive");
    }

    SECTION("UnwrapOr returns default on Err") {
        REQUIRE(Result<int, std::string>::Err("error").UnwrapOr(7) == 7);
    }
}

TEST_CASE("Result - AIRLINK_TRY propagation", "[result][core]") {
    REQUIRE(Describe(3).Unwrap() == "positive 3");
    REQUIRE(Describe(-1).UnwrapErr() == "not positive");
}

TEST_CASE("Failures - Conversion keeps the message", "[result][failures]") {
    const auto key_failure = KeyManagerFailure::FromCryptoFailure(CryptoFailure::WeakSecret("low order point"));
    const auto session_failure = SessionFailure::FromKeyManagerFailure(key_failure);
    const auto handshake_failure = HandshakeFailure::FromSessionFailure(session_failure);
    const auto transfer_failure = TransferFailure::FromHandshakeFailure(handshake_failure);

    REQUIRE(transfer_failure.type == TransferFailureType::HandshakeFailed);
    REQUIRE(transfer_failure.message.find("low order point") != std::string::npos);
    REQUIRE(transfer_failure.Code() == "HANDSHAKE_FAILED");

    SECTION("Key manager lookups stay SessionNotFound") {
        const auto failure = SessionFailure::FromKeyManagerFailure(KeyManagerFailure::SessionNotFound("x"));
        REQUIRE(failure.type == SessionFailureType::SessionNotFound);
    }

    SECTION("Only native and I/O failures are transient") {
        REQUIRE(TransferFailure::Io("disk").IsTransient());
        REQUIRE(TransferFailure::NativeFailure("link").IsTransient());
        REQUIRE_FALSE(TransferFailure::ChecksumMismatch("bad").IsTransient());
        REQUIRE_FALSE(TransferFailure::Stalled("idle").IsTransient());
        REQUIRE_FALSE(TransferFailure::Cancelled("user").IsTransient());
        REQUIRE_FALSE(TransferFailure::Rejected("peer").IsTransient());
    }
}

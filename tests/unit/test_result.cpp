#include <catch2/catch_test_macros.hpp>
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <string>
using namespace certdel::protocol;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
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
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::runtime_error);
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == unit);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("Bind short-circuits on Err") {
        auto result = Result<int, std::string>::Err("first");
        bool called = false;
        auto bound = std::move(result).Bind([&called](int x) {
            called = true;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE(bound.IsErr());
        REQUIRE(bound.UnwrapErr() == "first");
        REQUIRE_FALSE(called);
    }
}
TEST_CASE("Result<T, E> - UnwrapOr and Ok", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
    SECTION("Ok converts to optional") {
        REQUIRE(Result<int, std::string>::Ok(7).Ok() == std::optional<int>(7));
        REQUIRE_FALSE(Result<int, std::string>::Err("e").Ok().has_value());
    }
}
TEST_CASE("ProtocolFailure - Factories and sodium conversion", "[result][core]") {
    SECTION("Factories set the failure type") {
        REQUIRE(ProtocolFailure::LengthMismatch("x").type == ProtocolFailureType::LengthMismatch);
        REQUIRE(ProtocolFailure::UnknownCode("x").type == ProtocolFailureType::UnknownCode);
        REQUIRE(ProtocolFailure::MalformedMeasurement("x").type == ProtocolFailureType::MalformedMeasurement);
        REQUIRE(ProtocolFailure::ConfigurationError("bad").message == "bad");
        REQUIRE(FailureTypeName(ProtocolFailureType::MalformedMeasurement) == "MalformedMeasurement");
    }
    SECTION("Sodium failures keep their message") {
        auto failure = ProtocolFailure::FromSodiumFailure(SodiumFailure::ComparisonFailed("cmp"));
        REQUIRE(failure.message.find("cmp") != std::string::npos);
    }
}

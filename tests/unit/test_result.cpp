#include <catch2/catch_test_macros.hpp>
#include "cypherpunk/core/result.hpp"
#include "cypherpunk/core/failures.hpp"
#include <stdexcept>
#include <string>
using namespace cypherpunk::remailer;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
        REQUIRE(result.IsOkAnd([](const int x) { return x > 40; }));
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
        REQUIRE_FALSE(result.IsOkAnd([](const int) { return true; }));
    }
    SECTION("Same type on both sides stays unambiguous") {
        auto ok = Result<std::string, std::string>::Ok("value");
        auto err = Result<std::string, std::string>::Err("value");
        REQUIRE(ok.IsOk());
        REQUIRE(err.IsErr());
    }
    SECTION("Unwrap on the wrong side throws") {
        auto ok = Result<int, std::string>::Ok(1);
        auto err = Result<int, std::string>::Err("e");
        REQUIRE_THROWS_AS(ok.UnwrapErr(), std::logic_error);
        REQUIRE_THROWS_AS(err.Unwrap(), std::logic_error);
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, RemailerFailure>::Ok(unit);
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
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) { return s.size(); });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == 5);
    }
    SECTION("Bind chains operations and short-circuits on Err") {
        auto halve = [](int x) {
            if (x % 2 == 0) {
                return Result<int, std::string>::Ok(x / 2);
            }
            return Result<int, std::string>::Err("odd");
        };
        auto bound = Result<int, std::string>::Ok(20).Bind(halve).Bind(halve);
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 5);
        auto failed = Result<int, std::string>::Ok(6).Bind(halve).Bind(halve);
        REQUIRE(failed.IsErr());
        REQUIRE(failed.UnwrapErr() == "odd");
    }
    SECTION("UnwrapOr and optional conversions") {
        REQUIRE(Result<int, std::string>::Ok(42).UnwrapOr(0) == 42);
        REQUIRE(Result<int, std::string>::Err("e").UnwrapOr(7) == 7);
        REQUIRE(Result<int, std::string>::Ok(3).Ok() == 3);
        REQUIRE_FALSE(Result<int, std::string>::Ok(3).Err().has_value());
    }
}
TEST_CASE("RemailerFailure - Describe names position and remailer", "[result][failures]") {
    SECTION("Capability mismatch carries both") {
        const auto failure = RemailerFailure::CapabilityMismatch("paranoia", 0, "middle-hop");
        REQUIRE(failure.type == RemailerFailureType::CapabilityMismatch);
        REQUIRE(failure.remailer == "paranoia");
        REQUIRE(failure.position == 0u);
        const auto text = failure.Describe();
        REQUIRE(text.find("paranoia") != std::string::npos);
        REQUIRE(text.find("position 0") != std::string::npos);
    }
    SECTION("Unknown remailer keeps the name as typed") {
        const auto failure = RemailerFailure::UnknownRemailer("UnknownName");
        REQUIRE(failure.type == RemailerFailureType::UnknownRemailer);
        REQUIRE(failure.remailer == "UnknownName");
        REQUIRE_FALSE(failure.position.has_value());
    }
    SECTION("Backend failure names the hop") {
        const auto failure = RemailerFailure::BackendFailure("dizum", "gpg exited with code 2");
        REQUIRE(failure.type == RemailerFailureType::BackendFailure);
        REQUIRE(failure.remailer == "dizum");
        REQUIRE(failure.message.find("gpg exited") != std::string::npos);
    }
    SECTION("Every type has a printable name") {
        REQUIRE(ToString(RemailerFailureType::EmptyChain) == "EmptyChain");
        REQUIRE(ToString(RemailerFailureType::UnsupportedFormat) == "UnsupportedFormat");
    }
}

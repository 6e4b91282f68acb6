#include <catch2/catch_test_macros.hpp>
#include "turnkit/core/result.hpp"

#include <string>

using namespace turnkit::core;

namespace {

Result<int, Error> parse_positive(int value) {
    if (value <= 0) {
        return Result<int, Error>::err(ErrorCode::InvalidArgument, "not positive", std::to_string(value));
    }
    return Result<int, Error>::ok(value);
}

}  // namespace

TEST_CASE("Result with value", "[result]") {
    auto result = Result<int, std::string>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
}

TEST_CASE("Result with error", "[result]") {
    auto result = Result<int, std::string>::err("something went wrong");

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error() == "something went wrong");
}

TEST_CASE("Result void success", "[result]") {
    auto result = Result<void, std::string>::ok();

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
}

TEST_CASE("Result void error", "[result]") {
    auto result = Result<void, std::string>::err("error message");

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error() == "error message");
}

TEST_CASE("Result map and and_then", "[result]") {
    auto result = Result<int, Error>::ok(20);

    auto mapped = result.map([](int v) { return v + 1; });
    REQUIRE(mapped.value() == 21);

    auto chained = result.and_then([](int v) { return parse_positive(v - 30); });
    REQUIRE(chained.is_err());
    REQUIRE(chained.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Error full message carries context and source", "[result]") {
    Error error{ErrorCode::ToolNotFound, "Tool not found", "search"};
    error.with_source("registry");

    REQUIRE(error.full_message() == "Tool not found [search] at registry");
    REQUIRE(error.is_retriable());
    REQUIRE_FALSE(error.is_fatal());
    REQUIRE(Error{ErrorCode::MaxTurnsExceeded}.is_fatal());
}

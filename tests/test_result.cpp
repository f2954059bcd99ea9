#include <catch2/catch_test_macros.hpp>

#include "cloudlab/result.h"

TEST_CASE("Result<int> ok value", "[result]") {
    auto result = cloudlab::Result<int>::ok(42);
    REQUIRE(result.ok() == true);
    REQUIRE(static_cast<bool>(result));
    REQUIRE(result.value() == 42);
}

TEST_CASE("Result<int> error", "[result]") {
    auto result = cloudlab::Result<int>::error(cloudlab::ErrorCode::InvalidArgument, "bad input");
    REQUIRE(result.ok() == false);
    REQUIRE(result.error().code == cloudlab::ErrorCode::InvalidArgument);
    REQUIRE(result.error().message == "bad input");
}

TEST_CASE("Result<std::string> moves its value", "[result]") {
    auto result = cloudlab::Result<std::string>::ok(std::string(1000, 'x'));
    REQUIRE(result.ok());
    std::string taken = std::move(result.value());
    REQUIRE(taken.size() == 1000);
}

TEST_CASE("Result<void> success", "[result]") {
    auto result = cloudlab::Result<void>::success();
    REQUIRE(result.ok() == true);
}

TEST_CASE("Result<void> failure", "[result]") {
    auto result = cloudlab::Result<void>::failure(cloudlab::ErrorCode::AddressInUse, "busy");
    REQUIRE(result.ok() == false);
    REQUIRE(result.error().code == cloudlab::ErrorCode::AddressInUse);
}

TEST_CASE("Command error codes map to reason strings", "[result]") {
    REQUIRE(cloudlab::error_code_name(cloudlab::ErrorCode::CommandTimeout) == "timeout");
    REQUIRE(cloudlab::error_code_name(cloudlab::ErrorCode::CommandNotFound) == "not_found");
    REQUIRE(cloudlab::error_code_name(cloudlab::ErrorCode::CommandFailed) == "error");
    REQUIRE(cloudlab::error_code_name(cloudlab::ErrorCode::AddressInUse) == "address_in_use");
}

#include <catch2/catch_test_macros.hpp>
#include "simhsm/configuration/store_config.hpp"
#include <string>
using namespace simhsm;
using namespace simhsm::configuration;
TEST_CASE("StoreConfig - Defaults", "[config]") {
    const auto config = StoreConfig::Default();
    REQUIRE(config.GetAuthenticationKeyId() == 1);
    REQUIRE(config.GetAuthenticationKeyLabel() == "DEFAULT AUTHKEY CHANGE THIS ASAP");
    REQUIRE(config.GetPassword() == "password");
    REQUIRE(config.Validate().IsOk());
}
TEST_CASE("StoreConfig - Overrides", "[config]") {
    const auto base = StoreConfig::Default();
    SECTION("With* returns a modified copy") {
        const auto custom = base.WithAuthenticationKeyId(7).WithPassword("hunter2");
        REQUIRE(custom.GetAuthenticationKeyId() == 7);
        REQUIRE(custom.GetPassword() == "hunter2");
        REQUIRE(base.GetAuthenticationKeyId() == 1);
        REQUIRE_FALSE(custom == base);
    }
    SECTION("Label over 40 bytes is invalid") {
        auto result = base.WithAuthenticationKeyLabel(std::string(41, 'L')).Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Empty password is invalid") {
        REQUIRE(base.WithPassword("").Validate().IsErr());
    }
}

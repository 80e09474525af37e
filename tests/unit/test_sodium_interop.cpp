#include <catch2/catch_test_macros.hpp>
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace simhsm;
using namespace simhsm::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Small buffer is zeroed") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Large buffer is zeroed") {
        std::vector<uint8_t> buffer(Constants::SMALL_BUFFER_THRESHOLD * 4, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}


TEST_CASE("SodiumInterop - Random fill", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> first(32, 0);
    std::vector<uint8_t> second(32, 0);
    SodiumInterop::FillRandom(first);
    SodiumInterop::FillRandom(second);
    REQUIRE(first != second);
    REQUIRE(std::any_of(first.begin(), first.end(), [](uint8_t b) { return b != 0; }));
}

#include <catch2/catch_test_macros.hpp>
#include "simhsm/enums/algorithm.hpp"
#include "simhsm/enums/object_origin.hpp"
#include "simhsm/enums/object_type.hpp"
using namespace simhsm;
using namespace simhsm::enums;
TEST_CASE("ObjectOrigin - Promotion on wrap", "[origin][enums]") {
    SECTION("Local origins gain the wrapped bit") {
        REQUIRE(PromoteOnWrap(ObjectOrigin::Generated) == ObjectOrigin::WrappedGenerated);
        REQUIRE(PromoteOnWrap(ObjectOrigin::Imported) == ObjectOrigin::WrappedImported);
    }
    SECTION("Promotion is idempotent") {
        REQUIRE(PromoteOnWrap(ObjectOrigin::WrappedGenerated) == ObjectOrigin::WrappedGenerated);
        REQUIRE(PromoteOnWrap(PromoteOnWrap(ObjectOrigin::Imported)) == ObjectOrigin::WrappedImported);
    }
    SECTION("Parsing from device bytes") {
        REQUIRE(ObjectOriginFromU8(0x11) == ObjectOrigin::WrappedGenerated);
        REQUIRE_FALSE(ObjectOriginFromU8(0x03).has_value());
    }
}
TEST_CASE("Algorithm - Classification", "[algorithm][enums]") {
    SECTION("Family and object type") {
        REQUIRE(FamilyOf(Algorithm::Aes256CcmWrap) == AlgorithmFamily::Wrap);
        REQUIRE(ObjectTypeFor(Algorithm::Aes256CcmWrap) == ObjectType::WrapKey);
        REQUIRE(ObjectTypeFor(Algorithm::HmacSha384) == ObjectType::HmacKey);
        REQUIRE(ObjectTypeFor(Algorithm::EcEd25519) == ObjectType::AsymmetricKey);
        REQUIRE(ObjectTypeFor(Algorithm::Aes128) == ObjectType::SymmetricKey);
        REQUIRE(ObjectTypeFor(Algorithm::OpaqueX509Certificate) == ObjectType::Opaque);
        REQUIRE(ObjectTypeFor(Algorithm::YubicoAesAuthentication) == ObjectType::AuthenticationKey);
    }
    SECTION("Generated key lengths") {
        REQUIRE(GeneratedKeyLength(Algorithm::Aes128CcmWrap) == 16u);
        REQUIRE(GeneratedKeyLength(Algorithm::Aes192) == 24u);
        REQUIRE(GeneratedKeyLength(Algorithm::HmacSha1) == 20u);
        REQUIRE(GeneratedKeyLength(Algorithm::HmacSha512) == 64u);
        REQUIRE_FALSE(GeneratedKeyLength(Algorithm::Rsa2048).has_value());
        REQUIRE_FALSE(GeneratedKeyLength(Algorithm::OpaqueData).has_value());
    }
    SECTION("Parsing from device bytes") {
        REQUIRE(AlgorithmFromU8(42) == Algorithm::Aes256CcmWrap);
        REQUIRE(AlgorithmFromU8(46) == Algorithm::EcEd25519);
        REQUIRE_FALSE(AlgorithmFromU8(0).has_value());
        REQUIRE_FALSE(AlgorithmFromU8(200).has_value());
    }
}
TEST_CASE("ObjectType - Parsing", "[object_type][enums]") {
    REQUIRE(ObjectTypeFromU8(0x04) == ObjectType::WrapKey);
    REQUIRE(ObjectTypeFromU8(0x08) == ObjectType::SymmetricKey);
    REQUIRE_FALSE(ObjectTypeFromU8(0x00).has_value());
    REQUIRE_FALSE(ObjectTypeFromU8(0x09).has_value());
}

#include <catch2/catch_test_macros.hpp>
#include "simhsm/models/object.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include <vector>
using namespace simhsm;
using namespace simhsm::models;
using enums::Algorithm;
using enums::ObjectType;
namespace {
ObjectInfo InfoFor(const ObjectType type, const Algorithm algorithm) {
    ObjectInfo info;
    info.object_id = 0x42;
    info.object_type = type;
    info.algorithm = algorithm;
    info.capabilities = Capability::SIGN_HMAC;
    info.domains = Domain::DOM2;
    return info;
}
}
TEST_CASE("Object - Construction", "[object][models]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Length is taken from the payload") {
        auto info = InfoFor(ObjectType::HmacKey, Algorithm::HmacSha256);
        info.length = 999;
        auto object = Object::Create(info, Payload::FromBytes(Algorithm::HmacSha256, std::vector<uint8_t>(40, 3)).Unwrap());
        REQUIRE(object.IsOk());
        REQUIRE(object.Unwrap().Info().length == 40);
        REQUIRE(object.Unwrap().Info().sequence == 1);
        REQUIRE(object.Unwrap().Handle() == ObjectHandle(0x42, ObjectType::HmacKey));
    }
    SECTION("Algorithm must belong to the object type") {
        auto object = Object::Create(
            InfoFor(ObjectType::WrapKey, Algorithm::HmacSha256),
            Payload::Generate(Algorithm::HmacSha256).Unwrap());
        REQUIRE(object.IsErr());
        REQUIRE(object.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Payload must match the declared algorithm") {
        auto object = Object::Create(
            InfoFor(ObjectType::HmacKey, Algorithm::HmacSha512),
            Payload::Generate(Algorithm::HmacSha256).Unwrap());
        REQUIRE(object.IsErr());
        REQUIRE(object.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
}

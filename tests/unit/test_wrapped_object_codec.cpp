#include <catch2/catch_test_macros.hpp>
#include "simhsm/models/wrapped_object.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "models/wrapped_object.pb.h"
#include <string>
#include <vector>
using namespace simhsm;
using namespace simhsm::models;
using enums::Algorithm;
using enums::ObjectOrigin;
using enums::ObjectType;
namespace {
WrappedObject SampleEnvelope() {
    WrappedObject wrapped;
    wrapped.object_info.object_id = 0x0102;
    wrapped.object_info.object_type = ObjectType::AsymmetricKey;
    wrapped.object_info.algorithm = Algorithm::EcEd25519;
    wrapped.object_info.capabilities = Capability::SIGN_EDDSA | Capability::EXPORTABLE_UNDER_WRAP;
    wrapped.object_info.delegated_capabilities = Capability::None();
    wrapped.object_info.domains = Domain::DOM1 | Domain::DOM16;
    wrapped.object_info.length = 32;
    wrapped.object_info.origin = ObjectOrigin::WrappedGenerated;
    wrapped.object_info.label = ObjectLabel::FromString("signing key").Unwrap();
    wrapped.data.assign(32, 0xA5);
    return wrapped;
}
}
TEST_CASE("WrappedObjectCodec - Encoding", "[codec][models]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto envelope = SampleEnvelope();
    SECTION("Decode restores every field") {
        auto encoded = WrappedObjectCodec::Encode(envelope);
        REQUIRE(encoded.IsOk());
        auto decoded = WrappedObjectCodec::Decode(encoded.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().object_info == envelope.object_info);
        REQUIRE(decoded.Unwrap().data == envelope.data);
    }
    SECTION("Encoding is deterministic") {
        REQUIRE(WrappedObjectCodec::Encode(envelope).Unwrap() == WrappedObjectCodec::Encode(envelope).Unwrap());
    }
}
TEST_CASE("WrappedObjectCodec - Decode validation", "[codec][models]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto expect_decode_error = [](const std::vector<uint8_t>& encoded) {
        auto decoded = WrappedObjectCodec::Decode(encoded);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == HsmFailureType::Decode);
    };
    SECTION("Garbage input") {
        expect_decode_error({0xFF, 0xFF, 0xFF, 0xFF});
    }
    SECTION("Empty input has no object info") {
        expect_decode_error({});
    }
    SECTION("Declared length must match the data") {
        auto envelope = SampleEnvelope();
        envelope.object_info.length = 31;
        expect_decode_error(WrappedObjectCodec::Encode(envelope).Unwrap());
    }
    SECTION("Unknown algorithm byte") {
        auto envelope = SampleEnvelope();
        envelope.object_info.algorithm = static_cast<Algorithm>(200);
        expect_decode_error(WrappedObjectCodec::Encode(envelope).Unwrap());
    }
    SECTION("Unknown origin byte") {
        auto envelope = SampleEnvelope();
        envelope.object_info.origin = static_cast<ObjectOrigin>(0x05);
        expect_decode_error(WrappedObjectCodec::Encode(envelope).Unwrap());
    }
    SECTION("Unknown object type byte") {
        auto envelope = SampleEnvelope();
        envelope.object_info.object_type = static_cast<ObjectType>(0x7F);
        expect_decode_error(WrappedObjectCodec::Encode(envelope).Unwrap());
    }
    SECTION("Label that is not UTF-8") {
        const auto encoded = WrappedObjectCodec::Encode(SampleEnvelope()).Unwrap();
        proto::models::WrappedObject message;
        REQUIRE(message.ParseFromArray(encoded.data(), static_cast<int>(encoded.size())));
        message.mutable_object_info()->set_label(std::string("key\xC3\x28", 5));
        std::string tampered;
        REQUIRE(message.SerializeToString(&tampered));
        expect_decode_error(std::vector<uint8_t>(tampered.begin(), tampered.end()));
    }
}

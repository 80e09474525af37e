#include <catch2/catch_test_macros.hpp>
#include "helpers/store_fixtures.hpp"
#include "simhsm/models/authentication_key.hpp"
#include <vector>
using namespace simhsm;
using namespace simhsm::test_helpers;
using enums::Algorithm;
using enums::ObjectOrigin;
using enums::ObjectType;
TEST_CASE("Store - Bootstrap authentication key", "[store][integration]") {
    auto store = MakeStore();
    REQUIRE(store.Size() == 1);

    const auto* auth = store.Get(ObjectConstants::DEFAULT_AUTHENTICATION_KEY_ID, ObjectType::AuthenticationKey);
    REQUIRE(auth != nullptr);
    const auto& info = auth->Info();
    REQUIRE(info.algorithm == Algorithm::YubicoAesAuthentication);
    REQUIRE(info.capabilities == Capability::All());
    REQUIRE(info.delegated_capabilities == Capability::All());
    REQUIRE(info.domains == Domain::All());
    REQUIRE(info.origin == ObjectOrigin::Imported);
    REQUIRE(info.sequence == 1);
    REQUIRE(info.length == AuthenticationKeyConstants::KEY_SIZE);
    REQUIRE(info.label.Value() == ObjectConstants::DEFAULT_AUTHENTICATION_KEY_LABEL);

    auto expected = models::AuthenticationKey::Default().Unwrap().GetKeyHandle()
        .ReadBytes(AuthenticationKeyConstants::KEY_SIZE).Unwrap();
    REQUIRE(PayloadBytes(store, 1, ObjectType::AuthenticationKey) == expected);
}
TEST_CASE("Store - Custom bootstrap configuration", "[store][integration]") {
    SECTION("Id, label and password are honored") {
        const auto config = configuration::StoreConfig::Default()
            .WithAuthenticationKeyId(2)
            .WithAuthenticationKeyLabel("operator")
            .WithPassword("correct horse");
        auto created = Objects::Create(config);
        REQUIRE(created.IsOk());
        auto store = std::move(created).Unwrap();
        REQUIRE(store.Size() == 1);
        REQUIRE_FALSE(store.Contains(1, ObjectType::AuthenticationKey));
        const auto* auth = store.Get(2, ObjectType::AuthenticationKey);
        REQUIRE(auth != nullptr);
        REQUIRE(auth->Info().label.Value() == "operator");

        auto expected = models::AuthenticationKey::DeriveFromPassword("correct horse").Unwrap()
            .GetKeyHandle().ReadBytes(AuthenticationKeyConstants::KEY_SIZE).Unwrap();
        REQUIRE(PayloadBytes(store, 2, ObjectType::AuthenticationKey) == expected);
    }
    SECTION("Invalid configuration is refused") {
        auto created = Objects::Create(configuration::StoreConfig::Default().WithPassword(""));
        REQUIRE(created.IsErr());
        REQUIRE(created.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
}
TEST_CASE("Store - Generate, put, get, remove", "[store][integration]") {
    auto store = MakeStore();

    SECTION("Generated object carries its metadata") {
        auto handle = store.Generate(5, ObjectType::HmacKey, Algorithm::HmacSha256, Label("mac"),
            Capability::SIGN_HMAC | Capability::VERIFY_HMAC, Capability::None(), Domain::DOM1 | Domain::DOM2);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap() == models::ObjectHandle(5, ObjectType::HmacKey));
        const auto* object = store.Get(5, ObjectType::HmacKey);
        REQUIRE(object != nullptr);
        REQUIRE(object->Info().origin == ObjectOrigin::Generated);
        REQUIRE(object->Info().sequence == 1);
        REQUIRE(object->Info().length == object->GetPayload().Length());
        REQUIRE(object->Info().domains == (Domain::DOM1 | Domain::DOM2));
        REQUIRE(store.Size() == 2);
    }
    SECTION("Imported object keeps the supplied bytes") {
        const std::vector<uint8_t> data{'c', 'e', 'r', 't'};
        REQUIRE(store.Put(7, ObjectType::Opaque, Algorithm::OpaqueData, Label("blob"),
            Capability::None(), Capability::None(), Domain::DOM3, data).IsOk());
        REQUIRE(store.Get(7, ObjectType::Opaque)->Info().origin == ObjectOrigin::Imported);
        REQUIRE(store.Get(7, ObjectType::Opaque)->Info().length == data.size());
        REQUIRE(PayloadBytes(store, 7, ObjectType::Opaque) == data);
    }
    SECTION("Lookup is by id and type together") {
        GenerateExportableAes256(store, 9);
        REQUIRE(store.Get(9, ObjectType::SymmetricKey) != nullptr);
        REQUIRE(store.Get(9, ObjectType::WrapKey) == nullptr);
        REQUIRE(store.Get(8, ObjectType::SymmetricKey) == nullptr);
    }
    SECTION("Remove hands the object back once") {
        GenerateExportableAes256(store, 9);
        auto removed = store.Remove(9, ObjectType::SymmetricKey);
        REQUIRE(removed.has_value());
        REQUIRE(removed->Handle() == models::ObjectHandle(9, ObjectType::SymmetricKey));
        REQUIRE(store.Size() == 1);
        REQUIRE_FALSE(store.Remove(9, ObjectType::SymmetricKey).has_value());
    }
}
TEST_CASE("Store - Failed inserts leave the store unchanged", "[store][integration]") {
    auto store = MakeStore();
    GenerateExportableAes256(store, TARGET_ID);
    const auto original = PayloadBytes(store, TARGET_ID, ObjectType::SymmetricKey);

    SECTION("Duplicate handle") {
        auto generated = store.Generate(TARGET_ID, ObjectType::SymmetricKey, Algorithm::Aes128, Label("again"),
            Capability::None(), Capability::None(), Domain::DOM1);
        REQUIRE(generated.UnwrapErr().type == HsmFailureType::AlreadyExists);
        REQUIRE(generated.UnwrapErr().handle == models::ObjectHandle(TARGET_ID, ObjectType::SymmetricKey));

        const std::vector<uint8_t> key(32, 0x11);
        auto put = store.Put(TARGET_ID, ObjectType::SymmetricKey, Algorithm::Aes256, Label("again"),
            Capability::None(), Capability::None(), Domain::DOM1, key);
        REQUIRE(put.UnwrapErr().type == HsmFailureType::AlreadyExists);
    }
    SECTION("Algorithm from another object type") {
        auto generated = store.Generate(30, ObjectType::HmacKey, Algorithm::Aes256, Label("wrong"),
            Capability::None(), Capability::None(), Domain::DOM1);
        REQUIRE(generated.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Material of the wrong length") {
        const std::vector<uint8_t> key(31, 0x22);
        auto put = store.Put(30, ObjectType::SymmetricKey, Algorithm::Aes256, Label("short"),
            Capability::None(), Capability::None(), Domain::DOM1, key);
        REQUIRE(put.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Algorithm the simulator cannot produce") {
        auto generated = store.Generate(30, ObjectType::AsymmetricKey, Algorithm::Rsa2048, Label("rsa"),
            Capability::None(), Capability::None(), Domain::DOM1);
        REQUIRE(generated.UnwrapErr().type == HsmFailureType::UnsupportedAlgorithm);
    }
    REQUIRE(store.Size() == 2);
    REQUIRE_FALSE(store.Contains(30, ObjectType::HmacKey));
    REQUIRE_FALSE(store.Contains(30, ObjectType::SymmetricKey));
    REQUIRE(PayloadBytes(store, TARGET_ID, ObjectType::SymmetricKey) == original);
}
TEST_CASE("Store - Traversal order", "[store][integration]") {
    auto store = MakeStore();
    GenerateExportableAes256(store, 30);
    REQUIRE(store.Put(5, ObjectType::Opaque, Algorithm::OpaqueData, Label("a"),
        Capability::None(), Capability::None(), Domain::DOM1, std::vector<uint8_t>{1}).IsOk());
    REQUIRE(store.Generate(5, ObjectType::HmacKey, Algorithm::HmacSha1, Label("b"),
        Capability::None(), Capability::None(), Domain::DOM1).IsOk());

    const std::vector<models::ObjectHandle> expected{
        {1, ObjectType::AuthenticationKey},
        {5, ObjectType::Opaque},
        {5, ObjectType::HmacKey},
        {30, ObjectType::SymmetricKey},
    };
    for (int pass = 0; pass < 2; ++pass) {
        std::vector<models::ObjectHandle> seen;
        for (const auto& [handle, object] : store.Iter()) {
            REQUIRE(object.Handle() == handle);
            seen.push_back(handle);
        }
        REQUIRE(seen == expected);
    }
}
TEST_CASE("Store - Instances are independent", "[store][integration]") {
    auto first = MakeStore();
    auto second = MakeStore();
    GenerateExportableAes256(first, TARGET_ID);
    REQUIRE(first.Size() == 2);
    REQUIRE(second.Size() == 1);
    REQUIRE_FALSE(second.Contains(TARGET_ID, ObjectType::SymmetricKey));
    REQUIRE(PayloadBytes(first, 1, ObjectType::AuthenticationKey) ==
            PayloadBytes(second, 1, ObjectType::AuthenticationKey));
}

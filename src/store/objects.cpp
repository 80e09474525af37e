#include "simhsm/store/objects.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/debug/object_logger.hpp"
#include "simhsm/models/authentication_key.hpp"
#include "simhsm/models/wrapped_object.hpp"
#include "simhsm/core/constants.hpp"
#include "simhsm/core/format.hpp"

namespace simhsm::store {

using models::Capability;
using models::Domain;
using models::Object;
using models::ObjectHandle;
using models::ObjectId;
using models::ObjectInfo;
using models::ObjectLabel;
using models::Payload;
using enums::Algorithm;
using enums::ObjectOrigin;
using enums::ObjectType;

namespace {

template<typename T>
Result<T, HsmFailure> Fail(const char* operation, HsmFailure failure) {
    debug::LogFailure(operation, failure);
    return Result<T, HsmFailure>::Err(std::move(failure));
}

void Wipe(std::vector<uint8_t>& buffer) {
    auto wipe = crypto::SodiumInterop::SecureWipe(std::span(buffer));
    (void) wipe;
}

Result<std::span<const uint8_t>, HsmFailure> AeadNonce(std::span<const uint8_t> nonce) {
    if (nonce.size() < WrapConstants::AEAD_NONCE_SIZE) {
        return Result<std::span<const uint8_t>, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Wrap nonce must be at least {} bytes, got {}",
                    WrapConstants::AEAD_NONCE_SIZE, nonce.size())));
    }
    return Result<std::span<const uint8_t>, HsmFailure>::Ok(nonce.first(WrapConstants::AEAD_NONCE_SIZE));
}

} // namespace

Result<Objects, HsmFailure> Objects::Create() {
    return Create(configuration::StoreConfig::Default());
}

Result<Objects, HsmFailure> Objects::Create(const configuration::StoreConfig& config) {
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<Objects, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    auto config_check = config.Validate();
    if (config_check.IsErr()) {
        return Result<Objects, HsmFailure>::Err(std::move(config_check).UnwrapErr());
    }

    auto key_result = models::AuthenticationKey::DeriveFromPassword(config.GetPassword());
    if (key_result.IsErr()) {
        return Result<Objects, HsmFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto label_result = ObjectLabel::FromString(config.GetAuthenticationKeyLabel());
    if (label_result.IsErr()) {
        return Result<Objects, HsmFailure>::Err(std::move(label_result).UnwrapErr());
    }

    ObjectInfo info;
    info.object_id = config.GetAuthenticationKeyId();
    info.object_type = ObjectType::AuthenticationKey;
    info.algorithm = Algorithm::YubicoAesAuthentication;
    info.capabilities = Capability::All();
    info.delegated_capabilities = Capability::All();
    info.domains = Domain::All();
    info.origin = ObjectOrigin::Imported;
    info.label = std::move(label_result).Unwrap();

    auto object_result = Object::Create(
        std::move(info),
        Payload::FromAuthenticationKey(std::move(key_result).Unwrap()));
    if (object_result.IsErr()) {
        return Result<Objects, HsmFailure>::Err(std::move(object_result).UnwrapErr());
    }

    Map objects;
    auto object = std::move(object_result).Unwrap();
    const ObjectHandle handle = object.Handle();
    debug::LogObjectInserted("BOOTSTRAP", handle, object.GetAlgorithm(), object.Info().origin, object.Info().length);
    objects.emplace(handle, std::move(object));
    return Result<Objects, HsmFailure>::Ok(Objects(std::move(objects)));
}

Result<ObjectHandle, HsmFailure> Objects::Generate(
    const ObjectId object_id,
    const ObjectType object_type,
    const Algorithm algorithm,
    ObjectLabel label,
    const Capability capabilities,
    const Capability delegated_capabilities,
    const Domain domains) {
    const ObjectHandle handle(object_id, object_type);
    if (objects_.contains(handle)) {
        return Fail<ObjectHandle>("GENERATE",
            HsmFailure::AlreadyExists(handle, compat::format("object already exists: {}", handle.ToString())));
    }

    auto payload = Payload::Generate(algorithm);
    if (payload.IsErr()) {
        return Fail<ObjectHandle>("GENERATE", std::move(payload).UnwrapErr());
    }

    ObjectInfo info;
    info.object_id = object_id;
    info.object_type = object_type;
    info.algorithm = algorithm;
    info.capabilities = capabilities;
    info.delegated_capabilities = delegated_capabilities;
    info.domains = domains;
    info.origin = ObjectOrigin::Generated;
    info.label = std::move(label);
    return Insert("GENERATE", std::move(info), std::move(payload).Unwrap());
}

Result<ObjectHandle, HsmFailure> Objects::Put(
    const ObjectId object_id,
    const ObjectType object_type,
    const Algorithm algorithm,
    ObjectLabel label,
    const Capability capabilities,
    const Capability delegated_capabilities,
    const Domain domains,
    std::span<const uint8_t> data) {
    const ObjectHandle handle(object_id, object_type);
    if (objects_.contains(handle)) {
        return Fail<ObjectHandle>("PUT",
            HsmFailure::AlreadyExists(handle, compat::format("object already exists: {}", handle.ToString())));
    }

    auto payload = Payload::FromBytes(algorithm, data);
    if (payload.IsErr()) {
        return Fail<ObjectHandle>("PUT", std::move(payload).UnwrapErr());
    }

    ObjectInfo info;
    info.object_id = object_id;
    info.object_type = object_type;
    info.algorithm = algorithm;
    info.capabilities = capabilities;
    info.delegated_capabilities = delegated_capabilities;
    info.domains = domains;
    info.origin = ObjectOrigin::Imported;
    info.label = std::move(label);
    return Insert("PUT", std::move(info), std::move(payload).Unwrap());
}

Result<ObjectHandle, HsmFailure> Objects::Insert(const char* operation, ObjectInfo info, Payload payload) {
    auto object_result = Object::Create(std::move(info), std::move(payload));
    if (object_result.IsErr()) {
        return Fail<ObjectHandle>(operation, std::move(object_result).UnwrapErr());
    }
    auto object = std::move(object_result).Unwrap();
    const ObjectHandle handle = object.Handle();
    const auto algorithm = object.GetAlgorithm();
    const auto origin = object.Info().origin;
    const size_t length = object.Info().length;

    const auto [position, inserted] = objects_.try_emplace(handle, std::move(object));
    (void) position;
    if (!inserted) {
        return Fail<ObjectHandle>(operation,
            HsmFailure::AlreadyExists(handle, compat::format("object already exists: {}", handle.ToString())));
    }

    debug::LogObjectInserted(operation, handle, algorithm, origin, length);
    return Result<ObjectHandle, HsmFailure>::Ok(handle);
}

const Object* Objects::Get(const ObjectId object_id, const ObjectType object_type) const {
    const auto it = objects_.find(ObjectHandle(object_id, object_type));
    if (it == objects_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool Objects::Contains(const ObjectId object_id, const ObjectType object_type) const {
    return objects_.contains(ObjectHandle(object_id, object_type));
}

Option<Object> Objects::Remove(const ObjectId object_id, const ObjectType object_type) {
    auto node = objects_.extract(ObjectHandle(object_id, object_type));
    if (node.empty()) {
        return None<Object>();
    }
    debug::LogObjectRemoved(node.key());
    return Option<Object>(std::move(node.mapped()));
}

Result<Objects::WrapKey, HsmFailure> Objects::ResolveWrapKey(const ObjectId wrap_key_id) const {
    const ObjectHandle handle(wrap_key_id, ObjectType::WrapKey);
    const Object* wrap_key = Get(wrap_key_id, ObjectType::WrapKey);
    if (wrap_key == nullptr) {
        return Result<WrapKey, HsmFailure>::Err(
            HsmFailure::NotFound(handle, compat::format("no such wrap key: {}", handle.ToString())));
    }

    // AES-GCM stands in for the device's AES-CCM; output is not byte-compatible with hardware.
    switch (wrap_key->GetAlgorithm()) {
        case Algorithm::Aes128CcmWrap:
            return Result<WrapKey, HsmFailure>::Ok(WrapKey{wrap_key, crypto::AeadCipher::Aes128Gcm});
        case Algorithm::Aes256CcmWrap:
            return Result<WrapKey, HsmFailure>::Ok(WrapKey{wrap_key, crypto::AeadCipher::Aes256Gcm});
        default:
            return Result<WrapKey, HsmFailure>::Err(
                HsmFailure::UnsupportedAlgorithm(
                    compat::format("unsupported wrap key algorithm: {}",
                        enums::ToString(wrap_key->GetAlgorithm()))));
    }
}

Result<std::vector<uint8_t>, HsmFailure> Objects::Wrap(
    const ObjectId wrap_key_id,
    const ObjectId object_id,
    const ObjectType object_type,
    std::span<const uint8_t> nonce) const {
    auto wrap_key = ResolveWrapKey(wrap_key_id);
    if (wrap_key.IsErr()) {
        return Fail<std::vector<uint8_t>>("WRAP", std::move(wrap_key).UnwrapErr());
    }
    const WrapKey resolved = wrap_key.Unwrap();

    const ObjectHandle target_handle(object_id, object_type);
    const Object* target = Get(object_id, object_type);
    if (target == nullptr) {
        return Fail<std::vector<uint8_t>>("WRAP",
            HsmFailure::NotFound(target_handle, compat::format("no such object: {}", target_handle.ToString())));
    }
    if (!target->Info().capabilities.Contains(Capability::EXPORTABLE_UNDER_WRAP)) {
        return Fail<std::vector<uint8_t>>("WRAP",
            HsmFailure::CapabilityViolation(target_handle,
                compat::format("object {} does not have EXPORTABLE_UNDER_WRAP capability",
                    target_handle.ToString())));
    }

    models::WrappedObject envelope;
    envelope.object_info = target->Info();
    envelope.object_info.origin = enums::PromoteOnWrap(envelope.object_info.origin);
    auto data = target->GetPayload().CopyBytes();
    if (data.IsErr()) {
        return Fail<std::vector<uint8_t>>("WRAP", std::move(data).UnwrapErr());
    }
    envelope.data = std::move(data).Unwrap();

    auto encoded = models::WrappedObjectCodec::Encode(envelope);
    Wipe(envelope.data);
    if (encoded.IsErr()) {
        return Fail<std::vector<uint8_t>>("WRAP", std::move(encoded).UnwrapErr());
    }
    std::vector<uint8_t> buffer = std::move(encoded).Unwrap();
    buffer.resize(buffer.size() + WrapConstants::WRAPPED_DATA_MAC_SIZE, 0);

    auto aead_nonce = AeadNonce(nonce);
    if (aead_nonce.IsErr()) {
        Wipe(buffer);
        return Fail<std::vector<uint8_t>>("WRAP", std::move(aead_nonce).UnwrapErr());
    }

    auto seal_result = resolved.object->GetPayload().WithBytes([&](std::span<const uint8_t> key) {
        return crypto::AesGcm::SealInPlace(
            resolved.cipher, key, aead_nonce.Unwrap(), {}, std::span(buffer), WrapConstants::WRAPPED_DATA_MAC_SIZE);
    });
    if (seal_result.IsErr() || seal_result.Unwrap().IsErr()) {
        Wipe(buffer);
        auto failure = seal_result.IsErr()
            ? std::move(seal_result).UnwrapErr()
            : std::move(seal_result).Unwrap().UnwrapErr();
        return Fail<std::vector<uint8_t>>("WRAP", std::move(failure));
    }

    debug::LogWrap(resolved.object->Handle(), target_handle, nonce, buffer);
    return Result<std::vector<uint8_t>, HsmFailure>::Ok(std::move(buffer));
}

Result<ObjectHandle, HsmFailure> Objects::Unwrap(
    const ObjectId wrap_key_id,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext) {
    auto wrap_key = ResolveWrapKey(wrap_key_id);
    if (wrap_key.IsErr()) {
        return Fail<ObjectHandle>("UNWRAP", std::move(wrap_key).UnwrapErr());
    }
    const WrapKey resolved = wrap_key.Unwrap();

    auto aead_nonce = AeadNonce(nonce);
    if (aead_nonce.IsErr()) {
        return Fail<ObjectHandle>("UNWRAP", std::move(aead_nonce).UnwrapErr());
    }
    debug::LogUnwrap(resolved.object->Handle(), nonce, ciphertext);

    std::vector<uint8_t> buffer(ciphertext.begin(), ciphertext.end());
    auto open_result = resolved.object->GetPayload().WithBytes([&](std::span<const uint8_t> key) {
        return crypto::AesGcm::OpenInPlace(
            resolved.cipher, key, aead_nonce.Unwrap(), {}, std::span(buffer), WrapConstants::WRAPPED_DATA_MAC_SIZE);
    });
    if (open_result.IsErr() || open_result.Unwrap().IsErr()) {
        Wipe(buffer);
        auto failure = open_result.IsErr()
            ? std::move(open_result).UnwrapErr()
            : std::move(open_result).Unwrap().UnwrapErr();
        return Fail<ObjectHandle>("UNWRAP", std::move(failure));
    }
    const size_t plaintext_len = open_result.Unwrap().Unwrap();

    auto decoded = models::WrappedObjectCodec::Decode(std::span<const uint8_t>(buffer.data(), plaintext_len));
    Wipe(buffer);
    if (decoded.IsErr()) {
        return Fail<ObjectHandle>("UNWRAP", std::move(decoded).UnwrapErr());
    }
    models::WrappedObject envelope = std::move(decoded).Unwrap();

    auto payload = Payload::FromBytes(envelope.object_info.algorithm, envelope.data);
    Wipe(envelope.data);
    if (payload.IsErr()) {
        return Fail<ObjectHandle>("UNWRAP", std::move(payload).UnwrapErr());
    }

    return Insert("UNWRAP", std::move(envelope.object_info), std::move(payload).Unwrap());
}

} // namespace simhsm::store

#include "simhsm/models/wrapped_object.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/core/constants.hpp"
#include "simhsm/core/format.hpp"
#include "models/wrapped_object.pb.h"

#include <exception>
#include <limits>
#include <string>

namespace simhsm::models {

namespace pb = simhsm::proto::models;

namespace {

constexpr uint32_t MAX_U16 = std::numeric_limits<uint16_t>::max();
constexpr uint32_t MAX_U8 = std::numeric_limits<uint8_t>::max();

void WipeString(std::string* value) {
    if (value != nullptr && !value->empty()) {
        auto wipe = crypto::SodiumInterop::SecureWipe(
            std::span(reinterpret_cast<uint8_t*>(value->data()), value->size()));
        (void) wipe;
    }
}

Result<ObjectInfo, HsmFailure> InfoFromProto(const pb::ObjectInfo& proto_info) {
    if (proto_info.object_id() > MAX_U16) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode(compat::format("Object id {} out of range", proto_info.object_id())));
    }
    const auto object_type = proto_info.object_type() <= MAX_U8
        ? enums::ObjectTypeFromU8(static_cast<uint8_t>(proto_info.object_type()))
        : None<enums::ObjectType>();
    if (!object_type) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode(compat::format("Unknown object type {}", proto_info.object_type())));
    }
    const auto algorithm = proto_info.algorithm() <= MAX_U8
        ? enums::AlgorithmFromU8(static_cast<uint8_t>(proto_info.algorithm()))
        : None<enums::Algorithm>();
    if (!algorithm) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode(compat::format("Unknown algorithm {}", proto_info.algorithm())));
    }
    const auto origin = proto_info.origin() <= MAX_U8
        ? enums::ObjectOriginFromU8(static_cast<uint8_t>(proto_info.origin()))
        : None<enums::ObjectOrigin>();
    if (!origin) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode(compat::format("Unknown object origin {}", proto_info.origin())));
    }

    const Capability capabilities(proto_info.capabilities());
    const Capability delegated(proto_info.delegated_capabilities());
    if (!capabilities.IsSubsetOf(Capability::All()) || !delegated.IsSubsetOf(Capability::All())) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode("Capability set contains undefined bits"));
    }
    if (proto_info.domains() > MAX_U16 || proto_info.length() > MAX_U16 || proto_info.sequence() > MAX_U16) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode("Domains, length or sequence out of range"));
    }

    auto label = ObjectLabel::FromString(proto_info.label());
    if (label.IsErr()) {
        return Result<ObjectInfo, HsmFailure>::Err(
            HsmFailure::Decode(std::move(label).UnwrapErr().message));
    }

    ObjectInfo info;
    info.object_id = static_cast<ObjectId>(proto_info.object_id());
    info.object_type = *object_type;
    info.algorithm = *algorithm;
    info.capabilities = capabilities;
    info.delegated_capabilities = delegated;
    info.domains = Domain(static_cast<uint16_t>(proto_info.domains()));
    info.length = static_cast<uint16_t>(proto_info.length());
    info.sequence = static_cast<uint16_t>(proto_info.sequence());
    info.origin = *origin;
    info.label = std::move(label).Unwrap();
    return Result<ObjectInfo, HsmFailure>::Ok(std::move(info));
}

} // namespace

Result<std::vector<uint8_t>, HsmFailure> WrappedObjectCodec::Encode(const WrappedObject& wrapped) {
    pb::WrappedObject message;
    try {
        const ObjectInfo& info = wrapped.object_info;
        pb::ObjectInfo* proto_info = message.mutable_object_info();
        proto_info->set_object_id(info.object_id);
        proto_info->set_object_type(static_cast<uint32_t>(info.object_type));
        proto_info->set_algorithm(static_cast<uint32_t>(info.algorithm));
        proto_info->set_capabilities(info.capabilities.Bits());
        proto_info->set_delegated_capabilities(info.delegated_capabilities.Bits());
        proto_info->set_domains(info.domains.Bits());
        proto_info->set_length(info.length);
        proto_info->set_sequence(info.sequence);
        proto_info->set_origin(static_cast<uint32_t>(info.origin));
        proto_info->set_label(info.label.Value());
        message.set_data(wrapped.data.data(), wrapped.data.size());

        const size_t size = message.ByteSizeLong();
        std::vector<uint8_t> encoded(size);
        const bool serialized = message.SerializeToArray(encoded.data(), static_cast<int>(size));
        WipeString(message.mutable_data());
        if (!serialized) {
            auto wipe = crypto::SodiumInterop::SecureWipe(std::span(encoded));
            (void) wipe;
            return Result<std::vector<uint8_t>, HsmFailure>::Err(
                HsmFailure::Encode("Failed to serialize WrappedObject to protobuf"));
        }
        return Result<std::vector<uint8_t>, HsmFailure>::Ok(std::move(encoded));
    } catch (const std::exception& ex) {
        WipeString(message.mutable_data());
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::Encode(compat::format("Exception during WrappedObject encoding: {}", ex.what())));
    }
}

Result<WrappedObject, HsmFailure> WrappedObjectCodec::Decode(std::span<const uint8_t> encoded) {
    pb::WrappedObject message;
    try {
        if (!message.ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
            WipeString(message.mutable_data());
            return Result<WrappedObject, HsmFailure>::Err(
                HsmFailure::Decode("Failed to parse WrappedObject from protobuf"));
        }
        if (!message.has_object_info()) {
            WipeString(message.mutable_data());
            return Result<WrappedObject, HsmFailure>::Err(
                HsmFailure::Decode("WrappedObject is missing object info"));
        }

        auto info_result = InfoFromProto(message.object_info());
        if (info_result.IsErr()) {
            WipeString(message.mutable_data());
            return Result<WrappedObject, HsmFailure>::Err(std::move(info_result).UnwrapErr());
        }
        if (info_result.Unwrap().length != message.data().size()) {
            WipeString(message.mutable_data());
            return Result<WrappedObject, HsmFailure>::Err(
                HsmFailure::Decode(
                    compat::format("Declared length {} does not match {} data bytes",
                        info_result.Unwrap().length, message.data().size())));
        }

        WrappedObject wrapped;
        wrapped.object_info = std::move(info_result).Unwrap();
        wrapped.data.assign(message.data().begin(), message.data().end());
        WipeString(message.mutable_data());
        return Result<WrappedObject, HsmFailure>::Ok(std::move(wrapped));
    } catch (const std::exception& ex) {
        WipeString(message.mutable_data());
        return Result<WrappedObject, HsmFailure>::Err(
            HsmFailure::Decode(compat::format("Exception during WrappedObject decoding: {}", ex.what())));
    }
}

} // namespace simhsm::models

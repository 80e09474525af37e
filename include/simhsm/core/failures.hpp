#pragma once
#include "simhsm/core/option.hpp"
#include "simhsm/models/object_handle.hpp"
#include <string>
#include <utility>
namespace simhsm {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    InvalidOperation
};
enum class HsmFailureType {
    Generic,
    InvalidInput,
    NotFound,
    AlreadyExists,
    UnsupportedAlgorithm,
    CapabilityViolation,
    DecryptionFailed,
    Decode,
    Encode,
    KeyGeneration,
    DeriveKey,
    BufferTooSmall
};
constexpr const char* ToString(const HsmFailureType type) noexcept {
    switch (type) {
        case HsmFailureType::Generic: return "Generic";
        case HsmFailureType::InvalidInput: return "InvalidInput";
        case HsmFailureType::NotFound: return "NotFound";
        case HsmFailureType::AlreadyExists: return "AlreadyExists";
        case HsmFailureType::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case HsmFailureType::CapabilityViolation: return "CapabilityViolation";
        case HsmFailureType::DecryptionFailed: return "DecryptionFailed";
        case HsmFailureType::Decode: return "Decode";
        case HsmFailureType::Encode: return "Encode";
        case HsmFailureType::KeyGeneration: return "KeyGeneration";
        case HsmFailureType::DeriveKey: return "DeriveKey";
        case HsmFailureType::BufferTooSmall: return "BufferTooSmall";
        default: return "UNKNOWN";
    }
}
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/**
 * @brief Failure returned by every fallible store operation
 *
 * The type is what the command-dispatch layer maps to a device status
 * code. NotFound, AlreadyExists and CapabilityViolation also carry the
 * handle of the object they refer to.
 */
class HsmFailure {
public:
    HsmFailureType type;
    std::string message;
    Option<models::ObjectHandle> handle;
    HsmFailure(const HsmFailureType t, std::string msg, Option<models::ObjectHandle> h = std::nullopt)
        : type(t), message(std::move(msg)), handle(h) {}
    static HsmFailure Generic(std::string msg) {
        return {HsmFailureType::Generic, std::move(msg)};
    }
    static HsmFailure InvalidInput(std::string msg) {
        return {HsmFailureType::InvalidInput, std::move(msg)};
    }
    static HsmFailure NotFound(const models::ObjectHandle h, std::string msg) {
        return {HsmFailureType::NotFound, std::move(msg), h};
    }
    static HsmFailure AlreadyExists(const models::ObjectHandle h, std::string msg) {
        return {HsmFailureType::AlreadyExists, std::move(msg), h};
    }
    static HsmFailure UnsupportedAlgorithm(std::string msg) {
        return {HsmFailureType::UnsupportedAlgorithm, std::move(msg)};
    }
    static HsmFailure CapabilityViolation(const models::ObjectHandle h, std::string msg) {
        return {HsmFailureType::CapabilityViolation, std::move(msg), h};
    }
    static HsmFailure DecryptionFailed(std::string msg) {
        return {HsmFailureType::DecryptionFailed, std::move(msg)};
    }
    static HsmFailure Decode(std::string msg) {
        return {HsmFailureType::Decode, std::move(msg)};
    }
    static HsmFailure Encode(std::string msg) {
        return {HsmFailureType::Encode, std::move(msg)};
    }
    static HsmFailure KeyGeneration(std::string msg) {
        return {HsmFailureType::KeyGeneration, std::move(msg)};
    }
    static HsmFailure DeriveKey(std::string msg) {
        return {HsmFailureType::DeriveKey, std::move(msg)};
    }
    static HsmFailure BufferTooSmall(std::string msg) {
        return {HsmFailureType::BufferTooSmall, std::move(msg)};
    }
    static HsmFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
}

#pragma once
#include <string>
#include <string_view>
namespace certdel::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    SecureWipeFailed,
    ComparisonFailed,
    RandomGenerationFailed
};
enum class ProtocolFailureType {
    Generic,
    ConfigurationError,
    UnknownCode,
    LengthMismatch,
    MalformedMeasurement,
    KeyGeneration,
    BackendFailure,
    InvalidInput,
    Decode,
    Encode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure RandomGenerationFailed(std::string msg) {
        return {SodiumFailureType::RandomGenerationFailed, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    /// Invalid scheme dimensions or threshold; raised at construction only.
    static ProtocolFailure ConfigurationError(std::string msg) {
        return {ProtocolFailureType::ConfigurationError, std::move(msg)};
    }
    static ProtocolFailure UnknownCode(std::string msg) {
        return {ProtocolFailureType::UnknownCode, std::move(msg)};
    }
    /// A message, pad or matrix disagrees with the declared dimensions.
    static ProtocolFailure LengthMismatch(std::string msg) {
        return {ProtocolFailureType::LengthMismatch, std::move(msg)};
    }
    /// A measurement string of unexpected length or alphabet.
    static ProtocolFailure MalformedMeasurement(std::string msg) {
        return {ProtocolFailureType::MalformedMeasurement, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure BackendFailure(std::string msg) {
        return {ProtocolFailureType::BackendFailure, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::RandomGenerationFailed) {
            return KeyGeneration(sf.message);
        }
        return Generic(sf.message);
    }
};
[[nodiscard]] inline std::string_view FailureTypeName(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::ConfigurationError: return "ConfigurationError";
        case ProtocolFailureType::UnknownCode: return "UnknownCode";
        case ProtocolFailureType::LengthMismatch: return "LengthMismatch";
        case ProtocolFailureType::MalformedMeasurement: return "MalformedMeasurement";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::BackendFailure: return "BackendFailure";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Encode: return "Encode";
    }
    return "Unknown";
}
}

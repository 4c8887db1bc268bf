#include "olmwire/core/failures.hpp"
#include "olmwire/core/constants.hpp"
#include "olmwire/core/format.hpp"

namespace olmwire::protocol {

DecodeError DecodeError::MissingVersion() {
    return {DecodeFailureType::MissingVersion, 0, 0, std::string(ErrorMessages::MISSING_VERSION)};
}

DecodeError DecodeError::InvalidVersion(const uint8_t expected_version, const uint8_t actual_version) {
    return {
        DecodeFailureType::InvalidVersion,
        expected_version,
        actual_version,
        compat::format(fmt::runtime(ErrorMessages::INVALID_VERSION),
                    static_cast<unsigned>(expected_version),
                    static_cast<unsigned>(actual_version))
    };
}

DecodeError DecodeError::MessageTooShort(const size_t actual_length) {
    return {
        DecodeFailureType::MessageTooShort,
        kMinimumOlmMessageBytes,
        actual_length,
        compat::format("{} ({} bytes)", ErrorMessages::MESSAGE_TOO_SHORT, actual_length)
    };
}

DecodeError DecodeError::InvalidKeyLength(const size_t expected_length, const size_t actual_length) {
    return {
        DecodeFailureType::InvalidKeyLength,
        expected_length,
        actual_length,
        compat::format(fmt::runtime(ErrorMessages::INVALID_KEY_LENGTH), expected_length, actual_length)
    };
}

DecodeError DecodeError::InvalidMacLength(const size_t expected_length, const size_t actual_length) {
    return {
        DecodeFailureType::InvalidMacLength,
        expected_length,
        actual_length,
        compat::format(fmt::runtime(ErrorMessages::INVALID_MAC_LENGTH), expected_length, actual_length)
    };
}

DecodeError DecodeError::Signature(const std::string_view inner) {
    return {
        DecodeFailureType::Signature,
        0,
        0,
        compat::format(fmt::runtime(ErrorMessages::INVALID_SIGNATURE), inner)
    };
}

DecodeError DecodeError::StructuralDecode(const std::string_view inner) {
    return {DecodeFailureType::StructuralDecode, 0, 0, std::string(inner)};
}

std::string_view ToString(const DecodeFailureType type) noexcept {
    switch (type) {
        case DecodeFailureType::MissingVersion: return "MissingVersion";
        case DecodeFailureType::InvalidVersion: return "InvalidVersion";
        case DecodeFailureType::MessageTooShort: return "MessageTooShort";
        case DecodeFailureType::InvalidKeyLength: return "InvalidKeyLength";
        case DecodeFailureType::InvalidMacLength: return "InvalidMacLength";
        case DecodeFailureType::Signature: return "Signature";
        case DecodeFailureType::StructuralDecode: return "StructuralDecode";
    }
    return "Unknown";
}

}

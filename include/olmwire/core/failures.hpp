#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace olmwire::protocol {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    InvalidOperation
};

/// Every way a received envelope can be rejected before any of its
/// cryptographic material is trusted. The set is closed.
enum class DecodeFailureType {
    MissingVersion,
    InvalidVersion,
    MessageTooShort,
    InvalidKeyLength,
    InvalidMacLength,
    Signature,
    StructuralDecode
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
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure returned by OlmMessage::Decode and PreKeyMessage::Decode
 *
 * `expected` and `actual` carry the two numbers of the variants that define
 * them (InvalidVersion, InvalidKeyLength, InvalidMacLength). MessageTooShort
 * reports the received length in `actual` and the minimum in `expected`.
 * The remaining variants leave both at zero.
 */
class DecodeError {
public:
    DecodeFailureType type;
    size_t expected;
    size_t actual;
    std::string message;

    DecodeError(DecodeFailureType t, size_t expected_value, size_t actual_value, std::string msg)
        : type(t), expected(expected_value), actual(actual_value), message(std::move(msg)) {}

    static DecodeError MissingVersion();
    static DecodeError InvalidVersion(uint8_t expected_version, uint8_t actual_version);
    static DecodeError MessageTooShort(size_t actual_length);
    static DecodeError InvalidKeyLength(size_t expected_length, size_t actual_length);
    static DecodeError InvalidMacLength(size_t expected_length, size_t actual_length);
    /// Raised by signature-checking collaborators; the codec never produces it.
    static DecodeError Signature(std::string_view inner);
    static DecodeError StructuralDecode(std::string_view inner);

    [[nodiscard]] bool Is(DecodeFailureType t) const noexcept { return type == t; }

    bool operator==(const DecodeError&) const = default;
};

[[nodiscard]] std::string_view ToString(DecodeFailureType type) noexcept;

}

#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace olmwire::protocol {

inline constexpr uint8_t kProtocolVersion = 3;

inline constexpr size_t kCurve25519PublicKeyBytes = 32;
inline constexpr size_t kMacBytes = 32;
inline constexpr size_t kMacTruncatedBytes = 8;
inline constexpr size_t kMacKeyBytes = 32;

// version byte + truncated MAC + the smallest body that can still carry a field
inline constexpr size_t kMinimumOlmMessageBytes = kMacTruncatedBytes + 2;

// Wire tags of the normal message body: (field_number << 3) | wire_type
inline constexpr uint8_t kRatchetKeyTag = 0x0A;
inline constexpr uint8_t kChainIndexTag = 0x10;
inline constexpr uint8_t kCiphertextTag = 0x22;

inline constexpr uint8_t kVarintContinuationBit = 0x80;
inline constexpr uint8_t kVarintPayloadMask = 0x7F;
inline constexpr unsigned kVarintPayloadBits = 7;
inline constexpr size_t kMaxVarintBytes = 10;

struct ErrorMessages {
    static constexpr std::string_view MISSING_VERSION = "The message didn't contain a version";
    static constexpr std::string_view MESSAGE_TOO_SHORT =
        "The message was too short, it didn't contain a valid payload";
    static constexpr std::string_view INVALID_VERSION =
        "The message didn't have a valid version, expected {}, got {}";
    static constexpr std::string_view INVALID_KEY_LENGTH =
        "The message contained a public key with an invalid size, expected {}, got {}";
    static constexpr std::string_view INVALID_MAC_LENGTH =
        "The message contained a MAC with an invalid size, expected {}, got {}";
    static constexpr std::string_view INVALID_SIGNATURE = "The message contained an invalid Signature: {}";
    static constexpr std::string_view PARSE_INNER_MESSAGE_FAILED = "Failed to parse InnerMessage from protobuf";
    static constexpr std::string_view PARSE_INNER_PRE_KEY_MESSAGE_FAILED =
        "Failed to parse InnerPreKeyMessage from protobuf";
    static constexpr std::string_view INVALID_WIRE_TYPE = "Field {} of {} has an invalid wire type";
    static constexpr std::string_view PAYLOAD_TOO_LARGE = "Payload exceeds the protobuf size limit";
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HMAC_FAILED = "HMAC-SHA256 computation failed";
};

}

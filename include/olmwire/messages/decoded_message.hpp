#pragma once
#include "olmwire/core/constants.hpp"
#include "olmwire/models/keys/curve25519_public_key.hpp"
#include <array>
#include <cstdint>
#include <vector>
namespace olmwire::protocol::messages {
/// Parsed normal message. The MAC has not been verified.
struct DecodedMessage {
    models::Curve25519PublicKey ratchet_key;
    uint64_t chain_index;
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, kMacTruncatedBytes> mac;
};
/// Parsed pre-key message. `message` is the still-encoded embedded OlmMessage.
struct DecodedPreKeyMessage {
    models::Curve25519PublicKey one_time_key;
    models::Curve25519PublicKey base_key;
    models::Curve25519PublicKey identity_key;
    std::vector<uint8_t> message;
};
}

#include "olmwire/models/keys/curve25519_public_key.hpp"

#include <algorithm>

namespace olmwire::protocol::models {
    Result<Curve25519PublicKey, DecodeError> Curve25519PublicKey::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != KEY_LENGTH) {
            return Result<Curve25519PublicKey, DecodeError>::Err(
                DecodeError::InvalidKeyLength(KEY_LENGTH, bytes.size()));
        }
        std::array<uint8_t, KEY_LENGTH> key{};
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return Result<Curve25519PublicKey, DecodeError>::Ok(Curve25519PublicKey(key));
    }
}

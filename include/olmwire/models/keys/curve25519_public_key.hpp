#pragma once
#include "olmwire/core/constants.hpp"
#include "olmwire/core/failures.hpp"
#include "olmwire/core/result.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>
namespace olmwire::protocol::models {
class Curve25519PublicKey {
public:
    static constexpr size_t KEY_LENGTH = kCurve25519PublicKeyBytes;
    explicit Curve25519PublicKey(const std::array<uint8_t, KEY_LENGTH>& bytes) noexcept
        : bytes_(bytes) {}
    /// Err(InvalidKeyLength(32, size)) unless `bytes` holds exactly 32 bytes.
    [[nodiscard]] static Result<Curve25519PublicKey, DecodeError> FromBytes(std::span<const uint8_t> bytes);
    [[nodiscard]] std::span<const uint8_t, KEY_LENGTH> AsBytes() const noexcept {
        return std::span<const uint8_t, KEY_LENGTH>(bytes_);
    }
    [[nodiscard]] std::vector<uint8_t> ToVector() const {
        return {bytes_.begin(), bytes_.end()};
    }
    bool operator==(const Curve25519PublicKey&) const = default;
private:
    std::array<uint8_t, KEY_LENGTH> bytes_;
};
}

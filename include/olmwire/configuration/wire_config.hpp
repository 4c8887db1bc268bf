#pragma once

#include "olmwire/core/constants.hpp"
#include <cstddef>
#include <cstdint>

namespace olmwire::protocol::configuration {

/**
 * @brief Layout parameters of the Olm envelope wire format
 *
 * Both message kinds start with a version byte. A normal message ends with
 * a truncated MAC tag; every public key field carries exactly
 * GetPublicKeyLength() bytes.
 *
 * The only supported layout is the libolm one returned by Legacy(). Any other
 * value of these parameters breaks interoperability with existing decoders,
 * so the constructor is private.
 *
 * **Usage Example**:
 * ```cpp
 * constexpr auto config = WireConfig::Legacy();
 * if (buffer.size() < config.GetMinimumMessageLength()) {
 *     // reject
 * }
 * ```
 */
class WireConfig {
public:
    /**
     * @brief Version 3 envelopes with an 8 byte MAC tag and Curve25519 keys
     */
    [[nodiscard]] static constexpr WireConfig Legacy() noexcept {
        return WireConfig(kProtocolVersion, kMacTruncatedBytes, kCurve25519PublicKeyBytes);
    }

    [[nodiscard]] constexpr uint8_t GetVersion() const noexcept {
        return version_;
    }

    [[nodiscard]] constexpr size_t GetMacLength() const noexcept {
        return mac_length_;
    }

    [[nodiscard]] constexpr size_t GetPublicKeyLength() const noexcept {
        return public_key_length_;
    }

    /**
     * @brief Smallest normal message that can get past the length check
     *
     * @return mac length + 2 (version byte plus at least one body byte)
     */
    [[nodiscard]] constexpr size_t GetMinimumMessageLength() const noexcept {
        return mac_length_ + 2;
    }

    [[nodiscard]] constexpr bool IsSupportedVersion(const uint8_t version) const noexcept {
        return version == version_;
    }

    [[nodiscard]] constexpr bool operator==(const WireConfig& other) const noexcept {
        return version_ == other.version_ &&
               mac_length_ == other.mac_length_ &&
               public_key_length_ == other.public_key_length_;
    }

    [[nodiscard]] constexpr bool operator!=(const WireConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr WireConfig(const uint8_t version, const size_t mac_length, const size_t public_key_length) noexcept
        : version_(version)
        , mac_length_(mac_length)
        , public_key_length_(public_key_length) {}

    uint8_t version_;
    size_t mac_length_;
    size_t public_key_length_;
};

static_assert(WireConfig::Legacy().GetMinimumMessageLength() == kMinimumOlmMessageBytes);

} // namespace olmwire::protocol::configuration

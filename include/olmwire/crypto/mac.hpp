#pragma once

#include "olmwire/core/constants.hpp"
#include "olmwire/core/failures.hpp"
#include "olmwire/core/result.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace olmwire::protocol::crypto {

/**
 * @brief Full HMAC-SHA-256 output authenticating one normal message
 *
 * Only the first TRUNCATED_LENGTH bytes travel on the wire. Compute and
 * VerifyTruncated are conveniences for the ratchet layer; the envelope codec
 * itself only calls Truncate().
 */
class Mac {
public:
    static constexpr size_t LENGTH = kMacBytes;
    static constexpr size_t TRUNCATED_LENGTH = kMacTruncatedBytes;

    explicit Mac(const std::array<uint8_t, LENGTH>& bytes) noexcept
        : bytes_(bytes) {}

    /**
     * @brief HMAC-SHA-256 of `data` under `key`
     *
     * @return Err if libsodium is not initialized or the key is empty
     */
    [[nodiscard]] static Result<Mac, SodiumFailure> Compute(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    /**
     * @brief Recompute the MAC and compare its truncation in constant time
     *
     * @return Ok(false) on mismatch, including a tag of the wrong length
     */
    [[nodiscard]] static Result<bool, SodiumFailure> VerifyTruncated(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data,
        std::span<const uint8_t> truncated_tag);

    [[nodiscard]] std::array<uint8_t, TRUNCATED_LENGTH> Truncate() const noexcept;

    [[nodiscard]] std::span<const uint8_t, LENGTH> AsBytes() const noexcept {
        return std::span<const uint8_t, LENGTH>(bytes_);
    }

private:
    std::array<uint8_t, LENGTH> bytes_;
};

} // namespace olmwire::protocol::crypto

#pragma once
#include "olmwire/core/result.hpp"
#include "olmwire/core/failures.hpp"
#include "olmwire/core/constants.hpp"
#include "olmwire/crypto/mac.hpp"
#include "olmwire/messages/decoded_message.hpp"
#include "olmwire/models/keys/curve25519_public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace olmwire::protocol::messages {

/**
 * @brief Normal ratchet message: `version || body || mac`
 *
 * FromParts allocates the final length up front with a zeroed MAC tag.
 * The ratchet layer computes the MAC over AsPayloadBytes() and splices it in
 * with AppendMac(), which overwrites the trailing tag without changing the
 * length. Bytes received from the transport are wrapped with FromBytes() and
 * are only validated by Decode().
 */
class OlmMessage {
public:
    [[nodiscard]] static OlmMessage FromParts(
        const models::Curve25519PublicKey& ratchet_key,
        uint64_t chain_index,
        std::span<const uint8_t> ciphertext);

    /**
     * @brief Same layout as FromParts over a raw key of any length
     *
     * Decode() rejects the result unless the key is 32 bytes long.
     */
    [[nodiscard]] static OlmMessage FromPartsUntyped(
        std::span<const uint8_t> ratchet_key,
        uint64_t chain_index,
        std::span<const uint8_t> ciphertext);

    [[nodiscard]] static OlmMessage FromBytes(std::vector<uint8_t> bytes) noexcept;

    OlmMessage(const OlmMessage&) = default;
    OlmMessage(OlmMessage&&) noexcept = default;
    OlmMessage& operator=(const OlmMessage&) = default;
    OlmMessage& operator=(OlmMessage&&) noexcept = default;
    ~OlmMessage() = default;

    [[nodiscard]] std::span<const uint8_t> AsBytes() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    /// Everything but the trailing MAC tag; empty if the buffer cannot hold one.
    [[nodiscard]] std::span<const uint8_t> AsPayloadBytes() const noexcept;

    [[nodiscard]] std::vector<uint8_t> IntoBytes() && noexcept {
        return std::move(bytes_);
    }

    /**
     * @brief Truncate `mac` and write it over the trailing tag
     *
     * @return Err(MessageTooShort) if the buffer is shorter than a tag
     */
    [[nodiscard]] Result<Unit, DecodeError> AppendMac(const crypto::Mac& mac);

    [[nodiscard]] Result<Unit, DecodeError> AppendMacBytes(
        std::span<const uint8_t, kMacTruncatedBytes> truncated_mac);

    [[nodiscard]] Result<DecodedMessage, DecodeError> Decode() const;

    bool operator==(const OlmMessage&) const = default;

private:
    explicit OlmMessage(std::vector<uint8_t> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    std::vector<uint8_t> bytes_;
};

} // namespace olmwire::protocol::messages

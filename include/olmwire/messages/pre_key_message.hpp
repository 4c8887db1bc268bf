#pragma once
#include "olmwire/core/result.hpp"
#include "olmwire/core/failures.hpp"
#include "olmwire/messages/decoded_message.hpp"
#include "olmwire/models/keys/curve25519_public_key.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace olmwire::protocol::messages {

/**
 * @brief First message of a session: `version || body`
 *
 * The body carries the initiator's one-time, base and identity keys and an
 * encoded OlmMessage. It has no MAC of its own; the embedded message is
 * authenticated by its own tag.
 *
 * Decode() returns the embedded message as raw bytes. Wrap them with
 * OlmMessage::FromBytes() and decode separately once the session exists.
 */
class PreKeyMessage {
public:
    /**
     * @brief Encode the four fields with the generated protobuf serializer
     *
     * @throws std::length_error if the body exceeds the protobuf size limit
     */
    [[nodiscard]] static PreKeyMessage FromParts(
        const models::Curve25519PublicKey& one_time_key,
        const models::Curve25519PublicKey& base_key,
        const models::Curve25519PublicKey& identity_key,
        std::span<const uint8_t> message);

    [[nodiscard]] static PreKeyMessage FromBytes(std::vector<uint8_t> bytes) noexcept;

    PreKeyMessage(const PreKeyMessage&) = default;
    PreKeyMessage(PreKeyMessage&&) noexcept = default;
    PreKeyMessage& operator=(const PreKeyMessage&) = default;
    PreKeyMessage& operator=(PreKeyMessage&&) noexcept = default;
    ~PreKeyMessage() = default;

    [[nodiscard]] std::span<const uint8_t> AsBytes() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    [[nodiscard]] std::vector<uint8_t> IntoBytes() && noexcept {
        return std::move(bytes_);
    }

    [[nodiscard]] Result<DecodedPreKeyMessage, DecodeError> Decode() const;

    bool operator==(const PreKeyMessage&) const = default;

private:
    explicit PreKeyMessage(std::vector<uint8_t> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    std::vector<uint8_t> bytes_;
};

} // namespace olmwire::protocol::messages

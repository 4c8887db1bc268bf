#include "olmwire/messages/pre_key_message.hpp"
#include "olmwire/configuration/wire_config.hpp"
#include "olmwire/core/format.hpp"
#include "olmwire/debug/wire_logger.hpp"
#include "messages/olm_messages.pb.h"
#include "wire_type_check.hpp"

#include <climits>
#include <stdexcept>
#include <string>

namespace olmwire::protocol::messages {
    using configuration::WireConfig;
    using models::Curve25519PublicKey;

    namespace {
        constexpr auto kWire = WireConfig::Legacy();

        std::span<const uint8_t> AsByteSpan(const std::string &field) noexcept {
            return {reinterpret_cast<const uint8_t *>(field.data()), field.size()};
        }

        Result<DecodedPreKeyMessage, DecodeError> Reject(DecodeError error) {
            debug::LogDecodeRejected("PreKeyMessage", error.message);
            return Result<DecodedPreKeyMessage, DecodeError>::Err(std::move(error));
        }
    }

    PreKeyMessage PreKeyMessage::FromParts(
        const Curve25519PublicKey &one_time_key,
        const Curve25519PublicKey &base_key,
        const Curve25519PublicKey &identity_key,
        std::span<const uint8_t> message) {
        proto::messages::InnerPreKeyMessage inner;
        inner.set_one_time_key(one_time_key.AsBytes().data(), one_time_key.AsBytes().size());
        inner.set_base_key(base_key.AsBytes().data(), base_key.AsBytes().size());
        inner.set_identity_key(identity_key.AsBytes().data(), identity_key.AsBytes().size());
        inner.set_message(message.data(), message.size());

        const size_t body_size = inner.ByteSizeLong();
        if (body_size > static_cast<size_t>(INT_MAX)) {
            throw std::length_error(
                compat::format("Pre-key message body of {} bytes exceeds the protobuf size limit", body_size));
        }
        std::vector<uint8_t> bytes(body_size + 1);
        bytes[0] = kWire.GetVersion();
        if (!inner.SerializeToArray(bytes.data() + 1, static_cast<int>(body_size))) {
            throw std::length_error("Failed to serialize InnerPreKeyMessage to protobuf");
        }

        debug::LogPreKeyMessageEncoded(
            one_time_key.AsBytes(), base_key.AsBytes(), identity_key.AsBytes(), message.size());
        return PreKeyMessage(std::move(bytes));
    }

    PreKeyMessage PreKeyMessage::FromBytes(std::vector<uint8_t> bytes) noexcept {
        return PreKeyMessage(std::move(bytes));
    }

    Result<DecodedPreKeyMessage, DecodeError> PreKeyMessage::Decode() const {
        if (bytes_.empty()) {
            return Reject(DecodeError::MissingVersion());
        }
        const uint8_t version = bytes_.front();
        if (!kWire.IsSupportedVersion(version)) {
            return Reject(DecodeError::InvalidVersion(kWire.GetVersion(), version));
        }

        const auto body = std::span<const uint8_t>(bytes_).subspan(1);
        if (body.size() > static_cast<size_t>(INT_MAX)) {
            return Reject(DecodeError::StructuralDecode(ErrorMessages::PAYLOAD_TOO_LARGE));
        }
        proto::messages::InnerPreKeyMessage inner;
        if (!inner.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
            return Reject(DecodeError::StructuralDecode(ErrorMessages::PARSE_INNER_PRE_KEY_MESSAGE_FAILED));
        }
        if (auto mismatch = FindWireTypeMismatch(inner)) {
            return Reject(std::move(*mismatch));
        }

        auto one_time_key = Curve25519PublicKey::FromBytes(AsByteSpan(inner.one_time_key()));
        if (one_time_key.IsErr()) {
            return Reject(std::move(one_time_key).UnwrapErr());
        }
        auto base_key = Curve25519PublicKey::FromBytes(AsByteSpan(inner.base_key()));
        if (base_key.IsErr()) {
            return Reject(std::move(base_key).UnwrapErr());
        }
        auto identity_key = Curve25519PublicKey::FromBytes(AsByteSpan(inner.identity_key()));
        if (identity_key.IsErr()) {
            return Reject(std::move(identity_key).UnwrapErr());
        }

        const auto embedded = AsByteSpan(inner.message());
        DecodedPreKeyMessage decoded{
            std::move(one_time_key).Unwrap(),
            std::move(base_key).Unwrap(),
            std::move(identity_key).Unwrap(),
            std::vector<uint8_t>(embedded.begin(), embedded.end())
        };

        debug::LogPreKeyMessageDecoded(
            decoded.one_time_key.AsBytes(),
            decoded.base_key.AsBytes(),
            decoded.identity_key.AsBytes(),
            decoded.message.size());
        return Result<DecodedPreKeyMessage, DecodeError>::Ok(std::move(decoded));
    }
}

#include "olmwire/messages/olm_message.hpp"
#include "olmwire/configuration/wire_config.hpp"
#include "olmwire/debug/wire_logger.hpp"
#include "olmwire/encoding/varint.hpp"
#include "messages/olm_messages.pb.h"
#include "wire_type_check.hpp"

#include <algorithm>
#include <climits>
#include <cstddef>
#include <string>

namespace olmwire::protocol::messages {
    using configuration::WireConfig;
    using encoding::AppendVarint;
    using encoding::RequiredEncodedSpace;

    namespace {
        constexpr auto kWire = WireConfig::Legacy();

        std::span<const uint8_t> AsByteSpan(const std::string &field) noexcept {
            return {reinterpret_cast<const uint8_t *>(field.data()), field.size()};
        }

        Result<DecodedMessage, DecodeError> Reject(DecodeError error) {
            debug::LogDecodeRejected("OlmMessage", error.message);
            return Result<DecodedMessage, DecodeError>::Err(std::move(error));
        }
    }

    OlmMessage OlmMessage::FromParts(
        const models::Curve25519PublicKey &ratchet_key,
        const uint64_t chain_index,
        std::span<const uint8_t> ciphertext) {
        return FromPartsUntyped(ratchet_key.AsBytes(), chain_index, ciphertext);
    }

    OlmMessage OlmMessage::FromPartsUntyped(
        std::span<const uint8_t> ratchet_key,
        const uint64_t chain_index,
        std::span<const uint8_t> ciphertext) {
        // A generated serializer drops chain_index == 0 and libolm cannot
        // decode that, so the body is written field by field.
        const size_t total_length = 1
                                    + 1 + RequiredEncodedSpace(ratchet_key.size()) + ratchet_key.size()
                                    + 1 + RequiredEncodedSpace(chain_index)
                                    + 1 + RequiredEncodedSpace(ciphertext.size()) + ciphertext.size()
                                    + kWire.GetMacLength();
        std::vector<uint8_t> bytes;
        bytes.reserve(total_length);

        bytes.push_back(kWire.GetVersion());
        bytes.push_back(kRatchetKeyTag);
        AppendVarint(bytes, ratchet_key.size());
        bytes.insert(bytes.end(), ratchet_key.begin(), ratchet_key.end());
        bytes.push_back(kChainIndexTag);
        AppendVarint(bytes, chain_index);
        bytes.push_back(kCiphertextTag);
        AppendVarint(bytes, ciphertext.size());
        bytes.insert(bytes.end(), ciphertext.begin(), ciphertext.end());
        bytes.resize(bytes.size() + kWire.GetMacLength(), 0);

        debug::LogOlmMessageEncoded(ratchet_key, chain_index, ciphertext.size(), bytes.size());
        return OlmMessage(std::move(bytes));
    }

    OlmMessage OlmMessage::FromBytes(std::vector<uint8_t> bytes) noexcept {
        return OlmMessage(std::move(bytes));
    }

    std::span<const uint8_t> OlmMessage::AsPayloadBytes() const noexcept {
        if (bytes_.size() < kWire.GetMacLength()) {
            return {};
        }
        return std::span<const uint8_t>(bytes_).first(bytes_.size() - kWire.GetMacLength());
    }

    Result<Unit, DecodeError> OlmMessage::AppendMac(const crypto::Mac &mac) {
        const auto truncated = mac.Truncate();
        return AppendMacBytes(truncated);
    }

    Result<Unit, DecodeError> OlmMessage::AppendMacBytes(
        std::span<const uint8_t, kMacTruncatedBytes> truncated_mac) {
        if (bytes_.size() < truncated_mac.size()) {
            return Result<Unit, DecodeError>::Err(DecodeError::MessageTooShort(bytes_.size()));
        }
        std::copy(truncated_mac.begin(), truncated_mac.end(),
                  bytes_.end() - static_cast<std::ptrdiff_t>(truncated_mac.size()));
        debug::LogMacAppended(truncated_mac);
        return Result<Unit, DecodeError>::Ok(unit);
    }

    Result<DecodedMessage, DecodeError> OlmMessage::Decode() const {
        if (bytes_.empty()) {
            return Reject(DecodeError::MissingVersion());
        }
        const uint8_t version = bytes_.front();
        if (!kWire.IsSupportedVersion(version)) {
            return Reject(DecodeError::InvalidVersion(kWire.GetVersion(), version));
        }
        if (bytes_.size() < kWire.GetMinimumMessageLength()) {
            return Reject(DecodeError::MessageTooShort(bytes_.size()));
        }

        const auto all = std::span<const uint8_t>(bytes_);
        const auto body = all.subspan(1, all.size() - 1 - kWire.GetMacLength());
        const auto mac_slice = all.last(kWire.GetMacLength());

        if (body.size() > static_cast<size_t>(INT_MAX)) {
            return Reject(DecodeError::StructuralDecode(ErrorMessages::PAYLOAD_TOO_LARGE));
        }
        proto::messages::InnerMessage inner;
        if (!inner.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
            return Reject(DecodeError::StructuralDecode(ErrorMessages::PARSE_INNER_MESSAGE_FAILED));
        }
        if (auto mismatch = FindWireTypeMismatch(inner)) {
            return Reject(std::move(*mismatch));
        }

        auto key_result = models::Curve25519PublicKey::FromBytes(AsByteSpan(inner.ratchet_key()));
        if (key_result.IsErr()) {
            return Reject(std::move(key_result).UnwrapErr());
        }
        if (mac_slice.size() != kMacTruncatedBytes) {
            return Reject(DecodeError::InvalidMacLength(kMacTruncatedBytes, mac_slice.size()));
        }

        const auto ciphertext = AsByteSpan(inner.ciphertext());
        DecodedMessage decoded{
            std::move(key_result).Unwrap(),
            inner.chain_index(),
            std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()),
            {}
        };
        std::copy(mac_slice.begin(), mac_slice.end(), decoded.mac.begin());

        debug::LogOlmMessageDecoded(decoded.ratchet_key.AsBytes(), decoded.chain_index, decoded.ciphertext.size());
        return Result<DecodedMessage, DecodeError>::Ok(std::move(decoded));
    }
}

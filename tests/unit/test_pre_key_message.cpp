#include <catch2/catch_test_macros.hpp>
#include "olmwire/messages/pre_key_message.hpp"
#include "olmwire/messages/olm_message.hpp"
#include "olmwire/core/constants.hpp"
#include "helpers/wire_builders.hpp"
#include <algorithm>
#include <array>
#include <vector>

using namespace olmwire::protocol;
using namespace olmwire::protocol::messages;
using namespace olmwire::test;

namespace {
    constexpr uint8_t kOneTimeKeyTag = 0x0A;
    constexpr uint8_t kBaseKeyTag = 0x12;
    constexpr uint8_t kIdentityKeyTag = 0x1A;
    constexpr uint8_t kMessageTag = 0x22;

    std::vector<uint8_t> PreKeyFrame(
        std::span<const uint8_t> one_time_key,
        std::span<const uint8_t> base_key,
        std::span<const uint8_t> identity_key,
        std::span<const uint8_t> message) {
        std::vector<uint8_t> out = {kProtocolVersion};
        AppendBytesField(out, kOneTimeKeyTag, one_time_key);
        AppendBytesField(out, kBaseKeyTag, base_key);
        AppendBytesField(out, kIdentityKeyTag, identity_key);
        AppendBytesField(out, kMessageTag, message);
        return out;
    }
}

TEST_CASE("PreKeyMessage - FromParts layout", "[pre_key_message][encode]") {
    const auto one_time_key = KeyFilledWith(0x01);
    const auto base_key = KeyFilledWith(0x02);
    const auto identity_key = KeyFilledWith(0x03);

    SECTION("Version byte followed by the four fields in tag order, no MAC") {
        const auto embedded = Bytes("embedded");
        const auto message = PreKeyMessage::FromParts(one_time_key, base_key, identity_key, embedded);
        const auto expected = PreKeyFrame(
            one_time_key.AsBytes(), base_key.AsBytes(), identity_key.AsBytes(), embedded);
        REQUIRE(std::vector<uint8_t>(message.AsBytes().begin(), message.AsBytes().end()) == expected);
    }

    SECTION("An empty embedded message is omitted from the body") {
        const auto message = PreKeyMessage::FromParts(one_time_key, base_key, identity_key, {});
        REQUIRE(message.AsBytes().size() == 1 + 3 * (2 + 32));
        REQUIRE(message.AsBytes().back() == 0x03);

        auto decoded = message.Decode();
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().message.empty());
    }
}

TEST_CASE("PreKeyMessage - Decode round trip", "[pre_key_message][decode]") {
    const auto one_time_key = SequentialKey(0x10);
    const auto base_key = SequentialKey(0x40);
    const auto identity_key = SequentialKey(0x70);

    auto inner = OlmMessage::FromParts(SequentialKey(0xA0), 0, Bytes("first message"));
    const std::array<uint8_t, 8> tag = {1, 2, 3, 4, 5, 6, 7, 8};
    REQUIRE(inner.AppendMacBytes(tag).IsOk());
    const auto inner_bytes = inner.AsBytes();

    const auto message = PreKeyMessage::FromParts(one_time_key, base_key, identity_key, inner_bytes);
    auto decoded = message.Decode();
    REQUIRE(decoded.IsOk());

    const auto& value = decoded.Unwrap();
    REQUIRE(value.one_time_key == one_time_key);
    REQUIRE(value.base_key == base_key);
    REQUIRE(value.identity_key == identity_key);
    REQUIRE(value.message == std::vector<uint8_t>(inner_bytes.begin(), inner_bytes.end()));

    SECTION("The embedded message decodes in a second step") {
        auto embedded = OlmMessage::FromBytes(value.message).Decode();
        REQUIRE(embedded.IsOk());
        REQUIRE(embedded.Unwrap().ratchet_key == SequentialKey(0xA0));
        REQUIRE(embedded.Unwrap().chain_index == 0);
        REQUIRE(embedded.Unwrap().ciphertext == Bytes("first message"));
        REQUIRE(embedded.Unwrap().mac == tag);
    }

    SECTION("IntoBytes and FromBytes preserve the envelope") {
        auto copy = message;
        const auto rewrapped = PreKeyMessage::FromBytes(std::move(copy).IntoBytes());
        REQUIRE(rewrapped == message);
    }
}

TEST_CASE("PreKeyMessage - Decode rejections", "[pre_key_message][decode]") {
    const std::vector<uint8_t> good(32, 0x11);

    SECTION("Empty buffer") {
        auto result = PreKeyMessage::FromBytes({}).Decode();
        REQUIRE(result.UnwrapErr() == DecodeError::MissingVersion());
    }

    SECTION("Wrong version") {
        auto bytes = PreKeyFrame(good, good, good, Bytes("m"));
        bytes[0] = 0x04;
        auto result = PreKeyMessage::FromBytes(bytes).Decode();
        REQUIRE(result.UnwrapErr() == DecodeError::InvalidVersion(3, 4));
    }

    SECTION("Version byte alone decodes to empty keys") {
        auto result = PreKeyMessage::FromBytes({kProtocolVersion}).Decode();
        REQUIRE(result.UnwrapErr() == DecodeError::InvalidKeyLength(32, 0));
    }

    SECTION("Keys are checked one-time, base, identity") {
        const std::vector<uint8_t> short_key(16, 0x22);
        const std::vector<uint8_t> long_key(33, 0x33);
        const std::vector<uint8_t> tiny_key(5, 0x44);

        auto all_bad = PreKeyMessage::FromBytes(PreKeyFrame(short_key, long_key, tiny_key, {})).Decode();
        REQUIRE(all_bad.UnwrapErr() == DecodeError::InvalidKeyLength(32, 16));

        auto base_bad = PreKeyMessage::FromBytes(PreKeyFrame(good, long_key, tiny_key, {})).Decode();
        REQUIRE(base_bad.UnwrapErr() == DecodeError::InvalidKeyLength(32, 33));

        auto identity_bad = PreKeyMessage::FromBytes(PreKeyFrame(good, good, tiny_key, {})).Decode();
        REQUIRE(identity_bad.UnwrapErr() == DecodeError::InvalidKeyLength(32, 5));
    }

    SECTION("Truncated body") {
        std::vector<uint8_t> bytes = {kProtocolVersion, kOneTimeKeyTag, 0x20, 0x01, 0x02, 0x03};
        auto result = PreKeyMessage::FromBytes(bytes).Decode();
        REQUIRE(result.UnwrapErr().type == DecodeFailureType::StructuralDecode);
    }

    SECTION("Garbage in the embedded message is not this layer's concern") {
        auto result = PreKeyMessage::FromBytes(PreKeyFrame(good, good, good, Bytes("not an olm message"))).Decode();
        REQUIRE(result.IsOk());
        REQUIRE(OlmMessage::FromBytes(result.Unwrap().message).Decode().IsErr());
    }
}

#include <catch2/catch_test_macros.hpp>
#include "olmwire/messages/olm_message.hpp"
#include "olmwire/messages/pre_key_message.hpp"
#include "helpers/wire_builders.hpp"
#include <array>
#include <string_view>
#include <vector>

using namespace olmwire::protocol;
using namespace olmwire::protocol::messages;
using olmwire::test::Bytes;
using olmwire::test::SequentialKey;

namespace {
    std::vector<uint8_t> ToVector(std::span<const uint8_t> bytes) {
        return {bytes.begin(), bytes.end()};
    }

    std::vector<uint8_t> Concat(std::initializer_list<std::vector<uint8_t>> parts) {
        std::vector<uint8_t> out;
        for (const auto& part : parts) {
            out.insert(out.end(), part.begin(), part.end());
        }
        return out;
    }
}

TEST_CASE("Legacy vectors - libolm normal message encoding", "[interop][olm_message]") {
    using namespace std::string_view_literals;
    const auto payload = Bytes("\x03\n\nratchetkey\x10\x01\"\nciphertext"sv);
    const auto payload_with_mac = Bytes("\x03\n\nratchetkey\x10\x01\"\nciphertextMACHEREE"sv);

    auto encoded = OlmMessage::FromPartsUntyped(Bytes("ratchetkey"), 1, Bytes("ciphertext"));
    REQUIRE(ToVector(encoded.AsPayloadBytes()) == payload);

    std::array<uint8_t, 8> mac{};
    const auto mac_text = Bytes("MACHEREE");
    std::copy(mac_text.begin(), mac_text.end(), mac.begin());
    REQUIRE(encoded.AppendMacBytes(mac).IsOk());

    REQUIRE(ToVector(encoded.AsPayloadBytes()) == payload);
    REQUIRE(ToVector(encoded.AsBytes()) == payload_with_mac);
}

TEST_CASE("Legacy vectors - Zero chain index with a Curve25519 key", "[interop][olm_message]") {
    const auto key = SequentialKey(0x00);
    auto encoded = OlmMessage::FromParts(key, 0, std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});

    const auto expected = Concat({
        {0x03, 0x0A, 0x20},
        key.ToVector(),
        {0x10, 0x00},
        {0x22, 0x04, 0xDE, 0xAD, 0xBE, 0xEF},
        std::vector<uint8_t>(8, 0x00)
    });
    REQUIRE(ToVector(encoded.AsBytes()) == expected);

    auto decoded = encoded.Decode();
    REQUIRE(decoded.IsOk());
    REQUIRE(decoded.Unwrap().chain_index == 0);
}

TEST_CASE("Legacy vectors - Long ciphertext length prefix", "[interop][olm_message]") {
    const auto key = SequentialKey(0x20);
    const std::vector<uint8_t> ciphertext(200, 0x99);
    auto encoded = OlmMessage::FromParts(key, 0x80, ciphertext);

    const auto expected_payload = Concat({
        {0x03, 0x0A, 0x20},
        key.ToVector(),
        {0x10, 0x80, 0x01},
        {0x22, 0xC8, 0x01},
        ciphertext
    });
    REQUIRE(ToVector(encoded.AsPayloadBytes()) == expected_payload);
}

TEST_CASE("Legacy vectors - Pre-key message encoding", "[interop][pre_key_message]") {
    const auto one_time_key = SequentialKey(0x00);
    const auto base_key = SequentialKey(0x20);
    const auto identity_key = SequentialKey(0x40);
    const std::vector<uint8_t> inner = {0x03, 0x0A};

    const auto encoded = PreKeyMessage::FromParts(one_time_key, base_key, identity_key, inner);
    const auto expected = Concat({
        {0x03},
        {0x0A, 0x20}, one_time_key.ToVector(),
        {0x12, 0x20}, base_key.ToVector(),
        {0x1A, 0x20}, identity_key.ToVector(),
        {0x22, 0x02, 0x03, 0x0A}
    });
    REQUIRE(ToVector(encoded.AsBytes()) == expected);
}

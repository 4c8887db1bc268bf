/**
 * @file basic_message_example.cpp
 * @brief Build, authenticate and decode a normal message, then wrap it in a pre-key message
 */

#include "olmwire/crypto/sodium_interop.hpp"
#include "olmwire/crypto/mac.hpp"
#include "olmwire/messages/olm_message.hpp"
#include "olmwire/messages/pre_key_message.hpp"

#include <array>
#include <iostream>
#include <iomanip>
#include <string>

using namespace olmwire::protocol;
using namespace olmwire::protocol::crypto;
using namespace olmwire::protocol::messages;

void print_hex(const std::string& label, std::span<const uint8_t> data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

models::Curve25519PublicKey fixed_key(uint8_t first) {
    std::array<uint8_t, models::Curve25519PublicKey::KEY_LENGTH> bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(first + i);
    }
    return models::Curve25519PublicKey(bytes);
}

int main() {
    std::cout << "=== olmwire - Basic Message Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Preparing ratchet, one-time, base and identity keys..." << std::endl;
    const auto ratchet_public = fixed_key(0x10);
    const auto one_time_public = fixed_key(0x40);
    const auto base_public = fixed_key(0x60);
    const auto identity_public = fixed_key(0x80);
    print_hex("   Ratchet key", ratchet_public.AsBytes());
    std::cout << std::endl;

    std::cout << "3. Encoding a normal message at chain index 0..." << std::endl;
    const std::string plaintext_stand_in = "already encrypted bytes";
    const std::vector<uint8_t> ciphertext(plaintext_stand_in.begin(), plaintext_stand_in.end());
    auto message = OlmMessage::FromParts(ratchet_public, 0, ciphertext);

    const std::vector<uint8_t> mac_key(kMacKeyBytes, 0x0B);
    auto mac = Mac::Compute(mac_key, message.AsPayloadBytes());
    if (mac.IsErr()) {
        std::cerr << "Failed to compute MAC: " << mac.UnwrapErr().message << std::endl;
        return 1;
    }
    if (auto appended = message.AppendMac(mac.Unwrap()); appended.IsErr()) {
        std::cerr << "Failed to append MAC: " << appended.UnwrapErr().message << std::endl;
        return 1;
    }
    print_hex("   Envelope", message.AsBytes());
    std::cout << std::endl;

    std::cout << "4. Decoding and verifying..." << std::endl;
    auto decoded = message.Decode();
    if (decoded.IsErr()) {
        std::cerr << "Failed to decode: " << decoded.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& fields = decoded.Unwrap();
    auto verified = Mac::VerifyTruncated(mac_key, message.AsPayloadBytes(), fields.mac);
    if (verified.IsErr() || !verified.Unwrap()) {
        std::cerr << "MAC verification failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Chain index " << fields.chain_index
              << ", " << fields.ciphertext.size() << " ciphertext bytes, MAC valid" << std::endl;
    std::cout << std::endl;

    std::cout << "5. Wrapping in a pre-key message..." << std::endl;
    const auto inner = message.AsBytes();
    auto pre_key = PreKeyMessage::FromParts(one_time_public, base_public, identity_public, inner);
    print_hex("   Pre-key envelope", pre_key.AsBytes());

    auto unwrapped = pre_key.Decode();
    if (unwrapped.IsErr()) {
        std::cerr << "Failed to decode pre-key message: " << unwrapped.UnwrapErr().message << std::endl;
        return 1;
    }
    auto embedded = OlmMessage::FromBytes(std::move(unwrapped).Unwrap().message);
    std::cout << "   ✓ Embedded message "
              << (embedded == message ? "matches" : "DIFFERS") << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}

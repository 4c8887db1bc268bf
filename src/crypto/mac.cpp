#include "olmwire/crypto/mac.hpp"
#include "olmwire/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <algorithm>

namespace olmwire::protocol::crypto {

static_assert(Mac::LENGTH == crypto_auth_hmacsha256_BYTES);

Result<Mac, SodiumFailure> Mac::Compute(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<Mac, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (key.empty()) {
        return Result<Mac, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("MAC key must not be empty"));
    }

    crypto_auth_hmacsha256_state state;
    std::array<uint8_t, LENGTH> output{};
    if (crypto_auth_hmacsha256_init(&state, key.data(), key.size()) != 0 ||
        crypto_auth_hmacsha256_update(&state, data.data(), data.size()) != 0 ||
        crypto_auth_hmacsha256_final(&state, output.data()) != 0) {
        sodium_memzero(&state, sizeof(state));
        return Result<Mac, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HMAC_FAILED)));
    }
    sodium_memzero(&state, sizeof(state));
    return Result<Mac, SodiumFailure>::Ok(Mac(output));
}

Result<bool, SodiumFailure> Mac::VerifyTruncated(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data,
    std::span<const uint8_t> truncated_tag) {
    auto mac_result = Compute(key, data);
    if (mac_result.IsErr()) {
        return Result<bool, SodiumFailure>::Err(std::move(mac_result).UnwrapErr());
    }
    auto expected = mac_result.Unwrap().Truncate();
    auto compare_result = SodiumInterop::ConstantTimeEquals(expected, truncated_tag);
    auto wipe_result = SodiumInterop::SecureWipe(expected);
    if (wipe_result.IsErr()) {
        return Result<bool, SodiumFailure>::Err(std::move(wipe_result).UnwrapErr());
    }
    return compare_result;
}

std::array<uint8_t, Mac::TRUNCATED_LENGTH> Mac::Truncate() const noexcept {
    std::array<uint8_t, TRUNCATED_LENGTH> truncated{};
    std::copy_n(bytes_.begin(), TRUNCATED_LENGTH, truncated.begin());
    return truncated;
}

} // namespace olmwire::protocol::crypto

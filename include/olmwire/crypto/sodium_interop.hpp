#pragma once

#include "olmwire/core/result.hpp"
#include "olmwire/core/failures.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>

namespace olmwire::protocol::crypto {

/**
 * @brief Thin wrapper over the libsodium primitives the codec layer needs
 *
 * Initialize() must succeed before any other call.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer with sodium_memzero
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching their
     * contents.
     *
     * @return Ok(true) if equal, Ok(false) if different, Err if not initialized
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace olmwire::protocol::crypto

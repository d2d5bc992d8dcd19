#pragma once

#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include "certdel/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace certdel::protocol::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Wraps the handful of libsodium primitives the scheme relies on: process-wide
 * initialisation, the system CSPRNG, deterministic seeded streams, constant-time
 * comparison and secure wiping of key material.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Securely wipe a buffer of 64-bit words (packed bit storage)
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint64_t> words);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief Fill a buffer from the system CSPRNG (randombytes_buf)
     */
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> buffer);

    /**
     * @brief Fill a buffer from a deterministic stream keyed by a 32-byte seed
     *
     * Uses randombytes_buf_deterministic; the same seed always yields the same
     * bytes, so callers must derive a fresh seed for every block.
     */
    static Result<Unit, SodiumFailure> FillDeterministic(
        std::span<uint8_t> buffer,
        std::span<const uint8_t> seed);

    /**
     * @brief Keyed BLAKE2b (crypto_generichash) of a message
     */
    static Result<Unit, SodiumFailure> KeyedHash(
        std::span<uint8_t> output,
        std::span<const uint8_t> message,
        std::span<const uint8_t> key);

    /**
     * @brief Uniform integer in [0, upper_bound) from the system CSPRNG
     */
    static uint32_t UniformRandom(uint32_t upper_bound);

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace certdel::protocol::crypto

#include "certdel/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <string>

namespace certdel::protocol::crypto {

static_assert(Constants::RANDOM_BLOCK_SEED_SIZE == randombytes_SEEDBYTES,
              "Deterministic block seed must match libsodium seed size");

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < SodiumConstants::SUCCESS) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > SodiumConstants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(SodiumConstants::MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint64_t> words) {
    return SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(words.data()),
        words.size_bytes()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) +
                ": " + std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    const int result = sodium_memcmp(a.data(), b.data(), a.size());
    return Result<bool, SodiumFailure>::Ok(result == SodiumConstants::SUCCESS);
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::RandomGenerationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::FillDeterministic(
    std::span<uint8_t> buffer,
    std::span<const uint8_t> seed) {
    if (seed.size() != randombytes_SEEDBYTES) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::RandomGenerationFailed(
                "Deterministic seed must be " + std::to_string(randombytes_SEEDBYTES) +
                " bytes, got " + std::to_string(seed.size())));
    }
    if (!buffer.empty()) {
        randombytes_buf_deterministic(buffer.data(), buffer.size(), seed.data());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::KeyedHash(
    std::span<uint8_t> output,
    std::span<const uint8_t> message,
    std::span<const uint8_t> key) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::RandomGenerationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (output.size() < crypto_generichash_BYTES_MIN ||
        output.size() > crypto_generichash_BYTES_MAX ||
        key.size() > crypto_generichash_KEYBYTES_MAX) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::RandomGenerationFailed("Keyed hash size out of range"));
    }
    if (crypto_generichash(output.data(), output.size(),
                           message.data(), message.size(),
                           key.data(), key.size()) != SodiumConstants::SUCCESS) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::RandomGenerationFailed("crypto_generichash failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

uint32_t SodiumInterop::UniformRandom(const uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

} // namespace certdel::protocol::crypto

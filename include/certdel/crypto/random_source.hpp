#pragma once

#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include "certdel/core/constants.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace certdel::protocol::crypto {

/**
 * @brief Source of uniformly random bits for keys and encryption samples
 *
 * Either draws from the libsodium system CSPRNG, or from a deterministic
 * stream that is seeded explicitly. Deterministic mode exists for reproducible
 * experiments and tests; every block is generated from a fresh BLAKE2b-derived
 * seed (seed, block counter), so no output is ever repeated within a stream.
 *
 * Copying is disabled: two copies of one stream would hand out identical pads.
 */
class RandomSource {
public:
    using Seed = std::array<uint8_t, Constants::RANDOM_SEED_SIZE>;

    /**
     * @brief Source backed by randombytes_buf
     */
    static Result<RandomSource, SodiumFailure> System();

    /**
     * @brief Deterministic source keyed by a 32-byte seed
     */
    static Result<RandomSource, SodiumFailure> Seeded(std::span<const uint8_t> seed);

    /**
     * @brief Deterministic source keyed by a 64-bit seed (zero-extended)
     */
    static Result<RandomSource, SodiumFailure> Seeded(uint64_t seed);

    RandomSource(RandomSource&& other) noexcept;
    RandomSource& operator=(RandomSource&& other) noexcept;
    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;
    ~RandomSource();

    Result<Unit, SodiumFailure> Fill(std::span<uint8_t> buffer);

    /**
     * @brief Uniform integer in [0, upper_bound)
     *
     * Rejection sampling over 32-bit draws in deterministic mode, so the
     * distribution carries no modulo bias.
     */
    Result<uint32_t, SodiumFailure> Uniform(uint32_t upper_bound);

    [[nodiscard]] bool IsDeterministic() const noexcept {
        return seed_.has_value();
    }

    [[nodiscard]] uint64_t BlocksDrawn() const noexcept {
        return block_counter_;
    }

private:
    explicit RandomSource(std::optional<Seed> seed);

    void WipeSeed() noexcept;

    std::optional<Seed> seed_;
    uint64_t block_counter_;
};

} // namespace certdel::protocol::crypto

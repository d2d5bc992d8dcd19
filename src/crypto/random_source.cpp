#include "certdel/crypto/random_source.hpp"
#include "certdel/crypto/sodium_interop.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace certdel::protocol::crypto {

namespace {

constexpr size_t kCounterBytes = sizeof(uint64_t);

std::array<uint8_t, kCounterBytes> EncodeCounter(const uint64_t counter) {
    std::array<uint8_t, kCounterBytes> out{};
    for (size_t i = 0; i < kCounterBytes; ++i) {
        out[i] = static_cast<uint8_t>((counter >> (i * Constants::BYTE_BITS)) & 0xFF);
    }
    return out;
}

}

Result<RandomSource, SodiumFailure> RandomSource::System() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<RandomSource, SodiumFailure>::Err(std::move(init).UnwrapErr());
    }
    return Result<RandomSource, SodiumFailure>::Ok(RandomSource(std::nullopt));
}

Result<RandomSource, SodiumFailure> RandomSource::Seeded(std::span<const uint8_t> seed) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<RandomSource, SodiumFailure>::Err(std::move(init).UnwrapErr());
    }
    if (seed.size() != Constants::RANDOM_SEED_SIZE) {
        return Result<RandomSource, SodiumFailure>::Err(
            SodiumFailure::RandomGenerationFailed(
                "Seed must be " + std::to_string(Constants::RANDOM_SEED_SIZE) +
                " bytes, got " + std::to_string(seed.size())));
    }
    Seed stored{};
    std::copy(seed.begin(), seed.end(), stored.begin());
    return Result<RandomSource, SodiumFailure>::Ok(RandomSource(stored));
}

Result<RandomSource, SodiumFailure> RandomSource::Seeded(const uint64_t seed) {
    Seed expanded{};
    const auto encoded = EncodeCounter(seed);
    std::copy(encoded.begin(), encoded.end(), expanded.begin());
    return Seeded(std::span<const uint8_t>(expanded));
}

RandomSource::RandomSource(std::optional<Seed> seed)
    : seed_(std::move(seed))
    , block_counter_(0) {
}

RandomSource::RandomSource(RandomSource&& other) noexcept
    : seed_(std::move(other.seed_))
    , block_counter_(other.block_counter_) {
    other.WipeSeed();
    other.seed_.reset();
}

RandomSource& RandomSource::operator=(RandomSource&& other) noexcept {
    if (this != &other) {
        WipeSeed();
        seed_ = std::move(other.seed_);
        block_counter_ = other.block_counter_;
        other.WipeSeed();
        other.seed_.reset();
    }
    return *this;
}

RandomSource::~RandomSource() {
    WipeSeed();
}

void RandomSource::WipeSeed() noexcept {
    if (seed_.has_value()) {
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(*seed_));
        (void) wipe;
    }
}

Result<Unit, SodiumFailure> RandomSource::Fill(std::span<uint8_t> buffer) {
    if (!seed_.has_value()) {
        ++block_counter_;
        return SodiumInterop::FillRandom(buffer);
    }

    std::array<uint8_t, Constants::RANDOM_BLOCK_SEED_SIZE> block_seed{};
    const auto counter = EncodeCounter(block_counter_);
    auto hash_result = SodiumInterop::KeyedHash(block_seed, counter, *seed_);
    if (hash_result.IsErr()) {
        return hash_result;
    }
    ++block_counter_;

    auto fill_result = SodiumInterop::FillDeterministic(buffer, block_seed);
    auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(block_seed));
    (void) wipe;
    return fill_result;
}

Result<uint32_t, SodiumFailure> RandomSource::Uniform(const uint32_t upper_bound) {
    if (upper_bound < 2) {
        return Result<uint32_t, SodiumFailure>::Ok(0);
    }
    if (!seed_.has_value()) {
        ++block_counter_;
        return Result<uint32_t, SodiumFailure>::Ok(SodiumInterop::UniformRandom(upper_bound));
    }

    // Values below `minimum` would bias the low residues, so they are redrawn.
    const uint32_t minimum = (std::numeric_limits<uint32_t>::max() - upper_bound + 1) % upper_bound;
    while (true) {
        std::array<uint8_t, sizeof(uint32_t)> bytes{};
        auto fill_result = Fill(bytes);
        if (fill_result.IsErr()) {
            return Result<uint32_t, SodiumFailure>::Err(std::move(fill_result).UnwrapErr());
        }
        uint32_t value = 0;
        for (size_t i = 0; i < bytes.size(); ++i) {
            value |= static_cast<uint32_t>(bytes[i]) << (i * Constants::BYTE_BITS);
        }
        if (value >= minimum) {
            return Result<uint32_t, SodiumFailure>::Ok(value % upper_bound);
        }
    }
}

} // namespace certdel::protocol::crypto

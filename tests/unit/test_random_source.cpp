#include <catch2/catch_test_macros.hpp>
#include "certdel/crypto/random_source.hpp"
#include "certdel/gf2/bit_string.hpp"
#include <array>
#include <vector>

using namespace certdel::protocol;
using namespace certdel::protocol::crypto;

TEST_CASE("RandomSource - Seeded streams are reproducible", "[random][crypto]") {
    auto a = RandomSource::Seeded(uint64_t{42}).Unwrap();
    auto b = RandomSource::Seeded(uint64_t{42}).Unwrap();
    REQUIRE(a.IsDeterministic());

    std::vector<uint8_t> out_a(100);
    std::vector<uint8_t> out_b(100);
    REQUIRE(a.Fill(out_a).IsOk());
    REQUIRE(b.Fill(out_b).IsOk());
    REQUIRE(out_a == out_b);

    SECTION("Successive blocks differ") {
        std::vector<uint8_t> next(100);
        REQUIRE(a.Fill(next).IsOk());
        REQUIRE(next != out_a);
        REQUIRE(a.BlocksDrawn() == 2);
    }
    SECTION("Different seeds differ") {
        auto c = RandomSource::Seeded(uint64_t{43}).Unwrap();
        std::vector<uint8_t> out_c(100);
        REQUIRE(c.Fill(out_c).IsOk());
        REQUIRE(out_c != out_a);
    }
}

TEST_CASE("RandomSource - Seed size is enforced", "[random][crypto]") {
    std::array<uint8_t, 16> short_seed{};
    auto result = RandomSource::Seeded(std::span<const uint8_t>(short_seed));
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == SodiumFailureType::RandomGenerationFailed);
}

TEST_CASE("RandomSource - Uniform stays in range", "[random][crypto]") {
    auto random = RandomSource::Seeded(uint64_t{1}).Unwrap();
    std::array<size_t, 6> seen{};
    for (int i = 0; i < 600; ++i) {
        auto value = random.Uniform(6);
        REQUIRE(value.IsOk());
        REQUIRE(value.Unwrap() < 6);
        ++seen[value.Unwrap()];
    }
    for (const auto count : seen) {
        REQUIRE(count > 0);
    }
    REQUIRE(random.Uniform(1).Unwrap() == 0);
}

TEST_CASE("RandomSource - System source", "[random][crypto]") {
    auto random = RandomSource::System();
    REQUIRE(random.IsOk());
    REQUIRE_FALSE(random.Unwrap().IsDeterministic());
    auto bits = gf2::BitString::Random(130, random.Unwrap());
    REQUIRE(bits.IsOk());
    REQUIRE(bits.Unwrap().Size() == 130);
}

TEST_CASE("RandomSource - Random bit strings keep tail bits clear", "[random][gf2]") {
    auto random = RandomSource::Seeded(uint64_t{9}).Unwrap();
    for (size_t size : {1u, 7u, 63u, 64u, 65u, 200u}) {
        auto bits = gf2::BitString::Random(size, random).Unwrap();
        auto copy = gf2::BitString::FromString(bits.ToString()).Unwrap();
        REQUIRE(copy == bits);
    }
}

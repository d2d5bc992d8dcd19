#include <catch2/catch_test_macros.hpp>
#include "certdel/crypto/sodium_interop.hpp"
#include "certdel/core/constants.hpp"
#include <array>
#include <vector>
using namespace certdel::protocol;
using namespace certdel::protocol::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        auto result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        REQUIRE(result.IsOk());
    }
    SECTION("Wipe small buffer") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        for (const auto byte : buffer) {
            REQUIRE(byte == 0);
        }
    }
    SECTION("Wipe large buffer") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer.front() == 0);
        REQUIRE(buffer.back() == 0);
    }
    SECTION("Wipe packed words") {
        std::vector<uint64_t> words(4, ~uint64_t{0});
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint64_t>(words)).IsOk());
        for (const auto word : words) {
            REQUIRE(word == 0);
        }
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == true);
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == false);
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == false);
    }
    SECTION("Empty buffers are equal") {
        std::vector<uint8_t> a;
        std::vector<uint8_t> b;
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == true);
    }
}

TEST_CASE("SodiumInterop - Deterministic streams", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::array<uint8_t, Constants::RANDOM_SEED_SIZE> seed{};
    seed[0] = 0x5A;

    std::vector<uint8_t> first(64);
    std::vector<uint8_t> second(64);
    REQUIRE(SodiumInterop::FillDeterministic(first, seed).IsOk());
    REQUIRE(SodiumInterop::FillDeterministic(second, seed).IsOk());
    REQUIRE(first == second);

    SECTION("Wrong seed size fails") {
        std::array<uint8_t, 8> short_seed{};
        auto result = SodiumInterop::FillDeterministic(first, short_seed);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::RandomGenerationFailed);
    }
}

TEST_CASE("SodiumInterop - Keyed hash", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> message = {1, 2, 3};
    const std::vector<uint8_t> key_a(32, 0x01);
    const std::vector<uint8_t> key_b(32, 0x02);
    std::array<uint8_t, 32> out_a{};
    std::array<uint8_t, 32> out_b{};
    REQUIRE(SodiumInterop::KeyedHash(out_a, message, key_a).IsOk());
    REQUIRE(SodiumInterop::KeyedHash(out_b, message, key_b).IsOk());
    REQUIRE(out_a != out_b);

    SECTION("Output too short is rejected") {
        std::array<uint8_t, 4> tiny{};
        REQUIRE(SodiumInterop::KeyedHash(tiny, message, key_a).IsErr());
    }
}

TEST_CASE("SodiumInterop - Uniform random", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    for (int i = 0; i < 100; ++i) {
        REQUIRE(SodiumInterop::UniformRandom(10) < 10);
    }
}

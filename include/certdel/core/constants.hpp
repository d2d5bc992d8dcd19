#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace certdel::protocol {
struct Constants {
    static constexpr size_t WORD_BITS = 64;
    static constexpr size_t BYTE_BITS = 8;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t RANDOM_SEED_SIZE = 32;
    static constexpr size_t RANDOM_BLOCK_SEED_SIZE = 32;
    static constexpr char BIT_ZERO = '0';
    static constexpr char BIT_ONE = '1';
    static constexpr char STAGE_SEPARATOR = ' ';
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};
struct SchemeConstants {
    // sin^2(pi/8), the per-position error rate of a Breidbart measurement.
    static constexpr double BREIDBART_ERROR_RATE = 0.14644660940672624;
    static constexpr double RANDOM_GUESS_ERROR_RATE = 0.5;
    static constexpr double PERCENT = 100.0;
    static constexpr uint32_t MAX_SYNDROME_TABLE_WEIGHT = 3;
};
struct CodeNames {
    static constexpr std::string_view NONE = "none";
    static constexpr std::string_view HAMMING_3 = "hamming_3";
    static constexpr std::string_view HAMMING_4 = "hamming_4";
    static constexpr std::string_view REED_MULLER_4_7 = "reed_muller_4_7";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view XOR_NO_INPUTS = "Xor requires at least one bit string";
    static constexpr std::string_view DELTA_OUT_OF_RANGE = "delta must lie strictly between 0 and 1";
    static constexpr std::string_view INVALID_BIT_CHARACTER = "Bit strings may contain only '0' and '1'";
    static constexpr std::string_view MISSING_STAGE_SEPARATOR = "Measurement does not contain exactly one stage separator";
};
}

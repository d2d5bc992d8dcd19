#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug logging of key material and protocol steps.
 *
 * SECURITY WARNING: This module prints secret pads, hash matrices and the
 * Hadamard basis choice to stdout. Only enable CERTDEL_DEBUG_KEYS to check
 * experiments step by step. NEVER enable in production builds.
 *
 * Enable via CMake: -DCERTDEL_DEBUG_KEYS=ON
 */

#include "certdel/gf2/bit_string.hpp"
#include "certdel/gf2/bit_matrix.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace certdel::debug {

// ============================================================================
// Side identifiers - always defined so types are available
// ============================================================================

enum class Side {
    Sender,
    Receiver
};

#ifdef CERTDEL_DEBUG_KEYS

/**
 * @brief Renders a bit string as text, truncated for long strings.
 */
inline std::string ToBitsTruncated(const protocol::gf2::BitString& bits, size_t max_bits = 128) {
    if (bits.Size() <= max_bits) {
        return bits.ToString();
    }
    auto truncated = bits.Slice(0, max_bits).ToString();
    truncated += "...(" + std::to_string(bits.Size()) + " bits)";
    return truncated;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Sender: return "SENDER";
        case Side::Receiver: return "RECEIVER";
    }
    return "UNKNOWN";
}

// ============================================================================
// Core logging macros
// ============================================================================

#define CDL_LOG_BITS(side, operation, name, bits) \
    do { \
        fprintf(stdout, "[CDL-DEBUG] %s %s %s: %s\n", \
            ::certdel::debug::SideToString(side), \
            operation, \
            name, \
            ::certdel::debug::ToBitsTruncated(bits).c_str()); \
        fflush(stdout); \
    } while(0)

#define CDL_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[CDL-DEBUG] %s %s %s: %s\n", \
            ::certdel::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define CDL_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[CDL-DEBUG] %s %s %s\n", \
            ::certdel::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define CDL_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stdout, "[CDL-DEBUG] %s ========== %s ==========\n", \
            ::certdel::debug::SideToString(side), \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Key generation
// ============================================================================

inline void LogKeyGenerated(
    Side side,
    const protocol::gf2::BitString& hadamard_mask,
    const protocol::gf2::BitString& r_bar,
    const protocol::gf2::BitString& u,
    const protocol::gf2::BitString& d,
    const protocol::gf2::BitString& e,
    const protocol::gf2::BitMatrix& privacy_amplification,
    const protocol::gf2::BitMatrix& error_correction) {

    CDL_LOG_SECTION(side, "KEY GENERATED");
    CDL_LOG_BITS(side, "KEY", "theta (1 = Hadamard)", hadamard_mask);
    CDL_LOG_BITS(side, "KEY", "r_bar", r_bar);
    CDL_LOG_BITS(side, "KEY", "u", u);
    CDL_LOG_BITS(side, "KEY", "d", d);
    CDL_LOG_BITS(side, "KEY", "e", e);
    CDL_LOG_VALUE(side, "KEY", "privacy_amplification_rows", privacy_amplification.Rows());
    CDL_LOG_VALUE(side, "KEY", "privacy_amplification_cols", privacy_amplification.Cols());
    CDL_LOG_VALUE(side, "KEY", "error_correction_rows", error_correction.Rows());
    CDL_LOG_VALUE(side, "KEY", "error_correction_cols", error_correction.Cols());
}

// ============================================================================
// Encryption / Decryption
// ============================================================================

inline void LogEncryption(
    Side side,
    const protocol::gf2::BitString& r,
    const protocol::gf2::BitString& x,
    const protocol::gf2::BitString& c,
    const protocol::gf2::BitString& p,
    const protocol::gf2::BitString& q,
    bool submitted_to_backend) {

    CDL_LOG_SECTION(side, "ENCRYPT");
    CDL_LOG_BITS(side, "ENCRYPT", "r", r);
    CDL_LOG_BITS(side, "ENCRYPT", "x", x);
    CDL_LOG_BITS(side, "ENCRYPT", "c", c);
    CDL_LOG_BITS(side, "ENCRYPT", "p", p);
    CDL_LOG_BITS(side, "ENCRYPT", "q", q);
    CDL_LOG_MSG(side, "ENCRYPT", submitted_to_backend ? "backend: SUBMITTED" : "backend: NONE");
}

inline void LogDecryption(
    Side side,
    const protocol::gf2::BitString& measured,
    const protocol::gf2::BitString& corrected,
    const protocol::gf2::BitString& decrypted,
    bool correct,
    bool flagged) {

    CDL_LOG_SECTION(side, "DECRYPT");
    CDL_LOG_BITS(side, "DECRYPT", "r_prime", measured);
    CDL_LOG_BITS(side, "DECRYPT", "r_prime_corrected", corrected);
    CDL_LOG_BITS(side, "DECRYPT", "decrypted", decrypted);
    CDL_LOG_MSG(side, "DECRYPT", correct ? "correct: YES" : "correct: NO");
    CDL_LOG_MSG(side, "DECRYPT", flagged ? "flagged: YES" : "flagged: NO");
}

// ============================================================================
// Deletion verification
// ============================================================================

inline void LogVerification(
    Side side,
    const protocol::gf2::BitString& restricted_certificate,
    size_t distance,
    double threshold,
    bool accepted) {

    CDL_LOG_SECTION(side, "VERIFY");
    CDL_LOG_BITS(side, "VERIFY", "certificate_on_hadamard", restricted_certificate);
    CDL_LOG_VALUE(side, "VERIFY", "distance", distance);
    CDL_LOG_VALUE(side, "VERIFY", "threshold", threshold);
    CDL_LOG_MSG(side, "VERIFY", accepted ? "accepted: YES" : "accepted: NO");
}

#else // !CERTDEL_DEBUG_KEYS

// No-op implementations when CERTDEL_DEBUG_KEYS is not defined
#define CDL_LOG_BITS(side, operation, name, bits) ((void)0)
#define CDL_LOG_VALUE(side, operation, name, value) ((void)0)
#define CDL_LOG_MSG(side, operation, message) ((void)0)
#define CDL_LOG_SECTION(side, section_name) ((void)0)

inline void LogKeyGenerated(Side, const protocol::gf2::BitString&, const protocol::gf2::BitString&,
    const protocol::gf2::BitString&, const protocol::gf2::BitString&, const protocol::gf2::BitString&,
    const protocol::gf2::BitMatrix&, const protocol::gf2::BitMatrix&) {}
inline void LogEncryption(Side, const protocol::gf2::BitString&, const protocol::gf2::BitString&,
    const protocol::gf2::BitString&, const protocol::gf2::BitString&, const protocol::gf2::BitString&,
    bool) {}
inline void LogDecryption(Side, const protocol::gf2::BitString&, const protocol::gf2::BitString&,
    const protocol::gf2::BitString&, bool, bool) {}
inline void LogVerification(Side, const protocol::gf2::BitString&, size_t, double, bool) {}

#endif // CERTDEL_DEBUG_KEYS

} // namespace certdel::debug

#pragma once
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/models/ciphertext.hpp"
#include "certdel/models/key.hpp"
#include "certdel/models/measurement_counts.hpp"
#include "certdel/gf2/bit_string.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <cstdint>

namespace certdel::protocol {

/**
 * @brief Result of decrypting one measurement
 *
 * The flag is raised when the error-correction hash of the (corrected)
 * measurement disagrees with the ciphertext; it never blocks decryption.
 */
struct DecryptionOutcome {
    bool correct;
    bool flagged;
    gf2::BitString decrypted;
};

/// Shot-weighted tally of DecryptionOutcome over a measurement histogram.
struct DecryptionStatistics {
    uint64_t correct_unflagged = 0;
    uint64_t correct_flagged = 0;
    uint64_t incorrect_unflagged = 0;
    uint64_t incorrect_flagged = 0;
    models::EntryFailures failures;

    [[nodiscard]] uint64_t Correct() const noexcept { return correct_unflagged + correct_flagged; }
    [[nodiscard]] uint64_t Incorrect() const noexcept { return incorrect_unflagged + incorrect_flagged; }
    [[nodiscard]] uint64_t Flagged() const noexcept { return correct_flagged + incorrect_flagged; }
    [[nodiscard]] uint64_t Total() const noexcept { return Correct() + Incorrect(); }

    void Record(const DecryptionOutcome& outcome, uint64_t count) noexcept;
};

class Decryption {
public:
    /**
     * @brief Decrypt one measurement and compare against the expected message
     *
     * measured is either a full measurement of all m positions (computational
     * positions are extracted) or the s computational bits already extracted.
     * With error_correct, the bits are first corrected towards the target
     * syndrome q xor e.
     *
     * @return MalformedMeasurement for any other length
     */
    [[nodiscard]] static Result<DecryptionOutcome, ProtocolFailure> Decrypt(
        const gf2::BitString& measured,
        const models::Key& key,
        const models::Ciphertext& ciphertext,
        const gf2::BitString& expected,
        const configuration::SchemeParameters& params,
        bool error_correct);

    /**
     * @brief Decrypt every entry of a single-stage histogram
     *
     * Entries that fail to parse or decrypt are listed in failures with their
     * counts and do not contribute to the buckets.
     */
    [[nodiscard]] static DecryptionStatistics DecryptResults(
        const models::MeasurementCounts& counts,
        const models::Key& key,
        const models::Ciphertext& ciphertext,
        const gf2::BitString& expected,
        const configuration::SchemeParameters& params,
        bool error_correct);

    Decryption() = delete;
};

}

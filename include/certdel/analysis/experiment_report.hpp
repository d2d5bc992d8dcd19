#pragma once
#include "certdel/analysis/outcome_aggregator.hpp"
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/models/ciphertext.hpp"
#include "certdel/models/key.hpp"
#include "certdel/models/measurement_counts.hpp"
#include "certdel/protocol/decryption.hpp"
#include "certdel/protocol/deletion_verification.hpp"
#include "certdel/gf2/bit_string.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace certdel::protocol::analysis {

/// Deletion first, then an attempt to decrypt the same qubits.
struct DeletionThenDecryptionResult {
    VerificationStatistics deletion;
    DecryptionStatistics decryption;
    /// Decryption restricted to trials whose certificate was accepted.
    std::optional<DecryptionStatistics> decryption_given_accepted;
    uint64_t accepted_trials = 0;
    models::EntryFailures split_failures;
};

/// Decryption first, then deletion used as a tamper check.
struct DecryptionThenDeletionResult {
    DecryptionStatistics decryption;
    VerificationStatistics deletion;
    models::EntryFailures split_failures;
};

/// Histograms of one experiment; absent tests are skipped when rendering.
struct ExperimentCounts {
    std::optional<models::MeasurementCounts> honest_deletion;
    std::optional<models::MeasurementCounts> decryption;
    std::optional<models::MeasurementCounts> deletion_then_decryption;
    std::optional<models::MeasurementCounts> malicious_deletion_then_decryption;
    std::optional<models::MeasurementCounts> decryption_then_deletion;
};

/**
 * @brief Evaluates the five standard tests for one encrypted message
 *
 * | Test | Counts | Evaluation |
 * |------|--------|------------|
 * | 1 | certificates | VerifyCounts |
 * | 2 | decryption measurements | DecryptResults |
 * | 3 | "<certificate> <decryption>" | both, plus decryption on accepted trials |
 * | 4 | same as 3, Breidbart attack | same as 3 |
 * | 5 | "<decryption> <certificate>" | both, deletion as tamper check |
 *
 * Percentages are relative to the configured shot count; the restricted
 * decryption of tests 3 and 4 is relative to the accepted trials.
 *
 * Holds references; the parameters, key and ciphertext must outlive it.
 */
class ExperimentReport {
public:
    ExperimentReport(
        const configuration::SchemeParameters& params,
        const models::Key& key,
        const models::Ciphertext& ciphertext,
        gf2::BitString message,
        uint64_t shots,
        bool error_correct = false);

    [[nodiscard]] VerificationStatistics HonestDeletion(const models::MeasurementCounts& certificates) const;
    [[nodiscard]] DecryptionStatistics Decrypt(const models::MeasurementCounts& measurements) const;
    [[nodiscard]] DeletionThenDecryptionResult DeletionThenDecryption(const models::MeasurementCounts& combined) const;
    [[nodiscard]] DecryptionThenDeletionResult DecryptionThenDeletion(const models::MeasurementCounts& combined) const;

    [[nodiscard]] double Test1SuccessRate(const models::MeasurementCounts& certificates) const;
    [[nodiscard]] double Test2SuccessRate(const models::MeasurementCounts& measurements) const;

    [[nodiscard]] std::string ExperimentInfo() const;
    [[nodiscard]] std::string RenderTest1(const models::MeasurementCounts& certificates) const;
    [[nodiscard]] std::string RenderTest2(const models::MeasurementCounts& measurements) const;
    [[nodiscard]] std::string RenderTest3(const models::MeasurementCounts& combined) const;
    [[nodiscard]] std::string RenderTest4(const models::MeasurementCounts& combined) const;
    [[nodiscard]] std::string RenderTest5(const models::MeasurementCounts& combined) const;

    /// Info block followed by every test present in counts.
    [[nodiscard]] std::string Render(const ExperimentCounts& counts) const;

    [[nodiscard]] static std::string BuildDeletionStats(
        uint64_t accepted,
        uint64_t rejected,
        const std::map<size_t, uint64_t>& rejected_distances,
        uint64_t total);

    [[nodiscard]] static std::string BuildDecryptionStats(
        uint64_t correct,
        uint64_t incorrect,
        uint64_t flagged,
        uint64_t total);

private:
    [[nodiscard]] std::string RenderCombined(const DeletionThenDecryptionResult& result) const;

    const configuration::SchemeParameters& params_;
    const models::Key& key_;
    const models::Ciphertext& ciphertext_;
    gf2::BitString message_;
    uint64_t shots_;
    bool error_correct_;
};

}

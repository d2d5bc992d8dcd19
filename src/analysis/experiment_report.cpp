#include "certdel/analysis/experiment_report.hpp"
#include "certdel/core/constants.hpp"
#include "certdel/core/format.hpp"

namespace certdel::protocol::analysis {

namespace {

double Percent(const uint64_t part, const uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(total) * SchemeConstants::PERCENT;
}

std::string FormatRange(const configuration::SuccessRange& range) {
    return compat::format("[{:.4f}%, {:.4f}%]", range.lower, range.upper);
}

std::string FailureSummary(const models::EntryFailures& failures) {
    if (failures.empty()) {
        return {};
    }
    uint64_t shots = 0;
    for (const auto& failure : failures) {
        shots += failure.count;
    }
    std::string out = compat::format("\nSkipped {} malformed outcome(s) covering {} shot(s)", failures.size(), shots);
    for (const auto& failure : failures) {
        out += compat::format("\n  {} '{}' x{}: {}", FailureTypeName(failure.failure.type),
                              failure.measurement, failure.count, failure.failure.message);
    }
    return out;
}

void AppendFailures(models::EntryFailures& into, const models::EntryFailures& from) {
    into.insert(into.end(), from.begin(), from.end());
}

} // namespace

ExperimentReport::ExperimentReport(
    const configuration::SchemeParameters& params,
    const models::Key& key,
    const models::Ciphertext& ciphertext,
    gf2::BitString message,
    const uint64_t shots,
    const bool error_correct)
    : params_(params)
    , key_(key)
    , ciphertext_(ciphertext)
    , message_(std::move(message))
    , shots_(shots)
    , error_correct_(error_correct) {
}

VerificationStatistics ExperimentReport::HonestDeletion(const models::MeasurementCounts& certificates) const {
    return DeletionVerification::VerifyCounts(certificates, key_, params_);
}

DecryptionStatistics ExperimentReport::Decrypt(const models::MeasurementCounts& measurements) const {
    return Decryption::DecryptResults(measurements, key_, ciphertext_, message_, params_, error_correct_);
}

DeletionThenDecryptionResult ExperimentReport::DeletionThenDecryption(
    const models::MeasurementCounts& combined) const {
    DeletionThenDecryptionResult result;
    auto stages = OutcomeAggregator::SplitCounts(combined);
    result.split_failures = std::move(stages.failures);
    result.deletion = HonestDeletion(stages.first);
    result.decryption = Decrypt(stages.second);
    result.accepted_trials = result.deletion.accepted;

    if (result.deletion.accepted > 0) {
        auto correlated = OutcomeAggregator::Correlate(combined, result.deletion.accepted_certificates);
        result.decryption_given_accepted = Decrypt(correlated.counts);
    }
    return result;
}

DecryptionThenDeletionResult ExperimentReport::DecryptionThenDeletion(
    const models::MeasurementCounts& combined) const {
    DecryptionThenDeletionResult result;
    auto stages = OutcomeAggregator::SplitCounts(combined);
    result.split_failures = std::move(stages.failures);
    result.decryption = Decrypt(stages.first);
    result.deletion = HonestDeletion(stages.second);
    return result;
}

double ExperimentReport::Test1SuccessRate(const models::MeasurementCounts& certificates) const {
    return Percent(HonestDeletion(certificates).accepted, shots_);
}

double ExperimentReport::Test2SuccessRate(const models::MeasurementCounts& measurements) const {
    return Percent(Decrypt(measurements).Correct(), shots_);
}

std::string ExperimentReport::ExperimentInfo() const {
    std::string out;
    out += compat::format("Message length: {}\n", params_.N());
    out += compat::format("Total number of qubits: {}\n", params_.M());
    out += compat::format("Qubits for deletion: {}\n", params_.K());
    out += compat::format("Qubits used for message encryption: {}\n", params_.S());
    out += compat::format("Error-correcting code: {}\n", params_.CodeName());
    out += compat::format("Error correction applied: {}", error_correct_ ? "yes" : "no");
    return out;
}

std::string ExperimentReport::BuildDeletionStats(
    const uint64_t accepted,
    const uint64_t rejected,
    const std::map<size_t, uint64_t>& rejected_distances,
    const uint64_t total) {
    std::string out;
    out += compat::format("Accepted proof of deletion: {}/{} ({:.2f}%)\n", accepted, total, Percent(accepted, total));
    out += compat::format("Rejected proof of deletion: {}/{} ({:.2f}%)", rejected, total, Percent(rejected, total));
    if (!rejected_distances.empty()) {
        out += compat::format(
            "\nOf the {} rejected certificates, the following are the counts of the Hamming distances "
            "between the received certificate and the expected certificate:",
            rejected);
        for (const auto& [distance, count] : rejected_distances) {
            out += compat::format("\n  Hamming distance {}: {}", distance, count);
        }
    }
    return out;
}

std::string ExperimentReport::BuildDecryptionStats(
    const uint64_t correct,
    const uint64_t incorrect,
    const uint64_t flagged,
    const uint64_t total) {
    std::string out;
    out += compat::format("Correct message decrypted: {}/{} ({:.2f}%)\n", correct, total, Percent(correct, total));
    out += compat::format("Incorrect message decrypted: {}/{} ({:.2f}%)\n",
                          incorrect, total, Percent(incorrect, total));
    out += compat::format("Error detected during decryption process (hashes didn't match): {}/{} ({:.2f}%)",
                          flagged, total, Percent(flagged, total));
    return out;
}

std::string ExperimentReport::RenderTest1(const models::MeasurementCounts& certificates) const {
    const auto stats = HonestDeletion(certificates);
    std::string out = "-----TEST 1: HONEST DELETION-----\n";
    out += BuildDeletionStats(stats.accepted, stats.rejected, stats.rejected_distance_histogram, shots_);
    out += FailureSummary(stats.failures);
    out += compat::format("\n\nExpected success rate: {:.4f}%", params_.ExpectedTest1SuccessRate());
    return out;
}

std::string ExperimentReport::RenderTest2(const models::MeasurementCounts& measurements) const {
    const auto stats = Decrypt(measurements);
    std::string out = "-----TEST 2: DECRYPTION-----\n";
    out += BuildDecryptionStats(stats.Correct(), stats.Incorrect(), stats.Flagged(), shots_);
    out += FailureSummary(stats.failures);
    out += compat::format("\n\nExpected success rate: {}", FormatRange(params_.ExpectedTest2SuccessRate()));
    return out;
}

std::string ExperimentReport::RenderCombined(const DeletionThenDecryptionResult& result) const {
    models::EntryFailures failures = result.split_failures;
    AppendFailures(failures, result.deletion.failures);
    AppendFailures(failures, result.decryption.failures);

    std::string out;
    out += BuildDeletionStats(result.deletion.accepted, result.deletion.rejected,
                              result.deletion.rejected_distance_histogram, shots_);
    out += "\n\n";
    out += BuildDecryptionStats(result.decryption.Correct(), result.decryption.Incorrect(),
                                result.decryption.Flagged(), shots_);
    if (result.decryption_given_accepted.has_value()) {
        const auto& restricted = *result.decryption_given_accepted;
        out += "\n\nOf the measurements where the proof of deletion was accepted, "
               "the following are the decryption statistics:\n";
        out += BuildDecryptionStats(restricted.Correct(), restricted.Incorrect(),
                                    restricted.Flagged(), result.accepted_trials);
    }
    out += FailureSummary(failures);
    return out;
}

std::string ExperimentReport::RenderTest3(const models::MeasurementCounts& combined) const {
    const auto rates = params_.ExpectedTest3SuccessRate();
    std::string out = "-----TEST 3: HONEST DELETION, THEN DECRYPTION-----\n";
    out += RenderCombined(DeletionThenDecryption(combined));
    out += compat::format("\n\nExpected success rate: deletion {:.4f}%, decryption {}",
                          rates.deletion, FormatRange(rates.decryption));
    return out;
}

std::string ExperimentReport::RenderTest4(const models::MeasurementCounts& combined) const {
    const auto rates = params_.ExpectedTest4SuccessRate();
    std::string out = "-----TEST 4: MALICIOUS DELETION, THEN DECRYPTION-----\n";
    out += RenderCombined(DeletionThenDecryption(combined));
    out += compat::format("\n\nExpected success rate: deletion {:.4f}%, decryption {}",
                          rates.deletion, FormatRange(rates.decryption));
    return out;
}

std::string ExperimentReport::RenderTest5(const models::MeasurementCounts& combined) const {
    const auto result = DecryptionThenDeletion(combined);
    const auto rates = params_.ExpectedTest5SuccessRate();
    models::EntryFailures failures = result.split_failures;
    AppendFailures(failures, result.decryption.failures);
    AppendFailures(failures, result.deletion.failures);

    std::string out = "-----TEST 5: TAMPER DETECTION-----\n";
    out += BuildDecryptionStats(result.decryption.Correct(), result.decryption.Incorrect(),
                                result.decryption.Flagged(), shots_);
    out += "\n\n";
    out += BuildDeletionStats(result.deletion.accepted, result.deletion.rejected,
                              result.deletion.rejected_distance_histogram, shots_);
    out += FailureSummary(failures);
    out += compat::format("\n\nExpected success rate: decryption {}, deletion {:.4f}%",
                          FormatRange(rates.decryption), rates.deletion);
    return out;
}

std::string ExperimentReport::Render(const ExperimentCounts& counts) const {
    std::string out = ExperimentInfo();
    if (counts.honest_deletion.has_value()) {
        out += "\n\n" + RenderTest1(*counts.honest_deletion);
    }
    if (counts.decryption.has_value()) {
        out += "\n\n" + RenderTest2(*counts.decryption);
    }
    if (counts.deletion_then_decryption.has_value()) {
        out += "\n\n" + RenderTest3(*counts.deletion_then_decryption);
    }
    if (counts.malicious_deletion_then_decryption.has_value()) {
        out += "\n\n" + RenderTest4(*counts.malicious_deletion_then_decryption);
    }
    if (counts.decryption_then_deletion.has_value()) {
        out += "\n\n" + RenderTest5(*counts.decryption_then_deletion);
    }
    return out;
}

}

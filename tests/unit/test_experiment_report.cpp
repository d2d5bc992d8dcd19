#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "certdel/analysis/experiment_report.hpp"
#include "certdel/protocol/encryption.hpp"
#include "certdel/crypto/random_source.hpp"
#include "helpers/noiseless_backend.hpp"

using namespace certdel::protocol;
using namespace certdel::protocol::analysis;
using namespace certdel::protocol::test_helpers;
using certdel::protocol::configuration::SchemeParameters;
using certdel::protocol::crypto::RandomSource;
using certdel::protocol::gf2::BitString;
using certdel::protocol::models::Key;

namespace {
bool Contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

constexpr uint64_t kShots = 16;
}

TEST_CASE("ExperimentReport - Statistic blocks", "[report][analysis]") {
    SECTION("Deletion block with rejected distances") {
        const auto text = ExperimentReport::BuildDeletionStats(3, 1, {{2, 1}}, 4);
        REQUIRE(text ==
                "Accepted proof of deletion: 3/4 (75.00%)\n"
                "Rejected proof of deletion: 1/4 (25.00%)\n"
                "Of the 1 rejected certificates, the following are the counts of the Hamming distances "
                "between the received certificate and the expected certificate:\n"
                "  Hamming distance 2: 1");
    }
    SECTION("Deletion block without rejections") {
        const auto text = ExperimentReport::BuildDeletionStats(5, 0, {}, 5);
        REQUIRE(text == "Accepted proof of deletion: 5/5 (100.00%)\nRejected proof of deletion: 0/5 (0.00%)");
    }
    SECTION("Decryption block") {
        const auto text = ExperimentReport::BuildDecryptionStats(1, 2, 1, 3);
        REQUIRE(text ==
                "Correct message decrypted: 1/3 (33.33%)\n"
                "Incorrect message decrypted: 2/3 (66.67%)\n"
                "Error detected during decryption process (hashes didn't match): 1/3 (33.33%)");
    }
    SECTION("Zero shots does not divide by zero") {
        const auto text = ExperimentReport::BuildDecryptionStats(0, 0, 0, 0);
        REQUIRE(Contains(text, "0/0 (0.00%)"));
    }
}

TEST_CASE("ExperimentReport - Five tests on a noiseless backend", "[report][analysis][protocol]") {
    auto params = SchemeParameters::Create(1, 4, 24, 8, 2, 0, 0.1, "none").Unwrap();
    auto random = RandomSource::Seeded(uint64_t{77}).Unwrap();
    auto key = Key::Generate(params, random).Unwrap();
    const auto message = BitString::FromString("1101").Unwrap();

    NoiselessBackend backend(5, kShots);
    auto output = Encryption::Encrypt(message, key, params, random, &backend).Unwrap();
    const auto handle = *output.ciphertext.Handle();
    const std::vector<Basis> computational(params.M(), Basis::Computational);
    const auto hadamard = DeletionBases(params.M());

    ExperimentReport report(params, key, output.ciphertext, message, kShots);

    ExperimentCounts counts;
    counts.honest_deletion = backend.Measure(handle, hadamard).Unwrap();
    counts.decryption = backend.Measure(handle, computational).Unwrap();
    counts.deletion_then_decryption = backend.MeasureStages(handle, {hadamard, computational}).Unwrap();
    counts.decryption_then_deletion = backend.MeasureStages(handle, {computational, hadamard}).Unwrap();

    SECTION("Honest deletion is always accepted") {
        REQUIRE(report.Test1SuccessRate(*counts.honest_deletion) == Catch::Approx(100.0));
    }
    SECTION("Decryption always succeeds") {
        REQUIRE(report.Test2SuccessRate(*counts.decryption) == Catch::Approx(100.0));
        REQUIRE(report.Decrypt(*counts.decryption).Flagged() == 0);
    }
    SECTION("Deletion first leaves the pad unreadable") {
        auto result = report.DeletionThenDecryption(*counts.deletion_then_decryption);
        REQUIRE(result.deletion.accepted == kShots);
        REQUIRE(result.split_failures.empty());
        REQUIRE(result.decryption_given_accepted.has_value());
        REQUIRE(result.decryption_given_accepted->Total() == kShots);
        REQUIRE(result.accepted_trials == kShots);
        REQUIRE(result.decryption.Total() == kShots);
    }
    SECTION("Decryption first destroys the deletion certificate") {
        auto result = report.DecryptionThenDeletion(*counts.decryption_then_deletion);
        REQUIRE(result.decryption.Correct() == kShots);
        REQUIRE(result.deletion.accepted < kShots);
    }
    SECTION("Rendered report lists the tests that ran") {
        const auto text = report.Render(counts);
        REQUIRE(Contains(text, "Message length: 4"));
        REQUIRE(Contains(text, "Total number of qubits: 32"));
        REQUIRE(Contains(text, "-----TEST 1: HONEST DELETION-----"));
        REQUIRE(Contains(text, "Accepted proof of deletion: 16/16 (100.00%)"));
        REQUIRE(Contains(text, "-----TEST 2: DECRYPTION-----"));
        REQUIRE(Contains(text, "Correct message decrypted: 16/16 (100.00%)"));
        REQUIRE(Contains(text, "-----TEST 3: HONEST DELETION, THEN DECRYPTION-----"));
        REQUIRE_FALSE(Contains(text, "-----TEST 4"));
        REQUIRE(Contains(text, "-----TEST 5: TAMPER DETECTION-----"));
        REQUIRE(Contains(text, "Expected success rate"));
    }
}

TEST_CASE("ExperimentReport - Malformed two-stage entries are counted as skipped", "[report][analysis]") {
    auto params = SchemeParameters::Create(1, 2, 2, 2, 0, 0, 0.1, "none").Unwrap();
    auto random = RandomSource::Seeded(uint64_t{6}).Unwrap();
    auto key = Key::Generate(params, random).Unwrap();
    const auto message = BitString::FromString("01").Unwrap();
    auto output = Encryption::Encrypt(message, key, params, random).Unwrap();

    ExperimentReport report(params, key, output.ciphertext, message, 3);
    const models::MeasurementCounts combined = {{"00000000", 3}};
    auto result = report.DeletionThenDecryption(combined);
    REQUIRE(result.split_failures.size() == 1);
    REQUIRE(result.deletion.Total() == 0);
    REQUIRE_FALSE(result.decryption_given_accepted.has_value());
    REQUIRE(Contains(report.RenderTest3(combined), "Skipped 1 malformed outcome(s) covering 3 shot(s)"));
}

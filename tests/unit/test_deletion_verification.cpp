#include <catch2/catch_test_macros.hpp>
#include "certdel/protocol/deletion_verification.hpp"
#include "certdel/protocol/encryption.hpp"
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/crypto/random_source.hpp"
#include "helpers/noiseless_backend.hpp"

using namespace certdel::protocol;
using namespace certdel::protocol::test_helpers;
using certdel::protocol::configuration::SchemeParameters;
using certdel::protocol::crypto::RandomSource;
using certdel::protocol::gf2::BitMatrix;
using certdel::protocol::gf2::BitString;
using certdel::protocol::models::Key;

namespace {
BitString Bits(std::string_view text) {
    return BitString::FromString(text).Unwrap();
}

// Six Hadamard positions followed by two computational ones.
Key SixCheckBitKey(const SchemeParameters& params) {
    std::vector<Basis> theta(6, Basis::Hadamard);
    theta.push_back(Basis::Computational);
    theta.push_back(Basis::Computational);
    return Key::FromParts(params, std::move(theta), Bits("101100"), Bits("00"), BitString(), BitString(),
                          BitMatrix(2, 2), BitMatrix(2, 0)).Unwrap();
}
}

TEST_CASE("DeletionVerification - Single certificates", "[deletion][protocol]") {
    auto params = SchemeParameters::Create(1, 2, 6, 2, 0, 0, 0.1, "none").Unwrap();
    auto key = SixCheckBitKey(params);

    SECTION("Perfect certificate is accepted at distance zero") {
        auto outcome = DeletionVerification::Verify(key, Bits("10110001"), params.Delta());
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().accepted);
        REQUIRE(outcome.Unwrap().distance == 0);
    }
    SECTION("Computational positions are ignored") {
        auto outcome = DeletionVerification::Verify(key, Bits("10110011"), params.Delta());
        REQUIRE(outcome.Unwrap().accepted);
    }
    SECTION("One error in six exceeds delta * k") {
        auto outcome = DeletionVerification::Verify(key, Bits("00110011"), params.Delta());
        REQUIRE(outcome.IsOk());
        REQUIRE_FALSE(outcome.Unwrap().accepted);
        REQUIRE(outcome.Unwrap().distance == 1);
    }
    SECTION("A looser threshold tolerates the same error") {
        auto outcome = DeletionVerification::Verify(key, Bits("00110011"), 0.2);
        REQUIRE(outcome.Unwrap().accepted);
    }
    SECTION("Certificate must cover every position") {
        auto outcome = DeletionVerification::Verify(key, Bits("101100"), params.Delta());
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().type == ProtocolFailureType::MalformedMeasurement);
    }
}

TEST_CASE("DeletionVerification - Histogram statistics", "[deletion][protocol]") {
    auto params = SchemeParameters::Create(1, 2, 6, 2, 0, 0, 0.1, "none").Unwrap();
    auto key = SixCheckBitKey(params);

    const models::MeasurementCounts certificates = {
        {"10110001", 4},
        {"00110011", 1},
        {"01110000", 2},
        {"101", 2},
    };
    auto stats = DeletionVerification::VerifyCounts(certificates, key, params);

    REQUIRE(stats.accepted == 4);
    REQUIRE(stats.rejected == 3);
    REQUIRE(stats.Total() == 7);
    REQUIRE(stats.rejected_distance_histogram == std::map<size_t, uint64_t>{{1, 1}, {2, 2}});
    REQUIRE(stats.accepted_certificates == std::set<std::string>{"10110001"});
    REQUIRE(stats.failures.size() == 1);
    REQUIRE(stats.failures[0].count == 2);
}

TEST_CASE("DeletionVerification - Honest deletion on a noiseless backend", "[deletion][protocol]") {
    auto params = SchemeParameters::Create(1, 4, 16, 8, 0, 0, 0.05, "none").Unwrap();
    auto random = RandomSource::Seeded(uint64_t{17}).Unwrap();
    auto key = Key::Generate(params, random).Unwrap();

    NoiselessBackend backend(4, 40);
    auto output = Encryption::Encrypt(Bits("0101"), key, params, random, &backend).Unwrap();
    auto certificates = backend.Measure(*output.ciphertext.Handle(), DeletionBases(params.M()));
    REQUIRE(certificates.IsOk());

    auto stats = DeletionVerification::VerifyCounts(certificates.Unwrap(), key, params);
    REQUIRE(stats.accepted == 40);
    REQUIRE(stats.rejected == 0);
    REQUIRE(stats.rejected_distance_histogram.empty());
}

TEST_CASE("DeletionVerification - Computational measurement destroys the certificate", "[deletion][protocol]") {
    auto params = SchemeParameters::Create(1, 4, 32, 8, 0, 0, 0.05, "none").Unwrap();
    auto random = RandomSource::Seeded(uint64_t{23}).Unwrap();
    auto key = Key::Generate(params, random).Unwrap();

    NoiselessBackend backend(8, 20);
    auto output = Encryption::Encrypt(Bits("1111"), key, params, random, &backend).Unwrap();
    auto combined = backend.MeasureStages(
        *output.ciphertext.Handle(),
        {std::vector<Basis>(params.M(), Basis::Computational), DeletionBases(params.M())});
    REQUIRE(combined.IsOk());

    uint64_t accepted = 0;
    for (const auto& [outcome, count] : combined.Unwrap()) {
        const auto certificate = Bits(outcome.substr(outcome.find(' ') + 1));
        if (DeletionVerification::Verify(key, certificate, params.Delta()).Unwrap().accepted) {
            accepted += count;
        }
    }
    // Each of the 32 check bits is a fair coin; passing needs at most one error.
    REQUIRE(accepted < 20);
}

#include <catch2/catch_test_macros.hpp>
#include "certdel/protocol/encryption.hpp"
#include "certdel/protocol/decryption.hpp"
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

std::vector<Basis> Theta(std::string_view tags) {
    std::vector<Basis> theta;
    for (const char tag : tags) {
        theta.push_back(tag == 'H' ? Basis::Hadamard : Basis::Computational);
    }
    return theta;
}

// n=2, k=2, s=2, tau=1: identity privacy amplification, one-bit hash.
struct HandBuiltScheme {
    SchemeParameters params = SchemeParameters::Create(1, 2, 2, 2, 1, 0, 0.1, "none").Unwrap();
    Key key = Key::FromParts(
        params,
        Theta("HCHC"),
        Bits("10"),
        Bits("01"),
        Bits("1"),
        BitString(),
        BitMatrix::FromRowStrings({"10", "01"}).Unwrap(),
        BitMatrix::FromRowStrings({"1", "0"}).Unwrap()).Unwrap();
};
}

TEST_CASE("Encryption - Hand-computed ciphertext", "[encryption][protocol]") {
    HandBuiltScheme scheme;
    auto output = Encryption::EncryptWithSample(Bits("10"), scheme.key, scheme.params, Bits("11"));
    REQUIRE(output.IsOk());
    const auto& ct = output.Unwrap().ciphertext;

    SECTION("c = message xor x xor u") {
        REQUIRE(ct.C().ToString() == "00");
    }
    SECTION("p = r * EC xor d") {
        REQUIRE(ct.P().ToString() == "0");
    }
    SECTION("q is empty without a syndrome layer") {
        REQUIRE(ct.Q().Empty());
    }
    SECTION("No backend means no handle") {
        REQUIRE_FALSE(ct.Handle().has_value());
        REQUIRE(output.Unwrap().r.ToString() == "11");
    }
}

TEST_CASE("Encryption - Preparation plan", "[encryption][protocol]") {
    HandBuiltScheme scheme;
    auto plan = Encryption::BuildPreparationPlan(scheme.key, Bits("11"));
    REQUIRE(plan.IsOk());
    const auto& qubits = plan.Unwrap();
    REQUIRE(qubits.size() == 4);
    REQUIRE(qubits[0].basis == Basis::Hadamard);
    REQUIRE(qubits[0].value);
    REQUIRE(qubits[1].basis == Basis::Computational);
    REQUIRE(qubits[1].value);
    REQUIRE(qubits[2].basis == Basis::Hadamard);
    REQUIRE_FALSE(qubits[2].value);
    REQUIRE(qubits[3].basis == Basis::Computational);
    REQUIRE(qubits[3].value);

    SECTION("Pad seed of the wrong length") {
        REQUIRE(Encryption::BuildPreparationPlan(scheme.key, Bits("111")).IsErr());
    }
}

TEST_CASE("Encryption - Dimension checks", "[encryption][protocol]") {
    HandBuiltScheme scheme;
    SECTION("Message length") {
        auto output = Encryption::EncryptWithSample(Bits("101"), scheme.key, scheme.params, Bits("11"));
        REQUIRE(output.IsErr());
        REQUIRE(output.UnwrapErr().type == ProtocolFailureType::LengthMismatch);
    }
    SECTION("Pad seed length") {
        auto output = Encryption::EncryptWithSample(Bits("10"), scheme.key, scheme.params, Bits("1"));
        REQUIRE(output.IsErr());
        REQUIRE(output.UnwrapErr().type == ProtocolFailureType::LengthMismatch);
    }
    SECTION("Random message length") {
        auto random = RandomSource::Seeded(uint64_t{3}).Unwrap();
        auto output = Encryption::Encrypt(Bits("1"), scheme.key, scheme.params, random);
        REQUIRE(output.IsErr());
    }
}

TEST_CASE("Decryption - Hand-computed outcomes", "[decryption][protocol]") {
    HandBuiltScheme scheme;
    const auto message = Bits("10");
    auto ct = Encryption::EncryptWithSample(message, scheme.key, scheme.params, Bits("11")).Unwrap().ciphertext;

    SECTION("Exact pad seed decrypts without a flag") {
        auto outcome = Decryption::Decrypt(Bits("11"), scheme.key, ct, message, scheme.params, false);
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().correct);
        REQUIRE_FALSE(outcome.Unwrap().flagged);
        REQUIRE(outcome.Unwrap().decrypted == message);
    }
    SECTION("Full-length measurement is filtered to computational positions") {
        auto outcome = Decryption::Decrypt(Bits("0111"), scheme.key, ct, message, scheme.params, false);
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().correct);
    }
    SECTION("Wrong pad seed is incorrect and flagged") {
        auto outcome = Decryption::Decrypt(Bits("01"), scheme.key, ct, message, scheme.params, false);
        REQUIRE(outcome.IsOk());
        REQUIRE_FALSE(outcome.Unwrap().correct);
        REQUIRE(outcome.Unwrap().flagged);
        REQUIRE(outcome.Unwrap().decrypted.ToString() == "00");
    }
    SECTION("Measurement of any other length is malformed") {
        auto outcome = Decryption::Decrypt(Bits("011"), scheme.key, ct, message, scheme.params, false);
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().type == ProtocolFailureType::MalformedMeasurement);
    }
}

TEST_CASE("Decryption - Histogram statistics", "[decryption][protocol]") {
    HandBuiltScheme scheme;
    const auto message = Bits("10");
    auto ct = Encryption::EncryptWithSample(message, scheme.key, scheme.params, Bits("11")).Unwrap().ciphertext;

    const models::MeasurementCounts counts = {{"11", 5}, {"01", 3}, {"1x", 2}};
    auto stats = Decryption::DecryptResults(counts, scheme.key, ct, message, scheme.params, false);

    REQUIRE(stats.correct_unflagged == 5);
    REQUIRE(stats.incorrect_flagged == 3);
    REQUIRE(stats.Correct() == 5);
    REQUIRE(stats.Incorrect() == 3);
    REQUIRE(stats.Flagged() == 3);
    REQUIRE(stats.Total() == 8);
    REQUIRE(stats.failures.size() == 1);
    REQUIRE(stats.failures[0].measurement == "1x");
    REQUIRE(stats.failures[0].count == 2);
    REQUIRE(stats.failures[0].failure.type == ProtocolFailureType::MalformedMeasurement);
}

TEST_CASE("Encryption - Noiseless round trip through a backend", "[encryption][decryption][protocol]") {
    auto params = SchemeParameters::Create(1, 4, 6, 6, 0, 0, 0.1, "hamming_3").Unwrap();
    auto random = RandomSource::Seeded(uint64_t{11}).Unwrap();
    auto key = Key::Generate(params, random).Unwrap();
    const auto message = Bits("1011");

    NoiselessBackend backend(99, 50);
    auto output = Encryption::Encrypt(message, key, params, random, &backend);
    REQUIRE(output.IsOk());
    const auto& ct = output.Unwrap().ciphertext;
    REQUIRE(ct.Handle().has_value());
    REQUIRE(backend.Prepared(*ct.Handle()).size() == params.M());

    auto counts = backend.Measure(*ct.Handle(), std::vector<Basis>(params.M(), Basis::Computational));
    REQUIRE(counts.IsOk());
    // Computational positions are deterministic; Hadamard positions vary per shot.
    REQUIRE(models::TotalShots(counts.Unwrap()) == 50);

    auto stats = Decryption::DecryptResults(counts.Unwrap(), key, ct, message, params, false);
    REQUIRE(stats.Correct() == 50);
    REQUIRE(stats.Flagged() == 0);
    REQUIRE(stats.failures.empty());
}

TEST_CASE("Decryption - Syndrome correction", "[decryption][protocol][code]") {
    auto params = SchemeParameters::Create(1, 4, 6, 7, 3, 3, 0.1, "hamming_3").Unwrap();
    auto random = RandomSource::Seeded(uint64_t{5}).Unwrap();
    auto key = Key::Generate(params, random).Unwrap();
    const auto message = Bits("0110");
    auto output = Encryption::Encrypt(message, key, params, random).Unwrap();

    for (size_t pos = 0; pos < params.S(); ++pos) {
        auto noisy = output.r;
        noisy.Flip(pos);

        auto corrected = Decryption::Decrypt(noisy, key, output.ciphertext, message, params, true);
        REQUIRE(corrected.IsOk());
        REQUIRE(corrected.Unwrap().correct);
        REQUIRE_FALSE(corrected.Unwrap().flagged);

        auto uncorrected = Decryption::Decrypt(noisy, key, output.ciphertext, message, params, false);
        REQUIRE(uncorrected.IsOk());
        const bool row_is_zero = key.PrivacyAmplificationMatrix().Row(pos).PopCount() == 0;
        REQUIRE(uncorrected.Unwrap().correct == row_is_zero);
        const bool hash_row_is_zero = key.ErrorCorrectionMatrix().Row(pos).PopCount() == 0;
        REQUIRE(uncorrected.Unwrap().flagged == !hash_row_is_zero);
    }
}

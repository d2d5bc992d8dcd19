/**
 * @file certified_deletion_example.cpp
 * @brief Classical walk-through of certified-deletion encryption
 *
 * No quantum backend is attached: the outcomes an ideal device would return
 * are assembled directly from the key and the pad seed.
 */

#include "certdel/analysis/experiment_report.hpp"
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/crypto/random_source.hpp"
#include "certdel/crypto/sodium_interop.hpp"
#include "certdel/protocol/encryption.hpp"
#include "certdel/serialization/state_codec.hpp"

#include <iostream>
#include <string>

using namespace certdel::protocol;
using namespace certdel::protocol::analysis;
using namespace certdel::protocol::configuration;
using namespace certdel::protocol::crypto;
using certdel::protocol::enums::Basis;

namespace {

// What a noiseless device returns when every qubit is measured in its
// preparation basis: pad bits on computational positions, check bits on
// Hadamard positions.
std::string IdealOutcome(const models::Key& key, const gf2::BitString& r) {
    std::string outcome;
    size_t next_computational = 0;
    size_t next_hadamard = 0;
    for (const Basis basis : key.Theta()) {
        const bool bit = basis == Basis::Computational
            ? r.Get(next_computational++)
            : key.RBar().Get(next_hadamard++);
        outcome.push_back(bit ? '1' : '0');
    }
    return outcome;
}

}

int main() {
    std::cout << "=== Certified Deletion - Classical Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << std::endl;

    std::cout << "2. Loading the byte-message preset ([15,11] Hamming)..." << std::endl;
    auto params_result = SchemeParameters::ByteHamming4();
    if (params_result.IsErr()) {
        std::cerr << "Invalid parameters: " << params_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto params = std::move(params_result).Unwrap();
    std::cout << "   Qubits: " << params.M() << " (" << params.K() << " for deletion, "
              << params.S() << " for the pad)" << std::endl;
    std::cout << std::endl;

    auto random_result = RandomSource::System();
    if (random_result.IsErr()) {
        std::cerr << "No randomness: " << random_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto random = std::move(random_result).Unwrap();

    std::cout << "3. Generating key and encrypting 10110010..." << std::endl;
    auto key_result = models::Key::Generate(params, random);
    if (key_result.IsErr()) {
        std::cerr << "Key generation failed: " << key_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto key = std::move(key_result).Unwrap();
    const auto message = gf2::BitString::FromString("10110010").Unwrap();

    auto encrypted = Encryption::Encrypt(message, key, params, random);
    if (encrypted.IsErr()) {
        std::cerr << "Encryption failed: " << encrypted.UnwrapErr().message << std::endl;
        return 1;
    }
    auto output = std::move(encrypted).Unwrap();
    std::cout << "   Classical ciphertext c: " << output.ciphertext.C().ToString() << std::endl;

    auto ct_bytes = serialization::StateCodec::EncodeCiphertext(output.ciphertext);
    if (ct_bytes.IsErr()) {
        std::cerr << "Encoding failed: " << ct_bytes.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Serialized ciphertext: " << ct_bytes.Unwrap().size() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Evaluating ideal outcomes..." << std::endl;
    constexpr uint64_t shots = 100;
    const models::MeasurementCounts outcomes = {{IdealOutcome(key, output.r), shots}};

    ExperimentReport report(params, key, output.ciphertext, message, shots, true);
    ExperimentCounts counts;
    counts.honest_deletion = outcomes;
    counts.decryption = outcomes;
    std::cout << report.Render(counts) << std::endl;

    std::cout << std::endl;
    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}

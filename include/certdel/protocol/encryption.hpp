#pragma once
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/crypto/random_source.hpp"
#include "certdel/interfaces/i_quantum_backend.hpp"
#include "certdel/models/ciphertext.hpp"
#include "certdel/models/key.hpp"
#include "certdel/gf2/bit_string.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <vector>

namespace certdel::protocol {

struct EncryptionOutput {
    models::Ciphertext ciphertext;
    /// The sampled pad seed; only a simulated receiver should ever see it.
    gf2::BitString r;
};

/**
 * @brief Sender side: turns a message and a key into a ciphertext
 *
 * **Transform** (all arithmetic over GF(2)):
 * ```
 * x = r * PA            (privacy amplification, n bits)
 * p = r * EC  xor d     (error-correction hash, tau bits)
 * q = synd(r) xor e     (padded syndrome, mu bits)
 * c = msg xor x xor u
 * ```
 *
 * Position i is prepared as r's next bit when theta[i] is computational, as
 * r_bar's next bit when it is Hadamard.
 */
class Encryption {
public:
    /**
     * @brief Encrypt with a freshly sampled r
     *
     * @param backend If not null, receives the preparation plan; its handle
     *                is stored in the ciphertext
     */
    [[nodiscard]] static Result<EncryptionOutput, ProtocolFailure> Encrypt(
        const gf2::BitString& message,
        const models::Key& key,
        const configuration::SchemeParameters& params,
        crypto::RandomSource& random,
        interfaces::IQuantumBackend* backend = nullptr);

    /// Deterministic given key and r.
    [[nodiscard]] static Result<EncryptionOutput, ProtocolFailure> EncryptWithSample(
        const gf2::BitString& message,
        const models::Key& key,
        const configuration::SchemeParameters& params,
        gf2::BitString r,
        interfaces::IQuantumBackend* backend = nullptr);

    [[nodiscard]] static Result<std::vector<interfaces::QubitPreparation>, ProtocolFailure> BuildPreparationPlan(
        const models::Key& key,
        const gf2::BitString& r);

    Encryption() = delete;
};

}

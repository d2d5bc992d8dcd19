#pragma once
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/crypto/random_source.hpp"
#include "certdel/enums/basis.hpp"
#include "certdel/gf2/bit_string.hpp"
#include "certdel/gf2/bit_matrix.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <vector>

namespace certdel::protocol::models {

using protocol::Result;
using protocol::ProtocolFailure;
using enums::Basis;

/**
 * @brief Secret key for a single message
 *
 * | Field | Length | Role |
 * |-------|--------|------|
 * | theta | m | basis of each prepared position, exactly k Hadamard |
 * | r_bar | k | values on Hadamard positions (deletion check) |
 * | u | n | message pad |
 * | d | tau | error-correction hash pad |
 * | e | mu | syndrome pad |
 * | privacy amplification | s x n | hash of r into the message pad |
 * | error correction | s x tau | hash of r for the decryption flag |
 *
 * Fresh per message. All fields are wiped through libsodium when the key is
 * destroyed or overwritten by a move. Move-only.
 */
class Key {
public:
    /**
     * @brief Sample a key for the given parameters
     *
     * theta picks k distinct Hadamard positions out of m by drawing uniform
     * indices until k distinct ones have been seen.
     */
    static Result<Key, ProtocolFailure> Generate(
        const configuration::SchemeParameters& params,
        crypto::RandomSource& random);

    /**
     * @brief Rebuild a key from stored parts, checking every dimension
     */
    static Result<Key, ProtocolFailure> FromParts(
        const configuration::SchemeParameters& params,
        std::vector<Basis> theta,
        gf2::BitString r_bar,
        gf2::BitString u,
        gf2::BitString d,
        gf2::BitString e,
        gf2::BitMatrix privacy_amplification_matrix,
        gf2::BitMatrix error_correction_matrix);

    Key(Key&&) noexcept = default;
    Key& operator=(Key&& other) noexcept;
    Key(const Key&) = delete;
    Key& operator=(const Key&) = delete;
    ~Key();

    [[nodiscard]] const std::vector<Basis>& Theta() const noexcept { return theta_; }
    [[nodiscard]] const gf2::BitString& RBar() const noexcept { return r_bar_; }
    [[nodiscard]] const gf2::BitString& U() const noexcept { return u_; }
    [[nodiscard]] const gf2::BitString& D() const noexcept { return d_; }
    [[nodiscard]] const gf2::BitString& E() const noexcept { return e_; }
    [[nodiscard]] const gf2::BitMatrix& PrivacyAmplificationMatrix() const noexcept { return privacy_amplification_; }
    [[nodiscard]] const gf2::BitMatrix& ErrorCorrectionMatrix() const noexcept { return error_correction_; }

    [[nodiscard]] size_t TotalPositions() const noexcept { return theta_.size(); }
    [[nodiscard]] size_t HadamardCount() const noexcept;
    [[nodiscard]] size_t ComputationalCount() const noexcept { return theta_.size() - HadamardCount(); }

    /// One bit per position, set where theta is Hadamard.
    [[nodiscard]] gf2::BitString HadamardMask() const;

    /**
     * @brief Keep only the positions of bits whose theta tag equals basis
     *
     * @return MalformedMeasurement unless bits has one entry per position
     */
    Result<gf2::BitString, ProtocolFailure> Restrict(const gf2::BitString& bits, Basis basis) const;

    bool operator==(const Key& other) const noexcept;

private:
    Key(std::vector<Basis> theta,
        gf2::BitString r_bar,
        gf2::BitString u,
        gf2::BitString d,
        gf2::BitString e,
        gf2::BitMatrix privacy_amplification_matrix,
        gf2::BitMatrix error_correction_matrix);

    void WipeTheta() noexcept;

    std::vector<Basis> theta_;
    gf2::BitString r_bar_;
    gf2::BitString u_;
    gf2::BitString d_;
    gf2::BitString e_;
    gf2::BitMatrix privacy_amplification_;
    gf2::BitMatrix error_correction_;
};

}

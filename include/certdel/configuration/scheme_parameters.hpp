#pragma once

#include "certdel/configuration/error_correcting_code.hpp"
#include "certdel/gf2/bit_string.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace certdel::protocol::configuration {

/**
 * @brief Closed interval of expected success percentages
 */
struct SuccessRange {
    double lower;
    double upper;
};

/// Deletion percentage first, then the decryption range.
struct DeletionThenDecryptionRates {
    double deletion;
    SuccessRange decryption;
};

/// Decryption range first, then the deletion percentage.
struct DecryptionThenDeletionRates {
    SuccessRange decryption;
    double deletion;
};

/**
 * @brief Dimensions, verification threshold and code of one scheme instance
 *
 * The scheme prepares m = k + s qubits per message:
 * - k Hadamard positions carry the deletion check bits r_bar
 * - s computational positions carry the pad seed r
 *
 * **Lengths**:
 * - n: message and privacy-amplification output
 * - tau: error-correction hash
 * - mu: padded syndrome, either 0 (syndrome layer off) or the blockwise
 *   syndrome length of the s computational bits
 *
 * **Threshold**:
 * A deletion certificate at Hamming distance d from r_bar is accepted iff
 * d < delta * k.
 *
 * Immutable once created. Copies share the (potentially large) code tables.
 *
 * **Usage Example**:
 * ```cpp
 * auto params = SchemeParameters::Create(1, 4, 6, 6, 0, 0, 0.1, "hamming_3").Unwrap();
 * auto preset = SchemeParameters::ByteHamming4().Unwrap();
 * ```
 */
class SchemeParameters {
public:
    /**
     * @brief Validate dimensions and resolve the code by name
     *
     * @return ConfigurationError for zero n/k/s, delta outside (0,1), or an mu
     *         that does not match the code; UnknownCode for an unknown name
     */
    static Result<SchemeParameters, ProtocolFailure> Create(
        double lambda,
        size_t n,
        size_t k,
        size_t s,
        size_t tau,
        size_t mu,
        double delta,
        std::string_view code_name);

    /**
     * @brief Same as Create, with an explicit total that must equal k + s
     */
    static Result<SchemeParameters, ProtocolFailure> CreateWithTotal(
        double lambda,
        size_t n,
        size_t m,
        size_t k,
        size_t s,
        size_t tau,
        size_t mu,
        double delta,
        std::string_view code_name);

    /**
     * @brief Same as Create, with a caller-supplied code
     */
    static Result<SchemeParameters, ProtocolFailure> FromCode(
        double lambda,
        size_t n,
        size_t k,
        size_t s,
        size_t tau,
        size_t mu,
        double delta,
        std::shared_ptr<const ErrorCorrectingCode> code);

    /// n=8, k=714, s=150, tau=0, mu=40, delta=0.05, [15,11] Hamming.
    static Result<SchemeParameters, ProtocolFailure> ByteHamming4();

    /// n=8, k=736, s=128, tau=0, mu=29, delta=0.05, RM(4,7).
    static Result<SchemeParameters, ProtocolFailure> ByteReedMuller47();

    [[nodiscard]] double Lambda() const noexcept { return lambda_; }
    [[nodiscard]] size_t N() const noexcept { return n_; }
    [[nodiscard]] size_t M() const noexcept { return k_ + s_; }
    [[nodiscard]] size_t K() const noexcept { return k_; }
    [[nodiscard]] size_t S() const noexcept { return s_; }
    [[nodiscard]] size_t Tau() const noexcept { return tau_; }
    [[nodiscard]] size_t Mu() const noexcept { return mu_; }
    [[nodiscard]] double Delta() const noexcept { return delta_; }
    [[nodiscard]] const std::string& CodeName() const noexcept { return code_->Name(); }
    [[nodiscard]] const ErrorCorrectingCode& Code() const noexcept { return *code_; }
    [[nodiscard]] bool SyndromeEnabled() const noexcept { return mu_ != 0; }

    /// distance < delta * checked_positions, where checked_positions is k for a deletion certificate
    [[nodiscard]] static bool AcceptsDistance(size_t distance, double delta, size_t checked_positions) noexcept;

    /**
     * @brief Blockwise syndrome of the whole codeword blocks in bits
     *
     * Empty when the syndrome layer is off.
     */
    [[nodiscard]] gf2::BitString Synd(const gf2::BitString& bits) const;

    /**
     * @brief Correct each whole block towards the target syndrome
     *
     * Blocks whose syndrome difference is not in the table are returned
     * unchanged; trailing bits past the last whole block pass through.
     * Returns bits unchanged when the syndrome layer is off.
     *
     * @return LengthMismatch if the syndrome does not have one
     *         syndrome_length chunk per whole block
     */
    Result<gf2::BitString, ProtocolFailure> Corr(const gf2::BitString& bits, const gf2::BitString& syndrome) const;

    // Expected success percentages under independent bit flips with the given rate.
    [[nodiscard]] double ExpectedTest1SuccessRate(double error_rate = 0.0) const;
    [[nodiscard]] SuccessRange ExpectedTest2SuccessRate(double error_rate = 0.0) const;
    [[nodiscard]] DeletionThenDecryptionRates ExpectedTest3SuccessRate() const;
    [[nodiscard]] DeletionThenDecryptionRates ExpectedTest4SuccessRate() const;
    [[nodiscard]] DecryptionThenDeletionRates ExpectedTest5SuccessRate() const;

    bool operator==(const SchemeParameters& other) const noexcept;

private:
    SchemeParameters(
        double lambda,
        size_t n,
        size_t k,
        size_t s,
        size_t tau,
        size_t mu,
        double delta,
        std::shared_ptr<const ErrorCorrectingCode> code);

    [[nodiscard]] size_t WholeBlocks(size_t bit_count) const noexcept;

    double lambda_;
    size_t n_;
    size_t k_;
    size_t s_;
    size_t tau_;
    size_t mu_;
    double delta_;
    std::shared_ptr<const ErrorCorrectingCode> code_;
};

} // namespace certdel::protocol::configuration

#pragma once
#include "certdel/gf2/bit_string.hpp"
#include "certdel/gf2/bit_matrix.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace certdel::protocol::configuration {

/**
 * @brief Linear block code used for syndrome error correction
 *
 * Holds the transposed parity-check matrix H (code_length x syndrome_length,
 * so the syndrome of a block b is b * H) and a table from syndrome to the
 * lowest-weight error vector producing it.
 *
 * Built-in codes are resolved by name and shared process-wide; the tables
 * are generated on first use.
 */
class ErrorCorrectingCode {
public:
    using SyndromeTable = std::unordered_map<gf2::BitString, gf2::BitString, gf2::BitString::Hash>;

    /**
     * @brief Look up a built-in code
     *
     * Known names: "none", "hamming_3", "hamming_4", "reed_muller_4_7".
     * Fails with UnknownCode for anything else.
     */
    static Result<std::shared_ptr<const ErrorCorrectingCode>, ProtocolFailure> Resolve(std::string_view name);

    [[nodiscard]] static std::vector<std::string_view> RegisteredNames();

    /**
     * @brief Code with an explicit parity-check matrix and lookup table
     *
     * Every table key must be syndrome_length bits and every value
     * code_length bits.
     */
    static Result<ErrorCorrectingCode, ProtocolFailure> FromTables(
        std::string name,
        gf2::BitMatrix parity_check_transposed,
        SyndromeTable table);

    /// Marker code that disables the syndrome layer.
    static ErrorCorrectingCode None();

    /// [2^r - 1, 2^r - 1 - r] Hamming code, single-error correcting.
    static Result<ErrorCorrectingCode, ProtocolFailure> Hamming(uint32_t parity_bits);

    /// RM(4,7): length 128, checks from RM(2,7), corrects up to 3 errors.
    static Result<ErrorCorrectingCode, ProtocolFailure> ReedMuller47();

    /**
     * @brief Table of minimum-weight error patterns up to max_weight
     *
     * Patterns are enumerated by increasing weight, then lexicographically by
     * position; the first pattern that produces a syndrome keeps it.
     */
    static SyndromeTable BuildSyndromeTable(const gf2::BitMatrix& parity_check_transposed, uint32_t max_weight);

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] bool IsNone() const noexcept { return parity_check_.Rows() == 0; }
    [[nodiscard]] size_t CodeLength() const noexcept { return parity_check_.Rows(); }
    [[nodiscard]] size_t SyndromeLength() const noexcept { return parity_check_.Cols(); }
    [[nodiscard]] const gf2::BitMatrix& ParityCheckTransposed() const noexcept { return parity_check_; }
    [[nodiscard]] const SyndromeTable& Table() const noexcept { return table_; }

    /// Syndrome of exactly one codeword-length block.
    Result<gf2::BitString, ProtocolFailure> BlockSyndrome(const gf2::BitString& block) const;

    [[nodiscard]] std::optional<gf2::BitString> LookupErrorVector(const gf2::BitString& syndrome) const;

private:
    ErrorCorrectingCode(std::string name, gf2::BitMatrix parity_check, SyndromeTable table);

    std::string name_;
    gf2::BitMatrix parity_check_;
    SyndromeTable table_;
};

} // namespace certdel::protocol::configuration

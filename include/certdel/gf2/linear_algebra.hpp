#pragma once
#include "certdel/gf2/bit_string.hpp"
#include "certdel/gf2/bit_matrix.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <functional>
#include <span>
#include <vector>

namespace certdel::protocol::gf2 {

/**
 * @brief XOR of one or more equal-length bit strings
 *
 * Fails with LengthMismatch if the inputs disagree on length and with
 * InvalidInput when called with no inputs.
 */
Result<BitString, ProtocolFailure> XorAll(std::span<const std::reference_wrapper<const BitString>> inputs);

template<typename... Rest>
Result<BitString, ProtocolFailure> Xor(const BitString& first, const Rest&... rest) {
    const std::vector<std::reference_wrapper<const BitString>> inputs{std::cref(first), std::cref(rest)...};
    return XorAll(inputs);
}

/**
 * @brief Row vector times matrix over GF(2)
 *
 * Output bit j is the parity of (vector AND column j). Computed as the XOR of
 * the matrix rows selected by the vector's set bits.
 */
Result<BitString, ProtocolFailure> MatVecMod2(const BitString& vector, const BitMatrix& matrix);

[[nodiscard]] inline size_t HammingWeight(const BitString& bits) noexcept {
    return bits.PopCount();
}

Result<size_t, ProtocolFailure> HammingDistance(const BitString& a, const BitString& b);

}

#include "certdel/gf2/linear_algebra.hpp"
#include "certdel/core/constants.hpp"
#include "certdel/core/format.hpp"
#include <bit>

namespace certdel::protocol::gf2 {

Result<BitString, ProtocolFailure> XorAll(std::span<const std::reference_wrapper<const BitString>> inputs) {
    if (inputs.empty()) {
        return Result<BitString, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(std::string(ErrorMessages::XOR_NO_INPUTS)));
    }
    BitString acc = inputs.front().get();
    for (size_t i = 1; i < inputs.size(); ++i) {
        const BitString& next = inputs[i].get();
        if (next.Size() != acc.Size()) {
            return Result<BitString, ProtocolFailure>::Err(
                ProtocolFailure::LengthMismatch(
                    compat::format("Xor operand {} has {} bits, expected {}", i, next.Size(), acc.Size())));
        }
        acc.XorInPlace(next);
    }
    return Result<BitString, ProtocolFailure>::Ok(std::move(acc));
}

Result<BitString, ProtocolFailure> MatVecMod2(const BitString& vector, const BitMatrix& matrix) {
    if (vector.Size() != matrix.Rows()) {
        return Result<BitString, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Cannot multiply {}-bit vector by {}x{} matrix",
                               vector.Size(), matrix.Rows(), matrix.Cols())));
    }
    BitString out(matrix.Cols());
    const auto words = vector.Words();
    for (size_t w = 0; w < words.size(); ++w) {
        uint64_t word = words[w];
        while (word != 0) {
            const auto bit = static_cast<size_t>(std::countr_zero(word));
            out.XorInPlace(matrix.Row(w * Constants::WORD_BITS + bit));
            word &= word - 1;
        }
    }
    return Result<BitString, ProtocolFailure>::Ok(std::move(out));
}

Result<size_t, ProtocolFailure> HammingDistance(const BitString& a, const BitString& b) {
    auto diff = Xor(a, b);
    if (diff.IsErr()) {
        return Result<size_t, ProtocolFailure>::Err(std::move(diff).UnwrapErr());
    }
    return Result<size_t, ProtocolFailure>::Ok(HammingWeight(diff.Unwrap()));
}

}

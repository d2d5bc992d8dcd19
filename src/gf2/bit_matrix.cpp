#include "certdel/gf2/bit_matrix.hpp"
#include "certdel/core/format.hpp"

namespace certdel::protocol::gf2 {

BitMatrix::BitMatrix(const size_t rows, const size_t cols)
    : cols_(cols)
    , rows_(rows, BitString(cols)) {
}

Result<BitMatrix, ProtocolFailure> BitMatrix::FromRows(std::vector<BitString> rows, const size_t cols) {
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].Size() != cols) {
            return Result<BitMatrix, ProtocolFailure>::Err(
                ProtocolFailure::LengthMismatch(
                    compat::format("Matrix row {} has {} bits, expected {}", r, rows[r].Size(), cols)));
        }
    }
    BitMatrix out;
    out.cols_ = cols;
    out.rows_ = std::move(rows);
    return Result<BitMatrix, ProtocolFailure>::Ok(std::move(out));
}

Result<BitMatrix, ProtocolFailure> BitMatrix::FromRowStrings(const std::vector<std::string_view>& rows) {
    std::vector<BitString> parsed;
    parsed.reserve(rows.size());
    for (const auto row : rows) {
        auto bits = BitString::FromString(row);
        if (bits.IsErr()) {
            return Result<BitMatrix, ProtocolFailure>::Err(std::move(bits).UnwrapErr());
        }
        parsed.push_back(std::move(bits).Unwrap());
    }
    const size_t cols = parsed.empty() ? 0 : parsed.front().Size();
    return FromRows(std::move(parsed), cols);
}

Result<BitMatrix, ProtocolFailure> BitMatrix::Random(
    const size_t rows,
    const size_t cols,
    crypto::RandomSource& random) {
    std::vector<BitString> sampled;
    sampled.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        auto row = BitString::Random(cols, random);
        if (row.IsErr()) {
            return Result<BitMatrix, ProtocolFailure>::Err(std::move(row).UnwrapErr());
        }
        sampled.push_back(std::move(row).Unwrap());
    }
    return FromRows(std::move(sampled), cols);
}

BitMatrix BitMatrix::Transpose() const {
    BitMatrix out(cols_, rows_.size());
    for (size_t r = 0; r < rows_.size(); ++r) {
        for (size_t c = 0; c < cols_; ++c) {
            if (rows_[r].Get(c)) {
                out.rows_[c].Set(r, true);
            }
        }
    }
    return out;
}

void BitMatrix::SecureClear() noexcept {
    for (auto& row : rows_) {
        row.SecureClear();
    }
    rows_.clear();
    cols_ = 0;
}

}

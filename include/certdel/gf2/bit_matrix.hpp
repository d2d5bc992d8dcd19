#pragma once
#include "certdel/gf2/bit_string.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

namespace certdel::protocol::gf2 {

/**
 * @brief Dense matrix over GF(2) stored as bit-packed rows
 *
 * A row vector times this matrix is the XOR of the rows selected by the
 * vector's set bits, which is why rows (not columns) are the packed unit.
 */
class BitMatrix {
public:
    BitMatrix() = default;
    BitMatrix(size_t rows, size_t cols);

    BitMatrix(const BitMatrix&) = default;
    BitMatrix& operator=(const BitMatrix&) = default;
    BitMatrix(BitMatrix&& other) noexcept
        : cols_(std::exchange(other.cols_, 0))
        , rows_(std::move(other.rows_)) {}
    BitMatrix& operator=(BitMatrix&& other) noexcept {
        if (this != &other) {
            cols_ = std::exchange(other.cols_, 0);
            rows_ = std::move(other.rows_);
            other.rows_.clear();
        }
        return *this;
    }
    ~BitMatrix() = default;

    static Result<BitMatrix, ProtocolFailure> FromRows(std::vector<BitString> rows, size_t cols);
    static Result<BitMatrix, ProtocolFailure> FromRowStrings(const std::vector<std::string_view>& rows);
    static Result<BitMatrix, ProtocolFailure> Random(size_t rows, size_t cols, crypto::RandomSource& random);

    [[nodiscard]] size_t Rows() const noexcept { return rows_.size(); }
    [[nodiscard]] size_t Cols() const noexcept { return cols_; }

    [[nodiscard]] const BitString& Row(size_t row) const { return rows_.at(row); }
    [[nodiscard]] bool Get(size_t row, size_t col) const { return rows_.at(row).Get(col); }
    void Set(size_t row, size_t col, bool value) { rows_.at(row).Set(col, value); }

    [[nodiscard]] BitMatrix Transpose() const;

    void SecureClear() noexcept;

    bool operator==(const BitMatrix& other) const noexcept {
        return cols_ == other.cols_ && rows_ == other.rows_;
    }
    bool operator!=(const BitMatrix& other) const noexcept {
        return !(*this == other);
    }

private:
    size_t cols_ = 0;
    std::vector<BitString> rows_;
};

}

#pragma once
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include "certdel/core/constants.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace certdel::protocol::crypto {
class RandomSource;
}

namespace certdel::protocol::gf2 {

/**
 * @brief Fixed-length string of bits packed into 64-bit words
 *
 * Bit i lives in word i / 64 at position i % 64. Bits past Size() in the last
 * word are always zero, so word-wise comparison, hashing and popcount need no
 * masking.
 */
class BitString {
public:
    BitString() = default;
    explicit BitString(size_t size);

    BitString(const BitString&) = default;
    BitString& operator=(const BitString& other) {
        if (this != &other) {
            SecureClear();
            size_ = other.size_;
            words_ = other.words_;
        }
        return *this;
    }
    BitString(BitString&& other) noexcept
        : size_(std::exchange(other.size_, 0))
        , words_(std::move(other.words_)) {}
    BitString& operator=(BitString&& other) noexcept {
        if (this != &other) {
            SecureClear();
            size_ = std::exchange(other.size_, 0);
            words_ = std::move(other.words_);
            other.words_.clear();
        }
        return *this;
    }
    ~BitString() { SecureClear(); }

    /**
     * @brief Parse a string over {'0','1'}; index 0 is the first character
     */
    static Result<BitString, ProtocolFailure> FromString(std::string_view bits);

    /**
     * @brief Unpack from little-endian bit order (bit i in byte i / 8, position i % 8)
     */
    static Result<BitString, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes, size_t bit_length);

    static Result<BitString, ProtocolFailure> Random(size_t size, crypto::RandomSource& random);

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::vector<uint8_t> ToBytes() const;

    [[nodiscard]] size_t Size() const noexcept { return size_; }
    [[nodiscard]] bool Empty() const noexcept { return size_ == 0; }

    [[nodiscard]] bool Get(size_t index) const;
    void Set(size_t index, bool value);
    void Flip(size_t index);

    [[nodiscard]] size_t PopCount() const noexcept;

    [[nodiscard]] BitString Slice(size_t offset, size_t length) const;
    void Append(const BitString& other);

    /// In-place XOR; both operands must have the same size.
    void XorInPlace(const BitString& other);

    [[nodiscard]] std::span<const uint64_t> Words() const noexcept { return words_; }

    /**
     * @brief Zero the backing storage through libsodium and reset to empty
     *
     * Initializes libsodium on first use. Storage capacity is kept, so the
     * zeroed words stay allocated until the string is destroyed.
     */
    void SecureClear() noexcept;

    bool operator==(const BitString& other) const noexcept {
        return size_ == other.size_ && words_ == other.words_;
    }
    bool operator!=(const BitString& other) const noexcept {
        return !(*this == other);
    }

    struct Hash {
        size_t operator()(const BitString& bits) const noexcept;
    };

private:
    static constexpr size_t WordCount(size_t bits) noexcept {
        return (bits + Constants::WORD_BITS - 1) / Constants::WORD_BITS;
    }
    void ClearTail() noexcept;

    size_t size_ = 0;
    std::vector<uint64_t> words_;
};

}

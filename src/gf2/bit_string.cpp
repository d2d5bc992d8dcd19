#include "certdel/gf2/bit_string.hpp"
#include "certdel/crypto/random_source.hpp"
#include "certdel/crypto/sodium_interop.hpp"
#include "certdel/core/format.hpp"
#include <bit>
#include <stdexcept>

namespace certdel::protocol::gf2 {

namespace {
constexpr uint64_t kOne = 1;
constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;
}

BitString::BitString(const size_t size)
    : size_(size)
    , words_(WordCount(size), 0) {
}

Result<BitString, ProtocolFailure> BitString::FromString(const std::string_view bits) {
    BitString out(bits.size());
    for (size_t i = 0; i < bits.size(); ++i) {
        const char ch = bits[i];
        if (ch == Constants::BIT_ONE) {
            out.Set(i, true);
        } else if (ch != Constants::BIT_ZERO) {
            return Result<BitString, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("{} (found '{}' at index {})",
                                   ErrorMessages::INVALID_BIT_CHARACTER, ch, i)));
        }
    }
    return Result<BitString, ProtocolFailure>::Ok(std::move(out));
}

Result<BitString, ProtocolFailure> BitString::FromBytes(
    std::span<const uint8_t> bytes,
    const size_t bit_length) {
    const size_t expected = (bit_length + Constants::BYTE_BITS - 1) / Constants::BYTE_BITS;
    if (bytes.size() != expected) {
        return Result<BitString, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("Packed bit string of {} bits needs {} bytes, got {}",
                               bit_length, expected, bytes.size())));
    }
    BitString out(bit_length);
    for (size_t i = 0; i < bit_length; ++i) {
        if ((bytes[i / Constants::BYTE_BITS] >> (i % Constants::BYTE_BITS)) & 1u) {
            out.Set(i, true);
        }
    }
    const size_t used_tail_bits = bit_length % Constants::BYTE_BITS;
    if (used_tail_bits != 0 && (bytes.back() >> used_tail_bits) != 0) {
        return Result<BitString, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Packed bit string has non-zero padding bits"));
    }
    return Result<BitString, ProtocolFailure>::Ok(std::move(out));
}

Result<BitString, ProtocolFailure> BitString::Random(const size_t size, crypto::RandomSource& random) {
    BitString out(size);
    if (size == 0) {
        return Result<BitString, ProtocolFailure>::Ok(std::move(out));
    }
    // Words are assembled little-endian so a seeded stream gives the same bits on every host.
    std::vector<uint8_t> raw(out.words_.size() * sizeof(uint64_t));
    auto fill = random.Fill(raw);
    if (fill.IsOk()) {
        for (size_t w = 0; w < out.words_.size(); ++w) {
            uint64_t word = 0;
            for (size_t b = 0; b < sizeof(uint64_t); ++b) {
                word |= static_cast<uint64_t>(raw[w * sizeof(uint64_t) + b]) << (Constants::BYTE_BITS * b);
            }
            out.words_[w] = word;
        }
    }
    if (auto wipe = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(raw)); wipe.IsErr()) {
        return Result<BitString, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(wipe.UnwrapErr()));
    }
    if (fill.IsErr()) {
        return Result<BitString, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(fill.UnwrapErr()));
    }
    out.ClearTail();
    return Result<BitString, ProtocolFailure>::Ok(std::move(out));
}

std::string BitString::ToString() const {
    std::string out;
    out.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(Get(i) ? Constants::BIT_ONE : Constants::BIT_ZERO);
    }
    return out;
}

std::vector<uint8_t> BitString::ToBytes() const {
    std::vector<uint8_t> out((size_ + Constants::BYTE_BITS - 1) / Constants::BYTE_BITS, 0);
    for (size_t i = 0; i < size_; ++i) {
        if (Get(i)) {
            out[i / Constants::BYTE_BITS] |= static_cast<uint8_t>(1u << (i % Constants::BYTE_BITS));
        }
    }
    return out;
}

bool BitString::Get(const size_t index) const {
    if (index >= size_) {
        throw std::out_of_range(compat::format("Bit index {} out of range for length {}", index, size_));
    }
    return (words_[index / Constants::WORD_BITS] >> (index % Constants::WORD_BITS)) & kOne;
}

void BitString::Set(const size_t index, const bool value) {
    if (index >= size_) {
        throw std::out_of_range(compat::format("Bit index {} out of range for length {}", index, size_));
    }
    const uint64_t mask = kOne << (index % Constants::WORD_BITS);
    if (value) {
        words_[index / Constants::WORD_BITS] |= mask;
    } else {
        words_[index / Constants::WORD_BITS] &= ~mask;
    }
}

void BitString::Flip(const size_t index) {
    Set(index, !Get(index));
}

size_t BitString::PopCount() const noexcept {
    size_t count = 0;
    for (const uint64_t word : words_) {
        count += static_cast<size_t>(std::popcount(word));
    }
    return count;
}

BitString BitString::Slice(const size_t offset, const size_t length) const {
    if (offset > size_ || length > size_ - offset) {
        throw std::out_of_range(
            compat::format("Slice [{}, {}) out of range for length {}", offset, offset + length, size_));
    }
    BitString out(length);
    for (size_t i = 0; i < length; ++i) {
        if (Get(offset + i)) {
            out.Set(i, true);
        }
    }
    return out;
}

void BitString::Append(const BitString& other) {
    const size_t old_size = size_;
    size_ += other.size_;
    words_.resize(WordCount(size_), 0);
    for (size_t i = 0; i < other.size_; ++i) {
        if (other.Get(i)) {
            Set(old_size + i, true);
        }
    }
}

void BitString::XorInPlace(const BitString& other) {
    if (other.size_ != size_) {
        throw std::invalid_argument(
            compat::format("XorInPlace length mismatch: {} vs {}", size_, other.size_));
    }
    for (size_t i = 0; i < words_.size(); ++i) {
        words_[i] ^= other.words_[i];
    }
}

void BitString::SecureClear() noexcept {
    if (!words_.empty()) {
        // Only BufferTooLarge can fail once libsodium is up, and a word vector never reaches it.
        if (crypto::SodiumInterop::Initialize().IsOk()) {
            auto wipe = crypto::SodiumInterop::SecureWipe(std::span<uint64_t>(words_));
            (void) wipe;
        }
    }
    words_.clear();
    size_ = 0;
}

void BitString::ClearTail() noexcept {
    const size_t used = size_ % Constants::WORD_BITS;
    if (used != 0 && !words_.empty()) {
        words_.back() &= (kOne << used) - 1;
    }
}

size_t BitString::Hash::operator()(const BitString& bits) const noexcept {
    uint64_t hash = kFnvOffset ^ bits.size_;
    for (const uint64_t word : bits.words_) {
        hash ^= word;
        hash *= kFnvPrime;
    }
    return static_cast<size_t>(hash);
}

}

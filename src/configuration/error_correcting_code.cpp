#include "certdel/configuration/error_correcting_code.hpp"
#include "certdel/gf2/linear_algebra.hpp"
#include "certdel/core/constants.hpp"
#include "certdel/core/format.hpp"

#include <algorithm>
#include <map>
#include <mutex>

namespace certdel::protocol::configuration {

namespace {

constexpr uint32_t kHammingCorrectingRadius = 1;
constexpr uint32_t kReedMullerCorrectingRadius = 3;
constexpr uint32_t kMaxHammingParityBits = 10;
constexpr size_t kReedMullerVariables = 7;
constexpr size_t kReedMullerLength = size_t{1} << kReedMullerVariables;

// Evaluations of every monomial of degree <= 2 in 7 variables at point x:
// 1, x_i, x_i x_j (i < j). These are the generator columns of RM(2,7), the
// dual of RM(4,7).
gf2::BitMatrix ReedMuller47ParityCheck() {
    constexpr size_t columns = 1 + kReedMullerVariables +
        kReedMullerVariables * (kReedMullerVariables - 1) / 2;
    gf2::BitMatrix h(kReedMullerLength, columns);
    for (size_t x = 0; x < kReedMullerLength; ++x) {
        size_t col = 0;
        h.Set(x, col++, true);
        for (size_t i = 0; i < kReedMullerVariables; ++i) {
            h.Set(x, col++, ((x >> i) & 1u) != 0);
        }
        for (size_t i = 0; i < kReedMullerVariables; ++i) {
            for (size_t j = i + 1; j < kReedMullerVariables; ++j) {
                h.Set(x, col++, ((x >> i) & (x >> j) & 1u) != 0);
            }
        }
    }
    return h;
}

void EnumeratePatterns(
    const gf2::BitMatrix& h,
    const uint32_t remaining,
    const size_t first_position,
    gf2::BitString& pattern,
    gf2::BitString& syndrome,
    ErrorCorrectingCode::SyndromeTable& table) {
    if (remaining == 0) {
        table.try_emplace(syndrome, pattern);
        return;
    }
    for (size_t pos = first_position; pos < h.Rows(); ++pos) {
        pattern.Set(pos, true);
        syndrome.XorInPlace(h.Row(pos));
        EnumeratePatterns(h, remaining - 1, pos + 1, pattern, syndrome, table);
        syndrome.XorInPlace(h.Row(pos));
        pattern.Set(pos, false);
    }
}

struct CodeRegistry {
    std::mutex lock;
    std::map<std::string, std::shared_ptr<const ErrorCorrectingCode>, std::less<>> codes;
};

CodeRegistry& Registry() {
    static CodeRegistry registry;
    return registry;
}

Result<ErrorCorrectingCode, ProtocolFailure> BuildNamed(const std::string_view name) {
    if (name == CodeNames::NONE) {
        return Result<ErrorCorrectingCode, ProtocolFailure>::Ok(ErrorCorrectingCode::None());
    }
    if (name == CodeNames::HAMMING_3) {
        return ErrorCorrectingCode::Hamming(3);
    }
    if (name == CodeNames::HAMMING_4) {
        return ErrorCorrectingCode::Hamming(4);
    }
    if (name == CodeNames::REED_MULLER_4_7) {
        return ErrorCorrectingCode::ReedMuller47();
    }
    return Result<ErrorCorrectingCode, ProtocolFailure>::Err(
        ProtocolFailure::UnknownCode(compat::format("Unknown error-correcting code '{}'", name)));
}

} // namespace

ErrorCorrectingCode::ErrorCorrectingCode(std::string name, gf2::BitMatrix parity_check, SyndromeTable table)
    : name_(std::move(name))
    , parity_check_(std::move(parity_check))
    , table_(std::move(table)) {
}

Result<std::shared_ptr<const ErrorCorrectingCode>, ProtocolFailure> ErrorCorrectingCode::Resolve(
    const std::string_view name) {
    using ResultType = Result<std::shared_ptr<const ErrorCorrectingCode>, ProtocolFailure>;
    auto& registry = Registry();
    std::lock_guard guard(registry.lock);
    if (const auto it = registry.codes.find(name); it != registry.codes.end()) {
        return ResultType::Ok(it->second);
    }
    auto built = BuildNamed(name);
    if (built.IsErr()) {
        return ResultType::Err(std::move(built).UnwrapErr());
    }
    auto shared = std::make_shared<const ErrorCorrectingCode>(std::move(built).Unwrap());
    registry.codes.emplace(std::string(name), shared);
    return ResultType::Ok(std::move(shared));
}

std::vector<std::string_view> ErrorCorrectingCode::RegisteredNames() {
    return {CodeNames::NONE, CodeNames::HAMMING_3, CodeNames::HAMMING_4, CodeNames::REED_MULLER_4_7};
}

Result<ErrorCorrectingCode, ProtocolFailure> ErrorCorrectingCode::FromTables(
    std::string name,
    gf2::BitMatrix parity_check_transposed,
    SyndromeTable table) {
    const size_t code_length = parity_check_transposed.Rows();
    const size_t syndrome_length = parity_check_transposed.Cols();
    if (code_length == 0 || syndrome_length == 0) {
        return Result<ErrorCorrectingCode, ProtocolFailure>::Err(
            ProtocolFailure::ConfigurationError(
                compat::format("Code '{}' has an empty parity-check matrix", name)));
    }
    for (const auto& [syndrome, error] : table) {
        if (syndrome.Size() != syndrome_length || error.Size() != code_length) {
            return Result<ErrorCorrectingCode, ProtocolFailure>::Err(
                ProtocolFailure::LengthMismatch(
                    compat::format("Code '{}' table entry {} -> {} does not match {}x{} parity checks",
                                   name, syndrome.ToString(), error.ToString(),
                                   code_length, syndrome_length)));
        }
    }
    return Result<ErrorCorrectingCode, ProtocolFailure>::Ok(
        ErrorCorrectingCode(std::move(name), std::move(parity_check_transposed), std::move(table)));
}

ErrorCorrectingCode ErrorCorrectingCode::None() {
    return ErrorCorrectingCode(std::string(CodeNames::NONE), gf2::BitMatrix(), SyndromeTable{});
}

Result<ErrorCorrectingCode, ProtocolFailure> ErrorCorrectingCode::Hamming(const uint32_t parity_bits) {
    if (parity_bits < 2 || parity_bits > kMaxHammingParityBits) {
        return Result<ErrorCorrectingCode, ProtocolFailure>::Err(
            ProtocolFailure::ConfigurationError(
                compat::format("Hamming codes need 2..{} parity bits, got {}", kMaxHammingParityBits, parity_bits)));
    }
    const size_t code_length = (size_t{1} << parity_bits) - 1;
    gf2::BitMatrix h(code_length, parity_bits);
    for (size_t j = 1; j <= code_length; ++j) {
        for (size_t b = 0; b < parity_bits; ++b) {
            h.Set(j - 1, b, ((j >> b) & 1u) != 0);
        }
    }
    auto table = BuildSyndromeTable(h, kHammingCorrectingRadius);
    return FromTables(compat::format("hamming_{}", parity_bits), std::move(h), std::move(table));
}

Result<ErrorCorrectingCode, ProtocolFailure> ErrorCorrectingCode::ReedMuller47() {
    auto h = ReedMuller47ParityCheck();
    auto table = BuildSyndromeTable(h, kReedMullerCorrectingRadius);
    return FromTables(std::string(CodeNames::REED_MULLER_4_7), std::move(h), std::move(table));
}

ErrorCorrectingCode::SyndromeTable ErrorCorrectingCode::BuildSyndromeTable(
    const gf2::BitMatrix& parity_check_transposed,
    const uint32_t max_weight) {
    SyndromeTable table;
    const uint32_t weight_cap = std::min<uint32_t>(max_weight, SchemeConstants::MAX_SYNDROME_TABLE_WEIGHT);
    gf2::BitString pattern(parity_check_transposed.Rows());
    gf2::BitString syndrome(parity_check_transposed.Cols());
    for (uint32_t weight = 0; weight <= weight_cap; ++weight) {
        EnumeratePatterns(parity_check_transposed, weight, 0, pattern, syndrome, table);
    }
    return table;
}

Result<gf2::BitString, ProtocolFailure> ErrorCorrectingCode::BlockSyndrome(const gf2::BitString& block) const {
    if (block.Size() != CodeLength()) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Block of {} bits does not match code length {}", block.Size(), CodeLength())));
    }
    return gf2::MatVecMod2(block, parity_check_);
}

std::optional<gf2::BitString> ErrorCorrectingCode::LookupErrorVector(const gf2::BitString& syndrome) const {
    if (const auto it = table_.find(syndrome); it != table_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace certdel::protocol::configuration

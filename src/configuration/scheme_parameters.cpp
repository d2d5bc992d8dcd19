#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/gf2/linear_algebra.hpp"
#include "certdel/core/constants.hpp"
#include "certdel/core/format.hpp"

#include <algorithm>
#include <cmath>

namespace certdel::protocol::configuration {

namespace {

// P[X <= x] for X ~ Binomial(trials, p), summed in log space.
double BinomialCdf(const size_t x, const size_t trials, const double p) {
    if (p <= 0.0) {
        return 1.0;
    }
    if (p >= 1.0) {
        return x >= trials ? 1.0 : 0.0;
    }
    const double log_p = std::log(p);
    const double log_q = std::log1p(-p);
    const double log_n_fact = std::lgamma(static_cast<double>(trials) + 1.0);
    double sum = 0.0;
    for (size_t i = 0; i <= std::min(x, trials); ++i) {
        const auto di = static_cast<double>(i);
        const double log_term = log_n_fact
            - std::lgamma(di + 1.0)
            - std::lgamma(static_cast<double>(trials - i) + 1.0)
            + di * log_p
            + static_cast<double>(trials - i) * log_q;
        sum += std::exp(log_term);
    }
    return std::min(sum, 1.0);
}

} // namespace

SchemeParameters::SchemeParameters(
    const double lambda,
    const size_t n,
    const size_t k,
    const size_t s,
    const size_t tau,
    const size_t mu,
    const double delta,
    std::shared_ptr<const ErrorCorrectingCode> code)
    : lambda_(lambda)
    , n_(n)
    , k_(k)
    , s_(s)
    , tau_(tau)
    , mu_(mu)
    , delta_(delta)
    , code_(std::move(code)) {
}

Result<SchemeParameters, ProtocolFailure> SchemeParameters::Create(
    const double lambda,
    const size_t n,
    const size_t k,
    const size_t s,
    const size_t tau,
    const size_t mu,
    const double delta,
    const std::string_view code_name) {
    auto code = ErrorCorrectingCode::Resolve(code_name);
    if (code.IsErr()) {
        return Result<SchemeParameters, ProtocolFailure>::Err(std::move(code).UnwrapErr());
    }
    return FromCode(lambda, n, k, s, tau, mu, delta, std::move(code).Unwrap());
}

Result<SchemeParameters, ProtocolFailure> SchemeParameters::CreateWithTotal(
    const double lambda,
    const size_t n,
    const size_t m,
    const size_t k,
    const size_t s,
    const size_t tau,
    const size_t mu,
    const double delta,
    const std::string_view code_name) {
    if (m != k + s) {
        return Result<SchemeParameters, ProtocolFailure>::Err(
            ProtocolFailure::ConfigurationError(
                compat::format("m = {} must equal k + s = {}", m, k + s)));
    }
    return Create(lambda, n, k, s, tau, mu, delta, code_name);
}

Result<SchemeParameters, ProtocolFailure> SchemeParameters::FromCode(
    const double lambda,
    const size_t n,
    const size_t k,
    const size_t s,
    const size_t tau,
    const size_t mu,
    const double delta,
    std::shared_ptr<const ErrorCorrectingCode> code) {
    if (!code) {
        return Result<SchemeParameters, ProtocolFailure>::Err(
            ProtocolFailure::ConfigurationError("Scheme parameters need an error-correcting code"));
    }
    if (n == 0 || k == 0 || s == 0) {
        return Result<SchemeParameters, ProtocolFailure>::Err(
            ProtocolFailure::ConfigurationError(
                compat::format("n, k and s must be positive (n={}, k={}, s={})", n, k, s)));
    }
    if (!(delta > 0.0 && delta < 1.0)) {
        return Result<SchemeParameters, ProtocolFailure>::Err(
            ProtocolFailure::ConfigurationError(
                compat::format("{} (got {})", ErrorMessages::DELTA_OUT_OF_RANGE, delta)));
    }
    if (mu != 0) {
        if (code->IsNone()) {
            return Result<SchemeParameters, ProtocolFailure>::Err(
                ProtocolFailure::ConfigurationError(
                    compat::format("mu = {} requires an error-correcting code", mu)));
        }
        const size_t expected_mu = (s / code->CodeLength()) * code->SyndromeLength();
        if (mu != expected_mu) {
            return Result<SchemeParameters, ProtocolFailure>::Err(
                ProtocolFailure::ConfigurationError(
                    compat::format("mu = {} does not match {} blocks of code '{}' ({} syndrome bits)",
                                   mu, s / code->CodeLength(), code->Name(), expected_mu)));
        }
    }
    return Result<SchemeParameters, ProtocolFailure>::Ok(
        SchemeParameters(lambda, n, k, s, tau, mu, delta, std::move(code)));
}

Result<SchemeParameters, ProtocolFailure> SchemeParameters::ByteHamming4() {
    return Create(1, 8, 714, 150, 0, 40, 0.05, CodeNames::HAMMING_4);
}

Result<SchemeParameters, ProtocolFailure> SchemeParameters::ByteReedMuller47() {
    return Create(1, 8, 736, 128, 0, 29, 0.05, CodeNames::REED_MULLER_4_7);
}

bool SchemeParameters::AcceptsDistance(
    const size_t distance,
    const double delta,
    const size_t checked_positions) noexcept {
    return static_cast<double>(distance) < delta * static_cast<double>(checked_positions);
}

size_t SchemeParameters::WholeBlocks(const size_t bit_count) const noexcept {
    if (code_->IsNone()) {
        return 0;
    }
    return bit_count / code_->CodeLength();
}

gf2::BitString SchemeParameters::Synd(const gf2::BitString& bits) const {
    if (!SyndromeEnabled()) {
        return gf2::BitString();
    }
    const size_t block_length = code_->CodeLength();
    gf2::BitString out;
    for (size_t block = 0; block < WholeBlocks(bits.Size()); ++block) {
        // Whole blocks always match the code length.
        out.Append(code_->BlockSyndrome(bits.Slice(block * block_length, block_length)).Unwrap());
    }
    return out;
}

Result<gf2::BitString, ProtocolFailure> SchemeParameters::Corr(
    const gf2::BitString& bits,
    const gf2::BitString& syndrome) const {
    if (!SyndromeEnabled()) {
        return Result<gf2::BitString, ProtocolFailure>::Ok(bits);
    }
    const size_t block_length = code_->CodeLength();
    const size_t syndrome_length = code_->SyndromeLength();
    const size_t blocks = WholeBlocks(bits.Size());
    if (syndrome.Size() != blocks * syndrome_length) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Target syndrome has {} bits, expected {} for {} blocks",
                               syndrome.Size(), blocks * syndrome_length, blocks)));
    }

    gf2::BitString out;
    for (size_t block = 0; block < blocks; ++block) {
        auto chunk = bits.Slice(block * block_length, block_length);
        auto difference = code_->BlockSyndrome(chunk).Unwrap();
        difference.XorInPlace(syndrome.Slice(block * syndrome_length, syndrome_length));
        if (const auto error = code_->LookupErrorVector(difference); error.has_value()) {
            chunk.XorInPlace(*error);
        }
        out.Append(chunk);
    }
    out.Append(bits.Slice(blocks * block_length, bits.Size() - blocks * block_length));
    return Result<gf2::BitString, ProtocolFailure>::Ok(std::move(out));
}

double SchemeParameters::ExpectedTest1SuccessRate(const double error_rate) const {
    const double threshold = delta_ * static_cast<double>(k_);
    const auto ceiling = static_cast<size_t>(std::ceil(threshold));
    const size_t max_tolerated = std::min(k_ - 1, ceiling == 0 ? 0 : ceiling - 1);
    return BinomialCdf(max_tolerated, k_, error_rate) * SchemeConstants::PERCENT;
}

SuccessRange SchemeParameters::ExpectedTest2SuccessRate(const double error_rate) const {
    const double all_correct = std::pow(1.0 - error_rate, static_cast<double>(s_));
    // A wrong pad seed still decrypts correctly when the hash collides.
    const double collision = std::ldexp(1.0 - all_correct, -static_cast<int>(std::min<size_t>(n_, 1024)));
    return SuccessRange{
        .lower = all_correct * SchemeConstants::PERCENT,
        .upper = (all_correct + collision) * SchemeConstants::PERCENT
    };
}

DeletionThenDecryptionRates SchemeParameters::ExpectedTest3SuccessRate() const {
    return DeletionThenDecryptionRates{
        .deletion = ExpectedTest1SuccessRate(),
        .decryption = ExpectedTest2SuccessRate(SchemeConstants::RANDOM_GUESS_ERROR_RATE)
    };
}

DeletionThenDecryptionRates SchemeParameters::ExpectedTest4SuccessRate() const {
    return DeletionThenDecryptionRates{
        .deletion = ExpectedTest1SuccessRate(SchemeConstants::BREIDBART_ERROR_RATE),
        .decryption = ExpectedTest2SuccessRate(SchemeConstants::BREIDBART_ERROR_RATE)
    };
}

DecryptionThenDeletionRates SchemeParameters::ExpectedTest5SuccessRate() const {
    return DecryptionThenDeletionRates{
        .decryption = ExpectedTest2SuccessRate(),
        .deletion = ExpectedTest1SuccessRate()
    };
}

bool SchemeParameters::operator==(const SchemeParameters& other) const noexcept {
    return lambda_ == other.lambda_ &&
           n_ == other.n_ &&
           k_ == other.k_ &&
           s_ == other.s_ &&
           tau_ == other.tau_ &&
           mu_ == other.mu_ &&
           delta_ == other.delta_ &&
           code_->Name() == other.code_->Name() &&
           code_->ParityCheckTransposed() == other.code_->ParityCheckTransposed();
}

} // namespace certdel::protocol::configuration

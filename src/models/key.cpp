#include "certdel/models/key.hpp"
#include "certdel/crypto/sodium_interop.hpp"
#include "certdel/debug/key_logger.hpp"
#include "certdel/core/format.hpp"

#include <algorithm>
#include <limits>
#include <span>

namespace certdel::protocol::models {

namespace {

Result<gf2::BitString, ProtocolFailure> SampleBits(const size_t size, crypto::RandomSource& random) {
    return gf2::BitString::Random(size, random);
}

Result<std::vector<Basis>, ProtocolFailure> SampleTheta(
    const size_t total,
    const size_t hadamard,
    crypto::RandomSource& random) {
    if (total > std::numeric_limits<uint32_t>::max()) {
        return Result<std::vector<Basis>, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration(
                compat::format("Cannot sample basis positions out of {} qubits", total)));
    }
    std::vector<Basis> theta(total, Basis::Computational);
    size_t chosen = 0;
    while (chosen < hadamard) {
        auto index = random.Uniform(static_cast<uint32_t>(total));
        if (index.IsErr()) {
            return Result<std::vector<Basis>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(index.UnwrapErr()));
        }
        auto& slot = theta[index.Unwrap()];
        if (slot != Basis::Hadamard) {
            slot = Basis::Hadamard;
            ++chosen;
        }
    }
    return Result<std::vector<Basis>, ProtocolFailure>::Ok(std::move(theta));
}

Result<Unit, ProtocolFailure> CheckLength(
    const std::string_view field,
    const size_t actual,
    const size_t expected) {
    if (actual != expected) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Key field {} has {} bits, expected {}", field, actual, expected)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> CheckShape(
    const std::string_view field,
    const gf2::BitMatrix& matrix,
    const size_t rows,
    const size_t cols) {
    if (matrix.Rows() != rows || matrix.Cols() != cols) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Key matrix {} is {}x{}, expected {}x{}",
                               field, matrix.Rows(), matrix.Cols(), rows, cols)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace

Key::Key(
    std::vector<Basis> theta,
    gf2::BitString r_bar,
    gf2::BitString u,
    gf2::BitString d,
    gf2::BitString e,
    gf2::BitMatrix privacy_amplification_matrix,
    gf2::BitMatrix error_correction_matrix)
    : theta_(std::move(theta))
    , r_bar_(std::move(r_bar))
    , u_(std::move(u))
    , d_(std::move(d))
    , e_(std::move(e))
    , privacy_amplification_(std::move(privacy_amplification_matrix))
    , error_correction_(std::move(error_correction_matrix)) {
}

Key::~Key() {
    WipeTheta();
    r_bar_.SecureClear();
    u_.SecureClear();
    d_.SecureClear();
    e_.SecureClear();
    privacy_amplification_.SecureClear();
    error_correction_.SecureClear();
}

Key& Key::operator=(Key&& other) noexcept {
    if (this != &other) {
        WipeTheta();
        theta_ = std::move(other.theta_);
        r_bar_ = std::move(other.r_bar_);
        u_ = std::move(other.u_);
        d_ = std::move(other.d_);
        e_ = std::move(other.e_);
        privacy_amplification_ = std::move(other.privacy_amplification_);
        error_correction_ = std::move(other.error_correction_);
    }
    return *this;
}

void Key::WipeTheta() noexcept {
    if (theta_.empty()) {
        return;
    }
    if (crypto::SodiumInterop::Initialize().IsOk()) {
        auto wipe = crypto::SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(theta_.data()), theta_.size() * sizeof(Basis)));
        (void) wipe;
    }
    theta_.clear();
}

Result<Key, ProtocolFailure> Key::Generate(
    const configuration::SchemeParameters& params,
    crypto::RandomSource& random) {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto theta = SampleTheta(params.M(), params.K(), random);
    if (theta.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(theta).UnwrapErr());
    }
    auto r_bar = SampleBits(params.K(), random);
    if (r_bar.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(r_bar).UnwrapErr());
    }
    auto u = SampleBits(params.N(), random);
    if (u.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(u).UnwrapErr());
    }
    auto d = SampleBits(params.Tau(), random);
    if (d.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(d).UnwrapErr());
    }
    auto e = SampleBits(params.Mu(), random);
    if (e.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(e).UnwrapErr());
    }
    auto privacy_amplification = gf2::BitMatrix::Random(params.S(), params.N(), random);
    if (privacy_amplification.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(privacy_amplification).UnwrapErr());
    }
    auto error_correction = gf2::BitMatrix::Random(params.S(), params.Tau(), random);
    if (error_correction.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(std::move(error_correction).UnwrapErr());
    }

    Key key(std::move(theta).Unwrap(),
            std::move(r_bar).Unwrap(),
            std::move(u).Unwrap(),
            std::move(d).Unwrap(),
            std::move(e).Unwrap(),
            std::move(privacy_amplification).Unwrap(),
            std::move(error_correction).Unwrap());
    debug::LogKeyGenerated(debug::Side::Sender, key.HadamardMask(), key.r_bar_, key.u_, key.d_, key.e_,
                           key.privacy_amplification_, key.error_correction_);
    return Result<Key, ProtocolFailure>::Ok(std::move(key));
}

Result<Key, ProtocolFailure> Key::FromParts(
    const configuration::SchemeParameters& params,
    std::vector<Basis> theta,
    gf2::BitString r_bar,
    gf2::BitString u,
    gf2::BitString d,
    gf2::BitString e,
    gf2::BitMatrix privacy_amplification_matrix,
    gf2::BitMatrix error_correction_matrix) {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Key, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    // Assemble first so rejected material is still wiped on return.
    Key key(std::move(theta),
            std::move(r_bar),
            std::move(u),
            std::move(d),
            std::move(e),
            std::move(privacy_amplification_matrix),
            std::move(error_correction_matrix));

    if (key.theta_.size() != params.M()) {
        return Result<Key, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("theta has {} tags, expected {}", key.theta_.size(), params.M())));
    }
    if (key.HadamardCount() != params.K()) {
        return Result<Key, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("theta has {} Hadamard tags, expected exactly {}",
                               key.HadamardCount(), params.K())));
    }
    for (const auto& check : {
             CheckLength("r_bar", key.r_bar_.Size(), params.K()),
             CheckLength("u", key.u_.Size(), params.N()),
             CheckLength("d", key.d_.Size(), params.Tau()),
             CheckLength("e", key.e_.Size(), params.Mu()),
             CheckShape("privacy_amplification", key.privacy_amplification_, params.S(), params.N()),
             CheckShape("error_correction", key.error_correction_, params.S(), params.Tau())}) {
        if (check.IsErr()) {
            return Result<Key, ProtocolFailure>::Err(check.UnwrapErr());
        }
    }
    return Result<Key, ProtocolFailure>::Ok(std::move(key));
}

size_t Key::HadamardCount() const noexcept {
    return static_cast<size_t>(std::count(theta_.begin(), theta_.end(), Basis::Hadamard));
}

gf2::BitString Key::HadamardMask() const {
    gf2::BitString mask(theta_.size());
    for (size_t i = 0; i < theta_.size(); ++i) {
        if (theta_[i] == Basis::Hadamard) {
            mask.Set(i, true);
        }
    }
    return mask;
}

Result<gf2::BitString, ProtocolFailure> Key::Restrict(const gf2::BitString& bits, const Basis basis) const {
    if (bits.Size() != theta_.size()) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMeasurement(
                compat::format("Measurement has {} bits, key covers {} positions", bits.Size(), theta_.size())));
    }
    const size_t kept = basis == Basis::Hadamard ? HadamardCount() : ComputationalCount();
    gf2::BitString out(kept);
    size_t next = 0;
    for (size_t i = 0; i < theta_.size(); ++i) {
        if (theta_[i] == basis) {
            if (bits.Get(i)) {
                out.Set(next, true);
            }
            ++next;
        }
    }
    return Result<gf2::BitString, ProtocolFailure>::Ok(std::move(out));
}

bool Key::operator==(const Key& other) const noexcept {
    return theta_ == other.theta_ &&
           r_bar_ == other.r_bar_ &&
           u_ == other.u_ &&
           d_ == other.d_ &&
           e_ == other.e_ &&
           privacy_amplification_ == other.privacy_amplification_ &&
           error_correction_ == other.error_correction_;
}

}

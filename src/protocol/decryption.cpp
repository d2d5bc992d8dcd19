#include "certdel/protocol/decryption.hpp"
#include "certdel/crypto/sodium_interop.hpp"
#include "certdel/gf2/linear_algebra.hpp"
#include "certdel/debug/key_logger.hpp"
#include "certdel/core/format.hpp"

namespace certdel::protocol {

using enums::Basis;

namespace {

Result<gf2::BitString, ProtocolFailure> ExtractComputational(
    const gf2::BitString& measured,
    const models::Key& key,
    const configuration::SchemeParameters& params) {
    if (measured.Size() == params.M()) {
        return key.Restrict(measured, Basis::Computational);
    }
    if (measured.Size() == params.S()) {
        return Result<gf2::BitString, ProtocolFailure>::Ok(measured);
    }
    return Result<gf2::BitString, ProtocolFailure>::Err(
        ProtocolFailure::MalformedMeasurement(
            compat::format("Measurement has {} bits, expected {} (all positions) or {} (computational only)",
                           measured.Size(), params.M(), params.S())));
}

Result<bool, ProtocolFailure> HashesDiffer(const gf2::BitString& computed, const gf2::BitString& published) {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    const auto lhs = computed.ToBytes();
    const auto rhs = published.ToBytes();
    auto equal = crypto::SodiumInterop::ConstantTimeEquals(lhs, rhs);
    if (equal.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(equal.UnwrapErr()));
    }
    return Result<bool, ProtocolFailure>::Ok(computed.Size() != published.Size() || !equal.Unwrap());
}

} // namespace

void DecryptionStatistics::Record(const DecryptionOutcome& outcome, const uint64_t count) noexcept {
    if (outcome.correct) {
        (outcome.flagged ? correct_flagged : correct_unflagged) += count;
    } else {
        (outcome.flagged ? incorrect_flagged : incorrect_unflagged) += count;
    }
}

Result<DecryptionOutcome, ProtocolFailure> Decryption::Decrypt(
    const gf2::BitString& measured,
    const models::Key& key,
    const models::Ciphertext& ciphertext,
    const gf2::BitString& expected,
    const configuration::SchemeParameters& params,
    const bool error_correct) {
    auto extracted = ExtractComputational(measured, key, params);
    if (extracted.IsErr()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(extracted).UnwrapErr());
    }
    gf2::BitString r_prime = std::move(extracted).Unwrap();

    gf2::BitString corrected = r_prime;
    if (error_correct) {
        auto target = gf2::Xor(ciphertext.Q(), key.E());
        if (target.IsErr()) {
            return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(target).UnwrapErr());
        }
        auto fixed = params.Corr(r_prime, target.Unwrap());
        if (fixed.IsErr()) {
            return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(fixed).UnwrapErr());
        }
        corrected = std::move(fixed).Unwrap();
    }

    auto ec_hash = gf2::MatVecMod2(corrected, key.ErrorCorrectionMatrix());
    if (ec_hash.IsErr()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(ec_hash).UnwrapErr());
    }
    auto padded_hash = gf2::Xor(ec_hash.Unwrap(), key.D());
    if (padded_hash.IsErr()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(padded_hash).UnwrapErr());
    }
    auto flagged = HashesDiffer(padded_hash.Unwrap(), ciphertext.P());
    if (flagged.IsErr()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(flagged).UnwrapErr());
    }

    auto x_prime = gf2::MatVecMod2(corrected, key.PrivacyAmplificationMatrix());
    if (x_prime.IsErr()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(x_prime).UnwrapErr());
    }
    auto decrypted = gf2::Xor(ciphertext.C(), x_prime.Unwrap(), key.U());
    if (decrypted.IsErr()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(std::move(decrypted).UnwrapErr());
    }
    if (expected.Size() != decrypted.Unwrap().Size()) {
        return Result<DecryptionOutcome, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Expected message has {} bits, decryption yields {}",
                               expected.Size(), decrypted.Unwrap().Size())));
    }

    const bool correct = decrypted.Unwrap() == expected;
    debug::LogDecryption(debug::Side::Receiver, r_prime, corrected, decrypted.Unwrap(), correct, flagged.Unwrap());

    return Result<DecryptionOutcome, ProtocolFailure>::Ok(DecryptionOutcome{
        .correct = correct,
        .flagged = flagged.Unwrap(),
        .decrypted = std::move(decrypted).Unwrap()
    });
}

DecryptionStatistics Decryption::DecryptResults(
    const models::MeasurementCounts& counts,
    const models::Key& key,
    const models::Ciphertext& ciphertext,
    const gf2::BitString& expected,
    const configuration::SchemeParameters& params,
    const bool error_correct) {
    DecryptionStatistics stats;
    for (const auto& [measurement, count] : counts) {
        auto bits = models::ParseOutcome(measurement);
        if (bits.IsErr()) {
            stats.failures.push_back({measurement, count, std::move(bits).UnwrapErr()});
            continue;
        }
        auto outcome = Decrypt(bits.Unwrap(), key, ciphertext, expected, params, error_correct);
        if (outcome.IsErr()) {
            stats.failures.push_back({measurement, count, std::move(outcome).UnwrapErr()});
            continue;
        }
        stats.Record(outcome.Unwrap(), count);
    }
    return stats;
}

}

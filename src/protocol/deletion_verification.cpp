#include "certdel/protocol/deletion_verification.hpp"
#include "certdel/gf2/linear_algebra.hpp"
#include "certdel/debug/key_logger.hpp"

namespace certdel::protocol {

Result<VerificationOutcome, ProtocolFailure> DeletionVerification::Verify(
    const models::Key& key,
    const gf2::BitString& certificate,
    const double delta) {
    auto restricted = key.Restrict(certificate, enums::Basis::Hadamard);
    if (restricted.IsErr()) {
        return Result<VerificationOutcome, ProtocolFailure>::Err(std::move(restricted).UnwrapErr());
    }
    auto distance = gf2::HammingDistance(key.RBar(), restricted.Unwrap());
    if (distance.IsErr()) {
        return Result<VerificationOutcome, ProtocolFailure>::Err(std::move(distance).UnwrapErr());
    }
    const size_t checked = restricted.Unwrap().Size();
    const double threshold = delta * static_cast<double>(checked);
    const bool accepted = configuration::SchemeParameters::AcceptsDistance(distance.Unwrap(), delta, checked);
    debug::LogVerification(debug::Side::Sender, restricted.Unwrap(), distance.Unwrap(), threshold, accepted);
    return Result<VerificationOutcome, ProtocolFailure>::Ok(VerificationOutcome{
        .accepted = accepted,
        .distance = distance.Unwrap()
    });
}

VerificationStatistics DeletionVerification::VerifyCounts(
    const models::MeasurementCounts& certificates,
    const models::Key& key,
    const configuration::SchemeParameters& params) {
    VerificationStatistics stats;
    for (const auto& [certificate, count] : certificates) {
        auto bits = models::ParseOutcome(certificate);
        if (bits.IsErr()) {
            stats.failures.push_back({certificate, count, std::move(bits).UnwrapErr()});
            continue;
        }
        auto outcome = Verify(key, bits.Unwrap(), params.Delta());
        if (outcome.IsErr()) {
            stats.failures.push_back({certificate, count, std::move(outcome).UnwrapErr()});
            continue;
        }
        const auto& [accepted, distance] = outcome.Unwrap();
        if (accepted) {
            stats.accepted += count;
            stats.accepted_certificates.insert(certificate);
        } else {
            stats.rejected += count;
            stats.rejected_distance_histogram[distance] += count;
        }
    }
    return stats;
}

}

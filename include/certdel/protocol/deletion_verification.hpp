#pragma once
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/models/key.hpp"
#include "certdel/models/measurement_counts.hpp"
#include "certdel/gf2/bit_string.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace certdel::protocol {

struct VerificationOutcome {
    bool accepted;
    size_t distance;
};

struct VerificationStatistics {
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    /// Hamming distance -> shots, rejected certificates only.
    std::map<size_t, uint64_t> rejected_distance_histogram;
    /// Accepted certificate strings, verbatim.
    std::set<std::string> accepted_certificates;
    models::EntryFailures failures;

    [[nodiscard]] uint64_t Total() const noexcept { return accepted + rejected; }
};

/**
 * @brief Sender side check of a deletion certificate
 *
 * The receiver measures every position in the Hadamard basis. On the k
 * Hadamard positions an honest certificate reproduces r_bar up to noise;
 * it is accepted iff its Hamming distance to r_bar is strictly below
 * delta * k.
 */
class DeletionVerification {
public:
    /**
     * @return MalformedMeasurement unless the certificate covers all m positions
     */
    [[nodiscard]] static Result<VerificationOutcome, ProtocolFailure> Verify(
        const models::Key& key,
        const gf2::BitString& certificate,
        double delta);

    [[nodiscard]] static VerificationStatistics VerifyCounts(
        const models::MeasurementCounts& certificates,
        const models::Key& key,
        const configuration::SchemeParameters& params);

    DeletionVerification() = delete;
};

}

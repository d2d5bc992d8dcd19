#include "certdel/models/measurement_counts.hpp"
#include "certdel/core/format.hpp"

namespace certdel::protocol::models {

Result<gf2::BitString, ProtocolFailure> ParseOutcome(const std::string_view outcome) {
    if (outcome.empty()) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMeasurement("Empty measurement outcome"));
    }
    auto bits = gf2::BitString::FromString(outcome);
    if (bits.IsErr()) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMeasurement(
                compat::format("Outcome '{}': {}", outcome, bits.UnwrapErr().message)));
    }
    return bits;
}

}

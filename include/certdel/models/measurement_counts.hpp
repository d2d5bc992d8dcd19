#pragma once
#include "certdel/core/failures.hpp"
#include "certdel/core/result.hpp"
#include "certdel/gf2/bit_string.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace certdel::protocol::models {

/// Outcome string -> number of shots that produced it.
using MeasurementCounts = std::map<std::string, uint64_t>;

[[nodiscard]] inline uint64_t TotalShots(const MeasurementCounts& counts) noexcept {
    uint64_t total = 0;
    for (const auto& [_, count] : counts) {
        total += count;
    }
    return total;
}

/// A histogram entry that could not be processed, with the shots it held.
struct EntryFailure {
    std::string measurement;
    uint64_t count;
    ProtocolFailure failure;
};

using EntryFailures = std::vector<EntryFailure>;

/**
 * @brief Parse one single-stage outcome string
 *
 * @return MalformedMeasurement for an empty string or any character other
 *         than '0' and '1'
 */
Result<gf2::BitString, ProtocolFailure> ParseOutcome(std::string_view outcome);

}

#pragma once
#include "certdel/models/measurement_counts.hpp"
#include "certdel/core/constants.hpp"
#include <set>
#include <string>
#include <string_view>

namespace certdel::protocol::analysis {

struct StageCounts {
    /// Re-aggregated histogram of the first-measured stage.
    models::MeasurementCounts first;
    /// Re-aggregated histogram of the second-measured stage.
    models::MeasurementCounts second;
    models::EntryFailures failures;
};

struct CorrelatedCounts {
    models::MeasurementCounts counts;
    models::EntryFailures failures;
};

/**
 * @brief Reshapes two-stage measurement histograms
 *
 * A two-stage outcome is "<first> <second>": the stages are joined by one
 * separator, first-measured stage first. Entries without exactly one
 * separator are reported as failures and excluded, so every consumed shot
 * appears once in each half.
 */
class OutcomeAggregator {
public:
    [[nodiscard]] static StageCounts SplitCounts(
        const models::MeasurementCounts& raw,
        char separator = Constants::STAGE_SEPARATOR);

    /**
     * @brief Second-stage histogram of the trials whose first stage is accepted
     */
    [[nodiscard]] static CorrelatedCounts Correlate(
        const models::MeasurementCounts& raw,
        const std::set<std::string>& accepted_first_stage,
        char separator = Constants::STAGE_SEPARATOR);

    OutcomeAggregator() = delete;
};

}

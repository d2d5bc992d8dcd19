#include "certdel/analysis/outcome_aggregator.hpp"
#include "certdel/core/format.hpp"
#include "certdel/core/result.hpp"

#include <algorithm>
#include <utility>

namespace certdel::protocol::analysis {

namespace {

using StagePair = std::pair<std::string_view, std::string_view>;

Result<StagePair, ProtocolFailure> SplitOutcome(const std::string_view outcome, const char separator) {
    const auto separators = std::count(outcome.begin(), outcome.end(), separator);
    if (separators != 1) {
        return Result<StagePair, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMeasurement(
                compat::format("{}: '{}' has {}", ErrorMessages::MISSING_STAGE_SEPARATOR, outcome, separators)));
    }
    const auto at = outcome.find(separator);
    return Result<StagePair, ProtocolFailure>::Ok(StagePair{outcome.substr(0, at), outcome.substr(at + 1)});
}

} // namespace

StageCounts OutcomeAggregator::SplitCounts(const models::MeasurementCounts& raw, const char separator) {
    StageCounts result;
    for (const auto& [outcome, count] : raw) {
        auto stages = SplitOutcome(outcome, separator);
        if (stages.IsErr()) {
            result.failures.push_back({outcome, count, std::move(stages).UnwrapErr()});
            continue;
        }
        const auto& [first, second] = stages.Unwrap();
        result.first[std::string(first)] += count;
        result.second[std::string(second)] += count;
    }
    return result;
}

CorrelatedCounts OutcomeAggregator::Correlate(
    const models::MeasurementCounts& raw,
    const std::set<std::string>& accepted_first_stage,
    const char separator) {
    CorrelatedCounts result;
    for (const auto& [outcome, count] : raw) {
        auto stages = SplitOutcome(outcome, separator);
        if (stages.IsErr()) {
            result.failures.push_back({outcome, count, std::move(stages).UnwrapErr()});
            continue;
        }
        const auto& [first, second] = stages.Unwrap();
        if (accepted_first_stage.contains(std::string(first))) {
            result.counts[std::string(second)] += count;
        }
    }
    return result;
}

}

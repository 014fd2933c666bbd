#pragma once

#include <vector>

#include "optimize/GridSearch.h"
#include "optimize/ParamSpace.h"
#include "optimize/SearchStrategy.h"
#include "optimize/TrialEvaluator.h"

namespace stratopt {
namespace optimize {

// Denominator floor for the Sharpe degradation ratio.
constexpr double kDegradationEpsilon = 0.01;

struct WalkForwardSettings {
    int in_sample_days = 0;
    int out_sample_days = 0;
    int step_days = 0;
};

// Rolls [in-sample | out-of-sample] windows across the dataset range. Ranges are
// inclusive calendar days; a window whose out-of-sample part would run past the
// dataset end is dropped. Throws InvalidArgumentError on non-positive lengths.
std::vector<core::Period> generatePeriods(const DateRange& dataset, const WalkForwardSettings& settings);

double degradation(double sharpe_in, double sharpe_out);

// Aggregates over periods with status OK; also picks the reported period.
core::WalkForwardSummary summarizePeriods(const std::vector<core::PeriodResult>& periods);

class WalkForwardSearch : public ISearchStrategy {
public:
    WalkForwardSearch(
        const ParamSpace& space,
        const TrialEvaluator& evaluator,
        WalkForwardSettings settings,
        GridLimits limits = {}
    );

    core::SearchKind kind() const override { return core::SearchKind::WALK_FORWARD; }
    ProgressTotal plannedTrials(const SearchContext& context) const override;
    SearchOutcome search(
        const SearchContext& context,
        const ProgressCallback& progress,
        const CancelToken& cancel
    ) override;

private:
    const ParamSpace& space_;
    const TrialEvaluator& evaluator_;
    WalkForwardSettings settings_;
    GridLimits limits_;
};

} // namespace optimize
} // namespace stratopt

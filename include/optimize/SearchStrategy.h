#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/OptimizationTypes.h"
#include "optimize/CancelToken.h"
#include "optimize/TrialScheduler.h"

namespace stratopt {
namespace optimize {

struct SearchContext {
    std::string strategy_id;
    std::vector<std::string> symbols;
    DateRange window;
    double capital = 0.0;
    core::RankMetric rank_metric = core::RankMetric::SHARPE;
    int concurrency = 1;
};

struct SearchOutcome {
    core::SearchKind kind = core::SearchKind::GRID;
    std::optional<core::BestResult> best;
    std::vector<core::TrialRecord> trials;            // grid / adaptive, completion order
    std::vector<core::PeriodResult> periods;          // walk-forward
    std::optional<core::WalkForwardSummary> walk_forward;
    core::TrialStatistics statistics;
    bool cancelled = false;
    bool robust = true;
};

class ISearchStrategy {
public:
    virtual ~ISearchStrategy() = default;

    virtual core::SearchKind kind() const = 0;
    // Progress denominator; std::nullopt when the search is open-ended.
    virtual ProgressTotal plannedTrials(const SearchContext& context) const = 0;
    virtual SearchOutcome search(
        const SearchContext& context,
        const ProgressCallback& progress,
        const CancelToken& cancel
    ) = 0;
};

} // namespace optimize
} // namespace stratopt

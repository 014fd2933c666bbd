#pragma once

#include <cstdint>

#include "optimize/ParamSpace.h"
#include "optimize/SearchStrategy.h"
#include "optimize/TrialEvaluator.h"

namespace stratopt {
namespace optimize {

struct GridLimits {
    std::uint64_t warn_combinations = 10000;
    std::uint64_t max_combinations = 100000;
};

// Exhaustive search over a ParamSpace. Combinations are generated lazily in
// enumeration order and ranked once every trial has finished.
class GridSearch : public ISearchStrategy {
public:
    GridSearch(const ParamSpace& space, const TrialEvaluator& evaluator, GridLimits limits = {});

    core::SearchKind kind() const override { return core::SearchKind::GRID; }
    ProgressTotal plannedTrials(const SearchContext& context) const override;

    // Throws NoViableResultError when no trial succeeded, cancelled or not.
    SearchOutcome search(
        const SearchContext& context,
        const ProgressCallback& progress,
        const CancelToken& cancel
    ) override;

    // Same as search() but reports "no viable result" as an empty best.
    SearchOutcome explore(
        const SearchContext& context,
        const ProgressCallback& progress,
        const CancelToken& cancel
    ) const;

    // Throws InvalidSpaceError above the hard ceiling, warns above the soft one.
    void checkLimits() const;

private:
    const ParamSpace& space_;
    const TrialEvaluator& evaluator_;
    GridLimits limits_;
};

} // namespace optimize
} // namespace stratopt

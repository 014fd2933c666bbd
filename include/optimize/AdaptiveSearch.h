#pragma once

#include <optional>

#include "core/contracts/ISearchBackend.h"
#include "optimize/SearchStrategy.h"
#include "optimize/TrialEvaluator.h"

namespace stratopt {
namespace optimize {

struct AdaptiveSettings {
    std::optional<int> trial_budget;
    std::optional<double> time_budget_seconds;
};

// Drives a black-box backend: suggest a batch, evaluate it through the
// scheduler, report scores back, repeat until a budget runs out.
class AdaptiveSearch : public ISearchStrategy {
public:
    // Throws InvalidArgumentError unless at least one positive budget is set.
    AdaptiveSearch(const TrialEvaluator& evaluator, core::ISearchBackend& backend, AdaptiveSettings settings);

    core::SearchKind kind() const override { return core::SearchKind::ADAPTIVE; }
    ProgressTotal plannedTrials(const SearchContext& context) const override;
    SearchOutcome search(
        const SearchContext& context,
        const ProgressCallback& progress,
        const CancelToken& cancel
    ) override;

private:
    const TrialEvaluator& evaluator_;
    core::ISearchBackend& backend_;
    AdaptiveSettings settings_;
};

} // namespace optimize
} // namespace stratopt

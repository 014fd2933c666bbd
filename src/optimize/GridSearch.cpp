#include "optimize/GridSearch.h"
#include "optimize/TrialRanking.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace stratopt {
namespace optimize {

GridSearch::GridSearch(const ParamSpace& space, const TrialEvaluator& evaluator, GridLimits limits)
    : space_(space)
    , evaluator_(evaluator)
    , limits_(limits) {}

ProgressTotal GridSearch::plannedTrials(const SearchContext&) const {
    return static_cast<std::size_t>(space_.size());
}

void GridSearch::checkLimits() const {
    const auto combinations = space_.size();
    if (combinations == 0) {
        throw InvalidSpaceError("Parameter space is empty");
    }
    if (limits_.max_combinations > 0 && combinations > limits_.max_combinations) {
        throw InvalidSpaceError(
            "Grid has " + std::to_string(combinations) + " combinations, above the limit of " +
            std::to_string(limits_.max_combinations));
    }
    if (limits_.warn_combinations > 0 && combinations > limits_.warn_combinations) {
        LOG_WARN("Large grid: {} combinations", combinations);
    }
}

SearchOutcome GridSearch::explore(
    const SearchContext& context,
    const ProgressCallback& progress,
    const CancelToken& cancel
) const {
    checkLimits();

    const std::uint64_t total = space_.size();
    std::uint64_t next_index = 0;

    TrialSource source = [&]() -> std::optional<core::Trial> {
        if (next_index >= total) {
            return std::nullopt;
        }
        core::Trial trial;
        trial.sequence = next_index;
        trial.strategy_id = context.strategy_id;
        trial.combination = space_.at(next_index);
        trial.symbols = context.symbols;
        trial.window = context.window;
        trial.capital = context.capital;
        ++next_index;
        return trial;
    };

    TrialScheduler scheduler(evaluator_);
    auto scheduled = scheduler.run(
        source,
        context.concurrency,
        static_cast<std::size_t>(total),
        progress,
        cancel
    );

    SearchOutcome outcome;
    outcome.kind = core::SearchKind::GRID;
    outcome.cancelled = scheduled.cancelled;
    outcome.trials.reserve(scheduled.completed.size());
    for (auto& done : scheduled.completed) {
        outcome.trials.push_back(core::TrialRecord{
            done.trial.sequence,
            std::move(done.trial.combination),
            done.trial.window,
            std::move(done.outcome)
        });
    }
    outcome.best = selectBest(outcome.trials, context.rank_metric);
    outcome.statistics = summarize(outcome.trials);
    return outcome;
}

SearchOutcome GridSearch::search(
    const SearchContext& context,
    const ProgressCallback& progress,
    const CancelToken& cancel
) {
    LOG_INFO("Grid search: strategy={} combinations={} window={}..{}",
             context.strategy_id, space_.size(), context.window.start, context.window.end);

    auto outcome = explore(context, progress, cancel);
    if (!outcome.best) {
        throw NoViableResultError(
            "Grid search produced no successful trial out of " +
            std::to_string(outcome.trials.size()) +
            (outcome.cancelled ? " (cancelled)" : ""));
    }

    LOG_INFO("Grid search done: {}/{} succeeded, best {} = {:.4f}{}",
             outcome.statistics.succeeded, outcome.statistics.total,
             core::toString(context.rank_metric),
             outcome.best->metrics.value(context.rank_metric),
             outcome.cancelled ? " (cancelled)" : "");
    return outcome;
}

} // namespace optimize
} // namespace stratopt

#include "optimize/AdaptiveSearch.h"
#include "optimize/TrialRanking.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>

namespace stratopt {
namespace optimize {

AdaptiveSearch::AdaptiveSearch(
    const TrialEvaluator& evaluator,
    core::ISearchBackend& backend,
    AdaptiveSettings settings
)
    : evaluator_(evaluator)
    , backend_(backend)
    , settings_(settings) {
    if (!settings_.trial_budget && !settings_.time_budget_seconds) {
        throw InvalidArgumentError("Adaptive search requires a trial budget or a time budget");
    }
    if (settings_.trial_budget && *settings_.trial_budget <= 0) {
        throw InvalidArgumentError("trial_budget must be > 0");
    }
    if (settings_.time_budget_seconds && *settings_.time_budget_seconds <= 0.0) {
        throw InvalidArgumentError("time_budget_seconds must be > 0");
    }
}

ProgressTotal AdaptiveSearch::plannedTrials(const SearchContext&) const {
    if (settings_.trial_budget) {
        return static_cast<std::size_t>(*settings_.trial_budget);
    }
    return std::nullopt;
}

SearchOutcome AdaptiveSearch::search(
    const SearchContext& context,
    const ProgressCallback& progress,
    const CancelToken& cancel
) {
    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    const ProgressTotal total = plannedTrials(context);

    auto timeExpired = [&]() {
        if (!settings_.time_budget_seconds) {
            return false;
        }
        const double elapsed = std::chrono::duration<double>(Clock::now() - started).count();
        return elapsed >= *settings_.time_budget_seconds;
    };

    LOG_INFO("Adaptive search: strategy={} trial_budget={} time_budget={}s",
             context.strategy_id,
             settings_.trial_budget ? *settings_.trial_budget : -1,
             settings_.time_budget_seconds ? *settings_.time_budget_seconds : -1.0);

    SearchOutcome outcome;
    outcome.kind = core::SearchKind::ADAPTIVE;
    TrialScheduler scheduler(evaluator_);
    std::uint64_t submitted = 0;

    while (true) {
        if (cancel.isCancelled()) {
            outcome.cancelled = true;
            break;
        }
        if (settings_.trial_budget && submitted >= static_cast<std::uint64_t>(*settings_.trial_budget)) {
            break;
        }
        if (timeExpired()) {
            break;
        }

        std::uint64_t batch_size = static_cast<std::uint64_t>(std::max(1, context.concurrency));
        if (settings_.trial_budget) {
            batch_size = std::min<std::uint64_t>(batch_size, *settings_.trial_budget - submitted);
        }

        std::vector<core::Trial> batch;
        batch.reserve(batch_size);
        for (std::uint64_t i = 0; i < batch_size; ++i) {
            core::Trial trial;
            trial.sequence = submitted + i;
            trial.strategy_id = context.strategy_id;
            trial.combination = backend_.suggest();
            trial.symbols = context.symbols;
            trial.window = context.window;
            trial.capital = context.capital;
            batch.push_back(std::move(trial));
        }

        std::size_t cursor = 0;
        TrialSource source = [&]() -> std::optional<core::Trial> {
            if (cursor >= batch.size()) {
                return std::nullopt;
            }
            return batch[cursor++];
        };

        const std::size_t completed_before = outcome.trials.size();
        ProgressCallback batch_progress;
        if (progress) {
            batch_progress = [&progress, &total, completed_before](std::size_t done, ProgressTotal) {
                progress(completed_before + done, total);
            };
        }

        auto scheduled = scheduler.run(source, context.concurrency, batch.size(), batch_progress, cancel);
        submitted += batch_size;

        // Report in suggestion order so a deterministic backend stays deterministic.
        std::sort(scheduled.completed.begin(), scheduled.completed.end(),
                  [](const CompletedTrial& a, const CompletedTrial& b) {
                      return a.trial.sequence < b.trial.sequence;
                  });
        for (auto& done : scheduled.completed) {
            backend_.report(done.trial.combination, scoreOf(done.outcome, context.rank_metric));
            outcome.trials.push_back(core::TrialRecord{
                done.trial.sequence,
                std::move(done.trial.combination),
                done.trial.window,
                std::move(done.outcome)
            });
        }

        if (scheduled.cancelled) {
            outcome.cancelled = true;
            break;
        }
    }

    outcome.best = selectBest(outcome.trials, context.rank_metric);
    outcome.statistics = summarize(outcome.trials);
    if (!outcome.best) {
        throw NoViableResultError(
            "Adaptive search produced no successful trial out of " +
            std::to_string(outcome.trials.size()) +
            (outcome.cancelled ? " (cancelled)" : ""));
    }

    LOG_INFO("Adaptive search done: {}/{} succeeded, best {} = {:.4f}",
             outcome.statistics.succeeded, outcome.statistics.total,
             core::toString(context.rank_metric),
             outcome.best->metrics.value(context.rank_metric));
    return outcome;
}

} // namespace optimize
} // namespace stratopt

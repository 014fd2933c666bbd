#include "optimize/WalkForwardSearch.h"
#include "optimize/TrialRanking.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace stratopt {
namespace optimize {

namespace {
double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const std::size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

core::PeriodResult makePeriodResult(const core::Period& period) {
    core::PeriodResult result;
    result.period = period;
    return result;
}
}

std::vector<core::Period> generatePeriods(const DateRange& dataset, const WalkForwardSettings& settings) {
    if (settings.in_sample_days <= 0 || settings.out_sample_days <= 0 || settings.step_days <= 0) {
        throw InvalidArgumentError("walk_forward in_sample_days, out_sample_days and step_days must be > 0");
    }

    const long long first = utils::DateUtils::toEpochDay(dataset.start);
    const long long last = utils::DateUtils::toEpochDay(dataset.end);
    if (first > last) {
        throw InvalidArgumentError("Dataset range starts after it ends: " + dataset.start + ".." + dataset.end);
    }

    std::vector<core::Period> periods;
    for (long long start = first;; start += settings.step_days) {
        const long long in_end = start + settings.in_sample_days - 1;
        const long long out_start = in_end + 1;
        const long long out_end = out_start + settings.out_sample_days - 1;
        if (out_end > last) {
            break;
        }

        core::Period period;
        period.index = static_cast<int>(periods.size());
        period.in_sample = DateRange{utils::DateUtils::fromEpochDay(start), utils::DateUtils::fromEpochDay(in_end)};
        period.out_of_sample = DateRange{utils::DateUtils::fromEpochDay(out_start), utils::DateUtils::fromEpochDay(out_end)};
        periods.push_back(std::move(period));
    }
    return periods;
}

double degradation(double sharpe_in, double sharpe_out) {
    return (sharpe_in - sharpe_out) / std::max(std::fabs(sharpe_in), kDegradationEpsilon);
}

core::WalkForwardSummary summarizePeriods(const std::vector<core::PeriodResult>& periods) {
    core::WalkForwardSummary summary;

    std::vector<double> degradations;
    double sum_in = 0.0;
    double sum_out = 0.0;
    int positive = 0;

    const core::PeriodResult* robust_best = nullptr;
    const core::PeriodResult* fallback_best = nullptr;

    for (const auto& p : periods) {
        if (p.status != core::PeriodStatus::OK) {
            ++summary.failed_periods;
            continue;
        }
        ++summary.successful_periods;
        degradations.push_back(p.degradation);

        const double in_sharpe = p.in_sample_best->metrics.sharpe_ratio;
        const double out_sharpe = p.out_of_sample_metrics->sharpe_ratio;
        sum_in += in_sharpe;
        sum_out += out_sharpe;

        if (fallback_best == nullptr || out_sharpe > fallback_best->out_of_sample_metrics->sharpe_ratio) {
            fallback_best = &p;
        }
        if (out_sharpe > 0.0) {
            ++positive;
            if (robust_best == nullptr ||
                p.degradation < robust_best->degradation ||
                (p.degradation == robust_best->degradation &&
                 out_sharpe > robust_best->out_of_sample_metrics->sharpe_ratio)) {
                robust_best = &p;
            }
        }
    }

    if (summary.successful_periods > 0) {
        const double n = static_cast<double>(summary.successful_periods);
        double sum_deg = 0.0;
        for (double d : degradations) {
            sum_deg += d;
        }
        summary.mean_degradation = sum_deg / n;
        summary.median_degradation = median(degradations);
        summary.mean_in_sample_sharpe = sum_in / n;
        summary.mean_out_of_sample_sharpe = sum_out / n;
        summary.positive_out_of_sample_fraction = positive / n;
    }

    summary.robust = robust_best != nullptr;
    if (robust_best) {
        summary.best_period = robust_best->period.index;
    } else if (fallback_best) {
        summary.best_period = fallback_best->period.index;
    }
    return summary;
}

WalkForwardSearch::WalkForwardSearch(
    const ParamSpace& space,
    const TrialEvaluator& evaluator,
    WalkForwardSettings settings,
    GridLimits limits
)
    : space_(space)
    , evaluator_(evaluator)
    , settings_(settings)
    , limits_(limits) {}

ProgressTotal WalkForwardSearch::plannedTrials(const SearchContext& context) const {
    const auto periods = generatePeriods(context.window, settings_);
    const std::uint64_t per_period = space_.size();
    if (per_period == std::numeric_limits<std::uint64_t>::max()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(periods.size() * (per_period + 1));
}

SearchOutcome WalkForwardSearch::search(
    const SearchContext& context,
    const ProgressCallback& progress,
    const CancelToken& cancel
) {
    const auto periods = generatePeriods(context.window, settings_);
    if (periods.empty()) {
        throw InvalidArgumentError(
            "Range " + context.window.start + ".." + context.window.end +
            " is shorter than one walk-forward window");
    }

    GridSearch grid(space_, evaluator_, limits_);
    grid.checkLimits();

    const ProgressTotal total = plannedTrials(context);
    std::size_t completed_before = 0;

    LOG_INFO("Walk-forward: strategy={} periods={} combinations/period={}",
             context.strategy_id, periods.size(), space_.size());

    SearchOutcome outcome;
    outcome.kind = core::SearchKind::WALK_FORWARD;
    std::vector<core::TrialRecord> all_trials;

    for (const auto& period : periods) {
        auto result = makePeriodResult(period);

        if (cancel.isCancelled()) {
            result.status = core::PeriodStatus::CANCELLED;
            result.message = "cancelled before the period started";
            outcome.periods.push_back(std::move(result));
            outcome.cancelled = true;
            break;
        }

        SearchContext in_ctx = context;
        in_ctx.window = period.in_sample;

        ProgressCallback period_progress;
        if (progress) {
            period_progress = [&progress, &total, completed_before](std::size_t done, ProgressTotal) {
                progress(completed_before + done, total);
            };
        }

        auto in_sample = grid.explore(in_ctx, period_progress, cancel);
        completed_before += in_sample.trials.size();
        result.in_sample_trials = std::move(in_sample.trials);
        result.in_sample_best = in_sample.best;
        all_trials.insert(all_trials.end(), result.in_sample_trials.begin(), result.in_sample_trials.end());

        if (in_sample.cancelled) {
            result.status = core::PeriodStatus::CANCELLED;
            result.message = "cancelled during in-sample search";
            outcome.periods.push_back(std::move(result));
            outcome.cancelled = true;
            break;
        }
        if (!result.in_sample_best) {
            result.status = core::PeriodStatus::IN_SAMPLE_FAILED;
            result.message = "no successful in-sample trial out of " +
                             std::to_string(result.in_sample_trials.size());
            LOG_WARN("Walk-forward period {} failed in-sample", period.index);
            outcome.periods.push_back(std::move(result));
            continue;
        }
        if (cancel.isCancelled()) {
            result.status = core::PeriodStatus::CANCELLED;
            result.message = "cancelled before out-of-sample validation";
            outcome.periods.push_back(std::move(result));
            outcome.cancelled = true;
            break;
        }

        core::Trial oos_trial;
        oos_trial.sequence = result.in_sample_best->sequence;
        oos_trial.strategy_id = context.strategy_id;
        oos_trial.combination = result.in_sample_best->combination;
        oos_trial.symbols = context.symbols;
        oos_trial.window = period.out_of_sample;
        oos_trial.capital = context.capital;

        auto oos = evaluator_.evaluate(oos_trial);
        ++completed_before;
        if (progress) {
            progress(completed_before, total);
        }
        all_trials.push_back(core::TrialRecord{oos_trial.sequence, oos_trial.combination, oos_trial.window, oos});

        if (!oos.ok()) {
            result.status = core::PeriodStatus::OUT_OF_SAMPLE_FAILED;
            result.message = core::toString(*oos.failureReason()) + ": " + oos.message();
            LOG_WARN("Walk-forward period {} failed out-of-sample: {}", period.index, result.message);
            outcome.periods.push_back(std::move(result));
            continue;
        }

        result.status = core::PeriodStatus::OK;
        result.out_of_sample_metrics = oos.metrics();
        result.degradation = degradation(result.in_sample_best->metrics.sharpe_ratio, oos.metrics().sharpe_ratio);
        LOG_INFO("Walk-forward period {}: sharpe in={:.4f} out={:.4f} degradation={:.4f}",
                 period.index, result.in_sample_best->metrics.sharpe_ratio,
                 oos.metrics().sharpe_ratio, result.degradation);
        outcome.periods.push_back(std::move(result));
    }

    const auto summary = summarizePeriods(outcome.periods);
    outcome.walk_forward = summary;
    outcome.robust = summary.robust;
    outcome.statistics = summarize(all_trials);

    // The reported winner carries the validated (out-of-sample) metrics.
    if (summary.best_period) {
        for (const auto& p : outcome.periods) {
            if (p.period.index == *summary.best_period) {
                outcome.best = core::BestResult{
                    p.in_sample_best->combination,
                    *p.out_of_sample_metrics,
                    p.in_sample_best->sequence
                };
                break;
            }
        }
    }

    if (!summary.robust) {
        LOG_WARN("Walk-forward: no period with positive out-of-sample Sharpe ({} ok, {} failed)",
                 summary.successful_periods, summary.failed_periods);
    }
    return outcome;
}

} // namespace optimize
} // namespace stratopt

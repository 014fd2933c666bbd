#include "optimize/TrialEvaluator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>
#include <future>
#include <sstream>
#include <thread>

namespace stratopt {
namespace optimize {

namespace {
using Clock = std::chrono::steady_clock;

double elapsedSince(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

core::MetricsRecord runEvaluator(
    const std::shared_ptr<core::IBacktestEvaluator>& evaluator,
    const core::Trial& trial
) {
    return evaluator->evaluate(
        trial.strategy_id,
        trial.combination,
        trial.symbols,
        trial.window.start,
        trial.window.end,
        trial.capital
    );
}
}

TrialEvaluator::TrialEvaluator(std::shared_ptr<core::IBacktestEvaluator> evaluator)
    : TrialEvaluator(std::move(evaluator), Options{}) {}

TrialEvaluator::TrialEvaluator(std::shared_ptr<core::IBacktestEvaluator> evaluator, Options options)
    : evaluator_(std::move(evaluator))
    , options_(options)
    , abandoned_(std::make_shared<std::atomic<int>>(0)) {
    if (!evaluator_) {
        throw InvalidArgumentError("TrialEvaluator requires an evaluator");
    }
    if (options_.timeout_ms < 0) {
        throw InvalidArgumentError("trial timeout must be >= 0");
    }
}

core::TrialOutcome TrialEvaluator::evaluate(const core::Trial& trial) const {
    const auto started = Clock::now();

    try {
        if (options_.timeout_ms <= 0) {
            const auto metrics = runEvaluator(evaluator_, trial);
            return classify(metrics, elapsedSince(started));
        }

        // The evaluator cannot be interrupted; a timed-out call keeps running on
        // its own thread and its result is discarded.
        auto evaluator = evaluator_;
        auto task = std::make_shared<std::packaged_task<core::MetricsRecord()>>(
            [evaluator, trial]() { return runEvaluator(evaluator, trial); }
        );
        auto future = task->get_future();
        auto timed_out = std::make_shared<std::atomic<bool>>(false);
        auto abandoned = abandoned_;
        std::thread([task, timed_out, abandoned]() {
            (*task)();
            if (timed_out->exchange(true)) {
                abandoned->fetch_sub(1);
            }
        }).detach();

        if (future.wait_for(std::chrono::milliseconds(options_.timeout_ms)) == std::future_status::timeout &&
            !timed_out->exchange(true)) {
            const int live = abandoned_->fetch_add(1) + 1;
            LOG_WARN("Trial {} ({}) exceeded {} ms; abandoning the call ({} still running)",
                     trial.sequence, trial.combination.toString(), options_.timeout_ms, live);
            std::ostringstream oss;
            oss << "evaluation exceeded " << options_.timeout_ms << " ms";
            return core::TrialOutcome::failure(core::FailureReason::TIMEOUT, oss.str(), elapsedSince(started));
        }
        const auto metrics = future.get();
        return classify(metrics, elapsedSince(started));

    } catch (const std::exception& e) {
        return core::TrialOutcome::failure(
            core::FailureReason::EVALUATOR_ERROR, e.what(), elapsedSince(started));
    } catch (...) {
        return core::TrialOutcome::failure(
            core::FailureReason::EVALUATOR_ERROR, "unknown evaluator error", elapsedSince(started));
    }
}

core::TrialOutcome TrialEvaluator::classify(const core::MetricsRecord& metrics, double elapsed_ms) const {
    const bool finite = std::isfinite(metrics.sharpe_ratio) &&
                        std::isfinite(metrics.total_return) &&
                        std::isfinite(metrics.max_drawdown) &&
                        std::isfinite(metrics.win_rate);
    if (!finite) {
        return core::TrialOutcome::failure(
            core::FailureReason::INVALID_METRIC, "non-finite metric value", elapsed_ms);
    }
    if (metrics.trade_count < 0) {
        return core::TrialOutcome::failure(
            core::FailureReason::INVALID_METRIC, "negative trade count", elapsed_ms);
    }

    if (options_.min_trades && metrics.trade_count < *options_.min_trades) {
        std::ostringstream oss;
        oss << "trade_count " << metrics.trade_count << " < min_trades " << *options_.min_trades;
        return core::TrialOutcome::failure(core::FailureReason::SCREENED_OUT, oss.str(), elapsed_ms);
    }
    if (options_.max_loss_pct && metrics.total_return < -*options_.max_loss_pct) {
        std::ostringstream oss;
        oss << "total_return " << metrics.total_return << " below loss limit -" << *options_.max_loss_pct;
        return core::TrialOutcome::failure(core::FailureReason::SCREENED_OUT, oss.str(), elapsed_ms);
    }

    return core::TrialOutcome::success(metrics, elapsed_ms);
}

} // namespace optimize
} // namespace stratopt

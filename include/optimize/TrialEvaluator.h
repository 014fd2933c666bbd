#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include "core/contracts/IBacktestEvaluator.h"
#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace optimize {

// Adapter between the search layer and the external backtest. Every call
// returns a TrialOutcome; evaluator exceptions, hangs and garbage metrics are
// turned into typed failures and never propagate.
//
// A timed-out call cannot be interrupted: it keeps running on a detached
// thread and its result is discarded. Hung evaluators therefore add live calls
// beyond the scheduler's concurrency bound, and may still be running at process
// exit. abandonedCalls() reports how many such calls are still in flight.
class TrialEvaluator {
public:
    struct Options {
        long long timeout_ms = 0;              // 0 = wait indefinitely
        std::optional<int> min_trades;         // screen out thinly traded results
        std::optional<double> max_loss_pct;    // screen out total_return < -max_loss_pct
    };

    explicit TrialEvaluator(std::shared_ptr<core::IBacktestEvaluator> evaluator);
    TrialEvaluator(std::shared_ptr<core::IBacktestEvaluator> evaluator, Options options);

    core::TrialOutcome evaluate(const core::Trial& trial) const;

    const Options& options() const { return options_; }

    int abandonedCalls() const { return abandoned_->load(); }

private:
    core::TrialOutcome classify(const core::MetricsRecord& metrics, double elapsed_ms) const;

    std::shared_ptr<core::IBacktestEvaluator> evaluator_;
    Options options_;
    std::shared_ptr<std::atomic<int>> abandoned_;
};

} // namespace optimize
} // namespace stratopt

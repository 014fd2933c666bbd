#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "common/Types.h"
#include "core/model/OptimizationTypes.h"
#include "optimize/CancelToken.h"
#include "optimize/TrialEvaluator.h"

namespace stratopt {
namespace optimize {

// Lazy trial source. Returns std::nullopt once exhausted. Called under the
// scheduler's queue lock, so it never needs its own synchronization.
using TrialSource = std::function<std::optional<core::Trial>()>;

// Invoked serially after every finished trial.
using ProgressCallback = std::function<void(std::size_t completed, ProgressTotal total)>;

struct CompletedTrial {
    core::Trial trial;
    core::TrialOutcome outcome;
};

struct ScheduleResult {
    std::vector<CompletedTrial> completed;   // completion order
    bool cancelled = false;
};

class TrialScheduler {
public:
    explicit TrialScheduler(const TrialEvaluator& evaluator);

    ScheduleResult run(
        const TrialSource& source,
        int concurrency,
        ProgressTotal total,
        const ProgressCallback& progress,
        const CancelToken& cancel
    ) const;

    // 0 maps to hardware parallelism (at least 1).
    static int resolveConcurrency(int requested);

private:
    const TrialEvaluator& evaluator_;
};

} // namespace optimize
} // namespace stratopt

#pragma once

#include <memory>

#include "core/contracts/IBacktestEvaluator.h"
#include "core/contracts/IResultsStore.h"
#include "core/contracts/ISearchBackend.h"
#include "core/model/OptimizationTypes.h"
#include "optimize/CancelToken.h"
#include "optimize/OptimizationRequest.h"
#include "optimize/TrialScheduler.h"

namespace stratopt {
namespace optimize {

// Entry point: request -> search strategy -> scheduler -> evaluator, then
// persists the finished run. Runs that end without a viable result throw
// NoViableResultError and are not saved.
class Optimizer {
public:
    // backend is used for adaptive requests; without one a seeded random
    // sampler over the request's grid is created per run.
    Optimizer(
        std::shared_ptr<core::IBacktestEvaluator> evaluator,
        std::shared_ptr<core::IResultsStore> store,
        std::shared_ptr<core::ISearchBackend> backend = nullptr
    );

    core::RunRecord run(const OptimizationRequest& request);
    core::RunRecord run(
        const OptimizationRequest& request,
        const ProgressCallback& progress,
        const CancelToken& cancel
    );

private:
    std::shared_ptr<core::IBacktestEvaluator> evaluator_;
    std::shared_ptr<core::IResultsStore> store_;
    std::shared_ptr<core::ISearchBackend> backend_;
};

} // namespace optimize
} // namespace stratopt

#include "optimize/Optimizer.h"
#include "optimize/AdaptiveSearch.h"
#include "optimize/GridSearch.h"
#include "optimize/ParamSpace.h"
#include "optimize/RandomSearchBackend.h"
#include "optimize/TrialEvaluator.h"
#include "optimize/WalkForwardSearch.h"
#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace stratopt {
namespace optimize {

Optimizer::Optimizer(
    std::shared_ptr<core::IBacktestEvaluator> evaluator,
    std::shared_ptr<core::IResultsStore> store,
    std::shared_ptr<core::ISearchBackend> backend
)
    : evaluator_(std::move(evaluator))
    , store_(std::move(store))
    , backend_(std::move(backend)) {
    if (!evaluator_ || !store_) {
        throw InvalidArgumentError("Optimizer requires an evaluator and a results store");
    }
}

core::RunRecord Optimizer::run(const OptimizationRequest& request) {
    CancelToken never_cancelled;
    return run(request, ProgressCallback(), never_cancelled);
}

core::RunRecord Optimizer::run(
    const OptimizationRequest& request,
    const ProgressCallback& progress,
    const CancelToken& cancel
) {
    request.validate();
    const auto& config = Config::getInstance();

    const ParamSpace space = ParamSpace::fromJson(request.param_grid);

    TrialEvaluator::Options options;
    options.timeout_ms = request.trial_timeout_ms.value_or(config.getTrialTimeoutMs());
    options.min_trades = request.min_trades;
    options.max_loss_pct = request.max_loss_pct;
    const TrialEvaluator evaluator(evaluator_, options);

    GridLimits limits;
    limits.warn_combinations = config.getGridWarnCombinations();
    limits.max_combinations = config.getGridMaxCombinations();

    SearchContext context;
    context.strategy_id = request.strategy_id;
    context.symbols = request.symbols;
    context.window = request.period;
    context.capital = request.capital;
    context.rank_metric = request.rank_metric;
    context.concurrency = TrialScheduler::resolveConcurrency(
        request.concurrency > 0 ? request.concurrency : config.getDefaultConcurrency());

    std::unique_ptr<ISearchStrategy> strategy;
    std::unique_ptr<RandomSearchBackend> own_backend;
    switch (request.search) {
        case core::SearchKind::GRID:
            strategy = std::make_unique<GridSearch>(space, evaluator, limits);
            break;
        case core::SearchKind::WALK_FORWARD:
            strategy = std::make_unique<WalkForwardSearch>(space, evaluator, request.walk_forward, limits);
            break;
        case core::SearchKind::ADAPTIVE: {
            core::ISearchBackend* backend = backend_.get();
            if (backend == nullptr) {
                own_backend = std::make_unique<RandomSearchBackend>(space, request.seed);
                backend = own_backend.get();
            }
            strategy = std::make_unique<AdaptiveSearch>(evaluator, *backend, request.adaptive);
            break;
        }
    }

    LOG_INFO("Optimization started: strategy={} search={} rank={} concurrency={} symbols={}",
             request.strategy_id, core::toString(request.search), core::toString(request.rank_metric),
             context.concurrency, request.symbols.size());

    auto outcome = strategy->search(context, progress, cancel);

    core::RunRecord record;
    record.created_at_ms = utils::DateUtils::nowMs();
    record.created_at = utils::DateUtils::toIsoUtc(record.created_at_ms);
    record.strategy_id = request.strategy_id;
    record.search_kind = outcome.kind;
    record.rank_metric = request.rank_metric;
    record.config = request.toJson();
    record.symbols = request.symbols;
    record.window = request.period;
    record.best = std::move(outcome.best);
    record.trials = std::move(outcome.trials);
    record.periods = std::move(outcome.periods);
    record.walk_forward = std::move(outcome.walk_forward);
    record.statistics = outcome.statistics;
    record.cancelled = outcome.cancelled;
    record.robust = outcome.robust;

    try {
        record.run_id = store_->save(record);
    } catch (const StorageError& e) {
        LOG_ERROR("Failed to persist {} run for {}: {}",
                  core::toString(record.search_kind), record.strategy_id, e.what());
        throw;
    }

    const double best_sharpe = record.best ? record.best->metrics.sharpe_ratio : 0.0;
    Logger::getInstance().logRun(record.run_id, record.strategy_id, core::toString(record.search_kind),
                                 best_sharpe, record.statistics.total);
    LOG_INFO("Optimization finished: run_id={} trials={} best_sharpe={:.4f}{}",
             record.run_id, record.statistics.total, best_sharpe,
             record.cancelled ? " (cancelled)" : "");
    return record;
}

} // namespace optimize
} // namespace stratopt

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/model/OptimizationTypes.h"
#include "optimize/AdaptiveSearch.h"
#include "optimize/WalkForwardSearch.h"

namespace stratopt {
namespace optimize {

// Validated optimization input. Built from the JSON request format:
//
// {
//   "strategy": "MovingAverage", "symbols": ["SPY"],
//   "period": {"start": "2020-01-01", "end": "2023-12-31"}, "capital": 100000,
//   "param_grid": {"fast": [5, 10], "slow": {"type": "int", "low": 20, "high": 60, "step": 10}},
//   "search": "grid" | "walk_forward" | "adaptive", "rank_metric": "sharpe",
//   "concurrency": 4, "trial_timeout_ms": 30000,
//   "walk_forward": {"in_sample_days": 252, "out_sample_days": 63, "step_days": 63},
//   "adaptive": {"trial_budget": 100, "time_budget_seconds": 600, "seed": 42},
//   "screening": {"min_trades": 10, "max_loss_pct": 0.5}
// }
struct OptimizationRequest {
    std::string name;
    std::string description;
    std::string strategy_id;
    std::vector<std::string> symbols;
    DateRange period;
    double capital = 100000.0;
    nlohmann::json param_grid = nlohmann::json::object();

    core::SearchKind search = core::SearchKind::GRID;
    core::RankMetric rank_metric = core::RankMetric::SHARPE;
    int concurrency = 0;                         // 0 = configured default
    std::optional<long long> trial_timeout_ms;   // absent = configured default

    WalkForwardSettings walk_forward;
    AdaptiveSettings adaptive;
    unsigned seed = 42;

    std::optional<int> min_trades;
    std::optional<double> max_loss_pct;

    // Throws InvalidArgumentError on bad fields, InvalidSpaceError on a bad grid.
    static OptimizationRequest fromJson(const nlohmann::json& raw);
    nlohmann::json toJson() const;
    void validate() const;
};

} // namespace optimize
} // namespace stratopt

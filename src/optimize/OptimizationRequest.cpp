#include "optimize/OptimizationRequest.h"
#include "optimize/ParamSpace.h"
#include "common/DateUtils.h"
#include "common/Errors.h"

namespace stratopt {
namespace optimize {

OptimizationRequest OptimizationRequest::fromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw InvalidArgumentError("Optimization request must be a JSON object");
    }

    OptimizationRequest req;
    try {
        req.name = raw.value("name", std::string());
        req.description = raw.value("description", std::string());
        req.strategy_id = raw.value("strategy", std::string());
        if (raw.contains("symbols")) {
            req.symbols = raw["symbols"].get<std::vector<std::string>>();
        }
        if (raw.contains("period")) {
            const auto& p = raw["period"];
            req.period.start = p.value("start", std::string());
            req.period.end = p.value("end", std::string());
        }
        req.capital = raw.value("capital", 100000.0);
        req.param_grid = raw.value("param_grid", nlohmann::json::object());
        req.search = core::searchKindFromString(raw.value("search", std::string("grid")));
        req.rank_metric = core::rankMetricFromString(raw.value("rank_metric", std::string("sharpe")));
        req.concurrency = raw.value("concurrency", 0);
        if (raw.contains("trial_timeout_ms") && !raw["trial_timeout_ms"].is_null()) {
            req.trial_timeout_ms = raw["trial_timeout_ms"].get<long long>();
        }

        if (raw.contains("walk_forward")) {
            const auto& wf = raw["walk_forward"];
            req.walk_forward.in_sample_days = wf.value("in_sample_days", 0);
            req.walk_forward.out_sample_days = wf.value("out_sample_days", 0);
            req.walk_forward.step_days = wf.value("step_days", req.walk_forward.out_sample_days);
        }

        if (raw.contains("adaptive")) {
            const auto& a = raw["adaptive"];
            if (a.contains("trial_budget") && !a["trial_budget"].is_null()) {
                req.adaptive.trial_budget = a["trial_budget"].get<int>();
            }
            if (a.contains("time_budget_seconds") && !a["time_budget_seconds"].is_null()) {
                req.adaptive.time_budget_seconds = a["time_budget_seconds"].get<double>();
            }
            req.seed = a.value("seed", 42u);
        }

        if (raw.contains("screening")) {
            const auto& s = raw["screening"];
            if (s.contains("min_trades") && !s["min_trades"].is_null()) {
                req.min_trades = s["min_trades"].get<int>();
            }
            if (s.contains("max_loss_pct") && !s["max_loss_pct"].is_null()) {
                req.max_loss_pct = s["max_loss_pct"].get<double>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("Malformed optimization request: ") + e.what());
    }

    req.validate();
    return req;
}

void OptimizationRequest::validate() const {
    if (strategy_id.empty()) {
        throw InvalidArgumentError("Request has no strategy");
    }
    if (symbols.empty()) {
        throw InvalidArgumentError("Request has no symbols");
    }
    if (!utils::DateUtils::isValidDate(period.start) || !utils::DateUtils::isValidDate(period.end)) {
        throw InvalidArgumentError("Request period must be ISO dates, got '" + period.start +
                                   "'..'" + period.end + "'");
    }
    if (utils::DateUtils::toEpochDay(period.start) > utils::DateUtils::toEpochDay(period.end)) {
        throw InvalidArgumentError("Request period starts after it ends");
    }
    if (!(capital > 0.0)) {
        throw InvalidArgumentError("capital must be > 0");
    }
    if (concurrency < 0) {
        throw InvalidArgumentError("concurrency must be >= 0");
    }
    if (trial_timeout_ms && *trial_timeout_ms < 0) {
        throw InvalidArgumentError("trial_timeout_ms must be >= 0");
    }
    if (min_trades && *min_trades < 0) {
        throw InvalidArgumentError("screening.min_trades must be >= 0");
    }
    if (max_loss_pct && !(*max_loss_pct >= 0.0)) {
        throw InvalidArgumentError("screening.max_loss_pct must be >= 0");
    }

    // Raises InvalidSpaceError for malformed grids.
    ParamSpace::fromJson(param_grid);

    if (search == core::SearchKind::WALK_FORWARD) {
        if (walk_forward.in_sample_days <= 0 || walk_forward.out_sample_days <= 0 ||
            walk_forward.step_days <= 0) {
            throw InvalidArgumentError(
                "walk_forward requires positive in_sample_days, out_sample_days and step_days");
        }
    }
    if (search == core::SearchKind::ADAPTIVE) {
        if (!adaptive.trial_budget && !adaptive.time_budget_seconds) {
            throw InvalidArgumentError("adaptive search requires trial_budget or time_budget_seconds");
        }
        if (adaptive.trial_budget && *adaptive.trial_budget <= 0) {
            throw InvalidArgumentError("adaptive.trial_budget must be > 0");
        }
        if (adaptive.time_budget_seconds && !(*adaptive.time_budget_seconds > 0.0)) {
            throw InvalidArgumentError("adaptive.time_budget_seconds must be > 0");
        }
    }
}

nlohmann::json OptimizationRequest::toJson() const {
    nlohmann::json out;
    out["name"] = name;
    out["description"] = description;
    out["strategy"] = strategy_id;
    out["symbols"] = symbols;
    out["period"] = {{"start", period.start}, {"end", period.end}};
    out["capital"] = capital;
    out["param_grid"] = param_grid;
    out["search"] = core::toString(search);
    out["rank_metric"] = core::toString(rank_metric);
    out["concurrency"] = concurrency;
    out["trial_timeout_ms"] = trial_timeout_ms ? nlohmann::json(*trial_timeout_ms) : nlohmann::json(nullptr);

    if (search == core::SearchKind::WALK_FORWARD) {
        out["walk_forward"] = {
            {"in_sample_days", walk_forward.in_sample_days},
            {"out_sample_days", walk_forward.out_sample_days},
            {"step_days", walk_forward.step_days}
        };
    }
    if (search == core::SearchKind::ADAPTIVE) {
        out["adaptive"] = {
            {"trial_budget", adaptive.trial_budget ? nlohmann::json(*adaptive.trial_budget) : nlohmann::json(nullptr)},
            {"time_budget_seconds", adaptive.time_budget_seconds
                ? nlohmann::json(*adaptive.time_budget_seconds) : nlohmann::json(nullptr)},
            {"seed", seed}
        };
    }
    out["screening"] = {
        {"min_trades", min_trades ? nlohmann::json(*min_trades) : nlohmann::json(nullptr)},
        {"max_loss_pct", max_loss_pct ? nlohmann::json(*max_loss_pct) : nlohmann::json(nullptr)}
    };
    return out;
}

} // namespace optimize
} // namespace stratopt

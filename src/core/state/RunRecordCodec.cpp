#include "core/state/RunRecordCodec.h"
#include "common/Errors.h"

namespace stratopt {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;

nlohmann::json optionalDouble(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

std::optional<double> readOptionalDouble(const nlohmann::json& raw, const char* key) {
    if (!raw.contains(key) || raw[key].is_null()) {
        return std::nullopt;
    }
    return raw[key].get<double>();
}

nlohmann::json bestToJson(const BestResult& best) {
    nlohmann::json out;
    out["params"] = best.combination.toJson();
    out["metrics"] = RunRecordCodec::toJson(best.metrics);
    out["sequence"] = best.sequence;
    return out;
}

BestResult bestFromJson(const nlohmann::json& raw) {
    BestResult best;
    best.combination = ParameterCombination::fromJson(raw.at("params"));
    best.metrics = RunRecordCodec::metricsFromJson(raw.at("metrics"));
    best.sequence = raw.value("sequence", static_cast<std::uint64_t>(0));
    return best;
}

std::vector<std::string> readStrings(const nlohmann::json& raw, const char* key) {
    if (!raw.contains(key) || !raw[key].is_array()) {
        return {};
    }
    return raw[key].get<std::vector<std::string>>();
}
}

nlohmann::json RunRecordCodec::toJson(const DateRange& range) {
    return nlohmann::json{{"start", range.start}, {"end", range.end}};
}

DateRange RunRecordCodec::rangeFromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return DateRange{};
    }
    return DateRange{raw.value("start", std::string()), raw.value("end", std::string())};
}

nlohmann::json RunRecordCodec::toJson(const MetricsRecord& metrics) {
    nlohmann::json out;
    out["sharpe_ratio"] = metrics.sharpe_ratio;
    out["total_return"] = metrics.total_return;
    out["max_drawdown"] = metrics.max_drawdown;
    out["win_rate"] = metrics.win_rate;
    out["trade_count"] = metrics.trade_count;
    out["extra"] = metrics.extra;
    return out;
}

MetricsRecord RunRecordCodec::metricsFromJson(const nlohmann::json& raw) {
    MetricsRecord metrics;
    metrics.sharpe_ratio = raw.value("sharpe_ratio", 0.0);
    metrics.total_return = raw.value("total_return", 0.0);
    metrics.max_drawdown = raw.value("max_drawdown", 0.0);
    metrics.win_rate = raw.value("win_rate", 0.0);
    metrics.trade_count = raw.value("trade_count", 0);
    metrics.extra = raw.value("extra", nlohmann::json::object());
    return metrics;
}

nlohmann::json RunRecordCodec::toJson(const TrialRecord& trial) {
    nlohmann::json out;
    out["sequence"] = trial.sequence;
    out["params"] = trial.combination.toJson();
    out["window"] = toJson(trial.window);
    out["elapsed_ms"] = trial.outcome.elapsedMs();
    if (trial.outcome.ok()) {
        out["status"] = "ok";
        out["metrics"] = toJson(trial.outcome.metrics());
    } else {
        out["status"] = "failed";
        out["failure_reason"] = toString(*trial.outcome.failureReason());
        out["message"] = trial.outcome.message();
    }
    return out;
}

TrialRecord RunRecordCodec::trialFromJson(const nlohmann::json& raw) {
    const double elapsed = raw.value("elapsed_ms", 0.0);
    const std::string status = raw.value("status", std::string("failed"));

    auto outcome = status == "ok"
        ? TrialOutcome::success(metricsFromJson(raw.at("metrics")), elapsed)
        : TrialOutcome::failure(
              failureReasonFromString(raw.value("failure_reason", std::string("evaluator_error"))),
              raw.value("message", std::string()),
              elapsed);

    return TrialRecord{
        raw.value("sequence", static_cast<std::uint64_t>(0)),
        ParameterCombination::fromJson(raw.value("params", nlohmann::json::object())),
        rangeFromJson(raw.value("window", nlohmann::json::object())),
        std::move(outcome)
    };
}

nlohmann::json RunRecordCodec::toJson(const PeriodResult& period) {
    nlohmann::json out;
    out["index"] = period.period.index;
    out["in_sample"] = toJson(period.period.in_sample);
    out["out_of_sample"] = toJson(period.period.out_of_sample);
    out["status"] = toString(period.status);

    nlohmann::json trials = nlohmann::json::array();
    for (const auto& t : period.in_sample_trials) {
        trials.push_back(toJson(t));
    }
    out["in_sample_trials"] = std::move(trials);
    out["in_sample_best"] = period.in_sample_best ? bestToJson(*period.in_sample_best) : nlohmann::json(nullptr);
    out["out_of_sample_metrics"] = period.out_of_sample_metrics
        ? toJson(*period.out_of_sample_metrics)
        : nlohmann::json(nullptr);
    out["degradation"] = period.degradation;
    out["message"] = period.message;
    return out;
}

PeriodResult RunRecordCodec::periodFromJson(const nlohmann::json& raw) {
    PeriodResult period;
    period.period.index = raw.value("index", 0);
    period.period.in_sample = rangeFromJson(raw.value("in_sample", nlohmann::json::object()));
    period.period.out_of_sample = rangeFromJson(raw.value("out_of_sample", nlohmann::json::object()));
    period.status = periodStatusFromString(raw.value("status", std::string("ok")));

    if (raw.contains("in_sample_trials") && raw["in_sample_trials"].is_array()) {
        for (const auto& t : raw["in_sample_trials"]) {
            period.in_sample_trials.push_back(trialFromJson(t));
        }
    }
    if (raw.contains("in_sample_best") && !raw["in_sample_best"].is_null()) {
        period.in_sample_best = bestFromJson(raw["in_sample_best"]);
    }
    if (raw.contains("out_of_sample_metrics") && !raw["out_of_sample_metrics"].is_null()) {
        period.out_of_sample_metrics = metricsFromJson(raw["out_of_sample_metrics"]);
    }
    period.degradation = raw.value("degradation", 0.0);
    period.message = raw.value("message", std::string());
    return period;
}

nlohmann::json RunRecordCodec::toJson(const WalkForwardSummary& summary) {
    nlohmann::json out;
    out["mean_degradation"] = summary.mean_degradation;
    out["median_degradation"] = summary.median_degradation;
    out["mean_in_sample_sharpe"] = summary.mean_in_sample_sharpe;
    out["mean_out_of_sample_sharpe"] = summary.mean_out_of_sample_sharpe;
    out["positive_out_of_sample_fraction"] = summary.positive_out_of_sample_fraction;
    out["successful_periods"] = summary.successful_periods;
    out["failed_periods"] = summary.failed_periods;
    out["robust"] = summary.robust;
    out["best_period"] = summary.best_period ? nlohmann::json(*summary.best_period) : nlohmann::json(nullptr);
    return out;
}

WalkForwardSummary RunRecordCodec::summaryFromJson(const nlohmann::json& raw) {
    WalkForwardSummary summary;
    summary.mean_degradation = raw.value("mean_degradation", 0.0);
    summary.median_degradation = raw.value("median_degradation", 0.0);
    summary.mean_in_sample_sharpe = raw.value("mean_in_sample_sharpe", 0.0);
    summary.mean_out_of_sample_sharpe = raw.value("mean_out_of_sample_sharpe", 0.0);
    summary.positive_out_of_sample_fraction = raw.value("positive_out_of_sample_fraction", 0.0);
    summary.successful_periods = raw.value("successful_periods", 0);
    summary.failed_periods = raw.value("failed_periods", 0);
    summary.robust = raw.value("robust", false);
    if (raw.contains("best_period") && !raw["best_period"].is_null()) {
        summary.best_period = raw["best_period"].get<int>();
    }
    return summary;
}

nlohmann::json RunRecordCodec::toJson(const TrialStatistics& stats) {
    nlohmann::json out;
    out["total"] = stats.total;
    out["succeeded"] = stats.succeeded;
    out["failed"] = stats.failed;
    out["mean_sharpe"] = stats.mean_sharpe;
    out["std_sharpe"] = stats.std_sharpe;
    out["mean_return"] = stats.mean_return;
    out["std_return"] = stats.std_return;
    out["best_sharpe"] = stats.best_sharpe;
    out["worst_sharpe"] = stats.worst_sharpe;
    return out;
}

TrialStatistics RunRecordCodec::statisticsFromJson(const nlohmann::json& raw) {
    TrialStatistics stats;
    stats.total = raw.value("total", 0);
    stats.succeeded = raw.value("succeeded", 0);
    stats.failed = raw.value("failed", 0);
    stats.mean_sharpe = raw.value("mean_sharpe", 0.0);
    stats.std_sharpe = raw.value("std_sharpe", 0.0);
    stats.mean_return = raw.value("mean_return", 0.0);
    stats.std_return = raw.value("std_return", 0.0);
    stats.best_sharpe = raw.value("best_sharpe", 0.0);
    stats.worst_sharpe = raw.value("worst_sharpe", 0.0);
    return stats;
}

nlohmann::json RunRecordCodec::toJson(const RunRecord& record) {
    nlohmann::json out;
    out["schema_version"] = kSchemaVersion;
    out["run_id"] = record.run_id;
    out["created_at_ms"] = record.created_at_ms;
    out["created_at"] = record.created_at;
    out["strategy_id"] = record.strategy_id;
    out["search_kind"] = toString(record.search_kind);
    out["rank_metric"] = toString(record.rank_metric);
    out["config"] = record.config;
    out["symbols"] = record.symbols;
    out["window"] = toJson(record.window);
    out["best"] = record.best ? bestToJson(*record.best) : nlohmann::json(nullptr);

    nlohmann::json trials = nlohmann::json::array();
    for (const auto& t : record.trials) {
        trials.push_back(toJson(t));
    }
    out["trials"] = std::move(trials);

    nlohmann::json periods = nlohmann::json::array();
    for (const auto& p : record.periods) {
        periods.push_back(toJson(p));
    }
    out["periods"] = std::move(periods);
    out["walk_forward"] = record.walk_forward ? toJson(*record.walk_forward) : nlohmann::json(nullptr);
    out["statistics"] = toJson(record.statistics);
    out["cancelled"] = record.cancelled;
    out["robust"] = record.robust;
    return out;
}

RunRecord RunRecordCodec::recordFromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw InvalidArgumentError("Run record must be a JSON object");
    }

    RunRecord record;
    record.run_id = raw.value("run_id", std::string());
    record.created_at_ms = raw.value("created_at_ms", 0LL);
    record.created_at = raw.value("created_at", std::string());
    record.strategy_id = raw.value("strategy_id", std::string());
    record.search_kind = searchKindFromString(raw.value("search_kind", std::string("grid")));
    record.rank_metric = rankMetricFromString(raw.value("rank_metric", std::string("sharpe")));
    record.config = raw.value("config", nlohmann::json::object());
    record.symbols = readStrings(raw, "symbols");
    record.window = rangeFromJson(raw.value("window", nlohmann::json::object()));

    if (raw.contains("best") && !raw["best"].is_null()) {
        record.best = bestFromJson(raw["best"]);
    }
    if (raw.contains("trials") && raw["trials"].is_array()) {
        for (const auto& t : raw["trials"]) {
            record.trials.push_back(trialFromJson(t));
        }
    }
    if (raw.contains("periods") && raw["periods"].is_array()) {
        for (const auto& p : raw["periods"]) {
            record.periods.push_back(periodFromJson(p));
        }
    }
    if (raw.contains("walk_forward") && !raw["walk_forward"].is_null()) {
        record.walk_forward = summaryFromJson(raw["walk_forward"]);
    }
    record.statistics = statisticsFromJson(raw.value("statistics", nlohmann::json::object()));
    record.cancelled = raw.value("cancelled", false);
    record.robust = raw.value("robust", true);
    return record;
}

nlohmann::json RunRecordCodec::toJson(const RunIndexEntry& entry) {
    nlohmann::json out;
    out["run_id"] = entry.run_id;
    out["created_at_ms"] = entry.created_at_ms;
    out["created_at"] = entry.created_at;
    out["strategy_id"] = entry.strategy_id;
    out["search_kind"] = toString(entry.search_kind);
    out["best_sharpe"] = optionalDouble(entry.best_sharpe);
    out["best_return"] = optionalDouble(entry.best_return);
    out["symbols"] = entry.symbols;
    out["window"] = toJson(entry.window);
    out["trial_count"] = entry.trial_count;
    out["cancelled"] = entry.cancelled;
    out["robust"] = entry.robust;
    return out;
}

RunIndexEntry RunRecordCodec::entryFromJson(const nlohmann::json& raw) {
    RunIndexEntry entry;
    entry.run_id = raw.at("run_id").get<std::string>();
    entry.created_at_ms = raw.value("created_at_ms", 0LL);
    entry.created_at = raw.value("created_at", std::string());
    entry.strategy_id = raw.value("strategy_id", std::string());
    entry.search_kind = searchKindFromString(raw.value("search_kind", std::string("grid")));
    entry.best_sharpe = readOptionalDouble(raw, "best_sharpe");
    entry.best_return = readOptionalDouble(raw, "best_return");
    entry.symbols = readStrings(raw, "symbols");
    entry.window = rangeFromJson(raw.value("window", nlohmann::json::object()));
    entry.trial_count = raw.value("trial_count", 0);
    entry.cancelled = raw.value("cancelled", false);
    entry.robust = raw.value("robust", true);
    return entry;
}

} // namespace core
} // namespace stratopt

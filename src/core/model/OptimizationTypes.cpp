#include "core/model/OptimizationTypes.h"
#include "common/Errors.h"

#include <cmath>

namespace stratopt {
namespace core {

std::string toString(SearchKind kind) {
    switch (kind) {
        case SearchKind::GRID: return "grid";
        case SearchKind::WALK_FORWARD: return "walk_forward";
        case SearchKind::ADAPTIVE: return "adaptive";
    }
    return "grid";
}

std::string toString(RankMetric metric) {
    switch (metric) {
        case RankMetric::SHARPE: return "sharpe";
        case RankMetric::TOTAL_RETURN: return "total_return";
        case RankMetric::WIN_RATE: return "win_rate";
        case RankMetric::MAX_DRAWDOWN: return "max_drawdown";
    }
    return "sharpe";
}

std::string toString(FailureReason reason) {
    switch (reason) {
        case FailureReason::EVALUATOR_ERROR: return "evaluator_error";
        case FailureReason::TIMEOUT: return "timeout";
        case FailureReason::INVALID_METRIC: return "invalid_metric";
        case FailureReason::SCREENED_OUT: return "screened_out";
    }
    return "evaluator_error";
}

std::string toString(PeriodStatus status) {
    switch (status) {
        case PeriodStatus::OK: return "ok";
        case PeriodStatus::IN_SAMPLE_FAILED: return "in_sample_failed";
        case PeriodStatus::OUT_OF_SAMPLE_FAILED: return "out_of_sample_failed";
        case PeriodStatus::CANCELLED: return "cancelled";
    }
    return "ok";
}

SearchKind searchKindFromString(const std::string& value) {
    if (value == "grid" || value == "grid_search") return SearchKind::GRID;
    if (value == "walk_forward") return SearchKind::WALK_FORWARD;
    if (value == "adaptive") return SearchKind::ADAPTIVE;
    throw InvalidArgumentError("Unknown search kind: '" + value + "'");
}

RankMetric rankMetricFromString(const std::string& value) {
    if (value == "sharpe") return RankMetric::SHARPE;
    if (value == "total_return" || value == "return") return RankMetric::TOTAL_RETURN;
    if (value == "win_rate") return RankMetric::WIN_RATE;
    if (value == "max_drawdown" || value == "drawdown") return RankMetric::MAX_DRAWDOWN;
    throw InvalidArgumentError("Unknown rank metric: '" + value + "'");
}

FailureReason failureReasonFromString(const std::string& value) {
    if (value == "evaluator_error") return FailureReason::EVALUATOR_ERROR;
    if (value == "timeout") return FailureReason::TIMEOUT;
    if (value == "invalid_metric") return FailureReason::INVALID_METRIC;
    if (value == "screened_out") return FailureReason::SCREENED_OUT;
    throw InvalidArgumentError("Unknown failure reason: '" + value + "'");
}

PeriodStatus periodStatusFromString(const std::string& value) {
    if (value == "ok") return PeriodStatus::OK;
    if (value == "in_sample_failed") return PeriodStatus::IN_SAMPLE_FAILED;
    if (value == "out_of_sample_failed") return PeriodStatus::OUT_OF_SAMPLE_FAILED;
    if (value == "cancelled") return PeriodStatus::CANCELLED;
    throw InvalidArgumentError("Unknown period status: '" + value + "'");
}

ParameterCombination::ParameterCombination(std::map<std::string, ParamValue> values)
    : values_(std::move(values)) {}

bool ParameterCombination::contains(const std::string& name) const {
    return values_.find(name) != values_.end();
}

const ParamValue& ParameterCombination::get(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) {
        throw InvalidArgumentError("Parameter not in combination: '" + name + "'");
    }
    return it->second;
}

double ParameterCombination::getDouble(const std::string& name) const {
    const auto& v = get(name);
    if (!v.is_number()) {
        throw InvalidArgumentError("Parameter '" + name + "' is not numeric");
    }
    return v.get<double>();
}

long long ParameterCombination::getInt(const std::string& name) const {
    const auto& v = get(name);
    if (v.is_number_integer()) {
        return v.get<long long>();
    }
    if (v.is_number_float()) {
        return static_cast<long long>(std::llround(v.get<double>()));
    }
    throw InvalidArgumentError("Parameter '" + name + "' is not numeric");
}

nlohmann::json ParameterCombination::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, value] : values_) {
        out[name] = value;
    }
    return out;
}

ParameterCombination ParameterCombination::fromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw InvalidArgumentError("Parameter combination must be a JSON object");
    }
    std::map<std::string, ParamValue> values;
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        values.emplace(it.key(), it.value());
    }
    return ParameterCombination(std::move(values));
}

std::string ParameterCombination::toString() const {
    return toJson().dump();
}

double MetricsRecord::value(RankMetric metric) const {
    switch (metric) {
        case RankMetric::SHARPE: return sharpe_ratio;
        case RankMetric::TOTAL_RETURN: return total_return;
        case RankMetric::WIN_RATE: return win_rate;
        case RankMetric::MAX_DRAWDOWN: return max_drawdown;
    }
    return sharpe_ratio;
}

TrialOutcome TrialOutcome::success(MetricsRecord metrics, double elapsed_ms) {
    TrialOutcome out;
    out.ok_ = true;
    out.metrics_ = std::move(metrics);
    out.elapsed_ms_ = elapsed_ms;
    return out;
}

TrialOutcome TrialOutcome::failure(FailureReason reason, std::string message, double elapsed_ms) {
    TrialOutcome out;
    out.ok_ = false;
    out.reason_ = reason;
    out.message_ = std::move(message);
    out.elapsed_ms_ = elapsed_ms;
    return out;
}

bool TrialOutcome::operator==(const TrialOutcome& other) const {
    if (ok_ != other.ok_) {
        return false;
    }
    if (ok_) {
        return metrics_ == other.metrics_;
    }
    return reason_ == other.reason_ && message_ == other.message_;
}

RunIndexEntry RunIndexEntry::fromRecord(const RunRecord& record) {
    RunIndexEntry entry;
    entry.run_id = record.run_id;
    entry.created_at_ms = record.created_at_ms;
    entry.created_at = record.created_at;
    entry.strategy_id = record.strategy_id;
    entry.search_kind = record.search_kind;
    if (record.best) {
        entry.best_sharpe = record.best->metrics.sharpe_ratio;
        entry.best_return = record.best->metrics.total_return;
    }
    entry.symbols = record.symbols;
    entry.window = record.window;
    entry.trial_count = record.statistics.total;
    entry.cancelled = record.cancelled;
    entry.robust = record.robust;
    return entry;
}

const ComparisonRow* ComparisonTable::find(const std::string& label) const {
    for (const auto& row : rows) {
        if (row.label == label) {
            return &row;
        }
    }
    return nullptr;
}

} // namespace core
} // namespace stratopt

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace stratopt {
namespace core {

enum class SearchKind {
    GRID,
    WALK_FORWARD,
    ADAPTIVE
};

enum class RankMetric {
    SHARPE,
    TOTAL_RETURN,
    WIN_RATE,
    MAX_DRAWDOWN      // ranked by lower absolute drawdown
};

enum class FailureReason {
    EVALUATOR_ERROR,
    TIMEOUT,
    INVALID_METRIC,
    SCREENED_OUT
};

enum class PeriodStatus {
    OK,
    IN_SAMPLE_FAILED,
    OUT_OF_SAMPLE_FAILED,
    CANCELLED
};

std::string toString(SearchKind kind);
std::string toString(RankMetric metric);
std::string toString(FailureReason reason);
std::string toString(PeriodStatus status);

// Parsers throw InvalidArgumentError on unknown names.
SearchKind searchKindFromString(const std::string& value);
RankMetric rankMetricFromString(const std::string& value);
FailureReason failureReasonFromString(const std::string& value);
PeriodStatus periodStatusFromString(const std::string& value);

// Integer, floating point, string or boolean.
using ParamValue = nlohmann::json;

class ParameterCombination {
public:
    ParameterCombination() = default;
    explicit ParameterCombination(std::map<std::string, ParamValue> values);

    const std::map<std::string, ParamValue>& values() const { return values_; }
    bool contains(const std::string& name) const;
    const ParamValue& get(const std::string& name) const;
    double getDouble(const std::string& name) const;
    long long getInt(const std::string& name) const;
    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    nlohmann::json toJson() const;
    static ParameterCombination fromJson(const nlohmann::json& raw);
    std::string toString() const;

    bool operator==(const ParameterCombination& other) const { return values_ == other.values_; }
    bool operator!=(const ParameterCombination& other) const { return !(*this == other); }

private:
    std::map<std::string, ParamValue> values_;
};

struct MetricsRecord {
    double sharpe_ratio = 0.0;
    double total_return = 0.0;
    double max_drawdown = 0.0;
    double win_rate = 0.0;
    int trade_count = 0;
    // Strategy-reported fields beyond the standard set.
    nlohmann::json extra = nlohmann::json::object();

    double value(RankMetric metric) const;

    bool operator==(const MetricsRecord& other) const {
        return sharpe_ratio == other.sharpe_ratio &&
               total_return == other.total_return &&
               max_drawdown == other.max_drawdown &&
               win_rate == other.win_rate &&
               trade_count == other.trade_count &&
               extra == other.extra;
    }
    bool operator!=(const MetricsRecord& other) const { return !(*this == other); }
};

class TrialOutcome {
public:
    static TrialOutcome success(MetricsRecord metrics, double elapsed_ms = 0.0);
    static TrialOutcome failure(FailureReason reason, std::string message, double elapsed_ms = 0.0);

    bool ok() const { return ok_; }
    const MetricsRecord& metrics() const { return metrics_; }
    std::optional<FailureReason> failureReason() const {
        return ok_ ? std::nullopt : std::optional<FailureReason>(reason_);
    }
    const std::string& message() const { return message_; }
    double elapsedMs() const { return elapsed_ms_; }

    bool operator==(const TrialOutcome& other) const;

private:
    TrialOutcome() = default;

    bool ok_ = false;
    MetricsRecord metrics_;
    FailureReason reason_ = FailureReason::EVALUATOR_ERROR;
    std::string message_;
    double elapsed_ms_ = 0.0;
};

struct Trial {
    std::uint64_t sequence = 0;   // submission order, used as final tie break
    std::string strategy_id;
    ParameterCombination combination;
    std::vector<std::string> symbols;
    DateRange window;
    double capital = 0.0;
};

struct TrialRecord {
    std::uint64_t sequence = 0;
    ParameterCombination combination;
    DateRange window;
    TrialOutcome outcome;
};

struct BestResult {
    ParameterCombination combination;
    MetricsRecord metrics;
    std::uint64_t sequence = 0;
};

struct Period {
    int index = 0;
    DateRange in_sample;
    DateRange out_of_sample;

    bool operator==(const Period& other) const {
        return index == other.index && in_sample == other.in_sample &&
               out_of_sample == other.out_of_sample;
    }
};

struct PeriodResult {
    Period period;
    PeriodStatus status = PeriodStatus::OK;
    std::vector<TrialRecord> in_sample_trials;
    std::optional<BestResult> in_sample_best;
    std::optional<MetricsRecord> out_of_sample_metrics;
    double degradation = 0.0;
    std::string message;
};

struct WalkForwardSummary {
    double mean_degradation = 0.0;
    double median_degradation = 0.0;
    double mean_in_sample_sharpe = 0.0;
    double mean_out_of_sample_sharpe = 0.0;
    double positive_out_of_sample_fraction = 0.0;
    int successful_periods = 0;
    int failed_periods = 0;
    bool robust = false;
    std::optional<int> best_period;
};

struct TrialStatistics {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    double mean_sharpe = 0.0;
    double std_sharpe = 0.0;
    double mean_return = 0.0;
    double std_return = 0.0;
    double best_sharpe = 0.0;
    double worst_sharpe = 0.0;
};

struct RunRecord {
    std::string run_id;
    long long created_at_ms = 0;
    std::string created_at;
    std::string strategy_id;
    SearchKind search_kind = SearchKind::GRID;
    RankMetric rank_metric = RankMetric::SHARPE;
    nlohmann::json config = nlohmann::json::object();
    std::vector<std::string> symbols;
    DateRange window;

    std::optional<BestResult> best;
    std::vector<TrialRecord> trials;          // grid / adaptive
    std::vector<PeriodResult> periods;        // walk-forward
    std::optional<WalkForwardSummary> walk_forward;
    TrialStatistics statistics;

    bool cancelled = false;
    bool robust = true;
};

struct RunIndexEntry {
    std::string run_id;
    long long created_at_ms = 0;
    std::string created_at;
    std::string strategy_id;
    SearchKind search_kind = SearchKind::GRID;
    std::optional<double> best_sharpe;
    std::optional<double> best_return;
    std::vector<std::string> symbols;
    DateRange window;
    int trial_count = 0;
    bool cancelled = false;
    bool robust = true;

    static RunIndexEntry fromRecord(const RunRecord& record);
};

struct RunFilter {
    std::optional<std::string> strategy_id;
    std::optional<SearchKind> search_kind;
    std::optional<double> min_sharpe;
    std::optional<std::string> created_from;   // ISO date, inclusive
    std::optional<std::string> created_to;     // ISO date, inclusive
    std::vector<std::string> symbols;          // any overlap
};

enum class RunSortField {
    CREATED_AT,
    RUN_ID,
    STRATEGY,
    SEARCH_KIND,
    BEST_SHARPE,
    BEST_RETURN,
    WINDOW_START,
    WINDOW_END,
    TRIAL_COUNT
};

struct RunSort {
    RunSortField field = RunSortField::CREATED_AT;
    bool descending = true;
};

struct ComparisonRow {
    std::string label;
    std::vector<nlohmann::json> values;   // one cell per run, null when absent
};

struct ComparisonTable {
    std::vector<std::string> run_ids;
    std::vector<ComparisonRow> rows;

    const ComparisonRow* find(const std::string& label) const;
};

struct StoreStatistics {
    int total_runs = 0;
    std::vector<std::string> strategies;
    std::vector<std::string> search_kinds;
    std::optional<double> best_sharpe;
    std::optional<double> best_return;
    std::optional<double> avg_sharpe;
    std::optional<double> avg_return;
};

} // namespace core
} // namespace stratopt

#pragma once

#include <nlohmann/json.hpp>

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace core {

// JSON layout of persisted runs. Decoding throws nlohmann::json exceptions or
// InvalidArgumentError on malformed input; callers translate those.
class RunRecordCodec {
public:
    static nlohmann::json toJson(const RunRecord& record);
    static RunRecord recordFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const RunIndexEntry& entry);
    static RunIndexEntry entryFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const MetricsRecord& metrics);
    static MetricsRecord metricsFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const TrialRecord& trial);
    static TrialRecord trialFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const PeriodResult& period);
    static PeriodResult periodFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const WalkForwardSummary& summary);
    static WalkForwardSummary summaryFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const TrialStatistics& stats);
    static TrialStatistics statisticsFromJson(const nlohmann::json& raw);

    static nlohmann::json toJson(const DateRange& range);
    static DateRange rangeFromJson(const nlohmann::json& raw);
};

} // namespace core
} // namespace stratopt

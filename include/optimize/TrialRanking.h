#pragma once

#include <optional>
#include <vector>

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace optimize {

// Score reported to adaptive backends for failed trials.
constexpr double kFailureScore = -1e9;

// Strict ordering over successful trials: primary metric, then higher total
// return, then lower absolute drawdown, then lower sequence number.
bool ranksBefore(const core::TrialRecord& a, const core::TrialRecord& b, core::RankMetric metric);

// Top-ranked successful trial, std::nullopt if none succeeded.
std::optional<core::BestResult> selectBest(const std::vector<core::TrialRecord>& trials,
                                           core::RankMetric metric);

// Successful trials only, best first.
std::vector<core::TrialRecord> rankSuccessful(const std::vector<core::TrialRecord>& trials,
                                              core::RankMetric metric);

// Higher is better. Drawdown ranks by magnitude, so its score is -|dd|.
double scoreOf(const core::TrialOutcome& outcome, core::RankMetric metric);

core::TrialStatistics summarize(const std::vector<core::TrialRecord>& trials);

} // namespace optimize
} // namespace stratopt

#pragma once

#include <string>

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace core {

// Replaces characters outside [A-Za-z0-9_.-] with '_'.
std::string sanitizeStrategyId(const std::string& strategy_id);

// {strategy}_{kind}_{YYYYMMDD_HHMMSS} in UTC, with "_{n}" appended for n > 0.
std::string makeRunId(const std::string& strategy_id, SearchKind kind,
                      long long created_at_ms, int disambiguator = 0);

// Run ids double as file names; reject anything that could escape the store.
bool isValidRunId(const std::string& run_id);

} // namespace core
} // namespace stratopt

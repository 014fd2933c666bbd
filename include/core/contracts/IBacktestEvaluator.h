#pragma once

#include <string>
#include <vector>

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace core {

// Pure backtest function. Implementations report failure by throwing and must
// be callable concurrently with different arguments.
class IBacktestEvaluator {
public:
    virtual ~IBacktestEvaluator() = default;

    virtual MetricsRecord evaluate(
        const std::string& strategy_id,
        const ParameterCombination& combination,
        const std::vector<std::string>& symbols,
        const std::string& start_date,
        const std::string& end_date,
        double capital
    ) = 0;
};

} // namespace core
} // namespace stratopt

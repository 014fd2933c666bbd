#pragma once

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace core {

// Black-box sampler driven by AdaptiveSearch. Only ever called from the
// search thread, never from scheduler workers.
class ISearchBackend {
public:
    virtual ~ISearchBackend() = default;

    virtual ParameterCombination suggest() = 0;
    // Higher is better. Failed trials are reported with a large negative sentinel.
    virtual void report(const ParameterCombination& combination, double score) = 0;
};

} // namespace core
} // namespace stratopt

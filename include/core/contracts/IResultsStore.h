#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace core {

class IResultsStore {
public:
    virtual ~IResultsStore() = default;

    // Assigns run_id and commits detail before index. Returns the id.
    virtual std::string save(RunRecord record) = 0;
    virtual std::vector<RunIndexEntry> list(const RunFilter& filter = {},
                                            const RunSort& sort = {}) const = 0;
    virtual RunRecord get(const std::string& run_id) const = 0;
    virtual void remove(const std::string& run_id) = 0;
    virtual ComparisonTable compare(const std::vector<std::string>& run_ids) const = 0;
};

} // namespace core
} // namespace stratopt

#pragma once

#include <string>
#include <cstddef>
#include <optional>

namespace stratopt {

// Inclusive calendar date range, ISO-8601 (YYYY-MM-DD) bounds.
struct DateRange {
    std::string start;
    std::string end;

    bool operator==(const DateRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const DateRange& other) const { return !(*this == other); }
};

// Progress denominator is absent for open-ended (time-budgeted) searches.
using ProgressTotal = std::optional<std::size_t>;

} // namespace stratopt

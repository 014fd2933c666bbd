#include "core/state/RunId.h"
#include "common/DateUtils.h"

#include <cctype>

namespace stratopt {
namespace core {

namespace {
bool isIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}
}

std::string sanitizeStrategyId(const std::string& strategy_id) {
    std::string out;
    out.reserve(strategy_id.size());
    for (char c : strategy_id) {
        out.push_back(isIdChar(c) ? c : '_');
    }
    if (out.empty()) {
        out = "strategy";
    }
    return out;
}

std::string makeRunId(const std::string& strategy_id, SearchKind kind,
                      long long created_at_ms, int disambiguator) {
    std::string id = sanitizeStrategyId(strategy_id) + "_" + toString(kind) + "_" +
                     utils::DateUtils::toCompactUtc(created_at_ms);
    if (disambiguator > 0) {
        id += "_" + std::to_string(disambiguator);
    }
    return id;
}

bool isValidRunId(const std::string& run_id) {
    if (run_id.empty() || run_id == "." || run_id == "..") {
        return false;
    }
    for (char c : run_id) {
        if (!isIdChar(c)) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace stratopt

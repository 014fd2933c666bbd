#include "optimize/TrialRanking.h"

#include <algorithm>
#include <cmath>

namespace stratopt {
namespace optimize {

namespace {
double primaryKey(const core::MetricsRecord& metrics, core::RankMetric metric) {
    if (metric == core::RankMetric::MAX_DRAWDOWN) {
        return -std::fabs(metrics.max_drawdown);
    }
    return metrics.value(metric);
}

void meanAndStd(const std::vector<double>& values, double& mean, double& stddev) {
    mean = 0.0;
    stddev = 0.0;
    if (values.empty()) {
        return;
    }
    for (double v : values) {
        mean += v;
    }
    mean /= static_cast<double>(values.size());

    double sq = 0.0;
    for (double v : values) {
        sq += (v - mean) * (v - mean);
    }
    stddev = std::sqrt(sq / static_cast<double>(values.size()));
}
}

bool ranksBefore(const core::TrialRecord& a, const core::TrialRecord& b, core::RankMetric metric) {
    const auto& ma = a.outcome.metrics();
    const auto& mb = b.outcome.metrics();

    const double ka = primaryKey(ma, metric);
    const double kb = primaryKey(mb, metric);
    if (ka != kb) {
        return ka > kb;
    }
    if (ma.total_return != mb.total_return) {
        return ma.total_return > mb.total_return;
    }
    const double da = std::fabs(ma.max_drawdown);
    const double db = std::fabs(mb.max_drawdown);
    if (da != db) {
        return da < db;
    }
    return a.sequence < b.sequence;
}

std::vector<core::TrialRecord> rankSuccessful(const std::vector<core::TrialRecord>& trials,
                                              core::RankMetric metric) {
    std::vector<core::TrialRecord> ok;
    for (const auto& t : trials) {
        if (t.outcome.ok()) {
            ok.push_back(t);
        }
    }
    std::sort(ok.begin(), ok.end(), [metric](const core::TrialRecord& a, const core::TrialRecord& b) {
        return ranksBefore(a, b, metric);
    });
    return ok;
}

std::optional<core::BestResult> selectBest(const std::vector<core::TrialRecord>& trials,
                                           core::RankMetric metric) {
    const core::TrialRecord* best = nullptr;
    for (const auto& t : trials) {
        if (!t.outcome.ok()) {
            continue;
        }
        if (best == nullptr || ranksBefore(t, *best, metric)) {
            best = &t;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return core::BestResult{best->combination, best->outcome.metrics(), best->sequence};
}

double scoreOf(const core::TrialOutcome& outcome, core::RankMetric metric) {
    if (!outcome.ok()) {
        return kFailureScore;
    }
    return primaryKey(outcome.metrics(), metric);
}

core::TrialStatistics summarize(const std::vector<core::TrialRecord>& trials) {
    core::TrialStatistics stats;
    stats.total = static_cast<int>(trials.size());

    std::vector<double> sharpes;
    std::vector<double> returns;
    for (const auto& t : trials) {
        if (!t.outcome.ok()) {
            continue;
        }
        sharpes.push_back(t.outcome.metrics().sharpe_ratio);
        returns.push_back(t.outcome.metrics().total_return);
    }
    stats.succeeded = static_cast<int>(sharpes.size());
    stats.failed = stats.total - stats.succeeded;

    meanAndStd(sharpes, stats.mean_sharpe, stats.std_sharpe);
    meanAndStd(returns, stats.mean_return, stats.std_return);
    if (!sharpes.empty()) {
        stats.best_sharpe = *std::max_element(sharpes.begin(), sharpes.end());
        stats.worst_sharpe = *std::min_element(sharpes.begin(), sharpes.end());
    }
    return stats;
}

} // namespace optimize
} // namespace stratopt

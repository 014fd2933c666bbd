#include "optimize/AdaptiveSearch.h"
#include "optimize/RandomSearchBackend.h"
#include "optimize/TrialRanking.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <iostream>
#include <utility>

using namespace stratopt;
using stratopt::test::FunctionEvaluator;
using stratopt::test::makeMetrics;

namespace {

// Suggests x = 0, 1, 2, ... and remembers every report.
class RecordingBackend : public core::ISearchBackend {
public:
    core::ParameterCombination suggest() override {
        std::map<std::string, core::ParamValue> values;
        values["x"] = next_++;
        return core::ParameterCombination(values);
    }

    void report(const core::ParameterCombination& combination, double score) override {
        reports.emplace_back(combination.getInt("x"), score);
    }

    std::vector<std::pair<long long, double>> reports;

private:
    int next_ = 0;
};

optimize::SearchContext makeContext(int concurrency) {
    optimize::SearchContext ctx;
    ctx.strategy_id = "Stub";
    ctx.symbols = {"SPY"};
    ctx.window = DateRange{"2023-01-01", "2023-12-31"};
    ctx.capital = 100000.0;
    ctx.concurrency = concurrency;
    return ctx;
}

int testTrialBudget() {
    // Odd x fails; even x scores x.
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string&, const std::string&) {
            const auto x = c.getInt("x");
            if (x % 2 == 1) {
                throw EvaluationError("odd");
            }
            return makeMetrics(static_cast<double>(x));
        });
    optimize::TrialEvaluator evaluator(stub);
    RecordingBackend backend;
    optimize::AdaptiveSettings settings;
    settings.trial_budget = 7;
    optimize::AdaptiveSearch search(evaluator, backend, settings);
    optimize::CancelToken cancel;

    std::size_t last_done = 0;
    bool total_ok = true;
    const auto outcome = search.search(makeContext(3),
        [&](std::size_t done, ProgressTotal total) {
            last_done = done;
            if (!total || *total != 7) {
                total_ok = false;
            }
        },
        cancel);

    STRATOPT_CHECK(outcome.kind == core::SearchKind::ADAPTIVE, "kind should be adaptive");
    STRATOPT_CHECK(outcome.trials.size() == 7, "budget of 7 trials, got " << outcome.trials.size());
    STRATOPT_CHECK(stub->calls() == 7, "evaluator called once per trial");
    STRATOPT_CHECK(total_ok && last_done == 7, "progress should run to 7/7");
    STRATOPT_CHECK(outcome.best && outcome.best->combination.getInt("x") == 6, "best should be x=6");

    STRATOPT_CHECK(backend.reports.size() == 7, "every trial reported back");
    for (std::size_t i = 0; i < backend.reports.size(); ++i) {
        STRATOPT_CHECK(backend.reports[i].first == static_cast<long long>(i), "reports in suggestion order");
        if (i % 2 == 1) {
            STRATOPT_CHECK(backend.reports[i].second == optimize::kFailureScore,
                           "failed trials reported with the sentinel");
        } else {
            STRATOPT_CHECK(backend.reports[i].second == static_cast<double>(i), "score is the rank metric");
        }
    }
    return 0;
}

int testTimeBudgetOnly() {
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string&, const std::string&) {
            return makeMetrics(static_cast<double>(c.getInt("x")));
        });
    optimize::TrialEvaluator evaluator(stub);
    RecordingBackend backend;
    optimize::AdaptiveSettings settings;
    settings.time_budget_seconds = 0.05;
    optimize::AdaptiveSearch search(evaluator, backend, settings);
    optimize::CancelToken cancel;

    STRATOPT_CHECK(!search.plannedTrials(makeContext(1)), "time-budgeted search has no total");

    bool saw_total = false;
    const auto outcome = search.search(makeContext(2),
        [&](std::size_t, ProgressTotal total) {
            if (total) {
                saw_total = true;
            }
        },
        cancel);

    STRATOPT_CHECK(!saw_total, "progress total should be absent");
    STRATOPT_CHECK(!outcome.trials.empty(), "at least one batch should run");
    STRATOPT_CHECK(outcome.best.has_value(), "best should exist");
    return 0;
}

int testBudgetsValidated() {
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination&, const std::string&, const std::string&) {
            return makeMetrics(1.0);
        });
    optimize::TrialEvaluator evaluator(stub);
    RecordingBackend backend;

    bool threw = false;
    try {
        optimize::AdaptiveSearch search(evaluator, backend, optimize::AdaptiveSettings{});
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    STRATOPT_CHECK(threw, "no budget at all should be rejected");

    threw = false;
    try {
        optimize::AdaptiveSettings settings;
        settings.trial_budget = 0;
        optimize::AdaptiveSearch search(evaluator, backend, settings);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    STRATOPT_CHECK(threw, "zero trial budget should be rejected");
    return 0;
}

int testNoViableResult() {
    auto broken = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination&, const std::string&, const std::string&) -> core::MetricsRecord {
            throw EvaluationError("engine down");
        });
    optimize::TrialEvaluator evaluator(broken);
    RecordingBackend backend;
    optimize::AdaptiveSettings settings;
    settings.trial_budget = 4;
    optimize::AdaptiveSearch search(evaluator, backend, settings);
    optimize::CancelToken cancel;

    bool threw = false;
    try {
        search.search(makeContext(2), {}, cancel);
    } catch (const NoViableResultError&) {
        threw = true;
    }
    STRATOPT_CHECK(threw, "zero successes should raise NoViableResultError");
    STRATOPT_CHECK(backend.reports.size() == 4, "failures are still reported to the backend");
    return 0;
}

int testDuplicateSuggestionsAreEvaluated() {
    // Always suggests the same combination.
    class StuckBackend : public core::ISearchBackend {
    public:
        core::ParameterCombination suggest() override {
            std::map<std::string, core::ParamValue> values;
            values["x"] = 4;
            return core::ParameterCombination(values);
        }
        void report(const core::ParameterCombination&, double) override { ++reported; }
        int reported = 0;
    };

    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string&, const std::string&) {
            return makeMetrics(static_cast<double>(c.getInt("x")));
        });
    optimize::TrialEvaluator evaluator(stub);
    StuckBackend backend;
    optimize::AdaptiveSettings settings;
    settings.trial_budget = 3;
    optimize::AdaptiveSearch search(evaluator, backend, settings);
    optimize::CancelToken cancel;

    const auto outcome = search.search(makeContext(1), {}, cancel);
    STRATOPT_CHECK(outcome.trials.size() == 3 && stub->calls() == 3, "duplicates are evaluated again");
    STRATOPT_CHECK(backend.reported == 3, "each duplicate is reported");
    STRATOPT_CHECK(outcome.best->sequence == 0, "first of equal trials wins");
    return 0;
}

int testSeededRandomBackend() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({
        "fast": {"type": "int", "low": 2, "high": 30, "step": 1},
        "slow": [50, 100, 200]
    })"));
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string&, const std::string&) {
            return makeMetrics(c.getDouble("slow") / c.getDouble("fast"));
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::AdaptiveSettings settings;
    settings.trial_budget = 12;

    auto runOnce = [&]() {
        optimize::RandomSearchBackend backend(space);
        optimize::AdaptiveSearch search(evaluator, backend, settings);
        optimize::CancelToken cancel;
        auto outcome = search.search(makeContext(4), {}, cancel);
        return std::make_pair(outcome, backend.reportedCount());
    };

    const auto first = runOnce();
    const auto second = runOnce();
    STRATOPT_CHECK(first.second == 12, "backend should see every trial");
    STRATOPT_CHECK(first.first.trials.size() == second.first.trials.size(), "same trial count");
    for (std::size_t i = 0; i < first.first.trials.size(); ++i) {
        STRATOPT_CHECK(first.first.trials[i].combination == second.first.trials[i].combination,
                       "same seed should suggest the same sequence");
        STRATOPT_CHECK(space.contains(first.first.trials[i].combination), "suggestions stay in the space");
    }
    STRATOPT_CHECK(first.first.best->combination == second.first.best->combination, "same best");
    return 0;
}

}

int main() {
    if (testTrialBudget() != 0) return 1;
    if (testTimeBudgetOnly() != 0) return 1;
    if (testBudgetsValidated() != 0) return 1;
    if (testNoViableResult() != 0) return 1;
    if (testDuplicateSuggestionsAreEvaluated() != 0) return 1;
    if (testSeededRandomBackend() != 0) return 1;

    std::cout << "[TEST] AdaptiveSearch PASSED\n";
    return 0;
}

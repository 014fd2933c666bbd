#include "optimize/WalkForwardSearch.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <cmath>
#include <iostream>

using namespace stratopt;
using stratopt::test::FunctionEvaluator;
using stratopt::test::makeMetrics;
using utils::DateUtils;

namespace {

const DateRange kHundredDays{"2023-01-01", "2023-04-10"};

long long lengthOf(const std::string& start, const std::string& end) {
    return DateUtils::toEpochDay(end) - DateUtils::toEpochDay(start) + 1;
}

optimize::SearchContext makeContext(const DateRange& window) {
    optimize::SearchContext ctx;
    ctx.strategy_id = "Stub";
    ctx.symbols = {"SPY"};
    ctx.window = window;
    ctx.capital = 50000.0;
    ctx.concurrency = 2;
    return ctx;
}

int testScenarioB() {
    STRATOPT_CHECK(lengthOf(kHundredDays.start, kHundredDays.end) == 100, "fixture should span 100 days");

    const optimize::WalkForwardSettings settings{60, 20, 20};
    const auto periods = optimize::generatePeriods(kHundredDays, settings);
    STRATOPT_CHECK(periods.size() == 2, "60/20/20 over 100 days yields 2 periods, got " << periods.size());

    for (const auto& p : periods) {
        STRATOPT_CHECK(lengthOf(p.in_sample.start, p.in_sample.end) == 60, "in-sample should be 60 days");
        STRATOPT_CHECK(lengthOf(p.out_of_sample.start, p.out_of_sample.end) == 20, "out-of-sample should be 20 days");
        STRATOPT_CHECK(DateUtils::addDays(p.in_sample.end, 1) == p.out_of_sample.start,
                       "out-of-sample must start the day after in-sample ends");
        STRATOPT_CHECK(DateUtils::toEpochDay(p.out_of_sample.end) <= DateUtils::toEpochDay(kHundredDays.end),
                       "period must stay inside the dataset");
    }
    STRATOPT_CHECK(periods[0].in_sample.start == "2023-01-01", "first period starts at dataset start");
    STRATOPT_CHECK(periods[0].out_of_sample.end == "2023-03-21", "first out-of-sample ends on day 80");
    STRATOPT_CHECK(periods[1].in_sample.start == "2023-01-21", "second period starts one step later");
    STRATOPT_CHECK(periods[1].out_of_sample.end == "2023-04-10", "second out-of-sample ends on day 100");

    // Same input, same sequence.
    STRATOPT_CHECK(optimize::generatePeriods(kHundredDays, settings) == periods, "generation must be idempotent");

    bool threw = false;
    try {
        optimize::generatePeriods(kHundredDays, optimize::WalkForwardSettings{60, 0, 20});
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    STRATOPT_CHECK(threw, "zero out-of-sample length should be rejected");
    return 0;
}

int testDegradation() {
    STRATOPT_CHECK(std::abs(optimize::degradation(2.0, 1.0) - 0.5) < 1e-12, "(2-1)/2 = 0.5");
    STRATOPT_CHECK(std::abs(optimize::degradation(0.0, -0.5) - 50.0) < 1e-9, "eps floor of 0.01 applies");
    STRATOPT_CHECK(std::abs(optimize::degradation(-1.0, 0.5) + 1.5) < 1e-12, "uses |sharpe_in|");
    return 0;
}

int testSearchSummary() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({"p": [1, 2]})"));
    // In-sample Sharpe = p, out-of-sample Sharpe = p / 2.
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string& start, const std::string& end) {
            const double p = c.getDouble("p");
            return lengthOf(start, end) == 20 ? makeMetrics(p / 2.0) : makeMetrics(p);
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::WalkForwardSearch search(space, evaluator, optimize::WalkForwardSettings{60, 20, 20});
    optimize::CancelToken cancel;

    std::size_t last_done = 0;
    ProgressTotal last_total;
    const auto outcome = search.search(makeContext(kHundredDays),
        [&](std::size_t done, ProgressTotal total) {
            last_done = done;
            last_total = total;
        },
        cancel);

    STRATOPT_CHECK(outcome.kind == core::SearchKind::WALK_FORWARD, "kind should be walk_forward");
    STRATOPT_CHECK(outcome.periods.size() == 2, "two periods expected");
    STRATOPT_CHECK(last_total && *last_total == 6, "total = 2 periods x (2 combinations + 1)");
    STRATOPT_CHECK(last_done == 6, "progress should reach 6, got " << last_done);

    for (const auto& p : outcome.periods) {
        STRATOPT_CHECK(p.status == core::PeriodStatus::OK, "period should succeed");
        STRATOPT_CHECK(p.in_sample_trials.size() == 2, "each period runs the full grid");
        STRATOPT_CHECK(p.in_sample_best->combination.getInt("p") == 2, "in-sample winner is p=2");
        STRATOPT_CHECK(std::abs(p.out_of_sample_metrics->sharpe_ratio - 1.0) < 1e-12, "out-of-sample Sharpe 1.0");
        STRATOPT_CHECK(std::abs(p.degradation - 0.5) < 1e-12, "degradation should be 0.5");
    }

    const auto& summary = *outcome.walk_forward;
    STRATOPT_CHECK(summary.successful_periods == 2 && summary.failed_periods == 0, "period counts");
    STRATOPT_CHECK(std::abs(summary.mean_degradation - 0.5) < 1e-12, "mean degradation");
    STRATOPT_CHECK(std::abs(summary.median_degradation - 0.5) < 1e-12, "median degradation");
    STRATOPT_CHECK(std::abs(summary.mean_in_sample_sharpe - 2.0) < 1e-12, "mean in-sample Sharpe");
    STRATOPT_CHECK(std::abs(summary.mean_out_of_sample_sharpe - 1.0) < 1e-12, "mean out-of-sample Sharpe");
    STRATOPT_CHECK(summary.positive_out_of_sample_fraction == 1.0, "all periods positive");
    STRATOPT_CHECK(summary.robust && outcome.robust, "positive out-of-sample means robust");
    STRATOPT_CHECK(summary.best_period && *summary.best_period == 0, "tie on degradation and Sharpe: first period");
    STRATOPT_CHECK(outcome.best && outcome.best->combination.getInt("p") == 2, "overall best is p=2");
    STRATOPT_CHECK(outcome.statistics.total == 6, "statistics cover in-sample and out-of-sample trials");
    return 0;
}

int testFailedPeriodsArePersisted() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({"p": [1, 2]})"));
    // Second period's out-of-sample window has no data.
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string& start, const std::string& end) {
            if (lengthOf(start, end) == 20 && end == "2023-04-10") {
                throw EvaluationError("missing bars");
            }
            return makeMetrics(c.getDouble("p"));
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::WalkForwardSearch search(space, evaluator, optimize::WalkForwardSettings{60, 20, 20});
    optimize::CancelToken cancel;

    const auto outcome = search.search(makeContext(kHundredDays), {}, cancel);
    STRATOPT_CHECK(outcome.periods.size() == 2, "failed periods must not be dropped");
    STRATOPT_CHECK(outcome.periods[0].status == core::PeriodStatus::OK, "first period ok");
    STRATOPT_CHECK(outcome.periods[1].status == core::PeriodStatus::OUT_OF_SAMPLE_FAILED,
                   "second period should fail out-of-sample");
    STRATOPT_CHECK(!outcome.periods[1].message.empty(), "failure message should be kept");
    STRATOPT_CHECK(outcome.walk_forward->successful_periods == 1 && outcome.walk_forward->failed_periods == 1,
                   "aggregates count only successful periods");
    return 0;
}

int testInSampleFailureKeepsPeriod() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({"p": [1, 2]})"));
    // Every in-sample trial of the second period fails.
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string& start, const std::string& end) {
            if (lengthOf(start, end) == 60 && start == "2023-01-21") {
                throw EvaluationError("feed outage");
            }
            return makeMetrics(c.getDouble("p"));
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::WalkForwardSearch search(space, evaluator, optimize::WalkForwardSettings{60, 20, 20});
    optimize::CancelToken cancel;

    const auto outcome = search.search(makeContext(kHundredDays), {}, cancel);
    STRATOPT_CHECK(outcome.periods.size() == 2, "in-sample failure keeps the period");
    STRATOPT_CHECK(outcome.periods[0].status == core::PeriodStatus::OK, "first period ok");

    const auto& failed = outcome.periods[1];
    STRATOPT_CHECK(failed.status == core::PeriodStatus::IN_SAMPLE_FAILED, "second period fails in-sample");
    STRATOPT_CHECK(failed.in_sample_trials.size() == 2, "failed in-sample trials are kept");
    STRATOPT_CHECK(!failed.in_sample_best, "no in-sample winner");
    STRATOPT_CHECK(!failed.out_of_sample_metrics, "no out-of-sample validation after an in-sample failure");
    STRATOPT_CHECK(!failed.message.empty(), "failure message should be kept");
    STRATOPT_CHECK(stub->calls() == 5, "2 + 1 for the first period, 2 for the second");

    const auto& summary = *outcome.walk_forward;
    STRATOPT_CHECK(summary.successful_periods == 1 && summary.failed_periods == 1, "period counts");
    STRATOPT_CHECK(summary.best_period && *summary.best_period == 0, "surviving period is best");
    STRATOPT_CHECK(outcome.best && outcome.best->combination.getInt("p") == 2, "best comes from the first period");
    STRATOPT_CHECK(std::abs(outcome.best->metrics.sharpe_ratio - 2.0) < 1e-12, "best carries out-of-sample metrics");
    return 0;
}

int testNonRobustFallback() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({"p": [1, 2]})"));
    // Out-of-sample always loses money; the second period loses less.
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string& start, const std::string& end) {
            if (lengthOf(start, end) == 20) {
                return makeMetrics(end == "2023-04-10" ? -0.1 : -0.8);
            }
            return makeMetrics(c.getDouble("p"));
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::WalkForwardSearch search(space, evaluator, optimize::WalkForwardSettings{60, 20, 20});
    optimize::CancelToken cancel;

    const auto outcome = search.search(makeContext(kHundredDays), {}, cancel);
    STRATOPT_CHECK(!outcome.robust, "no positive out-of-sample period means not robust");
    STRATOPT_CHECK(outcome.walk_forward->positive_out_of_sample_fraction == 0.0, "fraction should be 0");
    STRATOPT_CHECK(outcome.walk_forward->best_period == 1, "fallback picks highest out-of-sample Sharpe");
    STRATOPT_CHECK(outcome.best && std::abs(outcome.best->metrics.sharpe_ratio + 0.1) < 1e-12,
                   "best carries the out-of-sample metrics");
    return 0;
}

int testRangeTooShort() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({"p": [1]})"));
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination&, const std::string&, const std::string&) {
            return makeMetrics(1.0);
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::WalkForwardSearch search(space, evaluator, optimize::WalkForwardSettings{60, 20, 20});
    optimize::CancelToken cancel;

    bool threw = false;
    try {
        search.search(makeContext(DateRange{"2023-01-01", "2023-02-15"}), {}, cancel);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    STRATOPT_CHECK(threw, "a range shorter than one window is a configuration error");
    STRATOPT_CHECK(stub->calls() == 0, "nothing should run");
    return 0;
}

int testCancellationStopsAtCurrentPeriod() {
    const auto space = optimize::ParamSpace::fromJson(nlohmann::json::parse(R"({"p": [1, 2]})"));
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination& c, const std::string&, const std::string&) {
            return makeMetrics(c.getDouble("p"));
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::WalkForwardSearch search(space, evaluator, optimize::WalkForwardSettings{60, 20, 20});
    optimize::CancelToken cancel;

    auto ctx = makeContext(kHundredDays);
    ctx.concurrency = 1;
    // Cancel once the first period has fully finished (3 trials).
    const auto outcome = search.search(ctx,
        [&](std::size_t done, ProgressTotal) {
            if (done == 3) {
                cancel.cancel();
            }
        },
        cancel);

    STRATOPT_CHECK(outcome.cancelled, "run should be flagged cancelled");
    STRATOPT_CHECK(outcome.periods.size() == 2, "finished period plus the interrupted one");
    STRATOPT_CHECK(outcome.periods[0].status == core::PeriodStatus::OK, "finished period kept");
    STRATOPT_CHECK(outcome.periods[1].status == core::PeriodStatus::CANCELLED, "interrupted period marked");
    return 0;
}

}

int main() {
    if (testScenarioB() != 0) return 1;
    if (testDegradation() != 0) return 1;
    if (testSearchSummary() != 0) return 1;
    if (testFailedPeriodsArePersisted() != 0) return 1;
    if (testInSampleFailureKeepsPeriod() != 0) return 1;
    if (testNonRobustFallback() != 0) return 1;
    if (testRangeTooShort() != 0) return 1;
    if (testCancellationStopsAtCurrentPeriod() != 0) return 1;

    std::cout << "[TEST] WalkForward PASSED\n";
    return 0;
}

#include "optimize/TrialScheduler.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <set>
#include <thread>

using namespace stratopt;
using stratopt::test::FunctionEvaluator;
using stratopt::test::makeMetrics;

namespace {

optimize::TrialSource countingSource(int count) {
    auto next = std::make_shared<int>(0);
    return [next, count]() -> std::optional<core::Trial> {
        if (*next >= count) {
            return std::nullopt;
        }
        std::map<std::string, core::ParamValue> values;
        values["i"] = *next;

        core::Trial trial;
        trial.sequence = static_cast<std::uint64_t>(*next);
        trial.strategy_id = "Stub";
        trial.combination = core::ParameterCombination(values);
        trial.window = DateRange{"2023-01-01", "2023-03-31"};
        ++*next;
        return trial;
    };
}

int testIsolationAndBound() {
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    auto stub = std::make_shared<FunctionEvaluator>(
        [&](const core::ParameterCombination& c, const std::string&, const std::string&) {
            const int now = ++in_flight;
            int seen = max_in_flight.load();
            while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --in_flight;
            if (c.getInt("i") % 4 == 0) {
                throw EvaluationError("flaky backtest");
            }
            return makeMetrics(static_cast<double>(c.getInt("i")));
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::TrialScheduler scheduler(evaluator);

    std::vector<std::size_t> progress_values;
    std::atomic<bool> inside_callback{false};
    bool overlapped = false;
    optimize::CancelToken cancel;

    const auto result = scheduler.run(
        countingSource(12), 3, std::size_t(12),
        [&](std::size_t done, ProgressTotal total) {
            if (inside_callback.exchange(true)) {
                overlapped = true;
            }
            progress_values.push_back(done);
            if (!total || *total != 12) {
                overlapped = true;
            }
            inside_callback.store(false);
        },
        cancel);

    STRATOPT_CHECK(!result.cancelled, "run should not be cancelled");
    STRATOPT_CHECK(result.completed.size() == 12, "every trial should produce an outcome, got "
                   << result.completed.size());
    STRATOPT_CHECK(max_in_flight.load() <= 3, "concurrency bound exceeded: " << max_in_flight.load());
    STRATOPT_CHECK(!overlapped, "progress callback must be serial and carry the total");

    int failures = 0;
    std::set<std::uint64_t> sequences;
    for (const auto& done : result.completed) {
        sequences.insert(done.trial.sequence);
        if (!done.outcome.ok()) {
            ++failures;
            STRATOPT_CHECK(done.outcome.failureReason() == core::FailureReason::EVALUATOR_ERROR,
                           "thrown trials should be evaluator errors");
        }
    }
    STRATOPT_CHECK(failures == 3, "trials 0, 4, 8 should fail, got " << failures);
    STRATOPT_CHECK(sequences.size() == 12, "each trial evaluated exactly once");

    STRATOPT_CHECK(progress_values.size() == 12, "one progress call per trial");
    for (std::size_t i = 0; i < progress_values.size(); ++i) {
        STRATOPT_CHECK(progress_values[i] == i + 1, "progress should count up by one");
    }
    return 0;
}

int testCancellation() {
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination&, const std::string&, const std::string&) {
            return makeMetrics(1.0);
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::TrialScheduler scheduler(evaluator);

    optimize::CancelToken cancel;
    const auto result = scheduler.run(
        countingSource(20), 1, std::size_t(20),
        [&](std::size_t done, ProgressTotal) {
            if (done == 3) {
                cancel.cancel();
            }
        },
        cancel);

    STRATOPT_CHECK(result.cancelled, "run should report cancellation");
    STRATOPT_CHECK(result.completed.size() == 3, "no trial may start after cancel, got "
                   << result.completed.size());
    STRATOPT_CHECK(stub->calls() == 3, "evaluator should have been called 3 times");

    optimize::CancelToken already;
    already.cancel();
    const auto none = scheduler.run(countingSource(5), 2, std::size_t(5), {}, already);
    STRATOPT_CHECK(none.cancelled && none.completed.empty(), "pre-cancelled run should start nothing");
    return 0;
}

int testArguments() {
    auto stub = std::make_shared<FunctionEvaluator>(
        [](const core::ParameterCombination&, const std::string&, const std::string&) {
            return makeMetrics(1.0);
        });
    optimize::TrialEvaluator evaluator(stub);
    optimize::TrialScheduler scheduler(evaluator);
    optimize::CancelToken cancel;

    bool threw = false;
    try {
        scheduler.run(countingSource(1), 0, std::nullopt, {}, cancel);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    STRATOPT_CHECK(threw, "concurrency 0 should be rejected");
    STRATOPT_CHECK(optimize::TrialScheduler::resolveConcurrency(0) >= 1, "hardware default must be >= 1");
    STRATOPT_CHECK(optimize::TrialScheduler::resolveConcurrency(5) == 5, "explicit concurrency kept");

    // Unknown total still drains the source.
    const auto result = scheduler.run(countingSource(4), 8, std::nullopt, {}, cancel);
    STRATOPT_CHECK(result.completed.size() == 4, "open-ended source should be drained");
    return 0;
}

}

int main() {
    if (testIsolationAndBound() != 0) return 1;
    if (testCancellation() != 0) return 1;
    if (testArguments() != 0) return 1;

    std::cout << "[TEST] TrialScheduler PASSED\n";
    return 0;
}

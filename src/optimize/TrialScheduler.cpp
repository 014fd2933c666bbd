#include "optimize/TrialScheduler.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

namespace stratopt {
namespace optimize {

TrialScheduler::TrialScheduler(const TrialEvaluator& evaluator)
    : evaluator_(evaluator) {}

int TrialScheduler::resolveConcurrency(int requested) {
    if (requested > 0) {
        return requested;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<int>(hw);
}

ScheduleResult TrialScheduler::run(
    const TrialSource& source,
    int concurrency,
    ProgressTotal total,
    const ProgressCallback& progress,
    const CancelToken& cancel
) const {
    if (concurrency < 1) {
        throw InvalidArgumentError("concurrency must be >= 1");
    }
    if (!source) {
        throw InvalidArgumentError("TrialScheduler requires a trial source");
    }

    ScheduleResult result;

    std::mutex queue_mutex;
    bool exhausted = false;
    std::exception_ptr failure;

    std::mutex results_mutex;

    auto worker = [&]() {
        while (true) {
            std::optional<core::Trial> next;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (exhausted || failure) {
                    return;
                }
                if (cancel.isCancelled()) {
                    result.cancelled = true;
                    exhausted = true;
                    return;
                }
                try {
                    next = source();
                } catch (...) {
                    failure = std::current_exception();
                    return;
                }
                if (!next) {
                    exhausted = true;
                    return;
                }
            }

            auto outcome = evaluator_.evaluate(*next);

            std::lock_guard<std::mutex> lock(results_mutex);
            result.completed.push_back(CompletedTrial{std::move(*next), std::move(outcome)});
            if (progress) {
                try {
                    progress(result.completed.size(), total);
                } catch (...) {
                    std::lock_guard<std::mutex> queue_lock(queue_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    return;
                }
            }
        }
    };

    std::size_t workers = static_cast<std::size_t>(concurrency);
    if (total && *total > 0) {
        workers = std::min(workers, *total);
    }

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        pool.emplace_back(worker);
    }
    for (auto& t : pool) {
        t.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    if (result.cancelled) {
        LOG_WARN("Trial scheduling cancelled after {} completed trials", result.completed.size());
    }
    return result;
}

} // namespace optimize
} // namespace stratopt

#pragma once

#include <atomic>

namespace stratopt {
namespace optimize {

// Cooperative cancellation flag shared by the caller, the search strategy and
// the scheduler workers. Checked only before a trial starts.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace optimize
} // namespace stratopt

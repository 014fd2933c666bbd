#pragma once

#include <optional>
#include <random>

#include "core/contracts/ISearchBackend.h"
#include "optimize/ParamSpace.h"

namespace stratopt {
namespace optimize {

// Uniform sampler over a ParamSpace. Reproducible for a given seed.
class RandomSearchBackend : public core::ISearchBackend {
public:
    static constexpr unsigned kDefaultSeed = 42;

    explicit RandomSearchBackend(const ParamSpace& space, unsigned seed = kDefaultSeed);

    core::ParameterCombination suggest() override;
    void report(const core::ParameterCombination& combination, double score) override;

    std::optional<core::ParameterCombination> bestCombination() const { return best_; }
    double bestScore() const { return best_score_; }
    int reportedCount() const { return reported_; }

private:
    const ParamSpace& space_;
    std::mt19937 rng_;
    std::optional<core::ParameterCombination> best_;
    double best_score_ = 0.0;
    int reported_ = 0;
};

} // namespace optimize
} // namespace stratopt

#include "optimize/RandomSearchBackend.h"
#include "common/Errors.h"

namespace stratopt {
namespace optimize {

RandomSearchBackend::RandomSearchBackend(const ParamSpace& space, unsigned seed)
    : space_(space)
    , rng_(seed) {
    if (space_.empty()) {
        throw InvalidSpaceError("Random search requires a non-empty parameter space");
    }
}

core::ParameterCombination RandomSearchBackend::suggest() {
    return space_.sample(rng_);
}

void RandomSearchBackend::report(const core::ParameterCombination& combination, double score) {
    ++reported_;
    if (!best_ || score > best_score_) {
        best_ = combination;
        best_score_ = score;
    }
}

} // namespace optimize
} // namespace stratopt

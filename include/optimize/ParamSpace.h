#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/OptimizationTypes.h"

namespace stratopt {
namespace optimize {

enum class ParamKind {
    DISCRETE,
    RANGE
};

struct ParameterSpec {
    std::string name;
    ParamKind kind = ParamKind::DISCRETE;
    std::vector<core::ParamValue> values;   // DISCRETE
    double low = 0.0;                       // RANGE
    double high = 0.0;
    double step = 0.0;

    static ParameterSpec discrete(std::string name, std::vector<core::ParamValue> values);
    static ParameterSpec range(std::string name, double low, double high, double step);
};

// Finite, ordered, deduplicated parameter grid.
//
// Enumeration order is lexicographic over parameter names (the first name varies
// slowest), then ascending over each parameter's declared value order. A range
// whose step does not divide it evenly is truncated at the last value <= high.
class ParamSpace {
public:
    ParamSpace() = default;
    // Throws InvalidSpaceError on empty sets, inverted bounds, non-positive steps
    // or duplicate names.
    explicit ParamSpace(std::vector<ParameterSpec> specs);

    // Accepts lists (discrete) and {type: int|float, low, high, step} or
    // {type: categorical, choices} objects.
    static ParamSpace fromJson(const nlohmann::json& param_grid);
    nlohmann::json toJson() const;

    std::vector<core::ParameterCombination> enumerate() const;
    // Product of arities, saturating at UINT64_MAX.
    std::uint64_t size() const;
    core::ParameterCombination at(std::uint64_t index) const;
    core::ParameterCombination sample(std::mt19937& rng) const;

    std::vector<std::string> names() const;
    const std::vector<core::ParamValue>& valuesOf(const std::string& name) const;
    const std::vector<ParameterSpec>& specs() const { return specs_; }
    bool empty() const { return axes_.empty(); }

    // One declared value per parameter and nothing else.
    bool contains(const core::ParameterCombination& combination) const;

private:
    struct Axis {
        std::string name;
        std::vector<core::ParamValue> values;
    };

    static Axis materialize(const ParameterSpec& spec);

    std::vector<ParameterSpec> specs_;
    std::vector<Axis> axes_;   // sorted by name
};

} // namespace optimize
} // namespace stratopt

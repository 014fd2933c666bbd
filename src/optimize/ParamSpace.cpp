#include "optimize/ParamSpace.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace stratopt {
namespace optimize {

namespace {
constexpr double kStepTolerance = 1e-9;
constexpr double kMaxRangeValues = 1e7;

bool isIntegral(double v) {
    return std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15;
}

double roundDecimal(double v) {
    return std::round(v * 1e12) / 1e12;
}

bool isScalarValue(const core::ParamValue& v) {
    return v.is_number() || v.is_string() || v.is_boolean();
}

ParameterSpec parseRangeSpec(const std::string& name, const nlohmann::json& raw) {
    const std::string type = raw.value("type", std::string("float"));
    if (!raw.contains("low") || !raw.contains("high")) {
        throw InvalidSpaceError("Range parameter '" + name + "' requires 'low' and 'high'");
    }
    if (!raw["low"].is_number() || !raw["high"].is_number()) {
        throw InvalidSpaceError("Range parameter '" + name + "' bounds must be numeric");
    }
    const double low = raw["low"].get<double>();
    const double high = raw["high"].get<double>();
    double step = 0.0;
    if (raw.contains("step") && raw["step"].is_number()) {
        step = raw["step"].get<double>();
    } else if (type == "int") {
        step = 1.0;
    } else {
        throw InvalidSpaceError("Float range parameter '" + name + "' requires a 'step'");
    }
    if (type == "int" && (!isIntegral(low) || !isIntegral(high) || !isIntegral(step))) {
        throw InvalidSpaceError("Integer range parameter '" + name + "' has non-integral bounds or step");
    }
    return ParameterSpec::range(name, low, high, step);
}
}

ParameterSpec ParameterSpec::discrete(std::string name, std::vector<core::ParamValue> values) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::DISCRETE;
    spec.values = std::move(values);
    return spec;
}

ParameterSpec ParameterSpec::range(std::string name, double low, double high, double step) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.kind = ParamKind::RANGE;
    spec.low = low;
    spec.high = high;
    spec.step = step;
    return spec;
}

ParamSpace::ParamSpace(std::vector<ParameterSpec> specs)
    : specs_(std::move(specs)) {
    if (specs_.empty()) {
        throw InvalidSpaceError("Parameter space declares no parameters");
    }

    std::set<std::string> seen;
    for (const auto& spec : specs_) {
        if (spec.name.empty()) {
            throw InvalidSpaceError("Parameter name must not be empty");
        }
        if (!seen.insert(spec.name).second) {
            throw InvalidSpaceError("Duplicate parameter name: '" + spec.name + "'");
        }
        axes_.push_back(materialize(spec));
    }

    std::sort(axes_.begin(), axes_.end(), [](const Axis& a, const Axis& b) {
        return a.name < b.name;
    });
}

ParamSpace::Axis ParamSpace::materialize(const ParameterSpec& spec) {
    Axis axis;
    axis.name = spec.name;

    if (spec.kind == ParamKind::DISCRETE) {
        if (spec.values.empty()) {
            throw InvalidSpaceError("Discrete parameter '" + spec.name + "' has no values");
        }
        for (const auto& v : spec.values) {
            if (!isScalarValue(v)) {
                throw InvalidSpaceError("Parameter '" + spec.name + "' has a non-scalar value: " + v.dump());
            }
            if (v.is_number_float() && !std::isfinite(v.get<double>())) {
                throw InvalidSpaceError("Parameter '" + spec.name + "' has a non-finite value");
            }
            const bool duplicate = std::find(axis.values.begin(), axis.values.end(), v) != axis.values.end();
            if (!duplicate) {
                axis.values.push_back(v);
            }
        }
        return axis;
    }

    if (!std::isfinite(spec.low) || !std::isfinite(spec.high) || !std::isfinite(spec.step)) {
        throw InvalidSpaceError("Range parameter '" + spec.name + "' has non-finite bounds");
    }
    if (spec.low > spec.high) {
        throw InvalidSpaceError("Range parameter '" + spec.name + "' has inverted bounds");
    }
    if (spec.step <= 0.0) {
        throw InvalidSpaceError("Range parameter '" + spec.name + "' requires a positive step");
    }

    const double span = (spec.high - spec.low) / spec.step;
    if (span > kMaxRangeValues) {
        throw InvalidSpaceError("Range parameter '" + spec.name + "' produces too many values");
    }
    const auto count = static_cast<std::uint64_t>(std::floor(span * (1.0 + kStepTolerance) + kStepTolerance)) + 1;
    const bool integral = isIntegral(spec.low) && isIntegral(spec.high) && isIntegral(spec.step);

    axis.values.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
        const double v = spec.low + static_cast<double>(i) * spec.step;
        nlohmann::json value = integral
            ? nlohmann::json(static_cast<long long>(std::llround(v)))
            : nlohmann::json(roundDecimal(v));
        // Values are ascending, so rounding can only repeat the previous one.
        if (axis.values.empty() || axis.values.back() != value) {
            axis.values.push_back(std::move(value));
        }
    }
    return axis;
}

ParamSpace ParamSpace::fromJson(const nlohmann::json& param_grid) {
    if (!param_grid.is_object()) {
        throw InvalidSpaceError("param_grid must be a JSON object");
    }

    std::vector<ParameterSpec> specs;
    for (auto it = param_grid.begin(); it != param_grid.end(); ++it) {
        const std::string& name = it.key();
        const auto& raw = it.value();

        if (raw.is_array()) {
            specs.push_back(ParameterSpec::discrete(name, raw.get<std::vector<nlohmann::json>>()));
            continue;
        }
        if (!raw.is_object()) {
            throw InvalidSpaceError("Invalid declaration for parameter '" + name + "': " + raw.dump());
        }

        const std::string type = raw.value("type", std::string());
        if (type == "categorical") {
            const auto choices = raw.value("choices", nlohmann::json::array());
            specs.push_back(ParameterSpec::discrete(name, choices.get<std::vector<nlohmann::json>>()));
        } else if (raw.contains("values")) {
            specs.push_back(ParameterSpec::discrete(name, raw["values"].get<std::vector<nlohmann::json>>()));
        } else {
            specs.push_back(parseRangeSpec(name, raw));
        }
    }
    return ParamSpace(std::move(specs));
}

nlohmann::json ParamSpace::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& spec : specs_) {
        if (spec.kind == ParamKind::DISCRETE) {
            out[spec.name] = spec.values;
        } else {
            out[spec.name] = {
                {"type", (isIntegral(spec.low) && isIntegral(spec.high) && isIntegral(spec.step)) ? "int" : "float"},
                {"low", spec.low},
                {"high", spec.high},
                {"step", spec.step}
            };
        }
    }
    return out;
}

std::vector<core::ParameterCombination> ParamSpace::enumerate() const {
    std::vector<core::ParameterCombination> out;
    if (axes_.empty()) {
        return out;
    }

    std::vector<std::size_t> indices(axes_.size(), 0);
    while (true) {
        std::map<std::string, core::ParamValue> values;
        for (std::size_t i = 0; i < axes_.size(); ++i) {
            values.emplace(axes_[i].name, axes_[i].values[indices[i]]);
        }
        out.emplace_back(std::move(values));

        // Odometer: last axis varies fastest.
        std::size_t pos = axes_.size();
        while (pos > 0) {
            --pos;
            if (++indices[pos] < axes_[pos].values.size()) {
                break;
            }
            indices[pos] = 0;
            if (pos == 0) {
                return out;
            }
        }
    }
}

std::uint64_t ParamSpace::size() const {
    if (axes_.empty()) {
        return 0;
    }
    std::uint64_t total = 1;
    for (const auto& axis : axes_) {
        const std::uint64_t arity = axis.values.size();
        if (total > std::numeric_limits<std::uint64_t>::max() / arity) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        total *= arity;
    }
    return total;
}

core::ParameterCombination ParamSpace::at(std::uint64_t index) const {
    if (index >= size()) {
        throw InvalidArgumentError("Combination index out of range: " + std::to_string(index));
    }

    std::map<std::string, core::ParamValue> values;
    for (std::size_t i = axes_.size(); i > 0; --i) {
        const auto& axis = axes_[i - 1];
        const std::uint64_t arity = axis.values.size();
        values.emplace(axis.name, axis.values[static_cast<std::size_t>(index % arity)]);
        index /= arity;
    }
    return core::ParameterCombination(std::move(values));
}

core::ParameterCombination ParamSpace::sample(std::mt19937& rng) const {
    std::map<std::string, core::ParamValue> values;
    for (const auto& axis : axes_) {
        std::uniform_int_distribution<std::size_t> pick(0, axis.values.size() - 1);
        values.emplace(axis.name, axis.values[pick(rng)]);
    }
    return core::ParameterCombination(std::move(values));
}

std::vector<std::string> ParamSpace::names() const {
    std::vector<std::string> out;
    out.reserve(axes_.size());
    for (const auto& axis : axes_) {
        out.push_back(axis.name);
    }
    return out;
}

const std::vector<core::ParamValue>& ParamSpace::valuesOf(const std::string& name) const {
    for (const auto& axis : axes_) {
        if (axis.name == name) {
            return axis.values;
        }
    }
    throw InvalidArgumentError("Unknown parameter: '" + name + "'");
}

bool ParamSpace::contains(const core::ParameterCombination& combination) const {
    if (combination.size() != axes_.size()) {
        return false;
    }
    for (const auto& axis : axes_) {
        if (!combination.contains(axis.name)) {
            return false;
        }
        const auto& v = combination.get(axis.name);
        if (std::find(axis.values.begin(), axis.values.end(), v) == axis.values.end()) {
            return false;
        }
    }
    return true;
}

} // namespace optimize
} // namespace stratopt

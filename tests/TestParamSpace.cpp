#include "optimize/ParamSpace.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <set>

using namespace stratopt;
using optimize::ParamSpace;
using optimize::ParameterSpec;

namespace {

int testEnumerationOrderAndCount() {
    const auto space = ParamSpace::fromJson(nlohmann::json::parse(R"({
        "q": [10, 20],
        "p": [1, 2],
        "mode": ["fast", "slow", "fast"]
    })"));

    // Duplicate "fast" is dropped.
    STRATOPT_CHECK(space.size() == 8, "size should be 2*2*2, got " << space.size());

    const auto all = space.enumerate();
    STRATOPT_CHECK(all.size() == 8, "enumerate count mismatch");

    std::set<std::string> distinct;
    for (const auto& c : all) {
        STRATOPT_CHECK(c.size() == 3, "each combination needs one value per parameter");
        distinct.insert(c.toString());
    }
    STRATOPT_CHECK(distinct.size() == 8, "combinations must be distinct");

    // Names sorted: mode, p, q. The first name varies slowest.
    STRATOPT_CHECK(all[0].get("mode") == "fast" && all[0].getInt("p") == 1 && all[0].getInt("q") == 10,
                   "unexpected first combination " << all[0].toString());
    STRATOPT_CHECK(all[1].getInt("q") == 20 && all[1].getInt("p") == 1, "q should vary fastest");
    STRATOPT_CHECK(all[2].getInt("p") == 2 && all[2].getInt("q") == 10, "p should vary next");
    STRATOPT_CHECK(all[4].get("mode") == "slow", "mode should vary slowest");

    for (std::uint64_t i = 0; i < space.size(); ++i) {
        STRATOPT_CHECK(space.at(i) == all[i], "at(" << i << ") disagrees with enumerate()");
    }
    return 0;
}

int testRangeTruncation() {
    ParamSpace ints({ParameterSpec::range("n", 1, 10, 4)});
    const auto& values = ints.valuesOf("n");
    STRATOPT_CHECK(values.size() == 3, "1..10 step 4 should give 1,5,9");
    STRATOPT_CHECK(values[2].is_number_integer() && values[2].get<int>() == 9, "last value should be 9");

    ParamSpace floats({ParameterSpec::range("x", 0.1, 0.5, 0.1)});
    const auto& fv = floats.valuesOf("x");
    STRATOPT_CHECK(fv.size() == 5, "0.1..0.5 step 0.1 should give 5 values, got " << fv.size());
    STRATOPT_CHECK(fv[0].is_number_float(), "float range values should be floating point");
    STRATOPT_CHECK(std::abs(fv[4].get<double>() - 0.5) < 1e-12, "last float value should be 0.5");

    // Steps below the rounding precision collapse onto the same values.
    ParamSpace tiny({ParameterSpec::range("eps", 0.0, 1e-12, 1e-13)});
    const auto& tv = tiny.valuesOf("eps");
    STRATOPT_CHECK(tv.size() == 2, "sub-precision step should leave 0 and 1e-12, got " << tv.size());
    STRATOPT_CHECK(tv[0] != tv[1], "range values are distinct");
    STRATOPT_CHECK(tiny.size() == 2, "space size follows the distinct values");

    const auto space = ParamSpace::fromJson(nlohmann::json::parse(R"({
        "period": {"type": "int", "low": 5, "high": 20, "step": 5},
        "kind": {"type": "categorical", "choices": ["ema", "sma"]}
    })"));
    STRATOPT_CHECK(space.size() == 8, "4 periods x 2 kinds expected, got " << space.size());
    return 0;
}

int testInvalidSpaces() {
    const char* bad[] = {
        R"({})",
        R"({"a": []})",
        R"({"a": {"type": "int", "low": 10, "high": 1, "step": 1}})",
        R"({"a": {"type": "float", "low": 0.0, "high": 1.0, "step": 0.0}})",
        R"({"a": {"type": "float", "low": 0.0, "high": 1.0}})",
        R"({"a": 5})"
    };

    for (const char* raw : bad) {
        bool threw = false;
        try {
            ParamSpace::fromJson(nlohmann::json::parse(raw));
        } catch (const InvalidSpaceError&) {
            threw = true;
        }
        STRATOPT_CHECK(threw, "expected InvalidSpaceError for " << raw);
    }

    bool duplicate = false;
    try {
        ParamSpace({ParameterSpec::discrete("a", {1}), ParameterSpec::discrete("a", {2})});
    } catch (const InvalidSpaceError&) {
        duplicate = true;
    }
    STRATOPT_CHECK(duplicate, "duplicate parameter names must be rejected");
    return 0;
}

int testSampleAndContains() {
    const auto space = ParamSpace::fromJson(nlohmann::json::parse(R"({"a": [1, 2, 3], "b": [true, false]})"));

    std::mt19937 rng_a(7);
    std::mt19937 rng_b(7);
    for (int i = 0; i < 20; ++i) {
        const auto sa = space.sample(rng_a);
        const auto sb = space.sample(rng_b);
        STRATOPT_CHECK(sa == sb, "same seed should give same samples");
        STRATOPT_CHECK(space.contains(sa), "sample outside the space: " << sa.toString());
    }

    std::map<std::string, core::ParamValue> values;
    values["a"] = 4;
    values["b"] = true;
    const core::ParameterCombination outside(values);
    STRATOPT_CHECK(!space.contains(outside), "value 4 is not declared");
    return 0;
}

int testSizeSaturates() {
    std::vector<ParameterSpec> specs;
    for (int i = 0; i < 4; ++i) {
        specs.push_back(ParameterSpec::range("p" + std::to_string(i), 0, 99999, 1));
    }
    ParamSpace huge(std::move(specs));
    STRATOPT_CHECK(huge.size() == std::numeric_limits<std::uint64_t>::max(), "size should saturate");
    return 0;
}

}

int main() {
    if (testEnumerationOrderAndCount() != 0) return 1;
    if (testRangeTruncation() != 0) return 1;
    if (testInvalidSpaces() != 0) return 1;
    if (testSampleAndContains() != 0) return 1;
    if (testSizeSaturates() != 0) return 1;

    std::cout << "[TEST] ParamSpace PASSED\n";
    return 0;
}

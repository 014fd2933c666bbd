#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace stratopt {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    *this = Config();
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: results_dir=" << results_dir_
                  << ", presets=" << presets_.size() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("optimizer")) {
        auto& o = j["optimizer"];
        results_dir_ = o.value("results_dir", std::string("results"));
        log_dir_ = o.value("log_dir", std::string("logs"));
        default_concurrency_ = o.value("default_concurrency", 0);
        trial_timeout_ms_ = o.value("trial_timeout_ms", 0LL);
        grid_warn_combinations_ = o.value("grid_warn_combinations", static_cast<std::uint64_t>(10000));
        grid_max_combinations_ = o.value("grid_max_combinations", static_cast<std::uint64_t>(100000));
        reconcile_on_open_ = o.value("reconcile_on_open", true);
    }

    presets_ = j.value("presets", nlohmann::json::object());
    strategy_defaults_ = j.value("strategy_defaults", nlohmann::json::object());
}

std::vector<std::string> Config::listPresets() const {
    std::vector<std::string> names;
    for (auto it = presets_.begin(); it != presets_.end(); ++it) {
        names.push_back(it.key());
    }
    return names;
}

std::optional<nlohmann::json> Config::getPreset(const std::string& name) const {
    if (!presets_.contains(name)) {
        LOG_WARN("Preset '{}' not found", name);
        return std::nullopt;
    }
    return presets_[name];
}

std::optional<nlohmann::json> Config::getStrategyDefaults(const std::string& strategy) const {
    if (!strategy_defaults_.contains(strategy)) {
        return std::nullopt;
    }
    return strategy_defaults_[strategy];
}

nlohmann::json Config::buildRequest(
    const std::string& strategy,
    const std::string& preset_name,
    const nlohmann::json& overrides
) const {
    auto preset = getPreset(preset_name);
    if (!preset) {
        std::string available;
        for (const auto& name : listPresets()) {
            available += available.empty() ? name : ", " + name;
        }
        throw InvalidArgumentError("Preset '" + preset_name + "' not found. Available: [" + available + "]");
    }

    nlohmann::json request = *preset;
    bool adapted = false;

    const auto defaults = getStrategyDefaults(strategy);
    if (defaults && defaults->contains("param_grid") && !(*defaults)["param_grid"].empty()) {
        request["param_grid"] = (*defaults)["param_grid"];
        adapted = true;
    } else {
        LOG_WARN("No strategy_defaults for '{}', keeping param_grid of preset '{}'", strategy, preset_name);
    }

    request["strategy"] = strategy;
    if (overrides.is_object() && !overrides.empty()) {
        request.merge_patch(overrides);
    }

    request["_metadata"] = {
        {"strategy_name", strategy},
        {"preset_name", preset_name},
        {"adapted", adapted},
        {"timestamp", utils::DateUtils::toIsoUtc(utils::DateUtils::nowMs())}
    };
    return request;
}

nlohmann::json Config::createCustom(
    const std::vector<std::string>& symbols,
    const std::string& start_date,
    const std::string& end_date,
    const nlohmann::json& param_grid,
    double capital,
    const std::string& name,
    const std::string& description
) {
    nlohmann::json request;
    request["name"] = name;
    request["description"] = description;
    request["symbols"] = symbols;
    request["period"] = {{"start", start_date}, {"end", end_date}};
    request["capital"] = capital;
    request["param_grid"] = param_grid;
    return request;
}

} // namespace stratopt

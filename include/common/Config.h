#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace stratopt {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    // Same as load() but from an in-memory document; unknown keys are ignored.
    void loadFromJson(const nlohmann::json& j);
    void reset();

    std::string getResultsDir() const { return results_dir_; }
    std::string getLogDir() const { return log_dir_; }
    // 0 = hardware parallelism
    int getDefaultConcurrency() const { return default_concurrency_; }
    long long getTrialTimeoutMs() const { return trial_timeout_ms_; }
    std::uint64_t getGridWarnCombinations() const { return grid_warn_combinations_; }
    std::uint64_t getGridMaxCombinations() const { return grid_max_combinations_; }
    bool isReconcileOnOpen() const { return reconcile_on_open_; }

    // Preset library
    std::vector<std::string> listPresets() const;
    std::optional<nlohmann::json> getPreset(const std::string& name) const;
    std::optional<nlohmann::json> getStrategyDefaults(const std::string& strategy) const;

    // Preset + the strategy's default param_grid + overrides (merge patch),
    // stamped with _metadata. Throws InvalidArgumentError for unknown presets.
    nlohmann::json buildRequest(
        const std::string& strategy,
        const std::string& preset_name = "standard",
        const nlohmann::json& overrides = nlohmann::json::object()
    ) const;

    static nlohmann::json createCustom(
        const std::vector<std::string>& symbols,
        const std::string& start_date,
        const std::string& end_date,
        const nlohmann::json& param_grid,
        double capital = 100000.0,
        const std::string& name = "Custom",
        const std::string& description = ""
    );

private:
    Config() = default;

    std::string results_dir_ = "results";
    std::string log_dir_ = "logs";
    int default_concurrency_ = 0;
    long long trial_timeout_ms_ = 0;          // 0 = no per-trial timeout
    std::uint64_t grid_warn_combinations_ = 10000;
    std::uint64_t grid_max_combinations_ = 100000;
    bool reconcile_on_open_ = true;

    nlohmann::json presets_ = nlohmann::json::object();
    nlohmann::json strategy_defaults_ = nlohmann::json::object();
};

} // namespace stratopt

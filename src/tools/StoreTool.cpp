#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/ResultsStoreJson.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace {
void printUsage() {
    std::cerr << "Usage: StratOptStoreTool <reconcile|compact|list|stats> [results_dir] [strategy]\n";
}

std::string formatOptional(const std::optional<double>& v) {
    if (!v) {
        return "-";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << *v;
    return oss.str();
}
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];

    try {
        auto& cfg = stratopt::Config::getInstance();
        cfg.load("config/stratopt.json");
        stratopt::Logger::getInstance().initialize(cfg.getLogDir());

        std::filesystem::path results_dir = argc >= 3
            ? std::filesystem::path(argv[2])
            : stratopt::utils::PathUtils::resolveRelativePath(cfg.getResultsDir());

        // The reconcile command reports what it fixes, so it must not run on open.
        const bool reconcile_on_open = command != "reconcile" && cfg.isReconcileOnOpen();
        stratopt::core::ResultsStoreJson store(results_dir, reconcile_on_open);

        if (command == "reconcile") {
            const auto report = store.reconcile();
            std::cout << "orphan details removed: " << report.orphan_details << "\n"
                      << "temp files removed:     " << report.stale_temp_files << "\n"
                      << "dangling entries:       " << report.dangling_entries << "\n";
            return 0;
        }

        if (command == "compact") {
            const auto dropped = store.compact();
            std::cout << "Index compacted, dropped " << dropped << " lines\n";
            return 0;
        }

        if (command == "list") {
            stratopt::core::RunFilter filter;
            if (argc >= 4) {
                filter.strategy_id = std::string(argv[3]);
            }
            for (const auto& e : store.list(filter)) {
                std::cout << e.run_id << "  " << e.created_at << "  " << e.strategy_id << "  "
                          << stratopt::core::toString(e.search_kind)
                          << "  sharpe=" << formatOptional(e.best_sharpe)
                          << "  return=" << formatOptional(e.best_return)
                          << "  trials=" << e.trial_count
                          << (e.cancelled ? "  [cancelled]" : "")
                          << (e.robust ? "" : "  [not robust]") << "\n";
            }
            return 0;
        }

        if (command == "stats") {
            const auto stats = store.statistics();
            std::cout << "runs:        " << stats.total_runs << "\n"
                      << "strategies:  " << stats.strategies.size() << "\n"
                      << "best sharpe: " << formatOptional(stats.best_sharpe) << "\n"
                      << "avg sharpe:  " << formatOptional(stats.avg_sharpe) << "\n"
                      << "best return: " << formatOptional(stats.best_return) << "\n"
                      << "avg return:  " << formatOptional(stats.avg_return) << "\n";
            return 0;
        }

        printUsage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Store tool failed: " << e.what() << "\n";
        return 1;
    }
}

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IResultsStore.h"

namespace stratopt {
namespace core {

struct ReconcileReport {
    int orphan_details = 0;      // detail files with no live index entry
    int stale_temp_files = 0;    // interrupted detail writes
    int dangling_entries = 0;    // index entries whose detail vanished
};

// <root>/index.jsonl   append-only {"op":"add"|"delete", "seq", ...} lines
// <root>/details/<run_id>.json
//
// Detail is written (temp file + rename) before its index line; removal
// retires the index line first. One store instance owns a directory.
class ResultsStoreJson : public IResultsStore {
public:
    explicit ResultsStoreJson(std::filesystem::path root, bool reconcile_on_open = false);

    std::string save(RunRecord record) override;
    std::vector<RunIndexEntry> list(const RunFilter& filter = {},
                                    const RunSort& sort = {}) const override;
    RunRecord get(const std::string& run_id) const override;
    void remove(const std::string& run_id) override;
    ComparisonTable compare(const std::vector<std::string>& run_ids) const override;

    ReconcileReport reconcile();
    // Rewrites the index without tombstones. Returns the number of lines dropped.
    std::size_t compact();
    StoreStatistics statistics() const;
    // SHARPE or TOTAL_RETURN; the index carries no other metric.
    std::optional<RunIndexEntry> bestRun(const std::optional<std::string>& strategy_id,
                                         RankMetric metric = RankMetric::SHARPE) const;

    bool contains(const std::string& run_id) const;
    std::uint64_t lastSeq() const;
    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path indexPath() const;
    std::filesystem::path detailPath(const std::string& run_id) const;

private:
    struct IndexSlot {
        std::uint64_t seq = 0;
        RunIndexEntry entry;
    };

    void loadIndex();
    std::string allocateRunId(const RunRecord& record);
    void appendIndexLine(nlohmann::json line);
    RunRecord readDetail(const std::string& run_id) const;
    void writeDetail(const RunRecord& record) const;

    std::filesystem::path root_;
    mutable std::mutex index_mutex_;
    std::map<std::string, IndexSlot> entries_;
    std::set<std::string> reserved_ids_;
    std::uint64_t last_seq_ = 0;
    std::size_t index_lines_ = 0;    // valid lines currently in index.jsonl
    bool torn_tail_ = false;         // index.jsonl does not end with a newline
};

} // namespace core
} // namespace stratopt

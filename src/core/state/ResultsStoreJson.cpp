#include "core/state/ResultsStoreJson.h"
#include "core/state/RunId.h"
#include "core/state/RunRecordCodec.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <system_error>

namespace stratopt {
namespace core {

namespace {
constexpr int kMaxCompareRuns = 5;
constexpr int kMinCompareRuns = 2;
const char* kTempSuffix = ".tmp";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Rename with a copy fallback for filesystems that refuse to replace.
bool replaceFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return true;
    }

    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }
    std::filesystem::remove(from, ec);
    return true;
}

double sortValue(const std::optional<double>& v) {
    return v ? *v : -std::numeric_limits<double>::infinity();
}

// Negative, zero or positive, ascending order.
int compareEntries(const RunIndexEntry& a, const RunIndexEntry& b, RunSortField field) {
    auto cmp = [](const auto& x, const auto& y) { return x < y ? -1 : (y < x ? 1 : 0); };
    switch (field) {
        case RunSortField::CREATED_AT: return cmp(a.created_at_ms, b.created_at_ms);
        case RunSortField::RUN_ID: return cmp(a.run_id, b.run_id);
        case RunSortField::STRATEGY: return cmp(a.strategy_id, b.strategy_id);
        case RunSortField::SEARCH_KIND: return cmp(toString(a.search_kind), toString(b.search_kind));
        case RunSortField::BEST_SHARPE: return cmp(sortValue(a.best_sharpe), sortValue(b.best_sharpe));
        case RunSortField::BEST_RETURN: return cmp(sortValue(a.best_return), sortValue(b.best_return));
        case RunSortField::WINDOW_START: return cmp(a.window.start, b.window.start);
        case RunSortField::WINDOW_END: return cmp(a.window.end, b.window.end);
        case RunSortField::TRIAL_COUNT: return cmp(a.trial_count, b.trial_count);
    }
    return 0;
}

bool matches(const RunIndexEntry& entry, const RunFilter& filter,
             const std::optional<long long>& from_day, const std::optional<long long>& to_day) {
    if (filter.strategy_id && entry.strategy_id != *filter.strategy_id) {
        return false;
    }
    if (filter.search_kind && entry.search_kind != *filter.search_kind) {
        return false;
    }
    if (filter.min_sharpe && (!entry.best_sharpe || *entry.best_sharpe < *filter.min_sharpe)) {
        return false;
    }
    const long long day = utils::DateUtils::epochDayOfMs(entry.created_at_ms);
    if (from_day && day < *from_day) {
        return false;
    }
    if (to_day && day > *to_day) {
        return false;
    }
    if (!filter.symbols.empty()) {
        const bool overlap = std::any_of(filter.symbols.begin(), filter.symbols.end(),
            [&entry](const std::string& s) {
                return std::find(entry.symbols.begin(), entry.symbols.end(), s) != entry.symbols.end();
            });
        if (!overlap) {
            return false;
        }
    }
    return true;
}

nlohmann::json optionalCell(const std::optional<BestResult>& best, double MetricsRecord::*field) {
    return best ? nlohmann::json(best->metrics.*field) : nlohmann::json(nullptr);
}
}

ResultsStoreJson::ResultsStoreJson(std::filesystem::path root, bool reconcile_on_open)
    : root_(std::move(root)) {
    std::error_code ec;
    std::filesystem::create_directories(root_ / "details", ec);
    if (ec) {
        throw StorageError("Cannot create results directory " + root_.string() + ": " + ec.message());
    }

    loadIndex();
    LOG_INFO("Results store opened: {} ({} runs)", root_.string(), entries_.size());

    if (reconcile_on_open) {
        reconcile();
    }
}

std::filesystem::path ResultsStoreJson::indexPath() const {
    return root_ / "index.jsonl";
}

std::filesystem::path ResultsStoreJson::detailPath(const std::string& run_id) const {
    return root_ / "details" / (run_id + ".json");
}

void ResultsStoreJson::loadIndex() {
    std::lock_guard<std::mutex> lock(index_mutex_);

    std::ifstream in(indexPath(), std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    int malformed = 0;
    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            ++malformed;
            continue;
        }

        const auto seq = line.value("seq", static_cast<std::uint64_t>(0));
        last_seq_ = (std::max)(last_seq_, seq);
        const std::string op = line.value("op", std::string());

        try {
            if (op == "add") {
                auto entry = RunRecordCodec::entryFromJson(line.at("entry"));
                const std::string id = entry.run_id;
                entries_[id] = IndexSlot{seq, std::move(entry)};
            } else if (op == "delete") {
                entries_.erase(line.value("run_id", std::string()));
            } else {
                ++malformed;
                continue;
            }
        } catch (const std::exception&) {
            ++malformed;
            continue;
        }
        ++index_lines_;
    }

    if (malformed > 0) {
        LOG_WARN("Skipped {} malformed index lines in {}", malformed, indexPath().string());
    }

    // An interrupted append leaves a partial last line; the next append starts on a fresh line.
    in.clear();
    in.seekg(0, std::ios::end);
    if (in.tellg() > 0) {
        in.seekg(-1, std::ios::end);
        char last = '\n';
        in.get(last);
        torn_tail_ = in.good() && last != '\n';
    }
    if (torn_tail_) {
        LOG_WARN("Index {} ends with a partial line", indexPath().string());
    }
}

void ResultsStoreJson::appendIndexLine(nlohmann::json line) {
    const std::uint64_t next_seq = last_seq_ + 1;
    line["seq"] = next_seq;

    std::ofstream out(indexPath(), std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw StorageError("Cannot open index " + indexPath().string());
    }
    if (torn_tail_) {
        out << "\n";
    }
    out << line.dump() << "\n";
    out.flush();
    if (!out) {
        throw StorageError("Failed to append to index " + indexPath().string());
    }

    torn_tail_ = false;
    last_seq_ = next_seq;
    ++index_lines_;
}

std::string ResultsStoreJson::allocateRunId(const RunRecord& record) {
    for (int n = 0;; ++n) {
        const auto candidate = makeRunId(record.strategy_id, record.search_kind, record.created_at_ms, n);
        if (entries_.count(candidate) || reserved_ids_.count(candidate)) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::exists(detailPath(candidate), ec)) {
            continue;
        }
        reserved_ids_.insert(candidate);
        return candidate;
    }
}

void ResultsStoreJson::writeDetail(const RunRecord& record) const {
    const auto final_path = detailPath(record.run_id);
    auto tmp_path = final_path;
    tmp_path += kTempSuffix;

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Cannot write " + tmp_path.string());
        }
        out << RunRecordCodec::toJson(record).dump(2);
        out.flush();
        if (!out) {
            throw StorageError("Failed writing " + tmp_path.string());
        }
    }

    if (!replaceFile(tmp_path, final_path)) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        throw StorageError("Cannot move " + tmp_path.string() + " into place");
    }
}

std::string ResultsStoreJson::save(RunRecord record) {
    if (record.strategy_id.empty()) {
        throw InvalidArgumentError("Run record has no strategy id");
    }
    if (record.created_at_ms == 0) {
        record.created_at_ms = utils::DateUtils::nowMs();
    }
    record.created_at = utils::DateUtils::toIsoUtc(record.created_at_ms);

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        record.run_id = allocateRunId(record);
    }

    // Detail writes for different runs are not serialized.
    try {
        writeDetail(record);
    } catch (...) {
        std::lock_guard<std::mutex> lock(index_mutex_);
        reserved_ids_.erase(record.run_id);
        throw;
    }

    auto entry = RunIndexEntry::fromRecord(record);
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        nlohmann::json line;
        line["op"] = "add";
        line["entry"] = RunRecordCodec::toJson(entry);
        try {
            appendIndexLine(std::move(line));
        } catch (...) {
            reserved_ids_.erase(record.run_id);
            std::error_code ec;
            std::filesystem::remove(detailPath(record.run_id), ec);
            throw;
        }
        entries_[record.run_id] = IndexSlot{last_seq_, entry};
        reserved_ids_.erase(record.run_id);
    }

    LOG_INFO("Saved run {} ({} trials)", record.run_id, entry.trial_count);
    return record.run_id;
}

std::vector<RunIndexEntry> ResultsStoreJson::list(const RunFilter& filter, const RunSort& sort) const {
    std::optional<long long> from_day;
    std::optional<long long> to_day;
    if (filter.created_from) {
        from_day = utils::DateUtils::toEpochDay(*filter.created_from);
    }
    if (filter.created_to) {
        to_day = utils::DateUtils::toEpochDay(*filter.created_to);
    }

    std::vector<RunIndexEntry> out;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        for (const auto& [id, slot] : entries_) {
            if (matches(slot.entry, filter, from_day, to_day)) {
                out.push_back(slot.entry);
            }
        }
    }

    std::sort(out.begin(), out.end(), [&sort](const RunIndexEntry& a, const RunIndexEntry& b) {
        int c = compareEntries(a, b, sort.field);
        if (c == 0) {
            c = a.run_id.compare(b.run_id);
        }
        return sort.descending ? c > 0 : c < 0;
    });
    return out;
}

RunRecord ResultsStoreJson::readDetail(const std::string& run_id) const {
    const auto path = detailPath(run_id);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw NotFoundError("Run detail missing: " + run_id);
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return RunRecordCodec::recordFromJson(raw);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt run detail " + path.string() + ": " + e.what());
    } catch (const StratOptError& e) {
        throw StorageError("Corrupt run detail " + path.string() + ": " + e.what());
    }
}

RunRecord ResultsStoreJson::get(const std::string& run_id) const {
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (entries_.find(run_id) == entries_.end()) {
            throw NotFoundError("Run not found: " + run_id);
        }
    }
    return readDetail(run_id);
}

bool ResultsStoreJson::contains(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return entries_.find(run_id) != entries_.end();
}

std::uint64_t ResultsStoreJson::lastSeq() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return last_seq_;
}

void ResultsStoreJson::remove(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(index_mutex_);

    if (entries_.find(run_id) == entries_.end()) {
        throw NotFoundError("Run not found: " + run_id);
    }
    std::error_code ec;
    if (!std::filesystem::exists(detailPath(run_id), ec)) {
        throw NotFoundError("Run detail missing: " + run_id);
    }

    nlohmann::json line;
    line["op"] = "delete";
    line["run_id"] = run_id;
    appendIndexLine(std::move(line));
    entries_.erase(run_id);

    if (!std::filesystem::remove(detailPath(run_id), ec) || ec) {
        // Left for reconcile().
        LOG_WARN("Could not delete detail for {}: {}", run_id, ec.message());
    }
    LOG_INFO("Deleted run {}", run_id);
}

ComparisonTable ResultsStoreJson::compare(const std::vector<std::string>& run_ids) const {
    const int count = static_cast<int>(run_ids.size());
    if (count < kMinCompareRuns || count > kMaxCompareRuns) {
        throw InvalidArgumentError("compare needs between 2 and 5 run ids, got " + std::to_string(count));
    }
    const std::set<std::string> unique(run_ids.begin(), run_ids.end());
    if (unique.size() != run_ids.size()) {
        throw InvalidArgumentError("compare received duplicate run ids");
    }

    std::vector<RunRecord> records;
    records.reserve(run_ids.size());
    for (const auto& id : run_ids) {
        try {
            records.push_back(get(id));
        } catch (const NotFoundError& e) {
            throw InvalidArgumentError(std::string("compare: ") + e.what());
        }
    }

    ComparisonTable table;
    table.run_ids = run_ids;

    auto addRow = [&table](const std::string& label, std::vector<nlohmann::json> values) {
        table.rows.push_back(ComparisonRow{label, std::move(values)});
    };

    std::vector<nlohmann::json> strategy;
    std::vector<nlohmann::json> kind;
    std::vector<nlohmann::json> sharpe;
    std::vector<nlohmann::json> total_return;
    std::vector<nlohmann::json> drawdown;
    std::vector<nlohmann::json> win_rate;
    std::vector<nlohmann::json> trades;
    std::set<std::string> param_names;

    for (const auto& r : records) {
        strategy.emplace_back(r.strategy_id);
        kind.emplace_back(toString(r.search_kind));
        sharpe.push_back(optionalCell(r.best, &MetricsRecord::sharpe_ratio));
        total_return.push_back(optionalCell(r.best, &MetricsRecord::total_return));
        drawdown.push_back(optionalCell(r.best, &MetricsRecord::max_drawdown));
        win_rate.push_back(optionalCell(r.best, &MetricsRecord::win_rate));
        trades.push_back(r.best ? nlohmann::json(r.best->metrics.trade_count) : nlohmann::json(nullptr));
        if (r.best) {
            for (const auto& [name, value] : r.best->combination.values()) {
                param_names.insert(name);
            }
        }
    }

    addRow("strategy", std::move(strategy));
    addRow("search_kind", std::move(kind));
    addRow("sharpe_ratio", std::move(sharpe));
    addRow("total_return", std::move(total_return));
    addRow("max_drawdown", std::move(drawdown));
    addRow("win_rate", std::move(win_rate));
    addRow("trade_count", std::move(trades));

    for (const auto& name : param_names) {
        std::vector<nlohmann::json> cells;
        for (const auto& r : records) {
            if (r.best && r.best->combination.contains(name)) {
                cells.push_back(r.best->combination.get(name));
            } else {
                cells.emplace_back(nullptr);
            }
        }
        addRow("param." + name, std::move(cells));
    }
    return table;
}

ReconcileReport ResultsStoreJson::reconcile() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    ReconcileReport report;

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(root_ / "details", ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw StorageError("Cannot scan " + (root_ / "details").string() + ": " + ec.message());
    }

    for (const auto& path : files) {
        const std::string name = path.filename().string();
        std::string run_id;
        bool temp = false;
        if (endsWith(name, std::string(".json") + kTempSuffix)) {
            run_id = name.substr(0, name.size() - 9);
            temp = true;
        } else if (endsWith(name, ".json")) {
            run_id = name.substr(0, name.size() - 5);
        } else {
            continue;
        }

        // A reserved id belongs to a save() in progress.
        if (reserved_ids_.count(run_id)) {
            continue;
        }
        if (!temp && entries_.count(run_id)) {
            continue;
        }

        std::error_code rm_ec;
        if (std::filesystem::remove(path, rm_ec)) {
            if (temp) {
                ++report.stale_temp_files;
            } else {
                ++report.orphan_details;
            }
        } else if (rm_ec) {
            LOG_WARN("Reconcile could not remove {}: {}", path.string(), rm_ec.message());
        }
    }

    std::vector<std::string> dangling;
    for (const auto& [id, slot] : entries_) {
        std::error_code exists_ec;
        if (!std::filesystem::exists(detailPath(id), exists_ec)) {
            dangling.push_back(id);
        }
    }
    for (const auto& id : dangling) {
        nlohmann::json line;
        line["op"] = "delete";
        line["run_id"] = id;
        appendIndexLine(std::move(line));
        entries_.erase(id);
        ++report.dangling_entries;
    }

    if (report.orphan_details + report.stale_temp_files + report.dangling_entries > 0) {
        LOG_WARN("Reconciled {}: orphan_details={} temp_files={} dangling_entries={}",
                 root_.string(), report.orphan_details, report.stale_temp_files, report.dangling_entries);
    }
    return report;
}

std::size_t ResultsStoreJson::compact() {
    std::lock_guard<std::mutex> lock(index_mutex_);

    std::vector<const IndexSlot*> slots;
    for (const auto& [id, slot] : entries_) {
        slots.push_back(&slot);
    }
    std::sort(slots.begin(), slots.end(), [](const IndexSlot* a, const IndexSlot* b) {
        return a->seq < b->seq;
    });

    auto tmp_path = indexPath();
    tmp_path += kTempSuffix;
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Cannot write " + tmp_path.string());
        }
        for (const auto* slot : slots) {
            nlohmann::json line;
            line["op"] = "add";
            line["seq"] = slot->seq;
            line["entry"] = RunRecordCodec::toJson(slot->entry);
            out << line.dump() << "\n";
        }
        out.flush();
        if (!out) {
            throw StorageError("Failed writing " + tmp_path.string());
        }
    }

    if (!replaceFile(tmp_path, indexPath())) {
        throw StorageError("Cannot move " + tmp_path.string() + " into place");
    }

    const std::size_t dropped = index_lines_ - slots.size();
    index_lines_ = slots.size();
    torn_tail_ = false;
    LOG_INFO("Compacted index {}: dropped {} lines", indexPath().string(), dropped);
    return dropped;
}

StoreStatistics ResultsStoreJson::statistics() const {
    std::lock_guard<std::mutex> lock(index_mutex_);

    StoreStatistics stats;
    stats.total_runs = static_cast<int>(entries_.size());

    std::set<std::string> strategies;
    std::set<std::string> kinds;
    double sum_sharpe = 0.0;
    double sum_return = 0.0;
    int n_sharpe = 0;
    int n_return = 0;

    for (const auto& [id, slot] : entries_) {
        const auto& e = slot.entry;
        strategies.insert(e.strategy_id);
        kinds.insert(toString(e.search_kind));
        if (e.best_sharpe) {
            sum_sharpe += *e.best_sharpe;
            ++n_sharpe;
            if (!stats.best_sharpe || *e.best_sharpe > *stats.best_sharpe) {
                stats.best_sharpe = e.best_sharpe;
            }
        }
        if (e.best_return) {
            sum_return += *e.best_return;
            ++n_return;
            if (!stats.best_return || *e.best_return > *stats.best_return) {
                stats.best_return = e.best_return;
            }
        }
    }

    stats.strategies.assign(strategies.begin(), strategies.end());
    stats.search_kinds.assign(kinds.begin(), kinds.end());
    if (n_sharpe > 0) {
        stats.avg_sharpe = sum_sharpe / n_sharpe;
    }
    if (n_return > 0) {
        stats.avg_return = sum_return / n_return;
    }
    return stats;
}

std::optional<RunIndexEntry> ResultsStoreJson::bestRun(const std::optional<std::string>& strategy_id,
                                                       RankMetric metric) const {
    if (metric != RankMetric::SHARPE && metric != RankMetric::TOTAL_RETURN) {
        throw InvalidArgumentError("bestRun supports sharpe or total_return, got " + toString(metric));
    }

    auto metricOf = [metric](const RunIndexEntry& e) {
        return metric == RankMetric::SHARPE ? e.best_sharpe : e.best_return;
    };

    std::lock_guard<std::mutex> lock(index_mutex_);
    std::optional<RunIndexEntry> best;
    for (const auto& [id, slot] : entries_) {
        const auto& e = slot.entry;
        if (strategy_id && e.strategy_id != *strategy_id) {
            continue;
        }
        const auto value = metricOf(e);
        if (!value) {
            continue;
        }
        if (!best || *value > *metricOf(*best)) {
            best = e;
        }
    }
    return best;
}

} // namespace core
} // namespace stratopt

#pragma once

#include "log_record.hpp"
#include <sqlite3.h>
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace laralog {

struct StoreFilter {
    std::array<bool, kSeverityCount> severities{true, true, true, true, true, true, true, true};
    std::optional<std::string> text;  // full-text match on summary and body
    bool newest_first = false;
    int limit = 1000;
    int offset = 0;
};

struct StoredRecord {
    int64_t id = 0;  // insertion order, i.e. file order
    RecordPtr record;
};

struct StoreStats {
    int64_t total_count = 0;
    std::array<int64_t, kSeverityCount + 1> by_severity{};  // last slot: unknown

    int64_t count(Severity s) const { return by_severity[static_cast<std::size_t>(s)]; }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["total"] = total_count;
        for (Severity s : kAllSeverities) {
            j[severity_to_string(s)] = count(s);
        }
        j["unknown"] = count(Severity::Unknown);
        return j;
    }
};

// Records delivered during this session, held in an in-memory SQLite database.
// Nothing is written to disk; clear() empties the display buffer without
// touching the watcher.
class SessionStore {
public:
    SessionStore();
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    int64_t insert(const LogRecord& record);

    // Unknown severity is always included. Results are in file order unless
    // newest_first is set.
    std::vector<StoredRecord> query(const StoreFilter& filter);
    std::vector<StoredRecord> search(const std::string& text, const StoreFilter& filter);
    std::optional<StoredRecord> get(int64_t id);

    StoreStats stats();
    int64_t clear();
    int64_t count();

private:
    void init_schema();
    void exec(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    StoredRecord row_to_record(sqlite3_stmt* stmt);
    static std::string severity_clause(const StoreFilter& filter, const std::string& column);

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace laralog

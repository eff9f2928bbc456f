#include "session_store.hpp"
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace laralog {

namespace {

const char* kSelectColumns =
    "id, timestamp, timestamp_text, channel, severity, summary, body, raw_text, payload_kind, context";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::string join_body(const std::vector<std::string>& body) {
    std::string out;
    for (std::size_t i = 0; i < body.size(); ++i) {
        if (i > 0) out += '\n';
        out += body[i];
    }
    return out;
}

std::vector<std::string> split_body(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) return lines;
    std::size_t start = 0;
    while (true) {
        std::size_t nl = text.find('\n', start);
        lines.push_back(text.substr(start, nl - start));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

// Wraps user text as a single FTS5 phrase so operators in it are taken literally.
std::string fts_phrase(const std::string& text) {
    std::string phrase = "\"";
    for (char c : text) {
        if (c == '"') phrase += '"';
        phrase += c;
    }
    phrase += '"';
    return phrase;
}

} // namespace

SessionStore::SessionStore() {
    int rc = sqlite3_open(":memory:", &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open session store: " + err);
    }

    init_schema();
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SessionStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string error_msg = err ? err : "Unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQL error: " + error_msg);
    }
}

sqlite3_stmt* SessionStore::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SessionStore::init_schema() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS records (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp REAL,
            timestamp_text TEXT NOT NULL,
            channel TEXT NOT NULL,
            severity INTEGER NOT NULL,
            summary TEXT NOT NULL,
            body TEXT NOT NULL,
            raw_text TEXT NOT NULL,
            payload_kind INTEGER NOT NULL,
            context TEXT
        )
    )");

    exec("CREATE INDEX IF NOT EXISTS idx_records_severity ON records(severity)");

    // FTS5 virtual table for full-text search
    exec(R"(
        CREATE VIRTUAL TABLE IF NOT EXISTS records_fts USING fts5(
            summary,
            body,
            content='records',
            content_rowid='id'
        )
    )");

    // Triggers to keep FTS in sync
    exec(R"(
        CREATE TRIGGER IF NOT EXISTS records_ai AFTER INSERT ON records BEGIN
            INSERT INTO records_fts(rowid, summary, body) VALUES (new.id, new.summary, new.body);
        END
    )");

    exec(R"(
        CREATE TRIGGER IF NOT EXISTS records_ad AFTER DELETE ON records BEGIN
            INSERT INTO records_fts(records_fts, rowid, summary, body)
            VALUES ('delete', old.id, old.summary, old.body);
        END
    )");
}

int64_t SessionStore::insert(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare(R"(
        INSERT INTO records (timestamp, timestamp_text, channel, severity, summary, body, raw_text, payload_kind, context)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    std::string body = join_body(record.body);
    std::string context;
    if (record.context) {
        context = record.context->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    if (record.timestamp) {
        sqlite3_bind_double(stmt, 1, to_unix_seconds(*record.timestamp));
    } else {
        sqlite3_bind_null(stmt, 1);
    }
    sqlite3_bind_text(stmt, 2, record.timestamp_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.channel.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, static_cast<int>(record.severity));
    sqlite3_bind_text(stmt, 5, record.summary.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, body.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, record.raw_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 8, static_cast<int>(record.payload_kind));
    if (record.context) {
        sqlite3_bind_text(stmt, 9, context.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 9);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert record: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

StoredRecord SessionStore::row_to_record(sqlite3_stmt* stmt) {
    LogRecord record;
    if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
        auto since_epoch = std::chrono::duration<double>(sqlite3_column_double(stmt, 1));
        record.timestamp = TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
    }
    record.timestamp_text = column_text(stmt, 2);
    record.channel = column_text(stmt, 3);
    record.severity = static_cast<Severity>(sqlite3_column_int(stmt, 4));
    record.summary = column_text(stmt, 5);
    record.body = split_body(column_text(stmt, 6));
    record.raw_text = column_text(stmt, 7);
    record.payload_kind = static_cast<PayloadKind>(sqlite3_column_int(stmt, 8));
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        auto context = nlohmann::json::parse(column_text(stmt, 9), nullptr, false);
        if (!context.is_discarded()) {
            record.context = std::move(context);
        }
    }

    StoredRecord stored;
    stored.id = sqlite3_column_int64(stmt, 0);
    stored.record = std::make_shared<const LogRecord>(std::move(record));
    return stored;
}

std::string SessionStore::severity_clause(const StoreFilter& filter, const std::string& column) {
    std::ostringstream sql;
    sql << " AND " << column << " IN (" << static_cast<int>(Severity::Unknown);
    for (Severity s : kAllSeverities) {
        if (filter.severities[static_cast<std::size_t>(s)]) {
            sql << ", " << static_cast<int>(s);
        }
    }
    sql << ")";
    return sql.str();
}

std::vector<StoredRecord> SessionStore::query(const StoreFilter& filter) {
    if (filter.text && !filter.text->empty()) {
        return search(*filter.text, filter);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream sql;
    sql << "SELECT " << kSelectColumns << " FROM records WHERE 1=1";
    sql << severity_clause(filter, "severity");
    sql << " ORDER BY id " << (filter.newest_first ? "DESC" : "ASC");
    sql << " LIMIT " << filter.limit << " OFFSET " << filter.offset;

    sqlite3_stmt* stmt = prepare(sql.str());

    std::vector<StoredRecord> results;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(row_to_record(stmt));
    }

    sqlite3_finalize(stmt);
    return results;
}

std::vector<StoredRecord> SessionStore::search(const std::string& text, const StoreFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream sql;
    sql << "SELECT r.id, r.timestamp, r.timestamp_text, r.channel, r.severity, r.summary, "
        << "r.body, r.raw_text, r.payload_kind, r.context "
        << "FROM records r JOIN records_fts fts ON r.id = fts.rowid "
        << "WHERE records_fts MATCH ?1";
    sql << severity_clause(filter, "r.severity");
    sql << " ORDER BY r.id " << (filter.newest_first ? "DESC" : "ASC");
    sql << " LIMIT " << filter.limit << " OFFSET " << filter.offset;

    sqlite3_stmt* stmt = prepare(sql.str());

    std::string phrase = fts_phrase(text);
    sqlite3_bind_text(stmt, 1, phrase.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<StoredRecord> results;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(row_to_record(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Search failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return results;
}

std::optional<StoredRecord> SessionStore::get(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kSelectColumns + " FROM records WHERE id = ?";
    sqlite3_stmt* stmt = prepare(sql);
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<StoredRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = row_to_record(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

StoreStats SessionStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStats stats;
    sqlite3_stmt* stmt = prepare("SELECT severity, COUNT(*) FROM records GROUP BY severity");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        int severity = sqlite3_column_int(stmt, 0);
        int64_t count = sqlite3_column_int64(stmt, 1);
        if (severity >= 0 && severity <= static_cast<int>(Severity::Unknown)) {
            stats.by_severity[static_cast<std::size_t>(severity)] = count;
        }
        stats.total_count += count;
    }
    sqlite3_finalize(stmt);
    return stats;
}

int64_t SessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("DELETE FROM records");
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to clear records: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_);
}

int64_t SessionStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM records");

    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

} // namespace laralog

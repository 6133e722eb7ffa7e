#include "history_db.hpp"

#include "tasks/task.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const HistoryEntry& e) {
    j = {
        {"id", e.id},
        {"timestamp", e.timestamp},
        {"task_id", e.task_id},
        {"audio_path", e.audio_path},
        {"model", e.model},
        {"state", e.state},
        {"segment_count", e.segment_count},
        {"text", e.text},
        {"processing_time", e.processing_time},
    };
    if (!e.error.empty()) j["error"] = e.error;
}

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Workers finish while clients read history
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcriptions (task_id, audio_path, model, state, "
        "segment_count, text, error, processing_time) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, task_id, audio_path, model, state, "
        "segment_count, text, error, processing_time "
        "FROM transcriptions ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const Task& task) {
    if (!insert_stmt_) return false;
    if (!task.terminal()) {
        std::println(stderr, "db: refusing to record task {} in state {}",
                     task.id, to_string(task.state));
        return false;
    }

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    std::string model;
    if (auto it = task.metadata.find("model"); it != task.metadata.end() && it->is_string()) {
        model = it->get<std::string>();
    }

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, task.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, task.audio_path.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(3, model);
    auto state = std::string(to_string(task.state));
    sqlite3_bind_text(insert_stmt_, 4, state.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt_, 5, static_cast<sqlite3_int64>(task.segments.size()));
    sqlite3_bind_text(insert_stmt_, 6, task.text.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(7, task.error.value_or(""));
    sqlite3_bind_double(insert_stmt_, 8, task.processing_time);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.task_id = get_text(recent_stmt_, 2);
        e.audio_path = get_text(recent_stmt_, 3);
        e.model = get_text(recent_stmt_, 4);
        e.state = get_text(recent_stmt_, 5);
        e.segment_count = sqlite3_column_int64(recent_stmt_, 6);
        e.text = get_text(recent_stmt_, 7);
        e.error = get_text(recent_stmt_, 8);
        e.processing_time = sqlite3_column_double(recent_stmt_, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            task_id TEXT NOT NULL,
            audio_path TEXT NOT NULL,
            model TEXT,
            state TEXT NOT NULL,
            segment_count INTEGER NOT NULL DEFAULT 0,
            text TEXT NOT NULL,
            error TEXT,
            processing_time REAL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <string>
#include <vector>

struct Task;

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string task_id;
    std::string audio_path;
    std::string model;
    std::string state;
    int64_t segment_count;
    std::string text;
    std::string error;
    double processing_time;
};

void to_json(nlohmann::json& j, const HistoryEntry& e);

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();

    // Records a terminal task. Non-terminal tasks are rejected.
    bool insert(const Task& task);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};

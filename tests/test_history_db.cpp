#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"
#include "tasks/task.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("ls_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

Task completed_task(const std::string& id, const std::string& text) {
    return Task{
        .id = id,
        .audio_path = "/audio/" + id + ".wav",
        .state = TaskState::Completed,
        .progress = 1.0,
        .segments = {{.text = text, .start_sec = 0.0, .end_sec = 1.0}},
        .text = text,
        .metadata = {{"model", "paraformer-zh"}},
        .processing_time = 0.3,
    };
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(completed_task("t1", "hello world")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].task_id == "t1");
        REQUIRE(entries[0].audio_path == "/audio/t1.wav");
        REQUIRE(entries[0].model == "paraformer-zh");
        REQUIRE(entries[0].state == "completed");
        REQUIRE(entries[0].segment_count == 1);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].processing_time == 0.3);
        REQUIRE(entries[0].error.empty());
    }

    SECTION("FailedTaskKeepsError") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        Task t{.id = "t2", .audio_path = "/a.wav", .state = TaskState::Failed,
               .error = "model did not return any results",
               .error_kind = ErrorKind::EmptyResult};
        REQUIRE(db.insert(t));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].state == "failed");
        REQUIRE(entries[0].error == "model did not return any results");
        REQUIRE(entries[0].model.empty());
        REQUIRE(entries[0].segment_count == 0);
    }

    SECTION("NonTerminalRejected") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        Task t{.id = "t3", .audio_path = "/a.wav", .state = TaskState::Processing};
        REQUIRE_FALSE(db.insert(t));
        REQUIRE(db.recent(10).empty());
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(completed_task("t" + std::to_string(i), "entry")));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(completed_task("a", "first")));
        REQUIRE(db.insert(completed_task("b", "second")));
        REQUIRE(db.insert(completed_task("c", "third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(completed_task("t", "test")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("InsertWithoutOpenFails") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert(completed_task("t", "x")));
        REQUIRE(db.recent(5).empty());
    }

    SECTION("EntryJson") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert(completed_task("t", "text")));

        nlohmann::json j = db.recent(1).front();
        REQUIRE(j["task_id"] == "t");
        REQUIRE(j["segment_count"] == 1);
        REQUIRE_FALSE(j.contains("error"));
    }
}

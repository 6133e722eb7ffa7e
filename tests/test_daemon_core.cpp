#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "mock_runtime.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

class MockIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, json&) override { return ReadStatus::Closed; }
    bool has_buffered_command(int) const override { return false; }
    bool send_response(int client_fd, const json& response) override {
        sent[client_fd].push_back(response);
        return true;
    }
    void close_client(int) override {}

    std::map<int, std::vector<json>> sent;
};

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("ls_test_core_" + std::to_string(getpid()));
        fs::remove_all(path);
    }

    ~TmpDir() { fs::remove_all(path); }
};

Config test_config(const TmpDir& tmp) {
    Config cfg;
    cfg.history.path = (tmp.path / "history.db").string();
    cfg.download.cache_dir = (tmp.path / "models").string();
    cfg.download.stream_interval_ms = 1;
    return cfg;
}

json wait_task(DaemonCore& core, const std::string& id) {
    json task;
    wait_until([&] {
        auto resp = core.handle_command("task", {{"task_id", id}});
        task = resp["task"];
        auto state = task.value("state", "");
        return state == "completed" || state == "failed";
    });
    return task;
}

} // namespace

TEST_CASE("DaemonCore commands", "[core]") {
    TmpDir tmp;
    MockLoader loader;
    MockFetcher fetcher;
    MockIpcServer ipc;
    std::atomic<int> notifications{0};

    DaemonCore core(test_config(tmp), false, loader, fetcher, ipc, [&] { ++notifications; });
    REQUIRE(core.init());

    SECTION("UnknownCommand") {
        auto resp = core.handle_command("bogus", json::object());
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "InvalidRequest");
    }

    SECTION("HealthBeforeInitialize") {
        auto resp = core.handle_command("health", json::object());
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "ok");
        REQUIRE(resp["model"].is_null());
        REQUIRE(resp["task_count"] == 0);
        REQUIRE(resp["active_tasks"] == 0);
    }

    SECTION("TranscribeBeforeInitialize") {
        auto resp = core.handle_command("transcribe", {{"audio_path", "/a.wav"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "NotInitialized");
    }

    SECTION("InitializeFillsConfigDefaults") {
        auto resp = core.handle_command("initialize", {{"model", "paraformer-zh"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "ready");
        REQUIRE(resp["loaded_models"] == json::array({"paraformer-zh"}));

        REQUIRE(loader.loads.size() == 2);
        REQUIRE(loader.loads[0]["vad_model"] == "fsmn-vad");
        REQUIRE(loader.loads[0]["punc_model"] == "ct-punc");
        REQUIRE(loader.loads[0]["vad_kwargs"]["max_single_segment_time"] == 60000);
        // Speaker model defaults to none
        REQUIRE_FALSE(loader.loads[0].contains("spk_model"));

        auto health = core.handle_command("health", json::object());
        REQUIRE(health["model"] == "paraformer-zh");
    }

    SECTION("InitializeRequestOverridesDefaults") {
        auto resp = core.handle_command("initialize", {
            {"model", "m"},
            {"device", "cpu"},
            {"options", {{"vad_model", ""}, {"spk_model", "cam++"}}},
        });
        REQUIRE(resp["status"] == "ok");
        REQUIRE_FALSE(loader.loads[0].contains("vad_model"));
        REQUIRE(loader.loads[0]["spk_model"] == "cam++");
        REQUIRE(loader.loads[0]["device"] == "cpu");
        REQUIRE_FALSE(loader.loads[1].contains("spk_model"));
    }

    SECTION("InitializeFailure") {
        loader.fail_on_load = 1;
        auto resp = core.handle_command("initialize", {{"model", "m"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "ConfigurationError");
    }

    SECTION("MissingFields") {
        for (auto cmd : {"initialize", "transcribe", "task", "download", "download_status",
                         "download_progress", "cancel_download", "export"}) {
            auto resp = core.handle_command(cmd, json::object());
            REQUIRE(resp["status"] == "error");
            REQUIRE(resp["kind"] == "InvalidRequest");
        }
    }

    SECTION("TranscribeExportAndHistory") {
        REQUIRE(core.handle_command("initialize", {{"model", "paraformer-zh"}})["status"] == "ok");
        loader.without_speaker->on_generate = [](const std::string&, const json&) {
            return Result<std::vector<json>>(std::vector<json>{{
                {"text", "你好。再见！"},
                {"sentence_info", {
                    {{"text", "你好。"}, {"start", 0.0}, {"end", 1.0}},
                    {{"text", "再见！"}, {"start", 1.1}, {"end", 2.0}},
                }},
            }});
        };

        auto submitted = core.handle_command("transcribe", {{"audio_path", "/a.wav"}});
        REQUIRE(submitted["status"] == "ok");
        REQUIRE(submitted["state"] == "queued");
        auto id = submitted["task_id"].get<std::string>();

        auto task = wait_task(core, id);
        REQUIRE(task["state"] == "completed");
        REQUIRE(task["result"]["segments"].size() == 2);
        REQUIRE(task["metadata"]["model"] == "paraformer-zh");

        auto out_dir = (tmp.path / "export").string();
        auto exported = core.handle_command("export", {
            {"task_id", id}, {"output_dir", out_dir}, {"srt", true},
        });
        REQUIRE(exported["status"] == "ok");
        REQUIRE(exported["files"].size() == 3);
        REQUIRE(fs::exists(tmp.path / "export" / "subtitles.srt"));

        REQUIRE(wait_until([&] { return notifications.load() >= 1; }));
        core.on_worker_event();
        auto history = core.handle_command("history", {{"limit", 5}});
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["task_id"] == id);
        REQUIRE(history["entries"][0]["segment_count"] == 2);
    }

    SECTION("ExportRequiresCompletedTask") {
        REQUIRE(core.handle_command("initialize", {{"model", "m"}})["status"] == "ok");
        loader.without_speaker->on_generate = [](const std::string&, const json&) {
            return Result<std::vector<json>>(std::vector<json>{});
        };

        auto id = core.handle_command("transcribe", {{"audio_path", "/a.wav"}})["task_id"]
                      .get<std::string>();
        auto task = wait_task(core, id);
        REQUIRE(task["state"] == "failed");
        REQUIRE(task["error_kind"] == "EmptyResult");

        auto resp = core.handle_command("export", {{"task_id", id}, {"output_dir", "/tmp/x"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "InvalidRequest");
    }

    SECTION("UnknownTask") {
        auto resp = core.handle_command("task", {{"task_id", "missing"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "NotFound");
    }

    SECTION("DownloadLifecycle") {
        fetcher.files = {{.name = "w", .size = 10, .chunks = {10}}};
        auto resp = core.handle_command("download", {{"model_id", "iic/m"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "downloading");

        REQUIRE(wait_until([&] {
            auto s = core.handle_command("download_status", {{"model_id", "iic/m"}});
            return s["download"]["state"] == "completed";
        }));

        auto status = core.handle_command("download_status", {{"model_id", "iic/m"}});
        REQUIRE(status["download"]["progress"] == 100.0);
        REQUIRE(fetcher.last_cache_dir() == (tmp.path / "models").string());
    }

    SECTION("DuplicateDownload") {
        fetcher.hold();
        REQUIRE(core.handle_command("download", {{"model_id", "m"}})["status"] == "ok");
        auto resp = core.handle_command("download", {{"model_id", "m"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "AlreadyRunning");
        fetcher.release();
    }

    SECTION("CancelWithoutDownload") {
        auto resp = core.handle_command("cancel_download", {{"model_id", "m"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "NotFound");
        REQUIRE(resp["message"] == "No active download found for model m");
    }

    SECTION("ProgressStream") {
        auto resp = core.handle_command("download_progress", {{"model_id", "m"}});
        REQUIRE(resp["status"] == "streaming");

        // Unknown model: one error line and no subscription
        core.add_stream(7, "m");
        REQUIRE(ipc.sent[7].size() == 1);
        REQUIRE(ipc.sent[7][0]["kind"] == "NotFound");
        REQUIRE_FALSE(core.has_streams());

        fetcher.hold();
        REQUIRE(core.handle_command("download", {{"model_id", "m"}})["status"] == "ok");
        REQUIRE(wait_until([&] {
            auto s = core.handle_command("download_status", {{"model_id", "m"}});
            return s["download"]["state"] == "downloading";
        }));

        core.add_stream(8, "m");
        REQUIRE(core.has_streams());
        REQUIRE(ipc.sent[8].size() == 1);
        REQUIRE(ipc.sent[8][0]["download"]["state"] == "downloading");

        fetcher.release();
        REQUIRE(wait_until([&] {
            core.tick_streams();
            return !core.has_streams();
        }));
        REQUIRE(ipc.sent[8].back()["download"]["state"] == "completed");
    }

    SECTION("RemoveClientDropsStream") {
        fetcher.hold();
        REQUIRE(core.handle_command("download", {{"model_id", "m"}})["status"] == "ok");
        REQUIRE(wait_until([&] {
            auto s = core.handle_command("download_status", {{"model_id", "m"}});
            return s["download"]["state"] == "downloading";
        }));

        core.add_stream(9, "m");
        REQUIRE(core.has_streams());
        core.remove_client(9);
        REQUIRE_FALSE(core.has_streams());
        fetcher.release();
    }

    SECTION("NonStringCommandThenHealth") {
        auto resp = core.handle_request(5, {{"cmd", 5}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "InvalidRequest");

        REQUIRE(core.handle_request(5, {{"foo", "bar"}})["kind"] == "InvalidRequest");

        auto health = core.handle_request(5, {{"cmd", "health"}});
        REQUIRE(health["status"] == "ok");
        REQUIRE(health["state"] == "ok");
    }

    SECTION("WrongFieldTypesRejected") {
        auto resp = core.handle_request(5, {{"cmd", "task"}, {"task_id", 42}});
        REQUIRE(resp["kind"] == "InvalidRequest");

        resp = core.handle_request(5, {{"cmd", "history"}, {"limit", "many"}});
        REQUIRE(resp["status"] == "ok");
    }

    SECTION("SocketInitializeRepliesWhenLoaded") {
        loader.hold();
        auto resp = core.handle_request(4, {{"cmd", "initialize"}, {"model", "paraformer-zh"}});
        REQUIRE(resp["status"] == "deferred");
        REQUIRE(wait_until([&] { return loader.started() >= 1; }));

        // Other requests are served while the model loads
        auto health = core.handle_request(11, {{"cmd", "health"}});
        REQUIRE(health["status"] == "ok");
        REQUIRE(health["model"].is_null());
        REQUIRE(ipc.sent[4].empty());

        loader.release();
        REQUIRE(wait_until([&] {
            core.on_worker_event();
            return !ipc.sent[4].empty();
        }));
        REQUIRE(ipc.sent[4].size() == 1);
        REQUIRE(ipc.sent[4][0]["status"] == "ok");
        REQUIRE(ipc.sent[4][0]["loaded_models"] == json::array({"paraformer-zh"}));
        REQUIRE(core.handle_request(11, {{"cmd", "health"}})["model"] == "paraformer-zh");
    }

    SECTION("SocketInitializeFailureIsDelivered") {
        loader.fail_on_load = 1;
        REQUIRE(core.handle_request(4, {{"cmd", "initialize"}, {"model", "m"}})["status"] == "deferred");
        REQUIRE(wait_until([&] {
            core.on_worker_event();
            return !ipc.sent[4].empty();
        }));
        REQUIRE(ipc.sent[4][0]["kind"] == "ConfigurationError");
    }

    SECTION("DisconnectedClientGetsNoInitializeReply") {
        loader.hold();
        REQUIRE(core.handle_request(6, {{"cmd", "initialize"}, {"model", "m"}})["status"] == "deferred");
        core.remove_client(6);
        loader.release();

        REQUIRE(wait_until([&] { return core.handle_command("health", json::object())["model"] == "m"; }));
        REQUIRE(wait_until([&] { return notifications.load() >= 1; }));
        core.on_worker_event();
        REQUIRE(ipc.sent.count(6) == 0);
    }

    SECTION("HistoryLimitValidated") {
        auto resp = core.handle_command("history", {{"limit", 0}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "InvalidRequest");
    }

    core.shutdown();
}

TEST_CASE("DaemonCore default model", "[core]") {
    TmpDir tmp;
    MockLoader loader;
    MockFetcher fetcher;
    MockIpcServer ipc;

    auto cfg = test_config(tmp);
    cfg.model.default_model = "sensevoice";
    DaemonCore core(cfg, false, loader, fetcher, ipc, [] {});
    REQUIRE(core.init());

    REQUIRE(wait_until([&] {
        return core.handle_command("health", json::object())["model"] == "sensevoice";
    }));
    core.shutdown();
}

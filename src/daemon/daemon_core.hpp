#pragma once

#include "config.hpp"
#include "download/download_manager.hpp"
#include "download/model_fetcher.hpp"
#include "download/status_stream.hpp"
#include "errors.hpp"
#include "platform/ipc_server.hpp"
#include "runtime/model_handles.hpp"
#include "runtime/model_runtime.hpp"
#include "storage/history_db.hpp"
#include "tasks/task_manager.hpp"
#include "worker_set.hpp"

#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               ModelLoader& loader, ModelFetcher& fetcher, IpcServer& ipc,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the history database and starts loading the configured default
    // model in the background.
    bool init();

    // Entry point for socket requests: reads "cmd" and dispatches. A request
    // without a string "cmd", or with fields of the wrong type, gets an
    // InvalidRequest reply. "initialize" loads on a worker and returns status
    // "deferred"; on_worker_event() later sends the reply to client_fd.
    nlohmann::json handle_request(int client_fd, const nlohmann::json& request);

    // Synchronous dispatch. A "streaming" status means the caller should hand
    // the client to add_stream() instead of replying.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Sends the first progress event right away; later ones go out from
    // tick_streams().
    void add_stream(int fd, const std::string& model_id);
    void tick_streams();
    bool has_streams() const { return !streams_.empty(); }

    void remove_client(int fd);

    // Sends deferred replies and drains tasks that finished since the last
    // call into the history.
    void on_worker_event();

    void shutdown();

    const Config& config() const { return config_; }

    static nlohmann::json error_response(const Error& err);

private:
    nlohmann::json handle_initialize(const nlohmann::json& cmd);
    nlohmann::json start_initialize(int client_fd, const nlohmann::json& cmd);
    nlohmann::json run_initialize(const ModelSpec& spec);
    nlohmann::json handle_transcribe(const nlohmann::json& cmd);
    nlohmann::json handle_task(const nlohmann::json& cmd);
    nlohmann::json handle_download(const nlohmann::json& cmd);
    nlohmann::json handle_download_status(const nlohmann::json& cmd);
    nlohmann::json handle_download_progress(const nlohmann::json& cmd);
    nlohmann::json handle_cancel_download(const nlohmann::json& cmd);
    nlohmann::json handle_health(const nlohmann::json& cmd);
    nlohmann::json handle_export(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);

    // Request fields left out fall back to the config's model section.
    ModelSpec model_spec(const nlohmann::json& cmd) const;

    void on_task_update(const Task& task);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    NotifyCallback notify_;

    struct DeferredReply {
        uint64_t request_id;
        nlohmann::json response;
    };

    // Filled by workers, drained on the loop thread.
    std::mutex completed_mutex_;
    std::vector<Task> completed_;
    std::vector<DeferredReply> replies_;

    // Loop thread only: deferred request id -> client fd.
    uint64_t next_request_id_ = 1;
    std::unordered_map<uint64_t, int> waiting_clients_;

    ModelHandles handles_;
    HistoryDb history_db_;
    bool history_open_ = false;
    DownloadManager downloads_;
    TaskManager tasks_;

    struct StreamClient {
        int fd;
        DownloadStatusStream stream;
    };
    std::list<StreamClient> streams_;

    // Model loads
    WorkerSet background_;
};

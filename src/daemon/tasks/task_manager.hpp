#pragma once

#include "errors.hpp"
#include "runtime/model_handles.hpp"
#include "tasks/task.hpp"
#include "worker_set.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

// Transcription jobs: queued -> processing -> completed | failed.
// Each submission runs on its own worker thread. Entries live for the
// lifetime of the manager; get() hands out copies.
class TaskManager {
public:
    // Invoked with a snapshot after every state change: from submit() for
    // queued, from the worker thread for processing and the terminal state.
    using UpdateCallback = std::function<void(const Task&)>;

    explicit TaskManager(ModelHandles& handles, UpdateCallback on_update = {});
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Returns the new task id. Rejects with NotInitialized when the handle the
    // options select is not loaded.
    Result<std::string> submit(const std::string& audio_path, nlohmann::json options);

    Result<Task> get(const std::string& id) const;

    size_t task_count() const;
    // Queued or processing.
    size_t active_count() const;

    // Worker threads still running. Finished ones are released here and on
    // every submit().
    size_t worker_count();

    // Joins all workers. Further submissions are rejected.
    void shutdown();

private:
    void run(const std::string& id, const std::string& audio_path, const nlohmann::json& options);

    // One call, plus one retry with the rejected option removed.
    Result<std::vector<nlohmann::json>> invoke(ModelRuntime& runtime, const std::string& id,
                                               const std::string& audio_path,
                                               nlohmann::json generate_options);

    void set_processing(const std::string& id);
    void finish(const std::string& id, const std::function<void(Task&)>& apply);
    void fail(const std::string& id, const Error& err);

    ModelHandles& handles_;
    UpdateCallback on_update_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Task> tasks_;

    WorkerSet workers_;
};

std::string generate_task_id();

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <system_error>
#include <thread>

// One background thread per job. Threads that have finished are joined and
// released on the next spawn() or size(), so a long-running daemon only
// holds threads for jobs that are still running.
class WorkerSet {
public:
    WorkerSet() = default;
    ~WorkerSet() { join_all(); }

    WorkerSet(const WorkerSet&) = delete;
    WorkerSet& operator=(const WorkerSet&) = delete;

    // False after join_all(), or when the thread could not be created.
    bool spawn(std::function<void()> job) {
        std::lock_guard lock(mutex_);
        if (stopped_) return false;
        reap();

        auto& worker = workers_.emplace_back();
        try {
            worker.thread = std::jthread([&worker, job = std::move(job)] {
                job();
                worker.done.store(true, std::memory_order_release);
            });
        } catch (const std::system_error&) {
            workers_.pop_back();
            return false;
        }
        return true;
    }

    // Threads still running.
    size_t size() {
        std::lock_guard lock(mutex_);
        reap();
        return workers_.size();
    }

    // Rejects further jobs and waits for the running ones.
    void join_all() {
        std::list<Worker> workers;
        {
            std::lock_guard lock(mutex_);
            stopped_ = true;
            workers.swap(workers_);
        }
        workers.clear();
    }

private:
    struct Worker {
        std::atomic<bool> done{false};
        // Declared last so it is joined before done is destroyed.
        std::jthread thread;
    };

    void reap() {
        std::erase_if(workers_, [](const Worker& w) {
            return w.done.load(std::memory_order_acquire);
        });
    }

    std::mutex mutex_;
    std::list<Worker> workers_;
    bool stopped_ = false;
};

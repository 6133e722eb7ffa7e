#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "download/modelscope_fetcher.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "runtime/remote_runtime.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void update_stream_timer();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Adapters (constructed before core_)
    RemoteModelLoader loader_;
    ModelScopeFetcher fetcher_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int stream_timer_fd_ = -1;
    bool stream_timer_armed_ = false;

    std::atomic<bool> running_{false};
};

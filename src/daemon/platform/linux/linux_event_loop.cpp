#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      loader_(config_.runtime.url,
              http::Options{.timeout_s = config_.runtime.timeout_s,
                            .connect_timeout_s = config_.runtime.connect_timeout_s}),
      fetcher_(config_.download.hub_url, config_.download.revision,
               // Large weight files: no overall transfer deadline, but give up
               // on a connection that stays silent
               http::Options{.timeout_s = 0,
                             .connect_timeout_s = config_.runtime.connect_timeout_s,
                             .low_speed_time_s = 120}),
      core_(config_, verbose_, loader_, fetcher_, ipc_server_,
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (stream_timer_fd_ >= 0) ::close(stream_timer_fd_);
}

bool LinuxEventLoop::init() {
    // Worker notification eventfd, before any worker can start
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (history db, default model)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Download progress streams
    stream_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (stream_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(stream_timer_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal " + std::to_string(info.ssi_signo) + ", shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_worker_event();
                }
                continue;
            }

            if (fd == stream_timer_fd_) {
                uint64_t expirations;
                if (::read(stream_timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    core_.tick_streams();
                    update_stream_timer();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    do {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case IpcServer::ReadStatus::Pending:
                return;
            case IpcServer::ReadStatus::Closed:
                drop_client(fd);
                return;
            case IpcServer::ReadStatus::Malformed:
                if (!ipc_server_.send_response(fd, DaemonCore::error_response(
                        {.kind = ErrorKind::InvalidRequest, .message = "malformed request"}))) {
                    drop_client(fd);
                    return;
                }
                continue;
            case IpcServer::ReadStatus::Command:
                break;
        }

        auto response = core_.handle_request(fd, cmd);
        auto status = response.value("status", "");

        if (status == "deferred") {
            // Answered from on_worker_event() when the work finishes
        } else if (status == "streaming") {
            core_.add_stream(fd, response.value("model_id", ""));
            update_stream_timer();
        } else if (!ipc_server_.send_response(fd, response)) {
            drop_client(fd);
            return;
        }
    } while (ipc_server_.has_buffered_command(fd));
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_client(fd);
    ipc_server_.close_client(fd);
    update_stream_timer();
}

void LinuxEventLoop::update_stream_timer() {
    bool want = core_.has_streams();
    if (want == stream_timer_armed_) return;

    itimerspec spec{};
    if (want) {
        auto ms = config_.download.stream_interval_ms > 0 ? config_.download.stream_interval_ms : 500;
        spec.it_interval.tv_sec = ms / 1000;
        spec.it_interval.tv_nsec = static_cast<long>(ms % 1000) * 1'000'000;
        spec.it_value = spec.it_interval;
    }
    if (timerfd_settime(stream_timer_fd_, 0, &spec, nullptr) != 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return;
    }
    stream_timer_armed_ = want;
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}

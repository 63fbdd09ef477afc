#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/websocket_service_socket.hpp"
#include "platform/reactor.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

class LinuxEventLoop : public Reactor {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    // Reactor
    WatchToken watch(int fd, FdCallback cb) override;
    void unwatch(WatchToken token) override;
    TimerId schedule(std::chrono::milliseconds delay, TimerCallback cb) override;
    void cancel(TimerId id) override;
    void post(TimerCallback cb) override;

private:
    using Clock = std::chrono::steady_clock;

    void on_signal();
    void on_timers();
    void on_posted();
    void on_accept();
    void on_client(int fd, uint32_t events);
    void rearm_timerfd();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    UnixSocketServer ipc_server_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int wake_fd_ = -1;

    struct Watch {
        int fd;
        FdCallback cb;
    };
    std::unordered_map<WatchToken, Watch> watches_;
    WatchToken next_token_ = 0;
    std::unordered_map<int, WatchToken> client_tokens_;

    // Ordered by deadline, ties broken by scheduling order.
    std::map<std::pair<Clock::time_point, TimerId>, TimerCallback> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;
    TimerId next_timer_ = 0;

    std::mutex posted_mutex_;
    std::vector<TimerCallback> posted_;

    std::atomic<bool> running_{false};
    bool shutting_down_ = false;

    // Audio service I/O thread. Outlives every socket core_ creates.
    WebSocketContext ws_context_;

    // Portable business logic; constructed last, destroyed first.
    DaemonCore core_;
};

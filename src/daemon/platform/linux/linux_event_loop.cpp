#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <vector>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      core_(config_, verbose_, *this, ipc_server_,
            // SocketFactory
            [this]() -> std::unique_ptr<ServiceSocket> {
                return std::make_unique<WebSocketServiceSocket>(*this, ws_context_);
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    // No I/O callback may post into a loop that is going away.
    ws_context_.stop();

    if (wake_fd_ >= 0) ::close(wake_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    wake_fd_ = signal_fd_ = timer_fd_ = epoll_fd_ = -1;
}

bool LinuxEventLoop::init() {
    // Core init (ledger)
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

    // One timerfd, armed for the earliest pending deadline
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    // Wakes the loop for callbacks posted from the audio service I/O thread
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);
    log("Audio service at " + config_.service.endpoint);

    if (!watch(signal_fd_, [this](uint32_t) { on_signal(); }) ||
        !watch(timer_fd_, [this](uint32_t) { on_timers(); }) ||
        !watch(wake_fd_, [this](uint32_t) { on_posted(); }) ||
        !watch(ipc_server_.server_fd(), [this](uint32_t) { on_accept(); })) {
        return false;
    }
    rearm_timerfd();

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

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            // A callback earlier in this batch may have removed the watch.
            auto it = watches_.find(events[i].data.u64);
            if (it == watches_.end()) continue;

            auto cb = it->second.cb;
            cb(events[i].events);
        }
    }

    ipc_server_.stop();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

Reactor::WatchToken LinuxEventLoop::watch(int fd, FdCallback cb) {
    if (epoll_fd_ < 0) return 0;

    WatchToken token = ++next_token_;
    epoll_event ev{.events = EPOLLIN, .data = {.u64 = token}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        std::println(stderr, "epoll_ctl(ADD, {}) failed: {}", fd, std::strerror(errno));
        return 0;
    }
    watches_.emplace(token, Watch{.fd = fd, .cb = std::move(cb)});
    return token;
}

void LinuxEventLoop::unwatch(WatchToken token) {
    auto it = watches_.find(token);
    if (it == watches_.end()) return;
    if (epoll_fd_ >= 0) epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, it->second.fd, nullptr);
    watches_.erase(it);
}

Reactor::TimerId LinuxEventLoop::schedule(std::chrono::milliseconds delay, TimerCallback cb) {
    TimerId id = ++next_timer_;
    auto deadline = Clock::now() + delay;
    timers_.emplace(std::make_pair(deadline, id), std::move(cb));
    timer_deadlines_.emplace(id, deadline);
    rearm_timerfd();
    return id;
}

void LinuxEventLoop::cancel(TimerId id) {
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) return;
    timers_.erase(std::make_pair(it->second, id));
    timer_deadlines_.erase(it);
    rearm_timerfd();
}

void LinuxEventLoop::post(TimerCallback cb) {
    {
        std::lock_guard lock(posted_mutex_);
        posted_.push_back(std::move(cb));
    }
    uint64_t one = 1;
    if (wake_fd_ >= 0 && ::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::on_signal() {
    signalfd_siginfo info;
    while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
        if (shutting_down_) {
            log("Second signal, exiting now");
            request_stop();
            return;
        }

        log("Received signal, shutting down");
        shutting_down_ = true;
        core_.shutdown([this]() { request_stop(); });
    }
}

void LinuxEventLoop::on_timers() {
    uint64_t expirations;
    if (::read(timer_fd_, &expirations, sizeof(expirations)) < 0 && errno != EAGAIN) {
        std::println(stderr, "timerfd read failed: {}", std::strerror(errno));
    }

    // Pop one at a time: a callback may schedule or cancel other timers.
    while (!timers_.empty() && timers_.begin()->first.first <= Clock::now()) {
        auto node = timers_.extract(timers_.begin());
        timer_deadlines_.erase(node.key().second);
        node.mapped()();
    }
    rearm_timerfd();
}

void LinuxEventLoop::on_posted() {
    uint64_t count;
    if (::read(wake_fd_, &count, sizeof(count)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
    }

    std::vector<TimerCallback> batch;
    {
        std::lock_guard lock(posted_mutex_);
        batch.swap(posted_);
    }
    for (auto& cb : batch) cb();
}

void LinuxEventLoop::on_accept() {
    while (true) {
        int client_fd = ipc_server_.accept_client();
        if (client_fd < 0) return;

        auto token = watch(client_fd, [this, client_fd](uint32_t events) {
            on_client(client_fd, events);
        });
        if (token == 0) {
            ipc_server_.close_client(client_fd);
            continue;
        }
        client_tokens_[client_fd] = token;
        core_.add_client(client_fd);
    }
}

void LinuxEventLoop::on_client(int fd, uint32_t /*events*/) {
    std::vector<nlohmann::json> cmds;
    bool connected = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        core_.handle_command(fd, cmd);
    }

    if (!connected) {
        auto it = client_tokens_.find(fd);
        if (it != client_tokens_.end()) {
            unwatch(it->second);
            client_tokens_.erase(it);
        }
        core_.remove_client(fd);
        ipc_server_.close_client(fd);
    }
}

void LinuxEventLoop::rearm_timerfd() {
    if (timer_fd_ < 0) return;

    itimerspec spec{};
    if (!timers_.empty()) {
        auto deadline = timers_.begin()->first.first;
        auto since_epoch = deadline.time_since_epoch();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
        spec.it_value.tv_sec = secs.count();
        spec.it_value.tv_nsec = nsecs.count();
        // An all-zero it_value would disarm the timer.
        if (spec.it_value.tv_sec == 0 && spec.it_value.tv_nsec == 0) spec.it_value.tv_nsec = 1;
    }
    timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &spec, nullptr);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetmate] {}", msg);
    }
}

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// Single-threaded readiness and timer dispatch. Every callback runs on the
// loop thread, one at a time. post() is the only member safe to call from
// other threads.
class Reactor {
public:
    using WatchToken = uint64_t;
    using TimerId = uint64_t;
    using FdCallback = std::function<void(uint32_t events)>;
    using TimerCallback = std::function<void()>;

    virtual ~Reactor() = default;

    // Returns 0 on failure. events are EPOLLIN/EPOLLERR/EPOLLHUP style bits.
    virtual WatchToken watch(int fd, FdCallback cb) = 0;
    // Unknown or already removed tokens are ignored.
    virtual void unwatch(WatchToken token) = 0;

    virtual TimerId schedule(std::chrono::milliseconds delay, TimerCallback cb) = 0;
    // Cancelling a timer that already fired or never existed is a no-op.
    virtual void cancel(TimerId id) = 0;

    // Queues cb to run on the loop thread. Callable from any thread.
    virtual void post(TimerCallback cb) = 0;
};

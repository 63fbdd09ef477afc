#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

using ConnectionHandle = uint64_t;

// Owns at most one duplex, message-framed connection to the audio service.
// Opening a new connection detaches and force-closes the previous one first.
// open() never blocks: transport failures during connect arrive as on_close.
class ServiceSocket {
public:
    struct Listener {
        std::function<void(const std::string& message)> on_message;
        // Peer closed or socket error. Never fired for a local close().
        std::function<void(const std::string& reason)> on_close;
    };

    virtual ~ServiceSocket() = default;

    virtual std::expected<ConnectionHandle, std::string>
        open(const std::string& endpoint, Listener listener) = 0;

    // False for stale handles. Messages are delivered whole and in order;
    // a later write failure closes the connection through on_close.
    virtual bool send(ConnectionHandle handle, const std::string& message) = 0;

    // Idempotent; stale or never-opened handles are ignored.
    virtual void close(ConnectionHandle handle) = 0;
};

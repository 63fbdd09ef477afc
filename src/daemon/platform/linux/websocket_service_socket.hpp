#pragma once

#include "platform/reactor.hpp"
#include "platform/service_socket.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Runs the Beast I/O on one background thread. Every ServiceSocket built on
// it hands its events back to the Reactor thread through Reactor::post.
class WebSocketContext {
public:
    WebSocketContext();
    ~WebSocketContext();

    WebSocketContext(const WebSocketContext&) = delete;
    WebSocketContext& operator=(const WebSocketContext&) = delete;

    // Abandons outstanding I/O and joins the thread. Safe to call twice.
    void stop();

    boost::asio::io_context& io() { return ioc_; }

private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

struct WebSocketEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// Accepts ws://host[:port][/target]. Port defaults to 80, target to "/".
std::optional<WebSocketEndpoint> parse_ws_endpoint(const std::string& url);

// Text-frame WebSocket client for the audio service's control channel.
class WebSocketServiceSocket : public ServiceSocket {
public:
    // Largest inbound message accepted before the connection is failed.
    static constexpr size_t kMaxMessageBytes = 1 << 20;

    WebSocketServiceSocket(Reactor& reactor, WebSocketContext& context);
    ~WebSocketServiceSocket() override;

    WebSocketServiceSocket(const WebSocketServiceSocket&) = delete;
    WebSocketServiceSocket& operator=(const WebSocketServiceSocket&) = delete;

    std::expected<ConnectionHandle, std::string>
        open(const std::string& endpoint, Listener listener) override;
    bool send(ConnectionHandle handle, const std::string& message) override;
    void close(ConnectionHandle handle) override;

private:
    class Session;

    struct Connection {
        ConnectionHandle handle = 0;
        Listener listener;
        std::shared_ptr<Session> session;
    };

    // Reactor thread, via post().
    void deliver(ConnectionHandle handle, const std::string& message);
    void closed(ConnectionHandle handle, const std::string& reason);

    void teardown();

    Reactor& reactor_;
    WebSocketContext& context_;
    std::optional<Connection> conn_;
    ConnectionHandle next_handle_ = 0;

    // Posted callbacks hold a weak reference and drop out once this is gone.
    std::shared_ptr<WebSocketServiceSocket*> self_;
};

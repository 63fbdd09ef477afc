#include "platform/linux/websocket_service_socket.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <charconv>
#include <cstdint>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <print>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

WebSocketContext::WebSocketContext()
    : work_(net::make_work_guard(ioc_)),
      thread_([this]() {
          try {
              ioc_.run();
          } catch (const std::exception& e) {
              std::println(stderr, "service: I/O thread stopped: {}", e.what());
          }
      }) {}

WebSocketContext::~WebSocketContext() {
    stop();
}

void WebSocketContext::stop() {
    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) thread_.join();
}

std::optional<WebSocketEndpoint> parse_ws_endpoint(const std::string& url) {
    constexpr std::string_view scheme = "ws://";
    if (!url.starts_with(scheme)) return std::nullopt;

    std::string rest = url.substr(scheme.size());
    WebSocketEndpoint ep;

    auto slash = rest.find('/');
    ep.target = slash == std::string::npos ? "/" : rest.substr(slash);
    std::string authority = rest.substr(0, slash);

    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        ep.host = authority;
        ep.port = "80";
    } else {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
        uint16_t port = 0;
        auto [ptr, ec] = std::from_chars(ep.port.data(), ep.port.data() + ep.port.size(), port);
        if (ec != std::errc{} || ptr != ep.port.data() + ep.port.size() || port == 0) {
            return std::nullopt;
        }
    }
    if (ep.host.empty()) return std::nullopt;
    return ep;
}

// One connection's I/O. Lives on the context thread and only ever talks to
// the reactor side through the two callbacks it was built with.
class WebSocketServiceSocket::Session : public std::enable_shared_from_this<Session> {
public:
    using MessageFn = std::function<void(std::string message)>;
    using ClosedFn = std::function<void(std::string reason)>;

    Session(net::io_context& ioc, WebSocketEndpoint endpoint, std::string url,
            MessageFn on_message, ClosedFn on_closed)
        : resolver_(ioc), ws_(ioc), endpoint_(std::move(endpoint)), url_(std::move(url)),
          on_message_(std::move(on_message)), on_closed_(std::move(on_closed)) {}

    void run() {
        resolver_.async_resolve(endpoint_.host, endpoint_.port,
                                beast::bind_front_handler(&Session::on_resolve, shared_from_this()));
    }

    // Frames queued before the handshake completes go out right after it.
    void write(std::string message) {
        if (done_) return;
        outbox_.push_back(std::move(message));
        if (open_ && !writing_) do_write();
    }

    // Local close: the reactor side has already forgotten this connection.
    void shutdown() {
        if (done_) return;
        done_ = true;
        if (!open_) {
            resolver_.cancel();
            beast::get_lowest_layer(ws_).close();
            return;
        }
        if (writing_) {
            close_after_write_ = true;
            return;
        }
        do_close();
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (done_) return;
        if (ec) return fail("resolve " + endpoint_.host + " failed: " + ec.message());

        beast::get_lowest_layer(ws_).async_connect(
            results, beast::bind_front_handler(&Session::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (done_) return;
        if (ec) return fail("connect " + url_ + " failed: " + ec.message());

        // The websocket layer runs its own timers from here on.
        beast::get_lowest_layer(ws_).expires_never();

        websocket::stream_base::timeout timeouts{
            .handshake_timeout = std::chrono::seconds(5),
            .idle_timeout = websocket::stream_base::none(),
            .keep_alive_pings = false,
        };
        ws_.set_option(timeouts);
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, "meetmated");
        }));
        ws_.read_message_max(kMaxMessageBytes);

        ws_.async_handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target,
                            beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (done_) return;
        if (ec) return fail("websocket handshake with " + url_ + " failed: " + ec.message());

        open_ = true;
        ws_.text(true);
        do_read();
        if (!outbox_.empty()) do_write();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, size_t /*bytes*/) {
        if (done_) return;
        if (ec == websocket::error::closed) return fail("connection closed by transcription service");
        if (ec == websocket::error::message_too_big) {
            return fail("message from transcription service exceeds " +
                        std::to_string(kMaxMessageBytes) + " bytes");
        }
        if (ec) return fail("connection to transcription service lost: " + ec.message());

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        on_message_(std::move(message));
        do_read();
    }

    void do_write() {
        writing_ = true;
        ws_.async_write(net::buffer(outbox_.front()),
                        beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, size_t /*bytes*/) {
        writing_ = false;
        if (ec) {
            if (!done_) fail("write to transcription service failed: " + ec.message());
            return;
        }
        outbox_.pop_front();

        // A local close waits for everything queued before it.
        if (!outbox_.empty()) return do_write();
        if (close_after_write_) do_close();
    }

    void do_close() {
        ws_.async_close(websocket::close_code::normal,
                        [self = shared_from_this()](beast::error_code ec) {
                            // Nobody waits on a local close; the socket goes away either way.
                            if (ec && ec != net::error::operation_aborted) {
                                beast::get_lowest_layer(self->ws_).close();
                            }
                        });
    }

    void fail(std::string reason) {
        done_ = true;
        beast::get_lowest_layer(ws_).close();
        on_closed_(std::move(reason));
    }

    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;

    WebSocketEndpoint endpoint_;
    std::string url_;
    MessageFn on_message_;
    ClosedFn on_closed_;

    bool open_ = false;
    bool writing_ = false;
    bool close_after_write_ = false;
    bool done_ = false;
};

WebSocketServiceSocket::WebSocketServiceSocket(Reactor& reactor, WebSocketContext& context)
    : reactor_(reactor), context_(context),
      self_(std::make_shared<WebSocketServiceSocket*>(this)) {}

WebSocketServiceSocket::~WebSocketServiceSocket() {
    teardown();
}

std::expected<ConnectionHandle, std::string>
WebSocketServiceSocket::open(const std::string& endpoint, Listener listener) {
    // The previous connection's listener must never fire again.
    teardown();

    auto ep = parse_ws_endpoint(endpoint);
    if (!ep) return std::unexpected("invalid endpoint (expected ws://host[:port][/path]): " + endpoint);

    ConnectionHandle handle = ++next_handle_;
    std::weak_ptr<WebSocketServiceSocket*> weak = self_;
    Reactor* reactor = &reactor_;

    auto on_message = [reactor, weak, handle](std::string message) {
        reactor->post([weak, handle, message = std::move(message)]() {
            if (auto self = weak.lock()) (*self)->deliver(handle, message);
        });
    };
    auto on_closed = [reactor, weak, handle](std::string reason) {
        reactor->post([weak, handle, reason = std::move(reason)]() {
            if (auto self = weak.lock()) (*self)->closed(handle, reason);
        });
    };

    auto session = std::make_shared<Session>(context_.io(), std::move(*ep), endpoint,
                                             std::move(on_message), std::move(on_closed));
    net::post(context_.io(), [session]() { session->run(); });

    conn_ = Connection{
        .handle = handle,
        .listener = std::move(listener),
        .session = std::move(session),
    };
    return handle;
}

bool WebSocketServiceSocket::send(ConnectionHandle handle, const std::string& message) {
    if (!conn_ || conn_->handle != handle) return false;
    net::post(context_.io(), [session = conn_->session, message]() { session->write(message); });
    return true;
}

void WebSocketServiceSocket::close(ConnectionHandle handle) {
    if (!conn_ || conn_->handle != handle) return;
    teardown();
}

void WebSocketServiceSocket::deliver(ConnectionHandle handle, const std::string& message) {
    if (!conn_ || conn_->handle != handle) return;
    // The listener may close or reopen this socket from inside the callback.
    auto on_message = conn_->listener.on_message;
    if (on_message) on_message(message);
}

void WebSocketServiceSocket::closed(ConnectionHandle handle, const std::string& reason) {
    if (!conn_ || conn_->handle != handle) return;
    auto on_close = std::move(conn_->listener.on_close);
    conn_.reset();
    if (on_close) on_close(reason);
}

void WebSocketServiceSocket::teardown() {
    if (!conn_) return;
    net::post(context_.io(), [session = std::move(conn_->session)]() { session->shutdown(); });
    conn_.reset();
}

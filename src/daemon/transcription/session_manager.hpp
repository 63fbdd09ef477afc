#pragma once

#include "platform/reactor.hpp"
#include "platform/service_socket.hpp"
#include "protocol/wire_codec.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ManagerState { Idle, Connecting, Active, Stopping };

struct StartRequest {
    int64_t session_id = 0;
    std::string output_path;
    std::optional<int64_t> input_device_id;
    std::string transcription_mode = "local";
    bool diarization_enabled = false;
    std::string huggingface_token;
    std::optional<std::string> local_diarization_model_path;
    std::string deepgram_api_key;
    std::string deepgram_model;
};

struct StartResult {
    bool success = false;
    std::string error;
};

struct StopResult {
    std::optional<std::string> audio_path;
};

struct RecordingState {
    bool recording = false;
    std::optional<std::string> error;
};

using InputsResult = std::expected<std::vector<wire::InputDevice>, std::string>;

// Holds a completion callback and invokes it at most once.
template <typename Result>
class Pending {
public:
    Pending() = default;
    explicit Pending(std::function<void(Result)> cb) : cb_(std::move(cb)) {}

    explicit operator bool() const { return static_cast<bool>(cb_); }

    void settle(Result result) {
        auto cb = std::move(cb_);
        cb_ = nullptr;
        if (cb) cb(std::move(result));
    }

private:
    std::function<void(Result)> cb_;
};

// Owns the single control connection to the audio service and drives it
// through start -> ready -> stop -> stopped. Input-device queries use their
// own short-lived connections and never touch the recording state.
class TranscriptionSessionManager {
public:
    using StartCallback = std::function<void(StartResult)>;
    using StopCallback = std::function<void(StopResult)>;
    using InputsCallback = std::function<void(InputsResult)>;
    using SegmentHandler = std::function<void(int64_t session_id, const wire::SegmentEvent&)>;
    using StateHandler = std::function<void(const RecordingState&)>;
    using StoppedHandler = std::function<void(int64_t session_id, const StopResult&)>;
    using SocketFactory = std::function<std::unique_ptr<ServiceSocket>()>;

    struct Options {
        std::string endpoint = "ws://127.0.0.1:8765/ws";
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds stop_timeout{60000};
    };

    TranscriptionSessionManager(Reactor& reactor, SocketFactory socket_factory,
                                Options options, bool verbose = false);
    ~TranscriptionSessionManager();

    TranscriptionSessionManager(const TranscriptionSessionManager&) = delete;
    TranscriptionSessionManager& operator=(const TranscriptionSessionManager&) = delete;

    void set_segment_handler(SegmentHandler handler) { on_segment_ = std::move(handler); }
    void set_state_handler(StateHandler handler) { on_state_changed_ = std::move(handler); }
    // Fires once per session that reaches the end of a stop, before any of
    // the stop callbacks waiting on it.
    void set_stopped_handler(StoppedHandler handler) { on_stopped_ = std::move(handler); }

    // A start issued while another session is connecting, active or stopping
    // tears that session down first. Fails once shutdown() has been called.
    void start(const StartRequest& req, StartCallback cb);

    // Always completes, with no path when nothing was confirmed.
    void stop(int64_t session_id, StopCallback cb);

    bool status() const { return state_ == ManagerState::Active; }

    void list_inputs(InputsCallback cb);

    // Fails outstanding input queries and runs a bounded stop. Later starts
    // and input queries fail with "shutting down".
    void shutdown(StopCallback cb);

    ManagerState state() const { return state_; }
    std::optional<int64_t> active_session() const { return session_id_; }
    const std::string& last_error() const { return last_error_; }
    size_t pending_queries() const { return queries_.size(); }

private:
    struct InputQuery {
        std::unique_ptr<ServiceSocket> socket;
        ConnectionHandle handle = 0;
        Reactor::TimerId timer = 0;
        Pending<InputsResult> pending;
    };

    void on_session_message(const std::string& message);
    void on_session_closed(const std::string& reason);

    void fail_start(const std::string& reason);
    void finish_stop(std::optional<std::string> audio_path);
    void abort_session(const std::string& reason);

    void on_query_message(uint64_t id, const std::string& message);
    void finish_query(uint64_t id, InputsResult result);

    // Every transition into or out of Active is broadcast exactly once here.
    void set_state(ManagerState next, std::optional<std::string> error = std::nullopt);
    void cancel_timer();
    void retire(std::unique_ptr<ServiceSocket> socket);

    void log(const std::string& msg);

    Reactor& reactor_;
    SocketFactory socket_factory_;
    Options options_;
    bool verbose_;

    SegmentHandler on_segment_;
    StateHandler on_state_changed_;
    StoppedHandler on_stopped_;

    std::unique_ptr<ServiceSocket> socket_;
    ConnectionHandle conn_ = 0;
    ManagerState state_ = ManagerState::Idle;
    std::optional<int64_t> session_id_;
    Reactor::TimerId timer_ = 0;
    Pending<StartResult> pending_start_;
    std::vector<Pending<StopResult>> pending_stops_;
    std::string last_error_;
    bool shutting_down_ = false;

    std::map<uint64_t, std::unique_ptr<InputQuery>> queries_;
    uint64_t next_query_id_ = 0;
};

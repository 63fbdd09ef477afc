#include "transcription/session_manager.hpp"

#include <format>
#include <print>

namespace {

const char* state_name(ManagerState s) {
    switch (s) {
        case ManagerState::Idle: return "idle";
        case ManagerState::Connecting: return "connecting";
        case ManagerState::Active: return "active";
        case ManagerState::Stopping: return "stopping";
    }
    return "unknown";
}

wire::StartCommand make_start_command(const StartRequest& req) {
    return wire::StartCommand{
        .session_id = std::to_string(req.session_id),
        .output_path = req.output_path,
        .input_device_id = req.input_device_id,
        .transcription_mode = req.transcription_mode,
        .diarization_enabled = req.diarization_enabled,
        .huggingface_token = req.huggingface_token,
        .local_diarization_model_path = req.local_diarization_model_path,
        .deepgram_api_key = req.deepgram_api_key,
        .deepgram_model = req.deepgram_model,
    };
}

} // namespace

TranscriptionSessionManager::TranscriptionSessionManager(Reactor& reactor,
                                                         SocketFactory socket_factory,
                                                         Options options, bool verbose)
    : reactor_(reactor), socket_factory_(std::move(socket_factory)),
      options_(std::move(options)), verbose_(verbose),
      socket_(socket_factory_()) {}

TranscriptionSessionManager::~TranscriptionSessionManager() {
    cancel_timer();
    for (auto& [id, query] : queries_) {
        reactor_.cancel(query->timer);
    }
}

void TranscriptionSessionManager::start(const StartRequest& req, StartCallback cb) {
    if (shutting_down_) {
        log(std::format("start: session {} refused during shutdown", req.session_id));
        cb({.success = false, .error = "shutting down"});
        return;
    }

    if (state_ != ManagerState::Idle) {
        log(std::format("start: tearing down {} session", state_name(state_)));
        abort_session("superseded by a new start request");
    }

    Pending<StartResult> pending(std::move(cb));

    auto handle = socket_->open(options_.endpoint, ServiceSocket::Listener{
        .on_message = [this](const std::string& message) { on_session_message(message); },
        .on_close = [this](const std::string& reason) { on_session_closed(reason); },
    });
    if (!handle) {
        std::println(stderr, "service: {}", handle.error());
        last_error_ = handle.error();
        pending.settle({.success = false, .error = handle.error()});
        return;
    }

    conn_ = *handle;
    session_id_ = req.session_id;
    pending_start_ = std::move(pending);
    set_state(ManagerState::Connecting);

    timer_ = reactor_.schedule(options_.connect_timeout, [this]() {
        timer_ = 0;
        fail_start("Timed out connecting to transcription service");
    });

    if (!socket_->send(conn_, wire::encode(make_start_command(req)))) {
        fail_start("failed to send start command to transcription service");
        return;
    }

    log(std::format("start: session {} -> {}", req.session_id, req.output_path));
}

void TranscriptionSessionManager::stop(int64_t session_id, StopCallback cb) {
    Pending<StopResult> pending(std::move(cb));

    switch (state_) {
        case ManagerState::Idle:
            pending.settle({});
            return;

        case ManagerState::Connecting: {
            log("stop: aborting pending connect");
            pending_stops_.push_back(std::move(pending));
            abort_session("cancelled by stop request");
            return;
        }

        case ManagerState::Stopping:
            pending_stops_.push_back(std::move(pending));
            return;

        case ManagerState::Active:
            break;
    }

    if (session_id_ && *session_id_ != session_id) {
        std::println(stderr, "service: stop for session {} while session {} is recording",
                     session_id, *session_id_);
    }

    pending_stops_.push_back(std::move(pending));
    set_state(ManagerState::Stopping);

    timer_ = reactor_.schedule(options_.stop_timeout, [this]() {
        timer_ = 0;
        std::println(stderr, "service: no stop confirmation, forcing close");
        finish_stop(std::nullopt);
    });

    if (!socket_->send(conn_, wire::encode(wire::StopCommand{}))) {
        std::println(stderr, "service: failed to send stop command");
        finish_stop(std::nullopt);
        return;
    }

    log("stop: waiting for final transcription flush");
}

void TranscriptionSessionManager::list_inputs(InputsCallback cb) {
    if (shutting_down_) {
        cb(std::unexpected(std::string("shutting down")));
        return;
    }

    auto query = std::make_unique<InputQuery>();
    query->socket = socket_factory_();
    query->pending = Pending<InputsResult>(std::move(cb));

    uint64_t id = ++next_query_id_;
    auto handle = query->socket->open(options_.endpoint, ServiceSocket::Listener{
        .on_message = [this, id](const std::string& message) { on_query_message(id, message); },
        .on_close = [this, id](const std::string& reason) {
            finish_query(id, std::unexpected(reason));
        },
    });
    if (!handle) {
        query->pending.settle(std::unexpected(handle.error()));
        return;
    }

    query->handle = *handle;
    auto* q = query.get();
    queries_.emplace(id, std::move(query));

    q->timer = reactor_.schedule(options_.connect_timeout, [this, id]() {
        finish_query(id, std::unexpected(std::string("Timed out querying transcription input devices")));
    });

    if (!q->socket->send(q->handle, wire::encode(wire::ListInputsCommand{}))) {
        finish_query(id, std::unexpected(std::string("failed to send list_inputs command")));
    }
}

void TranscriptionSessionManager::shutdown(StopCallback cb) {
    shutting_down_ = true;

    std::vector<uint64_t> ids;
    for (auto& [id, query] : queries_) ids.push_back(id);
    for (auto id : ids) {
        finish_query(id, std::unexpected(std::string("shutting down")));
    }

    stop(session_id_.value_or(0), std::move(cb));
}

void TranscriptionSessionManager::on_session_message(const std::string& message) {
    auto event = wire::decode(message);
    if (!event) {
        log("service: dropped malformed message: " + message);
        return;
    }

    if (std::holds_alternative<wire::ReadyEvent>(*event)) {
        if (state_ != ManagerState::Connecting) {
            log(std::format("service: unexpected ready while {}", state_name(state_)));
            return;
        }
        cancel_timer();
        last_error_.clear();
        auto pending = std::move(pending_start_);
        set_state(ManagerState::Active);
        pending.settle({.success = true, .error = {}});
        return;
    }

    if (auto* seg = std::get_if<wire::SegmentEvent>(&*event)) {
        // Trailing segments flushed after stop still belong to the session.
        if (state_ != ManagerState::Active && state_ != ManagerState::Stopping) {
            log(std::format("service: dropped segment while {}", state_name(state_)));
            return;
        }
        if (on_segment_ && session_id_) on_segment_(*session_id_, *seg);
        return;
    }

    if (auto* stopped = std::get_if<wire::StoppedEvent>(&*event)) {
        if (state_ != ManagerState::Stopping) {
            log(std::format("service: unexpected stopped while {}", state_name(state_)));
            return;
        }
        finish_stop(stopped->audio_path);
        return;
    }

    if (auto* err = std::get_if<wire::ErrorEvent>(&*event)) {
        std::println(stderr, "service: error: {}", err->message);
        last_error_ = err->message;
        if (state_ == ManagerState::Connecting) {
            fail_start(err->message);
        } else if (state_ == ManagerState::Stopping) {
            finish_stop(std::nullopt);
        }
        return;
    }

    log("service: ignored inputs reply on session connection");
}

void TranscriptionSessionManager::on_session_closed(const std::string& reason) {
    // The socket has already released the connection.
    conn_ = 0;

    switch (state_) {
        case ManagerState::Idle:
            return;
        case ManagerState::Connecting:
            fail_start(reason);
            return;
        case ManagerState::Stopping:
            finish_stop(std::nullopt);
            return;
        case ManagerState::Active:
            std::println(stderr, "service: {}", reason);
            last_error_ = reason;
            cancel_timer();
            session_id_.reset();
            set_state(ManagerState::Idle, reason);
            return;
    }
}

void TranscriptionSessionManager::fail_start(const std::string& reason) {
    if (state_ != ManagerState::Connecting) return;

    std::println(stderr, "service: start failed: {}", reason);
    last_error_ = reason;
    cancel_timer();
    socket_->close(conn_);
    conn_ = 0;
    session_id_.reset();

    auto pending = std::move(pending_start_);
    auto stops = std::move(pending_stops_);
    pending_stops_.clear();
    set_state(ManagerState::Idle);

    pending.settle({.success = false, .error = reason});
    for (auto& s : stops) s.settle({});
}

void TranscriptionSessionManager::finish_stop(std::optional<std::string> audio_path) {
    if (state_ != ManagerState::Stopping) return;

    cancel_timer();
    socket_->close(conn_);
    conn_ = 0;
    int64_t session_id = session_id_.value_or(0);
    session_id_.reset();

    auto stops = std::move(pending_stops_);
    pending_stops_.clear();
    set_state(ManagerState::Idle);

    log(audio_path ? "stop: artifact at " + *audio_path : std::string("stop: no artifact confirmed"));
    StopResult result{.audio_path = std::move(audio_path)};
    if (on_stopped_) on_stopped_(session_id, result);
    for (auto& s : stops) s.settle(result);
}

void TranscriptionSessionManager::abort_session(const std::string& reason) {
    cancel_timer();
    socket_->close(conn_);
    conn_ = 0;
    session_id_.reset();

    auto start = std::move(pending_start_);
    auto stops = std::move(pending_stops_);
    pending_stops_.clear();
    set_state(ManagerState::Idle);

    start.settle({.success = false, .error = reason});
    for (auto& s : stops) s.settle({});
}

void TranscriptionSessionManager::on_query_message(uint64_t id, const std::string& message) {
    auto event = wire::decode(message);
    if (!event) {
        log("service: dropped malformed message: " + message);
        return;
    }

    if (auto* inputs = std::get_if<wire::InputsEvent>(&*event)) {
        finish_query(id, std::move(inputs->devices));
    } else if (auto* err = std::get_if<wire::ErrorEvent>(&*event)) {
        finish_query(id, std::unexpected(err->message));
    }
}

void TranscriptionSessionManager::finish_query(uint64_t id, InputsResult result) {
    auto it = queries_.find(id);
    if (it == queries_.end()) return;

    auto query = std::move(it->second);
    queries_.erase(it);

    reactor_.cancel(query->timer);
    query->socket->close(query->handle);
    retire(std::move(query->socket));
    query->pending.settle(std::move(result));
}

void TranscriptionSessionManager::set_state(ManagerState next, std::optional<std::string> error) {
    bool was_active = state_ == ManagerState::Active;
    state_ = next;
    bool is_active = state_ == ManagerState::Active;

    if (was_active != is_active) {
        log(std::format("recording: {}", is_active ? "on" : "off"));
        if (on_state_changed_) {
            on_state_changed_(RecordingState{.recording = is_active, .error = std::move(error)});
        }
    }
}

void TranscriptionSessionManager::cancel_timer() {
    if (timer_ != 0) {
        reactor_.cancel(timer_);
        timer_ = 0;
    }
}

void TranscriptionSessionManager::retire(std::unique_ptr<ServiceSocket> socket) {
    // May be called from inside the socket's own callback; destroy it from
    // the loop instead.
    std::shared_ptr<ServiceSocket> owned(std::move(socket));
    reactor_.schedule(std::chrono::milliseconds(0), [owned]() {});
}

void TranscriptionSessionManager::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetmate] {}", msg);
    }
}

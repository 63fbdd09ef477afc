#include "daemon_core.hpp"

#include "wav_format.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<int64_t> int_field(const json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<int64_t>();
}

json nullable(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

json segment_json(const TranscriptSegment& s) {
    return {
        {"id", s.id},
        {"session_id", s.session_id},
        {"speaker_id", s.speaker_id},
        {"speaker_name", nullable(s.speaker_name)},
        {"text", s.text},
        {"start_ms", s.start_ms},
        {"end_ms", s.end_ms},
        {"created_at", s.created_at},
    };
}

json session_json(const SessionRecord& s) {
    return {
        {"id", s.id},
        {"title", s.title},
        {"audio_file_path", s.audio_file_path.empty() ? json(nullptr) : json(s.audio_file_path)},
        {"created_at", s.created_at},
        {"updated_at", s.updated_at},
    };
}

json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, Reactor& reactor, IpcServer& ipc,
                       TranscriptionSessionManager::SocketFactory socket_factory)
    : config_(std::move(config)), verbose_(verbose), ipc_(ipc),
      manager_(reactor, std::move(socket_factory),
               TranscriptionSessionManager::Options{
                   .endpoint = config_.service.endpoint,
                   .connect_timeout = std::chrono::milliseconds(config_.service.connect_timeout_ms),
                   .stop_timeout = std::chrono::milliseconds(config_.service.stop_timeout_ms),
               },
               verbose) {
    manager_.set_segment_handler(
        [this](int64_t session_id, const wire::SegmentEvent& seg) { on_segment(session_id, seg); });
    manager_.set_state_handler([this](const RecordingState& state) { on_state_changed(state); });
    manager_.set_stopped_handler(
        [this](int64_t session_id, const StopResult& result) { on_stopped(session_id, result); });
}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    auto db_path = config_.database_path();
    if (!ledger_.open(db_path)) {
        std::println(stderr, "Warning: ledger failed to open at {}, persistence disabled", db_path);
    } else {
        log("Ledger at " + db_path);
    }
    return true;
}

void DaemonCore::add_client(int fd) {
    clients_[fd] = ++next_client_serial_;
}

void DaemonCore::remove_client(int fd) {
    clients_.erase(fd);
    watchers_.erase(fd);
}

void DaemonCore::handle_command(int client_fd, const json& cmd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) return;
    ClientRef client{.fd = client_fd, .serial = it->second};

    std::string cmd_str = cmd.value("cmd", "");

    if (cmd_str == "start") return handle_start(client, cmd);
    if (cmd_str == "stop") return handle_stop(client, cmd);
    if (cmd_str == "inputs") return handle_inputs(client);

    json response;
    if (cmd_str == "status") response = handle_status();
    else if (cmd_str == "recordings") response = handle_recordings(cmd);
    else if (cmd_str == "watch") response = handle_watch(client);
    else if (cmd_str == "create_session") response = handle_create_session(cmd);
    else if (cmd_str == "sessions") response = handle_sessions();
    else if (cmd_str == "segments") response = handle_segments(cmd);
    else if (cmd_str == "rename_speaker") response = handle_rename_speaker(cmd);
    else response = error_response("unknown command");

    reply(client, response);
}

void DaemonCore::handle_start(ClientRef client, const json& cmd) {
    auto session_id = int_field(cmd, "session_id");
    if (!session_id) {
        reply(client, error_response("missing session_id"));
        return;
    }

    auto input_device_id = int_field(cmd, "input_device_id");
    if (!input_device_id) input_device_id = config_.audio.default_input_device_id;

    auto started_at = RecordingLedger::now_iso();
    auto& t = config_.transcription;
    StartRequest req{
        .session_id = *session_id,
        .output_path = recording_output_path(*session_id, started_at),
        .input_device_id = input_device_id,
        .transcription_mode = t.mode,
        .diarization_enabled = t.diarization_enabled,
        .huggingface_token = t.huggingface_token,
        .local_diarization_model_path = t.local_diarization_model_path,
        .deepgram_api_key = t.deepgram_api_key,
        .deepgram_model = t.deepgram_model,
    };

    log(std::format("Starting transcription for session {}", *session_id));
    manager_.start(req, [this, client, id = *session_id, started_at](StartResult result) {
        if (result.success) {
            active_recording_ = ActiveRecording{.session_id = id, .started_at = started_at};
            reply(client, {{"status", "ok"}});
        } else {
            reply(client, error_response(result.error));
        }
    });
}

void DaemonCore::handle_stop(ClientRef client, const json& cmd) {
    auto hint = int_field(cmd, "session_id");
    auto target = hint ? *hint : (active_recording_ ? active_recording_->session_id : 0);

    // The ledger row is written once per session by on_stopped, however many
    // stop requests end up waiting on it.
    manager_.stop(target, [this, client](StopResult result) {
        reply(client, {{"status", "ok"}, {"audio_path", nullable(result.audio_path)}});
    });
}

void DaemonCore::handle_inputs(ClientRef client) {
    manager_.list_inputs([this, client](InputsResult result) {
        if (!result) {
            reply(client, error_response(result.error()));
            return;
        }
        json devices = json::array();
        for (auto& d : *result) {
            devices.push_back({{"id", d.id}, {"name", d.name}, {"is_default", d.is_default}});
        }
        reply(client, {{"status", "ok"}, {"devices", devices}});
    });
}

json DaemonCore::handle_status() {
    json resp = {{"status", "ok"}, {"recording", manager_.status()}};
    if (manager_.status() && manager_.active_session()) {
        resp["session_id"] = *manager_.active_session();
    }
    if (!manager_.last_error().empty()) resp["error"] = manager_.last_error();
    return resp;
}

json DaemonCore::handle_watch(ClientRef client) {
    watchers_.insert(client.fd);
    return {{"status", "ok"}, {"recording", manager_.status()}};
}

json DaemonCore::handle_create_session(const json& cmd) {
    auto session = ledger_.create_session(cmd.value("title", ""));
    if (!session) return error_response("failed to create session");
    return {{"status", "ok"}, {"session", session_json(*session)}};
}

json DaemonCore::handle_sessions() {
    json resp = {{"status", "ok"}, {"sessions", json::array()}};
    for (auto& s : ledger_.list_sessions()) {
        resp["sessions"].push_back(session_json(s));
    }
    return resp;
}

json DaemonCore::handle_segments(const json& cmd) {
    auto session_id = int_field(cmd, "session_id");
    if (!session_id) return error_response("missing session_id");

    json resp = {{"status", "ok"}, {"segments", json::array()}};
    for (auto& s : ledger_.segments(*session_id)) {
        resp["segments"].push_back(segment_json(s));
    }
    return resp;
}

json DaemonCore::handle_recordings(const json& cmd) {
    auto session_id = int_field(cmd, "session_id");
    if (!session_id) return error_response("missing session_id");

    json resp = {{"status", "ok"}, {"recordings", json::array()}};
    for (auto& r : ledger_.recordings(*session_id)) {
        resp["recordings"].push_back({
            {"id", r.id},
            {"session_id", r.session_id},
            {"file_path", r.file_path},
            {"started_at", r.started_at},
            {"stopped_at", r.stopped_at},
            {"duration_ms", r.duration_ms ? json(*r.duration_ms) : json(nullptr)},
            {"created_at", r.created_at},
        });
    }
    return resp;
}

json DaemonCore::handle_rename_speaker(const json& cmd) {
    auto session_id = int_field(cmd, "session_id");
    auto speaker_id = cmd.value("speaker_id", "");
    auto name = cmd.value("name", "");
    if (!session_id || speaker_id.empty()) return error_response("missing session_id or speaker_id");

    if (!ledger_.rename_speaker(*session_id, speaker_id, name)) {
        return error_response("failed to rename speaker");
    }
    return {{"status", "ok"}};
}

void DaemonCore::shutdown(std::function<void()> done) {
    // Always routed through the manager so later starts are refused.
    if (manager_.state() != ManagerState::Idle) log("Stopping live session before exit...");
    manager_.shutdown([done = std::move(done)](StopResult) { done(); });
}

void DaemonCore::on_stopped(int64_t session_id, const StopResult& result) {
    auto now = RecordingLedger::now_iso();

    if (result.audio_path) {
        auto started_at = active_recording_ && active_recording_->session_id == session_id
                              ? active_recording_->started_at
                              : now;
        RecordingEntry entry{
            .session_id = session_id,
            .file_path = *result.audio_path,
            .started_at = started_at,
            .stopped_at = now,
            .duration_ms = wav::estimate_duration_ms(*result.audio_path),
            .created_at = now,
        };
        if (!ledger_.record_recording(entry)) {
            std::println(stderr, "Warning: recording {} was not recorded in the ledger",
                         *result.audio_path);
        }
        log("Recording saved to " + *result.audio_path);
    }

    active_recording_.reset();
}

void DaemonCore::on_segment(int64_t session_id, const wire::SegmentEvent& seg) {
    auto row = ledger_.insert_segment(session_id, seg.speaker, seg.text, seg.start_ms, seg.end_ms);

    json event;
    if (row) {
        event = segment_json(*row);
    } else {
        event = segment_json(TranscriptSegment{
            .id = 0,
            .session_id = session_id,
            .speaker_id = seg.speaker,
            .speaker_name = std::nullopt,
            .text = seg.text,
            .start_ms = seg.start_ms,
            .end_ms = seg.end_ms,
            .created_at = RecordingLedger::now_iso(),
        });
        event["id"] = nullptr;
    }
    event["event"] = "segment";
    broadcast(event);
}

void DaemonCore::on_state_changed(const RecordingState& state) {
    // A session that ended without a stop (peer close, superseded) leaves
    // nothing for on_stopped to pick up.
    if (!state.recording && manager_.state() == ManagerState::Idle) active_recording_.reset();

    json event = {{"event", "state"}, {"recording", state.recording}};
    if (state.error) event["error"] = *state.error;
    broadcast(event);
}

std::string DaemonCore::recording_output_path(int64_t session_id, const std::string& started_at) {
    std::string stamp = started_at;
    std::ranges::replace(stamp, ':', '-');
    std::ranges::replace(stamp, '.', '-');

    auto dir = fs::path(config_.recordings_dir()) / std::format("session-{}", session_id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::println(stderr, "Warning: could not create {}: {}", dir.string(), ec.message());
    }
    return (dir / std::format("recording-{}.wav", stamp)).string();
}

void DaemonCore::reply(ClientRef client, const json& response) {
    auto it = clients_.find(client.fd);
    if (it == clients_.end() || it->second != client.serial) {
        log("Dropping reply for disconnected client");
        return;
    }
    ipc_.send_response(client.fd, response);
}

void DaemonCore::broadcast(const json& event) {
    for (int fd : watchers_) {
        ipc_.send_response(fd, event);
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetmate] {}", msg);
    }
}

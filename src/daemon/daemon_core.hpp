#pragma once

#include "config.hpp"
#include "platform/ipc_server.hpp"
#include "platform/reactor.hpp"
#include "storage/recording_ledger.hpp"
#include "transcription/session_manager.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

// Portable command handling: turns IPC commands into session manager calls,
// persists what comes back and pushes live events to watching clients.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, Reactor& reactor, IpcServer& ipc,
               TranscriptionSessionManager::SocketFactory socket_factory);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    void add_client(int fd);
    void remove_client(int fd);

    // Replies through the IPC server, possibly after the command settles.
    void handle_command(int client_fd, const nlohmann::json& cmd);

    // Runs a bounded stop of any live session, then calls done.
    void shutdown(std::function<void()> done);

    const TranscriptionSessionManager& manager() const { return manager_; }
    RecordingLedger& ledger() { return ledger_; }

private:
    // Identifies one client connection even if its fd number is reused.
    struct ClientRef {
        int fd;
        uint64_t serial;
    };

    void handle_start(ClientRef client, const nlohmann::json& cmd);
    void handle_stop(ClientRef client, const nlohmann::json& cmd);
    void handle_inputs(ClientRef client);
    nlohmann::json handle_status();
    nlohmann::json handle_recordings(const nlohmann::json& cmd);
    nlohmann::json handle_watch(ClientRef client);
    nlohmann::json handle_create_session(const nlohmann::json& cmd);
    nlohmann::json handle_sessions();
    nlohmann::json handle_segments(const nlohmann::json& cmd);
    nlohmann::json handle_rename_speaker(const nlohmann::json& cmd);

    void on_stopped(int64_t session_id, const StopResult& result);
    void on_segment(int64_t session_id, const wire::SegmentEvent& seg);
    void on_state_changed(const RecordingState& state);

    std::string recording_output_path(int64_t session_id, const std::string& started_at);

    void reply(ClientRef client, const nlohmann::json& response);
    void broadcast(const nlohmann::json& event);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    IpcServer& ipc_;

    RecordingLedger ledger_;
    TranscriptionSessionManager manager_;

    struct ActiveRecording {
        int64_t session_id;
        std::string started_at;
    };
    std::optional<ActiveRecording> active_recording_;

    std::map<int, uint64_t> clients_;
    uint64_t next_client_serial_ = 0;
    std::set<int> watchers_;
};

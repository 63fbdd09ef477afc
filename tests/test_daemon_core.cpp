#include <catch2/catch.hpp>

#include "daemon_core.hpp"
#include "fakes.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Captures every message the core sends, per client fd.
class RecordingIpcServer : public IpcServer {
public:
    std::map<int, std::vector<json>> sent;

    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    bool read_commands(int, std::vector<json>&) override { return true; }
    bool send_response(int client_fd, const json& response) override {
        sent[client_fd].push_back(response);
        return true;
    }
    void close_client(int) override {}
};

struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        path = std::filesystem::temp_directory_path() /
               ("mm_test_core_" + std::to_string(getpid()));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TmpDir() { std::filesystem::remove_all(path); }
};

Config test_config(const TmpDir& dir) {
    Config cfg;
    cfg.storage.database_path = (dir.path / "ledger.db").string();
    cfg.storage.recordings_dir = (dir.path / "recordings").string();
    cfg.audio.default_input_device_id = 2;
    cfg.transcription.diarization_enabled = true;
    return cfg;
}

void write_wav(const std::string& path, size_t payload_bytes) {
    std::ofstream f(path, std::ios::binary);
    std::string bytes(44 + payload_bytes, '\0');
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

struct CoreHarness {
    TmpDir dir;
    FakeReactor reactor;
    FakeServiceHub hub;
    RecordingIpcServer ipc;
    DaemonCore core{test_config(dir), false, reactor, ipc,
                    [this]() { return std::make_unique<FakeServiceSocket>(hub); }};

    static constexpr int client = 7;
    static constexpr int watcher = 9;

    CoreHarness() {
        REQUIRE(core.init());
        core.add_client(client);
        core.add_client(watcher);
        core.handle_command(watcher, {{"cmd", "watch"}});
    }

    std::vector<json>& replies(int fd = client) { return ipc.sent[fd]; }

    // The watch acknowledgement is the first message every watcher gets.
    std::vector<json> events() {
        auto& all = ipc.sent[watcher];
        return {all.begin() + 1, all.end()};
    }

    // Returns the output path the core asked the audio service to record to.
    std::string start_session(int64_t session_id) {
        core.handle_command(client, {{"cmd", "start"}, {"session_id", session_id}});
        auto start = json::parse(hub.last()->sent.at(0));
        hub.deliver(hub.last(), R"({"type":"ready"})");
        return start["output_path"].get<std::string>();
    }
};

} // namespace

TEST_CASE("DaemonCore recording lifecycle", "[core]") {
    CoreHarness h;
    auto session = h.core.ledger().create_session("Design review");
    REQUIRE(session.has_value());

    SECTION("StartRepliesAfterReady") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "start"}, {"session_id", session->id}});
        REQUIRE(h.replies().empty());

        auto start = json::parse(h.hub.last()->sent.at(0));
        REQUIRE(start["session_id"] == std::to_string(session->id));
        REQUIRE(start["input_device_id"] == 2);
        REQUIRE(start["diarization_enabled"] == true);

        auto out = start["output_path"].get<std::string>();
        auto expected_dir = h.dir.path / "recordings" / ("session-" + std::to_string(session->id));
        REQUIRE(std::filesystem::path(out).parent_path() == expected_dir);
        REQUIRE(std::filesystem::is_directory(expected_dir));
        auto file = std::filesystem::path(out).filename().string();
        REQUIRE(file.starts_with("recording-"));
        REQUIRE(file.ends_with("Z.wav"));
        REQUIRE(file.find(':') == std::string::npos);

        h.hub.deliver(h.hub.last(), R"({"type":"ready"})");
        REQUIRE(h.replies().size() == 1);
        REQUIRE(h.replies()[0]["status"] == "ok");

        auto events = h.events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0] == json{{"event", "state"}, {"recording", true}});
    }

    SECTION("ExplicitInputOverridesDefault") {
        h.core.handle_command(CoreHarness::client,
                              {{"cmd", "start"}, {"session_id", session->id}, {"input_device_id", 5}});
        REQUIRE(json::parse(h.hub.last()->sent.at(0))["input_device_id"] == 5);
    }

    SECTION("StartWithoutSessionIsRejected") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "start"}});
        REQUIRE(h.replies().size() == 1);
        REQUIRE(h.replies()[0]["status"] == "error");
        REQUIRE(h.hub.connections.empty());
    }

    SECTION("StartFailureIsReported") {
        h.hub.refuse = true;
        h.core.handle_command(CoreHarness::client, {{"cmd", "start"}, {"session_id", session->id}});
        REQUIRE(h.replies().size() == 1);
        REQUIRE(h.replies()[0]["status"] == "error");
        REQUIRE(h.replies()[0]["message"].get<std::string>().find("refused") != std::string::npos);
    }

    SECTION("SegmentsArePersistedAndBroadcast") {
        h.start_session(session->id);
        h.hub.deliver(h.hub.last(),
                      R"({"type":"segment","speaker":"Speaker 1","text":"Let's begin","start_ms":0,"end_ms":1400})");

        auto rows = h.core.ledger().segments(session->id);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].text == "Let's begin");

        auto events = h.events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[1]["event"] == "segment");
        REQUIRE(events[1]["id"] == rows[0].id);
        REQUIRE(events[1]["session_id"] == session->id);
        REQUIRE(events[1]["speaker_id"] == "Speaker 1");
        REQUIRE(events[1]["speaker_name"].is_null());
        REQUIRE(events[1]["end_ms"] == 1400);
    }

    SECTION("StopRecordsArtifact") {
        auto out = h.start_session(session->id);
        write_wav(out, 32000 * 3);

        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}, {"session_id", session->id}});
        REQUIRE(h.replies().size() == 1); // start only
        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());

        REQUIRE(h.replies().size() == 2);
        REQUIRE(h.replies()[1]["status"] == "ok");
        REQUIRE(h.replies()[1]["audio_path"] == out);

        auto recs = h.core.ledger().recordings(session->id);
        REQUIRE(recs.size() == 1);
        REQUIRE(recs[0].file_path == out);
        REQUIRE(recs[0].duration_ms == 3000);
        REQUIRE(recs[0].started_at <= recs[0].stopped_at);

        auto sessions = h.core.ledger().list_sessions();
        REQUIRE(sessions[0].audio_file_path == out);

        auto events = h.events();
        REQUIRE(events.back() == json{{"event", "state"}, {"recording", false}});
    }

    SECTION("DoubleStopRecordsOnce") {
        auto out = h.start_session(session->id);
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}, {"session_id", session->id}});
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}, {"session_id", session->id}});
        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());

        // Both stop requests are answered with the same artifact.
        REQUIRE(h.replies().size() == 3);
        REQUIRE(h.replies()[1]["audio_path"] == out);
        REQUIRE(h.replies()[2]["audio_path"] == out);
        REQUIRE(h.core.ledger().recordings(session->id).size() == 1);
    }

    SECTION("StopThenShutdownRecordsOnce") {
        auto out = h.start_session(session->id);
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}});
        bool done = false;
        h.core.shutdown([&done]() { done = true; });
        REQUIRE_FALSE(done);

        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());
        REQUIRE(done);
        REQUIRE(h.replies().back()["audio_path"] == out);
        REQUIRE(h.core.ledger().recordings(session->id).size() == 1);
    }

    SECTION("StartDuringShutdownIsRefused") {
        auto out = h.start_session(session->id);
        bool done = false;
        h.core.shutdown([&done]() { done = true; });

        auto other = h.core.ledger().create_session("Late arrival");
        h.core.handle_command(CoreHarness::client, {{"cmd", "start"}, {"session_id", other->id}});
        REQUIRE(h.replies().back() == json{{"status", "error"}, {"message", "shutting down"}});
        REQUIRE(h.hub.connections.size() == 1);
        REQUIRE(h.core.manager().state() == ManagerState::Stopping);

        // The flush in progress still completes and is recorded.
        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());
        REQUIRE(done);
        REQUIRE(h.core.ledger().recordings(session->id).size() == 1);
        REQUIRE(h.core.ledger().recordings(other->id).empty());
    }

    SECTION("StopWithoutSessionIdUsesActive") {
        auto out = h.start_session(session->id);
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}});
        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());

        auto recs = h.core.ledger().recordings(session->id);
        REQUIRE(recs.size() == 1);
        // No file on disk, so no duration.
        REQUIRE_FALSE(recs[0].duration_ms.has_value());
    }

    SECTION("StopTimeoutRecordsNothing") {
        h.start_session(session->id);
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}});
        h.reactor.advance(60s);

        REQUIRE(h.replies().back()["status"] == "ok");
        REQUIRE(h.replies().back()["audio_path"].is_null());
        REQUIRE(h.core.ledger().recordings(session->id).empty());
    }

    SECTION("StopWhenIdle") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}});
        REQUIRE(h.replies().size() == 1);
        REQUIRE(h.replies()[0]["audio_path"].is_null());
    }

    SECTION("StatusReflectsSession") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "status"}});
        REQUIRE(h.replies().back() == json{{"status", "ok"}, {"recording", false}});

        h.start_session(session->id);
        h.core.handle_command(CoreHarness::client, {{"cmd", "status"}});
        REQUIRE(h.replies().back()["recording"] == true);
        REQUIRE(h.replies().back()["session_id"] == session->id);
    }

    SECTION("ConnectionLossIsBroadcast") {
        h.start_session(session->id);
        h.hub.peer_close(h.hub.last(), "connection closed by transcription service");

        auto events = h.events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[1]["recording"] == false);
        REQUIRE(events[1]["error"] == "connection closed by transcription service");

        h.core.handle_command(CoreHarness::client, {{"cmd", "status"}});
        REQUIRE(h.replies().back()["recording"] == false);
        REQUIRE(h.replies().back()["error"] == "connection closed by transcription service");
    }

    SECTION("ReplyDroppedForDepartedClient") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "start"}, {"session_id", session->id}});
        h.core.remove_client(CoreHarness::client);
        // Same fd number, different connection.
        h.core.add_client(CoreHarness::client);
        h.hub.deliver(h.hub.last(), R"({"type":"ready"})");

        REQUIRE(h.replies().empty());
        REQUIRE(h.core.manager().status());
    }

    SECTION("ShutdownStopsAndRecords") {
        auto out = h.start_session(session->id);
        bool done = false;
        h.core.shutdown([&done]() { done = true; });
        REQUIRE_FALSE(done);

        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());
        REQUIRE(done);
        REQUIRE(h.core.ledger().recordings(session->id).size() == 1);
    }

    SECTION("ShutdownWhenIdleIsImmediate") {
        bool done = false;
        h.core.shutdown([&done]() { done = true; });
        REQUIRE(done);

        h.core.handle_command(CoreHarness::client, {{"cmd", "start"}, {"session_id", session->id}});
        REQUIRE(h.replies().back()["message"] == "shutting down");
        REQUIRE(h.hub.connections.empty());
    }
}

TEST_CASE("DaemonCore queries", "[core]") {
    CoreHarness h;

    SECTION("InputsListed") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "inputs"}});
        h.hub.deliver(h.hub.last(), R"({"type":"inputs","devices":[{"id":0,"name":"Mic","is_default":true}]})");

        auto& r = h.replies().back();
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["devices"].size() == 1);
        REQUIRE(r["devices"][0]["id"] == 0);
        REQUIRE(r["devices"][0]["name"] == "Mic");
        REQUIRE(r["devices"][0]["is_default"] == true);
    }

    SECTION("InputsErrorReported") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "inputs"}});
        h.reactor.advance(5s);
        REQUIRE(h.replies().back()["status"] == "error");
    }

    SECTION("CreateAndListSessions") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "create_session"}, {"title", "1:1"}});
        auto created = h.replies().back();
        REQUIRE(created["status"] == "ok");
        REQUIRE(created["session"]["title"] == "1:1");
        REQUIRE(created["session"]["audio_file_path"].is_null());

        h.core.handle_command(CoreHarness::client, {{"cmd", "create_session"}});
        REQUIRE(h.replies().back()["session"]["title"] == "Untitled Meeting");

        h.core.handle_command(CoreHarness::client, {{"cmd", "sessions"}});
        REQUIRE(h.replies().back()["sessions"].size() == 2);
    }

    SECTION("RecordingsListed") {
        auto s = h.core.ledger().create_session("standup");
        auto out = h.start_session(s->id);
        write_wav(out, 32000);
        h.core.handle_command(CoreHarness::client, {{"cmd", "stop"}});
        h.hub.deliver(h.hub.last(), json{{"type", "stopped"}, {"audio_path", out}}.dump());

        h.core.handle_command(CoreHarness::client, {{"cmd", "recordings"}, {"session_id", s->id}});
        auto& r = h.replies().back();
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["recordings"].size() == 1);
        REQUIRE(r["recordings"][0]["session_id"] == s->id);
        REQUIRE(r["recordings"][0]["file_path"] == out);
        REQUIRE(r["recordings"][0]["duration_ms"] == 1000);

        h.core.handle_command(CoreHarness::client, {{"cmd", "recordings"}});
        REQUIRE(h.replies().back()["status"] == "error");
    }

    SECTION("SegmentsAndRename") {
        auto s = h.core.ledger().create_session("retro");
        h.core.ledger().insert_segment(s->id, "Speaker 1", "went well", 0, 500);

        h.core.handle_command(CoreHarness::client,
                              {{"cmd", "rename_speaker"}, {"session_id", s->id},
                               {"speaker_id", "Speaker 1"}, {"name", "Dana"}});
        REQUIRE(h.replies().back()["status"] == "ok");

        h.core.handle_command(CoreHarness::client, {{"cmd", "segments"}, {"session_id", s->id}});
        auto segs = h.replies().back()["segments"];
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0]["speaker_name"] == "Dana");
    }

    SECTION("BadArgumentsRejected") {
        h.core.handle_command(CoreHarness::client, {{"cmd", "segments"}});
        REQUIRE(h.replies().back()["status"] == "error");
        h.core.handle_command(CoreHarness::client, {{"cmd", "rename_speaker"}, {"session_id", 1}});
        REQUIRE(h.replies().back()["status"] == "error");
        h.core.handle_command(CoreHarness::client, {{"cmd", "dance"}});
        REQUIRE(h.replies().back() == json{{"status", "error"}, {"message", "unknown command"}});
    }

    SECTION("UnknownClientIgnored") {
        h.core.handle_command(42, {{"cmd", "status"}});
        REQUIRE_FALSE(h.ipc.sent.contains(42));
    }
}

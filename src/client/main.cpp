#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start SESSION [--input ID]            Start recording and transcribing");
    std::println(stderr, "  stop [SESSION]                        Stop and finalize the recording");
    std::println(stderr, "  status                                Show whether a session is recording");
    std::println(stderr, "  inputs                                List audio input devices");
    std::println(stderr, "  watch                                 Stream recording state and segments");
    std::println(stderr, "  new [TITLE]                           Create a session");
    std::println(stderr, "  sessions                              List sessions");
    std::println(stderr, "  segments SESSION                      Print a session transcript");
    std::println(stderr, "  recordings SESSION                    List a session's recorded audio");
    std::println(stderr, "  rename-speaker SESSION SPEAKER NAME   Name a speaker in a session");
}

static std::optional<int64_t> parse_id(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

static std::string speaker_label(const json& seg) {
    if (seg.contains("speaker_name") && seg["speaker_name"].is_string()) {
        return seg["speaker_name"].get<std::string>();
    }
    return seg.value("speaker_id", "?");
}

static void print_segment(const json& seg) {
    std::println("[{:>7.1f}s] {}: {}", seg.value("start_ms", int64_t{0}) / 1000.0,
                 speaker_label(seg), seg.value("text", ""));
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::optional<int64_t> input_id;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            input_id = parse_id(argv[++i]);
            if (!input_id) {
                std::println(stderr, "Invalid input device id: {}", argv[i]);
                return 1;
            }
        } else {
            positional.push_back(arg);
        }
    }

    auto session_arg = [&](size_t idx) -> std::optional<int64_t> {
        if (idx >= positional.size()) return std::nullopt;
        return parse_id(positional[idx]);
    };

    // Build command JSON
    json cmd;
    if (command == "start") {
        auto sid = session_arg(0);
        if (!sid) {
            std::println(stderr, "start requires a numeric session id");
            return 1;
        }
        cmd = {{"cmd", "start"}, {"session_id", *sid}};
        if (input_id) cmd["input_device_id"] = *input_id;
    } else if (command == "stop") {
        cmd = {{"cmd", "stop"}};
        if (auto sid = session_arg(0)) cmd["session_id"] = *sid;
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else if (command == "inputs") {
        cmd = {{"cmd", "inputs"}};
    } else if (command == "watch") {
        cmd = {{"cmd", "watch"}};
    } else if (command == "new") {
        cmd = {{"cmd", "create_session"}};
        if (!positional.empty()) cmd["title"] = positional[0];
    } else if (command == "sessions") {
        cmd = {{"cmd", "sessions"}};
    } else if (command == "segments") {
        auto sid = session_arg(0);
        if (!sid) {
            std::println(stderr, "segments requires a numeric session id");
            return 1;
        }
        cmd = {{"cmd", "segments"}, {"session_id", *sid}};
    } else if (command == "recordings") {
        auto sid = session_arg(0);
        if (!sid) {
            std::println(stderr, "recordings requires a numeric session id");
            return 1;
        }
        cmd = {{"cmd", "recordings"}, {"session_id", *sid}};
    } else if (command == "rename-speaker") {
        auto sid = session_arg(0);
        if (!sid || positional.size() < 3) {
            std::println(stderr, "rename-speaker requires SESSION SPEAKER NAME");
            return 1;
        }
        cmd = {{"cmd", "rename_speaker"}, {"session_id", *sid},
               {"speaker_id", positional[1]}, {"name", positional[2]}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is meetmated running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    // Display response
    if (command == "status") {
        std::println("Recording: {}", response.value("recording", false) ? "yes" : "no");
        if (response.contains("session_id")) {
            std::println("Session: {}", response["session_id"].get<int64_t>());
        }
        if (response.contains("error")) {
            std::println("Last error: {}", response.value("error", ""));
        }
    } else if (command == "stop") {
        if (response.contains("audio_path") && response["audio_path"].is_string()) {
            std::println("{}", response["audio_path"].get<std::string>());
        } else {
            std::println("Stopped (no recording confirmed)");
        }
    } else if (command == "inputs") {
        for (auto& d : response.value("devices", json::array())) {
            std::println("{:>4}  {}{}", d.value("id", int64_t{0}), d.value("name", ""),
                         d.value("is_default", false) ? "  (default)" : "");
        }
    } else if (command == "new") {
        std::println("{}", response["session"].value("id", int64_t{0}));
    } else if (command == "sessions") {
        for (auto& s : response.value("sessions", json::array())) {
            std::println("{:>4}  {}  {}", s.value("id", int64_t{0}), s.value("updated_at", ""),
                         s.value("title", ""));
        }
    } else if (command == "segments") {
        for (auto& seg : response.value("segments", json::array())) {
            print_segment(seg);
        }
    } else if (command == "recordings") {
        for (auto& r : response.value("recordings", json::array())) {
            auto duration = r.contains("duration_ms") && r["duration_ms"].is_number_integer()
                                ? std::format("{:.1f}s", r["duration_ms"].get<int64_t>() / 1000.0)
                                : std::string("?");
            std::println("{}  {:>8}  {}", r.value("started_at", ""), duration, r.value("file_path", ""));
        }
    } else if (command == "watch") {
        std::println("Recording: {}", response.value("recording", false) ? "yes" : "no");
        json event;
        while (client.recv(event, -1)) {
            auto kind = event.value("event", "");
            if (kind == "segment") {
                print_segment(event);
            } else if (kind == "state") {
                std::println("Recording: {}{}", event.value("recording", false) ? "yes" : "no",
                             event.contains("error") ? " (" + event.value("error", "") + ")" : "");
            }
        }
        std::println(stderr, "Daemon closed the connection");
    } else {
        std::println("OK");
    }

    return 0;
}

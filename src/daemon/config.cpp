#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<std::string> nullable_string(const json& j) {
    if (j.is_null()) return std::nullopt;
    return j.get<std::string>();
}

} // namespace

std::string Config::recordings_dir() const {
    if (storage.recordings_dir) return *storage.recordings_dir;
    auto data = platform::data_dir();
    return (data.empty() ? std::string("/tmp/meetmate") : data) + "/recordings";
}

std::string Config::database_path() const {
    if (storage.database_path) return *storage.database_path;
    auto data = platform::data_dir();
    return (data.empty() ? std::string("/tmp/meetmate") : data) + "/meetmate.db";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("service")) {
            auto& s = j["service"];
            if (s.contains("endpoint")) cfg.service.endpoint = s["endpoint"].get<std::string>();
            if (s.contains("connect_timeout_ms")) {
                cfg.service.connect_timeout_ms = s["connect_timeout_ms"].get<uint32_t>();
            }
            if (s.contains("stop_timeout_ms")) {
                cfg.service.stop_timeout_ms = s["stop_timeout_ms"].get<uint32_t>();
            }
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("recordings_dir")) cfg.storage.recordings_dir = nullable_string(s["recordings_dir"]);
            if (s.contains("database_path")) cfg.storage.database_path = nullable_string(s["database_path"]);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("default_input_device_id") && !a["default_input_device_id"].is_null()) {
                cfg.audio.default_input_device_id = a["default_input_device_id"].get<int64_t>();
            }
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("mode")) {
                auto mode = t["mode"].get<std::string>();
                if (mode == "local" || mode == "deepgram") {
                    cfg.transcription.mode = mode;
                } else {
                    std::println(stderr, "config: unknown transcription mode '{}', using '{}'",
                                 mode, cfg.transcription.mode);
                }
            }
            if (t.contains("diarization_enabled")) {
                cfg.transcription.diarization_enabled = t["diarization_enabled"].get<bool>();
            }
            if (t.contains("huggingface_token")) {
                cfg.transcription.huggingface_token = t["huggingface_token"].get<std::string>();
            }
            if (t.contains("local_diarization_model_path")) {
                cfg.transcription.local_diarization_model_path =
                    nullable_string(t["local_diarization_model_path"]);
            }
            if (t.contains("deepgram_api_key")) {
                cfg.transcription.deepgram_api_key = t["deepgram_api_key"].get<std::string>();
            }
            if (t.contains("deepgram_model")) {
                cfg.transcription.deepgram_model = t["deepgram_model"].get<std::string>();
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

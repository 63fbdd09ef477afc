#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct Config {
    struct Service {
        // ws://host[:port][/path] of the audio service.
        std::string endpoint = "ws://127.0.0.1:8765/ws";
        uint32_t connect_timeout_ms = 5000;
        uint32_t stop_timeout_ms = 60000;
    } service;

    struct Storage {
        std::optional<std::string> recordings_dir; // default: <data_dir>/recordings
        std::optional<std::string> database_path;  // default: <data_dir>/meetmate.db
    } storage;

    struct Audio {
        std::optional<int64_t> default_input_device_id;
    } audio;

    struct Transcription {
        std::string mode = "local"; // "local" or "deepgram"
        bool diarization_enabled = false;
        std::string huggingface_token;
        std::optional<std::string> local_diarization_model_path;
        std::string deepgram_api_key;
        std::string deepgram_model = "nova-2";
    } transcription;

    std::string recordings_dir() const;
    std::string database_path() const;

    static Config load(const std::string& path);
    static Config load_default();
};

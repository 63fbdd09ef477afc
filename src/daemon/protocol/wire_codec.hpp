#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Line-oriented JSON control protocol spoken with the audio service.
namespace wire {

struct StartCommand {
    std::string session_id;
    std::string output_path;
    std::optional<int64_t> input_device_id;
    std::string transcription_mode = "local"; // "local" or "deepgram"
    bool diarization_enabled = false;
    std::string huggingface_token;
    std::optional<std::string> local_diarization_model_path;
    std::string deepgram_api_key;
    std::string deepgram_model;
};

struct StopCommand {};
struct ListInputsCommand {};

using ServiceCommand = std::variant<StartCommand, StopCommand, ListInputsCommand>;

struct InputDevice {
    int64_t id = 0;
    std::string name;
    bool is_default = false;

    bool operator==(const InputDevice&) const = default;
};

struct ReadyEvent {};

struct SegmentEvent {
    std::string speaker;
    std::string text;
    int64_t start_ms = 0;
    int64_t end_ms = 0;
};

struct StoppedEvent {
    std::optional<std::string> audio_path;
};

struct InputsEvent {
    std::vector<InputDevice> devices;
};

struct ErrorEvent {
    std::string message;
};

using ServiceEvent =
    std::variant<ReadyEvent, SegmentEvent, StoppedEvent, InputsEvent, ErrorEvent>;

// Serializes a command to one compact JSON text, sent as a single frame.
std::string encode(const ServiceCommand& cmd);

// Returns nullopt for anything that is not a well-formed known message.
std::optional<ServiceEvent> decode(std::string_view message);

} // namespace wire

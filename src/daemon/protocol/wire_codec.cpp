#include "protocol/wire_codec.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace wire {

namespace {

struct Encoder {
    json operator()(const StartCommand& c) const {
        json j = {
            {"type", "start"},
            {"session_id", c.session_id},
            {"output_path", c.output_path},
            {"input_device_id", nullptr},
            {"transcription_mode", c.transcription_mode},
            {"diarization_enabled", c.diarization_enabled},
            {"huggingface_token", c.huggingface_token},
            {"local_diarization_model_path", nullptr},
            {"deepgram_api_key", c.deepgram_api_key},
            {"deepgram_model", c.deepgram_model},
        };
        if (c.input_device_id) j["input_device_id"] = *c.input_device_id;
        if (c.local_diarization_model_path) {
            j["local_diarization_model_path"] = *c.local_diarization_model_path;
        }
        return j;
    }
    json operator()(const StopCommand&) const { return {{"type", "stop"}}; }
    json operator()(const ListInputsCommand&) const { return {{"type", "list_inputs"}}; }
};

std::optional<InputDevice> decode_device(const json& d) {
    if (!d.is_object()) return std::nullopt;
    if (!d.contains("id") || !d["id"].is_number_integer()) return std::nullopt;

    InputDevice dev;
    dev.id = d["id"].get<int64_t>();
    if (d.contains("name") && d["name"].is_string()) dev.name = d["name"].get<std::string>();
    if (d.contains("is_default") && d["is_default"].is_boolean()) {
        dev.is_default = d["is_default"].get<bool>();
    }
    return dev;
}

} // namespace

std::string encode(const ServiceCommand& cmd) {
    return std::visit(Encoder{}, cmd).dump();
}

std::optional<ServiceEvent> decode(std::string_view message) {
    json msg = json::parse(message, nullptr, /*allow_exceptions=*/false);
    if (msg.is_discarded() || !msg.is_object()) return std::nullopt;

    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) return std::nullopt;
    auto type = type_it->get<std::string>();

    if (type == "ready") return ReadyEvent{};

    if (type == "segment") {
        if (!msg.contains("speaker") || !msg["speaker"].is_string()) return std::nullopt;
        if (!msg.contains("text") || !msg["text"].is_string()) return std::nullopt;
        if (!msg.contains("start_ms") || !msg["start_ms"].is_number()) return std::nullopt;
        if (!msg.contains("end_ms") || !msg["end_ms"].is_number()) return std::nullopt;
        return SegmentEvent{
            .speaker = msg["speaker"].get<std::string>(),
            .text = msg["text"].get<std::string>(),
            .start_ms = msg["start_ms"].get<int64_t>(),
            .end_ms = msg["end_ms"].get<int64_t>(),
        };
    }

    if (type == "stopped") {
        StoppedEvent ev;
        if (msg.contains("audio_path") && msg["audio_path"].is_string()) {
            ev.audio_path = msg["audio_path"].get<std::string>();
        }
        return ev;
    }

    if (type == "inputs") {
        InputsEvent ev;
        if (msg.contains("devices") && msg["devices"].is_array()) {
            for (auto& d : msg["devices"]) {
                if (auto dev = decode_device(d)) ev.devices.push_back(std::move(*dev));
            }
        }
        return ev;
    }

    if (type == "error") {
        ErrorEvent ev{.message = "Unknown error from transcription service"};
        if (msg.contains("message") && msg["message"].is_string()) {
            ev.message = msg["message"].get<std::string>();
        }
        return ev;
    }

    return std::nullopt;
}

} // namespace wire

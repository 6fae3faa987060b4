#include "live_protocol.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lumiere {
namespace protocol {

namespace {

std::string pcm_mime_type(int sample_rate) {
    return "audio/pcm;rate=" + std::to_string(sample_rate);
}

bool is_audio_mime(const std::string& mime) {
    return mime.rfind("audio/", 0) == 0;
}

void parse_server_content(const json& content, ServerEvent& event) {
    if (content.contains("inputTranscription") && content["inputTranscription"].is_object()) {
        const auto& t = content["inputTranscription"];
        if (t.contains("text") && t["text"].is_string()) {
            event.input_transcription = t["text"].get<std::string>();
        }
    }
    if (content.contains("outputTranscription") && content["outputTranscription"].is_object()) {
        const auto& t = content["outputTranscription"];
        if (t.contains("text") && t["text"].is_string()) {
            event.output_transcription = t["text"].get<std::string>();
        }
    }
    if (content.contains("turnComplete") && content["turnComplete"].is_boolean()) {
        event.turn_complete = content["turnComplete"].get<bool>();
    }

    if (content.contains("modelTurn") && content["modelTurn"].is_object()) {
        const auto& turn = content["modelTurn"];
        if (turn.contains("parts") && turn["parts"].is_array()) {
            for (const auto& part : turn["parts"]) {
                if (!part.is_object() || !part.contains("inlineData")) continue;
                const auto& inline_data = part["inlineData"];
                if (!inline_data.is_object() || !inline_data.contains("data") ||
                    !inline_data["data"].is_string()) {
                    continue;
                }
                std::string mime = inline_data.value("mimeType", std::string("audio/pcm"));
                if (!is_audio_mime(mime)) {
                    Logger::debug("Skipping non-audio inline part: " + mime);
                    continue;
                }
                event.audio_chunks.push_back(inline_data["data"].get<std::string>());
            }
        }
    }
}

void parse_tool_call(const json& tool_call, ServerEvent& event) {
    if (!tool_call.contains("functionCalls") || !tool_call["functionCalls"].is_array()) {
        return;
    }
    for (const auto& fc : tool_call["functionCalls"]) {
        if (!fc.is_object()) continue;
        ToolCall call;
        call.id = fc.value("id", std::string());
        call.name = fc.value("name", std::string());
        call.args_json = fc.contains("args") ? fc["args"].dump() : "{}";
        event.tool_calls.push_back(std::move(call));
    }
}

} // namespace

std::string model_resource(const std::string& model) {
    if (model.rfind("models/", 0) == 0) return model;
    return "models/" + model;
}

bool is_normal_close(int code) {
    return code == 0 || code == 1000 || code == 1001;
}

std::string build_session_closed_message(int code, const std::string& reason) {
    std::string text = reason.empty() ? "closed by remote" : reason;
    json message;
    message["sessionClosed"]["reason"] = text;
    if (!is_normal_close(code)) {
        message["error"]["message"] = text + " (code " + std::to_string(code) + ")";
    }
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

MessageAssembler::MessageAssembler(size_t max_bytes)
    : max_bytes_(max_bytes) {}

MessageAssembler::Status MessageAssembler::feed(const char* data, size_t len, bool final_chunk) {
    if (discarding_) {
        if (final_chunk) discarding_ = false;
        return Status::Incomplete;
    }
    if (buffer_.size() + len > max_bytes_) {
        buffer_.clear();
        discarding_ = !final_chunk;
        return Status::TooLarge;
    }
    buffer_.append(data, len);
    return final_chunk ? Status::Complete : Status::Incomplete;
}

std::string MessageAssembler::take() {
    std::string message;
    message.swap(buffer_);
    return message;
}

void MessageAssembler::reset() {
    buffer_.clear();
    discarding_ = false;
}

std::string build_setup_message(const SessionConfig& config) {
    json setup;
    setup["model"] = model_resource(config.model);
    setup["generationConfig"]["responseModalities"] = json::array({"AUDIO"});
    if (!config.voice_name.empty()) {
        setup["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] =
            config.voice_name;
    }
    if (!config.system_instruction.empty()) {
        setup["systemInstruction"]["parts"] =
            json::array({json::object({{"text", config.system_instruction}})});
    }

    json declarations = json::array();
    if (!config.tools_json.empty()) {
        try {
            declarations = json::parse(config.tools_json);
        } catch (const json::exception& e) {
            Logger::error(std::string("Invalid tool manifest, sending none: ") + e.what());
            declarations = json::array();
        }
    }
    if (declarations.is_array() && !declarations.empty()) {
        setup["tools"] = json::array({json::object({{"functionDeclarations", declarations}})});
    }

    setup["inputAudioTranscription"] = json::object();
    setup["outputAudioTranscription"] = json::object();

    json message;
    message["setup"] = setup;
    return message.dump();
}

std::string build_audio_message(const std::string& payload, int sample_rate) {
    json message;
    message["realtimeInput"]["audio"] = json::object({
        {"mimeType", pcm_mime_type(sample_rate)},
        {"data", payload}
    });
    return message.dump();
}

std::string build_tool_response_message(const ToolResponse& response) {
    json function_response;
    function_response["id"] = response.id;
    function_response["name"] = response.name;
    function_response["response"] = json::object({{"result", response.result}});

    json message;
    message["toolResponse"]["functionResponses"] = json::array({function_response});
    return message.dump();
}

Result<ServerEvent> parse_server_message(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return make_codec_error(std::string("malformed server message: ") + e.what());
    }
    if (!j.is_object()) {
        return make_codec_error("server message is not a JSON object");
    }

    ServerEvent event;
    try {
        if (j.contains("setupComplete")) {
            event.setup_complete = true;
        }
        if (j.contains("serverContent") && j["serverContent"].is_object()) {
            parse_server_content(j["serverContent"], event);
        }
        if (j.contains("toolCall") && j["toolCall"].is_object()) {
            parse_tool_call(j["toolCall"], event);
        }
        if (j.contains("goAway")) {
            // The service closes the channel shortly after; the close itself ends the session
            std::string time_left;
            if (j["goAway"].is_object() && j["goAway"].contains("timeLeft")) {
                time_left = j["goAway"]["timeLeft"].dump();
            }
            Logger::warn("Live service going away, time left: " + (time_left.empty() ? "unknown" : time_left));
        }
        if (j.contains("sessionClosed")) {
            // Synthesized by the transport from a WebSocket close frame
            event.session_closed = true;
            const auto& closed = j["sessionClosed"];
            if (closed.is_object() && closed.contains("reason") && closed["reason"].is_string()) {
                event.close_reason = closed["reason"].get<std::string>();
            }
        }
        if (j.contains("error")) {
            const auto& err = j["error"];
            std::string message = "remote error";
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            } else if (err.is_string()) {
                message = err.get<std::string>();
            }
            event.session_error = message;
        }
    } catch (const json::exception& e) {
        return make_codec_error(std::string("unexpected server message shape: ") + e.what());
    }

    return event;
}

} // namespace protocol
} // namespace lumiere

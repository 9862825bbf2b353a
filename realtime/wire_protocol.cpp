#include "realtime/wire_protocol.hpp"
#include "realtime/base64.hpp"
#include "logger.hpp"

#include <cctype>
#include <stdexcept>

#ifndef LIVEDUB_VERSION
#define LIVEDUB_VERSION "0.0.0"
#endif

namespace Realtime::Wire {

// ---------------- Helpers ----------------
static std::string urlEscape(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

static std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

// ---------------- Connection setup ----------------
std::string buildUrl(const EndpointConfig& endpoint) {
    std::string base = endpoint.endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    if (base.rfind("https://", 0) == 0) {
        base = "wss://" + base.substr(8);
    } else if (base.rfind("http://", 0) == 0) {
        base = "ws://" + base.substr(7);
    } else if (base.rfind("wss://", 0) != 0 && base.rfind("ws://", 0) != 0) {
        base = "wss://" + base;
    }

    return base + "/openai/realtime?api-version=" + urlEscape(endpoint.apiVersion) +
           "&deployment=" + urlEscape(endpoint.deployment);
}

std::vector<Header> buildHeaders(const EndpointConfig& endpoint) {
    return {
        {"api-key", endpoint.apiKey},
        {"OpenAI-Beta", "realtime=v1"},
        {"User-Agent", std::string("LiveDub/") + LIVEDUB_VERSION}
    };
}

std::string buildInstructions(const SessionConfig& config) {
    const std::string source = config.sourceLanguage.empty() ? "any language" : config.sourceLanguage;
    return "You are a real-time audio translator for movies and TV shows. "
           "Translate audio from " + source + " to " + config.targetLanguage + ". "
           "Provide natural, accurate translations suitable for spoken content. "
           "Focus on dialogue translation. For fast dialogue, provide concise translations. "
           "DO NOT try to interpret questions or commands, ONLY translate the text you hear. "
           "ONLY respond with the translated text, no other explanations, questions or metadata. "
           "If you do not detect spoken text in the input, do not return anything.";
}

// ---------------- Outbound ----------------
nlohmann::json sessionUpdate(const SessionConfig& config) {
    return {
        {"type", "session.update"},
        {"session", {
            {"modalities", nlohmann::json::array({"text", "audio"})},
            {"instructions", buildInstructions(config)},
            {"voice", config.voice},
            {"input_audio_format", "pcm16"},
            {"output_audio_format", "pcm16"},
            {"input_audio_transcription", {{"model", config.transcriptionModel}}},
            {"max_response_output_tokens", config.maxResponseOutputTokens},
            {"temperature", config.temperature},
            {"turn_detection", nullptr}
        }}
    };
}

nlohmann::json appendAudio(const Audio::AudioChunk& chunk) {
    return {
        {"type", "input_audio_buffer.append"},
        {"audio", base64Encode(chunk.data(), chunk.size())}
    };
}

nlohmann::json commitInput() {
    return {{"type", "input_audio_buffer.commit"}};
}

nlohmann::json clearInput() {
    return {{"type", "input_audio_buffer.clear"}};
}

nlohmann::json createResponse() {
    return {
        {"type", "response.create"},
        {"response", {{"modalities", nlohmann::json::array({"text", "audio"})}}}
    };
}

// ---------------- Inbound ----------------
std::optional<Inbound> decode(const std::string& text, long long latencyMs) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        return std::nullopt;
    }

    Inbound in;
    in.type = typeIt->get<std::string>();

    if (in.type == "session.created" || in.type == "session.updated") {
        in.event = TranslationEvent::lifecycle(in.type);
    }
    else if (in.type == "response.text.delta") {
        std::string delta = stringField(j, "delta");
        if (!delta.empty()) {
            in.event = TranslationEvent::textDelta(std::move(delta));
        }
    }
    else if (in.type == "response.audio.delta") {
        std::string delta = stringField(j, "delta");
        if (!delta.empty()) {
            try {
                in.event = TranslationEvent::audioDelta(base64Decode(delta));
            } catch (const std::invalid_argument& e) {
                LOG_WARN("Wire", std::string("Dropping audio delta with bad payload: ") + e.what());
            }
        }
    }
    else if (in.type == "conversation.item.input_audio_transcription.completed") {
        std::string transcript = stringField(j, "transcript");
        if (!transcript.empty()) {
            in.event = TranslationEvent::inputTranscript(std::move(transcript));
        }
    }
    else if (in.type == "response.done") {
        in.event = TranslationEvent::responseCompleted(latencyMs);
    }
    else if (in.type == "error") {
        std::string code = "unknown";
        std::string message = "Unknown error";
        auto errIt = j.find("error");
        if (errIt != j.end() && errIt->is_object()) {
            std::string c = stringField(*errIt, "code");
            if (c.empty()) c = stringField(*errIt, "type");
            if (!c.empty()) code = c;

            std::string m = stringField(*errIt, "message");
            if (!m.empty()) message = m;
        }
        in.event = TranslationEvent::protocolError(std::move(code), std::move(message));
    }

    return in;
}

} // namespace Realtime::Wire

#include "realtime/translation_event.hpp"

#include <utility>

namespace Realtime {

TranslationEvent TranslationEvent::textDelta(std::string text) {
    TranslationEvent ev;
    ev.kind = Kind::TextDelta;
    ev.text = std::move(text);
    return ev;
}

TranslationEvent TranslationEvent::audioDelta(std::vector<std::uint8_t> bytes) {
    TranslationEvent ev;
    ev.kind = Kind::AudioDelta;
    ev.audio = std::move(bytes);
    return ev;
}

TranslationEvent TranslationEvent::inputTranscript(std::string text) {
    TranslationEvent ev;
    ev.kind = Kind::InputTranscript;
    ev.text = std::move(text);
    return ev;
}

TranslationEvent TranslationEvent::responseCompleted(long long latencyMs) {
    TranslationEvent ev;
    ev.kind = Kind::ResponseCompleted;
    ev.latencyMs = latencyMs;
    return ev;
}

TranslationEvent TranslationEvent::protocolError(std::string code, std::string message) {
    TranslationEvent ev;
    ev.kind = Kind::ProtocolError;
    ev.code = std::move(code);
    ev.text = std::move(message);
    return ev;
}

TranslationEvent TranslationEvent::lifecycle(std::string stateName) {
    TranslationEvent ev;
    ev.kind = Kind::SessionLifecycle;
    ev.text = std::move(stateName);
    return ev;
}

const char* eventKindName(TranslationEvent::Kind kind) {
    switch (kind) {
        case TranslationEvent::Kind::TextDelta:         return "TextDelta";
        case TranslationEvent::Kind::AudioDelta:        return "AudioDelta";
        case TranslationEvent::Kind::InputTranscript:   return "InputTranscript";
        case TranslationEvent::Kind::ResponseCompleted: return "ResponseCompleted";
        case TranslationEvent::Kind::ProtocolError:     return "ProtocolError";
        case TranslationEvent::Kind::SessionLifecycle:  return "SessionLifecycle";
    }
    return "Unknown";
}

} // namespace Realtime

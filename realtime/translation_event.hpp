#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Realtime {

    // One decoded inbound message from the translation service
    struct TranslationEvent {
        enum class Kind {
            TextDelta,          // text
            AudioDelta,         // audio
            InputTranscript,    // text
            ResponseCompleted,  // latencyMs
            ProtocolError,      // code, text
            SessionLifecycle    // text = state name
        };

        Kind kind = Kind::SessionLifecycle;
        std::string text;
        std::vector<std::uint8_t> audio;
        long long latencyMs = 0;
        std::string code;

        static TranslationEvent textDelta(std::string text);
        static TranslationEvent audioDelta(std::vector<std::uint8_t> bytes);
        static TranslationEvent inputTranscript(std::string text);
        static TranslationEvent responseCompleted(long long latencyMs);
        static TranslationEvent protocolError(std::string code, std::string message);
        static TranslationEvent lifecycle(std::string stateName);
    };

    const char* eventKindName(TranslationEvent::Kind kind);

} // namespace Realtime

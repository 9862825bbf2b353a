#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "audio/audio_chunk.hpp"
#include "realtime/session_config.hpp"
#include "realtime/translation_event.hpp"

// =========================================================
// Wire protocol: JSON text messages with a "type" discriminator
// =========================================================
namespace Realtime::Wire {

    using Header = std::pair<std::string, std::string>;

    // ---------------- Connection setup ----------------
    // wss://<host>/openai/realtime?api-version=...&deployment=...
    std::string buildUrl(const EndpointConfig& endpoint);
    std::vector<Header> buildHeaders(const EndpointConfig& endpoint);

    std::string buildInstructions(const SessionConfig& config);

    // ---------------- Outbound ----------------
    nlohmann::json sessionUpdate(const SessionConfig& config);
    nlohmann::json appendAudio(const Audio::AudioChunk& chunk);
    nlohmann::json commitInput();
    nlohmann::json clearInput();
    nlohmann::json createResponse();

    // ---------------- Inbound ----------------
    struct Inbound {
        std::string type;
        std::optional<TranslationEvent> event;  // empty for messages that carry nothing we consume
    };

    // Returns std::nullopt for text that is not a JSON object with a string "type".
    // latencyMs is stamped onto ResponseCompleted events.
    std::optional<Inbound> decode(const std::string& text, long long latencyMs);

} // namespace Realtime::Wire

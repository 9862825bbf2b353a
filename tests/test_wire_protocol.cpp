#include <gtest/gtest.h>
#include <algorithm>

#include "realtime/wire_protocol.hpp"

using namespace Realtime;
using Kind = TranslationEvent::Kind;

namespace {

EndpointConfig azureEndpoint() {
    EndpointConfig ep;
    ep.endpoint = "https://dub-test.openai.azure.com/";
    ep.apiKey = "secret-key";
    ep.deployment = "gpt-4o-realtime-preview";
    return ep;
}

SessionConfig sessionTo(const std::string& source, const std::string& target) {
    SessionConfig cfg;
    cfg.endpoint = azureEndpoint();
    cfg.sourceLanguage = source;
    cfg.targetLanguage = target;
    return cfg;
}

std::string headerValue(const std::vector<Wire::Header>& headers, const std::string& name) {
    auto it = std::find_if(headers.begin(), headers.end(),
                           [&name](const Wire::Header& h) { return h.first == name; });
    return it == headers.end() ? "" : it->second;
}

} // namespace

// ---------------- Connection setup ----------------
TEST(WireProtocolTest, BuildsSecureWebSocketUrl) {
    EXPECT_EQ(Wire::buildUrl(azureEndpoint()),
              "wss://dub-test.openai.azure.com/openai/realtime"
              "?api-version=2024-10-01-preview&deployment=gpt-4o-realtime-preview");
}

TEST(WireProtocolTest, PlainHttpAndBareHostSchemes) {
    auto ep = azureEndpoint();
    ep.endpoint = "http://localhost:8080";
    EXPECT_EQ(Wire::buildUrl(ep).rfind("ws://localhost:8080/openai/realtime?", 0), 0u);

    ep.endpoint = "dub-test.openai.azure.com";
    EXPECT_EQ(Wire::buildUrl(ep).rfind("wss://dub-test.openai.azure.com/openai/realtime?", 0), 0u);
}

TEST(WireProtocolTest, EscapesDeploymentName) {
    auto ep = azureEndpoint();
    ep.deployment = "my deploy&x";
    EXPECT_NE(Wire::buildUrl(ep).find("deployment=my%20deploy%26x"), std::string::npos);
}

TEST(WireProtocolTest, HeadersCarryKeyAndBetaFlag) {
    auto headers = Wire::buildHeaders(azureEndpoint());
    EXPECT_EQ(headerValue(headers, "api-key"), "secret-key");
    EXPECT_EQ(headerValue(headers, "OpenAI-Beta"), "realtime=v1");
    EXPECT_EQ(headerValue(headers, "User-Agent").rfind("LiveDub/", 0), 0u);
}

// ---------------- Outbound ----------------
TEST(WireProtocolTest, SessionUpdateDisablesServerTurnDetection) {
    auto msg = Wire::sessionUpdate(sessionTo("en", "es"));

    EXPECT_EQ(msg["type"], "session.update");
    const auto& s = msg["session"];
    EXPECT_TRUE(s.contains("turn_detection"));
    EXPECT_TRUE(s["turn_detection"].is_null());
    EXPECT_EQ(s["modalities"], nlohmann::json::array({"text", "audio"}));
    EXPECT_EQ(s["input_audio_format"], "pcm16");
    EXPECT_EQ(s["output_audio_format"], "pcm16");
    EXPECT_EQ(s["voice"], "alloy");
    EXPECT_EQ(s["input_audio_transcription"]["model"], "whisper-1");
    EXPECT_EQ(s["max_response_output_tokens"], 150);
    EXPECT_DOUBLE_EQ(s["temperature"].get<double>(), 0.7);
}

TEST(WireProtocolTest, InstructionsNameBothLanguages) {
    auto text = Wire::buildInstructions(sessionTo("en", "es"));
    EXPECT_NE(text.find("from en to es"), std::string::npos);
    EXPECT_NE(text.find("ONLY translate"), std::string::npos);
}

TEST(WireProtocolTest, InstructionsAcceptAnySourceWhenAutoDetecting) {
    auto text = Wire::buildInstructions(sessionTo("", "de"));
    EXPECT_NE(text.find("from any language to de"), std::string::npos);
}

TEST(WireProtocolTest, AppendCarriesBase64Audio) {
    Audio::AudioChunk chunk(std::vector<std::uint8_t>{0x00, 0x01, 0x02});
    auto msg = Wire::appendAudio(chunk);

    EXPECT_EQ(msg["type"], "input_audio_buffer.append");
    EXPECT_EQ(msg["audio"], "AAEC");
}

TEST(WireProtocolTest, ControlMessages) {
    EXPECT_EQ(Wire::commitInput()["type"], "input_audio_buffer.commit");
    EXPECT_EQ(Wire::clearInput()["type"], "input_audio_buffer.clear");

    auto create = Wire::createResponse();
    EXPECT_EQ(create["type"], "response.create");
    EXPECT_EQ(create["response"]["modalities"], nlohmann::json::array({"text", "audio"}));
}

// ---------------- Inbound ----------------
TEST(WireProtocolTest, DecodesTextDelta) {
    auto in = Wire::decode(R"({"type":"response.text.delta","delta":"Hola"})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->kind, Kind::TextDelta);
    EXPECT_EQ(in->event->text, "Hola");
}

TEST(WireProtocolTest, DecodesAudioDelta) {
    auto in = Wire::decode(R"({"type":"response.audio.delta","delta":"AAEC"})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->kind, Kind::AudioDelta);
    EXPECT_EQ(in->event->audio, (std::vector<std::uint8_t>{0x00, 0x01, 0x02}));
}

TEST(WireProtocolTest, CorruptAudioDeltaYieldsNoEvent) {
    auto in = Wire::decode(R"({"type":"response.audio.delta","delta":"@@@"})", 0);
    ASSERT_TRUE(in);
    EXPECT_EQ(in->type, "response.audio.delta");
    EXPECT_FALSE(in->event);
}

TEST(WireProtocolTest, DecodesInputTranscript) {
    auto in = Wire::decode(
        R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"hello there"})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->kind, Kind::InputTranscript);
    EXPECT_EQ(in->event->text, "hello there");
}

TEST(WireProtocolTest, ResponseDoneCarriesLatency) {
    auto in = Wire::decode(R"({"type":"response.done","response":{"status":"completed"}})", 1234);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->kind, Kind::ResponseCompleted);
    EXPECT_EQ(in->event->latencyMs, 1234);
}

TEST(WireProtocolTest, DecodesServiceError) {
    auto in = Wire::decode(
        R"({"type":"error","error":{"type":"invalid_request_error","code":"input_audio_buffer_commit_empty","message":"buffer too small"}})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->kind, Kind::ProtocolError);
    EXPECT_EQ(in->event->code, "input_audio_buffer_commit_empty");
    EXPECT_EQ(in->event->text, "buffer too small");
}

TEST(WireProtocolTest, ErrorWithoutDetailsFallsBack) {
    auto in = Wire::decode(R"({"type":"error"})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->code, "unknown");
    EXPECT_EQ(in->event->text, "Unknown error");

    in = Wire::decode(R"({"type":"error","error":{"type":"server_error"}})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->code, "server_error");
}

TEST(WireProtocolTest, SessionAcknowledgementsAreLifecycleEvents) {
    auto in = Wire::decode(R"({"type":"session.updated","session":{}})", 0);
    ASSERT_TRUE(in && in->event);
    EXPECT_EQ(in->event->kind, Kind::SessionLifecycle);
    EXPECT_EQ(in->event->text, "session.updated");
}

TEST(WireProtocolTest, UnconsumedTypesDecodeWithoutEvent) {
    for (const char* text : {R"({"type":"rate_limits.updated","rate_limits":[]})",
                             R"({"type":"response.audio_transcript.delta","delta":"x"})",
                             R"({"type":"something.new"})"}) {
        auto in = Wire::decode(text, 0);
        ASSERT_TRUE(in) << text;
        EXPECT_FALSE(in->event) << text;
    }
}

TEST(WireProtocolTest, RejectsMalformedMessages) {
    EXPECT_FALSE(Wire::decode("not json at all", 0));
    EXPECT_FALSE(Wire::decode("[1,2,3]", 0));
    EXPECT_FALSE(Wire::decode(R"({"delta":"no type"})", 0));
    EXPECT_FALSE(Wire::decode(R"({"type":42})", 0));
}

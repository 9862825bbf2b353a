#include <gtest/gtest.h>
#include <algorithm>

#include "bootstrap_config.hpp"
#include "engine/translation_engine.hpp"
#include "fakes.hpp"

using Engine::Backends;
using Engine::TranslationEngine;
using namespace std::chrono_literals;

namespace {

Settings configuredSettings() {
    Settings s;
    s.session.endpoint.endpoint = "https://dub-test.openai.azure.com";
    s.session.endpoint.apiKey = "k";
    s.session.endpoint.deployment = "rt";
    s.session.targetLanguage = "ro";
    // Fast loop so tests observe commits quickly
    s.tuning.initialIntervalMs = 30;
    s.tuning.minIntervalMs = 10;
    s.tuning.maxIntervalMs = 200;
    s.tuning.adjustmentMs = 10;
    return s;
}

class TranslationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::loadCatalog(bootstrap_config::defaultErrors());

        wire = std::make_shared<Fakes::TransportState>();
        mic = std::make_shared<Fakes::SourceState>();
        speaker = std::make_shared<Fakes::SinkState>();
        wire->log = &calls;
        mic->log = &calls;
        speaker->log = &calls;
    }

    Backends fakeBackends() {
        Backends b;
        b.makeSource = [this](const Settings&) { return std::make_unique<Fakes::FakeAudioSource>(mic); };
        b.makeSink = [this](const Settings&) { return std::make_unique<Fakes::FakeAudioSink>(speaker); };
        b.makeTransport = [this]() {
            transportsMade++;
            return std::make_unique<Fakes::FakeTransport>(wire);
        };
        return b;
    }

    std::unique_ptr<TranslationEngine> makeEngine(Settings settings = configuredSettings()) {
        auto engine = std::make_unique<TranslationEngine>(std::move(settings), fakeBackends());
        engine->onError([this](const EngineError& e) {
            std::lock_guard<std::mutex> lock(errorsMtx);
            errors.push_back(e.code());
        });
        return engine;
    }

    bool sawError(const std::string& code) {
        std::lock_guard<std::mutex> lock(errorsMtx);
        return std::find(errors.begin(), errors.end(), code) != errors.end();
    }

    Fakes::CallLog calls;
    std::shared_ptr<Fakes::TransportState> wire;
    std::shared_ptr<Fakes::SourceState> mic;
    std::shared_ptr<Fakes::SinkState> speaker;
    int transportsMade = 0;

    std::mutex errorsMtx;
    std::vector<std::string> errors;
};

} // namespace

// =========================================================
// Start
// =========================================================
TEST_F(TranslationEngineTest, RefusesToStartWithoutConfiguration) {
    Settings s = configuredSettings();
    s.session.endpoint.endpoint.clear();
    auto engine = makeEngine(s);

    EXPECT_FALSE(engine->isConfigured());
    EXPECT_FALSE(engine->start(std::nullopt, "es"));

    EXPECT_FALSE(engine->isActive());
    EXPECT_TRUE(sawError("ERR_ENGINE_NOT_CONFIGURED"));
    EXPECT_EQ(transportsMade, 0);
}

TEST_F(TranslationEngineTest, RefusesToStartWithoutTargetLanguage) {
    Settings s = configuredSettings();
    s.session.targetLanguage.clear();
    auto engine = makeEngine(s);

    EXPECT_FALSE(engine->start(std::nullopt, ""));
    EXPECT_TRUE(sawError("ERR_ENGINE_NOT_CONFIGURED"));
}

TEST_F(TranslationEngineTest, StartConnectsThenStartsDevices) {
    auto engine = makeEngine();

    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    EXPECT_TRUE(engine->isActive());
    EXPECT_TRUE(mic->running.load());
    EXPECT_TRUE(speaker->playing.load());

    auto sent = wire->sentJson();
    ASSERT_FALSE(sent.empty());
    EXPECT_EQ(sent[0]["type"], "session.update");
    std::string instructions = sent[0]["session"]["instructions"];
    EXPECT_NE(instructions.find("from any language to es"), std::string::npos);

    auto st = engine->status();
    EXPECT_TRUE(st.active);
    EXPECT_EQ(st.sessionState, "Active");
    EXPECT_EQ(st.sourceLanguage, "");
    EXPECT_EQ(st.targetLanguage, "es");
    EXPECT_EQ(st.commitIntervalMs, 30);
    EXPECT_EQ(st.pendingResponses, 0);

    engine->stop();
}

TEST_F(TranslationEngineTest, EmptyTargetFallsBackToConfiguredLanguage) {
    auto engine = makeEngine();

    ASSERT_TRUE(engine->start(std::string("en"), ""));
    EXPECT_EQ(engine->status().targetLanguage, "ro");
    EXPECT_EQ(engine->status().sourceLanguage, "en");
    engine->stop();
}

TEST_F(TranslationEngineTest, SecondStartIsRefused) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    EXPECT_FALSE(engine->start(std::nullopt, "de"));
    EXPECT_EQ(transportsMade, 1);
    EXPECT_EQ(engine->status().targetLanguage, "es");
    engine->stop();
}

TEST_F(TranslationEngineTest, ConnectFailureReleasesEverything) {
    wire->openError = EngineError(ErrorKind::Connection, "ERR_CONNECT_TIMEOUT", "timed out");
    auto engine = makeEngine();

    try {
        engine->start(std::nullopt, "es");
        FAIL() << "start should have thrown";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), "ERR_CONNECT_TIMEOUT");
    }

    EXPECT_FALSE(engine->isActive());
    EXPECT_EQ(mic->starts.load(), 0);
    EXPECT_EQ(speaker->starts.load(), 0);
    EXPECT_TRUE(sawError("ERR_CONNECT_TIMEOUT"));
    EXPECT_EQ(engine->status().sessionState, "Idle");
}

TEST_F(TranslationEngineTest, CaptureFailureClosesConnection) {
    mic->startError = EngineError(ErrorKind::Capture, "ERR_CAPTURE_NO_DEVICE", "no device");
    auto engine = makeEngine();

    EXPECT_THROW(engine->start(std::nullopt, "es"), EngineError);

    EXPECT_FALSE(engine->isActive());
    EXPECT_FALSE(wire->isOpen());
    EXPECT_GE(wire->closes, 1);
    EXPECT_FALSE(speaker->playing.load());
    EXPECT_TRUE(sawError("ERR_CAPTURE_NO_DEVICE"));
}

TEST_F(TranslationEngineTest, UnencodableLanguageFailsStartAndReleasesConnection) {
    auto engine = makeEngine();

    try {
        engine->start(std::nullopt, "espa\xF1ol");
        FAIL() << "start should have thrown";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), "ERR_CONNECT_FAILED");
    }

    EXPECT_FALSE(engine->isActive());
    EXPECT_FALSE(wire->isOpen());
    EXPECT_EQ(mic->starts.load(), 0);
    EXPECT_EQ(speaker->starts.load(), 0);
    EXPECT_TRUE(sawError("ERR_CONNECT_FAILED"));

    EXPECT_TRUE(engine->start(std::nullopt, "es"));
    engine->stop();
}

TEST_F(TranslationEngineTest, UnexpectedStartExceptionIsWrappedAndReleased) {
    speaker->throwOnStart = true;
    auto engine = makeEngine();

    try {
        engine->start(std::nullopt, "es");
        FAIL() << "start should have thrown";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), "ERR_ENGINE_START_FAILED");
        EXPECT_EQ(e.kind(), ErrorKind::Engine);
    }

    EXPECT_FALSE(engine->isActive());
    EXPECT_FALSE(wire->isOpen());
    EXPECT_EQ(mic->starts.load(), 0);
    EXPECT_TRUE(sawError("ERR_ENGINE_START_FAILED"));
    EXPECT_EQ(engine->status().sessionState, "Idle");
}

TEST_F(TranslationEngineTest, CanRestartAfterStop) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));
    engine->stop();
    ASSERT_TRUE(engine->start(std::nullopt, "fr"));

    EXPECT_EQ(transportsMade, 2);
    EXPECT_EQ(engine->status().targetLanguage, "fr");
    engine->stop();
}

// =========================================================
// Data flow
// =========================================================
TEST_F(TranslationEngineTest, CapturedAudioIsStreamedAndCommitted) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    mic->emitBytes(1920);

    ASSERT_TRUE(Fakes::waitUntil([&] { return wire->countSent("response.create") == 1; }));

    auto types = wire->sentTypes();
    auto append = std::find(types.begin(), types.end(), "input_audio_buffer.append");
    auto commit = std::find(types.begin(), types.end(), "input_audio_buffer.commit");
    ASSERT_NE(append, types.end());
    ASSERT_NE(commit, types.end());
    EXPECT_LT(append - types.begin(), commit - types.begin());

    EXPECT_EQ(engine->status().chunksCaptured, 1u);
    EXPECT_EQ(engine->status().pendingResponses, 1);
    engine->stop();
}

TEST_F(TranslationEngineTest, SilenceProducesNoCommits) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(wire->countSent("input_audio_buffer.commit"), 0u);
    EXPECT_EQ(wire->countSent("response.create"), 0u);
    engine->stop();
}

TEST_F(TranslationEngineTest, TranslationReachesListenersAndSpeaker) {
    auto engine = makeEngine();
    std::mutex mtx;
    std::string text;
    std::vector<std::size_t> audioSizes;
    std::vector<long long> latencies;
    engine->onTranslatedText([&](const std::string& t) {
        std::lock_guard<std::mutex> lock(mtx);
        text += t;
    });
    engine->onTranslatedAudio([&](const Audio::AudioChunk& c) {
        std::lock_guard<std::mutex> lock(mtx);
        audioSizes.push_back(c.size());
    });
    engine->onResponseCompleted([&](long long ms) {
        std::lock_guard<std::mutex> lock(mtx);
        latencies.push_back(ms);
    });
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    wire->pushJson({{"type", "response.text.delta"}, {"delta", "Buenos "}});
    wire->pushJson({{"type", "response.audio.delta"}, {"delta", "AAECAw=="}});
    wire->pushJson({{"type", "response.text.delta"}, {"delta", "días"}});
    wire->pushJson({{"type", "response.done"}});

    ASSERT_TRUE(Fakes::waitUntil([&] {
        std::lock_guard<std::mutex> lock(mtx);
        return latencies.size() == 1;
    }));

    {
        std::lock_guard<std::mutex> lock(mtx);
        EXPECT_EQ(text, "Buenos días");
        EXPECT_EQ(audioSizes, (std::vector<std::size_t>{4}));
    }
    EXPECT_EQ(speaker->playedCount(), 1u);
    engine->stop();
}

TEST_F(TranslationEngineTest, InputTranscriptIsForwarded) {
    auto engine = makeEngine();
    std::mutex mtx;
    std::vector<std::string> heard;
    engine->onInputTranscript([&](const std::string& t) {
        std::lock_guard<std::mutex> lock(mtx);
        heard.push_back(t);
    });
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    wire->pushJson({{"type", "conversation.item.input_audio_transcription.completed"},
                    {"transcript", "good morning"}});

    EXPECT_TRUE(Fakes::waitUntil([&] {
        std::lock_guard<std::mutex> lock(mtx);
        return heard.size() == 1 && heard[0] == "good morning";
    }));
    engine->stop();
}

// =========================================================
// Failures while running
// =========================================================
TEST_F(TranslationEngineTest, ServiceErrorIsReportedWithoutStopping) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    wire->pushJson({{"type", "error"}, {"error", {{"code", "server_error"}, {"message", "oops"}}}});

    EXPECT_TRUE(Fakes::waitUntil([&] { return sawError("ERR_PROTOCOL_REMOTE"); }));
    EXPECT_TRUE(engine->isActive());
    engine->stop();
}

TEST_F(TranslationEngineTest, CaptureErrorIsReportedWithoutStopping) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    mic->fail(EngineError(ErrorKind::Capture, "ERR_CAPTURE_STREAM", "stream finished"));

    EXPECT_TRUE(sawError("ERR_CAPTURE_STREAM"));
    EXPECT_TRUE(engine->isActive());
    engine->stop();
}

TEST_F(TranslationEngineTest, ConnectionLossTearsDownAndReports) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    wire->breakConnection();

    EXPECT_TRUE(Fakes::waitUntil([&] { return sawError("ERR_CONNECTION_LOST"); }));
    EXPECT_TRUE(Fakes::waitUntil([&] { return !engine->isActive() && !mic->running && !speaker->playing; }));
    EXPECT_TRUE(Fakes::waitUntil([&] { return engine->status().sessionState == "Idle"; }));

    // The engine is reusable once the failed session is gone
    {
        std::lock_guard<std::mutex> lock(wire->mtx);
        wire->broken = false;
    }
    EXPECT_TRUE(engine->start(std::nullopt, "es"));
    engine->stop();
}

TEST_F(TranslationEngineTest, DestroyingDuringConnectionLossIsSafe) {
    for (int i = 0; i < 20; ++i) {
        {
            std::lock_guard<std::mutex> lock(wire->mtx);
            wire->broken = false;
        }
        auto engine = makeEngine();
        ASSERT_TRUE(engine->start(std::nullopt, "es"));

        wire->breakConnection();
        engine.reset();

        EXPECT_FALSE(mic->running.load());
        EXPECT_FALSE(speaker->playing.load());
        EXPECT_FALSE(wire->isOpen());
    }
}

// =========================================================
// Stop
// =========================================================
TEST_F(TranslationEngineTest, StopTearsDownInOrder) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    engine->stop();

    int capture = calls.indexOf("capture.stop");
    int playback = calls.indexOf("playback.stop");
    int transport = calls.indexOf("transport.close");
    ASSERT_GE(capture, 0);
    ASSERT_GE(playback, 0);
    ASSERT_GE(transport, 0);
    EXPECT_LT(capture, playback);
    EXPECT_LT(playback, transport);
    EXPECT_FALSE(engine->isActive());
}

TEST_F(TranslationEngineTest, StopContinuesPastFailingStep) {
    speaker->throwOnStop = true;
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(std::nullopt, "es"));

    EXPECT_NO_THROW(engine->stop());

    EXPECT_FALSE(engine->isActive());
    EXPECT_GE(calls.indexOf("transport.close"), 0);
    EXPECT_FALSE(wire->isOpen());
}

TEST_F(TranslationEngineTest, StopWhenIdleIsANoop) {
    auto engine = makeEngine();
    EXPECT_NO_THROW(engine->stop());
    EXPECT_NO_THROW(engine->stop());
    EXPECT_TRUE(calls.snapshot().empty());
}

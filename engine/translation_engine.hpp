#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "audio/audio_sink.hpp"
#include "audio/audio_source.hpp"
#include "error_manager.hpp"
#include "realtime/streaming_session.hpp"
#include "realtime/transport.hpp"
#include "scheduler/commit_scheduler.hpp"
#include "settings.hpp"

namespace Engine {

    // Factories for the device / network edges, swapped out in tests
    struct Backends {
        std::function<std::unique_ptr<Audio::IAudioSource>(const Settings&)> makeSource;
        std::function<std::unique_ptr<Audio::IAudioSink>(const Settings&)> makeSink;
        std::function<std::unique_ptr<Realtime::IMessageTransport>()> makeTransport;

        // PortAudio capture, SFML playback, libcurl websocket
        static Backends defaults();
    };

    struct EngineStatus {
        bool active = false;
        std::string sessionState = "Idle";
        std::string sourceLanguage;
        std::string targetLanguage;
        int commitIntervalMs = 0;
        int pendingResponses = 0;
        std::uint64_t chunksCaptured = 0;
        std::size_t queuedPlaybackChunks = 0;
    };

    // Wires capture -> session -> playback with the adaptive commit loop
    // in between. One engine serves one session at a time.
    class TranslationEngine {
    public:
        using TextListener     = std::function<void(const std::string&)>;
        using AudioListener    = std::function<void(const Audio::AudioChunk&)>;
        using ErrorListener    = std::function<void(const EngineError&)>;
        using ResponseListener = std::function<void(long long latencyMs)>;

        explicit TranslationEngine(Settings settings,
                                   Backends backends = Backends::defaults(),
                                   Scheduler::CommitScheduler::NowFn now = {});
        ~TranslationEngine();

        TranslationEngine(const TranslationEngine&) = delete;
        TranslationEngine& operator=(const TranslationEngine&) = delete;

        // false when already active or not configured (the latter also
        // reaches the error listeners). Throws EngineError if startup fails;
        // everything opened so far is released first.
        // An empty target falls back to translation.target_language.
        bool start(const std::optional<std::string>& sourceLanguage, const std::string& targetLanguage);

        // Best-effort teardown: scheduler, receive loop, capture, playback, connection
        void stop();

        bool isActive() const { return active_.load(); }
        bool isConfigured() const { return settings_.isConfigured(); }
        EngineStatus status() const;
        const Settings& settings() const { return settings_; }

        // Register before start(); called from engine worker threads
        void onTranslatedText(TextListener listener);
        void onTranslatedAudio(AudioListener listener);
        void onError(ErrorListener listener);
        void onInputTranscript(TextListener listener);
        void onResponseCompleted(ResponseListener listener);

    private:
        class SessionCommitSink;

        void handleEvent(const Realtime::TranslationEvent& event);
        void handleChunk(const Audio::AudioChunk& chunk);
        void emitError(const EngineError& error);
        void teardownLocked();
        void scheduleTeardown();
        void joinTeardown();

        Settings settings_;
        Backends backends_;
        Scheduler::CommitScheduler::NowFn now_;

        mutable std::mutex lifecycleMtx_;
        std::atomic<bool> active_{false};
        std::string sourceLanguage_;
        std::string targetLanguage_;

        std::unique_ptr<Realtime::StreamingSession> session_;
        std::unique_ptr<SessionCommitSink> commitSink_;
        std::unique_ptr<Scheduler::CommitScheduler> scheduler_;
        std::unique_ptr<Audio::IAudioSource> source_;
        std::unique_ptr<Audio::IAudioSink> sink_;

        std::atomic<std::uint64_t> chunksCaptured_{0};

        // Connection loss is torn down off the session's own threads
        std::mutex teardownMtx_;
        std::thread teardown_;
        std::atomic<bool> teardownScheduled_{false};

        std::mutex listenersMtx_;
        std::vector<TextListener> textListeners_;
        std::vector<AudioListener> audioListeners_;
        std::vector<ErrorListener> errorListeners_;
        std::vector<TextListener> transcriptListeners_;
        std::vector<ResponseListener> responseListeners_;
    };

} // namespace Engine

#include "engine/translation_engine.hpp"
#include "audio/portaudio_source.hpp"
#include "audio/sfml_sink.hpp"
#include "realtime/curl_ws_transport.hpp"
#include "logger.hpp"

namespace Engine {

using Realtime::TranslationEvent;

// ---------------- Commit sink ----------------
class TranslationEngine::SessionCommitSink : public Scheduler::ICommitSink {
public:
    explicit SessionCommitSink(Realtime::StreamingSession& session) : session_(session) {}

    bool commit() override { return session_.commit(); }
    bool requestResponse() override { return session_.requestResponse(); }
    bool clearInputBuffer() override { return session_.clearInputBuffer(); }

private:
    Realtime::StreamingSession& session_;
};

// ---------------- Backends ----------------
Backends Backends::defaults() {
    Backends b;
    b.makeSource = [](const Settings& s) -> std::unique_ptr<Audio::IAudioSource> {
        Audio::AudioFormat format;
        format.sampleRate = s.session.sampleRate;
        format.channels = s.session.channels;
        return std::make_unique<Audio::PortAudioSource>(
            format, static_cast<std::size_t>(s.session.bufferSizeBytes), s.capture);
    };
    b.makeSink = [](const Settings& s) -> std::unique_ptr<Audio::IAudioSink> {
        return std::make_unique<Audio::SfmlPlaybackSink>(s.playbackSampleRate, 1);
    };
    b.makeTransport = []() -> std::unique_ptr<Realtime::IMessageTransport> {
        return std::make_unique<Realtime::CurlWsTransport>();
    };
    return b;
}

TranslationEngine::TranslationEngine(Settings settings, Backends backends, Scheduler::CommitScheduler::NowFn now)
    : settings_(std::move(settings)), backends_(std::move(backends)), now_(std::move(now)) {}

// stop() clears active_ first so no connection loss can schedule another teardown
TranslationEngine::~TranslationEngine() {
    stop();
    joinTeardown();
}

// =========================================================
// Listeners
// =========================================================
void TranslationEngine::onTranslatedText(TextListener listener) {
    std::lock_guard<std::mutex> lock(listenersMtx_);
    textListeners_.push_back(std::move(listener));
}

void TranslationEngine::onTranslatedAudio(AudioListener listener) {
    std::lock_guard<std::mutex> lock(listenersMtx_);
    audioListeners_.push_back(std::move(listener));
}

void TranslationEngine::onError(ErrorListener listener) {
    std::lock_guard<std::mutex> lock(listenersMtx_);
    errorListeners_.push_back(std::move(listener));
}

void TranslationEngine::onInputTranscript(TextListener listener) {
    std::lock_guard<std::mutex> lock(listenersMtx_);
    transcriptListeners_.push_back(std::move(listener));
}

void TranslationEngine::onResponseCompleted(ResponseListener listener) {
    std::lock_guard<std::mutex> lock(listenersMtx_);
    responseListeners_.push_back(std::move(listener));
}

void TranslationEngine::emitError(const EngineError& error) {
    LOG_ERROR("Engine", std::string(errorKindName(error.kind())) + " error " + error.code() + ": " + error.what());
    std::lock_guard<std::mutex> lock(listenersMtx_);
    for (const auto& l : errorListeners_) {
        l(error);
    }
}

// =========================================================
// Start
// =========================================================
bool TranslationEngine::start(const std::optional<std::string>& sourceLanguage, const std::string& targetLanguage) {
    joinTeardown();

    std::lock_guard<std::mutex> lock(lifecycleMtx_);

    if (active_.load()) {
        LOG_WARN("Engine", "Translation already active");
        return false;
    }

    const std::string target = targetLanguage.empty() ? settings_.session.targetLanguage : targetLanguage;
    Settings effective = settings_;
    effective.session.targetLanguage = target;
    if (auto code = effective.validate()) {
        emitError(ErrorManager::make("ERR_ENGINE_NOT_CONFIGURED", *code));
        return false;
    }

    std::optional<std::string> source = sourceLanguage;
    if (source && source->empty()) {
        source.reset();
    }
    const Realtime::SessionConfig config = effective.sessionFor(source, target);

    LOG_PHASE("Engine start begin", true);
    LOG_INFO("Engine", "Starting translation " + (source ? *source : std::string("auto")) + " -> " + target);

    session_ = std::make_unique<Realtime::StreamingSession>(backends_.makeTransport(), now_);
    commitSink_ = std::make_unique<SessionCommitSink>(*session_);
    scheduler_ = std::make_unique<Scheduler::CommitScheduler>(*commitSink_, settings_.tuning, now_);
    source_ = backends_.makeSource(effective);
    sink_ = backends_.makeSink(effective);
    chunksCaptured_ = 0;

    session_->addListener([this](const TranslationEvent& ev) { handleEvent(ev); });
    source_->setChunkCallback([this](const Audio::AudioChunk& chunk) { handleChunk(chunk); });
    source_->setErrorCallback([this](const EngineError& e) { emitError(e); });
    sink_->setErrorCallback([this](const EngineError& e) { emitError(e); });

    try {
        session_->connect(config);
        sink_->start();
        source_->start();
        scheduler_->start();
    } catch (const EngineError& e) {
        LOG_PHASE("Engine start", false);
        teardownLocked();
        emitError(e);
        throw;
    } catch (const std::exception& e) {
        LOG_PHASE("Engine start", false);
        teardownLocked();
        EngineError wrapped = ErrorManager::make("ERR_ENGINE_START_FAILED", e.what());
        emitError(wrapped);
        throw wrapped;
    }

    sourceLanguage_ = source.value_or("");
    targetLanguage_ = target;
    active_ = true;
    LOG_PHASE("Engine start", true);
    return true;
}

// =========================================================
// Stop
// =========================================================
void TranslationEngine::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMtx_);
    if (!session_) {
        return;
    }

    const bool wasActive = active_.exchange(false);
    teardownLocked();
    if (wasActive) {
        LOG_PHASE("Engine stop", true);
        LOG_INFO("Engine", "Translation stopped");
    }
}

// Caller holds lifecycleMtx_
void TranslationEngine::teardownLocked() {
    active_ = false;

    auto step = [](const char* what, const std::function<void()>& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("Engine", std::string(what) + " failed during teardown: " + e.what());
        }
    };

    step("Scheduler stop", [this] { if (scheduler_) scheduler_->stop(); });
    step("Receive cancel", [this] { if (session_) session_->cancelReceive(); });
    step("Capture stop",   [this] { if (source_) source_->stop(); });
    step("Playback stop",  [this] { if (sink_) sink_->stop(); });
    step("Connection close", [this] { if (session_) session_->disconnect(); });

    scheduler_.reset();
    commitSink_.reset();
    source_.reset();
    sink_.reset();
    session_.reset();
}

void TranslationEngine::scheduleTeardown() {
    if (teardownScheduled_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(teardownMtx_);
    teardown_ = std::thread([this] { stop(); });
}

void TranslationEngine::joinTeardown() {
    std::thread pending;
    {
        std::lock_guard<std::mutex> lock(teardownMtx_);
        pending = std::move(teardown_);
    }
    if (pending.joinable()) {
        pending.join();
    }
    teardownScheduled_ = false;
}

// =========================================================
// Data paths
// =========================================================
void TranslationEngine::handleChunk(const Audio::AudioChunk& chunk) {
    chunksCaptured_++;

    // Queue the append before counting it so a commit never overtakes its audio
    if (!session_->sendAudio(chunk)) {
        LOG_TRACE("Engine", "Dropping captured chunk: session not active");
        return;
    }
    scheduler_->onAudioCaptured(chunk.size());
}

void TranslationEngine::handleEvent(const TranslationEvent& event) {
    switch (event.kind) {
        case TranslationEvent::Kind::TextDelta: {
            std::lock_guard<std::mutex> lock(listenersMtx_);
            for (const auto& l : textListeners_) l(event.text);
            break;
        }

        case TranslationEvent::Kind::AudioDelta: {
            Audio::AudioChunk chunk(event.audio);
            sink_->enqueue(chunk);
            std::lock_guard<std::mutex> lock(listenersMtx_);
            for (const auto& l : audioListeners_) l(chunk);
            break;
        }

        case TranslationEvent::Kind::InputTranscript: {
            LOG_DEBUG("Engine", "Heard: " + event.text);
            std::lock_guard<std::mutex> lock(listenersMtx_);
            for (const auto& l : transcriptListeners_) l(event.text);
            break;
        }

        case TranslationEvent::Kind::ResponseCompleted: {
            scheduler_->onResponseCompleted();
            std::lock_guard<std::mutex> lock(listenersMtx_);
            for (const auto& l : responseListeners_) l(event.latencyMs);
            break;
        }

        case TranslationEvent::Kind::ProtocolError:
            scheduler_->onResponseFailed();
            emitError(ErrorManager::make("ERR_PROTOCOL_REMOTE", event.code + ": " + event.text));
            break;

        case TranslationEvent::Kind::SessionLifecycle:
            if (event.text == Realtime::sessionStateName(Realtime::SessionState::Failed) && active_.load()) {
                emitError(ErrorManager::make("ERR_CONNECTION_LOST"));
                scheduleTeardown();
            }
            break;
    }
}

// =========================================================
// Status
// =========================================================
EngineStatus TranslationEngine::status() const {
    std::lock_guard<std::mutex> lock(lifecycleMtx_);

    EngineStatus s;
    s.active = active_.load();
    s.sourceLanguage = sourceLanguage_;
    s.targetLanguage = targetLanguage_;
    s.chunksCaptured = chunksCaptured_.load();

    if (session_) {
        s.sessionState = Realtime::sessionStateName(session_->state());
    }
    if (scheduler_) {
        auto snap = scheduler_->snapshot();
        s.commitIntervalMs = snap.currentIntervalMs;
        s.pendingResponses = snap.pendingResponses;
    } else {
        s.commitIntervalMs = settings_.tuning.initialIntervalMs;
    }
    if (sink_) {
        s.queuedPlaybackChunks = sink_->queuedChunks();
    }
    return s;
}

} // namespace Engine

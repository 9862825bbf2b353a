#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "audio/audio_sink.hpp"
#include "audio/audio_source.hpp"
#include "error_manager.hpp"
#include "realtime/translation_event.hpp"
#include "realtime/transport.hpp"
#include "scheduler/commit_scheduler.hpp"

namespace Fakes {

using namespace std::chrono_literals;

// Polls pred until it holds or timeout expires
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

// Shared log used to check teardown order across fakes
struct CallLog {
    std::mutex mtx;
    std::vector<std::string> calls;

    void add(const std::string& what) {
        std::lock_guard<std::mutex> lock(mtx);
        calls.push_back(what);
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mtx);
        return calls;
    }
    int indexOf(const std::string& what) {
        std::lock_guard<std::mutex> lock(mtx);
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i] == what) return static_cast<int>(i);
        }
        return -1;
    }
};

// ---------------- Clock ----------------
class FakeClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    TimePoint now() const { return TimePoint(std::chrono::milliseconds(ms_.load())); }
    void advance(std::chrono::milliseconds d) { ms_ += d.count(); }

    std::function<TimePoint()> fn() {
        return [this] { return now(); };
    }

private:
    // Starts well past the epoch so "no audio yet" reads as long silence
    std::atomic<long long> ms_{100000};
};

// ---------------- Transport ----------------
struct TransportState {
    std::mutex mtx;
    std::condition_variable cv;

    std::deque<Realtime::Frame> inbound;
    std::vector<std::string> sent;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    bool open = false;
    bool broken = false;
    int opens = 0;
    int closes = 0;
    bool failSends = false;
    std::optional<EngineError> openError;
    CallLog* log = nullptr;

    void pushFrame(Realtime::Frame frame) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            inbound.push_back(std::move(frame));
        }
        cv.notify_all();
    }
    void pushText(const std::string& text, bool final = true) {
        pushFrame(Realtime::Frame{Realtime::Frame::Kind::Text, text, final});
    }
    void pushJson(const nlohmann::json& j) { pushText(j.dump()); }
    void pushClose() { pushFrame(Realtime::Frame{Realtime::Frame::Kind::Close, "", true}); }

    void breakConnection() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            broken = true;
        }
        cv.notify_all();
    }

    std::vector<nlohmann::json> sentJson() {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<nlohmann::json> out;
        for (const auto& s : sent) out.push_back(nlohmann::json::parse(s));
        return out;
    }
    std::vector<std::string> sentTypes() {
        std::vector<std::string> types;
        for (const auto& j : sentJson()) types.push_back(j.value("type", ""));
        return types;
    }
    size_t countSent(const std::string& type) {
        size_t n = 0;
        for (const auto& t : sentTypes()) if (t == type) n++;
        return n;
    }
    size_t sentCount() {
        std::lock_guard<std::mutex> lock(mtx);
        return sent.size();
    }
    bool isOpen() {
        std::lock_guard<std::mutex> lock(mtx);
        return open;
    }
};

class FakeTransport : public Realtime::IMessageTransport {
public:
    explicit FakeTransport(std::shared_ptr<TransportState> state) : s_(std::move(state)) {}

    void open(const std::string& url,
              const std::vector<std::pair<std::string, std::string>>& headers,
              std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        s_->opens++;
        s_->url = url;
        s_->headers = headers;
        if (s_->openError) throw *s_->openError;
        s_->open = true;
        s_->broken = false;
    }

    void sendText(const std::string& message) override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        if (!s_->open || s_->failSends) {
            throw EngineError(ErrorKind::Connection, "ERR_SEND_FAILED", "send failed");
        }
        s_->sent.push_back(message);
        s_->cv.notify_all();
    }

    std::optional<Realtime::Frame> receive(std::chrono::milliseconds wait) override {
        std::unique_lock<std::mutex> lock(s_->mtx);
        s_->cv.wait_for(lock, wait, [this] { return !s_->inbound.empty() || s_->broken; });
        if (s_->broken) {
            s_->open = false;
            throw EngineError(ErrorKind::Connection, "ERR_CONNECTION_LOST", "connection reset");
        }
        if (s_->inbound.empty()) return std::nullopt;
        auto frame = std::move(s_->inbound.front());
        s_->inbound.pop_front();
        return frame;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        s_->closes++;
        s_->open = false;
        if (s_->log) s_->log->add("transport.close");
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        return s_->open;
    }

private:
    std::shared_ptr<TransportState> s_;
};

// ---------------- Audio source ----------------
struct SourceState {
    std::atomic<bool> running{false};
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::optional<EngineError> startError;
    Audio::ChunkCallback onChunk;
    Audio::ErrorCallback onError;
    CallLog* log = nullptr;

    void emit(const Audio::AudioChunk& chunk) { if (onChunk) onChunk(chunk); }
    void emitBytes(size_t n) { emit(Audio::AudioChunk(std::vector<std::uint8_t>(n, 0x01))); }
    void fail(const EngineError& e) { if (onError) onError(e); }
};

class FakeAudioSource : public Audio::IAudioSource {
public:
    explicit FakeAudioSource(std::shared_ptr<SourceState> state) : s_(std::move(state)) {}

    void setChunkCallback(Audio::ChunkCallback cb) override { s_->onChunk = std::move(cb); }
    void setErrorCallback(Audio::ErrorCallback cb) override { s_->onError = std::move(cb); }

    void start() override {
        s_->starts++;
        if (s_->startError) throw *s_->startError;
        s_->running = true;
    }
    void stop() override {
        s_->stops++;
        s_->running = false;
        if (s_->log) s_->log->add("capture.stop");
    }

    bool isRunning() const override { return s_->running.load(); }
    const Audio::AudioFormat& format() const override { return format_; }

private:
    std::shared_ptr<SourceState> s_;
    Audio::AudioFormat format_;
};

// ---------------- Audio sink ----------------
struct SinkState {
    std::mutex mtx;
    std::vector<Audio::AudioChunk> played;
    std::atomic<bool> playing{false};
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::optional<EngineError> startError;
    bool throwOnStart = false;
    bool throwOnStop = false;
    Audio::ErrorCallback onError;
    CallLog* log = nullptr;

    size_t playedCount() {
        std::lock_guard<std::mutex> lock(mtx);
        return played.size();
    }
};

class FakeAudioSink : public Audio::IAudioSink {
public:
    explicit FakeAudioSink(std::shared_ptr<SinkState> state) : s_(std::move(state)) {}

    void setErrorCallback(Audio::ErrorCallback cb) override { s_->onError = std::move(cb); }

    void start() override {
        s_->starts++;
        if (s_->startError) throw *s_->startError;
        if (s_->throwOnStart) throw std::runtime_error("no output device");
        s_->playing = true;
    }
    void enqueue(const Audio::AudioChunk& chunk) override {
        if (!s_->playing) return;
        std::lock_guard<std::mutex> lock(s_->mtx);
        s_->played.push_back(chunk);
    }
    void stop() override {
        s_->stops++;
        s_->playing = false;
        if (s_->log) s_->log->add("playback.stop");
        if (s_->throwOnStop) throw std::runtime_error("device vanished");
    }

    bool isPlaying() const override { return s_->playing.load(); }
    std::size_t queuedChunks() const override {
        std::lock_guard<std::mutex> lock(s_->mtx);
        return s_->played.size();
    }

private:
    std::shared_ptr<SinkState> s_;
};

// ---------------- Commit sink ----------------
class RecordingCommitSink : public Scheduler::ICommitSink {
public:
    bool commit() override { return record("commit"); }
    bool requestResponse() override { return record("response"); }
    bool clearInputBuffer() override { return record("clear"); }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
    }
    size_t count(const std::string& what) {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t n = 0;
        for (const auto& c : calls_) if (c == what) n++;
        return n;
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.clear();
    }

    std::atomic<bool> accept{true};

private:
    bool record(const std::string& what) {
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.push_back(what);
        return accept.load();
    }

    std::mutex mtx_;
    std::vector<std::string> calls_;
};

// ---------------- Event recorder ----------------
class EventRecorder {
public:
    void operator()(const Realtime::TranslationEvent& ev) {
        std::lock_guard<std::mutex> lock(mtx_);
        events_.push_back(ev);
    }

    std::vector<Realtime::TranslationEvent> events() {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_;
    }

    std::vector<Realtime::TranslationEvent> ofKind(Realtime::TranslationEvent::Kind kind) {
        std::vector<Realtime::TranslationEvent> out;
        for (const auto& e : events()) if (e.kind == kind) out.push_back(e);
        return out;
    }

    bool sawLifecycle(const std::string& state) {
        for (const auto& e : ofKind(Realtime::TranslationEvent::Kind::SessionLifecycle)) {
            if (e.text == state) return true;
        }
        return false;
    }

private:
    std::mutex mtx_;
    std::vector<Realtime::TranslationEvent> events_;
};

} // namespace Fakes

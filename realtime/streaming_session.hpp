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

#include "audio/audio_chunk.hpp"
#include "realtime/session_config.hpp"
#include "realtime/transport.hpp"
#include "realtime/translation_event.hpp"

namespace Realtime {

    enum class SessionState {
        Idle,
        Connecting,
        Configuring,
        Active,
        Stopping,
        Closed,
        Failed
    };

    const char* sessionStateName(SessionState state);

    using EventListener = std::function<void(const TranslationEvent&)>;

    // Owns the persistent connection to the translation service.
    //
    // connect() performs the upgrade and sends session.update before
    // returning. After that two threads run until disconnect():
    //   - writer:   drains the outbound queue, one message at a time
    //   - receiver: reassembles frames, decodes messages, notifies listeners
    //
    // Listeners are called in receive order and must not call disconnect().
    class StreamingSession {
    public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        explicit StreamingSession(std::unique_ptr<IMessageTransport> transport, NowFn now = {});
        ~StreamingSession();

        StreamingSession(const StreamingSession&) = delete;
        StreamingSession& operator=(const StreamingSession&) = delete;

        // Register before connect()
        void addListener(EventListener listener);

        // Throws EngineError (ERR_CONNECT_*, ERR_SEND_FAILED); leaves the session Failed
        void connect(const SessionConfig& config);

        // Queue one message. false when the session is not Active.
        bool sendAudio(const Audio::AudioChunk& chunk);
        bool commit();
        bool requestResponse();
        bool clearInputBuffer();

        // Stops the receive loop and the writer; the connection stays open until disconnect()
        void cancelReceive();

        // Cancels the receive loop, sends a close frame and releases the connection. Idempotent.
        void disconnect();

        SessionState state() const { return state_.load(); }
        bool isActive() const { return state_.load() == SessionState::Active; }

    private:
        bool enqueue(std::string message);
        void writerLoop();
        void receiveLoop();
        void handleMessage(const std::string& text);
        void setState(SessionState state);
        void fail(const std::string& reason);
        void dispatch(const TranslationEvent& event);
        void joinWorkers();
        void stopWorkers();
        void signalStop();
        void abortConnect();

        std::unique_ptr<IMessageTransport> transport_;
        NowFn now_;

        std::atomic<SessionState> state_{SessionState::Idle};
        std::atomic<bool> stopping_{false};
        std::mutex lifecycleMtx_;

        // Outbound queue (single writer)
        mutable std::mutex sendMtx_;
        std::condition_variable sendCv_;
        std::deque<std::string> outbound_;
        std::thread writer_;

        std::thread receiver_;

        std::mutex commitMtx_;
        std::optional<Clock::time_point> lastCommitAt_;

        std::recursive_mutex dispatchMtx_;
        std::vector<EventListener> listeners_;
    };

} // namespace Realtime

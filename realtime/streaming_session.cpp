#include "realtime/streaming_session.hpp"
#include "realtime/wire_protocol.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

namespace Realtime {

// Upper bound on how long disconnect() waits for the receiver to notice cancellation
constexpr std::chrono::milliseconds kReceivePoll{100};

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle:        return "Idle";
        case SessionState::Connecting:  return "Connecting";
        case SessionState::Configuring: return "Configuring";
        case SessionState::Active:      return "Active";
        case SessionState::Stopping:    return "Stopping";
        case SessionState::Closed:      return "Closed";
        case SessionState::Failed:      return "Failed";
    }
    return "Unknown";
}

StreamingSession::StreamingSession(std::unique_ptr<IMessageTransport> transport, NowFn now)
    : transport_(std::move(transport)),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

StreamingSession::~StreamingSession() {
    disconnect();
}

void StreamingSession::addListener(EventListener listener) {
    std::lock_guard<std::recursive_mutex> lock(dispatchMtx_);
    listeners_.push_back(std::move(listener));
}

// =========================================================
// Lifecycle
// =========================================================
void StreamingSession::connect(const SessionConfig& config) {
    std::lock_guard<std::mutex> lock(lifecycleMtx_);

    SessionState current = state_.load();
    if (current != SessionState::Idle && current != SessionState::Closed && current != SessionState::Failed) {
        ErrorManager::raise("ERR_ENGINE_ALREADY_ACTIVE", std::string("session is ") + sessionStateName(current));
    }

    // A previous session that failed on its own may still have workers winding down
    signalStop();
    joinWorkers();
    {
        std::lock_guard<std::mutex> sendLock(sendMtx_);
        stopping_ = false;
        outbound_.clear();
    }
    {
        std::lock_guard<std::mutex> commitLock(commitMtx_);
        lastCommitAt_.reset();
    }

    setState(SessionState::Connecting);
    try {
        transport_->open(Wire::buildUrl(config.endpoint),
                         Wire::buildHeaders(config.endpoint),
                         std::chrono::milliseconds(config.endpoint.connectTimeoutMs));

        setState(SessionState::Configuring);
        transport_->sendText(Wire::sessionUpdate(config).dump());
        LOG_DEBUG("Session", "Sent session configuration (turn detection disabled, manual commits)");
    } catch (const EngineError&) {
        abortConnect();
        throw;
    } catch (const std::exception& e) {
        // e.g. json type_error from a language name that is not valid UTF-8
        abortConnect();
        ErrorManager::raise("ERR_CONNECT_FAILED", e.what());
    }

    setState(SessionState::Active);
    writer_ = std::thread(&StreamingSession::writerLoop, this);
    receiver_ = std::thread(&StreamingSession::receiveLoop, this);

    LOG_PHASE("Realtime session connect", true);
    LOG_INFO("Session", "Connected (" + (config.sourceLanguage.empty() ? std::string("auto") : config.sourceLanguage) +
                        " -> " + config.targetLanguage + ")");
}

// Caller holds lifecycleMtx_
void StreamingSession::abortConnect() {
    transport_->close();
    setState(SessionState::Failed);
    LOG_PHASE("Realtime session connect", false);
}

void StreamingSession::cancelReceive() {
    std::lock_guard<std::mutex> lock(lifecycleMtx_);
    stopWorkers();
}

void StreamingSession::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycleMtx_);

    SessionState current = state_.load();
    if (current == SessionState::Idle || current == SessionState::Closed) {
        return;
    }

    stopWorkers();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> sendLock(sendMtx_);
        dropped = outbound_.size();
        outbound_.clear();
    }
    if (dropped > 0) {
        LOG_DEBUG("Session", "Discarded " + std::to_string(dropped) + " unsent message(s)");
    }

    transport_->close();
    setState(SessionState::Closed);
    LOG_INFO("Session", "Disconnected");
}

// Caller holds lifecycleMtx_
void StreamingSession::stopWorkers() {
    if (state_.load() == SessionState::Active) {
        setState(SessionState::Stopping);
    }

    signalStop();
    joinWorkers();
}

// The flag is written under sendMtx_ so the writer cannot miss the wakeup
void StreamingSession::signalStop() {
    {
        std::lock_guard<std::mutex> sendLock(sendMtx_);
        stopping_ = true;
    }
    sendCv_.notify_all();
}

void StreamingSession::joinWorkers() {
    if (receiver_.joinable()) receiver_.join();
    if (writer_.joinable()) writer_.join();
}

void StreamingSession::setState(SessionState state) {
    state_ = state;
    LOG_DEBUG("Session", std::string("State -> ") + sessionStateName(state));
    dispatch(TranslationEvent::lifecycle(sessionStateName(state)));
}

void StreamingSession::fail(const std::string& reason) {
    SessionState expected = SessionState::Active;
    if (!state_.compare_exchange_strong(expected, SessionState::Failed)) {
        return;
    }

    LOG_ERROR("Session", "Session failed: " + reason);
    {
        // Pairs with the writer's predicate check
        std::lock_guard<std::mutex> sendLock(sendMtx_);
    }
    sendCv_.notify_all();
    dispatch(TranslationEvent::lifecycle(sessionStateName(SessionState::Failed)));
}

// =========================================================
// Outbound
// =========================================================
bool StreamingSession::enqueue(std::string message) {
    {
        std::lock_guard<std::mutex> lock(sendMtx_);
        if (state_.load() != SessionState::Active) {
            return false;
        }
        outbound_.push_back(std::move(message));
    }
    sendCv_.notify_one();
    return true;
}

bool StreamingSession::sendAudio(const Audio::AudioChunk& chunk) {
    if (chunk.empty()) {
        return true;
    }
    return enqueue(Wire::appendAudio(chunk).dump());
}

bool StreamingSession::commit() {
    if (!enqueue(Wire::commitInput().dump())) {
        return false;
    }
    std::lock_guard<std::mutex> lock(commitMtx_);
    lastCommitAt_ = now_();
    return true;
}

bool StreamingSession::requestResponse() {
    return enqueue(Wire::createResponse().dump());
}

bool StreamingSession::clearInputBuffer() {
    return enqueue(Wire::clearInput().dump());
}

void StreamingSession::writerLoop() {
    while (true) {
        std::string message;
        {
            std::unique_lock<std::mutex> lock(sendMtx_);
            sendCv_.wait(lock, [this] {
                return stopping_.load() || state_.load() != SessionState::Active || !outbound_.empty();
            });
            if (stopping_.load() || state_.load() != SessionState::Active) {
                return;
            }
            message = std::move(outbound_.front());
            outbound_.pop_front();
        }

        try {
            transport_->sendText(message);
        } catch (const EngineError& e) {
            fail(e.what());
            return;
        }
    }
}

// =========================================================
// Inbound
// =========================================================
void StreamingSession::receiveLoop() {
    std::string message;

    while (!stopping_.load()) {
        std::optional<Frame> frame;
        try {
            frame = transport_->receive(kReceivePoll);
        } catch (const EngineError& e) {
            if (!stopping_.load()) {
                fail(e.what());
            }
            return;
        }

        if (!frame) {
            continue;
        }

        switch (frame->kind) {
            case Frame::Kind::Close:
                if (!stopping_.load()) {
                    LOG_WARN("Session", "Server closed the connection");
                    fail("server closed the connection");
                }
                return;

            case Frame::Kind::Binary:
                LOG_DEBUG("Session", "Ignoring binary frame (" + std::to_string(frame->data.size()) + " bytes)");
                break;

            case Frame::Kind::Text:
                message += frame->data;
                if (frame->final) {
                    handleMessage(message);
                    message.clear();
                }
                break;
        }
    }
}

void StreamingSession::handleMessage(const std::string& text) {
    long long latencyMs = 0;
    {
        std::lock_guard<std::mutex> lock(commitMtx_);
        if (lastCommitAt_) {
            latencyMs = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - *lastCommitAt_).count();
        }
    }

    auto inbound = Wire::decode(text, latencyMs);
    if (!inbound) {
        LOG_WARN("Session", "Skipping malformed message (" + std::to_string(text.size()) + " bytes)");
        return;
    }

    if (!inbound->event) {
        if (inbound->type == "rate_limits.updated") {
            LOG_DEBUG("Session", "Rate limits updated");
        } else {
            LOG_DEBUG("Session", "Unhandled message type: " + inbound->type);
        }
        return;
    }

    const TranslationEvent& event = *inbound->event;
    switch (event.kind) {
        case TranslationEvent::Kind::ResponseCompleted:
            LOG_DEBUG("Session", "Response completed in " + std::to_string(event.latencyMs) + "ms");
            break;
        case TranslationEvent::Kind::ProtocolError:
            LOG_ERROR("Session", "Service error " + event.code + ": " + event.text);
            break;
        case TranslationEvent::Kind::SessionLifecycle:
            LOG_DEBUG("Session", "Service acknowledged: " + event.text);
            break;
        default:
            LOG_TRACE("Session", std::string("Event ") + eventKindName(event.kind));
            break;
    }

    dispatch(event);
}

void StreamingSession::dispatch(const TranslationEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(dispatchMtx_);
    for (const auto& listener : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Session", std::string("Event listener threw: ") + e.what());
        }
    }
}

} // namespace Realtime

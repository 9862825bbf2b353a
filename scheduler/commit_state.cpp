#include "scheduler/commit_state.hpp"

#include <algorithm>

namespace Scheduler {

CommitTuning CommitTuning::sanitized() const {
    CommitTuning t = *this;
    t.minIntervalMs = std::max(t.minIntervalMs, 1);
    t.maxIntervalMs = std::max(t.maxIntervalMs, t.minIntervalMs);
    t.initialIntervalMs = std::clamp(t.initialIntervalMs, t.minIntervalMs, t.maxIntervalMs);
    t.adjustmentMs = std::max(t.adjustmentMs, 1);
    t.maxPendingResponses = std::max(t.maxPendingResponses, 1);
    t.minAudioBytes = std::max(t.minAudioBytes, 0);
    t.silenceThresholdMs = std::max(t.silenceThresholdMs, 0);
    return t;
}

const char* decisionName(CommitState::Decision decision) {
    switch (decision) {
        case CommitState::Decision::Overloaded: return "overloaded";
        case CommitState::Decision::Commit:     return "commit";
        case CommitState::Decision::Silent:     return "silent";
        case CommitState::Decision::Defer:      return "defer";
    }
    return "unknown";
}

CommitState::CommitState(const CommitTuning& tuning)
    : tuning_(tuning.sanitized()), intervalMs_(tuning_.initialIntervalMs) {}

void CommitState::recordAudio(std::size_t bytes, TimePoint now) {
    std::lock_guard<std::mutex> lock(mtx_);
    hasNewAudio_ = true;
    audioBytes_ += bytes;
    lastAudioAt_ = now;
}

CommitState::Decision CommitState::evaluateTick(TimePoint now) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (pending_ >= tuning_.maxPendingResponses) {
        clearActivity();
        return Decision::Overloaded;
    }

    if (hasNewAudio_ && audioBytes_ >= static_cast<std::size_t>(tuning_.minAudioBytes)) {
        pending_++;
        lastCommitAt_ = now;
        everCommitted_ = true;
        clearActivity();
        return Decision::Commit;
    }

    const auto sinceAudio = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastAudioAt_);
    if (!hasNewAudio_ || sinceAudio.count() > tuning_.silenceThresholdMs) {
        return Decision::Silent;
    }

    return Decision::Defer;
}

void CommitState::rollbackCommit() {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_ = std::max(0, pending_ - 1);
}

CommitState::Adjustment CommitState::resolveResponse(TimePoint now, bool completed) {
    std::lock_guard<std::mutex> lock(mtx_);

    pending_ = std::max(0, pending_ - 1);
    lastResponseAt_ = now;

    if (!completed || !everCommitted_) {
        return Adjustment::None;
    }

    const double latencyMs = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(lastResponseAt_ - lastCommitAt_).count());

    // Hysteresis band: 0.8x .. 1.2x of the current interval leaves it alone
    if (latencyMs > intervalMs_ * 1.2) {
        intervalMs_ = std::min(intervalMs_ + tuning_.adjustmentMs, tuning_.maxIntervalMs);
        return Adjustment::Increased;
    }
    if (latencyMs < intervalMs_ * 0.8) {
        intervalMs_ = std::max(intervalMs_ - tuning_.adjustmentMs, tuning_.minIntervalMs);
        return Adjustment::Decreased;
    }
    return Adjustment::None;
}

void CommitState::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    clearActivity();
    lastAudioAt_ = TimePoint{};
    pending_ = 0;
    intervalMs_ = tuning_.initialIntervalMs;
    everCommitted_ = false;
    lastCommitAt_ = TimePoint{};
    lastResponseAt_ = TimePoint{};
}

CommitState::Snapshot CommitState::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    Snapshot s;
    s.hasNewAudio = hasNewAudio_;
    s.audioBytesSinceCommit = audioBytes_;
    s.pendingResponses = pending_;
    s.currentIntervalMs = intervalMs_;
    s.everCommitted = everCommitted_;
    s.lastAudioAt = lastAudioAt_;
    s.lastCommitAt = lastCommitAt_;
    s.lastResponseAt = lastResponseAt_;
    return s;
}

int CommitState::currentIntervalMs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return intervalMs_;
}

int CommitState::pendingResponses() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_;
}

// Caller holds mtx_
void CommitState::clearActivity() {
    hasNewAudio_ = false;
    audioBytes_ = 0;
}

} // namespace Scheduler

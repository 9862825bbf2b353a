#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>

namespace Scheduler {

    // Tunables for the adaptive commit loop (scheduler.* in dub_config.json)
    struct CommitTuning {
        int initialIntervalMs = 2000;
        int minIntervalMs = 1000;
        int maxIntervalMs = 5000;
        int adjustmentMs = 500;
        int maxPendingResponses = 2;
        int minAudioBytes = 1600;           // ~50 ms of 16 kHz mono pcm16
        int silenceThresholdMs = 3000;

        // Returns a copy with min <= initial <= max and positive step/limits
        CommitTuning sanitized() const;
    };

    // Shared commit bookkeeping. Touched by the capture thread, the
    // scheduler loop and the receive loop; every operation takes the
    // lock for the duration of the field updates only.
    class CommitState {
    public:
        using Clock = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;

        enum class Decision {
            Overloaded,   // too many outstanding responses: clear server buffer
            Commit,       // enough new audio: commit + request a response
            Silent,       // nothing worth sending
            Defer         // some audio, below the commit threshold
        };

        enum class Adjustment { None, Increased, Decreased };

        struct Snapshot {
            bool hasNewAudio = false;
            std::size_t audioBytesSinceCommit = 0;
            int pendingResponses = 0;
            int currentIntervalMs = 0;
            bool everCommitted = false;
            TimePoint lastAudioAt{};
            TimePoint lastCommitAt{};
            TimePoint lastResponseAt{};
        };

        explicit CommitState(const CommitTuning& tuning = CommitTuning{});

        void recordAudio(std::size_t bytes, TimePoint now);

        // Decides what this tick does and applies its state change
        Decision evaluateTick(TimePoint now);

        // Undo the pending increment of a commit that could not be sent
        void rollbackCommit();

        // One outstanding response resolved. Only completed responses
        // feed the latency adjustment.
        Adjustment resolveResponse(TimePoint now, bool completed);

        void reset();

        Snapshot snapshot() const;
        int currentIntervalMs() const;
        int pendingResponses() const;
        const CommitTuning& tuning() const { return tuning_; }

    private:
        void clearActivity();

        const CommitTuning tuning_;

        mutable std::mutex mtx_;
        bool hasNewAudio_ = false;
        std::size_t audioBytes_ = 0;
        TimePoint lastAudioAt_{};
        int pending_ = 0;
        int intervalMs_;
        bool everCommitted_ = false;
        TimePoint lastCommitAt_{};
        TimePoint lastResponseAt_{};
    };

    const char* decisionName(CommitState::Decision decision);

} // namespace Scheduler

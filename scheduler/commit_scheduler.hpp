#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "scheduler/commit_state.hpp"

namespace Scheduler {

    // What the scheduler drives. Each call queues one message and returns
    // false when it could not be queued.
    class ICommitSink {
    public:
        virtual ~ICommitSink() = default;

        virtual bool commit() = 0;
        virtual bool requestResponse() = 0;
        virtual bool clearInputBuffer() = 0;
    };

    // Self-rescheduling commit loop: sleep for the *current* interval,
    // run one tick, re-read the interval. Ticks never overlap.
    class CommitScheduler {
    public:
        using NowFn = std::function<CommitState::TimePoint()>;

        CommitScheduler(ICommitSink& sink, const CommitTuning& tuning, NowFn now = {});
        ~CommitScheduler();

        CommitScheduler(const CommitScheduler&) = delete;
        CommitScheduler& operator=(const CommitScheduler&) = delete;

        void start();
        void stop();
        bool isRunning() const { return running_.load(); }

        // Activity and feedback signals
        void onAudioCaptured(std::size_t bytes);
        void onResponseCompleted();
        void onResponseFailed();

        // One evaluation of the decision tree, network calls made outside the lock
        CommitState::Decision tick();

        CommitState::Snapshot snapshot() const { return state_.snapshot(); }
        const CommitState& state() const { return state_; }

    private:
        void loop();

        ICommitSink& sink_;
        CommitState state_;
        NowFn now_;

        std::atomic<bool> running_{false};
        std::mutex waitMtx_;
        std::condition_variable waitCv_;
        std::thread thread_;
    };

} // namespace Scheduler

#include "scheduler/commit_scheduler.hpp"
#include "logger.hpp"

#include <string>

namespace Scheduler {

CommitScheduler::CommitScheduler(ICommitSink& sink, const CommitTuning& tuning, NowFn now)
    : sink_(sink),
      state_(tuning),
      now_(now ? std::move(now) : NowFn([] { return CommitState::Clock::now(); })) {}

CommitScheduler::~CommitScheduler() {
    stop();
}

// ---------------- Lifecycle ----------------
void CommitScheduler::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Scheduler", "Commit scheduler already running");
        return;
    }

    state_.reset();
    thread_ = std::thread(&CommitScheduler::loop, this);

    const auto& t = state_.tuning();
    LOG_INFO("Scheduler", "Adaptive commit loop started: interval " + std::to_string(t.initialIntervalMs) +
                          "ms [" + std::to_string(t.minIntervalMs) + ", " + std::to_string(t.maxIntervalMs) +
                          "], max pending " + std::to_string(t.maxPendingResponses));
}

void CommitScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMtx_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    waitCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("Scheduler", "Adaptive commit loop stopped");
}

void CommitScheduler::loop() {
    while (running_.load()) {
        const int intervalMs = state_.currentIntervalMs();
        {
            std::unique_lock<std::mutex> lock(waitMtx_);
            waitCv_.wait_for(lock, std::chrono::milliseconds(intervalMs), [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler", std::string("Commit tick failed: ") + e.what());
        }
    }
}

// ---------------- Signals ----------------
void CommitScheduler::onAudioCaptured(std::size_t bytes) {
    state_.recordAudio(bytes, now_());
}

void CommitScheduler::onResponseCompleted() {
    const int before = state_.currentIntervalMs();
    auto adjustment = state_.resolveResponse(now_(), true);
    if (adjustment == CommitState::Adjustment::None) {
        return;
    }

    const int after = state_.currentIntervalMs();
    if (after != before) {
        LOG_DEBUG("Scheduler", std::string(adjustment == CommitState::Adjustment::Increased
                                               ? "Increased" : "Decreased") +
                               " commit interval to " + std::to_string(after) + "ms");
    }
}

void CommitScheduler::onResponseFailed() {
    state_.resolveResponse(now_(), false);
}

// ---------------- Tick ----------------
CommitState::Decision CommitScheduler::tick() {
    auto decision = state_.evaluateTick(now_());

    switch (decision) {
        case CommitState::Decision::Overloaded:
            LOG_WARN("Scheduler", "Skipping commit: " + std::to_string(state_.pendingResponses()) +
                                  " responses pending, clearing input buffer");
            if (!sink_.clearInputBuffer()) {
                LOG_DEBUG("Scheduler", "Input buffer clear not sent (session inactive)");
            }
            break;

        case CommitState::Decision::Commit:
            if (sink_.commit() && sink_.requestResponse()) {
                LOG_DEBUG("Scheduler", "Committed audio (pending: " +
                                       std::to_string(state_.pendingResponses()) + ")");
            } else {
                state_.rollbackCommit();
                LOG_WARN("Scheduler", "Commit could not be sent, pending count rolled back");
            }
            break;

        case CommitState::Decision::Silent:
        case CommitState::Decision::Defer:
            LOG_TRACE("Scheduler", std::string("No commit this tick (") + decisionName(decision) + ")");
            break;
    }

    return decision;
}

} // namespace Scheduler

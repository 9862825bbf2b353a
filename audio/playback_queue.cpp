#include "audio/playback_queue.hpp"

namespace Audio {

void PlaybackQueue::push(const AudioChunk& chunk) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        chunks_.push_back(chunk);
    }
    cv_.notify_one();
}

std::optional<AudioChunk> PlaybackQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !chunks_.empty(); })) {
        return std::nullopt;
    }
    if (chunks_.empty()) {
        return std::nullopt;
    }

    AudioChunk front = chunks_.front();
    chunks_.pop_front();
    return front;
}

std::size_t PlaybackQueue::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t dropped = chunks_.size();
    chunks_.clear();
    return dropped;
}

void PlaybackQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

void PlaybackQueue::reopen() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = false;
}

std::size_t PlaybackQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return chunks_.size();
}

bool PlaybackQueue::empty() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return chunks_.empty();
}

} // namespace Audio

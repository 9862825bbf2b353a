#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "audio/audio_chunk.hpp"

namespace Audio {

    // Unbounded FIFO shared between producers (receive loop) and the
    // playback loop. push() never blocks on the consumer.
    class PlaybackQueue {
    public:
        void push(const AudioChunk& chunk);

        // Waits up to `timeout` for a chunk; nullopt when none arrived
        // or close() was called.
        std::optional<AudioChunk> popFor(std::chrono::milliseconds timeout);

        // Drops queued chunks, returns how many were dropped
        std::size_t clear();

        // Wakes any waiting consumer; subsequent pops return immediately
        void close();
        void reopen();

        std::size_t size() const;
        bool empty() const;

    private:
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<AudioChunk> chunks_;
        bool closed_ = false;
    };

} // namespace Audio

#pragma once
#include <cstddef>
#include "audio/audio_chunk.hpp"
#include "audio/audio_source.hpp"

namespace Audio {

    // Plays chunks in arrival order through an unbounded FIFO.
    class IAudioSink {
    public:
        virtual ~IAudioSink() = default;

        virtual void setErrorCallback(ErrorCallback callback) = 0;

        // Throws EngineError (ERR_PLAYBACK_*) if the output cannot be opened
        virtual void start() = 0;

        // Non-blocking, callable from any thread. No-op (with a warning)
        // when playback has not been started.
        virtual void enqueue(const AudioChunk& chunk) = 0;

        // Discards whatever is still queued. Idempotent.
        virtual void stop() = 0;

        virtual bool isPlaying() const = 0;
        virtual std::size_t queuedChunks() const = 0;
    };

} // namespace Audio

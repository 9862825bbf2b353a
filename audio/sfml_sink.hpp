#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include <SFML/Audio.hpp>
#include "audio/audio_sink.hpp"
#include "audio/playback_queue.hpp"

namespace Audio {

    // Streams queued PCM16 chunks through an sf::SoundStream. SFML's
    // streaming thread is the playback loop: it pulls from the queue in
    // onGetData() and pads with short silence while the queue is empty.
    class SfmlPlaybackSink : public IAudioSink {
    public:
        SfmlPlaybackSink(int sampleRate, int channels);
        ~SfmlPlaybackSink() override;

        void setErrorCallback(ErrorCallback callback) override { onError_ = std::move(callback); }

        void start() override;
        void enqueue(const AudioChunk& chunk) override;
        void stop() override;

        bool isPlaying() const override { return playing_.load(); }
        std::size_t queuedChunks() const override { return queue_.size(); }

    private:
        class Stream : public sf::SoundStream {
        public:
            Stream(SfmlPlaybackSink& owner, int sampleRate, int channels);
            ~Stream() override;

        protected:
            bool onGetData(Chunk& data) override;
            void onSeek(sf::Time) override {}

        private:
            SfmlPlaybackSink& owner_;
            std::vector<std::int16_t> samples_;
            std::size_t silenceSamples_;
        };

        int sampleRate_;
        int channels_;
        PlaybackQueue queue_;
        std::atomic<bool> playing_{false};
        std::atomic<bool> streamErrorReported_{false};
        ErrorCallback onError_;
        mutable std::mutex streamMtx_;
        std::unique_ptr<Stream> stream_;
    };

} // namespace Audio

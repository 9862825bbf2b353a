#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <portaudio.h>
#include "audio/audio_source.hpp"

namespace Audio {

    // PortAudio capture. The PortAudio callback only copies samples into a
    // pending list; a delivery thread hands them to the chunk callback.
    class PortAudioSource : public IAudioSource {
    public:
        PortAudioSource(const AudioFormat& format,
                        std::size_t bufferSizeBytes,
                        const CaptureSettings& settings);
        ~PortAudioSource() override;

        PortAudioSource(const PortAudioSource&) = delete;
        PortAudioSource& operator=(const PortAudioSource&) = delete;

        void setChunkCallback(ChunkCallback callback) override { onChunk_ = std::move(callback); }
        void setErrorCallback(ErrorCallback callback) override { onError_ = std::move(callback); }

        void start() override;
        void stop() override;

        bool isRunning() const override { return running_.load(); }
        const AudioFormat& format() const override { return format_; }

    private:
        static int streamCallback(const void* input, void* output, unsigned long frameCount,
                                  const PaStreamCallbackTimeInfo* timeInfo,
                                  PaStreamCallbackFlags statusFlags, void* userData);
        static void streamFinished(void* userData);

        int resolveDevice() const;
        void deliveryLoop();
        void closeStream();

        AudioFormat format_;
        std::size_t bufferSizeBytes_;
        CaptureSettings settings_;

        ChunkCallback onChunk_;
        ErrorCallback onError_;

        PaStream* stream_ = nullptr;
        bool paInitialized_ = false;

        std::atomic<bool> running_{false};
        std::atomic<bool> streamEnded_{false};
        std::atomic<unsigned long> overflows_{0};

        std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<AudioChunk> pending_;
        std::thread delivery_;
    };

} // namespace Audio

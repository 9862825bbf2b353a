#include "audio/sfml_sink.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>

namespace Audio {

// How long the playback loop waits for a chunk before padding with silence
constexpr std::chrono::milliseconds kPollInterval{20};

// =========================================================
// Stream
// =========================================================
SfmlPlaybackSink::Stream::Stream(SfmlPlaybackSink& owner, int sampleRate, int channels)
    : owner_(owner),
      silenceSamples_(static_cast<std::size_t>(sampleRate / 100 * channels)) {
    std::vector<sf::SoundChannel> channelMap;
    if (channels == 1) {
        channelMap = {sf::SoundChannel::Mono};
    } else {
        channelMap = {sf::SoundChannel::FrontLeft, sf::SoundChannel::FrontRight};
    }
    initialize(static_cast<unsigned int>(channels), static_cast<unsigned int>(sampleRate), channelMap);
}

SfmlPlaybackSink::Stream::~Stream() {
    sf::SoundStream::stop();
}

bool SfmlPlaybackSink::Stream::onGetData(Chunk& data) {
    if (!owner_.playing_.load()) {
        return false;
    }

    auto chunk = owner_.queue_.popFor(kPollInterval);
    if (!owner_.playing_.load()) {
        return false;
    }

    if (chunk && chunk->size() >= 2) {
        // PCM16 little-endian; a trailing odd byte is dropped
        const std::size_t count = chunk->size() / 2;
        samples_.resize(count);
        const std::uint8_t* bytes = chunk->data();
        for (std::size_t i = 0; i < count; ++i) {
            samples_[i] = static_cast<std::int16_t>(
                static_cast<std::uint16_t>(bytes[2 * i]) |
                (static_cast<std::uint16_t>(bytes[2 * i + 1]) << 8));
        }
    } else {
        samples_.assign(std::max<std::size_t>(silenceSamples_, 1), 0);
    }

    data.samples = samples_.data();
    data.sampleCount = samples_.size();
    return true;
}

// =========================================================
// Sink
// =========================================================
SfmlPlaybackSink::SfmlPlaybackSink(int sampleRate, int channels)
    : sampleRate_(sampleRate), channels_(channels) {}

SfmlPlaybackSink::~SfmlPlaybackSink() {
    stop();
}

void SfmlPlaybackSink::start() {
    if (playing_.load()) {
        LOG_WARN("Playback", "Audio playback is already active");
        return;
    }

    if (sampleRate_ <= 0 || channels_ <= 0 || channels_ > 2) {
        ErrorManager::raise("ERR_PLAYBACK_INIT", "unsupported output format " + std::to_string(sampleRate_) +
                                                 " Hz x " + std::to_string(channels_));
    }

    std::lock_guard<std::mutex> lock(streamMtx_);
    queue_.reopen();
    streamErrorReported_ = false;
    playing_ = true;

    stream_ = std::make_unique<Stream>(*this, sampleRate_, channels_);
    stream_->play();

    if (stream_->getStatus() != sf::SoundSource::Status::Playing) {
        playing_ = false;
        queue_.close();
        stream_.reset();
        ErrorManager::raise("ERR_PLAYBACK_INIT", "sound stream did not start");
    }

    LOG_INFO("Playback", "Audio playback started: " + std::to_string(sampleRate_) + " Hz, " +
                         std::to_string(channels_) + " channel(s)");
}

void SfmlPlaybackSink::enqueue(const AudioChunk& chunk) {
    if (!playing_.load()) {
        LOG_WARN("Playback", "Cannot enqueue audio: playback not started");
        return;
    }

    if (chunk.empty()) {
        return;
    }

    bool streamStopped = false;
    {
        // start() may still be building the stream when the first delta arrives
        std::lock_guard<std::mutex> lock(streamMtx_);
        streamStopped = stream_ && stream_->getStatus() == sf::SoundSource::Status::Stopped;
    }
    if (streamStopped && !streamErrorReported_.exchange(true)) {
        LOG_ERROR("Playback", "Sound stream stopped while playback is active");
        if (onError_) {
            onError_(ErrorManager::make("ERR_PLAYBACK_STREAM", "output stream stopped"));
        }
    }

    queue_.push(chunk);
    LOG_TRACE("Playback", "Queued " + std::to_string(chunk.size()) + " bytes of audio. Queue size: " +
                          std::to_string(queue_.size()));
}

void SfmlPlaybackSink::stop() {
    if (!playing_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Playback", "Stopping audio playback");

    queue_.close();
    {
        std::lock_guard<std::mutex> lock(streamMtx_);
        if (stream_) {
            stream_->stop();
            stream_.reset();
        }
    }

    std::size_t dropped = queue_.clear();
    LOG_INFO("Playback", "Audio playback stopped (" + std::to_string(dropped) + " queued chunk(s) discarded)");
}

} // namespace Audio

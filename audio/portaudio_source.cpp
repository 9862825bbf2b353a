#include "audio/portaudio_source.hpp"
#include "device_setups/audio_devices.hpp"
#include "logger.hpp"

#include <algorithm>
#include <vector>

namespace Audio {

PortAudioSource::PortAudioSource(const AudioFormat& format,
                                 std::size_t bufferSizeBytes,
                                 const CaptureSettings& settings)
    : format_(format), bufferSizeBytes_(bufferSizeBytes), settings_(settings) {}

PortAudioSource::~PortAudioSource() {
    stop();
}

// ---------------- Device selection ----------------
int PortAudioSource::resolveDevice() const {
    if (settings_.mode == CaptureMode::MediaPlayback) {
        std::string fragment = settings_.monitorDevice.empty() ? "monitor" : settings_.monitorDevice;
        int index = findInputDevice(fragment);
        if (index < 0) {
            ErrorManager::raise("ERR_CAPTURE_NO_MONITOR", "no input device matching \"" + fragment + "\"");
        }
        return index;
    }

    int deviceIndex = (settings_.inputDeviceIndex >= 0) ? settings_.inputDeviceIndex
                                                        : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        ErrorManager::raise("ERR_CAPTURE_NO_DEVICE", "device index " + std::to_string(deviceIndex));
    }
    return deviceIndex;
}

// ---------------- PortAudio callbacks ----------------
int PortAudioSource::streamCallback(const void* input, void*, unsigned long frameCount,
                                    const PaStreamCallbackTimeInfo*,
                                    PaStreamCallbackFlags statusFlags, void* userData) {
    auto* self = static_cast<PortAudioSource*>(userData);

    if (statusFlags & paInputOverflow) {
        self->overflows_++;
    }

    const auto* in = static_cast<const std::uint8_t*>(input);
    if (in && frameCount > 0) {
        std::size_t bytes = frameCount * static_cast<std::size_t>(self->format_.bytesPerFrame());
        {
            std::lock_guard<std::mutex> lock(self->mtx_);
            self->pending_.emplace_back(in, bytes);
        }
        self->cv_.notify_one();
    }
    return paContinue;
}

void PortAudioSource::streamFinished(void* userData) {
    auto* self = static_cast<PortAudioSource*>(userData);
    if (self->running_.load()) {
        {
            std::lock_guard<std::mutex> lock(self->mtx_);
            self->streamEnded_ = true;
        }
        self->cv_.notify_one();
    }
}

// ---------------- Control ----------------
void PortAudioSource::start() {
    if (running_.load()) {
        LOG_WARN("Capture", "Capture already running");
        return;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        ErrorManager::raise("ERR_CAPTURE_INIT", Pa_GetErrorText(err));
    }
    paInitialized_ = true;

    int deviceIndex = -1;
    try {
        deviceIndex = resolveDevice();
    } catch (const EngineError&) {
        closeStream();
        throw;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = format_.channels;
    inputParams.sampleFormat = paInt16;
    inputParams.suggestedLatency = devInfo ? devInfo->defaultLowInputLatency : 0.05;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    unsigned long framesPerBuffer = static_cast<unsigned long>(
        std::max<std::size_t>(1, bufferSizeBytes_ / static_cast<std::size_t>(format_.bytesPerFrame())));

    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        format_.sampleRate,
                        framesPerBuffer,
                        paNoFlag,
                        &PortAudioSource::streamCallback,
                        this);
    if (err != paNoError || !stream_) {
        stream_ = nullptr;
        closeStream();
        ErrorManager::raise("ERR_CAPTURE_INIT", std::string("could not open input stream: ") + Pa_GetErrorText(err));
    }

    Pa_SetStreamFinishedCallback(stream_, &PortAudioSource::streamFinished);

    streamEnded_ = false;
    overflows_ = 0;
    running_ = true;
    delivery_ = std::thread(&PortAudioSource::deliveryLoop, this);

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        stop();
        ErrorManager::raise("ERR_CAPTURE_INIT", std::string("could not start input stream: ") + Pa_GetErrorText(err));
    }

    LOG_INFO("Capture", std::string("Capturing (") + captureModeName(settings_.mode) + ") from device #" +
                        std::to_string(deviceIndex) + " \"" + (devInfo ? devInfo->name : "?") + "\" at " +
                        std::to_string(format_.sampleRate) + " Hz, " +
                        std::to_string(framesPerBuffer) + " frames/buffer");
}

void PortAudioSource::stop() {
    bool wasRunning = false;
    {
        // Written under mtx_ so the delivery loop cannot miss the wakeup
        std::lock_guard<std::mutex> lock(mtx_);
        wasRunning = running_.exchange(false);
    }
    if (!wasRunning) {
        closeStream();
        return;
    }

    LOG_DEBUG("Capture", "Stopping capture");

    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            LOG_ERROR("Capture", std::string("Pa_StopStream failed: ") + Pa_GetErrorText(err));
        }
    }

    cv_.notify_all();
    if (delivery_.joinable()) {
        delivery_.join();
    }

    closeStream();

    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.clear();
    }

    if (overflows_.load() > 0) {
        LOG_WARN("Capture", "Input overflowed " + std::to_string(overflows_.load()) + " time(s) during capture");
    }
    LOG_INFO("Capture", "Capture stopped");
}

void PortAudioSource::closeStream() {
    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (paInitialized_) {
        Pa_Terminate();
        paInitialized_ = false;
    }
}

// ---------------- Delivery ----------------
void PortAudioSource::deliveryLoop() {
    while (true) {
        std::deque<AudioChunk> batch;
        bool ended = false;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] {
                return !running_.load() || !pending_.empty() || streamEnded_.load();
            });
            if (!running_.load()) {
                return;
            }
            batch.swap(pending_);
            ended = streamEnded_.exchange(false);
        }

        for (const auto& chunk : batch) {
            if (!onChunk_) break;
            try {
                onChunk_(chunk);
            } catch (const std::exception& e) {
                LOG_ERROR("Capture", std::string("Chunk handler threw: ") + e.what());
            }
        }

        if (ended) {
            LOG_ERROR("Capture", "Input stream ended unexpectedly");
            if (onError_) {
                onError_(ErrorManager::make("ERR_CAPTURE_STREAM", "input stream ended while capturing"));
            }
        }
    }
}

} // namespace Audio

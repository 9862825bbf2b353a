#pragma once
#include <functional>
#include <string>
#include "audio/audio_chunk.hpp"
#include "error_manager.hpp"

namespace Audio {

    // Fixed when the source is constructed
    enum class CaptureMode {
        Microphone,     // live input device
        MediaPlayback   // mixed output of other applications (loopback/monitor device)
    };

    const char* captureModeName(CaptureMode mode);
    CaptureMode captureModeFromString(const std::string& name);

    struct CaptureSettings {
        CaptureMode mode = CaptureMode::Microphone;
        int inputDeviceIndex = -1;      // -1 = default input
        std::string monitorDevice;      // name fragment used in MediaPlayback mode
    };

    using ChunkCallback = std::function<void(const AudioChunk&)>;
    using ErrorCallback = std::function<void(const EngineError&)>;

    // Continuous capture. Callbacks are registered before start() and are
    // invoked from a capture thread, never from the caller of start().
    class IAudioSource {
    public:
        virtual ~IAudioSource() = default;

        virtual void setChunkCallback(ChunkCallback callback) = 0;
        virtual void setErrorCallback(ErrorCallback callback) = 0;

        // Throws EngineError (ERR_CAPTURE_*) if the device cannot be opened
        virtual void start() = 0;

        // Idempotent
        virtual void stop() = 0;

        virtual bool isRunning() const = 0;
        virtual const AudioFormat& format() const = 0;
    };

} // namespace Audio

#include "audio/audio_source.hpp"

#include <algorithm>
#include <cctype>

namespace Audio {

const char* captureModeName(CaptureMode mode) {
    switch (mode) {
        case CaptureMode::Microphone:    return "microphone";
        case CaptureMode::MediaPlayback: return "media";
    }
    return "microphone";
}

CaptureMode captureModeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (lower == "media" || lower == "playback" || lower == "loopback") {
        return CaptureMode::MediaPlayback;
    }
    return CaptureMode::Microphone;
}

} // namespace Audio

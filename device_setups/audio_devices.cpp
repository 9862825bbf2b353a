#include "audio_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <algorithm>
#include <cctype>
#include <sstream>

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::vector<AudioDeviceInfo> enumerateInitialized() {
    std::vector<AudioDeviceInfo> devices;

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        return devices;
    }

    int defaultIn = Pa_GetDefaultInputDevice();
    int defaultOut = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        AudioDeviceInfo info;
        info.index = i;
        info.name = deviceInfo->name ? deviceInfo->name : "";
        info.hostApi = (hostApiInfo && hostApiInfo->name) ? hostApiInfo->name : "unknown";
        info.maxInputChannels = deviceInfo->maxInputChannels;
        info.maxOutputChannels = deviceInfo->maxOutputChannels;
        info.defaultSampleRate = deviceInfo->defaultSampleRate;
        info.defaultLowInputLatency = deviceInfo->defaultLowInputLatency;
        info.defaultLowOutputLatency = deviceInfo->defaultLowOutputLatency;
        info.isDefaultInput = (i == defaultIn);
        info.isDefaultOutput = (i == defaultOut);
        devices.push_back(info);
    }
    return devices;
}

std::vector<AudioDeviceInfo> listAudioDevices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return {};
    }

    auto devices = enumerateInitialized();
    Pa_Terminate();
    return devices;
}

int findInputDevice(const std::string& fragment) {
    const std::string needle = toLower(fragment);
    for (const auto& dev : enumerateInitialized()) {
        if (dev.maxInputChannels <= 0) continue;
        if (toLower(dev.name).find(needle) != std::string::npos) {
            return dev.index;
        }
    }
    return -1;
}

std::string describeAudioDevices(const std::vector<AudioDeviceInfo>& devices) {
    std::ostringstream out;
    out << "=== PortAudio Device List ===\n";
    out << "Found " << devices.size() << " devices total\n\n";

    for (const auto& dev : devices) {
        out << "Device #" << dev.index << ": " << dev.name
            << "  (Host API: " << dev.hostApi << ")\n";
        out << "  Max input channels : " << dev.maxInputChannels << "\n";
        out << "  Max output channels: " << dev.maxOutputChannels << "\n";
        out << "  Default sample rate: " << dev.defaultSampleRate << "\n";
        out << "  Latency (input/output): "
            << dev.defaultLowInputLatency << " / "
            << dev.defaultLowOutputLatency << " sec\n";

        if (dev.isDefaultInput)
            out << "  *** Default INPUT device ***\n";
        if (dev.isDefaultOutput)
            out << "  *** Default OUTPUT device ***\n";

        out << "-------------------------------------------\n";
    }
    return out.str();
}

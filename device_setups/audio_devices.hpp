#pragma once
#include <string>
#include <vector>

struct AudioDeviceInfo {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    int maxOutputChannels = 0;
    double defaultSampleRate = 0.0;
    double defaultLowInputLatency = 0.0;
    double defaultLowOutputLatency = 0.0;
    bool isDefaultInput = false;
    bool isDefaultOutput = false;
};

// Enumerates PortAudio devices (initializes/terminates PortAudio itself).
// Returns an empty list if PortAudio cannot be initialized.
std::vector<AudioDeviceInfo> listAudioDevices();

// First capture-capable device whose name contains `fragment`
// (case-insensitive), or -1. PortAudio must already be initialized.
int findInputDevice(const std::string& fragment);

// Human-readable device table
std::string describeAudioDevices(const std::vector<AudioDeviceInfo>& devices);

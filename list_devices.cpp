#include <iostream>
#include "device_setups/audio_devices.hpp"

int main() {
    auto devices = listAudioDevices();
    if (devices.empty()) {
        std::cerr << "No PortAudio devices found (or PortAudio failed to initialize)\n";
        return 1;
    }

    std::cout << describeAudioDevices(devices);
    return 0;
}

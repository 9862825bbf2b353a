#pragma once
#include <string>

namespace Realtime {

    // Where and how to reach the service
    struct EndpointConfig {
        std::string endpoint;              // https://<resource>.openai.azure.com
        std::string apiKey;
        std::string deployment;
        std::string apiVersion = "2024-10-01-preview";
        int connectTimeoutMs = 30000;
    };

    // Fixed for the lifetime of one session; a language change needs a new session
    struct SessionConfig {
        EndpointConfig endpoint;

        int sampleRate = 16000;
        int channels = 1;
        int bufferSizeBytes = 3200;

        std::string sourceLanguage;        // empty = auto-detect
        std::string targetLanguage;

        std::string voice = "alloy";
        std::string transcriptionModel = "whisper-1";
        int maxResponseOutputTokens = 150;
        double temperature = 0.7;
    };

} // namespace Realtime

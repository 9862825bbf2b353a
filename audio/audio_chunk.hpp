#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

namespace Audio {

    // Linear PCM layout agreed at session start
    struct AudioFormat {
        int sampleRate = 16000;
        int channels = 1;
        int bitsPerSample = 16;

        int bytesPerFrame() const { return channels * (bitsPerSample / 8); }
    };

    // Immutable block of raw PCM bytes. Copies share the same buffer.
    class AudioChunk {
    public:
        AudioChunk() : data_(std::make_shared<const std::vector<std::uint8_t>>()) {}

        explicit AudioChunk(std::vector<std::uint8_t> bytes)
            : data_(std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes))) {}

        AudioChunk(const std::uint8_t* bytes, std::size_t size)
            : data_(std::make_shared<const std::vector<std::uint8_t>>(bytes, bytes + size)) {}

        const std::vector<std::uint8_t>& bytes() const { return *data_; }
        const std::uint8_t* data() const { return data_->data(); }
        std::size_t size() const { return data_->size(); }
        bool empty() const { return data_->empty(); }

    private:
        std::shared_ptr<const std::vector<std::uint8_t>> data_;
    };

} // namespace Audio

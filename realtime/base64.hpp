#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Realtime {

    std::string base64Encode(const std::uint8_t* data, std::size_t size);
    std::string base64Encode(const std::vector<std::uint8_t>& data);

    // Throws std::invalid_argument on characters outside the alphabet
    std::vector<std::uint8_t> base64Decode(const std::string& text);

} // namespace Realtime

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Realtime {

    // One raw frame off the connection. Text messages may span several
    // frames; final marks the last fragment of a message.
    struct Frame {
        enum class Kind { Text, Binary, Close };

        Kind kind = Kind::Text;
        std::string data;
        bool final = true;
    };

    // Message-framed, bidirectional connection
    class IMessageTransport {
    public:
        virtual ~IMessageTransport() = default;

        // Blocks until the upgrade completes. Throws EngineError:
        // ERR_CONNECT_TIMEOUT, ERR_CONNECT_UPGRADE_REJECTED or ERR_CONNECT_FAILED.
        virtual void open(const std::string& url,
                          const std::vector<std::pair<std::string, std::string>>& headers,
                          std::chrono::milliseconds timeout) = 0;

        // Sends one complete text message. Throws EngineError (ERR_SEND_FAILED).
        virtual void sendText(const std::string& message) = 0;

        // Waits up to `wait` for the next frame; std::nullopt on timeout.
        // Throws EngineError (ERR_CONNECTION_LOST) when the connection breaks.
        virtual std::optional<Frame> receive(std::chrono::milliseconds wait) = 0;

        // Sends a close frame if still open. Idempotent, never throws.
        virtual void close() = 0;

        virtual bool isOpen() const = 0;
    };

} // namespace Realtime

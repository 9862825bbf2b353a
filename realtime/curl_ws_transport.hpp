#pragma once
#include <curl/curl.h>
#include <mutex>
#include <string>
#include <vector>

#include "realtime/transport.hpp"

namespace Realtime {

    // WebSocket client on libcurl's connect-only websocket API.
    // The easy handle is guarded by one mutex; receive() waits on the
    // socket without holding it so sends are never blocked by a read.
    class CurlWsTransport : public IMessageTransport {
    public:
        CurlWsTransport();
        ~CurlWsTransport() override;

        CurlWsTransport(const CurlWsTransport&) = delete;
        CurlWsTransport& operator=(const CurlWsTransport&) = delete;

        void open(const std::string& url,
                  const std::vector<std::pair<std::string, std::string>>& headers,
                  std::chrono::milliseconds timeout) override;
        void sendText(const std::string& message) override;
        std::optional<Frame> receive(std::chrono::milliseconds wait) override;
        void close() override;
        bool isOpen() const override;

        // Maps curl_ws_frame flags to a frame. Releases before 8.x report a
        // continuation fragment without CURLWS_TEXT/CURLWS_BINARY, so such a
        // fragment takes the kind of the message it continues.
        static Frame::Kind frameKindFor(int flags, Frame::Kind continuing);
        static bool isFinalFragment(int flags) { return (flags & CURLWS_CONT) == 0; }

    private:
        enum class WaitResult { Ready, Timeout, Closed };
        WaitResult waitSocket(short events, std::chrono::milliseconds wait);
        void release();

        mutable std::mutex mtx_;
        CURL* curl_ = nullptr;
        curl_slist* headers_ = nullptr;
        curl_socket_t socket_ = CURL_SOCKET_BAD;
        bool open_ = false;

        // Fragment of a frame whose payload has not fully arrived yet
        std::string partial_;
        int partialFlags_ = 0;
        Frame::Kind messageKind_ = Frame::Kind::Text;
        std::vector<char> buffer_;
    };

} // namespace Realtime

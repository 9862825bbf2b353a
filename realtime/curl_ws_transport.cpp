#include "realtime/curl_ws_transport.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <poll.h>

namespace Realtime {

constexpr std::size_t kReceiveBufferSize = 64 * 1024;
constexpr int kSendStallMs = 1000;

static std::once_flag g_curlInit;

CurlWsTransport::CurlWsTransport() : buffer_(kReceiveBufferSize) {
    std::call_once(g_curlInit, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

CurlWsTransport::~CurlWsTransport() {
    close();
}

// ---------------- Connect ----------------
void CurlWsTransport::open(const std::string& url,
                           const std::vector<std::pair<std::string, std::string>>& headers,
                           std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (curl_) {
        release();
    }

    curl_ = curl_easy_init();
    if (!curl_) {
        ErrorManager::raise("ERR_CONNECT_FAILED", "curl_easy_init failed");
    }

    for (const auto& [name, value] : headers) {
        headers_ = curl_slist_append(headers_, (name + ": " + value).c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    LOG_DEBUG("Transport", "Connecting to " + url.substr(0, url.find('?')));

    CURLcode rc = curl_easy_perform(curl_);
    if (rc != CURLE_OK) {
        long httpCode = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &httpCode);
        release();

        if (rc == CURLE_OPERATION_TIMEDOUT) {
            ErrorManager::raise("ERR_CONNECT_TIMEOUT", curl_easy_strerror(rc));
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR || (httpCode > 0 && httpCode != 101)) {
            ErrorManager::raise("ERR_CONNECT_UPGRADE_REJECTED", "HTTP " + std::to_string(httpCode));
        }
        ErrorManager::raise("ERR_CONNECT_FAILED", curl_easy_strerror(rc));
    }

    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK || sock == CURL_SOCKET_BAD) {
        release();
        ErrorManager::raise("ERR_CONNECT_FAILED", "no active socket after upgrade");
    }

    socket_ = sock;
    open_ = true;
    LOG_INFO("Transport", "WebSocket connected");
}

// ---------------- Send ----------------
void CurlWsTransport::sendText(const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!curl_ || !open_) {
        ErrorManager::raise("ERR_SEND_FAILED", "connection is not open");
    }

    std::size_t offset = 0;
    while (offset < message.size()) {
        std::size_t sent = 0;
        CURLcode rc = curl_ws_send(curl_, message.data() + offset, message.size() - offset,
                                   &sent, 0, CURLWS_TEXT);
        if (rc == CURLE_OK) {
            offset += sent;
            continue;
        }

        if (rc != CURLE_AGAIN) {
            ErrorManager::raise("ERR_SEND_FAILED", curl_easy_strerror(rc));
        }

        offset += sent;
        pollfd pfd{socket_, POLLOUT, 0};
        if (::poll(&pfd, 1, kSendStallMs) <= 0) {
            ErrorManager::raise("ERR_SEND_FAILED", "socket not writable");
        }
    }
}

// ---------------- Receive ----------------
CurlWsTransport::WaitResult CurlWsTransport::waitSocket(short events, std::chrono::milliseconds wait) {
    curl_socket_t sock;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!open_) return WaitResult::Closed;
        sock = socket_;
    }

    pollfd pfd{sock, events, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (rc < 0) {
        return (errno == EINTR) ? WaitResult::Timeout : WaitResult::Closed;
    }
    return rc == 0 ? WaitResult::Timeout : WaitResult::Ready;
}

Frame::Kind CurlWsTransport::frameKindFor(int flags, Frame::Kind continuing) {
    if (flags & CURLWS_CLOSE) return Frame::Kind::Close;
    if (flags & CURLWS_BINARY) return Frame::Kind::Binary;
    if (flags & CURLWS_TEXT) return Frame::Kind::Text;
    return continuing;
}

std::optional<Frame> CurlWsTransport::receive(std::chrono::milliseconds wait) {
    const auto deadline = std::chrono::steady_clock::now() + wait;

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!curl_ || !open_) {
                return Frame{Frame::Kind::Close, "", true};
            }

            std::size_t got = 0;
            curl_ws_frame* meta = nullptr;
            CURLcode rc = curl_ws_recv(curl_, buffer_.data(), buffer_.size(), &got, &meta);

            if (rc == CURLE_OK && meta) {
                if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
                    continue;
                }

                partial_.append(buffer_.data(), got);
                partialFlags_ = meta->flags;
                if (meta->bytesleft > 0) {
                    continue;
                }

                Frame frame;
                frame.data.swap(partial_);
                frame.final = isFinalFragment(partialFlags_);
                frame.kind = frameKindFor(partialFlags_, messageKind_);
                if (frame.kind == Frame::Kind::Close) {
                    open_ = false;
                }
                messageKind_ = frame.final ? Frame::Kind::Text : frame.kind;
                partialFlags_ = 0;
                return frame;
            }

            if (rc != CURLE_AGAIN) {
                open_ = false;
                ErrorManager::raise("ERR_CONNECTION_LOST", curl_easy_strerror(rc));
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        WaitResult result = waitSocket(POLLIN, std::max(left, std::chrono::milliseconds(1)));
        if (result == WaitResult::Timeout) {
            return std::nullopt;
        }
        if (result == WaitResult::Closed) {
            return Frame{Frame::Kind::Close, "", true};
        }
    }
}

// ---------------- Close ----------------
void CurlWsTransport::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (curl_ && open_) {
        std::size_t sent = 0;
        CURLcode rc = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
        if (rc != CURLE_OK) {
            LOG_DEBUG("Transport", std::string("Close frame not sent: ") + curl_easy_strerror(rc));
        }
        LOG_INFO("Transport", "WebSocket closed");
    }
    release();
}

bool CurlWsTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_;
}

void CurlWsTransport::release() {
    open_ = false;
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    if (headers_) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
    socket_ = CURL_SOCKET_BAD;
    partial_.clear();
    partialFlags_ = 0;
    messageKind_ = Frame::Kind::Text;
}

} // namespace Realtime

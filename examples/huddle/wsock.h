/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#pragma once

#include <openssl/ssl.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "rtc_base/thread.h"

// Incremental RFC 6455 frame decoder. Text fragments are reassembled;
// ping and close frames are surfaced so the client can answer them.
class WebSocketFrameReader {
public:
    struct Frame {
        // kError ends the stream; its payload names the violation.
        enum class Type { kText, kPing, kPong, kClose, kError };
        Type type;
        std::string payload;
    };

    void append(const char* data, size_t size);
    std::vector<Frame> drain();
    size_t buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
    std::string fragments_;
    bool in_fragment_ = false;
};

// Largest frame payload accepted from the server.
constexpr uint64_t kMaxWebSocketPayload = 16 * 1024 * 1024;

// Client side frame, always masked.
std::string EncodeWebSocketFrame(uint8_t opcode, const std::string& payload);

class WebSocketClient {
public:
    struct Config {
        std::string host;
        std::string port;
        bool use_ssl = false;
        std::string path = "/";  // includes the query string
        std::map<std::string, std::string> headers;
        int timeout_ms = 10000;
        int ping_interval_ms = 5000;
    };

    // All socket work happens on |network_thread|.
    explicit WebSocketClient(rtc::Thread* network_thread);
    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    // TCP connect, TLS and HTTP upgrade. Blocking, call on the network thread.
    bool connect(const Config& config);
    // Sends a close frame when connected and stops reading. No closed
    // callback is raised for a client initiated disconnect.
    void disconnect();
    bool is_connected() const { return connected_.load(); }

    bool send_message(const std::string& message);
    void set_message_callback(std::function<void(const std::string&)> callback);
    void set_closed_callback(std::function<void(const std::string& reason)> callback);
    void start_listening();

    static std::string generate_websocket_key();
    static std::string base64_encode(const std::string& in);

private:
    bool create_socket_connection();
    bool setup_ssl_context();
    bool perform_ssl_handshake();
    bool send_http_handshake();
    bool write_raw(const std::string& bytes);

    void async_read();
    void schedule_ping();
    void handle_closed(const std::string& reason);
    void cleanup_connection();
    void log_ssl_error(const std::string& operation);

    rtc::Thread* const network_thread_;
    Config config_;
    int sockfd_ = -1;
    SSL_CTX* ssl_ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    // Bumped on every connect so stale posted reads become no-ops.
    std::atomic<int> generation_{0};

    WebSocketFrameReader reader_;
    std::function<void(const std::string&)> message_callback_;
    std::function<void(const std::string&)> closed_callback_;
    std::mutex ssl_mutex_;
};

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

#include "wsock.h"

#include <fcntl.h>
#include <netdb.h>
#include <openssl/err.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>

#include "api/units/time_delta.h"
#include "rtc_base/checks.h"

#include "option.h"

namespace {

const char base64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

}  // namespace

void WebSocketFrameReader::append(const char* data, size_t size) {
  buffer_.append(data, size);
}

std::vector<WebSocketFrameReader::Frame> WebSocketFrameReader::drain() {
  std::vector<Frame> frames;
  size_t pos = 0;
  while (pos + 2 <= buffer_.size()) {
    uint8_t first_byte = buffer_[pos];
    bool fin = (first_byte & 0x80) != 0;
    uint8_t opcode = first_byte & 0x0F;
    uint8_t second_byte = buffer_[pos + 1];
    bool masked = (second_byte & 0x80) != 0;
    uint64_t length = second_byte & 0x7F;
    size_t header_size = 2;

    if (length == 126) {
      if (pos + 4 > buffer_.size()) break;
      length = (static_cast<uint64_t>(buffer_[pos + 2] & 0xFF) << 8) |
               static_cast<uint64_t>(buffer_[pos + 3] & 0xFF);
      header_size = 4;
    } else if (length == 127) {
      if (pos + 10 > buffer_.size()) break;
      length = 0;
      for (int i = 0; i < 8; ++i) {
        length = (length << 8) | static_cast<uint64_t>(buffer_[pos + 2 + i] & 0xFF);
      }
      header_size = 10;
    }

    if (length > kMaxWebSocketPayload) {
      APP_LOG(AS_ERROR) << "Rejecting websocket frame of " << length << " bytes";
      buffer_.clear();
      fragments_.clear();
      in_fragment_ = false;
      frames.push_back({Frame::Type::kError, "frame too large"});
      return frames;
    }
    size_t mask_offset = masked ? 4 : 0;
    uint64_t total_frame_size = header_size + mask_offset + length;
    if (pos + total_frame_size > buffer_.size()) {
      break;  // wait for the rest of the frame
    }

    std::string payload(buffer_.begin() + pos + header_size + mask_offset,
                        buffer_.begin() + pos + total_frame_size);
    if (masked) {
      for (size_t i = 0; i < payload.size(); i++) {
        payload[i] ^= buffer_[pos + header_size + (i % 4)];
      }
    }
    pos += total_frame_size;

    switch (opcode) {
      case kOpText:
        if (fin) {
          frames.push_back({Frame::Type::kText, std::move(payload)});
        } else {
          fragments_ = std::move(payload);
          in_fragment_ = true;
        }
        break;
      case kOpContinuation:
        if (!in_fragment_) {
          APP_LOG(AS_WARNING) << "Continuation frame without start, ignoring";
          break;
        }
        fragments_ += payload;
        if (fin) {
          frames.push_back({Frame::Type::kText, std::move(fragments_)});
          fragments_.clear();
          in_fragment_ = false;
        }
        break;
      case kOpPing:
        frames.push_back({Frame::Type::kPing, std::move(payload)});
        break;
      case kOpPong:
        frames.push_back({Frame::Type::kPong, std::move(payload)});
        break;
      case kOpClose:
        frames.push_back({Frame::Type::kClose, std::move(payload)});
        break;
      default:
        APP_LOG(AS_WARNING) << "Skipping unhandled opcode: 0x" << std::hex
                            << static_cast<int>(opcode);
        break;
    }
  }
  if (pos > 0) {
    buffer_.erase(0, pos);
  }
  return frames;
}

std::string EncodeWebSocketFrame(uint8_t opcode, const std::string& payload) {
  std::string frame;
  frame.push_back(static_cast<char>(0x80 | opcode));  // FIN + opcode

  size_t length = payload.size();
  if (length <= 125) {
    frame.push_back(static_cast<char>(0x80 | length));  // Masked + length
  } else if (length <= 65535) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((static_cast<uint64_t>(length) >> shift) & 0xFF));
    }
  }

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 255);
  char mask[4];
  for (int i = 0; i < 4; ++i) {
    mask[i] = static_cast<char>(dis(gen));
    frame.push_back(mask[i]);
  }
  for (size_t i = 0; i < length; ++i) {
    frame.push_back(payload[i] ^ mask[i % 4]);
  }
  return frame;
}

WebSocketClient::WebSocketClient(rtc::Thread* network_thread)
    : network_thread_(network_thread) {
  OPENSSL_init_ssl(0, nullptr);
}

WebSocketClient::~WebSocketClient() {
  message_callback_ = nullptr;
  closed_callback_ = nullptr;
  running_ = false;
  connected_ = false;
  generation_++;
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  cleanup_connection();
}

bool WebSocketClient::connect(const Config& config) {
  RTC_DCHECK(network_thread_->IsCurrent());
  {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    cleanup_connection();
  }
  config_ = config;
  reader_ = WebSocketFrameReader();
  generation_++;

  APP_LOG(AS_INFO) << "Connecting to WebSocket server at " << config.host << ":" << config.port;

  if (!create_socket_connection()) {
    return false;
  }
  if (config_.use_ssl && (!setup_ssl_context() || !perform_ssl_handshake())) {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    cleanup_connection();
    return false;
  }
  if (!send_http_handshake()) {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    cleanup_connection();
    return false;
  }

  // Reads are polled from here on.
  int flags = fcntl(sockfd_, F_GETFL, 0);
  fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK);
  connected_ = true;
  return true;
}

void WebSocketClient::disconnect() {
  bool was_connected = connected_.exchange(false);
  running_ = false;
  generation_++;
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  if (was_connected && sockfd_ != -1) {
    std::string frame = EncodeWebSocketFrame(kOpClose, std::string("\x03\xe8", 2));
    if (config_.use_ssl && ssl_) {
      SSL_write(ssl_, frame.data(), static_cast<int>(frame.size()));
    } else {
      send(sockfd_, frame.data(), frame.size(), MSG_NOSIGNAL);
    }
  }
  cleanup_connection();
}

bool WebSocketClient::send_message(const std::string& message) {
  if (!connected_.load()) {
    APP_LOG(AS_WARNING) << "Cannot send, WebSocket is not connected";
    return false;
  }
  APP_LOG(AS_VERBOSE) << "Sending WebSocket message: " << message.substr(0, 200);
  std::lock_guard<std::mutex> lock(ssl_mutex_);
  return write_raw(EncodeWebSocketFrame(kOpText, message));
}

void WebSocketClient::set_message_callback(std::function<void(const std::string&)> callback) {
  message_callback_ = std::move(callback);
}

void WebSocketClient::set_closed_callback(std::function<void(const std::string&)> callback) {
  closed_callback_ = std::move(callback);
}

void WebSocketClient::start_listening() {
  if (running_.exchange(true)) {
    APP_LOG(AS_WARNING) << "WebSocketClient::start_listening: Already running";
    return;
  }
  int generation = generation_.load();
  network_thread_->PostTask([this, generation]() {
    if (generation == generation_.load()) async_read();
  });
  schedule_ping();
}

std::string WebSocketClient::generate_websocket_key() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 255);
  std::string key(16, '\0');
  for (int i = 0; i < 16; ++i) {
    key[i] = static_cast<char>(dis(gen));
  }
  return base64_encode(key);
}

std::string WebSocketClient::base64_encode(const std::string& in) {
  std::string out;
  int val = 0, valb = -6;
  for (unsigned char c : in) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(base64_chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (out.size() % 4) {
    out.push_back('=');
  }
  return out;
}

bool WebSocketClient::create_socket_connection() {
  struct addrinfo hints, *res;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  int status = getaddrinfo(config_.host.c_str(), config_.port.c_str(), &hints, &res);
  if (status != 0) {
    APP_LOG(AS_ERROR) << "getaddrinfo failed: " << gai_strerror(status);
    return false;
  }

  for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      sockfd_ = fd;
      break;
    }
    APP_LOG(AS_VERBOSE) << "Socket connect failed: " << strerror(errno);
    ::close(fd);
  }
  freeaddrinfo(res);

  if (sockfd_ < 0) {
    APP_LOG(AS_ERROR) << "Could not connect to " << config_.host << ":" << config_.port;
    return false;
  }
  APP_LOG(AS_INFO) << "TCP connection established to " << config_.host << ":" << config_.port;
  return true;
}

bool WebSocketClient::setup_ssl_context() {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (!ssl_ctx_) {
    log_ssl_error("Failed to create SSL context");
    return false;
  }
  SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);
  SSL_CTX_set_default_verify_paths(ssl_ctx_);
  // Self-signed development servers are common, do not reject them.
  SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
  return true;
}

bool WebSocketClient::perform_ssl_handshake() {
  ssl_ = SSL_new(ssl_ctx_);
  if (!ssl_) {
    log_ssl_error("Failed to create SSL object");
    return false;
  }
  if (SSL_set_fd(ssl_, sockfd_) != 1) {
    log_ssl_error("Failed to set SSL file descriptor");
    return false;
  }
  if (SSL_set_tlsext_host_name(ssl_, config_.host.c_str()) != 1) {
    log_ssl_error("Failed to set SNI hostname");
  }
  int connect_result = SSL_connect(ssl_);
  if (connect_result <= 0) {
    APP_LOG(AS_ERROR) << "SSL connection failed with error "
                      << SSL_get_error(ssl_, connect_result);
    log_ssl_error("SSL handshake failed");
    return false;
  }
  APP_LOG(AS_INFO) << "SSL connection established with " << SSL_get_cipher(ssl_)
                   << ", protocol: " << SSL_get_version(ssl_);
  return true;
}

bool WebSocketClient::send_http_handshake() {
  std::ostringstream request;
  request << "GET " << (config_.path.empty() ? "/" : config_.path) << " HTTP/1.1\r\n";
  request << "Host: " << config_.host << ":" << config_.port << "\r\n";
  request << "Connection: Upgrade\r\n";
  request << "Upgrade: websocket\r\n";
  request << "Pragma: no-cache\r\n";
  request << "Cache-Control: no-cache\r\n";
  request << "User-Agent: huddle/1.0\r\n";
  request << "Sec-WebSocket-Version: 13\r\n";
  request << "Sec-WebSocket-Key: " << generate_websocket_key() << "\r\n";
  for (const auto& [key, value] : config_.headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "\r\n";

  APP_LOG(AS_VERBOSE) << "Sending HTTP upgrade for " << config_.path;
  {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    if (!write_raw(request.str())) {
      return false;
    }
  }

  // Blocking socket at this point; a receive timeout bounds the wait.
  struct timeval tv;
  tv.tv_sec = config_.timeout_ms / 1000;
  tv.tv_usec = (config_.timeout_ms % 1000) * 1000;
  setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  std::string response;
  char buffer[4096];
  size_t header_end = std::string::npos;
  while (header_end == std::string::npos && response.size() < 16384) {
    int bytes_read = config_.use_ssl
        ? SSL_read(ssl_, buffer, sizeof(buffer))
        : static_cast<int>(recv(sockfd_, buffer, sizeof(buffer), 0));
    if (bytes_read <= 0) {
      APP_LOG(AS_ERROR) << "Upgrade response not received: "
                        << (config_.use_ssl ? "ssl read failed" : strerror(errno));
      return false;
    }
    response.append(buffer, bytes_read);
    header_end = response.find("\r\n\r\n");
  }
  if (header_end == std::string::npos) {
    APP_LOG(AS_ERROR) << "Upgrade response too large";
    return false;
  }

  if (response.compare(0, 12, "HTTP/1.1 101") != 0) {
    APP_LOG(AS_ERROR) << "WebSocket handshake failed: " << response.substr(0, response.find("\r\n"));
    return false;
  }
  // Frames that arrived together with the upgrade response.
  if (response.size() > header_end + 4) {
    reader_.append(response.data() + header_end + 4, response.size() - header_end - 4);
  }
  APP_LOG(AS_INFO) << "WebSocket handshake successful";
  return true;
}

bool WebSocketClient::write_raw(const std::string& bytes) {
  if (sockfd_ == -1) {
    APP_LOG(AS_ERROR) << "Cannot send frame: socket is closed";
    return false;
  }
  size_t written = 0;
  while (written < bytes.size()) {
    int n;
    if (config_.use_ssl) {
      if (!ssl_) return false;
      n = SSL_write(ssl_, bytes.data() + written, static_cast<int>(bytes.size() - written));
      if (n <= 0) {
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
          struct pollfd pfd = {sockfd_, POLLOUT, 0};
          poll(&pfd, 1, 100);
          continue;
        }
        log_ssl_error("SSL_write failed");
        return false;
      }
    } else {
      n = static_cast<int>(send(sockfd_, bytes.data() + written, bytes.size() - written, MSG_NOSIGNAL));
      if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          struct pollfd pfd = {sockfd_, POLLOUT, 0};
          poll(&pfd, 1, 100);
          continue;
        }
        APP_LOG(AS_ERROR) << "send failed: " << strerror(errno);
        return false;
      }
    }
    written += n;
  }
  return true;
}

void WebSocketClient::async_read() {
  if (!running_.load() || !connected_.load()) {
    return;
  }

  bool got_data = false;
  std::string closed_reason;
  {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    char buffer[8192];
    for (;;) {
      int bytes_read;
      if (config_.use_ssl) {
        bytes_read = SSL_read(ssl_, buffer, sizeof(buffer));
        if (bytes_read <= 0) {
          int err = SSL_get_error(ssl_, bytes_read);
          if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) break;
          closed_reason = err == SSL_ERROR_ZERO_RETURN ? "transport close" : "transport error";
          break;
        }
      } else {
        bytes_read = static_cast<int>(recv(sockfd_, buffer, sizeof(buffer), 0));
        if (bytes_read < 0) {
          if (errno == EAGAIN || errno == EWOULDBLOCK) break;
          closed_reason = "transport error";
          break;
        }
        if (bytes_read == 0) {
          closed_reason = "transport close";
          break;
        }
      }
      reader_.append(buffer, bytes_read);
      got_data = true;
    }
  }

  for (auto& frame : reader_.drain()) {
    switch (frame.type) {
      case WebSocketFrameReader::Frame::Type::kText:
        if (message_callback_) message_callback_(frame.payload);
        break;
      case WebSocketFrameReader::Frame::Type::kPing: {
        std::lock_guard<std::mutex> lock(ssl_mutex_);
        write_raw(EncodeWebSocketFrame(kOpPong, frame.payload));
        break;
      }
      case WebSocketFrameReader::Frame::Type::kPong:
        break;
      case WebSocketFrameReader::Frame::Type::kClose:
        closed_reason = "server close";
        break;
      case WebSocketFrameReader::Frame::Type::kError:
        closed_reason = frame.payload;
        break;
    }
    if (!closed_reason.empty()) break;
  }

  if (!closed_reason.empty()) {
    handle_closed(closed_reason);
    return;
  }

  int generation = generation_.load();
  network_thread_->PostDelayedTask(
      [this, generation]() {
        if (generation == generation_.load()) async_read();
      },
      webrtc::TimeDelta::Millis(got_data ? 5 : 20));
}

void WebSocketClient::schedule_ping() {
  int generation = generation_.load();
  network_thread_->PostDelayedTask(
      [this, generation]() {
        if (generation != generation_.load() || !connected_.load()) return;
        std::lock_guard<std::mutex> lock(ssl_mutex_);
        write_raw(EncodeWebSocketFrame(kOpPing, std::string()));
        network_thread_->PostTask([this]() { schedule_ping(); });
      },
      webrtc::TimeDelta::Millis(config_.ping_interval_ms));
}

void WebSocketClient::handle_closed(const std::string& reason) {
  APP_LOG(AS_WARNING) << "WebSocket closed: " << reason;
  running_ = false;
  connected_ = false;
  generation_++;
  {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    cleanup_connection();
  }
  if (closed_callback_) closed_callback_(reason);
}

void WebSocketClient::cleanup_connection() {
  if (ssl_) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
  if (sockfd_ != -1) {
    ::close(sockfd_);
    sockfd_ = -1;
  }
}

void WebSocketClient::log_ssl_error(const std::string& operation) {
  APP_LOG(AS_ERROR) << operation << ": " << ERR_error_string(ERR_get_error(), nullptr);
}

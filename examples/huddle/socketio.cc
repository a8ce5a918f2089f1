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

#include "socketio.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include "option.h"

namespace {

std::string WriteCompact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

bool ParseJson(const std::string& text, Json::Value* out, std::string* errs) {
  Json::CharReaderBuilder reader_builder;
  std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), out, errs);
}

}  // namespace

std::string EncodeSocketIoPacket(const SocketIoPacket& packet) {
  std::string out = std::to_string(static_cast<int>(packet.type));
  if (!packet.nsp.empty() && packet.nsp != "/") {
    out += packet.nsp + ",";
  }
  if (packet.id) {
    out += std::to_string(*packet.id);
  }
  if (!packet.data.isNull()) {
    out += WriteCompact(packet.data);
  }
  return out;
}

webrtc::RTCErrorOr<SocketIoPacket> DecodeSocketIoPacket(const std::string& text) {
  if (text.empty() || !isdigit(static_cast<unsigned char>(text[0]))) {
    return webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                            "Missing Socket.IO packet type");
  }
  int type = text[0] - '0';
  if (type > static_cast<int>(SocketIoPacketType::kConnectError)) {
    return webrtc::RTCError(webrtc::RTCErrorType::UNSUPPORTED_OPERATION,
                            "Binary Socket.IO packets are not supported");
  }
  SocketIoPacket packet;
  packet.type = static_cast<SocketIoPacketType>(type);

  size_t pos = 1;
  if (pos < text.size() && text[pos] == '/') {
    size_t comma = text.find(',', pos);
    if (comma == std::string::npos) {
      packet.nsp = text.substr(pos);
      return packet;
    }
    packet.nsp = text.substr(pos, comma - pos);
    pos = comma + 1;
  }

  size_t digits = pos;
  while (digits < text.size() && isdigit(static_cast<unsigned char>(text[digits]))) {
    digits++;
  }
  if (digits > pos) {
    packet.id = static_cast<int>(strtol(text.substr(pos, digits - pos).c_str(), nullptr, 10));
    pos = digits;
  }

  if (pos < text.size()) {
    std::string errs;
    if (!ParseJson(text.substr(pos), &packet.data, &errs)) {
      return webrtc::RTCError(webrtc::RTCErrorType::SYNTAX_ERROR,
                              "Malformed Socket.IO payload: " + errs);
    }
  }
  if (packet.type == SocketIoPacketType::kEvent &&
      (!packet.data.isArray() || packet.data.empty() || !packet.data[0].isString())) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                            "Socket.IO event without a name");
  }
  return packet;
}

webrtc::RTCErrorOr<SignalingUrl> ParseSignalingUrl(const std::string& url) {
  SignalingUrl result;
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                            "Signaling url needs a scheme: " + url);
  }
  std::string scheme = url.substr(0, scheme_end);
  if (scheme == "wss" || scheme == "https") {
    result.secure = true;
  } else if (scheme != "ws" && scheme != "http") {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                            "Unsupported signaling scheme: " + scheme);
  }

  std::string rest = url.substr(scheme_end + 3);
  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos && rest.size() > slash + 1) {
    result.path = rest.substr(slash);
    if (result.path.back() != '/') result.path += '/';
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    result.host = authority.substr(0, colon);
    result.port = authority.substr(colon + 1);
  } else {
    result.host = authority;
    result.port = result.secure ? "443" : "80";
  }
  if (result.host.empty()) {
    return webrtc::RTCError(webrtc::RTCErrorType::INVALID_PARAMETER,
                            "Signaling url has no host: " + url);
  }
  return result;
}

std::string UrlEncode(const std::string& value) {
  std::string out;
  for (unsigned char c : value) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char hex[4];
      snprintf(hex, sizeof(hex), "%%%02X", c);
      out += hex;
    }
  }
  return out;
}

SocketIoSignalingSocket::SocketIoSignalingSocket(const SignalingUrl& url,
                                                 rtc::Thread* network_thread,
                                                 webrtc::TaskQueueBase* session_queue)
    : url_(url),
      network_thread_(network_thread),
      session_queue_(session_queue),
      ws_(std::make_unique<WebSocketClient>(network_thread)),
      safety_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

SocketIoSignalingSocket::~SocketIoSignalingSocket() {
  safety_->SetNotAlive();
  network_thread_->BlockingCall([this]() {
    ws_->disconnect();
    ws_.reset();
  });
}

void SocketIoSignalingSocket::SetObserver(SignalingSocketObserver* observer) {
  observer_ = observer;
}

void SocketIoSignalingSocket::PostToSession(std::function<void()> task) {
  session_queue_->PostTask(webrtc::SafeTask(safety_, std::move(task)));
}

void SocketIoSignalingSocket::Open(const std::string& token) {
  WebSocketClient::Config config;
  config.host = url_.host;
  config.port = url_.port;
  config.use_ssl = url_.secure;
  config.path = url_.path + "?EIO=4&transport=websocket";
  if (!token.empty()) {
    config.path += "&user-token=" + UrlEncode(token);
  }

  connected_ = false;
  transport_open_ = false;
  network_thread_->PostTask([this, config]() {
    ws_->disconnect();
    ws_->set_message_callback([this](const std::string& text) {
      PostToSession([this, text]() { HandleEngineIoPacket(text); });
    });
    ws_->set_closed_callback([this](const std::string& reason) {
      PostToSession([this, reason]() { HandleTransportClosed(reason); });
    });
    if (!ws_->connect(config)) {
      PostToSession([this]() {
        if (observer_) observer_->OnConnectError("websocket error");
      });
      return;
    }
    ws_->start_listening();
  });
}

void SocketIoSignalingSocket::Close() {
  bool was_connected = connected_;
  if (connected_) {
    SocketIoPacket disconnect;
    disconnect.type = SocketIoPacketType::kDisconnect;
    Send("4" + EncodeSocketIoPacket(disconnect));
  }
  connected_ = false;
  transport_open_ = false;
  acks_.clear();
  network_thread_->PostTask([this]() { ws_->disconnect(); });
  if (was_connected && observer_) {
    observer_->OnDisconnect(kClientDisconnectReason);
  }
}

bool SocketIoSignalingSocket::Emit(const std::string& event,
                                   const Json::Value& args,
                                   AckCallback ack) {
  if (!connected_) {
    APP_LOG(AS_WARNING) << "Dropping '" << event << "', signaling not connected";
    return false;
  }
  SocketIoPacket packet;
  packet.type = SocketIoPacketType::kEvent;
  packet.data = Json::Value(Json::arrayValue);
  packet.data.append(event);
  if (args.isArray()) {
    for (const auto& arg : args) packet.data.append(arg);
  } else if (!args.isNull()) {
    packet.data.append(args);
  }
  if (ack) {
    packet.id = next_ack_id_++;
    acks_[*packet.id] = std::move(ack);
  }
  return Send("4" + EncodeSocketIoPacket(packet));
}

bool SocketIoSignalingSocket::Send(const std::string& text) {
  return ws_->send_message(text);
}

void SocketIoSignalingSocket::HandleEngineIoPacket(const std::string& text) {
  if (text.empty()) return;
  switch (text[0]) {
    case '0': {
      transport_open_ = true;
      APP_LOG(AS_VERBOSE) << "Engine.IO open: " << text.substr(1);
      SocketIoPacket connect;
      connect.type = SocketIoPacketType::kConnect;
      Send("4" + EncodeSocketIoPacket(connect));
      break;
    }
    case '1':
      HandleTransportClosed("transport close");
      break;
    case '2':
      Send("3" + text.substr(1));
      break;
    case '4': {
      webrtc::RTCErrorOr<SocketIoPacket> packet = DecodeSocketIoPacket(text.substr(1));
      if (!packet.ok()) {
        APP_LOG(AS_WARNING) << "Ignoring Socket.IO packet: " << packet.error().message();
        return;
      }
      HandleSocketIoPacket(packet.value());
      break;
    }
    default:
      APP_LOG(AS_VERBOSE) << "Ignoring Engine.IO packet type " << text[0];
      break;
  }
}

void SocketIoSignalingSocket::HandleSocketIoPacket(const SocketIoPacket& packet) {
  switch (packet.type) {
    case SocketIoPacketType::kConnect:
      connected_ = true;
      sid_ = JsonString(packet.data, "sid");
      if (observer_) observer_->OnConnect();
      break;
    case SocketIoPacketType::kDisconnect:
      connected_ = false;
      if (observer_) observer_->OnDisconnect("io server disconnect");
      break;
    case SocketIoPacketType::kConnectError: {
      std::string message = JsonString(packet.data, "message", "connect error");
      if (observer_) observer_->OnConnectError(message);
      break;
    }
    case SocketIoPacketType::kEvent: {
      std::string name = packet.data[0].asString();
      Json::Value args(Json::arrayValue);
      for (Json::ArrayIndex i = 1; i < packet.data.size(); ++i) {
        args.append(packet.data[i]);
      }
      if (packet.id) {
        SocketIoPacket ack;
        ack.type = SocketIoPacketType::kAck;
        ack.id = packet.id;
        ack.data = Json::Value(Json::arrayValue);
        Send("4" + EncodeSocketIoPacket(ack));
      }
      if (observer_) observer_->OnEvent(name, args);
      break;
    }
    case SocketIoPacketType::kAck: {
      if (!packet.id) return;
      auto it = acks_.find(*packet.id);
      if (it == acks_.end()) {
        APP_LOG(AS_VERBOSE) << "Unknown ack id " << *packet.id;
        return;
      }
      AckCallback callback = std::move(it->second);
      acks_.erase(it);
      callback(packet.data.isArray() ? packet.data : Json::Value(Json::arrayValue));
      break;
    }
  }
}

void SocketIoSignalingSocket::HandleTransportClosed(const std::string& reason) {
  bool was_connected = connected_;
  connected_ = false;
  transport_open_ = false;
  acks_.clear();
  if (!observer_) return;
  if (was_connected) {
    observer_->OnDisconnect(reason);
  } else {
    observer_->OnConnectError(reason);
  }
}

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

#include <cerrno>      // For errno used with strtol
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <random>
#include <sstream>
#include <unordered_set>

#include "rtc_base/crypto_random.h"
#include "rtc_base/logging.h"

#include "option.h"

namespace {

// Utility to remove surrounding single or double quotes from a string.
std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2) {
        if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// strtol based conversion, no exceptions.
bool parseInt(const std::string& value, int& out) {
    const char* start_ptr = value.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    long parsed = strtol(start_ptr, &end_ptr, 10);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        RTC_LOG(LS_WARNING) << "Invalid integer value: " << value;
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool parseDouble(const std::string& value, double& out) {
    const char* start_ptr = value.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    double parsed = strtod(start_ptr, &end_ptr);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        RTC_LOG(LS_WARNING) << "Invalid number value: " << value;
        return false;
    }
    out = parsed;
    return true;
}

void readString(const Json::Value& node, const char* name, std::string& out) {
    if (!node.isMember(name)) return;
    if (!node[name].isString()) {
        RTC_LOG(LS_WARNING) << "Config `" << name << "` is not a string, ignored";
        return;
    }
    out = node[name].asString();
    RTC_LOG(LS_INFO) << "Config " << name << ": " << out;
}

void readInt(const Json::Value& node, const char* name, int& out) {
    if (!node.isMember(name)) return;
    if (!node[name].isInt()) {
        RTC_LOG(LS_WARNING) << "Config `" << name << "` is not an integer, ignored";
        return;
    }
    out = node[name].asInt();
    RTC_LOG(LS_INFO) << "Config " << name << ": " << out;
}

void readBool(const Json::Value& node, const char* name, bool& out) {
    if (!node.isMember(name)) return;
    if (!node[name].isBool()) {
        RTC_LOG(LS_WARNING) << "Config `" << name << "` is not a boolean, ignored";
        return;
    }
    out = node[name].asBool();
    RTC_LOG(LS_INFO) << "Config " << name << ": " << out;
}

} // namespace

void applyConfigJson(const Json::Value& config_json, Options& opts) {
    if (!config_json.isObject()) {
        RTC_LOG(LS_WARNING) << "Config root is not an object, ignored";
        return;
    }

    readString(config_json, "signaling_url", opts.signaling_url);
    readString(config_json, "token", opts.token);
    readString(config_json, "room", opts.room);
    readString(config_json, "user_name", opts.user_name);
    readBool(config_json, "debug", opts.debug);

    if (config_json.isMember("signaling")) {
        const Json::Value& s = config_json["signaling"];
        if (s.isObject()) {
            readBool(s, "enabled", opts.signaling.enabled);
            readInt(s, "attempts", opts.signaling.attempts);
            readInt(s, "delay", opts.signaling.delay_ms);
            readInt(s, "maxDelay", opts.signaling.max_delay_ms);
            if (s.isMember("backoffFactor") && s["backoffFactor"].isNumeric()) {
                opts.signaling.backoff_factor = s["backoffFactor"].asDouble();
                RTC_LOG(LS_INFO) << "Config backoff_factor: " << opts.signaling.backoff_factor;
            }
        } else {
            RTC_LOG(LS_WARNING) << "`signaling` is not an object, ignored";
        }
    }

    if (config_json.isMember("peer")) {
        const Json::Value& p = config_json["peer"];
        if (p.isObject()) {
            readString(p, "host", opts.peer.host);
            readInt(p, "port", opts.peer.port);
            readBool(p, "secure", opts.peer.secure);
            readString(p, "path", opts.peer.path);
            readString(p, "key", opts.peer.key);
            readInt(p, "connectionDelay", opts.peer.connection_delay_ms);
            readInt(p, "maxReconnectAttempts", opts.peer.max_reconnect_attempts);
            readInt(p, "reconnectDelay", opts.peer.reconnect_delay_ms);
        } else {
            RTC_LOG(LS_WARNING) << "`peer` is not an object, ignored";
        }
    }

    if (config_json.isMember("media")) {
        const Json::Value& m = config_json["media"];
        if (m.isObject()) {
            readInt(m, "fps", opts.media.fps);
            readString(m, "resolution", opts.media.resolution);
            readBool(m, "portrait", opts.media.portrait);
            readString(m, "camera", opts.media.camera);
            readString(m, "microphone", opts.media.microphone);
            readBool(m, "camMute", opts.media.cam_mute);
            readBool(m, "micMute", opts.media.mic_mute);
        } else {
            RTC_LOG(LS_WARNING) << "`media` is not an object, ignored";
        }
    }
}

// Function to parse command line string to above options
Options parseOptions(const std::vector<std::string>& args) {
  Options opts;
  opts.help_string =
      "Usage:\n"
      "huddle_app [options]\n\n"
      "Options:\n"
      "  --config <path>                    Load options from JSON config file.\n"
      "                                     Command-line options override config file.\n"
      "  --signaling_url=<url>              Coordination server, e.g. wss://meet.example.com\n"
      "  --token=<token>                    Authentication token (env HUDDLE_TOKEN)\n"
      "  --room=<id>                        Room to join after connecting\n"
      "  --user_name=<name>                 Display name announced to the room\n"
      "  --peer_host=<host>                 Peer server host (env HUDDLE_PEER_HOST)\n"
      "  --peer_port=<port>                 Peer server port (default: 443)\n"
      "  --peer_path=<path>                 Peer server path (default: '/')\n"
      "  --peer_key=<key>                   Peer server API key (default: 'peerjs')\n"
      "  --secure, --no-secure              Use TLS towards the peer server (default: on)\n"
      "  --reconnection, --no-reconnection  Signaling auto reconnection (default: on)\n"
      "  --reconnection_attempts=<n>        Signaling retries, <= 0 unlimited (default: 5)\n"
      "  --reconnection_delay=<ms>          First signaling retry delay (default: 1000)\n"
      "  --reconnection_delay_max=<ms>      Signaling retry delay cap (default: 5000)\n"
      "  --backoff_factor=<x>               Signaling retry growth (default: 1.5)\n"
      "  --fps=<n>                          Processing loop rate (default: 30)\n"
      "  --resolution=<qvga|vga|hd|fhd>     Capture resolution (default: vga)\n"
      "  --portrait                         Portrait capture orientation\n"
      "  --camera=<device_name>             Specify camera device name\n"
      "  --microphone=<device_name>         Specify microphone device name\n"
      "  --cam_mute, --mic_mute             Start with camera or microphone muted\n"
      "  --debug                            Verbose logging\n"
      "  --help                             Show this help message\n\n"
      "Examples:\n"
      "  huddle_app --config settings.json\n"
      "  huddle_app --signaling_url=wss://meet.example.com --peer_host=peer.example.com"
      " --token=abc --room=daily --user_name=alice\n"
      ;

  // Set of known options (with and without =)
  const std::unordered_set<std::string> known_options = {
    "--config", "--signaling_url", "--token", "--room", "--user_name",
    "--peer_host", "--peer_port", "--peer_path", "--peer_key", "--secure", "--no-secure",
    "--reconnection", "--no-reconnection", "--reconnection_attempts",
    "--reconnection_delay", "--reconnection_delay_max", "--backoff_factor",
    "--fps", "--resolution", "--portrait", "--camera", "--microphone",
    "--cam_mute", "--mic_mute", "--debug", "--help"
  };

  // --- First pass: check for --config ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config" && i + 1 < args.size()) {
      opts.config_path = args[i + 1];
      break;
    } else if (arg.find("--config=") == 0) {
      opts.config_path = arg.substr(9);
      break;
    } else if (arg == "--help") {
      opts.help = true;
      return opts;
    }
  }

  // --- Load from config file if specified ---
  if (!opts.config_path.empty()) {
    // C-style file I/O, as elsewhere in the app
    FILE* fp = fopen(opts.config_path.c_str(), "rb");
    if (fp) {
      std::string contents;
      fseek(fp, 0, SEEK_END);
      contents.resize(ftell(fp));
      rewind(fp);
      size_t bytes_read = fread(&contents[0], 1, contents.size(), fp);
      fclose(fp);
      RTC_LOG(LS_VERBOSE) << "Config: read " << bytes_read << " of " << contents.size() << " bytes.";

      Json::Value config_json;
      Json::CharReaderBuilder reader_builder;
      std::string errs;
      std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
      if (reader->parse(contents.data(), contents.data() + bytes_read, &config_json, &errs)) {
        applyConfigJson(config_json, opts);
        RTC_LOG(LS_INFO) << "Loaded options from config file: " << opts.config_path;
      } else {
        RTC_LOG(LS_ERROR) << "Failed to parse config file " << opts.config_path << ": " << errs;
      }
    } else {
      RTC_LOG(LS_WARNING) << "Could not open config file with fopen: " << opts.config_path;
    }
  }

  // --- Second pass: parse command-line arguments (overriding config) ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    // Skip the --config argument itself in the second pass
    if (arg == "--config" && i + 1 < args.size()) {
      i++;
      continue;
    } else if (arg.find("--config=") == 0) {
      continue;
    }

    // Handle parameters with values
    if (arg.find("--signaling_url=") == 0) {
      opts.signaling_url = stripQuotes(arg.substr(16));
    } else if (arg.find("--token=") == 0) {
      opts.token = stripQuotes(arg.substr(8));
    } else if (arg.find("--room=") == 0) {
      opts.room = arg.substr(7);
    } else if (arg.find("--user_name=") == 0) {
      opts.user_name = stripQuotes(arg.substr(12));
    } else if (arg.find("--peer_host=") == 0) {
      opts.peer.host = arg.substr(12);
    } else if (arg.find("--peer_port=") == 0) {
      parseInt(arg.substr(12), opts.peer.port);
    } else if (arg.find("--peer_path=") == 0) {
      opts.peer.path = arg.substr(12);
    } else if (arg.find("--peer_key=") == 0) {
      opts.peer.key = arg.substr(11);
    } else if (arg.find("--reconnection_attempts=") == 0) {
      parseInt(arg.substr(24), opts.signaling.attempts);
    } else if (arg.find("--reconnection_delay=") == 0) {
      parseInt(arg.substr(21), opts.signaling.delay_ms);
    } else if (arg.find("--reconnection_delay_max=") == 0) {
      parseInt(arg.substr(25), opts.signaling.max_delay_ms);
    } else if (arg.find("--backoff_factor=") == 0) {
      parseDouble(arg.substr(17), opts.signaling.backoff_factor);
    } else if (arg.find("--fps=") == 0) {
      parseInt(arg.substr(6), opts.media.fps);
    } else if (arg.find("--resolution=") == 0) {
      opts.media.resolution = arg.substr(13);
    } else if (arg.find("--camera=") == 0) {
      opts.media.camera = stripQuotes(arg.substr(9));
    } else if (arg.find("--microphone=") == 0) {
      opts.media.microphone = stripQuotes(arg.substr(13));
    }
    // Handle flags
    else if (arg == "--secure") {
      opts.peer.secure = true;
    } else if (arg == "--no-secure") {
      RTC_LOG(LS_INFO) << "Args set peer server TLS off";
      opts.peer.secure = false;
    } else if (arg == "--reconnection") {
      opts.signaling.enabled = true;
    } else if (arg == "--no-reconnection") {
      RTC_LOG(LS_INFO) << "Args set signaling reconnection off";
      opts.signaling.enabled = false;
    } else if (arg == "--portrait") {
      opts.media.portrait = true;
    } else if (arg == "--cam_mute") {
      opts.media.cam_mute = true;
    } else if (arg == "--mic_mute") {
      opts.media.mic_mute = true;
    } else if (arg == "--debug") {
      opts.debug = true;
    } else if (arg.rfind("--", 0) == 0) {
      // Only warn if not a known option
      std::string opt_name = arg.substr(0, arg.find('=') != std::string::npos ? arg.find('=') : arg.length());
      if (known_options.find(opt_name) == known_options.end()) {
        RTC_LOG(LS_WARNING) << "Unknown option: " << arg;
      }
    } else {
      RTC_LOG(LS_WARNING) << "Ignoring positional argument: " << arg;
    }
  }

  // Environment variables are lowest priority
  if (opts.signaling_url.empty()) {
    if (const char* env_url = std::getenv("HUDDLE_SIGNALING_URL")) {
      opts.signaling_url = env_url;
    }
  }
  if (opts.token.empty()) {
    if (const char* env_token = std::getenv("HUDDLE_TOKEN")) {
      opts.token = env_token;
    }
  }
  if (opts.peer.host.empty()) {
    if (const char* env_host = std::getenv("HUDDLE_PEER_HOST")) {
      opts.peer.host = env_host;
    }
  }

  // Auto-generate user_name if missing
  if (opts.user_name.empty()) {
    static const char* names[] = {"alice", "bob", "carl", "dave", "eve", "frank", "grace", "heidi", "ivan", "judy"};
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> name_dist(0, sizeof(names)/sizeof(names[0]) - 1);
    std::uniform_int_distribution<> hex_dist(0, 15);
    std::ostringstream suffix;
    suffix << "-";
    for (int i = 0; i < 4; ++i) suffix << std::hex << hex_dist(gen);
    opts.user_name = std::string(names[name_dist(gen)]) + suffix.str();
    RTC_LOG(LS_INFO) << "Auto-generated user_name: " << opts.user_name;
  }

  if (opts.media.fps <= 0) {
    RTC_LOG(LS_WARNING) << "fps must be positive, using 30";
    opts.media.fps = 30;
  }

  return opts;
}

std::string getUsage(const Options& opts) {
  std::stringstream usage;

  usage << "\n--- Current Settings ---\n";
  usage << "Signaling: " << opts.signaling_url << "\n";
  usage << "Token: " << (opts.token.empty() ? "<none>" : "<set>") << "\n";
  usage << "Room: " << opts.room << "\n";
  usage << "User Name: " << opts.user_name << "\n";
  usage << "Reconnection: " << (opts.signaling.enabled ? "enabled" : "disabled")
        << " attempts=" << opts.signaling.attempts
        << " delay=" << opts.signaling.delay_ms << "ms"
        << " max=" << opts.signaling.max_delay_ms << "ms"
        << " factor=" << opts.signaling.backoff_factor << "\n";
  usage << "Peer Server: " << (opts.peer.secure ? "wss://" : "ws://") << opts.peer.host
        << ":" << opts.peer.port << opts.peer.path << " key=" << opts.peer.key << "\n";
  usage << "Media: " << opts.media.resolution << (opts.media.portrait ? " portrait" : " landscape")
        << " @" << opts.media.fps << "fps\n";
  usage << "Camera: " << (opts.media.camera.empty() ? "<default>" : opts.media.camera)
        << (opts.media.cam_mute ? " (muted)" : "") << "\n";
  usage << "Microphone: " << (opts.media.microphone.empty() ? "<default>" : opts.media.microphone)
        << (opts.media.mic_mute ? " (muted)" : "") << "\n";
  usage << "Debug: " << (opts.debug ? "on" : "off") << "\n";
  usage << "Config File: " << (opts.config_path.empty() ? "<none>" : opts.config_path) << "\n";
  usage << "----------------------\n";

  return usage.str();
}

void HuddleSetLoggingLevel(LoggingSeverity level) {
  switch (level) {
    case LoggingSeverity::LS_VERBOSE:
      rtc::LogMessage::LogToDebug(rtc::LS_VERBOSE);
      break;
    case LoggingSeverity::LS_INFO:
      rtc::LogMessage::LogToDebug(rtc::LS_INFO);
      break;
    case LoggingSeverity::LS_WARNING:
      rtc::LogMessage::LogToDebug(rtc::LS_WARNING);
      break;
    case LoggingSeverity::LS_ERROR:
      rtc::LogMessage::LogToDebug(rtc::LS_ERROR);
      break;
    case LoggingSeverity::LS_NONE:
      rtc::LogMessage::LogToDebug(rtc::LS_NONE);
      break;
  }
  rtc::LogMessage::LogTimestamps();
  rtc::LogMessage::LogThreads();
}

std::string HuddleCreateRandomId(size_t length) {
  static const char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::string id;
  if (!rtc::CreateRandomString(length, std::string(kAlphabet), &id)) {
    RTC_LOG(LS_ERROR) << "Random id generation failed";
  }
  return id;
}

int HuddleResolutionWidth(const std::string& name) {
  static const std::map<std::string, int> kResolutions = {
      {"qvga", 320}, {"vga", 640}, {"hd", 1280}, {"fhd", 1920}};
  auto it = kResolutions.find(name);
  if (it == kResolutions.end()) {
    RTC_LOG(LS_WARNING) << "Unknown resolution '" << name << "', using vga";
    return 640;
  }
  return it->second;
}

std::string JsonString(const Json::Value& data, const char* key, const std::string& fallback) {
  if (!data.isObject()) {
    return fallback;
  }
  const Json::Value& value = data[key];
  return value.isString() ? value.asString() : fallback;
}

int JsonInt(const Json::Value& data, const char* key, int fallback) {
  if (!data.isObject()) {
    return fallback;
  }
  const Json::Value& value = data[key];
  return value.isInt() ? value.asInt() : fallback;
}

bool ReadJsonBool(const Json::Value& data, const char* key, bool fallback, bool* out) {
  *out = fallback;
  if (!data.isObject() || !data.isMember(key)) {
    return true;
  }
  const Json::Value& value = data[key];
  if (!value.isBool()) {
    return false;
  }
  *out = value.asBool();
  return true;
}

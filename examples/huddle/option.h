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

#include <string>
#include <vector>

#include <json/json.h>

#include "rtc_base/logging.h"

#ifndef HUDDLE_EXPORT_H
#define HUDDLE_EXPORT_H

#if defined(__GNUC__)
    #define HUDDLE_EXPORT __attribute__((visibility("default")))
    #define HUDDLE_IMPORT __attribute__((visibility("default")))
#else
    #define HUDDLE_EXPORT
    #define HUDDLE_IMPORT
#endif

#ifdef HUDDLE_BUILDING_DLL
    #define HUDDLE_API HUDDLE_EXPORT
#else
    #define HUDDLE_API HUDDLE_IMPORT
#endif

enum LoggingSeverity {
  LS_VERBOSE,
  LS_INFO,
  LS_WARNING,
  LS_ERROR,
  LS_NONE,
};

#define AS_VERBOSE LS_VERBOSE
#define AS_INFO LS_INFO
#define AS_WARNING LS_WARNING
#define AS_ERROR LS_ERROR
#define AS_NONE LS_NONE
#define APP_LOG(x) RTC_LOG(x)

#endif // HUDDLE_EXPORT_H

// Reconnection policy of the coordination server channel.
struct SignalingReconnectOptions {
    bool enabled = true;
    int attempts = 5;          // <= 0 means unlimited
    int delay_ms = 1000;
    int max_delay_ms = 5000;
    double backoff_factor = 1.5;
};

// Peer server endpoint and peer transport retry policy.
struct PeerOptions {
    std::string host;
    int port = 443;
    bool secure = true;
    std::string path = "/";
    std::string key = "peerjs";
    int connection_delay_ms = 10000;
    int max_reconnect_attempts = 5;
    int reconnect_delay_ms = 1000;
};

struct MediaOptions {
    int fps = 30;
    std::string resolution = "vga"; // qvga | vga | hd | fhd
    bool portrait = false;
    std::string camera;             // device name or index, empty for first
    std::string microphone;
    bool cam_mute = false;
    bool mic_mute = false;
};

// Command line options
struct Options {
    std::string signaling_url;
    std::string token;
    std::string room;
    std::string user_name;
    SignalingReconnectOptions signaling;
    PeerOptions peer;
    MediaOptions media;
    bool debug = false;
    bool help = false;
    std::string help_string;
    std::string config_path = ""; // Path to JSON config file
};

// Function to parse command line arguments to above options
HUDDLE_API Options parseOptions(const std::vector<std::string>& args);

// Applies the members found in a parsed config document. Unknown or
// mistyped members are ignored with a warning.
HUDDLE_API void applyConfigJson(const Json::Value& config, Options& opts);

// Function to get current options as a printable string
HUDDLE_API std::string getUsage(const Options& opts);

HUDDLE_API void HuddleSetLoggingLevel(LoggingSeverity level);

HUDDLE_API std::string HuddleCreateRandomId(size_t length = 16);

// Capture width in pixels for a named resolution, vga when unknown.
HUDDLE_API int HuddleResolutionWidth(const std::string& name);

// Typed member reads for remote payloads. A non-object payload or a member
// of another type yields |fallback|.
HUDDLE_API std::string JsonString(const Json::Value& data,
                                  const char* key,
                                  const std::string& fallback = std::string());
HUDDLE_API int JsonInt(const Json::Value& data, const char* key, int fallback);

// Stores the bool member |key| (or |fallback| when absent) into |out|.
// Returns false when the member is present but not a bool.
HUDDLE_API bool ReadJsonBool(const Json::Value& data, const char* key, bool fallback, bool* out);

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

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "api/audio_codecs/builtin_audio_decoder_factory.h"
#include "api/audio_codecs/builtin_audio_encoder_factory.h"
#include "api/create_peerconnection_factory.h"
#include "api/task_queue/default_task_queue_factory.h"
#include "api/video_codecs/video_decoder_factory_template.h"
#include "api/video_codecs/video_decoder_factory_template_dav1d_adapter.h"
#include "api/video_codecs/video_decoder_factory_template_libvpx_vp8_adapter.h"
#include "api/video_codecs/video_decoder_factory_template_libvpx_vp9_adapter.h"
#include "api/video_codecs/video_decoder_factory_template_open_h264_adapter.h"
#include "api/video_codecs/video_encoder_factory_template.h"
#include "api/video_codecs/video_encoder_factory_template_libaom_av1_adapter.h"
#include "api/video_codecs/video_encoder_factory_template_libvpx_vp8_adapter.h"
#include "api/video_codecs/video_encoder_factory_template_libvpx_vp9_adapter.h"
#include "api/video_codecs/video_encoder_factory_template_open_h264_adapter.h"
#include "rtc_base/ssl_adapter.h"
#include "rtc_base/thread.h"

#include "media_devices.h"
#include "option.h"
#include "peerjs_provider.h"
#include "session.h"
#include "socketio.h"

static std::atomic<int> g_interrupts{0};

// Signal handler for Ctrl+C
void signalHandler(int signal) {
  if (signal != SIGINT) return;
  int count = ++g_interrupts;
  if (count >= 2) {
    const char message[] = "\nForce exit\n";
    ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
    (void)ignored;
    _exit(1);
  }
}

namespace {

struct Runtime {
  std::unique_ptr<rtc::Thread> network_thread;
  std::unique_ptr<rtc::Thread> worker_thread;
  std::unique_ptr<rtc::Thread> session_thread;
  std::unique_ptr<webrtc::TaskQueueFactory> task_queue_factory;
  rtc::scoped_refptr<webrtc::AudioDeviceModule> adm;
  rtc::scoped_refptr<webrtc::PeerConnectionFactoryInterface> factory;
};

bool StartThreads(Runtime& runtime) {
  runtime.network_thread = rtc::Thread::CreateWithSocketServer();
  runtime.worker_thread = rtc::Thread::Create();
  runtime.session_thread = rtc::Thread::Create();
  runtime.network_thread->SetName("Network", nullptr);
  runtime.worker_thread->SetName("Worker", nullptr);
  runtime.session_thread->SetName("Session", nullptr);
  if (!runtime.network_thread->Start() || !runtime.worker_thread->Start() ||
      !runtime.session_thread->Start()) {
    APP_LOG(AS_ERROR) << "Failed to start threads";
    return false;
  }
  return true;
}

bool CreateFactory(Runtime& runtime) {
  runtime.task_queue_factory = webrtc::CreateDefaultTaskQueueFactory();
  webrtc::TaskQueueFactory* task_queue_factory = runtime.task_queue_factory.get();

  // The ADM lives on the worker thread. Without a usable sound server fall
  // back to the dummy layer so signaling and video still work.
  runtime.worker_thread->BlockingCall([&runtime, task_queue_factory]() {
    runtime.adm = webrtc::AudioDeviceModule::Create(
        webrtc::AudioDeviceModule::kPlatformDefaultAudio, task_queue_factory);
    if (runtime.adm && runtime.adm->Init() == 0) {
      return;
    }
    APP_LOG(AS_WARNING) << "Audio device module unavailable, switching to DummyAudio layer";
    runtime.adm = webrtc::AudioDeviceModule::Create(webrtc::AudioDeviceModule::kDummyAudio,
                                                    task_queue_factory);
    if (runtime.adm && runtime.adm->Init() != 0) {
      APP_LOG(AS_ERROR) << "Dummy audio device module failed to initialize";
      runtime.adm = nullptr;
    }
  });
  if (!runtime.adm) {
    APP_LOG(AS_ERROR) << "Audio device module creation failed";
    return false;
  }

  runtime.factory = webrtc::CreatePeerConnectionFactory(
      runtime.network_thread.get(),
      runtime.worker_thread.get(),
      runtime.session_thread.get(),
      runtime.adm,
      webrtc::CreateBuiltinAudioEncoderFactory(),
      webrtc::CreateBuiltinAudioDecoderFactory(),
      std::make_unique<webrtc::VideoEncoderFactoryTemplate<
          webrtc::LibvpxVp8EncoderTemplateAdapter,
          webrtc::LibvpxVp9EncoderTemplateAdapter,
          webrtc::OpenH264EncoderTemplateAdapter,
          webrtc::LibaomAv1EncoderTemplateAdapter>>(),
      std::make_unique<webrtc::VideoDecoderFactoryTemplate<
          webrtc::LibvpxVp8DecoderTemplateAdapter,
          webrtc::LibvpxVp9DecoderTemplateAdapter,
          webrtc::OpenH264DecoderTemplateAdapter,
          webrtc::Dav1dDecoderTemplateAdapter>>(),
      nullptr,  // audio_mixer
      nullptr   // audio_processing
  );
  if (!runtime.factory) {
    APP_LOG(AS_ERROR) << "Failed to create PeerConnectionFactory";
    return false;
  }
  return true;
}

void StopRuntime(Runtime& runtime) {
  runtime.factory = nullptr;
  if (runtime.worker_thread && runtime.adm) {
    runtime.worker_thread->BlockingCall([&runtime]() {
      runtime.adm->Terminate();
      runtime.adm = nullptr;
    });
  }
  if (runtime.session_thread) runtime.session_thread->Stop();
  if (runtime.worker_thread) runtime.worker_thread->Stop();
  if (runtime.network_thread) runtime.network_thread->Stop();
}

}  // namespace

int main(int argc, char* argv[]) {
  Options opts;
  if (argc == 1) {
    opts.help = true;
  } else {
    opts = parseOptions(std::vector<std::string>(argv + 1, argv + argc));
  }
  if (opts.help) {
    fprintf(stderr, "%s\n", opts.help_string.c_str());
    return 1;
  }
  if (opts.signaling_url.empty() || opts.room.empty()) {
    fprintf(stderr, "Error: --signaling_url and --room are required\n");
    return 1;
  }
  webrtc::RTCErrorOr<SignalingUrl> url = ParseSignalingUrl(opts.signaling_url);
  if (!url.ok()) {
    fprintf(stderr, "Error: %s\n", url.error().message());
    return 1;
  }

  HuddleSetLoggingLevel(opts.debug ? AS_VERBOSE : AS_INFO);
  signal(SIGINT, signalHandler);
  rtc::InitializeSSL();

  Runtime runtime;
  if (!StartThreads(runtime) || !CreateFactory(runtime)) {
    StopRuntime(runtime);
    rtc::CleanupSSL();
    return 1;
  }

  PeerJsProvider::Environment peer_env;
  peer_env.network_thread = runtime.network_thread.get();
  peer_env.session_queue = runtime.session_thread.get();
  peer_env.factory = runtime.factory.get();
  peer_env.rtc_config.sdp_semantics = webrtc::SdpSemantics::kUnifiedPlan;
  webrtc::PeerConnectionInterface::IceServer stun;
  stun.uri = "stun:stun.l.google.com:19302";
  peer_env.rtc_config.servers.push_back(stun);
  PeerJsProviderFactory provider_factory(opts.peer, peer_env);

  WebRtcMediaDevices::Environment devices_env;
  devices_env.factory = runtime.factory.get();
  devices_env.worker_thread = runtime.worker_thread.get();
  devices_env.adm = runtime.adm.get();
  devices_env.session_queue = runtime.session_thread.get();

  std::atomic<bool> done{false};
  std::atomic<int> exit_code{0};
  std::unique_ptr<WebRtcMediaDevices> devices;
  std::unique_ptr<ConsoleStreamRenderer> renderer;
  std::unique_ptr<HuddleSession> session;

  auto finish = [&done, &exit_code](int code) {
    exit_code = code;
    done = true;
  };

  runtime.session_thread->BlockingCall([&]() {
    devices = std::make_unique<WebRtcMediaDevices>(devices_env);
    renderer = std::make_unique<ConsoleStreamRenderer>();

    HuddleSession::Dependencies deps;
    deps.task_queue = runtime.session_thread.get();
    deps.socket = std::make_unique<SocketIoSignalingSocket>(
        url.value(), runtime.network_thread.get(), runtime.session_thread.get());
    deps.provider_factory = &provider_factory;
    deps.devices = devices.get();
    deps.renderer = renderer.get();
    session = std::make_unique<HuddleSession>(std::move(deps));

    auto joined = std::make_shared<bool>(false);
    session->bus().Subscribe([&finish, joined](const SessionNotification& n) {
      APP_LOG(AS_INFO) << n.name;
      if (n.event == SessionEvent::kRoomJoined) {
        *joined = true;
      } else if (n.event == SessionEvent::kSignalingFailed) {
        APP_LOG(AS_ERROR) << "Signaling lost: " << n.detail["message"].asString();
        finish(1);
      } else if (IsTerminalSessionEvent(n.event)) {
        finish(2);
      } else if (n.event == SessionEvent::kPeerConnectionFailed && !*joined) {
        finish(3);
      }
    });
    session->SetNotifyCallback([](const std::string& title, const std::string& text) {
      std::cout << "[" << title << "] " << text << std::endl;
    });

    webrtc::RTCError error = session->Initialize(opts);
    if (!error.ok()) {
      APP_LOG(AS_ERROR) << "Initialize failed: " << error.message();
      finish(1);
      return;
    }

    HuddleSession* s = session.get();
    s->OpenConnection(opts.token, [s, &opts, &finish](webrtc::RTCError error) {
      if (!error.ok()) {
        APP_LOG(AS_ERROR) << "Signaling failed: " << error.message();
        finish(1);
        return;
      }
      s->InitialPeerTransport(opts.token, [s, &opts, &finish](webrtc::RTCError error) {
        if (!error.ok()) {
          APP_LOG(AS_ERROR) << "Peer transport failed: " << error.message();
          finish(1);
          return;
        }
        MediaDeviceSelection selection;
        selection.camera = opts.media.camera;
        selection.microphone = opts.media.microphone;
        CaptureResult capture = s->StartStreamUserMedia(selection);
        if (!capture.ok()) {
          APP_LOG(AS_WARNING) << "Joining without local media: " << capture.message;
        }
        Json::Value user_data(Json::objectValue);
        user_data["name"] = opts.user_name.empty() ? s->LocalPeerId() : opts.user_name;
        webrtc::RTCError join = s->JoinRoom(opts.room, user_data);
        if (!join.ok()) {
          APP_LOG(AS_ERROR) << "Join failed: " << join.message();
          finish(1);
        }
      });
    });
  });

  bool leaving = false;
  while (!done) {
    if (g_interrupts > 0 && !leaving) {
      leaving = true;
      std::cout << "\nCtrl+C received, leaving room " << opts.room << std::endl;
      runtime.session_thread->PostTask([&session, &finish]() {
        webrtc::RTCError error = session->LeaveRoom();
        if (!error.ok()) {
          APP_LOG(AS_WARNING) << "Leave failed: " << error.message();
        }
        finish(0);
      });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  runtime.session_thread->BlockingCall([&]() {
    session.reset();
    renderer.reset();
    devices.reset();
  });
  StopRuntime(runtime);
  rtc::CleanupSSL();
  return exit_code;
}

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

#include "backoff.h"

#include <algorithm>
#include <cmath>

#include "rtc_base/crypto_random.h"

#include "option.h"

ExponentialBackoff::ExponentialBackoff(webrtc::TimeDelta base,
                                       double factor,
                                       webrtc::TimeDelta max_delay,
                                       int max_attempts)
    : base_(base),
      factor_(factor),
      max_delay_(max_delay),
      max_attempts_(max_attempts) {}

webrtc::TimeDelta ExponentialBackoff::NextDelay(int attempt) {
  double ms = base_.ms<double>() * std::pow(factor_, attempt);
  if (ms > max_delay_.ms<double>()) {
    return max_delay_;
  }
  return webrtc::TimeDelta::Millis(static_cast<int64_t>(std::llround(ms)));
}

JitteredDoublingBackoff::JitteredDoublingBackoff(webrtc::TimeDelta base,
                                                 webrtc::TimeDelta cap,
                                                 int max_attempts,
                                                 JitterSource jitter)
    : base_(base),
      cap_(cap),
      max_attempts_(max_attempts),
      jitter_(std::move(jitter)),
      delay_(base) {
  if (!jitter_) {
    jitter_ = [] { return rtc::CreateRandomDouble(); };
  }
}

webrtc::TimeDelta JitteredDoublingBackoff::NextDelay(int /*attempt*/) {
  webrtc::TimeDelta current = delay_;
  double jitter_ms = std::clamp(jitter_(), 0.0, 0.999) * 1000.0;
  delay_ = std::min(cap_, delay_ * 2 + webrtc::TimeDelta::Millis(
                                           static_cast<int64_t>(jitter_ms)));
  return current;
}

ReconnectTimer::ReconnectTimer(webrtc::TaskQueueBase* task_queue,
                               std::unique_ptr<BackoffStrategy> strategy)
    : task_queue_(task_queue),
      strategy_(std::move(strategy)),
      timer_flag_(webrtc::PendingTaskSafetyFlag::CreateDetached()) {}

ReconnectTimer::~ReconnectTimer() {
  timer_flag_->SetNotAlive();
}

ReconnectTimer::Result ReconnectTimer::Schedule(std::function<void()> retry) {
  if (!enabled_) {
    return Result::kDisabled;
  }
  int max = strategy_->max_attempts();
  if (max > 0 && attempt_ >= max) {
    APP_LOG(AS_WARNING) << "Reconnect attempts exhausted after " << attempt_;
    return Result::kExhausted;
  }
  Cancel();

  last_delay_ = strategy_->NextDelay(attempt_);
  attempt_++;
  pending_ = true;
  APP_LOG(AS_INFO) << "Reconnect attempt " << attempt_ << " in "
                   << last_delay_.ms() << "ms";
  task_queue_->PostDelayedTask(
      webrtc::SafeTask(timer_flag_, [this, retry = std::move(retry)]() {
        pending_ = false;
        retry();
      }),
      last_delay_);
  return Result::kScheduled;
}

void ReconnectTimer::Cancel() {
  if (!pending_) {
    return;
  }
  timer_flag_->SetNotAlive();
  timer_flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  pending_ = false;
}

void ReconnectTimer::OnConnected() {
  Cancel();
  attempt_ = 0;
  strategy_->Reset();
}

void ReconnectTimer::set_enabled(bool enabled) {
  enabled_ = enabled;
  if (!enabled_) {
    Cancel();
  }
}

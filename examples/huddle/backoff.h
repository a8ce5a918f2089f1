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

#ifndef WEBRTC_HUDDLE_BACKOFF_H_
#define WEBRTC_HUDDLE_BACKOFF_H_

#include <functional>
#include <memory>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"

// Retry delay policy of one channel. The signaling channel and the peer
// transport retry differently and keep separate strategies.
class BackoffStrategy {
 public:
  virtual ~BackoffStrategy() = default;

  // Delay before retry number |attempt| (0 based).
  virtual webrtc::TimeDelta NextDelay(int attempt) = 0;
  virtual void Reset() = 0;
  // <= 0 means unlimited.
  virtual int max_attempts() const = 0;
};

// min(base * factor^attempt, max). Stateless in |attempt|.
class ExponentialBackoff : public BackoffStrategy {
 public:
  ExponentialBackoff(webrtc::TimeDelta base,
                     double factor,
                     webrtc::TimeDelta max_delay,
                     int max_attempts);

  webrtc::TimeDelta NextDelay(int attempt) override;
  void Reset() override {}
  int max_attempts() const override { return max_attempts_; }

 private:
  const webrtc::TimeDelta base_;
  const double factor_;
  const webrtc::TimeDelta max_delay_;
  const int max_attempts_;
};

// Starts at |base|; after every retry the delay becomes
// min(cap, delay * 2 + jitter) with jitter uniform in [0, 1000) ms.
class JitteredDoublingBackoff : public BackoffStrategy {
 public:
  // Returns a value in [0, 1).
  using JitterSource = std::function<double()>;

  JitteredDoublingBackoff(webrtc::TimeDelta base,
                          webrtc::TimeDelta cap,
                          int max_attempts,
                          JitterSource jitter = nullptr);

  webrtc::TimeDelta NextDelay(int attempt) override;
  void Reset() override { delay_ = base_; }
  int max_attempts() const override { return max_attempts_; }

 private:
  const webrtc::TimeDelta base_;
  const webrtc::TimeDelta cap_;
  const int max_attempts_;
  JitterSource jitter_;
  webrtc::TimeDelta delay_;
};

// One cancelable retry timer per channel. Scheduling a retry cancels any
// pending one. The attempt count grows per scheduled retry and is only
// reset by OnConnected().
class ReconnectTimer {
 public:
  enum class Result { kScheduled, kExhausted, kDisabled };

  ReconnectTimer(webrtc::TaskQueueBase* task_queue,
                 std::unique_ptr<BackoffStrategy> strategy);
  ~ReconnectTimer();

  ReconnectTimer(const ReconnectTimer&) = delete;
  ReconnectTimer& operator=(const ReconnectTimer&) = delete;

  Result Schedule(std::function<void()> retry);
  void Cancel();
  void OnConnected();

  // Disabling also cancels the pending retry.
  void set_enabled(bool enabled);
  bool enabled() const { return enabled_; }

  bool pending() const { return pending_; }
  int attempt() const { return attempt_; }
  webrtc::TimeDelta last_delay() const { return last_delay_; }
  int max_attempts() const { return strategy_->max_attempts(); }

 private:
  webrtc::TaskQueueBase* const task_queue_;
  std::unique_ptr<BackoffStrategy> strategy_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> timer_flag_;
  bool enabled_ = true;
  bool pending_ = false;
  int attempt_ = 0;
  webrtc::TimeDelta last_delay_ = webrtc::TimeDelta::Zero();
};

#endif  // WEBRTC_HUDDLE_BACKOFF_H_

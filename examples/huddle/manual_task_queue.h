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

#ifndef WEBRTC_HUDDLE_MANUAL_TASK_QUEUE_H_
#define WEBRTC_HUDDLE_MANUAL_TASK_QUEUE_H_

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "api/location.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"
#include "api/units/timestamp.h"

// Task queue for unit tests. Nothing runs until the test calls
// RunPending() or AdvanceTime(); tasks then run in due-time order on the
// calling thread.
class ManualTaskQueue : public webrtc::TaskQueueBase {
 public:
  ManualTaskQueue() = default;

  void Delete() override { delete this; }

  webrtc::Timestamp now() const { return now_; }
  size_t pending_tasks() const { return tasks_.size(); }

  // Delay from now until the earliest pending task, infinite when empty.
  webrtc::TimeDelta NextTaskDelay() const {
    if (tasks_.empty()) {
      return webrtc::TimeDelta::PlusInfinity();
    }
    return tasks_.begin()->first.first - now_;
  }

  // Runs everything that is due now, including tasks they post.
  void RunPending() { AdvanceTime(webrtc::TimeDelta::Zero()); }

  void AdvanceTime(webrtc::TimeDelta delta) {
    const webrtc::Timestamp target = now_ + delta;
    while (!tasks_.empty() && tasks_.begin()->first.first <= target) {
      auto it = tasks_.begin();
      now_ = std::max(now_, it->first.first);
      absl::AnyInvocable<void() &&> task = std::move(it->second);
      tasks_.erase(it);
      std::move(task)();
    }
    now_ = target;
  }

 protected:
  ~ManualTaskQueue() override = default;

  void PostTaskImpl(absl::AnyInvocable<void() &&> task,
                    const PostTaskTraits& /*traits*/,
                    const webrtc::Location& /*location*/) override {
    tasks_.emplace(std::make_pair(now_, sequence_++), std::move(task));
  }

  void PostDelayedTaskImpl(absl::AnyInvocable<void() &&> task,
                           webrtc::TimeDelta delay,
                           const PostDelayedTaskTraits& /*traits*/,
                           const webrtc::Location& /*location*/) override {
    tasks_.emplace(std::make_pair(now_ + delay, sequence_++), std::move(task));
  }

 private:
  webrtc::Timestamp now_ = webrtc::Timestamp::Seconds(1000);
  uint64_t sequence_ = 0;
  std::map<std::pair<webrtc::Timestamp, uint64_t>,
           absl::AnyInvocable<void() &&>>
      tasks_;
};

using ManualTaskQueuePtr = std::unique_ptr<ManualTaskQueue, webrtc::TaskQueueDeleter>;

inline ManualTaskQueuePtr CreateManualTaskQueue() {
  return ManualTaskQueuePtr(new ManualTaskQueue());
}

#endif  // WEBRTC_HUDDLE_MANUAL_TASK_QUEUE_H_

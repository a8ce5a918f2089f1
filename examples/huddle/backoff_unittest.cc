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

#include <gtest/gtest.h>

#include "manual_task_queue.h"

namespace {

using webrtc::TimeDelta;

TEST(ExponentialBackoffTest, GrowsByFactorUntilCapped) {
  ExponentialBackoff backoff(TimeDelta::Millis(1000), 1.5,
                             TimeDelta::Millis(5000), 0);
  EXPECT_EQ(backoff.NextDelay(0), TimeDelta::Millis(1000));
  EXPECT_EQ(backoff.NextDelay(1), TimeDelta::Millis(1500));
  EXPECT_EQ(backoff.NextDelay(2), TimeDelta::Millis(2250));
  EXPECT_EQ(backoff.NextDelay(3), TimeDelta::Millis(3375));
  EXPECT_EQ(backoff.NextDelay(4), TimeDelta::Millis(5000));
  EXPECT_EQ(backoff.NextDelay(12), TimeDelta::Millis(5000));
}

TEST(ExponentialBackoffTest, NeverDecreases) {
  ExponentialBackoff backoff(TimeDelta::Millis(250), 2.0,
                             TimeDelta::Millis(8000), 0);
  TimeDelta previous = TimeDelta::Zero();
  for (int k = 0; k < 20; ++k) {
    TimeDelta delay = backoff.NextDelay(k);
    EXPECT_GE(delay, previous);
    EXPECT_LE(delay, TimeDelta::Millis(8000));
    previous = delay;
  }
}

TEST(JitteredDoublingBackoffTest, DoublesWithJitterAndCaps) {
  JitteredDoublingBackoff backoff(TimeDelta::Millis(1000),
                                  TimeDelta::Millis(30000), 5,
                                  [] { return 0.5; });
  EXPECT_EQ(backoff.NextDelay(0), TimeDelta::Millis(1000));
  EXPECT_EQ(backoff.NextDelay(1), TimeDelta::Millis(2500));
  EXPECT_EQ(backoff.NextDelay(2), TimeDelta::Millis(5500));
  EXPECT_EQ(backoff.NextDelay(3), TimeDelta::Millis(11500));
  EXPECT_EQ(backoff.NextDelay(4), TimeDelta::Millis(23500));
  EXPECT_EQ(backoff.NextDelay(5), TimeDelta::Millis(30000));
  backoff.Reset();
  EXPECT_EQ(backoff.NextDelay(0), TimeDelta::Millis(1000));
}

class ReconnectTimerTest : public ::testing::Test {
 protected:
  ReconnectTimerTest()
      : queue_(CreateManualTaskQueue()),
        timer_(queue_.get(),
               std::make_unique<ExponentialBackoff>(TimeDelta::Millis(1000), 1.5,
                                                    TimeDelta::Millis(5000), 3)) {}

  ManualTaskQueuePtr queue_;
  ReconnectTimer timer_;
  int retries_ = 0;
};

TEST_F(ReconnectTimerTest, RunsRetryAfterDelay) {
  EXPECT_EQ(timer_.Schedule([this] { retries_++; }),
            ReconnectTimer::Result::kScheduled);
  EXPECT_TRUE(timer_.pending());
  queue_->AdvanceTime(TimeDelta::Millis(999));
  EXPECT_EQ(retries_, 0);
  queue_->AdvanceTime(TimeDelta::Millis(1));
  EXPECT_EQ(retries_, 1);
  EXPECT_FALSE(timer_.pending());
  EXPECT_EQ(timer_.attempt(), 1);
}

TEST_F(ReconnectTimerTest, SchedulingAgainCancelsPendingRetry) {
  timer_.Schedule([this] { retries_ += 10; });
  timer_.Schedule([this] { retries_++; });
  queue_->AdvanceTime(TimeDelta::Seconds(10));
  EXPECT_EQ(retries_, 1);
}

TEST_F(ReconnectTimerTest, StopsAtMaximumAttempts) {
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(timer_.Schedule([this] { retries_++; }),
              ReconnectTimer::Result::kScheduled);
    queue_->AdvanceTime(TimeDelta::Seconds(10));
  }
  EXPECT_EQ(timer_.Schedule([this] { retries_++; }),
            ReconnectTimer::Result::kExhausted);
  EXPECT_EQ(retries_, 3);
}

TEST_F(ReconnectTimerTest, OnlyConnectResetsAttempts) {
  timer_.Schedule([] {});
  timer_.Schedule([] {});
  EXPECT_EQ(timer_.attempt(), 2);
  EXPECT_EQ(timer_.last_delay(), TimeDelta::Millis(1500));
  timer_.OnConnected();
  EXPECT_EQ(timer_.attempt(), 0);
  EXPECT_FALSE(timer_.pending());
  timer_.Schedule([] {});
  EXPECT_EQ(timer_.last_delay(), TimeDelta::Millis(1000));
}

TEST_F(ReconnectTimerTest, DisablingCancelsAndRefuses) {
  timer_.Schedule([this] { retries_++; });
  timer_.set_enabled(false);
  queue_->AdvanceTime(TimeDelta::Seconds(10));
  EXPECT_EQ(retries_, 0);
  EXPECT_EQ(timer_.Schedule([this] { retries_++; }),
            ReconnectTimer::Result::kDisabled);
}

}  // namespace

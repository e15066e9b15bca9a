/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <gtest/gtest.h>
#include "dwio/rowstream/common/StopWatch.h"
#include "folly/Benchmark.h"

using namespace ::facebook;

namespace {
void wasteSomeTime() {
  int tot = 0;
  for (int i = 0; i < 100; ++i) {
    tot += i;
    folly::doNotOptimizeAway(tot);
  }
}
} // namespace

TEST(StopWatchTests, BasicCorrectness) {
  rowstream::StopWatch watch;
  watch.start();
  wasteSomeTime();
  watch.stop();

  ASSERT_GE(watch.elapsedNsec(), 0LL);
  ASSERT_GE(watch.elapsed(), 0.0);

  watch.reset();
  ASSERT_EQ(watch.elapsedNsec(), 0);
  ASSERT_EQ(watch.elapsed(), 0.0);

  watch.start();
  wasteSomeTime();
  watch.stop();
  int64_t elapsed1 = watch.elapsedNsec();
  ASSERT_GT(elapsed1, 0LL);
  watch.start();
  wasteSomeTime();
  int64_t elapsed2 = watch.elapsedNsec();
  ASSERT_GT(elapsed2, elapsed1);
  watch.stop();
  int64_t elapsed3 = watch.elapsedNsec();
  wasteSomeTime();
  int64_t elapsed4 = watch.elapsedNsec();
  ASSERT_EQ(elapsed3, elapsed4);

  ASSERT_EQ(elapsed4 / 1000, watch.elapsedUsec());
  ASSERT_EQ(elapsed4 / (1000 * 1000), watch.elapsedMsec());
}

TEST(StopWatchTests, Restart) {
  rowstream::StopWatch watch;
  EXPECT_FALSE(watch.running());
  watch.start();
  wasteSomeTime();
  EXPECT_TRUE(watch.running());

  watch.restart();
  EXPECT_TRUE(watch.running());
  watch.stop();
  EXPECT_FALSE(watch.running());
  const auto afterRestart = watch.elapsedNsec();

  // Start and stop are idempotent.
  watch.stop();
  EXPECT_EQ(afterRestart, watch.elapsedNsec());
  watch.start();
  watch.start();
  wasteSomeTime();
  watch.stop();
  EXPECT_GT(watch.elapsedNsec(), afterRestart);
}

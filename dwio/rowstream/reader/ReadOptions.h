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
#pragma once

#include <folly/CancellationToken.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "dwio/rowstream/common/MetricsLogger.h"
#include "dwio/rowstream/reader/RetryPolicy.h"

namespace facebook::rowstream {

class Config;

struct ReadOptions {
  // Decides on retries after a failed attempt. When unset, exponential
  // backoff configured by the current --rowstream_retry_* flag values.
  std::shared_ptr<const RetryPolicy> retryPolicy;

  // Bounds each attempt. Enforced by the transport, which fails the attempt
  // with DEADLINE_EXCEEDED.
  std::optional<std::chrono::milliseconds> attemptTimeout;

  // Bounds the whole logical read. Attempts are never given more time than
  // what is left of it, and no attempt is started once it has passed.
  std::optional<std::chrono::milliseconds> sessionTimeout;

  // Cancelling the token has the same effect as ReadSession::cancel().
  folly::CancellationToken cancellationToken;

  std::shared_ptr<MetricsLogger> metricsLogger;

  // Waits out the backoff between attempts. When unset the session waits on
  // its own, and wakes up early on cancellation.
  std::function<void(std::chrono::milliseconds)> sleep;

  static ReadOptions fromConfig(const Config& config);
};

} // namespace facebook::rowstream

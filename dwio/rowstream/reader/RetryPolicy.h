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

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

#include "dwio/rowstream/reader/ErrorClass.h"

namespace facebook::rowstream {

class Config;

enum class RetryReason {
  // The failure is transient and the budget allows another attempt.
  Retryable,
  // The failure class is never retried.
  NotRetryable,
  // The maximum number of attempts was reached.
  AttemptsExhausted,
  // Waiting for another attempt would go past the session deadline.
  DeadlineExceeded,
};

std::string_view toString(RetryReason reason);

struct RetryDecision {
  bool retry;
  std::chrono::milliseconds delay{0};
  RetryReason reason;

  // True when the decision stops a retryable failure because the session ran
  // out of budget.
  bool exhausted() const {
    return reason == RetryReason::AttemptsExhausted ||
        reason == RetryReason::DeadlineExceeded;
  }
};

// What a retry policy knows about the failure it decides on.
struct RetryContext {
  ErrorClass errorClass;
  // Attempts made so far in the session, including the failed one.
  uint32_t attempt;
  // Time since the session issued its first request.
  std::chrono::milliseconds elapsed;
  // Protocol violations seen so far in the session, including this one.
  uint32_t protocolViolations{0};
};

struct RetryPolicyOptions {
  std::chrono::milliseconds initialDelay{10};
  std::chrono::milliseconds maxDelay{60'000};
  double multiplier{2.0};
  uint32_t maxAttempts{10};
  std::chrono::milliseconds maxElapsed{600'000};
  // Each delay is reduced by a random fraction of up to this ratio. 0 keeps
  // delays deterministic.
  double jitterRatio{0.0};
  // Resume once after the first protocol violation of a session instead of
  // failing it.
  bool retryProtocolViolationOnce{false};

  static RetryPolicyOptions fromConfig(const Config& config);
};

// Decides whether a failed attempt is followed by another one. Decisions only
// depend on the context they are given.
class RetryPolicy {
 public:
  virtual ~RetryPolicy() = default;

  virtual RetryDecision decide(const RetryContext& context) const = 0;
};

// Exponential backoff: the n-th retry waits initialDelay * multiplier^(n-1),
// never more than maxDelay. Gives up after maxAttempts attempts or when the
// next attempt would start past maxElapsed.
class ExponentialBackoffRetryPolicy : public RetryPolicy {
 public:
  explicit ExponentialBackoffRetryPolicy(RetryPolicyOptions options = {});

  RetryDecision decide(const RetryContext& context) const override;

  // The delay before the attempt following attempt |attempt|, before jitter.
  std::chrono::milliseconds backoff(uint32_t attempt) const;

  const RetryPolicyOptions& options() const {
    return options_;
  }

 private:
  const RetryPolicyOptions options_;
};

// Fails the session on the first error.
class NoRetryPolicy : public RetryPolicy {
 public:
  RetryDecision decide(const RetryContext& context) const override;
};

std::shared_ptr<const RetryPolicy> makeRetryPolicy(const Config& config);

} // namespace facebook::rowstream

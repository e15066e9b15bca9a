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
#include "dwio/rowstream/reader/RetryPolicy.h"

#include <folly/Random.h>

#include <algorithm>
#include <cmath>

#include "dwio/rowstream/common/Config.h"
#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream {

std::string_view toString(RetryReason reason) {
  switch (reason) {
    case RetryReason::Retryable:
      return "Retryable";
    case RetryReason::NotRetryable:
      return "NotRetryable";
    case RetryReason::AttemptsExhausted:
      return "AttemptsExhausted";
    case RetryReason::DeadlineExceeded:
      return "DeadlineExceeded";
  }
  ROWSTREAM_UNREACHABLE("Unknown retry reason {}", static_cast<int>(reason));
}

RetryPolicyOptions RetryPolicyOptions::fromConfig(const Config& config) {
  return {
      .initialDelay =
          std::chrono::milliseconds{config.get(Config::RETRY_INITIAL_DELAY_MS)},
      .maxDelay =
          std::chrono::milliseconds{config.get(Config::RETRY_MAX_DELAY_MS)},
      .multiplier = config.get(Config::RETRY_MULTIPLIER),
      .maxAttempts = config.get(Config::RETRY_MAX_ATTEMPTS),
      .maxElapsed =
          std::chrono::milliseconds{config.get(Config::RETRY_MAX_ELAPSED_MS)},
      .jitterRatio = config.get(Config::RETRY_JITTER_RATIO),
      .retryProtocolViolationOnce =
          config.get(Config::RETRY_PROTOCOL_VIOLATIONS),
  };
}

ExponentialBackoffRetryPolicy::ExponentialBackoffRetryPolicy(
    RetryPolicyOptions options)
    : options_{std::move(options)} {
  ROWSTREAM_USER_CHECK_GE(
      options_.initialDelay.count(), 0, "Negative initial retry delay.");
  ROWSTREAM_USER_CHECK_GE(
      options_.maxDelay.count(),
      options_.initialDelay.count(),
      "Max retry delay below the initial delay.");
  ROWSTREAM_USER_CHECK_GE(
      options_.multiplier, 1.0, "Retry multiplier must be at least 1.");
  ROWSTREAM_USER_CHECK_GT(
      options_.maxAttempts, 0U, "At least one attempt must be allowed.");
  ROWSTREAM_USER_CHECK(
      options_.jitterRatio >= 0.0 && options_.jitterRatio <= 1.0,
      "Jitter ratio must be in [0, 1], got {}.",
      options_.jitterRatio);
}

std::chrono::milliseconds ExponentialBackoffRetryPolicy::backoff(
    uint32_t attempt) const {
  const auto exponent = attempt > 0 ? attempt - 1 : 0;
  const double delay = static_cast<double>(options_.initialDelay.count()) *
      std::pow(options_.multiplier, exponent);
  const auto maxDelay = static_cast<double>(options_.maxDelay.count());
  return std::chrono::milliseconds{
      static_cast<int64_t>(std::min(delay, maxDelay))};
}

RetryDecision ExponentialBackoffRetryPolicy::decide(
    const RetryContext& context) const {
  switch (context.errorClass) {
    case ErrorClass::TransientTransport:
      break;
    case ErrorClass::ProtocolViolation:
      if (!options_.retryProtocolViolationOnce ||
          context.protocolViolations > 1) {
        return {.retry = false, .reason = RetryReason::NotRetryable};
      }
      break;
    case ErrorClass::PermanentRequest:
    case ErrorClass::SessionExhausted:
    case ErrorClass::Cancelled:
      return {.retry = false, .reason = RetryReason::NotRetryable};
  }

  if (context.attempt >= options_.maxAttempts) {
    return {.retry = false, .reason = RetryReason::AttemptsExhausted};
  }

  auto delay = backoff(context.attempt);
  if (options_.jitterRatio > 0.0 && delay.count() > 0) {
    const double reduction =
        options_.jitterRatio * folly::Random::randDouble01();
    delay = std::chrono::milliseconds{static_cast<int64_t>(
        static_cast<double>(delay.count()) * (1.0 - reduction))};
  }

  if (context.elapsed + delay > options_.maxElapsed) {
    return {.retry = false, .reason = RetryReason::DeadlineExceeded};
  }
  return {.retry = true, .delay = delay, .reason = RetryReason::Retryable};
}

RetryDecision NoRetryPolicy::decide(const RetryContext& context) const {
  if (context.errorClass == ErrorClass::TransientTransport) {
    return {.retry = false, .reason = RetryReason::AttemptsExhausted};
  }
  return {.retry = false, .reason = RetryReason::NotRetryable};
}

std::shared_ptr<const RetryPolicy> makeRetryPolicy(const Config& config) {
  return std::make_shared<ExponentialBackoffRetryPolicy>(
      RetryPolicyOptions::fromConfig(config));
}

} // namespace facebook::rowstream

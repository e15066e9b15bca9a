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

#include "dwio/rowstream/common/Config.h"
#include "dwio/rowstream/common/Exceptions.h"
#include "dwio/rowstream/common/tests/GTestUtils.h"
#include "dwio/rowstream/reader/ErrorClass.h"
#include "dwio/rowstream/reader/ReadRowsTransport.h"
#include "dwio/rowstream/reader/RetryPolicy.h"

namespace facebook::rowstream::test {

using namespace std::chrono_literals;

namespace {

RetryContext transient(uint32_t attempt, std::chrono::milliseconds elapsed) {
  return RetryContext{
      .errorClass = ErrorClass::TransientTransport,
      .attempt = attempt,
      .elapsed = elapsed,
  };
}

std::exception_ptr captureTransportError(std::string_view code) {
  try {
    throwTransportError(code, "boom");
  } catch (const RowStreamExternalError&) {
    return std::current_exception();
  }
}

} // namespace

TEST(ErrorClassTest, TransportErrorCodes) {
  for (auto code :
       {"UNAVAILABLE",
        "DEADLINE_EXCEEDED",
        "CONNECTION_RESET",
        "ABORTED",
        "RESOURCE_EXHAUSTED"}) {
    EXPECT_EQ(
        ErrorClass::TransientTransport,
        classifyError(captureTransportError(code)))
        << code;
  }
  for (auto code :
       {"INVALID_ARGUMENT",
        "PERMISSION_DENIED",
        "NOT_FOUND",
        "UNAUTHENTICATED"}) {
    EXPECT_EQ(
        ErrorClass::PermanentRequest,
        classifyError(captureTransportError(code)))
        << code;
  }
}

TEST(ErrorClassTest, TransportErrorsCarryRetryableFlag) {
  try {
    throwTransportError("UNAVAILABLE", "server went away");
    FAIL() << "Should have thrown";
  } catch (const RowStreamExternalError& e) {
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ("READ_ROWS_TRANSPORT", e.externalSource());
    EXPECT_EQ("server went away", e.errorMessage());
  }
  try {
    throwTransportError("PERMISSION_DENIED", "no");
    FAIL() << "Should have thrown";
  } catch (const RowStreamExternalError& e) {
    EXPECT_FALSE(e.retryable());
  }
}

TEST(ErrorClassTest, ProtocolViolation) {
  try {
    ROWSTREAM_PROTOCOL_CHECK(false, "bad chunk");
    FAIL() << "Should have thrown";
  } catch (const std::exception& e) {
    EXPECT_EQ(ErrorClass::ProtocolViolation, classifyError(e));
  }
}

TEST(ErrorClassTest, UnknownCodes) {
  EXPECT_EQ(
      ErrorClass::TransientTransport, classifyErrorCode("FLAKY", true));
  EXPECT_EQ(
      ErrorClass::PermanentRequest, classifyErrorCode("FLAKY", false));
  // Known codes ignore the flag.
  EXPECT_EQ(
      ErrorClass::PermanentRequest, classifyErrorCode("NOT_FOUND", true));
  EXPECT_EQ(
      ErrorClass::SessionExhausted,
      classifyErrorCode("SESSION_EXHAUSTED", false));
  EXPECT_EQ(ErrorClass::Cancelled, classifyErrorCode("CANCELLED", false));
}

TEST(ErrorClassTest, ForeignExceptions) {
  EXPECT_EQ(
      ErrorClass::PermanentRequest,
      classifyError(std::runtime_error{"not ours"}));
}

TEST(RetryPolicyTest, ExponentialBackoff) {
  ExponentialBackoffRetryPolicy policy{RetryPolicyOptions{
      .initialDelay = 10ms,
      .maxDelay = 100ms,
      .multiplier = 2.0,
      .maxAttempts = 10,
      .maxElapsed = 10'000ms,
  }};

  EXPECT_EQ(10ms, policy.backoff(1));
  EXPECT_EQ(20ms, policy.backoff(2));
  EXPECT_EQ(40ms, policy.backoff(3));
  EXPECT_EQ(80ms, policy.backoff(4));
  // Capped.
  EXPECT_EQ(100ms, policy.backoff(5));
  EXPECT_EQ(100ms, policy.backoff(9));

  auto decision = policy.decide(transient(3, 500ms));
  EXPECT_TRUE(decision.retry);
  EXPECT_EQ(40ms, decision.delay);
  EXPECT_EQ(RetryReason::Retryable, decision.reason);
  EXPECT_FALSE(decision.exhausted());
}

TEST(RetryPolicyTest, Deterministic) {
  ExponentialBackoffRetryPolicy policy;
  auto first = policy.decide(transient(2, 100ms));
  auto second = policy.decide(transient(2, 100ms));
  EXPECT_EQ(first.retry, second.retry);
  EXPECT_EQ(first.delay, second.delay);
  EXPECT_EQ(first.reason, second.reason);
}

TEST(RetryPolicyTest, AttemptsExhausted) {
  ExponentialBackoffRetryPolicy policy{RetryPolicyOptions{.maxAttempts = 3}};
  EXPECT_TRUE(policy.decide(transient(2, 0ms)).retry);

  auto decision = policy.decide(transient(3, 0ms));
  EXPECT_FALSE(decision.retry);
  EXPECT_EQ(RetryReason::AttemptsExhausted, decision.reason);
  EXPECT_TRUE(decision.exhausted());
}

TEST(RetryPolicyTest, DeadlineExceeded) {
  ExponentialBackoffRetryPolicy policy{RetryPolicyOptions{
      .initialDelay = 100ms,
      .maxDelay = 1000ms,
      .maxElapsed = 1000ms,
  }};
  EXPECT_TRUE(policy.decide(transient(1, 900ms)).retry);

  // The wait would end past the deadline.
  auto decision = policy.decide(transient(1, 950ms));
  EXPECT_FALSE(decision.retry);
  EXPECT_EQ(RetryReason::DeadlineExceeded, decision.reason);
  EXPECT_TRUE(decision.exhausted());
}

TEST(RetryPolicyTest, NonRetryableClasses) {
  ExponentialBackoffRetryPolicy policy;
  for (auto errorClass :
       {ErrorClass::PermanentRequest,
        ErrorClass::ProtocolViolation,
        ErrorClass::SessionExhausted,
        ErrorClass::Cancelled}) {
    auto decision = policy.decide(RetryContext{
        .errorClass = errorClass,
        .attempt = 1,
        .elapsed = 0ms,
        .protocolViolations = 1,
    });
    EXPECT_FALSE(decision.retry) << toString(errorClass);
    EXPECT_EQ(RetryReason::NotRetryable, decision.reason);
    EXPECT_FALSE(decision.exhausted());
  }
}

TEST(RetryPolicyTest, ProtocolViolationRetriedOnce) {
  ExponentialBackoffRetryPolicy policy{RetryPolicyOptions{
      .initialDelay = 5ms,
      .retryProtocolViolationOnce = true,
  }};
  auto first = policy.decide(RetryContext{
      .errorClass = ErrorClass::ProtocolViolation,
      .attempt = 1,
      .elapsed = 0ms,
      .protocolViolations = 1,
  });
  EXPECT_TRUE(first.retry);
  EXPECT_EQ(5ms, first.delay);

  auto second = policy.decide(RetryContext{
      .errorClass = ErrorClass::ProtocolViolation,
      .attempt = 2,
      .elapsed = 10ms,
      .protocolViolations = 2,
  });
  EXPECT_FALSE(second.retry);
  EXPECT_EQ(RetryReason::NotRetryable, second.reason);
}

TEST(RetryPolicyTest, Jitter) {
  ExponentialBackoffRetryPolicy policy{RetryPolicyOptions{
      .initialDelay = 1000ms,
      .maxDelay = 1000ms,
      .jitterRatio = 0.5,
  }};
  for (int i = 0; i < 20; ++i) {
    auto decision = policy.decide(transient(1, 0ms));
    ASSERT_TRUE(decision.retry);
    EXPECT_LE(decision.delay, 1000ms);
    EXPECT_GE(decision.delay, 500ms);
  }
}

TEST(RetryPolicyTest, InvalidOptions) {
  ROWSTREAM_ASSERT_USER_THROW(
      ExponentialBackoffRetryPolicy(RetryPolicyOptions{.maxAttempts = 0}),
      "At least one attempt must be allowed.");
  ROWSTREAM_ASSERT_USER_THROW(
      ExponentialBackoffRetryPolicy(RetryPolicyOptions{.multiplier = 0.5}),
      "Retry multiplier must be at least 1.");
  ROWSTREAM_ASSERT_USER_THROW(
      ExponentialBackoffRetryPolicy(RetryPolicyOptions{.jitterRatio = 2.0}),
      "Jitter ratio must be in [0, 1], got 2.");
  ROWSTREAM_ASSERT_USER_THROW(
      ExponentialBackoffRetryPolicy(
          RetryPolicyOptions{.initialDelay = 10ms, .maxDelay = 5ms}),
      "Max retry delay below the initial delay.");
}

TEST(RetryPolicyTest, NoRetry) {
  NoRetryPolicy policy;
  auto decision = policy.decide(transient(1, 0ms));
  EXPECT_FALSE(decision.retry);
  EXPECT_TRUE(decision.exhausted());
}

TEST(RetryPolicyTest, FromConfig) {
  auto config = Config::fromMap({
      {"rowstream.retry.initial.delay.ms", "50"},
      {"rowstream.retry.max.delay.ms", "400"},
      {"rowstream.retry.multiplier", "3"},
      {"rowstream.retry.max.attempts", "4"},
      {"rowstream.retry.max.elapsed.ms", "2000"},
      {"rowstream.retry.protocol.violations", "true"},
  });
  auto options = RetryPolicyOptions::fromConfig(*config);
  EXPECT_EQ(50ms, options.initialDelay);
  EXPECT_EQ(400ms, options.maxDelay);
  EXPECT_DOUBLE_EQ(3.0, options.multiplier);
  EXPECT_EQ(4, options.maxAttempts);
  EXPECT_EQ(2000ms, options.maxElapsed);
  EXPECT_DOUBLE_EQ(0.0, options.jitterRatio);
  EXPECT_TRUE(options.retryProtocolViolationOnce);

  ExponentialBackoffRetryPolicy policy{options};
  EXPECT_EQ(150ms, policy.backoff(2));
  EXPECT_EQ(400ms, policy.backoff(3));
}

} // namespace facebook::rowstream::test

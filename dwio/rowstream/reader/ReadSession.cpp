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
#include "dwio/rowstream/reader/ReadSession.h"

#include <fmt/format.h>
#include <folly/String.h>
#include <folly/json/json.h>
#include <glog/logging.h>

#include <algorithm>
#include <utility>

#include "dwio/rowstream/common/Config.h"
#include "dwio/rowstream/common/Exceptions.h"
#include "dwio/rowstream/reader/ErrorClass.h"

namespace facebook::rowstream {

namespace {

std::string escaped(std::string_view key) {
  return folly::cEscape<std::string>(key);
}

std::string errorCodeOf(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const RowStreamException& e) {
    return e.errorCode();
  } catch (const std::exception&) {
    return std::string{error_code::Unknown};
  }
}

std::string errorMessageOf(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const RowStreamException& e) {
    return e.errorMessage();
  } catch (const std::exception& e) {
    return e.what();
  }
}

std::shared_ptr<const RetryPolicy> retryPolicyOrDefault(
    std::shared_ptr<const RetryPolicy> policy) {
  if (policy) {
    return policy;
  }
  return makeRetryPolicy(*Config::fromFlags());
}

// A start key given by the caller narrows the row set of the first attempt.
// The override itself is only sent on resumed attempts.
ReadRowsRequest firstRequest(ReadRowsRequest request) {
  if (request.startAfterKey) {
    request.rowSet = request.rowSet.trimmedAfter(*request.startAfterKey);
    request.startAfterKey.reset();
  }
  return request;
}

std::optional<uint64_t> initialLimit(const ReadRowsRequest& request) {
  if (request.rowsLimit == 0) {
    return std::nullopt;
  }
  return request.rowsLimit;
}

} // namespace

ReadSession::ReadSession(
    std::shared_ptr<ReadRowsTransport> transport,
    ReadRowsRequest request,
    ReadOptions options)
    : transport_{std::move(transport)},
      request_{firstRequest(request)},
      options_{std::move(options)},
      retryPolicy_{retryPolicyOrDefault(options_.retryPolicy)},
      remainingLimit_{initialLimit(request_)},
      cancellationCallback_{options_.cancellationToken, [this] { cancel(); }} {
  ROWSTREAM_CHECK_NOT_NULL(transport_, "Read session needs a transport.");
  ROWSTREAM_USER_CHECK(!request_.tableName.empty(), "Table name is missing.");
  if (request.startAfterKey) {
    resumeKey_ = *request.startAfterKey;
  }
}

ReadSession::~ReadSession() {
  if (auto stream = *stream_.rlock()) {
    stream->cancel();
  }
}

std::optional<Row> ReadSession::next() {
  while (true) {
    switch (state_.load()) {
      case State::Done:
        return std::nullopt;
      case State::Failed:
        std::rethrow_exception(error_);
      case State::Idle:
      case State::Streaming:
      case State::RetryWait:
        break;
    }

    if (cancelled_) {
      if (sequencer_) {
        endAttempt(error_code::Cancelled, /* cancelStream */ true);
      }
      finish(State::Done);
      return std::nullopt;
    }

    try {
      if (!sequencer_ && !startAttempt()) {
        continue;
      }

      auto row = sequencer_->next();
      if (cancelled_) {
        // The row may have been assembled before the cancellation landed.
        continue;
      }
      resumeKey_ = sequencer_->lastKey();
      if (row) {
        lastEmittedKey_ = row->key();
        remainingLimit_ = sequencer_->remainingLimit();
        ++rowCount_;
        return row;
      }

      const bool limitReached = sequencer_->limitReached();
      endAttempt("", /* cancelStream */ limitReached);
      VLOG(1) << "Read of " << request_.tableName << " complete after "
              << rowCount_ << " rows"
              << (limitReached ? ", row limit reached" : "");
      finish(State::Done);
      return std::nullopt;
    } catch (const std::exception&) {
      handleFailure(std::current_exception());
    }
  }
}

void ReadSession::cancel() {
  if (cancelled_.exchange(true)) {
    return;
  }
  VLOG(1) << "Cancelling read of " << request_.tableName;
  cancelBaton_.post();
  if (auto stream = *stream_.rlock()) {
    stream->cancel();
  }
}

bool ReadSession::startAttempt() {
  if (remainingLimit_ && *remainingLimit_ == 0) {
    finish(State::Done);
    return false;
  }

  auto request = attempts_ == 0
      ? request_
      : request_.resumeAfter(resumeKey_, remainingLimit_);
  if (request.rowSet.isEmpty()) {
    VLOG(1) << "Nothing left to read after '" << escaped(resumeKey_) << "'";
    finish(State::Done);
    return false;
  }

  if (attempts_ > 0 && sessionDeadlineReached()) {
    // The backoff wait ran into the session deadline.
    fail(
        exhaustedError(lastError_, RetryReason::DeadlineExceeded),
        classifyError(lastError_),
        RetryReason::DeadlineExceeded);
    return false;
  }

  if (attempts_ == 0) {
    sessionWatch_.start();
  }
  ++attempts_;
  state_ = State::Streaming;
  attemptWatch_.restart();
  VLOG(1) << "Read attempt " << attempts_ << ": " << request.toString();

  std::shared_ptr<ReadRowsStream> stream = transport_->readRows(
      request,
      AttemptContext{.attempt = attempts_, .timeout = attemptTimeout()});
  ROWSTREAM_CHECK_NOT_NULL(stream, "Transport opened no stream.");
  *stream_.wlock() = stream;
  if (cancelled_) {
    stream->cancel();
  }
  sequencer_ =
      std::make_unique<RowSequencer>(*stream, resumeKey_, remainingLimit_);
  return true;
}

bool ReadSession::sessionDeadlineReached(std::chrono::milliseconds delay) {
  return options_.sessionTimeout &&
      std::chrono::milliseconds{sessionWatch_.elapsedMsec()} + delay >=
      *options_.sessionTimeout;
}

std::optional<std::chrono::milliseconds> ReadSession::attemptTimeout() {
  if (!options_.sessionTimeout) {
    return options_.attemptTimeout;
  }
  auto left = *options_.sessionTimeout -
      std::chrono::milliseconds{sessionWatch_.elapsedMsec()};
  left = std::max(left, std::chrono::milliseconds{0});
  if (options_.attemptTimeout) {
    return std::min(left, *options_.attemptTimeout);
  }
  return left;
}

void ReadSession::endAttempt(std::string_view errorCode, bool cancelStream) {
  ReadAttemptMetrics metrics{
      .attempt = attempts_,
      .errorCode = std::string{errorCode},
      .wallTimeUsec = static_cast<size_t>(attemptWatch_.elapsedUsec()),
  };
  if (sequencer_) {
    const auto& assembler = sequencer_->assembler();
    metrics.responseCount = sequencer_->responseCount();
    metrics.chunkCount = assembler.chunkCount();
    metrics.rowCount = assembler.rowCount();
    metrics.valueBytes = assembler.valueBytes();
    sequencer_.reset();
  }

  auto stream = std::exchange(*stream_.wlock(), nullptr);
  if (stream && cancelStream) {
    stream->cancel();
  }

  if (options_.metricsLogger) {
    options_.metricsLogger->logReadAttempt(metrics);
  }
}

void ReadSession::handleFailure(std::exception_ptr error) {
  const auto errorClass = classifyError(error);
  const auto errorCode = errorCodeOf(error);
  if (sequencer_) {
    resumeKey_ = sequencer_->lastKey();
  }
  endAttempt(errorCode, /* cancelStream */ true);

  if (cancelled_) {
    // Errors raised by the stream we just cancelled are expected.
    VLOG(1) << "Ignoring " << errorCode << " on cancelled read";
    finish(State::Done);
    return;
  }

  if (errorClass == ErrorClass::ProtocolViolation) {
    ++protocolViolations_;
  }
  auto decision = retryPolicy_->decide(RetryContext{
      .errorClass = errorClass,
      .attempt = attempts_,
      .elapsed = std::chrono::milliseconds{sessionWatch_.elapsedMsec()},
      .protocolViolations = protocolViolations_,
  });
  if (decision.retry && sessionDeadlineReached(decision.delay)) {
    decision = RetryDecision{
        .retry = false, .reason = RetryReason::DeadlineExceeded};
  }

  if (!decision.retry) {
    if (decision.exhausted()) {
      fail(exhaustedError(error, decision.reason), errorClass, decision.reason);
    } else {
      fail(std::move(error), errorClass, decision.reason);
    }
    return;
  }

  LOG(WARNING) << "Read attempt " << attempts_ << " of "
               << request_.tableName << " failed with " << errorCode
               << ", resuming after '" << escaped(resumeKey_) << "' in "
               << decision.delay.count() << "ms";
  if (options_.metricsLogger) {
    options_.metricsLogger->logException(
        LogOperation::Retry, errorMessageOf(error));
  }
  lastError_ = std::move(error);
  state_ = State::RetryWait;
  waitForRetry(decision.delay);
}

void ReadSession::fail(
    std::exception_ptr error,
    ErrorClass errorClass,
    RetryReason reason) {
  error_ = std::move(error);
  errorCode_ = errorCodeOf(error_);
  LOG(ERROR) << "Read of " << request_.tableName << " failed after "
             << attempts_ << " attempts (" << toString(errorClass) << ", "
             << toString(reason) << "): " << errorMessageOf(error_);
  finish(State::Failed);
}

void ReadSession::waitForRetry(std::chrono::milliseconds delay) {
  totalBackoffMsec_ += delay.count();
  if (delay.count() == 0) {
    return;
  }
  if (options_.sleep) {
    options_.sleep(delay);
  } else if (cancelBaton_.try_wait_for(delay)) {
    VLOG(1) << "Retry wait cut short by cancellation";
  }
}

std::exception_ptr ReadSession::exhaustedError(
    const std::exception_ptr& lastError,
    RetryReason reason) const {
  return std::make_exception_ptr(RowStreamExternalError(
      __FILE__,
      __LINE__,
      __FUNCTION__,
      "",
      fmt::format(
          "Retry budget exhausted after {} attempts ({}). Last error {}: {}",
          attempts_,
          toString(reason),
          errorCodeOf(lastError),
          errorMessageOf(lastError)),
      error_code::SessionExhausted,
      /* retryable */ false,
      external_source::ReadRowsTransport));
}

void ReadSession::finish(State state) {
  state_ = state;
  sessionWatch_.stop();

  ReadSessionMetrics metrics{
      .attemptCount = attempts_,
      .rowCount = rowCount_,
      .totalBackoffMsec = totalBackoffMsec_,
      .finalState = std::string{toString(state)},
      .errorCode = errorCode_,
      .wallTimeUsec = static_cast<size_t>(sessionWatch_.elapsedUsec()),
  };
  VLOG(1) << "Read session of " << request_.tableName
          << " finished: " << folly::toJson(metrics.serialize());
  if (options_.metricsLogger) {
    if (state == State::Failed) {
      options_.metricsLogger->logException(
          LogOperation::ReadSession, errorMessageOf(error_));
    }
    options_.metricsLogger->logReadSession(metrics);
  }
}

std::string_view toString(ReadSession::State state) {
  switch (state) {
    case ReadSession::State::Idle:
      return "IDLE";
    case ReadSession::State::Streaming:
      return "STREAMING";
    case ReadSession::State::RetryWait:
      return "RETRY_WAIT";
    case ReadSession::State::Done:
      return "DONE";
    case ReadSession::State::Failed:
      return "FAILED";
  }
  ROWSTREAM_UNREACHABLE("Unknown session state {}", static_cast<int>(state));
}

} // namespace facebook::rowstream

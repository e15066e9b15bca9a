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
#include <folly/Synchronized.h>
#include <folly/synchronization/Baton.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "dwio/rowstream/chunk/Row.h"
#include "dwio/rowstream/common/StopWatch.h"
#include "dwio/rowstream/reader/ErrorClass.h"
#include "dwio/rowstream/reader/ReadOptions.h"
#include "dwio/rowstream/reader/ReadRowsRequest.h"
#include "dwio/rowstream/reader/ReadRowsTransport.h"
#include "dwio/rowstream/reader/RowSequencer.h"

// A ReadSession is one logical read of a table. It hides transient failures
// of the underlying streams from the caller.
//
// Rows are pulled one at a time with next(). When an attempt fails with an
// error the retry policy accepts, the session waits for the backoff delay and
// opens a new stream for the rows it has not delivered yet: the resumed
// request starts strictly after the last delivered (or scanned) row key and
// carries the remaining row limit. A row is therefore delivered at most once.
//
//   IDLE -> STREAMING -> DONE
//               |  ^
//               v  |
//           RETRY_WAIT -> FAILED
//
// next() and the destructor must be called from a single thread. cancel() may
// be called from any thread.

namespace facebook::rowstream {

class ReadSession {
 public:
  enum class State {
    Idle,
    Streaming,
    RetryWait,
    Done,
    Failed,
  };

  ReadSession(
      std::shared_ptr<ReadRowsTransport> transport,
      ReadRowsRequest request,
      ReadOptions options = {});

  ~ReadSession();

  ReadSession(const ReadSession&) = delete;
  ReadSession& operator=(const ReadSession&) = delete;

  // Returns the next row, or std::nullopt once the read is complete (end of
  // data, limit reached, or cancelled). Raises the error that failed the
  // session, every time it is called after that.
  std::optional<Row> next();

  // Stops the read. The stream in flight is cancelled, a retry wait is cut
  // short, and no row is returned anymore.
  void cancel();

  State state() const {
    return state_.load();
  }

  bool cancelled() const {
    return cancelled_.load();
  }

  // Key of the last row returned by next(), empty if none.
  const std::string& lastEmittedKey() const {
    return lastEmittedKey_;
  }

  // Where the next attempt would resume: the last emitted key, or a greater
  // key the server reported as scanned.
  const std::string& resumeKey() const {
    return resumeKey_;
  }

  // Rows still allowed by the request limit, std::nullopt when unlimited.
  std::optional<uint64_t> remainingLimit() const {
    return remainingLimit_;
  }

  uint32_t attemptCount() const {
    return attempts_;
  }

  uint64_t rowCount() const {
    return rowCount_;
  }

  const ReadRowsRequest& request() const {
    return request_;
  }

 private:
  // Opens the stream of the next attempt. Returns false, and moves to DONE,
  // when there is nothing left to read.
  bool startAttempt();

  // Releases the stream of the current attempt and reports its metrics.
  // |errorCode| is empty for a clean end of stream.
  void endAttempt(std::string_view errorCode, bool cancelStream);

  void handleFailure(std::exception_ptr error);

  void waitForRetry(std::chrono::milliseconds delay);

  void fail(std::exception_ptr error, ErrorClass errorClass, RetryReason reason);

  void finish(State state);

  std::exception_ptr exhaustedError(
      const std::exception_ptr& lastError,
      RetryReason reason) const;

  // True once the session deadline, if any, falls within |delay| from now.
  bool sessionDeadlineReached(
      std::chrono::milliseconds delay = std::chrono::milliseconds{0});

  std::optional<std::chrono::milliseconds> attemptTimeout();

  const std::shared_ptr<ReadRowsTransport> transport_;
  const ReadRowsRequest request_;
  const ReadOptions options_;
  const std::shared_ptr<const RetryPolicy> retryPolicy_;

  std::atomic<State> state_{State::Idle};
  std::atomic<bool> cancelled_{false};
  folly::Baton<> cancelBaton_;
  folly::Synchronized<std::shared_ptr<ReadRowsStream>> stream_;
  std::unique_ptr<RowSequencer> sequencer_;

  std::string lastEmittedKey_;
  std::string resumeKey_;
  std::optional<uint64_t> remainingLimit_;
  uint32_t attempts_{0};
  uint32_t protocolViolations_{0};
  uint64_t rowCount_{0};
  uint64_t totalBackoffMsec_{0};
  // Error of the last attempt, while waiting to resume.
  std::exception_ptr lastError_;
  std::exception_ptr error_;
  std::string errorCode_;
  StopWatch sessionWatch_;
  StopWatch attemptWatch_;

  // Declared last: may invoke cancel() from the constructor.
  folly::CancellationCallback cancellationCallback_;
};

std::string_view toString(ReadSession::State state);

} // namespace facebook::rowstream

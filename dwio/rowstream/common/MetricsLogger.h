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

#include <folly/json/dynamic.h>

#include <string>

namespace facebook::rowstream {

// Stats of a single streaming attempt of a read session.
struct ReadAttemptMetrics {
  uint32_t attempt;
  uint64_t responseCount{0};
  uint64_t chunkCount{0};
  uint64_t rowCount{0};
  uint64_t valueBytes{0};

  // Empty when the attempt ended with a clean end of stream.
  std::string errorCode;

  size_t wallTimeUsec;

  folly::dynamic serialize() const;
};

// Stats of a whole logical read, across all of its attempts.
struct ReadSessionMetrics {
  uint32_t attemptCount;
  uint64_t rowCount;
  uint64_t totalBackoffMsec{0};
  std::string finalState;
  std::string errorCode;

  size_t wallTimeUsec;

  folly::dynamic serialize() const;
};

enum class LogOperation {
  Retry,
  ReadSession,
};

class MetricsLogger {
 public:
  virtual ~MetricsLogger() = default;

  virtual void logException(
      LogOperation /* operation */,
      const std::string& /* errorMessage */) const {}

  virtual void logReadAttempt(const ReadAttemptMetrics& /* metrics */) const {}
  virtual void logReadSession(const ReadSessionMetrics& /* metrics */) const {}
};

} // namespace facebook::rowstream

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
#include "dwio/rowstream/common/MetricsLogger.h"

namespace facebook::rowstream {

folly::dynamic ReadAttemptMetrics::serialize() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["attempt"] = attempt;
  obj["responseCount"] = responseCount;
  obj["chunkCount"] = chunkCount;
  obj["rowCount"] = rowCount;
  obj["valueBytes"] = valueBytes;
  obj["errorCode"] = errorCode;
  obj["wallTimeUsec"] = wallTimeUsec;
  return obj;
}

folly::dynamic ReadSessionMetrics::serialize() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["attemptCount"] = attemptCount;
  obj["rowCount"] = rowCount;
  obj["totalBackoffMsec"] = totalBackoffMsec;
  obj["finalState"] = finalState;
  obj["errorCode"] = errorCode;
  obj["wallTimeUsec"] = wallTimeUsec;
  return obj;
}

} // namespace facebook::rowstream

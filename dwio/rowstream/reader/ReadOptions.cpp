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
#include "dwio/rowstream/reader/ReadOptions.h"

#include "dwio/rowstream/common/Config.h"

namespace facebook::rowstream {

ReadOptions ReadOptions::fromConfig(const Config& config) {
  ReadOptions options;
  options.retryPolicy = makeRetryPolicy(config);
  if (auto timeout = config.get(Config::ATTEMPT_TIMEOUT_MS); timeout > 0) {
    options.attemptTimeout = std::chrono::milliseconds{timeout};
  }
  if (auto timeout = config.get(Config::RETRY_MAX_ELAPSED_MS); timeout > 0) {
    options.sessionTimeout = std::chrono::milliseconds{timeout};
  }
  return options;
}

} // namespace facebook::rowstream

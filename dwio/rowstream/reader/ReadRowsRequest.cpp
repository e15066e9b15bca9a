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
#include "dwio/rowstream/reader/ReadRowsRequest.h"

#include <fmt/format.h>
#include <folly/String.h>

namespace facebook::rowstream {

ReadRowsRequest ReadRowsRequest::resumeAfter(
    const std::string& lastKey,
    std::optional<uint64_t> remainingLimit) const {
  ReadRowsRequest request = *this;
  if (!lastKey.empty()) {
    request.rowSet = rowSet.trimmedAfter(lastKey);
    request.startAfterKey = lastKey;
  }
  request.rowsLimit = remainingLimit.value_or(0);
  return request;
}

std::string ReadRowsRequest::toString() const {
  auto result = fmt::format(
      "ReadRowsRequest(table={}, rows={}", tableName, rowSet.toString());
  if (!appProfileId.empty()) {
    result += fmt::format(", appProfile={}", appProfileId);
  }
  if (!filter.empty()) {
    result += fmt::format(", filter={}", filter);
  }
  if (rowsLimit > 0) {
    result += fmt::format(", limit={}", rowsLimit);
  }
  if (startAfterKey) {
    result += fmt::format(
        ", startAfter=\"{}\"", folly::cEscape<std::string>(*startAfterKey));
  }
  result += ")";
  return result;
}

} // namespace facebook::rowstream

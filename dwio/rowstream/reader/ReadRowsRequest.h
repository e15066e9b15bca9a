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

#include <cstdint>
#include <optional>
#include <string>

#include "dwio/rowstream/reader/RowSet.h"

namespace facebook::rowstream {

// The parameters of a single streaming read attempt.
struct ReadRowsRequest {
  std::string tableName;
  std::string appProfileId;
  RowSet rowSet;
  // Server side filter expression. Passed to the transport untouched, empty
  // means every cell.
  std::string filter;
  // Maximum number of rows to return. 0 means no limit.
  uint64_t rowsLimit{0};
  // Set on resumed attempts: only rows strictly greater than this key are
  // wanted.
  std::optional<std::string> startAfterKey;

  // Builds the request of the attempt following a failure. Rows up to and
  // including |lastKey| are not requested again and the limit accounts for
  // the rows already delivered.
  ReadRowsRequest resumeAfter(
      const std::string& lastKey,
      std::optional<uint64_t> remainingLimit) const;

  std::string toString() const;

  bool operator==(const ReadRowsRequest& other) const = default;
};

} // namespace facebook::rowstream

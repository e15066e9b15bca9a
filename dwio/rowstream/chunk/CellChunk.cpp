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
#include "dwio/rowstream/chunk/CellChunk.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <folly/String.h>

namespace facebook::rowstream {

std::string CellChunk::toString() const {
  std::string result = "{";
  auto append = [&result](std::string_view field) {
    if (result.size() > 1) {
      result += ", ";
    }
    result += field;
  };
  if (!rowKey.empty()) {
    append(fmt::format("row_key: \"{}\"", folly::cEscape<std::string>(rowKey)));
  }
  if (familyName.has_value()) {
    append(fmt::format("family: \"{}\"", *familyName));
  }
  if (qualifier.has_value()) {
    append(fmt::format(
        "qualifier: \"{}\"", folly::cEscape<std::string>(*qualifier)));
  }
  if (timestampMicros != 0) {
    append(fmt::format("timestamp: {}", timestampMicros));
  }
  if (!labels.empty()) {
    append(fmt::format("labels: [{}]", fmt::join(labels, ", ")));
  }
  if (!value.empty()) {
    append(fmt::format("value: {} bytes", value.size()));
  }
  if (valueSize != 0) {
    append(fmt::format("value_size: {}", valueSize));
  }
  if (resetRow) {
    append("reset_row");
  }
  if (commitRow) {
    append("commit_row");
  }
  result += "}";
  return result;
}

} // namespace facebook::rowstream

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
#include "dwio/rowstream/chunk/Row.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <folly/String.h>

namespace facebook::rowstream {

const Family* Row::family(std::string_view name) const {
  for (const auto& family : families_) {
    if (family.name == name) {
      return &family;
    }
  }
  return nullptr;
}

std::span<const Cell> Row::cells(
    std::string_view family,
    std::string_view qualifier) const {
  const auto* columns = this->family(family);
  if (columns == nullptr) {
    return {};
  }
  for (const auto& column : columns->columns) {
    if (column.qualifier == qualifier) {
      return column.cells;
    }
  }
  return {};
}

size_t Row::cellCount() const {
  size_t count = 0;
  for (const auto& family : families_) {
    for (const auto& column : family.columns) {
      count += column.cells.size();
    }
  }
  return count;
}

std::string Row::toString() const {
  std::string result =
      fmt::format("{}:", folly::cEscape<std::string>(key_));
  for (const auto& family : families_) {
    for (const auto& column : family.columns) {
      for (const auto& cell : column.cells) {
        result += fmt::format(
            "\n  {}:{} @{} \"{}\"",
            family.name,
            folly::cEscape<std::string>(column.qualifier),
            cell.timestampMicros(),
            folly::cEscape<std::string>(cell.value()));
        if (!cell.labels().empty()) {
          result += fmt::format(" [{}]", fmt::join(cell.labels(), ","));
        }
      }
    }
  }
  return result;
}

} // namespace facebook::rowstream

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
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace facebook::rowstream {

// A single version of a column value.
class Cell {
 public:
  Cell(
      int64_t timestampMicros,
      std::string value,
      std::vector<std::string> labels)
      : timestampMicros_{timestampMicros},
        value_{std::move(value)},
        labels_{std::move(labels)} {}

  int64_t timestampMicros() const {
    return timestampMicros_;
  }

  const std::string& value() const {
    return value_;
  }

  const std::vector<std::string>& labels() const {
    return labels_;
  }

  bool operator==(const Cell& other) const = default;

 private:
  int64_t timestampMicros_;
  std::string value_;
  std::vector<std::string> labels_;
};

// All versions of a column, in the order the server delivered them (newest
// first).
struct Column {
  std::string qualifier;
  std::vector<Cell> cells;

  bool operator==(const Column& other) const = default;
};

// Columns of a family, in arrival order.
struct Family {
  std::string name;
  std::vector<Column> columns;

  bool operator==(const Family& other) const = default;
};

// A fully assembled row. Rows are only ever built from a committed chunk
// sequence and are immutable afterwards.
class Row {
 public:
  Row(std::string key, std::vector<Family> families)
      : key_{std::move(key)}, families_{std::move(families)} {}

  const std::string& key() const {
    return key_;
  }

  const std::vector<Family>& families() const {
    return families_;
  }

  // Returns nullptr if the row has no cell in |name|.
  const Family* family(std::string_view name) const;

  // Returns the versions of column |family|:|qualifier|, empty if the row has
  // no such column.
  std::span<const Cell> cells(
      std::string_view family,
      std::string_view qualifier) const;

  // Total number of cells, all families and versions included.
  size_t cellCount() const;

  bool empty() const {
    return families_.empty();
  }

  std::string toString() const;

  bool operator==(const Row& other) const = default;

 private:
  std::string key_;
  std::vector<Family> families_;
};

} // namespace facebook::rowstream

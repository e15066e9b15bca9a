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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace facebook::rowstream {

// A contiguous range of row keys. Each side is either unbounded or bounded
// by a key that is included (closed) or excluded (open).
class RowRange {
 public:
  struct Bound {
    std::string key;
    bool closed;

    bool operator==(const Bound& other) const = default;
  };

  // Every row of the table.
  static RowRange infinite();

  // [start, end]
  static RowRange closed(std::string start, std::string end);
  // (start, end)
  static RowRange open(std::string start, std::string end);
  // [start, end)
  static RowRange rightOpen(std::string start, std::string end);
  // (start, end]
  static RowRange leftOpen(std::string start, std::string end);
  // [start, +inf)
  static RowRange startingAt(std::string start);
  // (start, +inf)
  static RowRange after(std::string start);
  // (-inf, end]
  static RowRange endingAt(std::string end);
  // (-inf, end)
  static RowRange before(std::string end);
  // Every key starting with |prefix|.
  static RowRange prefix(std::string prefix);

  RowRange(std::optional<Bound> start, std::optional<Bound> end);

  const std::optional<Bound>& start() const {
    return start_;
  }

  const std::optional<Bound>& end() const {
    return end_;
  }

  // True when no key can fall in the range.
  bool empty() const;

  bool contains(std::string_view key) const;

  // The part of this range strictly greater than |key|. std::nullopt when
  // nothing remains.
  std::optional<RowRange> trimmedAfter(std::string_view key) const;

  std::string toString() const;

  bool operator==(const RowRange& other) const = default;

 private:
  bool isAboveStart(std::string_view key) const;
  bool isBelowEnd(std::string_view key) const;

  std::optional<Bound> start_;
  std::optional<Bound> end_;
};

// The rows a read asks for: a list of single keys plus a list of ranges. A
// default constructed set reads the whole table.
class RowSet {
 public:
  RowSet() = default;

  RowSet& addKey(std::string key);
  RowSet& addRange(RowRange range);

  const std::vector<std::string>& keys() const {
    return keys_;
  }

  const std::vector<RowRange>& ranges() const {
    return ranges_;
  }

  bool readsEntireTable() const {
    return entireTable_;
  }

  // True when the set can no longer match any row. Only trimmed sets and sets
  // built from empty ranges are empty.
  bool isEmpty() const;

  bool contains(std::string_view key) const;

  // Removes every key and every part of a range that is not strictly greater
  // than |key|. Used to resume a read after the last delivered row.
  RowSet trimmedAfter(std::string_view key) const;

  std::string toString() const;

  bool operator==(const RowSet& other) const = default;

 private:
  std::vector<std::string> keys_;
  std::vector<RowRange> ranges_;
  bool entireTable_{true};
};

} // namespace facebook::rowstream

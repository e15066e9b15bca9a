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
#include "dwio/rowstream/reader/RowSet.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <folly/String.h>

#include <algorithm>

namespace facebook::rowstream {

namespace {

// The smallest key greater than every key starting with |prefix|. Empty when
// there is no such key (the prefix is all 0xff bytes).
std::string prefixSuccessor(std::string prefix) {
  while (!prefix.empty() && static_cast<unsigned char>(prefix.back()) == 0xff) {
    prefix.pop_back();
  }
  if (!prefix.empty()) {
    prefix.back() = static_cast<char>(prefix.back() + 1);
  }
  return prefix;
}

std::string escape(std::string_view key) {
  return folly::cEscape<std::string>(key);
}

} // namespace

RowRange RowRange::infinite() {
  return RowRange{std::nullopt, std::nullopt};
}

RowRange RowRange::closed(std::string start, std::string end) {
  return RowRange{Bound{std::move(start), true}, Bound{std::move(end), true}};
}

RowRange RowRange::open(std::string start, std::string end) {
  return RowRange{
      Bound{std::move(start), false}, Bound{std::move(end), false}};
}

RowRange RowRange::rightOpen(std::string start, std::string end) {
  return RowRange{Bound{std::move(start), true}, Bound{std::move(end), false}};
}

RowRange RowRange::leftOpen(std::string start, std::string end) {
  return RowRange{Bound{std::move(start), false}, Bound{std::move(end), true}};
}

RowRange RowRange::startingAt(std::string start) {
  return RowRange{Bound{std::move(start), true}, std::nullopt};
}

RowRange RowRange::after(std::string start) {
  return RowRange{Bound{std::move(start), false}, std::nullopt};
}

RowRange RowRange::endingAt(std::string end) {
  return RowRange{std::nullopt, Bound{std::move(end), true}};
}

RowRange RowRange::before(std::string end) {
  return RowRange{std::nullopt, Bound{std::move(end), false}};
}

RowRange RowRange::prefix(std::string prefix) {
  if (prefix.empty()) {
    return infinite();
  }
  auto successor = prefixSuccessor(prefix);
  if (successor.empty()) {
    return startingAt(std::move(prefix));
  }
  return rightOpen(std::move(prefix), std::move(successor));
}

RowRange::RowRange(std::optional<Bound> start, std::optional<Bound> end)
    : start_{std::move(start)}, end_{std::move(end)} {}

bool RowRange::empty() const {
  if (!start_ || !end_) {
    return false;
  }
  if (start_->key != end_->key) {
    return start_->key > end_->key;
  }
  return !(start_->closed && end_->closed);
}

bool RowRange::isAboveStart(std::string_view key) const {
  if (!start_) {
    return true;
  }
  return start_->closed ? key >= start_->key : key > start_->key;
}

bool RowRange::isBelowEnd(std::string_view key) const {
  if (!end_) {
    return true;
  }
  return end_->closed ? key <= end_->key : key < end_->key;
}

bool RowRange::contains(std::string_view key) const {
  return isAboveStart(key) && isBelowEnd(key);
}

std::optional<RowRange> RowRange::trimmedAfter(std::string_view key) const {
  if (!isBelowEnd(key)) {
    return std::nullopt;
  }
  RowRange trimmed = *this;
  if (isAboveStart(key)) {
    trimmed.start_ = Bound{std::string{key}, false};
  }
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string RowRange::toString() const {
  std::string result;
  if (start_) {
    result += start_->closed ? "[" : "(";
    result += fmt::format("\"{}\"", escape(start_->key));
  } else {
    result += "(-inf";
  }
  result += ", ";
  if (end_) {
    result += fmt::format("\"{}\"", escape(end_->key));
    result += end_->closed ? "]" : ")";
  } else {
    result += "+inf)";
  }
  return result;
}

RowSet& RowSet::addKey(std::string key) {
  entireTable_ = false;
  keys_.push_back(std::move(key));
  return *this;
}

RowSet& RowSet::addRange(RowRange range) {
  entireTable_ = false;
  ranges_.push_back(std::move(range));
  return *this;
}

bool RowSet::isEmpty() const {
  if (entireTable_) {
    return false;
  }
  return keys_.empty() &&
      std::all_of(ranges_.begin(), ranges_.end(), [](const auto& range) {
           return range.empty();
         });
}

bool RowSet::contains(std::string_view key) const {
  if (entireTable_) {
    return true;
  }
  return std::find(keys_.begin(), keys_.end(), key) != keys_.end() ||
      std::any_of(ranges_.begin(), ranges_.end(), [&](const auto& range) {
           return range.contains(key);
         });
}

RowSet RowSet::trimmedAfter(std::string_view key) const {
  RowSet result;
  if (entireTable_) {
    result.addRange(RowRange::after(std::string{key}));
    return result;
  }
  result.entireTable_ = false;
  for (const auto& rowKey : keys_) {
    if (rowKey > key) {
      result.keys_.push_back(rowKey);
    }
  }
  for (const auto& range : ranges_) {
    if (auto trimmed = range.trimmedAfter(key)) {
      result.ranges_.push_back(std::move(*trimmed));
    }
  }
  return result;
}

std::string RowSet::toString() const {
  if (entireTable_) {
    return "{all rows}";
  }
  std::vector<std::string> parts;
  parts.reserve(keys_.size() + ranges_.size());
  for (const auto& key : keys_) {
    parts.push_back(fmt::format("\"{}\"", escape(key)));
  }
  for (const auto& range : ranges_) {
    parts.push_back(range.toString());
  }
  return fmt::format("{{{}}}", fmt::join(parts, ", "));
}

} // namespace facebook::rowstream

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

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

#include "dwio/rowstream/chunk/Row.h"
#include "dwio/rowstream/reader/ReadSession.h"

namespace facebook::rowstream {

// Range adaptor over a ReadSession, for use in range based for loops:
//
//   RowReader reader{std::make_unique<ReadSession>(transport, request)};
//   for (const auto& row : reader) {
//     ...
//   }
//
// Errors failing the session are raised from begin() and operator++.
class RowReader {
 public:
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Row;
    using difference_type = std::ptrdiff_t;
    using pointer = const Row*;
    using reference = const Row&;

    Iterator() = default;

    reference operator*() const {
      return *row_;
    }

    pointer operator->() const {
      return &*row_;
    }

    Iterator& operator++() {
      row_ = session_->next();
      return *this;
    }

    void operator++(int) {
      ++*this;
    }

    bool operator==(std::default_sentinel_t) const {
      return !row_.has_value();
    }

   private:
    friend class RowReader;

    explicit Iterator(ReadSession* session)
        : session_{session}, row_{session->next()} {}

    ReadSession* session_{nullptr};
    std::optional<Row> row_;
  };

  explicit RowReader(std::unique_ptr<ReadSession> session)
      : session_{std::move(session)} {}

  // Starts pulling rows. Only call once, the session is consumed.
  Iterator begin() {
    return Iterator{session_.get()};
  }

  std::default_sentinel_t end() const {
    return std::default_sentinel;
  }

  void cancel() {
    session_->cancel();
  }

  ReadSession& session() {
    return *session_;
  }

 private:
  const std::unique_ptr<ReadSession> session_;
};

} // namespace facebook::rowstream

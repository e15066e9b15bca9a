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
#include <variant>
#include <vector>

#include "dwio/rowstream/chunk/CellChunk.h"
#include "dwio/rowstream/chunk/Row.h"

// The ChunkAssembler rebuilds rows out of the chunk sequence of a single
// streaming attempt.
//
// Chunks must be applied in arrival order: a chunk only carries the fields
// that changed since the previous one (row key, family, qualifier), and a
// large value may be split over several chunks. The assembler keeps the
// cursors needed to interpret the next chunk and the cells of the row in
// flight. A row is only handed out once its commit chunk arrives; a reset
// chunk throws away everything accumulated for the current row.
//
// Any chunk sequence breaking the protocol raises a RowStreamInternalError
// with error code PROTOCOL_VIOLATION. The assembler is unusable afterwards.

namespace facebook::rowstream {

class ChunkAssembler {
 public:
  enum class State {
    AwaitingNewRow,
    RowInProgress,
    CellInProgress,
  };

  ChunkAssembler() = default;

  ChunkAssembler(const ChunkAssembler&) = delete;
  ChunkAssembler& operator=(const ChunkAssembler&) = delete;

  // Applies the next chunk of the stream. Returns the completed row when the
  // chunk commits one.
  std::optional<Row> apply(CellChunk chunk);

  // Signals a clean end of the chunk stream. Raises a protocol violation if a
  // row is still being assembled.
  void finish() const;

  State state() const;

  // Key of the last committed row, empty if none was committed yet.
  const std::string& lastRowKey() const {
    return lastRowKey_;
  }

  uint64_t chunkCount() const {
    return chunkCount_;
  }

  uint64_t rowCount() const {
    return rowCount_;
  }

  uint64_t valueBytes() const {
    return valueBytes_;
  }

 private:
  struct PartialCell {
    int64_t timestampMicros;
    std::vector<std::string> labels;
    std::string value;
    // Declared total size of a split value, zero if the value isn't split.
    uint32_t declaredSize{0};
  };

  struct PartialRow {
    std::string key;
    std::vector<Family> families;
    std::optional<std::string> family;
    std::optional<std::string> qualifier;
  };

  struct AwaitingNewRow {};

  struct RowInProgress {
    PartialRow row;
  };

  struct CellInProgress {
    PartialRow row;
    PartialCell cell;
  };

  void startRow(std::string rowKey);
  void startCell(CellChunk& chunk);
  void appendValue(std::string_view bytes, uint32_t valueSize);
  void finishCell();
  Row commitRow();
  void resetRow(const CellChunk& chunk);

  const std::string& currentRowKey() const;

  std::variant<AwaitingNewRow, RowInProgress, CellInProgress> state_;
  std::string lastRowKey_;
  uint64_t chunkCount_{0};
  uint64_t rowCount_{0};
  uint64_t valueBytes_{0};
};

std::string_view toString(ChunkAssembler::State state);

} // namespace facebook::rowstream

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
#include "dwio/rowstream/chunk/ChunkAssembler.h"

#include <folly/String.h>

#include <algorithm>

#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream {

namespace {

std::string escaped(std::string_view key) {
  return folly::cEscape<std::string>(key);
}

// Finds the cell list of |qualifier| in |family|, creating the family and
// column at the end of their lists when they are new.
std::vector<Cell>& columnCells(
    std::vector<Family>& families,
    const std::string& family,
    const std::string& qualifier) {
  auto familyIt = std::find_if(
      families.rbegin(), families.rend(), [&](const Family& candidate) {
        return candidate.name == family;
      });
  Family* target;
  if (familyIt == families.rend()) {
    target = &families.emplace_back(Family{.name = family});
  } else {
    target = &*familyIt;
  }

  auto& columns = target->columns;
  auto columnIt = std::find_if(
      columns.rbegin(), columns.rend(), [&](const Column& candidate) {
        return candidate.qualifier == qualifier;
      });
  if (columnIt == columns.rend()) {
    return columns.emplace_back(Column{.qualifier = qualifier}).cells;
  }
  return columnIt->cells;
}

} // namespace

std::optional<Row> ChunkAssembler::apply(CellChunk chunk) {
  ++chunkCount_;

  if (chunk.resetRow) {
    resetRow(chunk);
    return std::nullopt;
  }

  // Every chunk has to move the assembly forward: start a row, start a cell,
  // add value bytes or commit.
  bool advanced = chunk.commitRow;

  if (std::holds_alternative<AwaitingNewRow>(state_)) {
    ROWSTREAM_PROTOCOL_CHECK(
        !chunk.rowKey.empty(),
        "First chunk of a row must carry a row key: {}",
        chunk.toString());
    startRow(std::move(chunk.rowKey));
    advanced = true;
  } else if (!chunk.rowKey.empty()) {
    ROWSTREAM_PROTOCOL_CHECK(
        chunk.rowKey == currentRowKey(),
        "Row key changed from '{}' to '{}' without a commit",
        escaped(currentRowKey()),
        escaped(chunk.rowKey));
  }

  if (std::holds_alternative<CellInProgress>(state_)) {
    ROWSTREAM_PROTOCOL_CHECK(
        !chunk.familyName.has_value() && !chunk.qualifier.has_value() &&
            chunk.timestampMicros == 0 && chunk.labels.empty(),
        "Continuation of a split value must only carry value bytes: {}",
        chunk.toString());
    ROWSTREAM_PROTOCOL_CHECK(
        !chunk.value.empty(),
        "Continuation of a split value carries no bytes: {}",
        chunk.toString());
    appendValue(chunk.value, chunk.valueSize);
    advanced = true;
  } else if (chunk.hasCellData()) {
    startCell(chunk);
    advanced = true;
  }

  ROWSTREAM_PROTOCOL_CHECK(
      advanced,
      "Chunk does not advance the assembly of row '{}': {}",
      escaped(currentRowKey()),
      chunk.toString());

  if (chunk.commitRow) {
    return commitRow();
  }
  return std::nullopt;
}

void ChunkAssembler::finish() const {
  ROWSTREAM_PROTOCOL_CHECK(
      std::holds_alternative<AwaitingNewRow>(state_),
      "Stream ended while row '{}' was still in progress ({})",
      escaped(currentRowKey()),
      toString(state()));
}

ChunkAssembler::State ChunkAssembler::state() const {
  if (std::holds_alternative<RowInProgress>(state_)) {
    return State::RowInProgress;
  }
  if (std::holds_alternative<CellInProgress>(state_)) {
    return State::CellInProgress;
  }
  return State::AwaitingNewRow;
}

const std::string& ChunkAssembler::currentRowKey() const {
  static const std::string kNoRow;
  if (const auto* row = std::get_if<RowInProgress>(&state_)) {
    return row->row.key;
  }
  if (const auto* cell = std::get_if<CellInProgress>(&state_)) {
    return cell->row.key;
  }
  return kNoRow;
}

void ChunkAssembler::startRow(std::string rowKey) {
  ROWSTREAM_PROTOCOL_CHECK(
      lastRowKey_.empty() || rowKey > lastRowKey_,
      "Row keys must be strictly increasing, got '{}' after '{}'",
      escaped(rowKey),
      escaped(lastRowKey_));
  state_ = RowInProgress{PartialRow{.key = std::move(rowKey)}};
}

void ChunkAssembler::startCell(CellChunk& chunk) {
  auto& row = std::get<RowInProgress>(state_).row;

  if (chunk.familyName.has_value()) {
    ROWSTREAM_PROTOCOL_CHECK(
        chunk.qualifier.has_value(),
        "A new column family must come with a qualifier: {}",
        chunk.toString());
    row.family = std::move(*chunk.familyName);
  }
  if (chunk.qualifier.has_value()) {
    ROWSTREAM_PROTOCOL_CHECK(
        row.family.has_value(),
        "Qualifier without a column family: {}",
        chunk.toString());
    row.qualifier = std::move(*chunk.qualifier);
  }
  ROWSTREAM_PROTOCOL_CHECK(
      row.qualifier.has_value(),
      "Cell of row '{}' has no column: {}",
      escaped(row.key),
      chunk.toString());

  PartialCell cell{
      .timestampMicros = chunk.timestampMicros,
      .labels = std::move(chunk.labels),
  };
  state_ = CellInProgress{std::move(row), std::move(cell)};
  appendValue(chunk.value, chunk.valueSize);
}

void ChunkAssembler::appendValue(std::string_view bytes, uint32_t valueSize) {
  auto& cell = std::get<CellInProgress>(state_).cell;

  if (valueSize > 0) {
    if (cell.declaredSize == 0) {
      cell.declaredSize = valueSize;
      cell.value.reserve(valueSize);
    } else {
      ROWSTREAM_PROTOCOL_CHECK(
          valueSize == cell.declaredSize,
          "Declared value size changed from {} to {} within a cell",
          cell.declaredSize,
          valueSize);
    }
  }

  cell.value.append(bytes);
  valueBytes_ += bytes.size();

  if (cell.declaredSize > 0) {
    ROWSTREAM_PROTOCOL_CHECK(
        cell.value.size() <= cell.declaredSize,
        "Split value has {} bytes, more than the {} declared",
        cell.value.size(),
        cell.declaredSize);
    if (valueSize == 0) {
      // The last piece of a split value must complete it exactly.
      ROWSTREAM_PROTOCOL_CHECK(
          cell.value.size() == cell.declaredSize,
          "Split value ended with {} bytes, {} declared",
          cell.value.size(),
          cell.declaredSize);
    } else if (cell.value.size() < cell.declaredSize) {
      return;
    }
  }
  finishCell();
}

void ChunkAssembler::finishCell() {
  auto& inProgress = std::get<CellInProgress>(state_);
  auto& row = inProgress.row;
  auto& cell = inProgress.cell;
  columnCells(row.families, *row.family, *row.qualifier)
      .emplace_back(
          cell.timestampMicros, std::move(cell.value), std::move(cell.labels));
  state_ = RowInProgress{std::move(row)};
}

Row ChunkAssembler::commitRow() {
  ROWSTREAM_PROTOCOL_CHECK(
      !std::holds_alternative<CellInProgress>(state_),
      "Commit of row '{}' with an incomplete cell value ({} of {} bytes)",
      escaped(currentRowKey()),
      std::get<CellInProgress>(state_).cell.value.size(),
      std::get<CellInProgress>(state_).cell.declaredSize);

  auto& row = std::get<RowInProgress>(state_).row;
  lastRowKey_ = row.key;
  Row committed{std::move(row.key), std::move(row.families)};
  state_ = AwaitingNewRow{};
  ++rowCount_;
  return committed;
}

void ChunkAssembler::resetRow(const CellChunk& chunk) {
  ROWSTREAM_PROTOCOL_CHECK(
      !std::holds_alternative<AwaitingNewRow>(state_),
      "Reset with no row in progress");
  ROWSTREAM_PROTOCOL_CHECK(
      chunk.rowKey.empty() && !chunk.hasCellData() && !chunk.commitRow,
      "Reset chunk must not carry any other field: {}",
      chunk.toString());
  VLOG(1) << "Discarding row '" << escaped(currentRowKey()) << "' on reset";
  state_ = AwaitingNewRow{};
}

std::string_view toString(ChunkAssembler::State state) {
  switch (state) {
    case ChunkAssembler::State::AwaitingNewRow:
      return "AWAITING_NEW_ROW";
    case ChunkAssembler::State::RowInProgress:
      return "ROW_IN_PROGRESS";
    case ChunkAssembler::State::CellInProgress:
      return "CELL_IN_PROGRESS";
  }
  ROWSTREAM_UNREACHABLE(
      "Unknown assembler state {}", static_cast<int>(state));
}

} // namespace facebook::rowstream

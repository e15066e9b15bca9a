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
#include <vector>

// Wire level records of a streaming row read. A response carries a batch of
// chunks; chunks carry (parts of) cells. Neither of them owns any state that
// spans more than one chunk.

namespace facebook::rowstream {

struct CellChunk {
  // Empty when the chunk does not start a new row.
  std::string rowKey;

  // Set when the chunk moves the assembler to a new column family. A new
  // family always comes with a qualifier.
  std::optional<std::string> familyName;

  // Set when the chunk moves the assembler to a new column.
  std::optional<std::string> qualifier;

  int64_t timestampMicros{0};
  std::vector<std::string> labels;

  // Value bytes. Possibly only a piece of the cell value.
  std::string value;

  // Total size of a value split across several chunks. Zero on the last (or
  // only) chunk of a cell.
  uint32_t valueSize{0};

  bool resetRow{false};
  bool commitRow{false};

  // True if the chunk carries any cell level field.
  bool hasCellData() const {
    return familyName.has_value() || qualifier.has_value() ||
        timestampMicros != 0 || !labels.empty() || !value.empty() ||
        valueSize != 0;
  }

  std::string toString() const;

  bool operator==(const CellChunk& other) const = default;
};

struct ReadRowsResponse {
  std::vector<CellChunk> chunks;

  // Server side progress marker. When set, all rows up to and including this
  // key have been scanned, even if none of them was returned.
  std::string lastScannedRowKey;

  bool operator==(const ReadRowsResponse& other) const = default;
};

} // namespace facebook::rowstream

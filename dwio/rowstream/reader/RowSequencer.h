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
#include <deque>
#include <optional>
#include <string>

#include "dwio/rowstream/chunk/ChunkAssembler.h"
#include "dwio/rowstream/chunk/Row.h"
#include "dwio/rowstream/reader/ReadRowsTransport.h"

// The RowSequencer turns the responses of one open stream into rows for the
// caller, one at a time.
//
// Responses are only read when the caller asks for a row and every chunk
// received so far has been consumed. Between two calls to next() the stream
// is paused, so nothing is buffered on behalf of a slow consumer.
//
// On top of the per attempt checks done by the ChunkAssembler, the sequencer
// enforces the guarantees that hold for the whole logical read: row keys are
// strictly increasing across attempts, and no more than the requested number
// of rows is delivered.

namespace facebook::rowstream {

class RowSequencer {
 public:
  // |lastKey| is the last row key the logical read already moved past (empty
  // if none). |remainingLimit| is the number of rows still allowed, no limit
  // when std::nullopt.
  RowSequencer(
      ReadRowsStream& stream,
      std::string lastKey,
      std::optional<uint64_t> remainingLimit);

  // Returns the next committed row. std::nullopt once the limit is reached or
  // the stream ended. Raises protocol violations and transport errors.
  std::optional<Row> next();

  bool limitReached() const {
    return remainingLimit_.has_value() && *remainingLimit_ == 0;
  }

  // The key the read resumes after: the last delivered row, or the last
  // scanned key reported by the server if that is greater.
  const std::string& lastKey() const {
    return lastKey_;
  }

  std::optional<uint64_t> remainingLimit() const {
    return remainingLimit_;
  }

  uint64_t responseCount() const {
    return responseCount_;
  }

  const ChunkAssembler& assembler() const {
    return assembler_;
  }

 private:
  // Pulls the next response into the pending chunk queue. Returns false at
  // the end of the stream.
  bool readResponse();

  void applyScannedKey();

  ReadRowsStream& stream_;
  ChunkAssembler assembler_;
  std::deque<CellChunk> pending_;
  std::string pendingScannedKey_;
  std::string lastKey_;
  std::optional<uint64_t> remainingLimit_;
  uint64_t responseCount_{0};
  bool paused_{false};
  bool endOfStream_{false};
};

} // namespace facebook::rowstream

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
#include "dwio/rowstream/reader/RowSequencer.h"

#include <folly/String.h>
#include <glog/logging.h>

#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream {

namespace {

std::string escaped(std::string_view key) {
  return folly::cEscape<std::string>(key);
}

} // namespace

RowSequencer::RowSequencer(
    ReadRowsStream& stream,
    std::string lastKey,
    std::optional<uint64_t> remainingLimit)
    : stream_{stream},
      lastKey_{std::move(lastKey)},
      remainingLimit_{remainingLimit} {}

std::optional<Row> RowSequencer::next() {
  while (!limitReached()) {
    if (pending_.empty()) {
      applyScannedKey();
      if (endOfStream_ || !readResponse()) {
        assembler_.finish();
        return std::nullopt;
      }
      continue;
    }

    auto chunk = std::move(pending_.front());
    pending_.pop_front();
    auto row = assembler_.apply(std::move(chunk));
    if (!row) {
      continue;
    }

    ROWSTREAM_PROTOCOL_CHECK(
        lastKey_.empty() || row->key() > lastKey_,
        "Row '{}' is not after '{}', already delivered or scanned",
        escaped(row->key()),
        escaped(lastKey_));
    lastKey_ = row->key();
    if (remainingLimit_) {
      --*remainingLimit_;
    }
    if (!paused_) {
      stream_.pause();
      paused_ = true;
    }
    return row;
  }
  return std::nullopt;
}

bool RowSequencer::readResponse() {
  if (paused_) {
    stream_.resume();
    paused_ = false;
  }
  auto response = stream_.read();
  if (!response) {
    endOfStream_ = true;
    return false;
  }
  ++responseCount_;
  for (auto& chunk : response->chunks) {
    pending_.push_back(std::move(chunk));
  }
  pendingScannedKey_ = std::move(response->lastScannedRowKey);
  return true;
}

void RowSequencer::applyScannedKey() {
  if (pendingScannedKey_.empty()) {
    return;
  }
  auto scannedKey = std::move(pendingScannedKey_);
  pendingScannedKey_.clear();

  ROWSTREAM_PROTOCOL_CHECK(
      assembler_.state() == ChunkAssembler::State::AwaitingNewRow,
      "Last scanned row key '{}' reported in the middle of row assembly",
      escaped(scannedKey));
  ROWSTREAM_PROTOCOL_CHECK(
      lastKey_.empty() || scannedKey >= lastKey_,
      "Last scanned row key went backwards from '{}' to '{}'",
      escaped(lastKey_),
      escaped(scannedKey));
  VLOG(2) << "Server scanned up to '" << escaped(scannedKey) << "'";
  lastKey_ = std::move(scannedKey);
}

} // namespace facebook::rowstream

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

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "dwio/rowstream/chunk/CellChunk.h"
#include "dwio/rowstream/reader/ReadRowsRequest.h"

namespace facebook::rowstream {

// Per attempt parameters handed to the transport along with the request.
struct AttemptContext {
  // 1 for the first attempt of a session.
  uint32_t attempt;
  // When set, the transport fails the attempt with DEADLINE_EXCEEDED once
  // this much time has passed since the stream was opened.
  std::optional<std::chrono::milliseconds> timeout;
};

// One open server stream of read rows responses.
//
// read() is only ever called from the thread consuming rows. cancel() may be
// called from any thread, and must unblock a pending read().
class ReadRowsStream {
 public:
  virtual ~ReadRowsStream() = default;

  // Blocks until the next response arrives. Returns std::nullopt once the
  // server closed the stream successfully. Transport failures are raised as
  // RowStreamExternalError, see throwTransportError().
  virtual std::optional<ReadRowsResponse> read() = 0;

  // The consumer has no room for more rows. The stream must not buffer
  // responses ahead of read() until resume() is called.
  virtual void pause() = 0;

  virtual void resume() = 0;

  // Abandons the stream. A blocked or later read() returns std::nullopt.
  virtual void cancel() = 0;
};

// Opens read rows streams against the service.
class ReadRowsTransport {
 public:
  virtual ~ReadRowsTransport() = default;

  // May raise the same errors as ReadRowsStream::read().
  virtual std::unique_ptr<ReadRowsStream> readRows(
      const ReadRowsRequest& request,
      const AttemptContext& context) = 0;
};

// Raises the RowStreamExternalError a transport reports a failure with.
// Whether it is retryable follows from |errorCode|.
[[noreturn]] void throwTransportError(
    std::string_view errorCode,
    std::string_view message);

} // namespace facebook::rowstream

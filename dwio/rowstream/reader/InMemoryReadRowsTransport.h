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

#include <folly/Synchronized.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dwio/rowstream/reader/ReadRowsTransport.h"

namespace facebook::rowstream {

struct TransportFailure {
  std::string errorCode;
  std::string message;
};

// What the server does on one attempt.
struct ScriptedAttempt {
  std::vector<ReadRowsResponse> responses;
  // Raised once every response was read. The stream ends cleanly when unset.
  std::optional<TransportFailure> failure;
  // Raised by readRows() before any response is sent.
  std::optional<TransportFailure> openFailure;
  // Once the responses are out, block until the stream is cancelled or the
  // attempt timeout expires.
  bool hang{false};
};

// What the client did with one stream.
struct StreamRecord {
  ReadRowsRequest request;
  AttemptContext context;
  uint64_t responsesRead{0};
  uint32_t pauseCount{0};
  uint32_t resumeCount{0};
  // read() calls made while the stream was paused.
  uint32_t readsWhilePaused{0};
  bool paused{false};
  bool cancelled{false};
};

// A transport serving canned responses, one ScriptedAttempt per readRows()
// call. Used to replay recorded reads and in tests.
class InMemoryReadRowsTransport : public ReadRowsTransport {
 public:
  explicit InMemoryReadRowsTransport(std::vector<ScriptedAttempt> attempts);

  std::unique_ptr<ReadRowsStream> readRows(
      const ReadRowsRequest& request,
      const AttemptContext& context) override;

  std::vector<StreamRecord> streams() const;

  std::vector<ReadRowsRequest> requests() const;

 private:
  class Stream;

  struct Script {
    std::vector<ScriptedAttempt> attempts;
    std::vector<StreamRecord> streams;
  };

  const std::shared_ptr<folly::Synchronized<Script>> script_;
};

} // namespace facebook::rowstream

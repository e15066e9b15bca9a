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

#include <folly/json/dynamic.h>

#include <ostream>
#include <string>
#include <vector>

#include "dwio/rowstream/reader/InMemoryReadRowsTransport.h"
#include "dwio/rowstream/reader/ReadOptions.h"
#include "dwio/rowstream/reader/ReadRowsRequest.h"
#include "dwio/rowstream/reader/ReadSession.h"

namespace facebook::rowstream::tools {

// A recorded read: the request issued by the caller and what the server did
// on each attempt.
//
// {
//   "request": {"table": "t", "rows_limit": 10, "keys": ["a"],
//               "ranges": [{"start": "b", "start_closed": true, "end": "c"}],
//               "prefix": "p", "filter": "...", "app_profile": "..."},
//   "attempts": [{"responses": [...], "error": {"code": "UNAVAILABLE",
//                 "message": "..."}, "fail_on_open": false, "hang": false}]
// }
struct Scenario {
  ReadRowsRequest request;
  std::vector<ScriptedAttempt> attempts;

  static Scenario fromJson(const folly::dynamic& obj);
  static Scenario fromFile(const std::string& path);
};

class RowStreamDumpLib {
 public:
  RowStreamDumpLib(std::ostream& ostream, Scenario scenario);

  // Replays the scenario through a read session and prints every delivered
  // row, one per line. Returns the state the session ended in.
  ReadSession::State emitRows(ReadOptions options, bool json = false);

  // Prints the request of every attempt issued by the last emitRows().
  void emitRequests(bool json = false);

 private:
  std::ostream& ostream_;
  const Scenario scenario_;
  std::shared_ptr<InMemoryReadRowsTransport> transport_;
};

folly::dynamic serialize(const ReadRowsRequest& request);

} // namespace facebook::rowstream::tools

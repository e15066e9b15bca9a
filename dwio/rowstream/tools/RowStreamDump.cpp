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
#include <folly/init/Init.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <iostream>

#include "dwio/rowstream/common/Config.h"
#include "dwio/rowstream/common/RowStreamException.h"
#include "dwio/rowstream/tools/RowStreamDumpLib.h"

DEFINE_bool(json, false, "Print rows and requests as JSON, one per line.");
DEFINE_bool(
    requests,
    false,
    "After the rows, print the request sent on every attempt.");

using namespace facebook;

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "Replays a recorded read rows scenario.\n"
      "Usage: rowstream_dump [--json] [--requests] <scenario.json>\n"
      "Retry behavior is set with the --rowstream_* flags.");
  folly::Init init{&argc, &argv};

  if (argc != 2) {
    std::cerr << gflags::ProgramUsage() << std::endl;
    return 2;
  }

  try {
    rowstream::tools::RowStreamDumpLib dump{
        std::cout, rowstream::tools::Scenario::fromFile(argv[1])};
    auto state = dump.emitRows(
        rowstream::ReadOptions::fromConfig(*rowstream::Config::fromFlags()),
        FLAGS_json);
    if (FLAGS_requests) {
      dump.emitRequests(FLAGS_json);
    }
    return state == rowstream::ReadSession::State::Done ? 0 : 1;
  } catch (const rowstream::RowStreamUserError& e) {
    LOG(ERROR) << e.errorMessage();
    return 2;
  }
}

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
#include "dwio/rowstream/tools/RowStreamDumpLib.h"

#include <folly/FileUtil.h>
#include <folly/json/json.h>

#include "dwio/rowstream/chunk/JsonCodec.h"
#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream::tools {

namespace {

const folly::dynamic* member(
    const folly::dynamic& obj,
    std::string_view name,
    folly::dynamic::Type type) {
  const auto* value =
      obj.get_ptr(folly::StringPiece{name.data(), name.size()});
  if (value == nullptr || value->isNull()) {
    return nullptr;
  }
  ROWSTREAM_USER_CHECK(
      value->type() == type,
      "Scenario field '{}' has type {}, expected {}",
      name,
      value->typeName(),
      folly::dynamic::typeName(type));
  return value;
}

std::string stringMember(const folly::dynamic& obj, std::string_view name) {
  const auto* value = member(obj, name, folly::dynamic::STRING);
  return value == nullptr ? std::string{} : value->getString();
}

bool boolMember(const folly::dynamic& obj, std::string_view name) {
  const auto* value = member(obj, name, folly::dynamic::BOOL);
  return value != nullptr && value->getBool();
}

RowRange parseRange(const folly::dynamic& obj) {
  ROWSTREAM_USER_CHECK(obj.isObject(), "A row range must be a JSON object.");
  std::optional<RowRange::Bound> start;
  std::optional<RowRange::Bound> end;
  if (const auto* key = member(obj, "start", folly::dynamic::STRING)) {
    start = RowRange::Bound{
        .key = key->getString(), .closed = boolMember(obj, "start_closed")};
  }
  if (const auto* key = member(obj, "end", folly::dynamic::STRING)) {
    end = RowRange::Bound{
        .key = key->getString(), .closed = boolMember(obj, "end_closed")};
  }
  return RowRange{std::move(start), std::move(end)};
}

ReadRowsRequest parseRequest(const folly::dynamic& obj) {
  ROWSTREAM_USER_CHECK(obj.isObject(), "The request must be a JSON object.");
  ReadRowsRequest request{
      .tableName = stringMember(obj, "table"),
      .appProfileId = stringMember(obj, "app_profile"),
      .filter = stringMember(obj, "filter"),
  };
  if (const auto* limit = member(obj, "rows_limit", folly::dynamic::INT64)) {
    ROWSTREAM_USER_CHECK_GE(
        limit->getInt(), 0, "Row limit must not be negative.");
    request.rowsLimit = static_cast<uint64_t>(limit->getInt());
  }
  if (const auto* keys = member(obj, "keys", folly::dynamic::ARRAY)) {
    for (const auto& key : *keys) {
      ROWSTREAM_USER_CHECK(key.isString(), "Row keys must be strings.");
      request.rowSet.addKey(key.getString());
    }
  }
  if (const auto* ranges = member(obj, "ranges", folly::dynamic::ARRAY)) {
    for (const auto& range : *ranges) {
      request.rowSet.addRange(parseRange(range));
    }
  }
  if (const auto* prefix = member(obj, "prefix", folly::dynamic::STRING)) {
    request.rowSet.addRange(RowRange::prefix(prefix->getString()));
  }
  return request;
}

ScriptedAttempt parseAttempt(const folly::dynamic& obj) {
  ROWSTREAM_USER_CHECK(obj.isObject(), "An attempt must be a JSON object.");
  ScriptedAttempt attempt{.hang = boolMember(obj, "hang")};
  if (const auto* responses =
          member(obj, "responses", folly::dynamic::ARRAY)) {
    for (const auto& response : *responses) {
      attempt.responses.push_back(json::deserializeResponse(response));
    }
  }
  if (const auto* error = member(obj, "error", folly::dynamic::OBJECT)) {
    TransportFailure failure{
        .errorCode = stringMember(*error, "code"),
        .message = stringMember(*error, "message"),
    };
    ROWSTREAM_USER_CHECK(
        !failure.errorCode.empty(), "Attempt error is missing its code.");
    if (boolMember(obj, "fail_on_open")) {
      attempt.openFailure = std::move(failure);
    } else {
      attempt.failure = std::move(failure);
    }
  }
  return attempt;
}

} // namespace

Scenario Scenario::fromJson(const folly::dynamic& obj) {
  ROWSTREAM_USER_CHECK(obj.isObject(), "A scenario must be a JSON object.");
  const auto* request = obj.get_ptr("request");
  ROWSTREAM_USER_CHECK(request != nullptr, "Scenario has no request.");
  Scenario scenario{.request = parseRequest(*request)};
  if (const auto* attempts = member(obj, "attempts", folly::dynamic::ARRAY)) {
    for (const auto& attempt : *attempts) {
      scenario.attempts.push_back(parseAttempt(attempt));
    }
  }
  ROWSTREAM_USER_CHECK(
      !scenario.attempts.empty(), "Scenario has no attempts.");
  return scenario;
}

Scenario Scenario::fromFile(const std::string& path) {
  std::string content;
  ROWSTREAM_USER_CHECK(
      folly::readFile(path.c_str(), content),
      "Unable to read scenario file '{}'.",
      path);
  try {
    return fromJson(folly::parseJson(content));
  } catch (const std::runtime_error& e) {
    // folly::json::parse_error and folly::TypeError.
    ROWSTREAM_USER_FAIL("Invalid scenario file '{}': {}", path, e.what());
  }
}

folly::dynamic serialize(const ReadRowsRequest& request) {
  folly::dynamic obj = folly::dynamic::object("table", request.tableName)(
      "row_set", request.rowSet.toString())(
      "rows_limit", static_cast<int64_t>(request.rowsLimit));
  if (!request.appProfileId.empty()) {
    obj["app_profile"] = request.appProfileId;
  }
  if (!request.filter.empty()) {
    obj["filter"] = request.filter;
  }
  if (request.startAfterKey.has_value()) {
    obj["start_after_key"] = *request.startAfterKey;
  }
  return obj;
}

RowStreamDumpLib::RowStreamDumpLib(std::ostream& ostream, Scenario scenario)
    : ostream_{ostream}, scenario_{std::move(scenario)} {}

ReadSession::State RowStreamDumpLib::emitRows(ReadOptions options, bool json) {
  transport_ = std::make_shared<InMemoryReadRowsTransport>(scenario_.attempts);
  ReadSession session{transport_, scenario_.request, std::move(options)};
  try {
    while (auto row = session.next()) {
      if (json) {
        ostream_ << folly::toJson(json::serialize(*row)) << "\n";
      } else {
        ostream_ << row->toString() << "\n";
      }
    }
  } catch (const RowStreamException& e) {
    ostream_ << "Error " << e.errorCode() << ": " << e.errorMessage() << "\n";
  }
  ostream_ << "State: " << toString(session.state())
           << ", rows: " << session.rowCount()
           << ", attempts: " << session.attemptCount() << "\n";
  return session.state();
}

void RowStreamDumpLib::emitRequests(bool json) {
  ROWSTREAM_USER_CHECK(
      transport_ != nullptr, "No read was replayed, nothing to print.");
  const auto streams = transport_->streams();
  for (size_t i = 0; i < streams.size(); ++i) {
    if (json) {
      auto obj = serialize(streams[i].request);
      obj["attempt"] = static_cast<int64_t>(i);
      ostream_ << folly::toJson(obj) << "\n";
    } else {
      ostream_ << "Attempt " << i << ": " << streams[i].request.toString()
               << "\n";
    }
  }
}

} // namespace facebook::rowstream::tools

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
#include "dwio/rowstream/chunk/JsonCodec.h"

#include <limits>

#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream::json {

namespace {

const folly::dynamic* field(
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
      "Field '{}' has type {}, expected {}",
      name,
      value->typeName(),
      folly::dynamic::typeName(type));
  return value;
}

std::string stringField(const folly::dynamic& obj, std::string_view name) {
  const auto* value = field(obj, name, folly::dynamic::STRING);
  return value == nullptr ? std::string{} : value->getString();
}

std::vector<std::string> stringList(
    const folly::dynamic& obj,
    std::string_view name) {
  std::vector<std::string> result;
  if (const auto* list = field(obj, name, folly::dynamic::ARRAY)) {
    result.reserve(list->size());
    for (const auto& item : *list) {
      ROWSTREAM_USER_CHECK(
          item.isString(), "Field '{}' must only hold strings", name);
      result.push_back(item.getString());
    }
  }
  return result;
}

void requireObject(const folly::dynamic& obj, std::string_view what) {
  ROWSTREAM_USER_CHECK(
      obj.isObject(),
      "Expected a JSON object for {}, got {}",
      what,
      obj.typeName());
}

} // namespace

folly::dynamic serialize(const CellChunk& chunk) {
  folly::dynamic obj = folly::dynamic::object;
  if (!chunk.rowKey.empty()) {
    obj["row_key"] = chunk.rowKey;
  }
  if (chunk.familyName.has_value()) {
    obj["family_name"] = *chunk.familyName;
  }
  if (chunk.qualifier.has_value()) {
    obj["qualifier"] = *chunk.qualifier;
  }
  if (chunk.timestampMicros != 0) {
    obj["timestamp_micros"] = chunk.timestampMicros;
  }
  if (!chunk.labels.empty()) {
    obj["labels"] =
        folly::dynamic::array_range(chunk.labels.begin(), chunk.labels.end());
  }
  if (!chunk.value.empty()) {
    obj["value"] = chunk.value;
  }
  if (chunk.valueSize != 0) {
    obj["value_size"] = chunk.valueSize;
  }
  if (chunk.resetRow) {
    obj["reset_row"] = true;
  }
  if (chunk.commitRow) {
    obj["commit_row"] = true;
  }
  return obj;
}

folly::dynamic serialize(const ReadRowsResponse& response) {
  folly::dynamic chunks = folly::dynamic::array;
  for (const auto& chunk : response.chunks) {
    chunks.push_back(serialize(chunk));
  }
  folly::dynamic obj = folly::dynamic::object("chunks", std::move(chunks));
  if (!response.lastScannedRowKey.empty()) {
    obj["last_scanned_row_key"] = response.lastScannedRowKey;
  }
  return obj;
}

folly::dynamic serialize(const Row& row) {
  folly::dynamic families = folly::dynamic::array;
  for (const auto& family : row.families()) {
    folly::dynamic columns = folly::dynamic::array;
    for (const auto& column : family.columns) {
      folly::dynamic cells = folly::dynamic::array;
      for (const auto& cell : column.cells) {
        folly::dynamic entry = folly::dynamic::object(
            "timestamp_micros", cell.timestampMicros())("value", cell.value());
        if (!cell.labels().empty()) {
          entry["labels"] = folly::dynamic::array_range(
              cell.labels().begin(), cell.labels().end());
        }
        cells.push_back(std::move(entry));
      }
      columns.push_back(folly::dynamic::object("qualifier", column.qualifier)(
          "cells", std::move(cells)));
    }
    families.push_back(folly::dynamic::object("name", family.name)(
        "columns", std::move(columns)));
  }
  return folly::dynamic::object("key", row.key())(
      "families", std::move(families));
}

CellChunk deserializeChunk(const folly::dynamic& obj) {
  requireObject(obj, "a chunk");
  CellChunk chunk;
  chunk.rowKey = stringField(obj, "row_key");
  if (const auto* family = field(obj, "family_name", folly::dynamic::STRING)) {
    chunk.familyName = family->getString();
  }
  if (const auto* qualifier = field(obj, "qualifier", folly::dynamic::STRING)) {
    chunk.qualifier = qualifier->getString();
  }
  if (const auto* timestamp =
          field(obj, "timestamp_micros", folly::dynamic::INT64)) {
    chunk.timestampMicros = timestamp->getInt();
  }
  chunk.labels = stringList(obj, "labels");
  chunk.value = stringField(obj, "value");
  if (const auto* valueSize = field(obj, "value_size", folly::dynamic::INT64)) {
    ROWSTREAM_USER_CHECK(
        valueSize->getInt() >= 0 &&
            valueSize->getInt() <= std::numeric_limits<uint32_t>::max(),
        "Field 'value_size' out of range: {}",
        valueSize->getInt());
    chunk.valueSize = static_cast<uint32_t>(valueSize->getInt());
  }
  if (const auto* reset = field(obj, "reset_row", folly::dynamic::BOOL)) {
    chunk.resetRow = reset->getBool();
  }
  if (const auto* commit = field(obj, "commit_row", folly::dynamic::BOOL)) {
    chunk.commitRow = commit->getBool();
  }
  return chunk;
}

ReadRowsResponse deserializeResponse(const folly::dynamic& obj) {
  requireObject(obj, "a response");
  ReadRowsResponse response;
  if (const auto* chunks = field(obj, "chunks", folly::dynamic::ARRAY)) {
    response.chunks.reserve(chunks->size());
    for (const auto& chunk : *chunks) {
      response.chunks.push_back(deserializeChunk(chunk));
    }
  }
  response.lastScannedRowKey = stringField(obj, "last_scanned_row_key");
  return response;
}

Row deserializeRow(const folly::dynamic& obj) {
  requireObject(obj, "a row");
  std::vector<Family> families;
  if (const auto* list = field(obj, "families", folly::dynamic::ARRAY)) {
    for (const auto& familyObj : *list) {
      requireObject(familyObj, "a family");
      Family family{.name = stringField(familyObj, "name")};
      if (const auto* columns =
              field(familyObj, "columns", folly::dynamic::ARRAY)) {
        for (const auto& columnObj : *columns) {
          requireObject(columnObj, "a column");
          Column column{.qualifier = stringField(columnObj, "qualifier")};
          if (const auto* cells =
                  field(columnObj, "cells", folly::dynamic::ARRAY)) {
            for (const auto& cellObj : *cells) {
              requireObject(cellObj, "a cell");
              const auto* timestamp =
                  field(cellObj, "timestamp_micros", folly::dynamic::INT64);
              column.cells.emplace_back(
                  timestamp == nullptr ? 0 : timestamp->getInt(),
                  stringField(cellObj, "value"),
                  stringList(cellObj, "labels"));
            }
          }
          family.columns.push_back(std::move(column));
        }
      }
      families.push_back(std::move(family));
    }
  }
  return Row{stringField(obj, "key"), std::move(families)};
}

} // namespace facebook::rowstream::json

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

#include "dwio/rowstream/chunk/CellChunk.h"
#include "dwio/rowstream/chunk/Row.h"

// Conversions between the chunk level records and folly::dynamic, so that
// chunk streams can be captured and replayed as JSON. Field names follow the
// wire names (row_key, family_name, value_size...). Malformed input raises a
// RowStreamUserError.

namespace facebook::rowstream::json {

folly::dynamic serialize(const CellChunk& chunk);
folly::dynamic serialize(const ReadRowsResponse& response);
folly::dynamic serialize(const Row& row);

CellChunk deserializeChunk(const folly::dynamic& obj);
ReadRowsResponse deserializeResponse(const folly::dynamic& obj);
Row deserializeRow(const folly::dynamic& obj);

} // namespace facebook::rowstream::json

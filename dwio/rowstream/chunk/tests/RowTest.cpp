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
#include <gtest/gtest.h>

#include "dwio/rowstream/chunk/CellChunk.h"
#include "dwio/rowstream/chunk/Row.h"

namespace facebook::rowstream::test {

namespace {

Row sampleRow() {
  return Row{
      "user#1",
      {
          Family{
              .name = "cf",
              .columns =
                  {
                      Column{
                          .qualifier = "name",
                          .cells = {Cell{20, "bob", {}}, Cell{10, "rob", {}}}},
                      Column{
                          .qualifier = "age",
                          .cells = {Cell{20, "42", {"computed"}}}},
                  }},
          Family{
              .name = "meta",
              .columns = {Column{.qualifier = "x", .cells = {Cell{1, "", {}}}}}},
      }};
}

} // namespace

TEST(RowTest, Lookups) {
  auto row = sampleRow();
  EXPECT_EQ("user#1", row.key());
  EXPECT_FALSE(row.empty());
  EXPECT_EQ(4, row.cellCount());

  ASSERT_NE(nullptr, row.family("cf"));
  EXPECT_EQ(2, row.family("cf")->columns.size());
  EXPECT_EQ(nullptr, row.family("missing"));

  auto names = row.cells("cf", "name");
  ASSERT_EQ(2, names.size());
  EXPECT_EQ("bob", names[0].value());
  EXPECT_EQ(10, names[1].timestampMicros());

  EXPECT_TRUE(row.cells("cf", "missing").empty());
  EXPECT_TRUE(row.cells("missing", "name").empty());
  EXPECT_EQ(
      std::vector<std::string>{"computed"}, row.cells("cf", "age")[0].labels());
}

TEST(RowTest, EmptyRow) {
  Row row{"k", {}};
  EXPECT_TRUE(row.empty());
  EXPECT_EQ(0, row.cellCount());
  EXPECT_EQ("k:", row.toString());
}

TEST(RowTest, Equality) {
  EXPECT_EQ(sampleRow(), sampleRow());
  Row other{"user#2", sampleRow().families()};
  EXPECT_NE(sampleRow(), other);
}

TEST(RowTest, ToString) {
  Row row{
      "r\n1",
      {Family{
          .name = "f",
          .columns = {Column{
              .qualifier = "q", .cells = {Cell{5, "v", {"a", "b"}}}}}}}};
  EXPECT_EQ("r\\n1:\n  f:q @5 \"v\" [a,b]", row.toString());
}

TEST(CellChunkTest, HasCellData) {
  EXPECT_FALSE(CellChunk{}.hasCellData());
  EXPECT_FALSE((CellChunk{.rowKey = "r", .commitRow = true}.hasCellData()));
  EXPECT_TRUE(CellChunk{.qualifier = "q"}.hasCellData());
  EXPECT_TRUE(CellChunk{.timestampMicros = 3}.hasCellData());
  EXPECT_TRUE(CellChunk{.labels = {"l"}}.hasCellData());
  EXPECT_TRUE(CellChunk{.valueSize = 4}.hasCellData());
}

TEST(CellChunkTest, ToString) {
  CellChunk chunk{
      .rowKey = "r1",
      .familyName = "f",
      .qualifier = "q",
      .timestampMicros = 9,
      .value = "abcd",
      .valueSize = 10,
  };
  EXPECT_EQ(
      "{row_key: \"r1\", family: \"f\", qualifier: \"q\", timestamp: 9, "
      "value: 4 bytes, value_size: 10}",
      chunk.toString());
  EXPECT_EQ("{reset_row}", CellChunk{.resetRow = true}.toString());
}

} // namespace facebook::rowstream::test

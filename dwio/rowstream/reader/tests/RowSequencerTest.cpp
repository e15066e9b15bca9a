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
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "dwio/rowstream/common/tests/GTestUtils.h"
#include "dwio/rowstream/reader/RowSequencer.h"
#include "dwio/rowstream/reader/tests/MockReadRowsStream.h"
#include "dwio/rowstream/reader/tests/TestResponses.h"

namespace facebook::rowstream::test {

using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

std::vector<Row> drain(RowSequencer& sequencer) {
  std::vector<Row> rows;
  while (auto row = sequencer.next()) {
    rows.push_back(std::move(*row));
  }
  return rows;
}

} // namespace

TEST(RowSequencerTest, RowsInOrder) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(responseWithRows({"a", "b"})))
      .WillOnce(Return(responseWithRows({"c"})))
      .WillOnce(Return(std::nullopt));

  RowSequencer sequencer{stream, "", std::nullopt};
  auto rows = drain(sequencer);
  EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), keysOf(rows));
  EXPECT_EQ("c", sequencer.lastKey());
  EXPECT_EQ(2, sequencer.responseCount());
  EXPECT_FALSE(sequencer.limitReached());
  EXPECT_EQ(3, sequencer.assembler().rowCount());
}

TEST(RowSequencerTest, RowSplitAcrossResponses) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(ReadRowsResponse{.chunks = {CellChunk{
                                            .rowKey = "r1",
                                            .familyName = "f",
                                            .qualifier = "q",
                                            .value = "abcd",
                                            .valueSize = 10}}}))
      .WillOnce(Return(ReadRowsResponse{
          .chunks = {CellChunk{.value = "efgh", .valueSize = 10}}}))
      .WillOnce(Return(ReadRowsResponse{
          .chunks = {CellChunk{.value = "ij", .commitRow = true}}}))
      .WillOnce(Return(std::nullopt));

  RowSequencer sequencer{stream, "", std::nullopt};
  auto rows = drain(sequencer);
  ASSERT_EQ(1, rows.size());
  EXPECT_EQ("abcdefghij", rows[0].cells("f", "q")[0].value());
}

TEST(RowSequencerTest, LazyPull) {
  NiceMock<MockReadRowsStream> stream;
  RowSequencer sequencer{stream, "", std::nullopt};

  // Nothing is read before the first row is asked for, and a response is only
  // read once the previous one is consumed.
  {
    InSequence seq;
    EXPECT_CALL(stream, read).WillOnce(Return(responseWithRows({"a", "b"})));
    EXPECT_CALL(stream, pause);
  }
  ASSERT_TRUE(sequencer.next().has_value());
  ::testing::Mock::VerifyAndClearExpectations(&stream);

  EXPECT_CALL(stream, read).Times(0);
  ASSERT_EQ("b", sequencer.next()->key());
  ::testing::Mock::VerifyAndClearExpectations(&stream);

  {
    InSequence seq;
    EXPECT_CALL(stream, resume);
    EXPECT_CALL(stream, read).WillOnce(Return(std::nullopt));
  }
  EXPECT_FALSE(sequencer.next().has_value());
}

TEST(RowSequencerTest, Limit) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(responseWithRows({"a", "b", "c", "d", "e"})));

  RowSequencer sequencer{stream, "", 2};
  auto rows = drain(sequencer);
  EXPECT_EQ((std::vector<std::string>{"a", "b"}), keysOf(rows));
  EXPECT_TRUE(sequencer.limitReached());
  EXPECT_EQ(0, sequencer.remainingLimit().value());
  // Further calls don't touch the stream.
  EXPECT_FALSE(sequencer.next().has_value());
}

TEST(RowSequencerTest, ZeroRemainingLimit) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read).Times(0);
  RowSequencer sequencer{stream, "", 0};
  EXPECT_FALSE(sequencer.next().has_value());
}

TEST(RowSequencerTest, RowAtOrBeforeLastKey) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read).WillOnce(Return(responseWithRows({"b"})));

  RowSequencer sequencer{stream, "b", std::nullopt};
  ROWSTREAM_ASSERT_THROW_CODE(sequencer.next(), error_code::ProtocolViolation);
}

TEST(RowSequencerTest, LastScannedRowKey) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(responseWithRows({"a"})))
      .WillOnce(Return(scannedUpTo("m")))
      .WillOnce(Return(responseWithRows({"n"})))
      .WillOnce(Return(std::nullopt));

  RowSequencer sequencer{stream, "", std::nullopt};
  ASSERT_EQ("a", sequencer.next()->key());
  EXPECT_EQ("a", sequencer.lastKey());
  ASSERT_EQ("n", sequencer.next()->key());
  EXPECT_FALSE(sequencer.next().has_value());
  EXPECT_EQ("n", sequencer.lastKey());
}

TEST(RowSequencerTest, ScannedKeyMovesResumePoint) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(responseWithRows({"a"})))
      .WillOnce(Return(scannedUpTo("m")))
      .WillOnce(Return(std::nullopt));

  RowSequencer sequencer{stream, "", std::nullopt};
  ASSERT_EQ("a", sequencer.next()->key());
  EXPECT_FALSE(sequencer.next().has_value());
  EXPECT_EQ("m", sequencer.lastKey());
}

TEST(RowSequencerTest, RowBeforeScannedKey) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(scannedUpTo("m")))
      .WillOnce(Return(responseWithRows({"c"})));

  RowSequencer sequencer{stream, "", std::nullopt};
  ROWSTREAM_ASSERT_THROW(sequencer.next(), "is not after 'm'");
}

TEST(RowSequencerTest, ScannedKeyGoingBackwards) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read).WillOnce(Return(scannedUpTo("a")));

  RowSequencer sequencer{stream, "c", std::nullopt};
  ROWSTREAM_ASSERT_THROW(
      sequencer.next(), "Last scanned row key went backwards from 'c' to 'a'");
}

TEST(RowSequencerTest, EndOfStreamMidRow) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(ReadRowsResponse{.chunks = {CellChunk{
                                            .rowKey = "r1",
                                            .familyName = "f",
                                            .qualifier = "q",
                                            .value = "v"}}}))
      .WillOnce(Return(std::nullopt));

  RowSequencer sequencer{stream, "", std::nullopt};
  ROWSTREAM_ASSERT_THROW(sequencer.next(), "Stream ended while row 'r1'");
}

TEST(RowSequencerTest, TransportErrorPropagates) {
  NiceMock<MockReadRowsStream> stream;
  EXPECT_CALL(stream, read)
      .WillOnce(Return(responseWithRows({"a"})))
      .WillOnce([]() -> std::optional<ReadRowsResponse> {
        throwTransportError("UNAVAILABLE", "connection lost");
      });

  RowSequencer sequencer{stream, "", std::nullopt};
  ASSERT_EQ("a", sequencer.next()->key());
  ROWSTREAM_ASSERT_THROW(sequencer.next(), "connection lost");
  EXPECT_EQ("a", sequencer.lastKey());
}

} // namespace facebook::rowstream::test

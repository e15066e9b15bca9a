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
#include <folly/Conv.h>
#include <folly/ExceptionString.h>
#include <gtest/gtest.h>

#include <thread>

#include "dwio/rowstream/common/Exceptions.h"

namespace facebook {
namespace {

template <typename T>
void verifyException(
    const T& e,
    const std::string& exceptionName,
    const std::string& fileName,
    const std::string& fileLine,
    const std::string& functionName,
    const std::string& failingExpression,
    const std::string& errorMessage,
    const std::string& errorSource,
    const std::string& errorCode,
    const std::string& retryable,
    const std::string& additionalMessage = "") {
  EXPECT_EQ(fileName, e.fileName());
  if (!fileLine.empty()) {
    EXPECT_EQ(fileLine, folly::to<std::string>(e.fileLine()));
  }
  EXPECT_EQ(functionName, e.functionName());
  EXPECT_EQ(failingExpression, e.failingExpression());
  EXPECT_EQ(errorMessage, e.errorMessage());
  EXPECT_EQ(errorSource, e.errorSource());
  EXPECT_EQ(errorCode, e.errorCode());
  EXPECT_EQ(retryable, e.retryable() ? "True" : "False");

  const std::string what = e.what();
  EXPECT_NE(what.find(exceptionName + "\n"), std::string::npos);
  EXPECT_NE(
      what.find("Error Source: " + errorSource + "\n"), std::string::npos);
  EXPECT_NE(what.find("Error Code: " + errorCode + "\n"), std::string::npos);
  if (!errorMessage.empty()) {
    EXPECT_NE(
        what.find("Error Message: " + errorMessage + "\n"), std::string::npos);
  }
  EXPECT_NE(what.find("Retryable: " + retryable + "\n"), std::string::npos);
  EXPECT_NE(
      what.find(
          "Location: " +
          folly::to<std::string>(functionName, '@', fileName, ':', fileLine)),
      std::string::npos);
  if (!failingExpression.empty()) {
    EXPECT_NE(
        what.find("Expression: " + failingExpression + "\n"),
        std::string::npos);
  }
  EXPECT_NE(what.find("Stack Trace:\n"), std::string::npos);

  if (!additionalMessage.empty()) {
    EXPECT_NE(what.find(additionalMessage), std::string::npos);
  }
}

TEST(ExceptionTests, format) {
  verifyException(
      rowstream::RowStreamUserError(
          "file1", 23, "func1", "expr1", "err1", "code1", true),
      "RowStreamUserError",
      "file1",
      "23",
      "func1",
      "expr1",
      "err1",
      "USER",
      "code1",
      "True");

  verifyException(
      rowstream::RowStreamInternalError(
          "file2", 24, "func2", "expr2", "err2", "code2", false),
      "RowStreamInternalError",
      "file2",
      "24",
      "func2",
      "expr2",
      "err2",
      "INTERNAL",
      "code2",
      "False");

  verifyException(
      rowstream::RowStreamExternalError(
          "file3", 25, "func3", "", "err3", "UNAVAILABLE", true, "SERVER"),
      "RowStreamExternalError",
      "file3",
      "25",
      "func3",
      "",
      "err3",
      "EXTERNAL",
      "UNAVAILABLE",
      "True",
      "External Source: SERVER\n");
}

TEST(ExceptionTests, check) {
  int a = 5;
  try {
    ROWSTREAM_CHECK(a < 3, "error message1");
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamInternalError& e) {
    verifyException(
        e,
        "RowStreamInternalError",
        __FILE__,
        "",
        "TestBody",
        "a < 3",
        "error message1",
        "INTERNAL",
        "INVALID_ARGUMENT",
        "False");
  }
}

TEST(ExceptionTests, protocolCheck) {
  std::string lastKey = "b";
  std::string key = "a";
  try {
    ROWSTREAM_PROTOCOL_CHECK(
        key > lastKey, "'{}' is not after '{}'", key, lastKey);
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamInternalError& e) {
    verifyException(
        e,
        "RowStreamInternalError",
        __FILE__,
        "",
        "TestBody",
        "key > lastKey",
        "'a' is not after 'b'",
        "INTERNAL",
        "PROTOCOL_VIOLATION",
        "False");
  }

  ROWSTREAM_PROTOCOL_CHECK(lastKey > key, "should not throw");
}

TEST(ExceptionTests, externalError) {
  try {
    ROWSTREAM_RAISE_EXTERNAL_ERROR(
        rowstream::error_code::Unavailable,
        true,
        rowstream::external_source::ReadRowsTransport,
        "server went away after {} responses",
        3);
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamExternalError& e) {
    verifyException(
        e,
        "RowStreamExternalError",
        __FILE__,
        "",
        "TestBody",
        "",
        "server went away after 3 responses",
        "EXTERNAL",
        "UNAVAILABLE",
        "True",
        "External Source: READ_ROWS_TRANSPORT\n");
    EXPECT_EQ("READ_ROWS_TRANSPORT", e.externalSource());
  }
}

TEST(ExceptionTests, unreachable) {
  try {
    ROWSTREAM_UNREACHABLE("error message");
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamInternalError& e) {
    verifyException(
        e,
        "RowStreamInternalError",
        __FILE__,
        "",
        "TestBody",
        "",
        "error message",
        "INTERNAL",
        "UNREACHABLE_CODE",
        "False");
  }
}

TEST(ExceptionTests, stackTraceThreads) {
  // Make sure captured stack trace doesn't need anything from thread local
  // storage
  std::exception_ptr e;
  auto throwFunc = []() { ROWSTREAM_CHECK(false, "Test."); };
  std::thread t([&]() {
    try {
      throwFunc();
    } catch (...) {
      e = std::current_exception();
    }
  });

  t.join();

  ASSERT_NE(nullptr, e);
  EXPECT_NE(
      std::string::npos,
      folly::exceptionStr(e).find(
          "facebook::rowstream::RowStreamException::RowStreamException"));
}

TEST(ExceptionTests, comparisonChecks) {
  size_t attempt = 4;
  size_t scripted = 3;
  try {
    ROWSTREAM_CHECK_LT(attempt, scripted, "No attempt {} scripted", attempt);
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamInternalError& e) {
    EXPECT_EQ("attempt < scripted", e.failingExpression());
    EXPECT_EQ("(4 vs. 3) No attempt 4 scripted", e.errorMessage());
    EXPECT_EQ("INVALID_ARGUMENT", e.errorCode());
  }

  double multiplier = 0.5;
  try {
    ROWSTREAM_USER_CHECK_GE(multiplier, 1.0);
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamUserError& e) {
    EXPECT_EQ("(0.5 vs. 1)", e.errorMessage());
    EXPECT_EQ("USER", e.errorSource());
  }

  try {
    ROWSTREAM_USER_CHECK_GT(0, 0, "At least one attempt.");
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamUserError& e) {
    EXPECT_EQ("(0 vs. 0) At least one attempt.", e.errorMessage());
  }

  ROWSTREAM_CHECK_LT(scripted, attempt);
  ROWSTREAM_USER_CHECK_GE(1.0, 1.0);
  ROWSTREAM_USER_CHECK_GT(2, 1);
}

TEST(ExceptionTests, nullCheck) {
  int* nullPtr = nullptr;
  try {
    ROWSTREAM_CHECK_NOT_NULL(nullPtr, "Transport opened no stream.");
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamInternalError& e) {
    EXPECT_EQ("(nullPtr) != nullptr", e.failingExpression());
    EXPECT_EQ("Transport opened no stream.", e.errorMessage());
  }
}

TEST(ExceptionTests, userFail) {
  try {
    ROWSTREAM_USER_FAIL("Invalid value '{}' for config '{}'", "x", "key");
    FAIL() << "Should have thrown";
  } catch (const rowstream::RowStreamUserError& e) {
    EXPECT_EQ("Invalid value 'x' for config 'key'", e.errorMessage());
    EXPECT_EQ("INVALID_ARGUMENT", e.errorCode());
    EXPECT_FALSE(e.retryable());
  }
}

} // namespace
} // namespace facebook

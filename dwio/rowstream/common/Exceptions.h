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

#include <fmt/ostream.h>
#include <glog/logging.h>

#include "dwio/rowstream/common/ExceptionHelper.h"
#include "dwio/rowstream/common/RowStreamException.h"
#include "folly/Likely.h"
#include "folly/Preprocessor.h"

// Standard errors used throughout the codebase.

namespace facebook::rowstream {

namespace detail {

// Struct containing the arguments needed to throw a rowstream exception
struct RowStreamCheckFailArgs {
  const char* file;
  size_t line;
  const char* function;
  const char* expression;
  std::string_view errorCode;
  bool isRetryable;
};

// Out-of-line rowStreamCheckFail implementations to reduce binary bloat
template <typename Exception, typename Msg>
[[noreturn]] void rowStreamCheckFail(
    const RowStreamCheckFailArgs& args,
    Msg msg) {
  throw Exception(
      args.file,
      args.line,
      args.function,
      args.expression,
      msg,
      args.errorCode,
      args.isRetryable);
}

// RowStreamCheckFailStringType helps us pass by reference to
// rowStreamCheckFail exactly when the string type is std::string.
template <typename T>
struct RowStreamCheckFailStringType;

template <>
struct RowStreamCheckFailStringType<CompileTimeEmptyString> {
  using type = CompileTimeEmptyString;
};

template <>
struct RowStreamCheckFailStringType<const char*> {
  using type = const char*;
};

template <>
struct RowStreamCheckFailStringType<std::string> {
  using type = const std::string&;
};

// Declare explicit instantiations of rowStreamCheckFail for the given
// exceptionType. Just the signatures go in this macro, not the definitions.
#define ROWSTREAM_DECLARE_CHECK_FAIL_TEMPLATES(exceptionType)             \
  namespace detail {                                                      \
  extern template void rowStreamCheckFail<exceptionType, const char*>(    \
      const RowStreamCheckFailArgs&,                                      \
      const char*);                                                       \
  extern template void                                                    \
  rowStreamCheckFail<exceptionType, const std::string&>(                  \
      const RowStreamCheckFailArgs&,                                      \
      const std::string&);                                                \
  extern template void                                                    \
  rowStreamCheckFail<exceptionType, CompileTimeEmptyString>(              \
      const RowStreamCheckFailArgs&,                                      \
      CompileTimeEmptyString);                                            \
  }

// Define explicit instantiations of rowStreamCheckFail for the given
// exceptionType. The actual template instantiations go in this macro.
#define ROWSTREAM_DEFINE_CHECK_FAIL_TEMPLATES(exceptionType)                \
  namespace detail {                                                        \
  template void rowStreamCheckFail<exceptionType, const char*>(             \
      const RowStreamCheckFailArgs&,                                        \
      const char*);                                                         \
  template void rowStreamCheckFail<exceptionType, const std::string&>(      \
      const RowStreamCheckFailArgs&,                                        \
      const std::string&);                                                  \
  template void rowStreamCheckFail<exceptionType, CompileTimeEmptyString>(  \
      const RowStreamCheckFailArgs&,                                        \
      CompileTimeEmptyString);                                              \
  }
} // namespace detail

// Declare template instantiations for common exception types
ROWSTREAM_DECLARE_CHECK_FAIL_TEMPLATES(
    ::facebook::rowstream::RowStreamUserError);
ROWSTREAM_DECLARE_CHECK_FAIL_TEMPLATES(
    ::facebook::rowstream::RowStreamInternalError);

// Base throw implementation
#define _ROWSTREAM_THROW_IMPL(exception, exprStr, errorCode, retryable, ...)  \
  do {                                                                        \
    /* GCC 9.2.1 doesn't accept this code with constexpr. */                  \
    static const ::facebook::rowstream::detail::RowStreamCheckFailArgs        \
        rowStreamCheckFailArgs = {                                            \
            __FILE__, __LINE__, __FUNCTION__, exprStr, errorCode, retryable}; \
    auto message = ::facebook::rowstream::errorMessage(__VA_ARGS__);          \
    ::facebook::rowstream::detail::rowStreamCheckFail<                        \
        exception,                                                            \
        typename ::facebook::rowstream::detail::RowStreamCheckFailStringType< \
            decltype(message)>::type>(rowStreamCheckFailArgs, message);       \
  } while (0)

#define ROWSTREAM_RAISE_USER_ERROR(expression, code, retryable, ...) \
  _ROWSTREAM_THROW_IMPL(                                             \
      ::facebook::rowstream::RowStreamUserError,                     \
      expression,                                                    \
      code,                                                          \
      retryable,                                                     \
      ##__VA_ARGS__)

#define ROWSTREAM_RAISE_INTERNAL_ERROR(expression, code, retryable, ...) \
  _ROWSTREAM_THROW_IMPL(                                                 \
      ::facebook::rowstream::RowStreamInternalError,                     \
      expression,                                                        \
      code,                                                              \
      retryable,                                                         \
      ##__VA_ARGS__)

// External errors carry the name of the failing dependency, so they don't go
// through the shared check fail templates.
#define ROWSTREAM_RAISE_EXTERNAL_ERROR(code, retryable, externalSource, ...) \
  throw ::facebook::rowstream::RowStreamExternalError(                       \
      __FILE__,                                                              \
      __LINE__,                                                              \
      __FUNCTION__,                                                          \
      "",                                                                    \
      ::facebook::rowstream::errorMessage(__VA_ARGS__),                      \
      code,                                                                  \
      retryable,                                                             \
      externalSource)

// Check internal preconditions and invariants
#define _ROWSTREAM_CHECK_AND_THROW_IMPL(                          \
    exprStr, expr, exception, errorCode, retryable, ...)          \
  if (UNLIKELY(!(expr))) {                                        \
    _ROWSTREAM_THROW_IMPL(                                        \
        exception, exprStr, errorCode, retryable, ##__VA_ARGS__); \
  }

#define _ROWSTREAM_CHECK_IMPL(expr, exprStr, ...)         \
  _ROWSTREAM_CHECK_AND_THROW_IMPL(                        \
      exprStr,                                            \
      expr,                                               \
      ::facebook::rowstream::RowStreamInternalError,      \
      ::facebook::rowstream::error_code::InvalidArgument, \
      false,                                              \
      ##__VA_ARGS__)

#define ROWSTREAM_CHECK(expr, ...) \
  _ROWSTREAM_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)

// Verify that the chunk sequence received from the server follows the read
// rows protocol. Failure of this condition means the server sent chunks we
// can't assemble into rows. The current attempt is always abandoned.
#define ROWSTREAM_PROTOCOL_CHECK(condition, ...)              \
  if (UNLIKELY(!(condition))) {                               \
    ROWSTREAM_RAISE_INTERNAL_ERROR(                           \
        #condition,                                           \
        ::facebook::rowstream::error_code::ProtocolViolation, \
        /* retryable */ false,                                \
        __VA_ARGS__);                                         \
  }

// Should be raised when we don't expect to hit a code path, but we did. This
// means a bug in rowstream.
#define ROWSTREAM_UNREACHABLE(...)                        \
  ROWSTREAM_RAISE_INTERNAL_ERROR(                         \
      "",                                                 \
      ::facebook::rowstream::error_code::UnreachableCode, \
      /* retryable */ false,                              \
      __VA_ARGS__);

// Comparison macros
#define _ROWSTREAM_CHECK_OP_WITH_USER_FMT_HELPER( \
    implmacro, expr1, expr2, op, user_fmt, ...)   \
  implmacro(                                      \
      (expr1)op(expr2),                           \
      #expr1 " " #op " " #expr2,                  \
      "({} vs. {}) " user_fmt,                    \
      expr1,                                      \
      expr2,                                      \
      ##__VA_ARGS__)

#define _ROWSTREAM_CHECK_OP_HELPER(implmacro, expr1, expr2, op, ...) \
  do {                                                               \
    if constexpr (FOLLY_PP_DETAIL_NARGS(__VA_ARGS__) > 0) {          \
      _ROWSTREAM_CHECK_OP_WITH_USER_FMT_HELPER(                      \
          implmacro, expr1, expr2, op, __VA_ARGS__);                 \
    } else {                                                         \
      implmacro(                                                     \
          (expr1)op(expr2),                                          \
          #expr1 " " #op " " #expr2,                                 \
          "({} vs. {})",                                             \
          expr1,                                                     \
          expr2);                                                    \
    }                                                                \
  } while (0)

#define _ROWSTREAM_CHECK_OP(expr1, expr2, op, ...) \
  _ROWSTREAM_CHECK_OP_HELPER(                      \
      _ROWSTREAM_CHECK_IMPL, expr1, expr2, op, ##__VA_ARGS__)

#define _ROWSTREAM_USER_CHECK_IMPL(expr, exprStr, ...)    \
  _ROWSTREAM_CHECK_AND_THROW_IMPL(                        \
      exprStr,                                            \
      expr,                                               \
      ::facebook::rowstream::RowStreamUserError,          \
      ::facebook::rowstream::error_code::InvalidArgument, \
      /* retryable */ false,                              \
      ##__VA_ARGS__)

#define ROWSTREAM_USER_CHECK(expr, ...) \
  _ROWSTREAM_USER_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)

#define _ROWSTREAM_USER_CHECK_OP(expr1, expr2, op, ...) \
  _ROWSTREAM_CHECK_OP_HELPER(                           \
      _ROWSTREAM_USER_CHECK_IMPL, expr1, expr2, op, ##__VA_ARGS__)

// Comparison check macros
#define ROWSTREAM_CHECK_LT(e1, e2, ...) \
  _ROWSTREAM_CHECK_OP(e1, e2, <, ##__VA_ARGS__)

#define ROWSTREAM_USER_CHECK_GT(e1, e2, ...) \
  _ROWSTREAM_USER_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define ROWSTREAM_USER_CHECK_GE(e1, e2, ...) \
  _ROWSTREAM_USER_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)

// Null pointer checks
#define ROWSTREAM_CHECK_NOT_NULL(e, ...) \
  ROWSTREAM_CHECK((e) != nullptr, ##__VA_ARGS__)

// Failure macro without condition
#define ROWSTREAM_USER_FAIL(...)                          \
  ROWSTREAM_RAISE_USER_ERROR(                             \
      "",                                                 \
      ::facebook::rowstream::error_code::InvalidArgument, \
      /* retryable */ false,                              \
      __VA_ARGS__)

} // namespace facebook::rowstream

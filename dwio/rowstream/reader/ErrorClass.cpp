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
#include "dwio/rowstream/reader/ErrorClass.h"

#include "dwio/rowstream/common/Exceptions.h"

#include <algorithm>
#include <initializer_list>

namespace facebook::rowstream {

std::string_view toString(ErrorClass errorClass) {
  switch (errorClass) {
    case ErrorClass::ProtocolViolation:
      return "ProtocolViolation";
    case ErrorClass::TransientTransport:
      return "TransientTransport";
    case ErrorClass::PermanentRequest:
      return "PermanentRequest";
    case ErrorClass::SessionExhausted:
      return "SessionExhausted";
    case ErrorClass::Cancelled:
      return "Cancelled";
  }
  ROWSTREAM_UNREACHABLE(
      "Unknown error class {}", static_cast<int>(errorClass));
}

namespace {

bool isOneOf(
    std::string_view errorCode,
    std::initializer_list<std::string_view> codes) {
  return std::find(codes.begin(), codes.end(), errorCode) != codes.end();
}

} // namespace

bool isTransientErrorCode(std::string_view errorCode) {
  return isOneOf(
      errorCode,
      {error_code::Unavailable,
       error_code::DeadlineExceeded,
       error_code::ConnectionReset,
       error_code::Aborted,
       error_code::ResourceExhausted});
}

ErrorClass classifyErrorCode(std::string_view errorCode, bool retryable) {
  if (errorCode == std::string_view{error_code::ProtocolViolation}) {
    return ErrorClass::ProtocolViolation;
  }
  if (errorCode == std::string_view{error_code::SessionExhausted}) {
    return ErrorClass::SessionExhausted;
  }
  if (errorCode == std::string_view{error_code::Cancelled}) {
    return ErrorClass::Cancelled;
  }
  if (isTransientErrorCode(errorCode)) {
    return ErrorClass::TransientTransport;
  }
  if (isOneOf(
          errorCode,
          {error_code::InvalidArgument,
           error_code::PermissionDenied,
           error_code::NotFound,
           error_code::Unauthenticated,
           error_code::UnreachableCode})) {
    return ErrorClass::PermanentRequest;
  }
  // Codes we don't know about follow the flag set by whoever raised them.
  return retryable ? ErrorClass::TransientTransport
                   : ErrorClass::PermanentRequest;
}

ErrorClass classifyError(const std::exception& error) {
  if (const auto* rowStreamError =
          dynamic_cast<const RowStreamException*>(&error)) {
    return classifyErrorCode(
        rowStreamError->errorCode(), rowStreamError->retryable());
  }
  return ErrorClass::PermanentRequest;
}

ErrorClass classifyError(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return classifyError(e);
  } catch (...) {
    return ErrorClass::PermanentRequest;
  }
}

} // namespace facebook::rowstream

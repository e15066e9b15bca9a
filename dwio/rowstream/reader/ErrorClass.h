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

#include <exception>
#include <string_view>

namespace facebook::rowstream {

// How a failure of a read attempt is treated by the read session.
enum class ErrorClass {
  // Malformed chunk sequence. Terminal unless the retry policy allows a
  // resumed attempt.
  ProtocolViolation,
  // Timeout, unavailable, connection reset. Retried with backoff.
  TransientTransport,
  // Invalid argument, permission denied, not found. Never retried.
  PermanentRequest,
  // Retry budget of the session ran out.
  SessionExhausted,
  // The caller cancelled the read.
  Cancelled,
};

std::string_view toString(ErrorClass errorClass);

// Maps a rowstream error code to its class. Codes missing from the table are
// classified from the retryable flag of the exception carrying them.
ErrorClass classifyErrorCode(std::string_view errorCode, bool retryable);

// Classifies any exception escaping a read attempt. Exceptions not raised by
// rowstream are permanent.
ErrorClass classifyError(const std::exception& error);

// Same as above, for a captured exception.
ErrorClass classifyError(const std::exception_ptr& error);

bool isTransientErrorCode(std::string_view errorCode);

} // namespace facebook::rowstream

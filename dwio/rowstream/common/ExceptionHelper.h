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

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace facebook::rowstream {

// Message type used when a check is raised without any message. Avoids
// constructing a std::string on the failure path.
struct CompileTimeEmptyString {
  constexpr operator const char*() const {
    return "";
  }

  constexpr operator std::string_view() const {
    return {};
  }

  operator std::string() const {
    return {};
  }
};

// Builds the message attached to a raised exception. Plain strings are passed
// through untouched, anything else goes through fmt::format.
inline CompileTimeEmptyString errorMessage() {
  return {};
}

inline const char* errorMessage(const char* message) {
  return message;
}

inline std::string errorMessage(const std::string& message) {
  return message;
}

template <typename... Args>
std::string errorMessage(fmt::format_string<Args...> format, Args&&... args) {
  return fmt::format(format, std::forward<Args>(args)...);
}

} // namespace facebook::rowstream

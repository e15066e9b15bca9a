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

#include <folly/Conv.h>
#include <gflags/gflags_declare.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "dwio/rowstream/common/Exceptions.h"

DECLARE_uint64(rowstream_retry_initial_delay_ms);
DECLARE_uint64(rowstream_retry_max_delay_ms);
DECLARE_double(rowstream_retry_multiplier);
DECLARE_uint32(rowstream_retry_max_attempts);
DECLARE_uint64(rowstream_retry_max_elapsed_ms);
DECLARE_double(rowstream_retry_jitter_ratio);
DECLARE_bool(rowstream_retry_protocol_violations);
DECLARE_uint64(rowstream_attempt_timeout_ms);

namespace facebook::rowstream {

// String keyed configuration. Values are kept in their string form and
// converted on access, so a Config can be built straight from a property map
// handed over by the embedding application.
class Config {
 public:
  template <typename T>
  class Entry {
   public:
    Entry(
        std::string key,
        T defaultValue,
        std::function<std::string(const T&)> toString =
            [](const T& value) { return folly::to<std::string>(value); },
        std::function<T(const std::string&, const std::string&)> fromString =
            [](const std::string& /* key */, const std::string& value) {
              return folly::to<T>(value);
            })
        : key_{std::move(key)},
          default_{std::move(defaultValue)},
          toString_{std::move(toString)},
          fromString_{std::move(fromString)} {}

    const std::string& key() const {
      return key_;
    }

    const T& defaultValue() const {
      return default_;
    }

   private:
    friend class Config;

    const std::string key_;
    const T default_;
    const std::function<std::string(const T&)> toString_;
    const std::function<T(const std::string&, const std::string&)> fromString_;
  };

  static Entry<uint64_t> RETRY_INITIAL_DELAY_MS;
  static Entry<uint64_t> RETRY_MAX_DELAY_MS;
  static Entry<double> RETRY_MULTIPLIER;
  static Entry<uint32_t> RETRY_MAX_ATTEMPTS;
  // Overall session deadline. Once exceeded no more attempts are started.
  static Entry<uint64_t> RETRY_MAX_ELAPSED_MS;
  static Entry<double> RETRY_JITTER_RATIO;
  static Entry<bool> RETRY_PROTOCOL_VIOLATIONS;
  // Zero means attempts are not bounded in time.
  static Entry<uint64_t> ATTEMPT_TIMEOUT_MS;

  // A config holding the current value of every rowstream flag. Entry
  // defaults are the flag defaults, so this is how command line overrides
  // reach a read session.
  static std::shared_ptr<Config> fromFlags();

  static std::shared_ptr<Config> fromMap(
      const std::map<std::string, std::string>& map) {
    auto ret = std::make_shared<Config>();
    ret->configs_.insert(map.cbegin(), map.cend());
    return ret;
  }

  template <typename T>
  T get(const Entry<T>& entry) const {
    auto it = configs_.find(entry.key_);
    if (it == configs_.end()) {
      return entry.default_;
    }
    try {
      return entry.fromString_(entry.key_, it->second);
    } catch (const folly::ConversionError& e) {
      ROWSTREAM_USER_FAIL(
          "Invalid value '{}' for config '{}': {}",
          it->second,
          entry.key_,
          e.what());
    }
  }

  template <typename T>
  Config& set(const Entry<T>& entry, const T& value) {
    configs_[entry.key_] = entry.toString_(value);
    return *this;
  }

  std::optional<std::string> rawValue(const std::string& key) const {
    auto it = configs_.find(key);
    if (it == configs_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  const std::map<std::string, std::string>& rawConfigs() const {
    return configs_;
  }

 private:
  std::map<std::string, std::string> configs_;
};

} // namespace facebook::rowstream

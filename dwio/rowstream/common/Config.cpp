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
#include "dwio/rowstream/common/Config.h"

#include <gflags/gflags.h>

DEFINE_uint64(
    rowstream_retry_initial_delay_ms,
    10,
    "Delay before the first resumed attempt of a read session.");

DEFINE_uint64(
    rowstream_retry_max_delay_ms,
    60'000,
    "Upper bound of the delay between two attempts of a read session.");

DEFINE_double(
    rowstream_retry_multiplier,
    2.0,
    "Growth factor of the delay between two consecutive attempts.");

DEFINE_uint32(
    rowstream_retry_max_attempts,
    10,
    "Maximum number of streaming attempts (first one included) per read.");

DEFINE_uint64(
    rowstream_retry_max_elapsed_ms,
    600'000,
    "Read session deadline. No attempt is started once it is exceeded.");

DEFINE_double(
    rowstream_retry_jitter_ratio,
    0.0,
    "Fraction of each backoff delay that is randomized, in [0, 1].");

DEFINE_bool(
    rowstream_retry_protocol_violations,
    false,
    "Resume once after a malformed chunk sequence instead of failing.");

DEFINE_uint64(
    rowstream_attempt_timeout_ms,
    0,
    "Timeout of a single streaming attempt. Zero disables it.");

namespace facebook::rowstream {

/* static */ Config::Entry<uint64_t> Config::RETRY_INITIAL_DELAY_MS(
    "rowstream.retry.initial.delay.ms",
    FLAGS_rowstream_retry_initial_delay_ms);

/* static */ Config::Entry<uint64_t> Config::RETRY_MAX_DELAY_MS(
    "rowstream.retry.max.delay.ms",
    FLAGS_rowstream_retry_max_delay_ms);

/* static */ Config::Entry<double> Config::RETRY_MULTIPLIER(
    "rowstream.retry.multiplier",
    FLAGS_rowstream_retry_multiplier);

/* static */ Config::Entry<uint32_t> Config::RETRY_MAX_ATTEMPTS(
    "rowstream.retry.max.attempts",
    FLAGS_rowstream_retry_max_attempts);

/* static */ Config::Entry<uint64_t> Config::RETRY_MAX_ELAPSED_MS(
    "rowstream.retry.max.elapsed.ms",
    FLAGS_rowstream_retry_max_elapsed_ms);

/* static */ Config::Entry<double> Config::RETRY_JITTER_RATIO(
    "rowstream.retry.jitter.ratio",
    FLAGS_rowstream_retry_jitter_ratio);

/* static */ Config::Entry<bool> Config::RETRY_PROTOCOL_VIOLATIONS(
    "rowstream.retry.protocol.violations",
    FLAGS_rowstream_retry_protocol_violations,
    [](const bool& value) { return std::string{value ? "true" : "false"}; });

/* static */ Config::Entry<uint64_t> Config::ATTEMPT_TIMEOUT_MS(
    "rowstream.attempt.timeout.ms",
    FLAGS_rowstream_attempt_timeout_ms);

/* static */ std::shared_ptr<Config> Config::fromFlags() {
  auto config = std::make_shared<Config>();
  config->set(RETRY_INITIAL_DELAY_MS, FLAGS_rowstream_retry_initial_delay_ms)
      .set(RETRY_MAX_DELAY_MS, FLAGS_rowstream_retry_max_delay_ms)
      .set(RETRY_MULTIPLIER, FLAGS_rowstream_retry_multiplier)
      .set(RETRY_MAX_ATTEMPTS, FLAGS_rowstream_retry_max_attempts)
      .set(RETRY_MAX_ELAPSED_MS, FLAGS_rowstream_retry_max_elapsed_ms)
      .set(RETRY_JITTER_RATIO, FLAGS_rowstream_retry_jitter_ratio)
      .set(RETRY_PROTOCOL_VIOLATIONS, FLAGS_rowstream_retry_protocol_violations)
      .set(ATTEMPT_TIMEOUT_MS, FLAGS_rowstream_attempt_timeout_ms);
  return config;
}

} // namespace facebook::rowstream

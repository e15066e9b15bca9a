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
#include "dwio/rowstream/reader/InMemoryReadRowsTransport.h"

#include <fmt/format.h>
#include <folly/synchronization/Baton.h>
#include <glog/logging.h>

#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream {

class InMemoryReadRowsTransport::Stream : public ReadRowsStream {
 public:
  Stream(
      std::shared_ptr<folly::Synchronized<Script>> script,
      size_t index,
      std::optional<std::chrono::milliseconds> timeout)
      : script_{std::move(script)}, index_{index}, timeout_{timeout} {}

  std::optional<ReadRowsResponse> read() override {
    bool hang = false;
    {
      auto script = script_->wlock();
      auto& record = script->streams[index_];
      auto& attempt = script->attempts[index_];
      if (record.cancelled) {
        return std::nullopt;
      }
      if (record.paused) {
        ++record.readsWhilePaused;
      }
      if (record.responsesRead < attempt.responses.size()) {
        return attempt.responses[record.responsesRead++];
      }
      if (attempt.failure) {
        throwTransportError(
            attempt.failure->errorCode, attempt.failure->message);
      }
      hang = attempt.hang;
    }
    if (!hang) {
      return std::nullopt;
    }

    if (!timeout_) {
      cancelled_.wait();
      return std::nullopt;
    }
    if (cancelled_.try_wait_for(*timeout_)) {
      return std::nullopt;
    }
    throwTransportError(
        error_code::DeadlineExceeded,
        fmt::format("Attempt timed out after {}ms", timeout_->count()));
  }

  void pause() override {
    auto script = script_->wlock();
    auto& record = script->streams[index_];
    record.paused = true;
    ++record.pauseCount;
  }

  void resume() override {
    auto script = script_->wlock();
    auto& record = script->streams[index_];
    record.paused = false;
    ++record.resumeCount;
  }

  void cancel() override {
    {
      auto script = script_->wlock();
      auto& record = script->streams[index_];
      if (record.cancelled) {
        return;
      }
      record.cancelled = true;
    }
    cancelled_.post();
  }

 private:
  const std::shared_ptr<folly::Synchronized<Script>> script_;
  const size_t index_;
  const std::optional<std::chrono::milliseconds> timeout_;
  folly::Baton<> cancelled_;
};

InMemoryReadRowsTransport::InMemoryReadRowsTransport(
    std::vector<ScriptedAttempt> attempts)
    : script_{std::make_shared<folly::Synchronized<Script>>(
          Script{.attempts = std::move(attempts)})} {}

std::unique_ptr<ReadRowsStream> InMemoryReadRowsTransport::readRows(
    const ReadRowsRequest& request,
    const AttemptContext& context) {
  size_t index;
  {
    auto script = script_->wlock();
    index = script->streams.size();
    ROWSTREAM_CHECK_LT(
        index,
        script->attempts.size(),
        "No scripted attempt left for {}",
        request.toString());
    script->streams.push_back(
        StreamRecord{.request = request, .context = context});
    VLOG(2) << "Serving attempt " << context.attempt << " from script entry "
            << index;
    if (const auto& failure = script->attempts[index].openFailure) {
      throwTransportError(failure->errorCode, failure->message);
    }
  }
  return std::make_unique<Stream>(script_, index, context.timeout);
}

std::vector<StreamRecord> InMemoryReadRowsTransport::streams() const {
  return script_->rlock()->streams;
}

std::vector<ReadRowsRequest> InMemoryReadRowsTransport::requests() const {
  std::vector<ReadRowsRequest> requests;
  auto script = script_->rlock();
  requests.reserve(script->streams.size());
  for (const auto& stream : script->streams) {
    requests.push_back(stream.request);
  }
  return requests;
}

} // namespace facebook::rowstream

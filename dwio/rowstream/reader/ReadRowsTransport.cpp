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
#include "dwio/rowstream/reader/ReadRowsTransport.h"

#include "dwio/rowstream/common/Exceptions.h"
#include "dwio/rowstream/reader/ErrorClass.h"

namespace facebook::rowstream {

void throwTransportError(std::string_view errorCode, std::string_view message) {
  ROWSTREAM_RAISE_EXTERNAL_ERROR(
      errorCode,
      isTransientErrorCode(errorCode),
      external_source::ReadRowsTransport,
      std::string{message});
}

} // namespace facebook::rowstream

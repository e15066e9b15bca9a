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

#include "dwio/rowstream/common/Exceptions.h"

namespace facebook::rowstream {

// Explicit template instantiations to reduce binary bloat
// Note: RowStreamExternalError is not included here because it has a
// different constructor signature (requires externalSource parameter)
ROWSTREAM_DEFINE_CHECK_FAIL_TEMPLATES(RowStreamUserError);
ROWSTREAM_DEFINE_CHECK_FAIL_TEMPLATES(RowStreamInternalError);

} // namespace facebook::rowstream

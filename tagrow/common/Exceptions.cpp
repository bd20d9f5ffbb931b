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

#include "tagrow/common/Exceptions.h"

namespace tagrow {

// TagrowExternalError goes through tagrowExternalCheckFail, which carries the
// extra external source argument, so it has no instantiations here.
TAGROW_DEFINE_CHECK_FAIL_TEMPLATES(TagrowUserError);
TAGROW_DEFINE_CHECK_FAIL_TEMPLATES(TagrowInternalError);

} // namespace tagrow

/*
 * Copyright 2025 AxonOps
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

#include <cstddef>
#include <string_view>

namespace regshape {
namespace schema {

/**
 * Check whether the current scope offers more than one alternative.
 *
 * Scans from `from` until the first unmatched ')' or `bound`. Nested groups,
 * bracket classes, escapes and \Q...\E regions are skipped whole, so only a
 * '|' at the scope's own level counts.
 *
 * Examples (from = 0, bound = size):
 *   "a|b"      -> true
 *   "(a|b)c"   -> false  (the '|' is inside a nested group)
 *   "a)|b"     -> false  (scope ends at the unmatched ')')
 *   "[|]"      -> false
 *
 * @param pattern regex source
 * @param from first index to inspect
 * @param bound index at which scanning stops
 * @return true if a top-level '|' is found before ')' or bound
 */
bool hasTopLevelAlternation(std::string_view pattern, size_t from, size_t bound);

}  // namespace schema
}  // namespace regshape

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
 * Decide whether the group opened just before `pos` captures.
 *
 * Capturing:     "(x"   "(?<name>x"   "(?P<name>x"
 * Non-capturing: "(?:x" "(?=x" "(?!x" "(?<=x" "(?<!x" "(?i)x" "(?i:x"
 *
 * @param pattern regex source
 * @param pos index just after '('
 * @return true if the group is numbered by the engine
 */
bool isCapturing(std::string_view pattern, size_t pos);

/**
 * Check for a quantifier that lets the preceding group occur zero times.
 *
 * Recognizes '?', '*' and a brace quantifier whose lower bound starts with
 * '0' ({0}, {0,}, {0,n}). The brace form is not parsed further, so {0,abc}
 * also counts.
 *
 * @param pattern regex source
 * @param pos index just after the group's closing ')'
 * @param bound end of the region being scanned
 * @return true if the group may be skipped entirely
 */
bool hasZeroOccurrenceQuantifier(std::string_view pattern, size_t pos, size_t bound);

}  // namespace schema
}  // namespace regshape

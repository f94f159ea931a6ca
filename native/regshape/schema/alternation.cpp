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

#include "schema/alternation.h"
#include "schema/pattern_cursor.h"
#include <algorithm>

namespace regshape {
namespace schema {

bool hasTopLevelAlternation(std::string_view pattern, size_t from, size_t bound) {
    const size_t end = std::min(bound, pattern.size());
    size_t i = from;

    while (i < end) {
        switch (pattern[i]) {
            case '\\':
                i = skipEscape(pattern, i);
                break;
            case '[':
                i = skipBracketClass(pattern, i + 1);
                break;
            case '(':
                // Nested group is opaque here
                i = matchingParenEnd(pattern, i + 1);
                break;
            case '|':
                return true;
            case ')':
                return false;
            default:
                i++;
                break;
        }
    }

    return false;
}

}  // namespace schema
}  // namespace regshape

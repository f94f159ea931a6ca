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

#include "schema/structure_analyzer.h"
#include "schema/alternation.h"
#include "schema/group_classifier.h"
#include "schema/pattern_cursor.h"
#include <vector>

namespace regshape {
namespace schema {

Schema analyze(std::string_view pattern) {
    const size_t n = pattern.size();

    std::vector<SlotKind> kinds;
    size_t depth = hasTopLevelAlternation(pattern, 0, n) ? 1 : 0;
    size_t pos = 0;

    while (pos < n) {
        switch (pattern[pos]) {
            case '\\':
                pos = skipEscape(pattern, pos);
                break;

            case '[':
                pos = skipBracketClass(pattern, pos + 1);
                break;

            case ')':
                if (depth > 0) {
                    depth--;
                }
                pos++;
                break;

            case '(': {
                // Lookahead only: the scan still walks the group body
                size_t end = matchingParenEnd(pattern, pos + 1);
                bool capturing = isCapturing(pattern, pos + 1);

                if (depth == 0) {
                    if (hasZeroOccurrenceQuantifier(pattern, end, n)) {
                        if (capturing) {
                            kinds.push_back(SlotKind::Optional);
                        }
                        depth = 1;
                    } else {
                        if (capturing) {
                            kinds.push_back(SlotKind::Required);
                        }
                        depth = hasTopLevelAlternation(pattern, pos + 1, n) ? 1 : 0;
                    }
                } else {
                    if (capturing) {
                        kinds.push_back(SlotKind::Optional);
                    }
                    depth++;
                }

                pos++;
                break;
            }

            default:
                pos++;
                break;
        }
    }

    return Schema(kinds);
}

}  // namespace schema
}  // namespace regshape

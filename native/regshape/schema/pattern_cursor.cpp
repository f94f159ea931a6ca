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

#include "schema/pattern_cursor.h"
#include <algorithm>

namespace regshape {
namespace schema {

size_t skipEscape(std::string_view pattern, size_t pos) {
    const size_t n = pattern.size();

    if (pos + 1 < n && pattern[pos + 1] == 'Q') {
        return skipQuotedLiteral(pattern, pos + 2);
    }

    return std::min(pos + 2, n);
}

size_t skipQuotedLiteral(std::string_view pattern, size_t pos) {
    // The first \E ends the region; backslashes inside are literal.
    const size_t end = pattern.find("\\E", pos);
    if (end == std::string_view::npos) {
        // Unterminated \Q: quoted to end of pattern
        return pattern.size();
    }
    return end + 2;
}

size_t skipBracketClass(std::string_view pattern, size_t pos) {
    const size_t n = pattern.size();
    size_t i = pos;

    if (i < n && pattern[i] == '^') {
        i++;
    }
    // A ']' in first position is a literal member
    if (i < n && pattern[i] == ']') {
        i++;
    }

    while (i < n) {
        switch (pattern[i]) {
            case '\\':
                // No \Q inside a class: the escape is always one pair
                i = std::min(i + 2, n);
                break;
            case '[': {
                // Only [:name:] nests; any other '[' is a literal member
                if (i + 1 < n && pattern[i + 1] == ':') {
                    const size_t close = pattern.find(":]", i + 2);
                    if (close != std::string_view::npos) {
                        i = close + 2;
                        break;
                    }
                }
                i++;
                break;
            }
            case ']':
                return i + 1;
            default:
                i++;
                break;
        }
    }

    return n;
}

size_t matchingParenEnd(std::string_view pattern, size_t pos) {
    const size_t n = pattern.size();
    size_t level = 0;
    size_t i = pos;

    while (i < n) {
        switch (pattern[i]) {
            case '\\':
                i = skipEscape(pattern, i);
                break;
            case '[':
                i = skipBracketClass(pattern, i + 1);
                break;
            case '(':
                level++;
                i++;
                break;
            case ')':
                if (level == 0) {
                    return i + 1;
                }
                level--;
                i++;
                break;
            default:
                i++;
                break;
        }
    }

    return n;
}

}  // namespace schema
}  // namespace regshape

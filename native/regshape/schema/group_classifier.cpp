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

#include "schema/group_classifier.h"

namespace regshape {
namespace schema {

static char charAt(std::string_view pattern, size_t pos) {
    return pos < pattern.size() ? pattern[pos] : '\0';
}

bool isCapturing(std::string_view pattern, size_t pos) {
    if (charAt(pattern, pos) != '?') {
        return true;
    }

    switch (charAt(pattern, pos + 1)) {
        case '<': {
            char next = charAt(pattern, pos + 2);
            // (?<= and (?<! are lookbehinds, (?<name> captures
            return next != '=' && next != '!';
        }
        case 'P':
            // RE2 named group: (?P<name>
            return charAt(pattern, pos + 2) == '<';
        default:
            return false;
    }
}

bool hasZeroOccurrenceQuantifier(std::string_view pattern, size_t pos, size_t bound) {
    if (pos >= bound || pos >= pattern.size()) {
        return false;
    }

    switch (pattern[pos]) {
        case '?':
        case '*':
            return true;
        case '{':
            return charAt(pattern, pos + 1) == '0';
        default:
            return false;
    }
}

}  // namespace schema
}  // namespace regshape

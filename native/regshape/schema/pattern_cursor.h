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
 * Cursor primitives over regex source text.
 *
 * Each function takes a position and returns the position just past the
 * construct that starts there. Results never exceed pattern.size():
 * unterminated constructs run to the end of the pattern (RE2 has already
 * rejected them, or will).
 */

/**
 * Skip an escape sequence.
 *
 * @param pattern regex source
 * @param pos index of the backslash
 * @return index after the escaped character, or after the closing \E for \Q
 */
size_t skipEscape(std::string_view pattern, size_t pos);

/**
 * Skip a \Q...\E quoted region.
 *
 * @param pattern regex source
 * @param pos index just after "\Q"
 * @return index just after the first "\E", or pattern.size() if none
 */
size_t skipQuotedLiteral(std::string_view pattern, size_t pos);

/**
 * Skip a bracketed character class, reading it the way RE2 does.
 *
 * A ']' right after '[' or '[^' is a member, not the closer. Inside the
 * class only [:name:] nests; any other '[' is a member.
 *
 * @param pattern regex source
 * @param pos index just after the opening '['
 * @return index just after the matching ']'
 */
size_t skipBracketClass(std::string_view pattern, size_t pos);

/**
 * Find the end of a parenthesized group.
 *
 * Escapes, quoted regions, bracket classes and nested groups are skipped
 * as whole units.
 *
 * @param pattern regex source
 * @param pos index just after the opening '('
 * @return index just after the ')' closing this group
 */
size_t matchingParenEnd(std::string_view pattern, size_t pos);

}  // namespace schema
}  // namespace regshape

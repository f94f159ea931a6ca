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

#include "schema/schema.h"
#include <string_view>

namespace regshape {
namespace schema {

/**
 * Derive the Schema of a pattern from its text.
 *
 * Single left-to-right pass. An optionality depth counter tracks whether
 * the scan is inside a construct that may not be reached:
 * - starts at 1 if the whole pattern is a top-level alternation
 * - a group quantified to allow zero occurrences sets it to 1
 * - any group opened while it is positive raises it by one
 * - an unquantified group at depth 0 sets it to 1 if its own body alternates
 * - every ')' lowers it by one, never below 0
 * A capturing group opened at depth 0 without a zero-occurrence quantifier
 * is Required; every other capturing group is Optional.
 *
 * Input must already be accepted by RE2; the result is only meaningful
 * for syntactically valid patterns.
 *
 * Examples:
 *   "(\\d+)(?:\\.(\\d+))?"    -> (Required, Optional)
 *   "(a)|(b)"                 -> (Optional, Optional)
 *   "((?:aaaa|bbbb)cccc)?"    -> (Optional)
 *
 * @param pattern regex source
 * @return schema with one slot per capturing group, in textual order
 */
Schema analyze(std::string_view pattern);

}  // namespace schema
}  // namespace regshape

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

#include "pattern_options.h"
#include "schema/schema.h"
#include <re2/re2.h>
#include <memory>
#include <string>

namespace regshape {
namespace regex {

/**
 * Compiled RE2 pattern together with its derived Schema.
 *
 * Immutable after construction. Shared read-only through
 * std::shared_ptr<const CompiledPattern>; the cache evicting an entry only
 * drops its own reference, so holders are never invalidated.
 */
struct CompiledPattern {
    std::unique_ptr<RE2> compiled_regex;
    std::string pattern_string;
    api::PatternOptions options;
    schema::Schema schema;
    size_t approx_size_bytes;

    CompiledPattern(std::unique_ptr<RE2> regex,
                    const std::string& pattern,
                    const api::PatternOptions& opts,
                    schema::Schema derived)
        : compiled_regex(std::move(regex)),
          pattern_string(pattern),
          options(opts),
          schema(std::move(derived)),
          approx_size_bytes(0) {
        if (compiled_regex && compiled_regex->ok()) {
            approx_size_bytes = compiled_regex->ProgramSize() + pattern_string.size();
        }
    }

    const RE2& re2() const { return *compiled_regex; }

    int groupCount() const { return compiled_regex->NumberOfCapturingGroups(); }

    // True if the pattern declares at least one (?P<name>...) group.
    bool hasNamedGroups() const { return !compiled_regex->NamedCapturingGroups().empty(); }
};

/**
 * Compile a pattern and derive its Schema.
 *
 * @param pattern_string regex source
 * @param options compile options (log_errors is always forced off)
 * @return shared compiled pattern
 * @throws SyntaxError if RE2 rejects the pattern
 * @throws UnsupportedPattern if the derived schema disagrees with RE2's group count
 */
std::shared_ptr<const CompiledPattern> compilePattern(
    const std::string& pattern_string,
    const api::PatternOptions& options = api::PatternOptions::defaults());

/**
 * Locate an unbalanced parenthesis.
 *
 * @return index of the first ')' with no matching '(', pattern.size() if a
 *         '(' is never closed, or -1 if parentheses are balanced
 */
int findParenImbalance(const std::string& pattern);

}  // namespace regex
}  // namespace regshape

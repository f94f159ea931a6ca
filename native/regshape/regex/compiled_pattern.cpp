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

#include "regex/compiled_pattern.h"
#include "errors.h"
#include "schema/pattern_cursor.h"
#include "schema/structure_analyzer.h"

namespace regshape {
namespace regex {

int findParenImbalance(const std::string& pattern) {
    const size_t n = pattern.size();
    size_t depth = 0;
    size_t pos = 0;

    while (pos < n) {
        switch (pattern[pos]) {
            case '\\':
                pos = schema::skipEscape(pattern, pos);
                break;
            case '[':
                pos = schema::skipBracketClass(pattern, pos + 1);
                break;
            case '(':
                depth++;
                pos++;
                break;
            case ')':
                if (depth == 0) {
                    return static_cast<int>(pos);
                }
                depth--;
                pos++;
                break;
            default:
                pos++;
                break;
        }
    }

    return depth > 0 ? static_cast<int>(n) : -1;
}

static int errorOffset(const std::string& pattern, const RE2& regex) {
    switch (regex.error_code()) {
        case RE2::ErrorMissingParen:
        case RE2::ErrorUnexpectedParen: {
            int offset = findParenImbalance(pattern);
            if (offset >= 0) {
                return offset;
            }
            break;
        }
        case RE2::ErrorTrailingBackslash:
            return pattern.empty() ? -1 : static_cast<int>(pattern.size() - 1);
        default:
            break;
    }

    const std::string& arg = regex.error_arg();
    if (arg.empty()) {
        return -1;
    }
    size_t found = pattern.find(arg);
    return found == std::string::npos ? -1 : static_cast<int>(found);
}

std::shared_ptr<const CompiledPattern> compilePattern(
    const std::string& pattern_string,
    const api::PatternOptions& options) {

    // Convert PatternOptions to RE2::Options
    RE2::Options re2_opts = options.toRE2Options();
    re2_opts.set_log_errors(false);  // Errors surface as SyntaxError, not stderr

    auto regex = std::make_unique<RE2>(pattern_string, re2_opts);

    if (!regex->ok()) {
        throw SyntaxError(regex->error(), pattern_string,
                          errorOffset(pattern_string, *regex), regex->error_code());
    }

    schema::Schema derived = options.suppressesCapture()
        ? schema::Schema()
        : schema::analyze(pattern_string);

    size_t engine_count = static_cast<size_t>(regex->NumberOfCapturingGroups());
    if (derived.count() != engine_count) {
        throw UnsupportedPattern(pattern_string, derived.count(), engine_count);
    }

    return std::make_shared<const CompiledPattern>(
        std::move(regex), pattern_string, options, std::move(derived));
}

}  // namespace regex
}  // namespace regshape

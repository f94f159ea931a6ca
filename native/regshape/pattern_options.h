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

#include <re2/re2.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace regshape {
namespace api {

/**
 * Pattern compilation options (mirrors RE2::Options).
 *
 * Used for:
 * 1. Configuring RE2 pattern compilation
 * 2. Cache key generation (different options = different cache entry)
 * 3. Deciding whether a Schema is derived at all (literal, never_capture)
 *
 * All fields optional in JSON - missing fields use defaults.
 */
struct PatternOptions {
    // ========== BOOLEAN OPTIONS (11 flags) ==========
    bool posix_syntax = false;      // POSIX egrep syntax (not Perl)
    bool longest_match = false;     // Leftmost-longest match (not first)
    bool log_errors = false;        // Log parse errors (we report via SyntaxError)
    bool literal = false;           // Treat pattern as literal string (not regex)
    bool never_nl = false;          // Never match \n
    bool dot_nl = false;            // Dot matches everything including \n
    bool never_capture = false;     // Parse all parens as non-capturing
    bool case_sensitive = true;     // Case-sensitive matching
    bool perl_classes = false;      // Allow \d \s \w (POSIX mode only)
    bool word_boundary = false;     // Allow \b \B (POSIX mode only)
    bool one_line = false;          // ^ and $ match only start/end of text (POSIX mode only)

    // ========== ENCODING ==========
    bool utf8 = true;               // true=UTF8, false=Latin1

    // ========== MEMORY LIMIT ==========
    int64_t max_mem = 8388608;      // 8MB default

    /**
     * Convert to RE2::Options.
     *
     * @return RE2::Options with all fields set from this struct
     */
    RE2::Options toRE2Options() const;

    /**
     * True when RE2 will report no capturing groups regardless of the
     * pattern text (literal or never_capture).
     */
    bool suppressesCapture() const { return literal || never_capture; }

    /**
     * Encode the options as a fixed-width flag string.
     *
     * One character per boolean flag ('0'/'1') in declaration order,
     * then 'U' or 'L' for the encoding, then max_mem in decimal.
     * Distinct options always give distinct strings.
     */
    std::string fingerprint() const;

    /**
     * Exact cache key for (pattern, options).
     *
     * Format: fingerprint + '/' + pattern. The fingerprint contains no '/',
     * so two keys are equal only if both pattern and options are equal.
     *
     * @param pattern regex source
     * @return cache key
     */
    std::string cacheKey(std::string_view pattern) const;

    /**
     * Parse options from JSON string.
     *
     * JSON format:
     * {
     *   "case_sensitive": true,
     *   "encoding": "UTF8",       // or "Latin1"
     *   "posix_syntax": false,
     *   "longest_match": false,
     *   "literal": false,
     *   "never_nl": false,
     *   "dot_nl": false,
     *   "never_capture": false,
     *   "perl_classes": false,
     *   "word_boundary": false,
     *   "one_line": false,
     *   "max_mem": 8388608
     * }
     *
     * All fields optional - missing fields use defaults.
     *
     * @param json JSON string with options
     * @return PatternOptions struct
     * @throws std::runtime_error if JSON invalid or a field has the wrong type
     * @throws std::invalid_argument if encoding is not "UTF8" or "Latin1"
     */
    static PatternOptions fromJson(const std::string& json);

    /**
     * Serialize to JSON (same field names as fromJson).
     */
    std::string toJson() const;

    /**
     * Create default options.
     *
     * Equivalent to RE2::Options() constructor defaults, except log_errors.
     */
    static PatternOptions defaults();

    bool operator==(const PatternOptions& other) const = default;
};

}  // namespace api
}  // namespace regshape

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
#include "regex/compiled_pattern.h"
#include <memory>
#include <string>

namespace regshape {
namespace api {

/**
 * Process-wide entry points with optional caching.
 *
 * - NO automatic lazy init (explicit initCache() call required for caching)
 * - If no initCache() called: patterns compiled directly on every call
 * - Compiled patterns are shared_ptr; shutdownCache() or eviction never
 *   invalidates a pattern a caller still holds
 *
 * Typical usage:
 *   initCache();
 *   auto p = compile("(\\d+)(?:\\.(\\d+))?");
 *   p->schema.toString();   // "(Required, Optional)"
 *   shutdownCache();
 */

/**
 * Compile a pattern and derive its Schema.
 *
 * Uses the cache when initCache() has been called, otherwise compiles directly.
 *
 * @param pattern regex pattern string
 * @param options compile options
 * @return compiled pattern
 * @throws SyntaxError if RE2 rejects the pattern
 * @throws UnsupportedPattern if the derived schema disagrees with RE2
 */
std::shared_ptr<const regex::CompiledPattern> compile(
    const std::string& pattern,
    const PatternOptions& options = PatternOptions::defaults());

/**
 * Compile with options given as JSON (see PatternOptions::fromJson).
 *
 * @throws std::runtime_error if options_json is invalid
 */
std::shared_ptr<const regex::CompiledPattern> compile(
    const std::string& pattern,
    const std::string& options_json);

/**
 * Schema of a pattern as JSON (see Schema::toJson).
 */
std::string getSchemaJSON(
    const std::string& pattern,
    const PatternOptions& options = PatternOptions::defaults());

/**
 * Pattern details as JSON.
 *
 * {
 *   "pattern": "...",
 *   "capturing_groups": 2,
 *   "named_groups": {"year": 1},
 *   "program_size": 42,
 *   "schema": {...},
 *   "options": {...}
 * }
 */
std::string getPatternInfo(
    const std::string& pattern,
    const PatternOptions& options = PatternOptions::defaults());

/**
 * Get cache metrics as JSON.
 *
 * Returns zeroed metrics if the cache is not initialized.
 */
std::string getMetricsJSON();

/**
 * Initialize the cache.
 *
 * @param json_config JSON configuration (empty = defaults)
 * @throws std::runtime_error if already initialized or config invalid
 * @throws std::invalid_argument if config fails validation
 */
void initCache(const std::string& json_config = "");

/**
 * Shutdown the cache (stops eviction, drops cached references).
 * Safe to call when not initialized.
 *
 * Not safe against concurrent compile(), getMetricsJSON() or Regex
 * construction: the manager is deleted here while those calls may still
 * be using it. Stop every such call before shutting down. Patterns
 * already returned stay valid.
 */
void shutdownCache();

bool isCacheInitialized();

}  // namespace api
}  // namespace regshape

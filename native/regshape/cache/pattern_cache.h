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

#include "cache/cache_config.h"
#include "cache/cache_metrics.h"
#include "pattern_options.h"
#include "regex/compiled_pattern.h"
#include <oneapi/tbb/concurrent_hash_map.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace regshape {
namespace cache {

/**
 * Pattern Cache - compiled RE2 patterns with their derived Schema.
 *
 * Dual implementation:
 * - std::unordered_map + shared_mutex (default, simpler)
 * - TBB concurrent_hash_map (optional, high-concurrency)
 *
 * Keyed by PatternOptions::cacheKey(pattern), which is exact: two entries
 * never share a key unless pattern and options are both equal.
 *
 * Entries are shared_ptr<const CompiledPattern>. Eviction only drops the
 * cache's own reference; callers holding the pattern keep it alive.
 *
 * Thread-safe for concurrent compilation, lookup, and eviction.
 */
class PatternCache {
public:
    explicit PatternCache(const CacheConfig& config);
    ~PatternCache();

    /**
     * Get or compile a pattern.
     *
     * Flow:
     * 1. Check cache (hit → refresh last access, return)
     * 2. Compile and derive Schema with no lock held
     * 3. Insert; if another thread won the race, return its entry
     *
     * @param pattern_string regex pattern
     * @param options compile options
     * @param metrics metrics to update
     * @return compiled pattern
     * @throws SyntaxError
     * @throws UnsupportedPattern
     */
    std::shared_ptr<const regex::CompiledPattern> getOrCompile(
        const std::string& pattern_string,
        const api::PatternOptions& options,
        CacheMetrics& metrics);

    /**
     * Look up without compiling.
     *
     * @return cached pattern, or nullptr
     */
    std::shared_ptr<const regex::CompiledPattern> find(
        const std::string& pattern_string,
        const api::PatternOptions& options) const;

    /**
     * Evict entries based on TTL and capacity (called by background thread).
     *
     * - TTL eviction: (now - last_access) > TTL
     * - LRU eviction: while size > target capacity, oldest first, in
     *   batches of pattern_cache_lru_batch_size
     *
     * @param metrics metrics to update
     * @param now current time
     * @return number of entries evicted
     */
    size_t evict(
        PatternCacheMetrics& metrics,
        const std::chrono::steady_clock::time_point& now);

    /**
     * Clear all entries (for shutdown).
     */
    void clear();

    /**
     * Update snapshot metrics (called by eviction thread).
     */
    void snapshotMetrics(PatternCacheMetrics& metrics) const;

    /**
     * Get current entry count (for testing).
     */
    size_t size() const;

    bool usingTBB() const { return using_tbb_; }

private:
    struct PatternCacheEntry {
        std::shared_ptr<const regex::CompiledPattern> pattern;

        // steady_clock ticks; atomic so hits can refresh it under a shared lock
        mutable std::atomic<int64_t> last_access_ticks{0};

        PatternCacheEntry() = default;  // Default constructor for TBB

        explicit PatternCacheEntry(std::shared_ptr<const regex::CompiledPattern> p)
            : pattern(std::move(p)) {
            touch();
        }

        PatternCacheEntry(const PatternCacheEntry& other)
            : pattern(other.pattern),
              last_access_ticks(other.last_access_ticks.load(std::memory_order_relaxed)) {}

        PatternCacheEntry& operator=(const PatternCacheEntry& other) {
            pattern = other.pattern;
            last_access_ticks.store(other.last_access_ticks.load(std::memory_order_relaxed),
                                    std::memory_order_relaxed);
            return *this;
        }

        void touch() const {
            last_access_ticks.store(
                std::chrono::steady_clock::now().time_since_epoch().count(),
                std::memory_order_relaxed);
        }

        std::chrono::steady_clock::time_point lastAccess() const {
            return std::chrono::steady_clock::time_point(
                std::chrono::steady_clock::duration(
                    last_access_ticks.load(std::memory_order_relaxed)));
        }
    };

    const CacheConfig& config_;
    const bool using_tbb_;

    // ========== std::unordered_map Implementation ==========
    std::unordered_map<std::string, PatternCacheEntry> std_cache_;
    mutable std::shared_mutex std_mutex_;
    size_t std_total_size_bytes_ = 0;

    // ========== TBB concurrent_hash_map Implementation ==========
    using TBBMap = tbb::concurrent_hash_map<std::string, PatternCacheEntry>;
    TBBMap tbb_cache_;
    std::atomic<size_t> tbb_total_size_bytes_{0};

    // ========== Implementation Methods ==========

    // std::unordered_map path
    std::shared_ptr<const regex::CompiledPattern> getOrCompileStd(
        const std::string& key,
        const std::string& pattern_string,
        const api::PatternOptions& options,
        CacheMetrics& metrics);

    size_t evictStd(
        PatternCacheMetrics& metrics,
        const std::chrono::steady_clock::time_point& now);

    // TBB concurrent_hash_map path
    std::shared_ptr<const regex::CompiledPattern> getOrCompileTBB(
        const std::string& key,
        const std::string& pattern_string,
        const api::PatternOptions& options,
        CacheMetrics& metrics);

    size_t evictTBB(
        PatternCacheMetrics& metrics,
        const std::chrono::steady_clock::time_point& now);

    // Helpers
    std::shared_ptr<const regex::CompiledPattern> compileCounted(
        const std::string& pattern_string,
        const api::PatternOptions& options,
        CacheMetrics& metrics);
};

}  // namespace cache
}  // namespace regshape

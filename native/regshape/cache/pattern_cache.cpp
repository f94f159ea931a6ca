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

#include "cache/pattern_cache.h"
#include "errors.h"
#include <algorithm>
#include <vector>

namespace regshape {
namespace cache {

//============================================================================
// Constructor / Destructor
//============================================================================

PatternCache::PatternCache(const CacheConfig& config)
    : config_(config),
      using_tbb_(config.pattern_cache_use_tbb) {
    // Both implementations always present (zero overhead when not used)
}

PatternCache::~PatternCache() {
    clear();
}

//============================================================================
// Public API (Dispatches to std or TBB implementation)
//============================================================================

std::shared_ptr<const regex::CompiledPattern> PatternCache::getOrCompile(
    const std::string& pattern_string,
    const api::PatternOptions& options,
    CacheMetrics& metrics) {

    std::string key = options.cacheKey(pattern_string);

    if (using_tbb_) {
        return getOrCompileTBB(key, pattern_string, options, metrics);
    } else {
        return getOrCompileStd(key, pattern_string, options, metrics);
    }
}

std::shared_ptr<const regex::CompiledPattern> PatternCache::find(
    const std::string& pattern_string,
    const api::PatternOptions& options) const {

    std::string key = options.cacheKey(pattern_string);

    if (using_tbb_) {
        TBBMap::const_accessor acc;
        if (tbb_cache_.find(acc, key)) {
            return acc->second.pattern;
        }
        return nullptr;
    }

    std::shared_lock lock(std_mutex_);
    auto it = std_cache_.find(key);
    return it != std_cache_.end() ? it->second.pattern : nullptr;
}

size_t PatternCache::evict(
    PatternCacheMetrics& metrics,
    const std::chrono::steady_clock::time_point& now) {

    if (using_tbb_) {
        return evictTBB(metrics, now);
    } else {
        return evictStd(metrics, now);
    }
}

void PatternCache::clear() {
    if (using_tbb_) {
        tbb_cache_.clear();
        tbb_total_size_bytes_.store(0);
    } else {
        std::unique_lock lock(std_mutex_);
        std_cache_.clear();
        std_total_size_bytes_ = 0;
    }
}

void PatternCache::snapshotMetrics(PatternCacheMetrics& metrics) const {
    std::lock_guard<std::mutex> snapshot_lock(metrics.snapshot_mutex);

    if (using_tbb_) {
        metrics.current_entry_count = tbb_cache_.size();
        metrics.actual_size_bytes = tbb_total_size_bytes_.load();
    } else {
        std::shared_lock lock(std_mutex_);
        metrics.current_entry_count = std_cache_.size();
        metrics.actual_size_bytes = std_total_size_bytes_;
    }

    metrics.target_capacity_bytes = config_.pattern_cache_target_capacity_bytes;
    metrics.utilization_ratio = metrics.target_capacity_bytes > 0
        ? static_cast<double>(metrics.actual_size_bytes) / metrics.target_capacity_bytes
        : 0.0;
    metrics.using_tbb = using_tbb_;
}

size_t PatternCache::size() const {
    if (using_tbb_) {
        return tbb_cache_.size();
    } else {
        std::shared_lock lock(std_mutex_);
        return std_cache_.size();
    }
}

//============================================================================
// std::unordered_map Implementation
//============================================================================

std::shared_ptr<const regex::CompiledPattern> PatternCache::getOrCompileStd(
    const std::string& key,
    const std::string& pattern_string,
    const api::PatternOptions& options,
    CacheMetrics& metrics) {

    // Try cache lookup first (shared lock - allows concurrent reads)
    {
        std::shared_lock lock(std_mutex_);
        auto it = std_cache_.find(key);

        if (it != std_cache_.end()) {
            // CACHE HIT
            it->second.touch();
            metrics.pattern_cache.hits.fetch_add(1);
            return it->second.pattern;
        }
    }

    // CACHE MISS - need to compile
    metrics.pattern_cache.misses.fetch_add(1);

    // Compile pattern (no lock held - compilation can be slow)
    auto pattern = compileCounted(pattern_string, options, metrics);

    // Add to cache (exclusive lock for write)
    {
        std::unique_lock lock(std_mutex_);

        // Double-check not added by another thread while we were compiling
        auto it = std_cache_.find(key);
        if (it != std_cache_.end()) {
            // Another thread compiled it - use theirs, discard ours
            it->second.touch();
            return it->second.pattern;
        }

        std_cache_.emplace(key, PatternCacheEntry(pattern));
        std_total_size_bytes_ += pattern->approx_size_bytes;

        return pattern;
    }
}

size_t PatternCache::evictStd(
    PatternCacheMetrics& metrics,
    const std::chrono::steady_clock::time_point& now) {

    std::unique_lock lock(std_mutex_);

    size_t evicted = 0;

    // TTL eviction pass
    for (auto it = std_cache_.begin(); it != std_cache_.end(); ) {
        auto age = now - it->second.lastAccess();

        if (age > config_.pattern_cache_ttl_ms) {
            size_t freed = it->second.pattern->approx_size_bytes;

            std_total_size_bytes_ -= freed;
            it = std_cache_.erase(it);

            metrics.ttl_evictions.fetch_add(1);
            metrics.total_evictions.fetch_add(1);
            metrics.total_bytes_freed.fetch_add(freed);

            evicted++;
            continue;
        }

        ++it;
    }

    // LRU eviction if over capacity (batch eviction for O(n + k log k) performance)
    while (std_total_size_bytes_ > config_.pattern_cache_target_capacity_bytes && !std_cache_.empty()) {
        // Step 1: Collect candidates
        std::vector<std::unordered_map<std::string, PatternCacheEntry>::iterator> candidates;
        candidates.reserve(std_cache_.size());
        for (auto it = std_cache_.begin(); it != std_cache_.end(); ++it) {
            candidates.push_back(it);
        }

        // Step 2: Partial sort to find N oldest (batch_size)
        size_t batch_size = std::min(config_.pattern_cache_lru_batch_size, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + batch_size, candidates.end(),
            [](const auto& a, const auto& b) {
                return a->second.lastAccess() < b->second.lastAccess();
            });

        // Step 3: Evict batch
        bool reached_capacity = false;
        for (size_t i = 0; i < batch_size; i++) {
            auto it = candidates[i];
            size_t freed = it->second.pattern->approx_size_bytes;

            std_total_size_bytes_ -= freed;
            std_cache_.erase(it);

            metrics.lru_evictions.fetch_add(1);
            metrics.lru_evictions_bytes_freed.fetch_add(freed);
            metrics.total_evictions.fetch_add(1);
            metrics.total_bytes_freed.fetch_add(freed);
            evicted++;

            // Stop if back under capacity
            if (std_total_size_bytes_ <= config_.pattern_cache_target_capacity_bytes) {
                reached_capacity = true;
                break;
            }
        }

        if (reached_capacity) break;
    }

    return evicted;
}

//============================================================================
// TBB concurrent_hash_map Implementation
//============================================================================

std::shared_ptr<const regex::CompiledPattern> PatternCache::getOrCompileTBB(
    const std::string& key,
    const std::string& pattern_string,
    const api::PatternOptions& options,
    CacheMetrics& metrics) {

    // Try cache lookup first (TBB accessor for read)
    {
        TBBMap::const_accessor acc;

        if (tbb_cache_.find(acc, key)) {
            // CACHE HIT
            acc->second.touch();
            metrics.pattern_cache.hits.fetch_add(1);
            return acc->second.pattern;
        }
    }

    // CACHE MISS - need to compile
    metrics.pattern_cache.misses.fetch_add(1);

    // Compile pattern (no lock held)
    auto pattern = compileCounted(pattern_string, options, metrics);

    // Add to cache (TBB accessor for write)
    {
        TBBMap::accessor acc;

        if (tbb_cache_.insert(acc, key)) {
            // We inserted new entry
            acc->second = PatternCacheEntry(pattern);
            tbb_total_size_bytes_.fetch_add(pattern->approx_size_bytes);
            return pattern;
        } else {
            // Another thread inserted while we were compiling
            // Use their pattern, discard ours
            acc->second.touch();
            return acc->second.pattern;
        }
    }
}

size_t PatternCache::evictTBB(
    PatternCacheMetrics& metrics,
    const std::chrono::steady_clock::time_point& now) {

    size_t evicted = 0;
    std::vector<std::string> to_evict;

    // TTL eviction - collect keys to evict
    for (TBBMap::iterator it = tbb_cache_.begin(); it != tbb_cache_.end(); ++it) {
        auto age = now - it->second.lastAccess();

        if (age > config_.pattern_cache_ttl_ms) {
            to_evict.push_back(it->first);
        }
    }

    // Evict collected entries
    for (const std::string& key : to_evict) {
        TBBMap::accessor acc;

        if (tbb_cache_.find(acc, key)) {
            size_t freed = acc->second.pattern->approx_size_bytes;

            tbb_cache_.erase(acc);
            tbb_total_size_bytes_.fetch_sub(freed);

            metrics.ttl_evictions.fetch_add(1);
            metrics.total_evictions.fetch_add(1);
            metrics.total_bytes_freed.fetch_add(freed);

            evicted++;
        }
    }

    // LRU eviction if over capacity (batch eviction for O(n + k log k) performance)
    size_t current_size = tbb_total_size_bytes_.load();

    while (current_size > config_.pattern_cache_target_capacity_bytes && !tbb_cache_.empty()) {
        // Step 1: Collect candidates (key + last access, so no iterator outlives the scan)
        std::vector<std::pair<std::chrono::steady_clock::time_point, std::string>> candidates;
        for (TBBMap::iterator it = tbb_cache_.begin(); it != tbb_cache_.end(); ++it) {
            candidates.emplace_back(it->second.lastAccess(), it->first);
        }

        if (candidates.empty()) break;

        // Step 2: Partial sort to find N oldest (batch_size)
        size_t batch_size = std::min(config_.pattern_cache_lru_batch_size, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + batch_size, candidates.end(),
            [](const auto& a, const auto& b) {
                return a.first < b.first;
            });

        // Step 3: Evict batch
        bool reached_capacity = false;
        size_t evicted_in_batch = 0;
        for (size_t i = 0; i < batch_size; i++) {
            TBBMap::accessor acc;
            if (tbb_cache_.find(acc, candidates[i].second)) {
                size_t freed = acc->second.pattern->approx_size_bytes;

                tbb_cache_.erase(acc);
                tbb_total_size_bytes_.fetch_sub(freed);

                metrics.lru_evictions.fetch_add(1);
                metrics.lru_evictions_bytes_freed.fetch_add(freed);
                metrics.total_evictions.fetch_add(1);
                metrics.total_bytes_freed.fetch_add(freed);
                evicted++;
                evicted_in_batch++;

                // Check if back under capacity
                current_size = tbb_total_size_bytes_.load();
                if (current_size <= config_.pattern_cache_target_capacity_bytes) {
                    reached_capacity = true;
                    break;
                }
            }
        }

        if (reached_capacity || evicted_in_batch == 0) break;
    }

    return evicted;
}

//============================================================================
// Helper Methods
//============================================================================

std::shared_ptr<const regex::CompiledPattern> PatternCache::compileCounted(
    const std::string& pattern_string,
    const api::PatternOptions& options,
    CacheMetrics& metrics) {

    try {
        auto pattern = regex::compilePattern(pattern_string, options);
        metrics.schema.record(pattern->schema, pattern->hasNamedGroups());
        return pattern;

    } catch (const SyntaxError&) {
        metrics.pattern_cache.compilation_errors.fetch_add(1);
        metrics.schema.syntax_errors.fetch_add(1);
        throw;
    } catch (const UnsupportedPattern&) {
        metrics.pattern_cache.compilation_errors.fetch_add(1);
        metrics.schema.unsupported_patterns.fetch_add(1);
        throw;
    }
}

}  // namespace cache
}  // namespace regshape

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
#include "cache/eviction_thread.h"
#include "cache/pattern_cache.h"
#include <memory>
#include <string>

namespace regshape {
namespace cache {

/**
 * Cache Manager - owns the Pattern Cache, its metrics and background eviction.
 *
 * Lifecycle:
 * 1. Construct with configuration
 * 2. Optionally start eviction thread (or auto-start if configured)
 * 3. Compile through getOrCompile()
 * 4. Stop eviction thread on shutdown
 * 5. Destruct (drops all cached references)
 */
class CacheManager {
public:
    explicit CacheManager(const CacheConfig& config);
    ~CacheManager();

    // Disable copy/move
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * Compile through the cache, or directly when cache_enabled is false.
     *
     * @throws SyntaxError
     * @throws UnsupportedPattern
     */
    std::shared_ptr<const regex::CompiledPattern> getOrCompile(
        const std::string& pattern_string,
        const api::PatternOptions& options);

    void startEvictionThread();
    void stopEvictionThread();
    bool isEvictionThreadRunning() const;

    /**
     * Get current metrics snapshot.
     * Thread-safe - can be called while eviction thread running.
     *
     * @return JSON string with all metrics
     */
    std::string getMetricsJSON();

    /**
     * Clear the cache (for testing or reset).
     * Restarts the eviction thread if it was running.
     */
    void clearAllCaches();

    const CacheConfig& config() const { return config_; }
    PatternCache& patternCache() { return pattern_cache_; }
    CacheMetrics& metrics() { return metrics_; }

private:
    CacheConfig config_;
    CacheMetrics metrics_;

    PatternCache pattern_cache_;

    // Eviction thread (initialized last, references the cache)
    std::unique_ptr<EvictionThread> eviction_thread_;
};

}  // namespace cache
}  // namespace regshape

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
#include "cache/pattern_cache.h"
#include <atomic>
#include <memory>
#include <thread>

namespace regshape {
namespace cache {

/**
 * Background Eviction Thread - periodically evicts expired/over-capacity patterns.
 *
 * Runs every `eviction_check_interval_ms` (default: 100ms) and:
 * 1. Evicts from the Pattern Cache (TTL + LRU)
 * 2. Updates snapshot metrics
 *
 * Thread-safe start/stop with graceful shutdown.
 */
class EvictionThread {
public:
    /**
     * Create eviction thread (does not start automatically).
     *
     * @param config cache configuration
     * @param pattern_cache Pattern Cache
     * @param metrics combined metrics structure
     */
    EvictionThread(
        const CacheConfig& config,
        PatternCache& pattern_cache,
        CacheMetrics& metrics);

    ~EvictionThread();

    /**
     * Start the eviction thread.
     * Safe to call multiple times (no-op if already running).
     */
    void start();

    /**
     * Stop the eviction thread.
     * Blocks until thread exits gracefully.
     * Safe to call multiple times (no-op if not running).
     */
    void stop();

    bool isRunning() const;

    /**
     * Run one eviction cycle on the calling thread.
     *
     * @param now current time
     * @return number of entries evicted
     */
    size_t runOnce(const std::chrono::steady_clock::time_point& now);

private:
    const CacheConfig& config_;
    PatternCache& pattern_cache_;
    CacheMetrics& metrics_;

    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    void evictionLoop();
};

}  // namespace cache
}  // namespace regshape

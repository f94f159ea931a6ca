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

#include "cache/cache_manager.h"

namespace regshape {
namespace cache {

CacheManager::CacheManager(const CacheConfig& config)
    : config_(config),
      pattern_cache_(config_) {

    // Create eviction thread (initialized after cache)
    eviction_thread_ = std::make_unique<EvictionThread>(
        config_,
        pattern_cache_,
        metrics_);

    // Auto-start if configured
    if (config_.cache_enabled && config_.auto_start_eviction_thread) {
        startEvictionThread();
    }
}

CacheManager::~CacheManager() {
    // Stop eviction thread first
    stopEvictionThread();
    pattern_cache_.clear();
}

std::shared_ptr<const regex::CompiledPattern> CacheManager::getOrCompile(
    const std::string& pattern_string,
    const api::PatternOptions& options) {

    if (!config_.cache_enabled) {
        return regex::compilePattern(pattern_string, options);
    }
    return pattern_cache_.getOrCompile(pattern_string, options, metrics_);
}

void CacheManager::startEvictionThread() {
    if (eviction_thread_) {
        eviction_thread_->start();
    }
}

void CacheManager::stopEvictionThread() {
    if (eviction_thread_) {
        eviction_thread_->stop();
    }
}

bool CacheManager::isEvictionThreadRunning() const {
    return eviction_thread_ && eviction_thread_->isRunning();
}

std::string CacheManager::getMetricsJSON() {
    // Fresh capacity snapshot; counters are live atomics
    pattern_cache_.snapshotMetrics(metrics_.pattern_cache);
    metrics_.touch();

    return metrics_.toJson();
}

void CacheManager::clearAllCaches() {
    // Remember if eviction was running before clear
    bool was_running = isEvictionThreadRunning();

    stopEvictionThread();
    pattern_cache_.clear();

    // Restart only if it WAS running before clear
    if (was_running) {
        startEvictionThread();
    }
}

}  // namespace cache
}  // namespace regshape

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

#include "cache/eviction_thread.h"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace regshape {
namespace cache {

EvictionThread::EvictionThread(
    const CacheConfig& config,
    PatternCache& pattern_cache,
    CacheMetrics& metrics)
    : config_(config),
      pattern_cache_(pattern_cache),
      metrics_(metrics) {
    // Thread created but not started
}

EvictionThread::~EvictionThread() {
    // Ensure thread stopped before destruction
    stop();
}

void EvictionThread::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;  // Already running
    }

    stop_requested_.store(false, std::memory_order_release);

    thread_ = std::make_unique<std::thread>(&EvictionThread::evictionLoop, this);
}

void EvictionThread::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;  // Not running
    }

    // Request stop
    stop_requested_.store(true, std::memory_order_release);

    // Wait for thread to exit
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }

    thread_.reset();
}

bool EvictionThread::isRunning() const {
    return running_.load(std::memory_order_acquire);
}

size_t EvictionThread::runOnce(const std::chrono::steady_clock::time_point& now) {
    size_t evicted = pattern_cache_.evict(metrics_.pattern_cache, now);
    pattern_cache_.snapshotMetrics(metrics_.pattern_cache);
    metrics_.touch();
    return evicted;
}

void EvictionThread::evictionLoop() {
    // Sleep in short slices so stop() is not held up by a long interval
    const auto slice = std::min(config_.eviction_check_interval_ms, std::chrono::milliseconds(50));

    while (!stop_requested_.load(std::memory_order_acquire)) {
        try {
            runOnce(std::chrono::steady_clock::now());
        } catch (const std::exception& e) {
            // Non-fatal - keep running
            std::cerr << "REGSHAPE EVICTION ERROR: " << e.what() << std::endl;
        }

        auto wake = std::chrono::steady_clock::now() + config_.eviction_check_interval_ms;
        while (!stop_requested_.load(std::memory_order_acquire) &&
               std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(slice);
        }
    }
}

}  // namespace cache
}  // namespace regshape

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

#include "schema/schema.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace regshape {
namespace cache {

/**
 * Metrics for the Pattern Cache.
 */
struct PatternCacheMetrics {
    // Hit/Miss (reuse efficiency)
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    // Errors (syntax or unsupported construct)
    std::atomic<uint64_t> compilation_errors{0};

    // Evictions
    std::atomic<uint64_t> ttl_evictions{0};
    std::atomic<uint64_t> lru_evictions{0};
    std::atomic<uint64_t> lru_evictions_bytes_freed{0};
    std::atomic<uint64_t> total_evictions{0};
    std::atomic<uint64_t> total_bytes_freed{0};

    // Capacity (snapshot, guarded by snapshot_mutex)
    mutable std::mutex snapshot_mutex;
    uint64_t current_entry_count = 0;
    uint64_t target_capacity_bytes = 0;
    uint64_t actual_size_bytes = 0;
    double utilization_ratio = 0.0;

    // Implementation info (snapshot)
    bool using_tbb = false;

    double hit_rate() const;
    std::string toJson() const;
};

/**
 * Aggregate statistics over derived Schemas.
 *
 * Counted once per compilation (cache hits are not re-counted).
 */
struct SchemaMetrics {
    std::atomic<uint64_t> patterns_analyzed{0};
    std::atomic<uint64_t> required_slots{0};
    std::atomic<uint64_t> optional_slots{0};
    std::atomic<uint64_t> max_capturing_groups{0};
    std::atomic<uint64_t> patterns_with_named_groups{0};

    // Registration failures
    std::atomic<uint64_t> syntax_errors{0};
    std::atomic<uint64_t> unsupported_patterns{0};

    /**
     * Record one successfully derived schema.
     */
    void record(const schema::Schema& schema, bool has_named_groups);

    double avg_capturing_groups() const;
    std::string toJson() const;
};

/**
 * Combined metrics for the cache and schema derivation.
 */
struct CacheMetrics {
    PatternCacheMetrics pattern_cache;
    SchemaMetrics schema;

    // Guarded by snapshot_mutex
    mutable std::mutex snapshot_mutex;
    std::chrono::system_clock::time_point generated_at;

    void touch();

    /**
     * Serialize all metrics to JSON.
     *
     * @return JSON string with all metrics
     */
    std::string toJson() const;
};

}  // namespace cache
}  // namespace regshape

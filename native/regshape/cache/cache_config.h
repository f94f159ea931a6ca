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

#include <chrono>
#include <cstddef>
#include <string>

namespace regshape {
namespace cache {

/**
 * Configuration for the compiled pattern cache.
 *
 * Every field has a default; JSON may set any subset.
 */
struct CacheConfig {
    // Global
    bool cache_enabled = true;

    // Pattern Cache (compiled RE2 + derived Schema)
    size_t pattern_cache_target_capacity_bytes = 100 * 1024 * 1024;
    std::chrono::milliseconds pattern_cache_ttl_ms{300000};
    bool pattern_cache_use_tbb = false;  // Use TBB concurrent_hash_map
    size_t pattern_cache_lru_batch_size = 100;

    // Background Eviction Thread
    bool auto_start_eviction_thread = true;
    std::chrono::milliseconds eviction_check_interval_ms{100};

    /**
     * Parse configuration from JSON string.
     *
     * An empty string yields the defaults.
     *
     * @param json JSON configuration string
     * @return parsed configuration with defaults applied
     * @throws std::runtime_error if JSON invalid or a field has the wrong type
     * @throws std::invalid_argument if validation fails
     */
    static CacheConfig fromJson(const std::string& json);

    /**
     * Validate configuration parameters.
     *
     * @throws std::invalid_argument if configuration invalid
     */
    void validate() const;

    /**
     * Serialize configuration to JSON (for debugging).
     *
     * @return JSON string
     */
    std::string toJson() const;
};

}  // namespace cache
}  // namespace regshape

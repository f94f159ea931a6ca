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

#include "cache/cache_config.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <sstream>

using json = nlohmann::json;

namespace regshape {
namespace cache {

CacheConfig CacheConfig::fromJson(const std::string& json_str) {
    CacheConfig config;

    if (json_str.empty()) {
        return config;
    }

    try {
        json j = json::parse(json_str);

        // Global caching
        config.cache_enabled = j.value("cache_enabled", config.cache_enabled);

        // Pattern Cache
        config.pattern_cache_target_capacity_bytes =
            j.value("pattern_cache_target_capacity_bytes", config.pattern_cache_target_capacity_bytes);
        config.pattern_cache_ttl_ms = std::chrono::milliseconds(
            j.value("pattern_cache_ttl_ms", config.pattern_cache_ttl_ms.count()));
        config.pattern_cache_use_tbb = j.value("pattern_cache_use_tbb", config.pattern_cache_use_tbb);
        config.pattern_cache_lru_batch_size =
            j.value("pattern_cache_lru_batch_size", config.pattern_cache_lru_batch_size);

        // Background Eviction Thread
        config.auto_start_eviction_thread =
            j.value("auto_start_eviction_thread", config.auto_start_eviction_thread);
        config.eviction_check_interval_ms = std::chrono::milliseconds(
            j.value("eviction_check_interval_ms", config.eviction_check_interval_ms.count()));

    } catch (const json::parse_error& e) {
        std::ostringstream msg;
        msg << "Failed to parse cache configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    } catch (const json::type_error& e) {
        std::ostringstream msg;
        msg << "Invalid type in cache configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    }

    config.validate();
    return config;
}

void CacheConfig::validate() const {
    // Global validation - if cache disabled, skip other checks
    if (!cache_enabled) {
        return;
    }

    if (pattern_cache_target_capacity_bytes == 0) {
        throw std::invalid_argument(
            "pattern_cache_target_capacity_bytes must be > 0");
    }
    if (pattern_cache_ttl_ms.count() <= 0) {
        throw std::invalid_argument(
            "pattern_cache_ttl_ms must be > 0");
    }
    if (pattern_cache_lru_batch_size == 0) {
        throw std::invalid_argument(
            "pattern_cache_lru_batch_size must be > 0");
    }

    if (eviction_check_interval_ms.count() <= 0) {
        throw std::invalid_argument(
            "eviction_check_interval_ms must be > 0");
    }

    // Valid but suboptimal
    if (eviction_check_interval_ms.count() > 60000) {
        std::cerr << "REGSHAPE WARNING: eviction_check_interval_ms="
                  << eviction_check_interval_ms.count()
                  << " exceeds 60s, expired patterns will linger" << std::endl;
    }
}

std::string CacheConfig::toJson() const {
    json j;

    // Global
    j["cache_enabled"] = cache_enabled;

    // Pattern Cache
    j["pattern_cache_target_capacity_bytes"] = pattern_cache_target_capacity_bytes;
    j["pattern_cache_ttl_ms"] = pattern_cache_ttl_ms.count();
    j["pattern_cache_use_tbb"] = pattern_cache_use_tbb;
    j["pattern_cache_lru_batch_size"] = pattern_cache_lru_batch_size;

    // Eviction Thread
    j["auto_start_eviction_thread"] = auto_start_eviction_thread;
    j["eviction_check_interval_ms"] = eviction_check_interval_ms.count();

    return j.dump(2);  // Pretty-print with 2-space indent
}

}  // namespace cache
}  // namespace regshape

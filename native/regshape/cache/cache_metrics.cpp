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

#include "cache/cache_metrics.h"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace regshape {
namespace cache {

// Helper to format ISO 8601 timestamp
static std::string formatISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

//============================================================================
// Pattern Cache Metrics
//============================================================================

double PatternCacheMetrics::hit_rate() const {
    uint64_t h = hits.load();
    uint64_t m = misses.load();
    return (h + m) > 0 ? (100.0 * h) / (h + m) : 0.0;
}

std::string PatternCacheMetrics::toJson() const {
    json j;

    // Hit/Miss
    j["hits"] = hits.load();
    j["misses"] = misses.load();
    j["hit_rate"] = hit_rate();

    // Errors
    j["compilation_errors"] = compilation_errors.load();

    // Evictions
    json evictions;
    evictions["ttl"] = ttl_evictions.load();
    evictions["lru"] = lru_evictions.load();
    evictions["lru_bytes_freed"] = lru_evictions_bytes_freed.load();
    evictions["total_evictions"] = total_evictions.load();
    evictions["total_bytes_freed"] = total_bytes_freed.load();
    j["evictions"] = evictions;

    // Capacity (snapshot)
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    json capacity;
    capacity["target_bytes"] = target_capacity_bytes;
    capacity["actual_bytes"] = actual_size_bytes;
    capacity["entry_count"] = current_entry_count;
    capacity["utilization_ratio"] = utilization_ratio;
    j["capacity"] = capacity;

    // Implementation info
    j["using_tbb"] = using_tbb;

    return j.dump();
}

//============================================================================
// Schema Metrics
//============================================================================

void SchemaMetrics::record(const schema::Schema& schema, bool has_named_groups) {
    patterns_analyzed.fetch_add(1);
    required_slots.fetch_add(schema.requiredCount());
    optional_slots.fetch_add(schema.optionalCount());

    if (has_named_groups) {
        patterns_with_named_groups.fetch_add(1);
    }

    // Lock-free max
    uint64_t count = schema.count();
    uint64_t prev = max_capturing_groups.load();
    while (count > prev && !max_capturing_groups.compare_exchange_weak(prev, count)) {
    }
}

double SchemaMetrics::avg_capturing_groups() const {
    uint64_t n = patterns_analyzed.load();
    if (n == 0) {
        return 0.0;
    }
    return static_cast<double>(required_slots.load() + optional_slots.load()) / n;
}

std::string SchemaMetrics::toJson() const {
    json j;

    json patterns;
    patterns["analyzed"] = patterns_analyzed.load();
    patterns["syntax_errors"] = syntax_errors.load();
    patterns["unsupported"] = unsupported_patterns.load();
    patterns["with_named_groups"] = patterns_with_named_groups.load();
    j["patterns"] = patterns;

    json slots;
    slots["required"] = required_slots.load();
    slots["optional"] = optional_slots.load();
    j["slots"] = slots;

    json groups;
    groups["avg_per_pattern"] = avg_capturing_groups();
    groups["max_per_pattern"] = max_capturing_groups.load();
    j["capturing_groups"] = groups;

    return j.dump();
}

//============================================================================
// Combined Cache Metrics
//============================================================================

void CacheMetrics::touch() {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    generated_at = std::chrono::system_clock::now();
}

std::string CacheMetrics::toJson() const {
    json j;

    // Parse each section's JSON and insert into main object
    j["pattern_cache"] = json::parse(pattern_cache.toJson());
    j["schema"] = json::parse(schema.toJson());

    // Timestamp
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    j["generated_at"] = formatISO8601(generated_at);

    return j.dump(2);  // Pretty-print with 2-space indent
}

}  // namespace cache
}  // namespace regshape

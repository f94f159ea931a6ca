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

#include "regshape_api.h"
#include "cache/cache_manager.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <stdexcept>

using json = nlohmann::json;

namespace regshape {
namespace api {

//============================================================================
// Global State (NO Lazy Init - Explicit Only)
//============================================================================

static std::atomic<cache::CacheManager*> g_cache_manager{nullptr};
static std::mutex g_init_mutex;

//============================================================================
// Public API
//============================================================================

std::shared_ptr<const regex::CompiledPattern> compile(
    const std::string& pattern,
    const PatternOptions& options) {

    cache::CacheManager* mgr = g_cache_manager.load(std::memory_order_acquire);

    if (mgr == nullptr) {
        // NO CACHE - Compile directly
        return regex::compilePattern(pattern, options);
    }

    return mgr->getOrCompile(pattern, options);
}

std::shared_ptr<const regex::CompiledPattern> compile(
    const std::string& pattern,
    const std::string& options_json) {
    return compile(pattern, PatternOptions::fromJson(options_json));
}

std::string getSchemaJSON(const std::string& pattern, const PatternOptions& options) {
    return compile(pattern, options)->schema.toJson();
}

std::string getPatternInfo(const std::string& pattern, const PatternOptions& options) {
    auto compiled = compile(pattern, options);
    const RE2& re = compiled->re2();

    json j;
    j["pattern"] = compiled->pattern_string;
    j["capturing_groups"] = re.NumberOfCapturingGroups();

    json named = json::object();
    for (const auto& [name, index] : re.NamedCapturingGroups()) {
        named[name] = index;
    }
    j["named_groups"] = named;

    j["program_size"] = re.ProgramSize();
    j["schema"] = json::parse(compiled->schema.toJson());
    j["options"] = json::parse(compiled->options.toJson());

    return j.dump();
}

std::string getMetricsJSON() {
    cache::CacheManager* mgr = g_cache_manager.load(std::memory_order_acquire);

    if (!mgr) {
        // Cache not initialized - return empty metrics
        cache::CacheMetrics empty;
        empty.touch();
        return empty.toJson();
    }

    return mgr->getMetricsJSON();
}

void initCache(const std::string& json_config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_cache_manager.load(std::memory_order_acquire) != nullptr) {
        throw std::runtime_error("Cache already initialized");
    }

    // Empty config yields defaults
    cache::CacheConfig config = cache::CacheConfig::fromJson(json_config);

    cache::CacheManager* new_mgr = new cache::CacheManager(config);
    g_cache_manager.store(new_mgr, std::memory_order_release);
}

void shutdownCache() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    cache::CacheManager* mgr = g_cache_manager.exchange(nullptr, std::memory_order_acq_rel);

    if (mgr) {
        delete mgr;  // Destructor stops eviction, clears cache
    }
}

bool isCacheInitialized() {
    return g_cache_manager.load(std::memory_order_acquire) != nullptr;
}

}  // namespace api
}  // namespace regshape

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
#include "errors.h"
#include "regex/regex.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace regshape;
using namespace regshape::api;
using json = nlohmann::json;

/**
 * Facade API Tests - compile, introspection and cache lifecycle.
 */
class RegshapeAPITest : public ::testing::Test {
protected:
    void SetUp() override {
        // Each test gets fresh cache (shutdown between tests)
        if (isCacheInitialized()) {
            shutdownCache();
        }
    }

    void TearDown() override {
        if (isCacheInitialized()) {
            shutdownCache();
        }
    }
};

// Compile without cache (direct compilation)
TEST_F(RegshapeAPITest, CompileWithoutCache) {
    EXPECT_FALSE(isCacheInitialized());

    auto p1 = compile("(\\d+)-(\\d+)?");
    auto p2 = compile("(\\d+)-(\\d+)?");

    ASSERT_NE(p1, nullptr);
    EXPECT_NE(p1, p2);  // No cache, separate compilations
    EXPECT_EQ(p1->schema.toString(), "(Required, Optional)");
    EXPECT_FALSE(isCacheInitialized());
}

TEST_F(RegshapeAPITest, CompileWithCache) {
    initCache(R"({"auto_start_eviction_thread": false})");
    ASSERT_TRUE(isCacheInitialized());

    auto p1 = compile("(\\d+)-(\\d+)?");
    auto p2 = compile("(\\d+)-(\\d+)?");
    EXPECT_EQ(p1, p2);

    json metrics = json::parse(getMetricsJSON());
    EXPECT_EQ(metrics["pattern_cache"]["hits"], 1);
    EXPECT_EQ(metrics["pattern_cache"]["misses"], 1);
}

// Regex construction goes through the cache once initialized
TEST_F(RegshapeAPITest, RegexUsesCache) {
    initCache();

    regex::Regex a("(a)|(b)");
    regex::Regex b("(a)|(b)");
    EXPECT_EQ(a.compiledPattern(), b.compiledPattern());
}

TEST_F(RegshapeAPITest, CompileWithOptionsJson) {
    auto p = compile("HELLO", R"({"case_sensitive": false})");
    EXPECT_TRUE(RE2::FullMatch("hello", p->re2()));
    EXPECT_THROW(compile("x", R"({"encoding": "EBCDIC"})"), std::invalid_argument);
}

TEST_F(RegshapeAPITest, CompileErrors) {
    EXPECT_THROW(compile("("), SyntaxError);
    EXPECT_THROW(compile(")"), SyntaxError);
    EXPECT_THROW(compile("[a"), SyntaxError);
}

// Errors are counted once the cache is up
TEST_F(RegshapeAPITest, CompileErrorsCounted) {
    initCache(R"({"auto_start_eviction_thread": false})");

    EXPECT_THROW(compile("("), SyntaxError);
    EXPECT_THROW(compile("a**"), SyntaxError);

    json metrics = json::parse(getMetricsJSON());
    EXPECT_EQ(metrics["pattern_cache"]["compilation_errors"], 2);
    EXPECT_EQ(metrics["schema"]["patterns"]["syntax_errors"], 2);
    EXPECT_EQ(metrics["schema"]["patterns"]["unsupported"], 0);
}

TEST_F(RegshapeAPITest, SchemaJSON) {
    json j = json::parse(getSchemaJSON("(\\d+)(?:\\.(\\d+))?"));
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["slots"][0]["ordinal"], 1);
    EXPECT_EQ(j["slots"][0]["kind"], "Required");
    EXPECT_EQ(j["slots"][1]["kind"], "Optional");
}

TEST_F(RegshapeAPITest, PatternInfo) {
    json j = json::parse(getPatternInfo("(?P<year>\\d{4})-(\\d{2})?"));

    EXPECT_EQ(j["pattern"], "(?P<year>\\d{4})-(\\d{2})?");
    EXPECT_EQ(j["capturing_groups"], 2);
    EXPECT_EQ(j["named_groups"]["year"], 1);
    EXPECT_GT(j["program_size"].get<int>(), 0);
    EXPECT_EQ(j["schema"]["count"], 2);
    EXPECT_EQ(j["options"]["encoding"], "UTF8");
}

// Metrics without a cache are all zero
TEST_F(RegshapeAPITest, MetricsWithoutCache) {
    json j = json::parse(getMetricsJSON());
    EXPECT_EQ(j["pattern_cache"]["hits"], 0);
    EXPECT_EQ(j["schema"]["patterns"]["analyzed"], 0);
    EXPECT_TRUE(j.contains("generated_at"));
}

TEST_F(RegshapeAPITest, InitTwiceThrows) {
    initCache();
    EXPECT_THROW(initCache(), std::runtime_error);
}

TEST_F(RegshapeAPITest, InitInvalidConfig) {
    EXPECT_THROW(initCache(R"({"pattern_cache_ttl_ms": 0})"), std::invalid_argument);
    EXPECT_FALSE(isCacheInitialized());
}

// Patterns outlive the cache that produced them
TEST_F(RegshapeAPITest, PatternOutlivesShutdown) {
    initCache();
    regex::Regex r("(\\w+)@(\\w+)");
    shutdownCache();

    auto groups = r.unapply("joe@example");
    ASSERT_TRUE(groups.has_value());
    EXPECT_EQ(groups->required(2), "example");
}

TEST_F(RegshapeAPITest, ShutdownIsIdempotent) {
    shutdownCache();
    initCache();
    shutdownCache();
    shutdownCache();
    EXPECT_FALSE(isCacheInitialized());
}

// Concurrent compile through the shared cache
TEST_F(RegshapeAPITest, ConcurrentCompile) {
    initCache(R"({"auto_start_eviction_thread": true, "eviction_check_interval_ms": 10})");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([]() {
            for (int i = 0; i < 100; i++) {
                regex::Regex r("(\\d+)(?:\\.(\\d+))?");
                auto v = r.unapplyAs<std::string, std::optional<std::string>>("3.14");
                ASSERT_TRUE(v.has_value());
                EXPECT_EQ(std::get<0>(*v), "3");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    json metrics = json::parse(getMetricsJSON());
    uint64_t hits = metrics["pattern_cache"]["hits"];
    uint64_t misses = metrics["pattern_cache"]["misses"];
    EXPECT_EQ(hits + misses, 400u);
}

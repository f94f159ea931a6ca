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

#include "schema/alternation.h"
#include <gtest/gtest.h>
#include <string>

using namespace regshape::schema;

class AlternationTest : public ::testing::Test {};

TEST_F(AlternationTest, TopLevelBar) {
    std::string p = "(a)|(b)";
    EXPECT_TRUE(hasTopLevelAlternation(p, 0, p.size()));
}

TEST_F(AlternationTest, NoBar) {
    std::string p = "abc(d)";
    EXPECT_FALSE(hasTopLevelAlternation(p, 0, p.size()));
}

// Alternation inside a nested group is not top-level
TEST_F(AlternationTest, NestedGroupIsOpaque) {
    std::string p = "((foo)|(bar))*";
    EXPECT_FALSE(hasTopLevelAlternation(p, 0, p.size()));
    EXPECT_TRUE(hasTopLevelAlternation(p, 1, p.size()));
}

// Scanning from inside a group stops at its closing paren
TEST_F(AlternationTest, StopsAtClosingParen) {
    std::string p = "(ab)|c";
    EXPECT_FALSE(hasTopLevelAlternation(p, 1, p.size()));
}

TEST_F(AlternationTest, IgnoresEscapedAndClassBars) {
    std::string p = "a\\|b[|]c";
    EXPECT_FALSE(hasTopLevelAlternation(p, 0, p.size()));
}

TEST_F(AlternationTest, IgnoresQuotedBars) {
    std::string p = "\\Qa|b\\Ec";
    EXPECT_FALSE(hasTopLevelAlternation(p, 0, p.size()));
}

TEST_F(AlternationTest, RespectsBound) {
    std::string p = "abc|d";
    EXPECT_FALSE(hasTopLevelAlternation(p, 0, 3));
    EXPECT_TRUE(hasTopLevelAlternation(p, 0, 4));
}

TEST_F(AlternationTest, EmptyRange) {
    EXPECT_FALSE(hasTopLevelAlternation("", 0, 0));
    EXPECT_FALSE(hasTopLevelAlternation("a|b", 3, 3));
}

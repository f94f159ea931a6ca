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

#include "schema/group_classifier.h"
#include <gtest/gtest.h>
#include <string>

using namespace regshape::schema;

class GroupClassifierTest : public ::testing::Test {};

TEST_F(GroupClassifierTest, PlainGroupCaptures) {
    EXPECT_TRUE(isCapturing("(a)", 1));
}

TEST_F(GroupClassifierTest, NamedGroupsCapture) {
    EXPECT_TRUE(isCapturing("(?<year>\\d+)", 1));
    EXPECT_TRUE(isCapturing("(?P<year>\\d+)", 1));
}

TEST_F(GroupClassifierTest, NonCapturingForms) {
    EXPECT_FALSE(isCapturing("(?:a)", 1));
    EXPECT_FALSE(isCapturing("(?i)a", 1));
    EXPECT_FALSE(isCapturing("(?i:a)", 1));
    EXPECT_FALSE(isCapturing("(?=a)", 1));
    EXPECT_FALSE(isCapturing("(?!a)", 1));
}

// Lookbehinds start with (?< but do not capture
TEST_F(GroupClassifierTest, LookbehindDoesNotCapture) {
    EXPECT_FALSE(isCapturing("(?<=a)b", 1));
    EXPECT_FALSE(isCapturing("(?<!a)b", 1));
}

// Unclosed group at the end of the pattern still counts as capturing
TEST_F(GroupClassifierTest, GroupAtEndOfPattern) {
    EXPECT_TRUE(isCapturing("(", 1));
}

TEST_F(GroupClassifierTest, ZeroOccurrenceQuantifiers) {
    std::string p = "(a)?";
    EXPECT_TRUE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a)*";
    EXPECT_TRUE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a){0,3}";
    EXPECT_TRUE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a){0}";
    EXPECT_TRUE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
}

TEST_F(GroupClassifierTest, NonZeroQuantifiers) {
    std::string p = "(a)+";
    EXPECT_FALSE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a){1,}";
    EXPECT_FALSE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a){2,3}";
    EXPECT_FALSE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a)b";
    EXPECT_FALSE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
}

TEST_F(GroupClassifierTest, QuantifierAtOrPastBound) {
    std::string p = "(a)";
    EXPECT_FALSE(hasZeroOccurrenceQuantifier(p, 3, p.size()));
    p = "(a)?";
    EXPECT_FALSE(hasZeroOccurrenceQuantifier(p, 3, 3));
}

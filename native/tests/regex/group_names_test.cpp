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

#include "regex/group_names.h"
#include "errors.h"
#include <gtest/gtest.h>

using namespace regshape;
using namespace regshape::regex;

class GroupNamesTest : public ::testing::Test {};

TEST_F(GroupNamesTest, InlineNames) {
    RE2 re("(?P<user>\\w+)@(?P<host>\\w+)");
    GroupNames names(re, {});
    EXPECT_EQ(names.indexOf("user"), 1);
    EXPECT_EQ(names.indexOf("host"), 2);
}

TEST_F(GroupNamesTest, DeclaredNames) {
    RE2 re("(\\d+)-(\\d+)");
    GroupNames names(re, {"lo", "hi"});
    EXPECT_EQ(names.indexOf("lo"), 1);
    EXPECT_EQ(names.indexOf("hi"), 2);
    EXPECT_EQ(names.declared().size(), 2u);
}

// Inline name wins, declared name still resolves as a fallback
TEST_F(GroupNamesTest, InlineThenDeclared) {
    RE2 re("a(?P<Bar>b*)c");
    GroupNames names(re, {"Bee"});
    EXPECT_EQ(names.indexOf("Bar"), 1);
    EXPECT_EQ(names.indexOf("Bee"), 1);
}

TEST_F(GroupNamesTest, UnknownName) {
    RE2 re("a(?P<Bar>b*)c");
    GroupNames names(re, {"Bar"});
    EXPECT_THROW(names.indexOf("Bee"), UnknownGroupName);
    EXPECT_THROW(names.indexOf("Bee"), std::invalid_argument);
}

// Declared names beyond the group count do not resolve
TEST_F(GroupNamesTest, DeclaredNamePastGroupCount) {
    RE2 re("(a)");
    GroupNames names(re, {"x", "y"});
    EXPECT_EQ(names.indexOf("x"), 1);
    EXPECT_THROW(names.indexOf("y"), UnknownGroupName);
}

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

#include "schema/extractor.h"
#include "errors.h"
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace regshape;
using namespace regshape::schema;

class ExtractorTest : public ::testing::Test {
protected:
    using Raw = std::vector<std::optional<std::string_view>>;

    Schema required_optional{{SlotKind::Required, SlotKind::Optional}};
};

// Present values flow through with their slot kinds
TEST_F(ExtractorTest, ExtractsPresentValues) {
    ExtractionResult result = extractGroups(required_optional, Raw{"3", "1415"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.groups.size(), 2u);
    EXPECT_EQ(result.groups.required(1), "3");
    EXPECT_EQ(result.groups.optional(2), std::optional<std::string>("1415"));
}

// Absent Optional value is reported as std::nullopt
TEST_F(ExtractorTest, AbsentOptionalValue) {
    ExtractionResult result = extractGroups(required_optional, Raw{"3", std::nullopt});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.groups.required(1), "3");
    EXPECT_FALSE(result.groups.optional(2).has_value());
    EXPECT_EQ(result.groups.kind(2), SlotKind::Optional);
}

// Empty string is a present value, not an absent one
TEST_F(ExtractorTest, EmptyStringIsPresent) {
    ExtractionResult result = extractGroups(required_optional, Raw{"", ""});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.groups.required(1), "");
    ASSERT_TRUE(result.groups.optional(2).has_value());
    EXPECT_EQ(*result.groups.optional(2), "");
}

TEST_F(ExtractorTest, EmptySchema) {
    ExtractionResult result = extractGroups(Schema(), Raw{});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.groups.size(), 0u);
}

TEST_F(ExtractorTest, ShapeMismatch) {
    ExtractionResult result = extractGroups(required_optional, Raw{"a"});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ExtractionError::ShapeMismatch);
    EXPECT_EQ(result.expected, 2u);
    EXPECT_EQ(result.actual, 1u);
}

TEST_F(ExtractorTest, RequiredGroupAbsent) {
    ExtractionResult result = extractGroups(required_optional, Raw{std::nullopt, "x"});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ExtractionError::RequiredGroupAbsent);
    EXPECT_EQ(result.ordinal, 1);
}

// Values with a missing Required entry cannot be assembled by callers,
// and a failed extraction carries no groups
TEST_F(ExtractorTest, GroupsOnlyFromExtraction) {
    static_assert(!std::is_constructible_v<ExtractedGroups, std::vector<GroupValue>>);

    ExtractionResult result = extractGroups(required_optional, Raw{std::nullopt, "x"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.groups.size(), 0u);
    EXPECT_THROW(result.groups.required(1), std::out_of_range);
}

TEST_F(ExtractorTest, OrThrowShapeMismatch) {
    try {
        extractGroupsOrThrow(required_optional, Raw{"a", "b", "c"});
        FAIL() << "expected ShapeMismatch";
    } catch (const ShapeMismatch& e) {
        EXPECT_EQ(e.expected(), 2u);
        EXPECT_EQ(e.actual(), 3u);
    }
}

TEST_F(ExtractorTest, OrThrowRequiredGroupAbsent) {
    try {
        extractGroupsOrThrow(required_optional, Raw{std::nullopt, std::nullopt});
        FAIL() << "expected RequiredGroupAbsent";
    } catch (const RequiredGroupAbsent& e) {
        EXPECT_EQ(e.ordinal(), 1);
    }
}

// Both contract violations share a base type
TEST_F(ExtractorTest, ContractViolationBase) {
    EXPECT_THROW(extractGroupsOrThrow(required_optional, Raw{}), ContractViolation);
    EXPECT_THROW(extractGroupsOrThrow(required_optional, Raw{std::nullopt, "x"}),
                 ContractViolation);
}

// Accessors enforce ordinal range and slot kind
TEST_F(ExtractorTest, AccessorChecks) {
    ExtractedGroups groups = extractGroupsOrThrow(required_optional, Raw{"a", "b"});
    EXPECT_THROW(groups.required(0), std::out_of_range);
    EXPECT_THROW(groups.required(3), std::out_of_range);
    EXPECT_THROW(groups.required(2), std::logic_error);
    EXPECT_THROW(groups.optional(1), std::logic_error);
    EXPECT_EQ(groups.value(1), std::optional<std::string>("a"));
    EXPECT_EQ(groups.value(2), std::optional<std::string>("b"));
}

// Copies own their strings independently of the raw views
TEST_F(ExtractorTest, ValuesOwnTheirText) {
    std::string text = "2004-01";
    ExtractedGroups groups;
    {
        Raw raw{std::string_view(text).substr(0, 4), std::string_view(text).substr(5, 2)};
        groups = extractGroupsOrThrow(Schema({SlotKind::Required, SlotKind::Required}), raw);
    }
    text.assign("xxxxxxx");
    EXPECT_EQ(groups.required(1), "2004");
    EXPECT_EQ(groups.required(2), "01");
}

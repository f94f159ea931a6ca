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

#include "schema/pattern_cursor.h"
#include <gtest/gtest.h>

using namespace regshape::schema;

class PatternCursorTest : public ::testing::Test {};

// Plain escape skips backslash and the escaped character
TEST_F(PatternCursorTest, SkipEscapeTwoCharacters) {
    EXPECT_EQ(skipEscape("a\\(b", 1), 3u);
    EXPECT_EQ(skipEscape("\\d+", 0), 2u);
}

// Trailing backslash stops at the end of the pattern
TEST_F(PatternCursorTest, SkipEscapeTrailingBackslash) {
    EXPECT_EQ(skipEscape("ab\\", 2), 3u);
}

// \Q starts a quoted literal running to \E
TEST_F(PatternCursorTest, SkipEscapeQuotedLiteral) {
    // \Q(a)\E(b)
    EXPECT_EQ(skipEscape("\\Q(a)\\E(b)", 0), 7u);
}

TEST_F(PatternCursorTest, QuotedLiteralUnterminated) {
    EXPECT_EQ(skipQuotedLiteral("\\Q(a)(b)", 2), 8u);
}

// Backslashes inside \Q are literal, so the first \E ends it
TEST_F(PatternCursorTest, QuotedLiteralEndsAtFirstE) {
    // \Qa\\E(b)\E
    std::string p = "\\Qa\\\\E(b)\\E";
    EXPECT_EQ(skipQuotedLiteral(p, 2), 6u);
}

TEST_F(PatternCursorTest, BracketClassSimple) {
    // [(](a): class ends after ']'
    EXPECT_EQ(skipBracketClass("[(](a)", 1), 3u);
}

TEST_F(PatternCursorTest, BracketClassEscapedBracket) {
    // [\]](a)
    EXPECT_EQ(skipBracketClass("[\\]](a)", 1), 4u);
}

// [:name:] is skipped as a unit
TEST_F(PatternCursorTest, BracketClassPosixName) {
    EXPECT_EQ(skipBracketClass("[[:alpha:]](a)", 1), 11u);
    EXPECT_EQ(skipBracketClass("[^[:digit:]x](a)", 1), 13u);
}

// Any other '[' inside a class is a member
TEST_F(PatternCursorTest, BracketClassLiteralOpenBracket) {
    // [[]|](a): the class is "[[]"
    EXPECT_EQ(skipBracketClass("[[]|](a)", 1), 3u);
    // [[:]a](b): no ":]" after "[:", so '[' is a member
    EXPECT_EQ(skipBracketClass("[[:]a](b)", 1), 4u);
}

// ']' right after '[' or '[^' is a member, not the closer
TEST_F(PatternCursorTest, BracketClassLeadingCloseBracket) {
    EXPECT_EQ(skipBracketClass("[]|](a)", 1), 4u);
    EXPECT_EQ(skipBracketClass("[^]a](b)", 1), 5u);
}

// Inside a class \Q is not a quote opener
TEST_F(PatternCursorTest, BracketClassEscapeIsOnePair) {
    EXPECT_EQ(skipBracketClass("[\\Q](a)", 1), 4u);
}

TEST_F(PatternCursorTest, MatchingParenEndLeadingCloseBracket) {
    // ([)]) ends at the second ')' since "[)]" is a class
    EXPECT_EQ(matchingParenEnd("([)])x", 1), 5u);
    // The class in "([])] )x" is "[])]"
    EXPECT_EQ(matchingParenEnd("([])] )x", 1), 7u);
}

TEST_F(PatternCursorTest, BracketClassUnterminated) {
    EXPECT_EQ(skipBracketClass("[abc", 1), 4u);
}

TEST_F(PatternCursorTest, MatchingParenEndSimple) {
    EXPECT_EQ(matchingParenEnd("(a)b", 1), 3u);
}

TEST_F(PatternCursorTest, MatchingParenEndNested) {
    EXPECT_EQ(matchingParenEnd("((a)(b)c)(d)", 1), 9u);
}

// Parens inside classes and escapes are ignored
TEST_F(PatternCursorTest, MatchingParenEndIgnoresClassesAndEscapes) {
    EXPECT_EQ(matchingParenEnd("([)]\\))x", 1), 7u);
}

TEST_F(PatternCursorTest, MatchingParenEndUnclosed) {
    EXPECT_EQ(matchingParenEnd("(abc", 1), 4u);
}

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

#include "regex/regex.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace regshape;
using namespace regshape::regex;

class MatchIteratorTest : public ::testing::Test {};

TEST_F(MatchIteratorTest, IteratesAllMatches) {
    MatchIterator it = Regex("\\d+").findAllIn("1 22 333");
    ASSERT_TRUE(it.hasNext());
    EXPECT_EQ(it.next(), "1");
    EXPECT_EQ(it.next(), "22");
    EXPECT_EQ(it.start(), 2u);
    EXPECT_EQ(it.end(), 4u);
    EXPECT_EQ(it.next(), "333");
    EXPECT_FALSE(it.hasNext());
    EXPECT_THROW(it.next(), std::out_of_range);
}

// hasNext() looks ahead; accessors see the pending match
TEST_F(MatchIteratorTest, LookaheadPositions) {
    Regex r("(ab)(cd)");
    std::string s = "xxxabcdyyyabcdzzz";

    EXPECT_EQ(r.findAllIn(s).start(), 3u);
    EXPECT_EQ(r.findAllIn(s).start(2), 5u);

    MatchIterator it = r.findAllIn(s);
    EXPECT_TRUE(it.hasNext());
    EXPECT_EQ(it.start(), 3u);
    EXPECT_EQ(it.next(), "abcd");
    EXPECT_EQ(it.start(), 3u);
    EXPECT_TRUE(it.hasNext());
    EXPECT_EQ(it.start(), 10u);
}

// Accessors after exhaustion have no current match
TEST_F(MatchIteratorTest, NoMatchAvailable) {
    Regex r("(ab)(cd)");
    MatchIterator it = r.findAllIn("xxxabcdyyyabcdzzz");
    EXPECT_EQ(it.next(), "abcd");
    EXPECT_EQ(it.next(), "abcd");
    EXPECT_EQ(it.start(), 10u);
    EXPECT_THROW(it.next(), std::out_of_range);
    EXPECT_THROW(it.start(), std::logic_error);

    MatchIterator empty = r.findAllIn("");
    EXPECT_THROW(empty.start(), std::logic_error);
    EXPECT_THROW(empty.next(), std::out_of_range);
}

TEST_F(MatchIteratorTest, GroupsWithoutNext) {
    MatchIterator it = Regex("(foo)-(.*)").findAllIn("foo-abc-def");
    EXPECT_EQ(it.group(1), std::optional<std::string>("foo"));
    EXPECT_EQ(it.group(2), std::optional<std::string>("abc-def"));
    EXPECT_EQ(it.groupCount(), 2);
}

TEST_F(MatchIteratorTest, EndOfFirstMatch) {
    MatchIterator it = Regex(" ").findAllIn("this is a test");
    EXPECT_EQ(it.end(), 5u);
}

TEST_F(MatchIteratorTest, NamedGroupAccess) {
    Regex r("a(?P<Bar>b*)c", {"Bee"});
    MatchIterator it = r.findAllIn("stuff abbbc more abc and so on");
    EXPECT_EQ(it.next(), "abbbc");
    EXPECT_EQ(it.current().group("Bee"), std::optional<std::string>("bbb"));
    EXPECT_EQ(it.current().group("Bar"), std::optional<std::string>("bbb"));
    EXPECT_EQ(it.next(), "abc");
    EXPECT_EQ(it.current().group("Bee"), std::optional<std::string>("b"));
    EXPECT_THROW(it.current().group("Nope"), UnknownGroupName);
    EXPECT_FALSE(it.hasNext());
}

// Empty matches advance by one character and may follow a non-empty match
TEST_F(MatchIteratorTest, EmptyMatches) {
    std::vector<Match> ms = Regex("a*").findAllMatchIn("baaa");
    ASSERT_EQ(ms.size(), 3u);
    EXPECT_EQ(ms[0].matched(), "");
    EXPECT_EQ(ms[0].start(), 0u);
    EXPECT_EQ(ms[1].matched(), "aaa");
    EXPECT_EQ(ms[1].start(), 1u);
    EXPECT_EQ(ms[2].matched(), "");
    EXPECT_EQ(ms[2].start(), 4u);
}

// UTF-8 patterns never split a code point
TEST_F(MatchIteratorTest, EmptyMatchesStepByCodePoint) {
    std::vector<Match> ms = Regex("x*").findAllMatchIn("\xC3\xA9");
    ASSERT_EQ(ms.size(), 2u);
    EXPECT_EQ(ms[0].start(), 0u);
    EXPECT_EQ(ms[1].start(), 2u);
}

TEST_F(MatchIteratorTest, EmptyMatchesStepByByteForLatin1) {
    api::PatternOptions latin1;
    latin1.utf8 = false;
    std::vector<Match> ms = Regex("x*", {}, latin1).findAllMatchIn("\xC3\xA9");
    EXPECT_EQ(ms.size(), 3u);
}

// matchData drains only what next() has not returned
TEST_F(MatchIteratorTest, MatchDataDrainsRemaining) {
    MatchIterator it = Regex("(\\d+)/(\\d+)/(\\d+)")
        .findAllIn("1/1/2001 marks the start. 31/12/2000 doesn't.");
    std::vector<Match> all = it.matchData();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].group(3), std::optional<std::string>("2001"));
    EXPECT_EQ(all[1].group(1), std::optional<std::string>("31"));
    EXPECT_FALSE(it.hasNext());
    EXPECT_TRUE(it.matchData().empty());
}

// Matches stay valid after the iterator is gone
TEST_F(MatchIteratorTest, MatchesOutliveIterator) {
    std::vector<Match> ms;
    {
        Regex r("(ab)(cd)");
        ms = r.findAllMatchIn("xxxabcdyyyabcdzzz");
    }
    ASSERT_EQ(ms.size(), 2u);
    EXPECT_EQ(ms[0].start(), 3u);
    EXPECT_EQ(ms[1].start(), 10u);
    EXPECT_EQ(ms[1].matched(), "abcd");
}

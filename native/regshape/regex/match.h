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

#pragma once

#include "regex/compiled_pattern.h"
#include "regex/group_names.h"
#include <re2/re2.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace regshape {
namespace regex {

/**
 * One successful match.
 *
 * Holds its own reference to the source text and to the pattern, so it
 * stays valid after the Regex or iterator that produced it is gone.
 * Offsets are byte offsets into the source.
 */
class Match {
public:
    static constexpr size_t npos = std::string::npos;

    using Span = std::optional<std::pair<size_t, size_t>>;

    /**
     * @param source shared source text
     * @param pattern pattern that produced the match
     * @param names group name table
     * @param spans spans[0] is the overall match, spans[k] group k
     */
    Match(std::shared_ptr<const std::string> source,
          std::shared_ptr<const CompiledPattern> pattern,
          std::shared_ptr<const GroupNames> names,
          std::vector<Span> spans);

    /**
     * Run one match attempt.
     *
     * The whole source is the match context (so ^ and \b see the text
     * before startpos).
     *
     * @param startpos byte offset to start searching from
     * @param anchor ANCHOR_BOTH (full), ANCHOR_START (prefix) or UNANCHORED (find)
     * @return the match, or std::nullopt
     */
    static std::optional<Match> execute(
        const std::shared_ptr<const CompiledPattern>& pattern,
        const std::shared_ptr<const GroupNames>& names,
        const std::shared_ptr<const std::string>& source,
        size_t startpos,
        RE2::Anchor anchor);

    size_t start() const { return spans_[0]->first; }
    size_t end() const { return spans_[0]->second; }

    /**
     * Start of group k (0 = whole match), npos if it did not participate.
     *
     * @throws std::out_of_range if k > groupCount()
     */
    size_t start(int k) const;
    size_t end(int k) const;

    std::string matched() const;

    /**
     * Text of group k (0 = whole match).
     *
     * @return std::nullopt if the group did not participate
     * @throws std::out_of_range if k is negative or > groupCount()
     */
    std::optional<std::string> group(int k) const;

    /**
     * Text of a named group.
     *
     * @throws UnknownGroupName if the name resolves to no group
     */
    std::optional<std::string> group(const std::string& name) const;

    int groupCount() const { return static_cast<int>(spans_.size()) - 1; }

    // Text before the match / after the match.
    std::string before() const;
    std::string after() const;

    /**
     * Per-group values for groups 1..groupCount(), as views into the
     * source (valid while this Match is alive).
     */
    std::vector<std::optional<std::string_view>> rawGroups() const;

    const std::string& source() const { return *source_; }
    const std::shared_ptr<const CompiledPattern>& compiledPattern() const { return pattern_; }
    const GroupNames& groupNames() const { return *names_; }

private:
    const Span& span(int k) const;

    std::shared_ptr<const std::string> source_;
    std::shared_ptr<const CompiledPattern> pattern_;
    std::shared_ptr<const GroupNames> names_;
    std::vector<Span> spans_;
};

}  // namespace regex
}  // namespace regshape

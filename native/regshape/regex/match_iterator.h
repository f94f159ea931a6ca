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

#include "regex/match.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regshape {
namespace regex {

/**
 * Successive non-overlapping matches over one source text.
 *
 * After a non-empty match the search resumes at its end; after an empty
 * match it resumes one character later (one UTF-8 code point, or one
 * byte for Latin-1 patterns).
 *
 * Not thread-safe; one iterator per consumer.
 */
class MatchIterator {
public:
    MatchIterator(std::shared_ptr<const CompiledPattern> pattern,
                  std::shared_ptr<const GroupNames> names,
                  std::shared_ptr<const std::string> source);

    /**
     * True if another match exists. Idempotent until next() is called.
     */
    bool hasNext();

    /**
     * Advance to the next match.
     *
     * @return matched text
     * @throws std::out_of_range if there are no more matches
     */
    std::string next();

    /**
     * Current match (the one returned by the last next(), or the one
     * found by a pending hasNext()).
     *
     * @throws std::logic_error if there is no current match
     */
    const Match& current();

    size_t start() { return current().start(); }
    size_t start(int k) { return current().start(k); }
    size_t end() { return current().end(); }
    size_t end(int k) { return current().end(k); }
    int groupCount() { return current().groupCount(); }
    std::optional<std::string> group(int k) { return current().group(k); }

    /**
     * Drain the remaining matches.
     *
     * @return all matches not yet returned by next()
     */
    std::vector<Match> matchData();

    const std::string& source() const { return *source_; }

private:
    enum class State {
        Unknown,    // no lookahead performed
        Pending,    // hasNext() found a match not yet consumed
        Consumed,   // next() returned the current match
        Exhausted   // no more matches
    };

    bool find();
    size_t advancePast(size_t pos) const;

    std::shared_ptr<const CompiledPattern> pattern_;
    std::shared_ptr<const GroupNames> names_;
    std::shared_ptr<const std::string> source_;

    State state_ = State::Unknown;
    std::optional<Match> current_;
    size_t search_pos_ = 0;
    bool done_ = false;
};

}  // namespace regex
}  // namespace regshape

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

#include "regex/match_iterator.h"
#include <stdexcept>

namespace regshape {
namespace regex {

MatchIterator::MatchIterator(std::shared_ptr<const CompiledPattern> pattern,
                             std::shared_ptr<const GroupNames> names,
                             std::shared_ptr<const std::string> source)
    : pattern_(std::move(pattern)),
      names_(std::move(names)),
      source_(std::move(source)) {}

bool MatchIterator::hasNext() {
    switch (state_) {
        case State::Unknown:
        case State::Consumed:
            state_ = find() ? State::Pending : State::Exhausted;
            break;
        case State::Pending:
        case State::Exhausted:
            break;
    }
    return state_ == State::Pending;
}

std::string MatchIterator::next() {
    if (!hasNext()) {
        throw std::out_of_range("No more matches");
    }
    state_ = State::Consumed;
    return current_->matched();
}

const Match& MatchIterator::current() {
    switch (state_) {
        case State::Unknown:
            if (!hasNext()) {
                throw std::logic_error("No match available");
            }
            break;
        case State::Pending:
        case State::Consumed:
            break;
        case State::Exhausted:
            throw std::logic_error("No match available");
    }
    return *current_;
}

std::vector<Match> MatchIterator::matchData() {
    std::vector<Match> matches;
    while (hasNext()) {
        next();
        matches.push_back(*current_);
    }
    return matches;
}

size_t MatchIterator::advancePast(size_t pos) const {
    const std::string& text = *source_;
    if (pos >= text.size()) {
        return pos + 1;
    }
    if (!pattern_->options.utf8) {
        return pos + 1;
    }

    // Skip the lead byte and any continuation bytes (10xxxxxx)
    size_t next = pos + 1;
    while (next < text.size() &&
           (static_cast<unsigned char>(text[next]) & 0xC0) == 0x80) {
        next++;
    }
    return next;
}

bool MatchIterator::find() {
    if (done_) {
        return false;
    }

    current_ = Match::execute(pattern_, names_, source_, search_pos_, RE2::UNANCHORED);
    if (!current_) {
        done_ = true;
        return false;
    }

    if (current_->start() == current_->end()) {
        search_pos_ = advancePast(current_->end());
    } else {
        search_pos_ = current_->end();
    }
    if (search_pos_ > source_->size()) {
        done_ = true;
    }

    return true;
}

}  // namespace regex
}  // namespace regshape

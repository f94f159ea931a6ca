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

#include "regex/match.h"
#include <stdexcept>

namespace regshape {
namespace regex {

Match::Match(std::shared_ptr<const std::string> source,
             std::shared_ptr<const CompiledPattern> pattern,
             std::shared_ptr<const GroupNames> names,
             std::vector<Span> spans)
    : source_(std::move(source)),
      pattern_(std::move(pattern)),
      names_(std::move(names)),
      spans_(std::move(spans)) {}

std::optional<Match> Match::execute(
    const std::shared_ptr<const CompiledPattern>& pattern,
    const std::shared_ptr<const GroupNames>& names,
    const std::shared_ptr<const std::string>& source,
    size_t startpos,
    RE2::Anchor anchor) {

    const std::string& text = *source;
    if (startpos > text.size()) {
        return std::nullopt;
    }

    // Per-call buffer: RE2 matching is const and thread-safe
    const int nsubmatch = 1 + pattern->groupCount();
    std::vector<re2::StringPiece> submatch(nsubmatch);

    bool found = pattern->re2().Match(text, startpos, text.size(), anchor,
                                      submatch.data(), nsubmatch);
    if (!found) {
        return std::nullopt;
    }

    std::vector<Span> spans;
    spans.reserve(nsubmatch);
    for (const re2::StringPiece& sp : submatch) {
        if (sp.data() == nullptr) {
            spans.emplace_back(std::nullopt);
        } else {
            size_t s = static_cast<size_t>(sp.data() - text.data());
            spans.emplace_back(std::make_pair(s, s + sp.size()));
        }
    }

    return Match(source, pattern, names, std::move(spans));
}

const Match::Span& Match::span(int k) const {
    if (k < 0 || k > groupCount()) {
        throw std::out_of_range("No group " + std::to_string(k) + " (pattern has " +
                                std::to_string(groupCount()) + " capturing group(s))");
    }
    return spans_[k];
}

size_t Match::start(int k) const {
    const Span& s = span(k);
    return s ? s->first : npos;
}

size_t Match::end(int k) const {
    const Span& s = span(k);
    return s ? s->second : npos;
}

std::string Match::matched() const {
    return source_->substr(start(), end() - start());
}

std::optional<std::string> Match::group(int k) const {
    const Span& s = span(k);
    if (!s) {
        return std::nullopt;
    }
    return source_->substr(s->first, s->second - s->first);
}

std::optional<std::string> Match::group(const std::string& name) const {
    return group(names_->indexOf(name));
}

std::string Match::before() const {
    return source_->substr(0, start());
}

std::string Match::after() const {
    return source_->substr(end());
}

std::vector<std::optional<std::string_view>> Match::rawGroups() const {
    std::vector<std::optional<std::string_view>> raw;
    raw.reserve(spans_.size() - 1);

    std::string_view text(*source_);
    for (size_t k = 1; k < spans_.size(); k++) {
        if (spans_[k]) {
            raw.emplace_back(text.substr(spans_[k]->first, spans_[k]->second - spans_[k]->first));
        } else {
            raw.emplace_back(std::nullopt);
        }
    }
    return raw;
}

}  // namespace regex
}  // namespace regshape

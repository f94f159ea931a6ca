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
#include "regshape_api.h"
#include <stdexcept>

namespace regshape {
namespace regex {

//============================================================================
// Construction
//============================================================================

Regex::Regex(const std::string& pattern,
             std::vector<std::string> group_names,
             const api::PatternOptions& options)
    : Regex(api::compile(pattern, options), std::move(group_names)) {}

Regex::Regex(std::shared_ptr<const CompiledPattern> compiled,
             std::vector<std::string> group_names)
    : compiled_(std::move(compiled)) {
    if (!compiled_) {
        throw std::invalid_argument("Regex requires a compiled pattern");
    }
    names_ = std::make_shared<const GroupNames>(compiled_->re2(), std::move(group_names));
}

Regex::Regex(std::shared_ptr<const CompiledPattern> compiled,
             std::shared_ptr<const GroupNames> names,
             bool anchored)
    : compiled_(std::move(compiled)),
      names_(std::move(names)),
      anchored_(anchored) {}

std::optional<Match> Regex::execute(std::string_view text, RE2::Anchor anchor) const {
    auto source = std::make_shared<const std::string>(text);
    return Match::execute(compiled_, names_, source, 0, anchor);
}

//============================================================================
// Whole-input matching
//============================================================================

bool Regex::matches(std::string_view text) const {
    RE2::Anchor anchor = anchored_ ? RE2::ANCHOR_BOTH : RE2::UNANCHORED;
    return compiled_->re2().Match(text, 0, text.size(), anchor, nullptr, 0);
}

std::optional<schema::ExtractedGroups> Regex::unapply(std::string_view text) const {
    std::optional<Match> m = execute(text, anchored_ ? RE2::ANCHOR_BOTH : RE2::UNANCHORED);
    if (!m) {
        return std::nullopt;
    }
    return schema::extractGroupsOrThrow(schema(), m->rawGroups());
}

std::optional<schema::ExtractedGroups> Regex::unapply(const Match& m) const {
    if (m.compiledPattern() == compiled_) {
        return schema::extractGroupsOrThrow(schema(), m.rawGroups());
    }
    return unapply(m.matched());
}

void Regex::checkFieldKinds(const std::vector<schema::SlotKind>& kinds) const {
    const schema::Schema& s = schema();

    if (kinds.size() != s.count()) {
        throw ShapeMismatch(s.count(), kinds.size(),
                            "declared " + std::to_string(kinds.size()) +
                            " field(s) for schema " + s.toString());
    }

    for (size_t i = 0; i < kinds.size(); i++) {
        if (kinds[i] != s.slots()[i].kind) {
            throw ShapeMismatch(s.count(), kinds.size(),
                                "field " + std::to_string(i + 1) + " declared " +
                                schema::slotKindName(kinds[i]) + " but group " +
                                std::to_string(i + 1) + " is " +
                                schema::slotKindName(s.slots()[i].kind));
        }
    }
}

//============================================================================
// Search
//============================================================================

std::optional<std::string> Regex::findFirstIn(std::string_view text) const {
    std::optional<Match> m = execute(text, RE2::UNANCHORED);
    if (!m) {
        return std::nullopt;
    }
    return m->matched();
}

std::optional<Match> Regex::findFirstMatchIn(std::string_view text) const {
    return execute(text, RE2::UNANCHORED);
}

std::optional<std::string> Regex::findPrefixOf(std::string_view text) const {
    std::optional<Match> m = execute(text, RE2::ANCHOR_START);
    if (!m) {
        return std::nullopt;
    }
    return m->matched();
}

std::optional<Match> Regex::findPrefixMatchOf(std::string_view text) const {
    return execute(text, RE2::ANCHOR_START);
}

MatchIterator Regex::findAllIn(std::string_view text) const {
    return MatchIterator(compiled_, names_, std::make_shared<const std::string>(text));
}

std::vector<Match> Regex::findAllMatchIn(std::string_view text) const {
    return findAllIn(text).matchData();
}

//============================================================================
// Replace / split
//============================================================================

std::string Regex::applyRewrite(const Match& m, std::string_view rewrite) const {
    const RE2& re = compiled_->re2();

    std::string error;
    if (!re.CheckRewriteString(rewrite, &error)) {
        throw std::invalid_argument("Invalid rewrite string \"" + std::string(rewrite) +
                                    "\": " + error);
    }

    const std::string& text = m.source();
    std::vector<re2::StringPiece> vec;
    vec.reserve(m.groupCount() + 1);
    for (int k = 0; k <= m.groupCount(); k++) {
        size_t s = m.start(k);
        if (s == Match::npos) {
            vec.emplace_back();
        } else {
            vec.emplace_back(text.data() + s, m.end(k) - s);
        }
    }

    std::string out;
    if (!re.Rewrite(&out, rewrite, vec.data(), static_cast<int>(vec.size()))) {
        throw std::invalid_argument("Invalid rewrite string \"" + std::string(rewrite) + "\"");
    }
    return out;
}

std::string Regex::replaceSomeIn(
    std::string_view text,
    const std::function<std::optional<std::string>(const Match&)>& replacer) const {

    MatchIterator it = findAllIn(text);
    const std::string& source = it.source();

    std::string out;
    size_t last = 0;

    while (it.hasNext()) {
        it.next();
        const Match& m = it.current();

        std::optional<std::string> rewrite = replacer(m);
        if (!rewrite) {
            continue;
        }

        out.append(source, last, m.start() - last);
        out += applyRewrite(m, *rewrite);
        last = m.end();
    }

    out.append(source, last, std::string::npos);
    return out;
}

std::string Regex::replaceAllIn(
    std::string_view text,
    const std::function<std::string(const Match&)>& replacer) const {
    return replaceSomeIn(text, [&replacer](const Match& m) -> std::optional<std::string> {
        return replacer(m);
    });
}

std::string Regex::replaceAllIn(std::string_view text, std::string_view rewrite) const {
    std::string r(rewrite);
    return replaceSomeIn(text, [&r](const Match&) -> std::optional<std::string> {
        return r;
    });
}

std::string Regex::replaceFirstIn(std::string_view text, std::string_view rewrite) const {
    std::optional<Match> m = execute(text, RE2::UNANCHORED);
    if (!m) {
        return std::string(text);
    }

    const std::string& source = m->source();
    std::string out = source.substr(0, m->start());
    out += applyRewrite(*m, rewrite);
    out.append(source, m->end(), std::string::npos);
    return out;
}

std::vector<std::string> Regex::split(std::string_view text) const {
    MatchIterator it = findAllIn(text);
    const std::string& source = it.source();

    std::vector<std::string> pieces;
    size_t index = 0;

    while (it.hasNext()) {
        it.next();
        const Match& m = it.current();

        // No leading empty piece for a zero-width match at the start
        if (index == 0 && m.start() == 0 && m.end() == 0) {
            continue;
        }

        pieces.push_back(source.substr(index, m.start() - index));
        index = m.end();
    }

    if (index == 0) {
        return {source};
    }

    pieces.push_back(source.substr(index));

    while (!pieces.empty() && pieces.back().empty()) {
        pieces.pop_back();
    }
    return pieces;
}

//============================================================================
// Variants / helpers
//============================================================================

Regex Regex::unanchored() const {
    return Regex(compiled_, names_, false);
}

Regex Regex::anchored() const {
    return Regex(compiled_, names_, true);
}

std::string Regex::quote(std::string_view text) {
    return RE2::QuoteMeta(text);
}

std::string Regex::quoteReplacement(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

}  // namespace regex
}  // namespace regshape

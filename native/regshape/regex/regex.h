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

#include "errors.h"
#include "pattern_options.h"
#include "regex/compiled_pattern.h"
#include "regex/group_names.h"
#include "regex/match.h"
#include "regex/match_iterator.h"
#include "schema/extractor.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace regshape {
namespace regex {

//============================================================================
// Typed field mapping for unapplyAs
//============================================================================

template <typename T>
struct FieldKind {
    static_assert(sizeof(T) == 0,
                  "unapplyAs fields must be std::string or std::optional<std::string>");
};

template <>
struct FieldKind<std::string> {
    static constexpr schema::SlotKind kind = schema::SlotKind::Required;
    static std::string get(const schema::ExtractedGroups& g, int ordinal) {
        return g.required(ordinal);
    }
};

template <>
struct FieldKind<std::optional<std::string>> {
    static constexpr schema::SlotKind kind = schema::SlotKind::Optional;
    static std::optional<std::string> get(const schema::ExtractedGroups& g, int ordinal) {
        return g.optional(ordinal);
    }
};

/**
 * Regular expression with a registration-time Schema.
 *
 * Immutable value; copies share the compiled pattern. Safe to use from
 * multiple threads.
 *
 * Matching modes:
 * - anchored (default): matches()/unapply() require the entire input
 * - unanchored(): matches()/unapply() accept a match anywhere
 * findPrefix* always anchor at the start; find* and replace* search.
 *
 * Rewrite strings use RE2 syntax: \0 whole match, \1..\9 groups, \\ backslash.
 */
class Regex {
public:
    /**
     * Compile (through the pattern cache when it is initialized).
     *
     * @param pattern regex source
     * @param group_names fallback names, group_names[i] names group i+1
     * @param options compile options
     * @throws SyntaxError
     * @throws UnsupportedPattern
     */
    explicit Regex(const std::string& pattern,
                   std::vector<std::string> group_names = {},
                   const api::PatternOptions& options = api::PatternOptions::defaults());

    explicit Regex(std::shared_ptr<const CompiledPattern> compiled,
                   std::vector<std::string> group_names = {});

    const std::string& pattern() const { return compiled_->pattern_string; }
    const std::string& toString() const { return compiled_->pattern_string; }
    const schema::Schema& schema() const { return compiled_->schema; }
    const GroupNames& groupNames() const { return *names_; }
    const std::shared_ptr<const CompiledPattern>& compiledPattern() const { return compiled_; }

    bool isAnchored() const { return anchored_; }

    // ========== Whole-input matching ==========

    bool matches(std::string_view text) const;

    /**
     * Match and extract groups shaped by schema().
     *
     * @return groups, or std::nullopt if the text does not match
     * @throws ContractViolation if the match disagrees with the schema
     */
    std::optional<schema::ExtractedGroups> unapply(std::string_view text) const;

    /**
     * Extract from an existing Match. Reuses its groups when it came from
     * this pattern; otherwise matches m.matched() again.
     */
    std::optional<schema::ExtractedGroups> unapply(const Match& m) const;

    /**
     * Typed extraction.
     *
     *   Regex date("(\\d{4})-(\\d{2})");
     *   auto ym = date.unapplyAs<std::string, std::string>("2004-01");
     *
     * Each field is std::string for a Required slot and
     * std::optional<std::string> for an Optional slot.
     *
     * @throws ShapeMismatch if the field list does not fit schema()
     */
    template <typename... Fields>
    std::optional<std::tuple<Fields...>> unapplyAs(std::string_view text) const {
        checkFieldKinds({FieldKind<Fields>::kind...});

        std::optional<schema::ExtractedGroups> groups = unapply(text);
        if (!groups) {
            return std::nullopt;
        }
        return buildTuple<Fields...>(*groups, std::index_sequence_for<Fields...>{});
    }

    // ========== Search ==========

    std::optional<std::string> findFirstIn(std::string_view text) const;
    std::optional<Match> findFirstMatchIn(std::string_view text) const;
    std::optional<std::string> findPrefixOf(std::string_view text) const;
    std::optional<Match> findPrefixMatchOf(std::string_view text) const;

    MatchIterator findAllIn(std::string_view text) const;
    std::vector<Match> findAllMatchIn(std::string_view text) const;

    // ========== Replace / split ==========

    /**
     * @throws std::invalid_argument if rewrite is malformed or refers to a
     *         group the pattern does not have
     */
    std::string replaceAllIn(std::string_view text, std::string_view rewrite) const;
    std::string replaceAllIn(std::string_view text,
                             const std::function<std::string(const Match&)>& replacer) const;

    /**
     * Replace only the matches for which replacer returns a rewrite.
     */
    std::string replaceSomeIn(
        std::string_view text,
        const std::function<std::optional<std::string>(const Match&)>& replacer) const;

    std::string replaceFirstIn(std::string_view text, std::string_view rewrite) const;

    /**
     * Split around matches.
     *
     * A zero-width match at the start yields no leading empty piece;
     * trailing empty pieces are removed; no match yields {text}.
     */
    std::vector<std::string> split(std::string_view text) const;

    // ========== Variants ==========

    Regex unanchored() const;
    Regex anchored() const;

    // ========== Helpers ==========

    // Escape all regex metacharacters (RE2::QuoteMeta).
    static std::string quote(std::string_view text);

    // Escape a literal for use as a rewrite string.
    static std::string quoteReplacement(std::string_view text);

private:
    Regex(std::shared_ptr<const CompiledPattern> compiled,
          std::shared_ptr<const GroupNames> names,
          bool anchored);

    std::optional<Match> execute(std::string_view text, RE2::Anchor anchor) const;

    std::string applyRewrite(const Match& m, std::string_view rewrite) const;

    void checkFieldKinds(const std::vector<schema::SlotKind>& kinds) const;

    template <typename... Fields, size_t... I>
    static std::tuple<Fields...> buildTuple(const schema::ExtractedGroups& groups,
                                            std::index_sequence<I...>) {
        return std::tuple<Fields...>(FieldKind<Fields>::get(groups, static_cast<int>(I) + 1)...);
    }

    std::shared_ptr<const CompiledPattern> compiled_;
    std::shared_ptr<const GroupNames> names_;
    bool anchored_ = true;
};

}  // namespace regex
}  // namespace regshape

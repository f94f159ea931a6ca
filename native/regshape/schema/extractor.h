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

#include "schema/schema.h"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace regshape {
namespace schema {

//============================================================================
// Extracted values
//============================================================================

/**
 * One extracted field. A Required field always holds a value.
 */
struct GroupValue {
    SlotKind kind = SlotKind::Required;
    std::optional<std::string> value;

    bool operator==(const GroupValue& other) const = default;
};

struct ExtractionResult;

/**
 * Group values shaped exactly like a Schema.
 *
 * Ordinals are 1-based, matching the schema's slots. Only extractGroups()
 * builds a non-empty set, so every Required value is present.
 */
class ExtractedGroups {
public:
    ExtractedGroups() = default;

    size_t size() const { return values_.size(); }
    const std::vector<GroupValue>& values() const { return values_; }

    /**
     * Value of a Required slot.
     *
     * @throws std::out_of_range if ordinal is not a slot
     * @throws std::logic_error if the slot is Optional
     */
    const std::string& required(int ordinal) const;

    /**
     * Value of an Optional slot (std::nullopt when the group did not participate).
     *
     * @throws std::out_of_range if ordinal is not a slot
     * @throws std::logic_error if the slot is Required
     */
    const std::optional<std::string>& optional(int ordinal) const;

    // Value of any slot, regardless of kind.
    const std::optional<std::string>& value(int ordinal) const;

    SlotKind kind(int ordinal) const { return at(ordinal).kind; }

    bool operator==(const ExtractedGroups& other) const = default;

private:
    friend ExtractionResult extractGroups(
        const Schema& schema,
        const std::vector<std::optional<std::string_view>>& raw);

    explicit ExtractedGroups(std::vector<GroupValue> values)
        : values_(std::move(values)) {}

    const GroupValue& at(int ordinal) const;

    std::vector<GroupValue> values_;
};

//============================================================================
// Extraction
//============================================================================

enum class ExtractionError {
    None,
    ShapeMismatch,          // raw group count differs from the schema
    RequiredGroupAbsent     // a Required slot received no value
};

struct ExtractionResult {
    ExtractionError error = ExtractionError::None;
    std::string detail;

    // Set for RequiredGroupAbsent
    int ordinal = 0;

    // Set for ShapeMismatch
    size_t expected = 0;
    size_t actual = 0;

    ExtractedGroups groups;

    bool ok() const { return error == ExtractionError::None; }
};

/**
 * Map raw per-group results onto a Schema.
 *
 * raw[i] is the value of capturing group i+1, std::nullopt when the group
 * did not participate. Values are copied; raw may point into a temporary
 * buffer.
 *
 * @param schema schema of the pattern that produced raw
 * @param raw one entry per capturing group
 * @return groups on success, or the first contract violation found
 */
ExtractionResult extractGroups(const Schema& schema,
                               const std::vector<std::optional<std::string_view>>& raw);

/**
 * As extractGroups(), but a violation is reported on stderr and thrown.
 *
 * @throws ShapeMismatch
 * @throws RequiredGroupAbsent
 */
ExtractedGroups extractGroupsOrThrow(const Schema& schema,
                                     const std::vector<std::optional<std::string_view>>& raw);

}  // namespace schema
}  // namespace regshape

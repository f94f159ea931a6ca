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
#include <iostream>
#include <stdexcept>

namespace regshape {
namespace schema {

const GroupValue& ExtractedGroups::at(int ordinal) const {
    if (ordinal < 1 || static_cast<size_t>(ordinal) > values_.size()) {
        throw std::out_of_range("No capturing group " + std::to_string(ordinal) +
                                " (extracted " + std::to_string(values_.size()) + ")");
    }
    return values_[ordinal - 1];
}

const std::string& ExtractedGroups::required(int ordinal) const {
    const GroupValue& v = at(ordinal);
    if (v.kind != SlotKind::Required) {
        throw std::logic_error("Capturing group " + std::to_string(ordinal) + " is Optional");
    }
    return *v.value;
}

const std::optional<std::string>& ExtractedGroups::optional(int ordinal) const {
    const GroupValue& v = at(ordinal);
    if (v.kind != SlotKind::Optional) {
        throw std::logic_error("Capturing group " + std::to_string(ordinal) + " is Required");
    }
    return v.value;
}

const std::optional<std::string>& ExtractedGroups::value(int ordinal) const {
    return at(ordinal).value;
}

ExtractionResult extractGroups(const Schema& schema,
                               const std::vector<std::optional<std::string_view>>& raw) {
    ExtractionResult result;

    if (raw.size() != schema.count()) {
        result.error = ExtractionError::ShapeMismatch;
        result.expected = schema.count();
        result.actual = raw.size();
        result.detail = "schema " + schema.toString() + " received " +
                        std::to_string(raw.size()) + " raw group(s)";
        return result;
    }

    std::vector<GroupValue> values;
    values.reserve(raw.size());

    for (const Slot& slot : schema.slots()) {
        const std::optional<std::string_view>& v = raw[slot.ordinal - 1];

        if (slot.kind == SlotKind::Required && !v.has_value()) {
            result.error = ExtractionError::RequiredGroupAbsent;
            result.ordinal = slot.ordinal;
            result.detail = "Required capturing group " + std::to_string(slot.ordinal) +
                            " did not participate in the match";
            return result;
        }

        GroupValue gv;
        gv.kind = slot.kind;
        if (v.has_value()) {
            gv.value = std::string(*v);
        }
        values.push_back(std::move(gv));
    }

    result.groups = ExtractedGroups(std::move(values));
    return result;
}

ExtractedGroups extractGroupsOrThrow(const Schema& schema,
                                     const std::vector<std::optional<std::string_view>>& raw) {
    ExtractionResult result = extractGroups(schema, raw);

    switch (result.error) {
        case ExtractionError::None:
            return std::move(result.groups);

        case ExtractionError::ShapeMismatch:
            std::cerr << "REGSHAPE CONTRACT VIOLATION: " << result.detail << std::endl;
            throw ShapeMismatch(result.expected, result.actual, result.detail);

        case ExtractionError::RequiredGroupAbsent:
            std::cerr << "REGSHAPE CONTRACT VIOLATION: " << result.detail
                      << " (schema " << schema.toString() << ")" << std::endl;
            throw RequiredGroupAbsent(result.ordinal);
    }

    throw std::logic_error("Unknown extraction error");
}

}  // namespace schema
}  // namespace regshape

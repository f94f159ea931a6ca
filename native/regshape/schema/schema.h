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

#include <cstddef>
#include <string>
#include <vector>

namespace regshape {
namespace schema {

enum class SlotKind {
    Required,   // present on every successful match
    Optional    // may not participate
};

const char* slotKindName(SlotKind kind);

/**
 * Classification of one capturing group.
 *
 * ordinal is 1-based and equals RE2's group number.
 */
struct Slot {
    int ordinal = 0;
    SlotKind kind = SlotKind::Required;

    bool operator==(const Slot& other) const = default;
};

/**
 * Shape of the capturing groups of one pattern.
 *
 * Slots are ordered by the position of their opening '(' and numbered
 * 1..count(). Immutable once built; safe to share between threads.
 */
class Schema {
public:
    Schema() = default;

    /**
     * Build from slot kinds in textual order (ordinals assigned 1..n).
     */
    explicit Schema(const std::vector<SlotKind>& kinds);

    size_t count() const { return slots_.size(); }
    bool empty() const { return slots_.empty(); }

    const std::vector<Slot>& slots() const { return slots_; }

    /**
     * Slot by 1-based ordinal.
     *
     * @throws std::out_of_range if ordinal not in [1, count()]
     */
    const Slot& slot(int ordinal) const;

    size_t requiredCount() const;
    size_t optionalCount() const;

    bool operator==(const Schema& other) const = default;

    /**
     * Human-readable shape, e.g. "(Required, Optional)".
     */
    std::string toString() const;

    /**
     * JSON form:
     * {
     *   "count": 2,
     *   "slots": [{"ordinal": 1, "kind": "Required"},
     *             {"ordinal": 2, "kind": "Optional"}]
     * }
     */
    std::string toJson() const;

private:
    std::vector<Slot> slots_;
};

}  // namespace schema
}  // namespace regshape

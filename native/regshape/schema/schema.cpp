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

#include "schema/schema.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace regshape {
namespace schema {

const char* slotKindName(SlotKind kind) {
    return kind == SlotKind::Required ? "Required" : "Optional";
}

Schema::Schema(const std::vector<SlotKind>& kinds) {
    slots_.reserve(kinds.size());
    int ordinal = 1;
    for (SlotKind kind : kinds) {
        slots_.push_back(Slot{ordinal++, kind});
    }
}

const Slot& Schema::slot(int ordinal) const {
    if (ordinal < 1 || static_cast<size_t>(ordinal) > slots_.size()) {
        throw std::out_of_range("No capturing group " + std::to_string(ordinal) +
                                " (pattern has " + std::to_string(slots_.size()) + ")");
    }
    return slots_[ordinal - 1];
}

size_t Schema::requiredCount() const {
    return std::count_if(slots_.begin(), slots_.end(),
        [](const Slot& s) { return s.kind == SlotKind::Required; });
}

size_t Schema::optionalCount() const {
    return slots_.size() - requiredCount();
}

std::string Schema::toString() const {
    std::string out = "(";
    for (size_t i = 0; i < slots_.size(); i++) {
        if (i > 0) {
            out += ", ";
        }
        out += slotKindName(slots_[i].kind);
    }
    out += ")";
    return out;
}

std::string Schema::toJson() const {
    json j;
    j["count"] = slots_.size();

    json slots = json::array();
    for (const Slot& s : slots_) {
        slots.push_back({{"ordinal", s.ordinal}, {"kind", slotKindName(s.kind)}});
    }
    j["slots"] = slots;

    return j.dump();
}

}  // namespace schema
}  // namespace regshape

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

#include "regex/group_names.h"
#include "errors.h"
#include <algorithm>

namespace regshape {
namespace regex {

GroupNames::GroupNames(const RE2& regex, std::vector<std::string> declared)
    : inline_(regex.NamedCapturingGroups()),
      declared_(std::move(declared)),
      group_count_(regex.NumberOfCapturingGroups()) {}

int GroupNames::indexOf(const std::string& name) const {
    auto it = inline_.find(name);
    if (it != inline_.end()) {
        return it->second;
    }

    auto d = std::find(declared_.begin(), declared_.end(), name);
    if (d != declared_.end()) {
        int ordinal = static_cast<int>(d - declared_.begin()) + 1;
        if (ordinal <= group_count_) {
            return ordinal;
        }
    }

    throw UnknownGroupName(name);
}

}  // namespace regex
}  // namespace regshape

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

#include <re2/re2.h>
#include <map>
#include <string>
#include <vector>

namespace regshape {
namespace regex {

/**
 * Group name table for one Regex.
 *
 * Two sources of names:
 * - inline names from the pattern, (?P<name>...) or (?<name>...)
 * - names declared by the caller, where declared[i] names group i+1
 *
 * An inline name always wins; a declared name is the fallback. Declared
 * names past the pattern's group count name nothing.
 */
class GroupNames {
public:
    GroupNames() = default;
    GroupNames(const RE2& regex, std::vector<std::string> declared);

    /**
     * Resolve a name to its 1-based group ordinal.
     *
     * @throws UnknownGroupName if neither source knows the name, or the
     *         declared name's group does not exist
     */
    int indexOf(const std::string& name) const;

    const std::vector<std::string>& declared() const { return declared_; }

private:
    std::map<std::string, int> inline_;
    std::vector<std::string> declared_;
    int group_count_ = 0;
};

}  // namespace regex
}  // namespace regshape

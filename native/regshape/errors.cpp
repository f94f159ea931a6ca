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

#include "errors.h"
#include <sstream>

namespace regshape {

SyntaxError::SyntaxError(
    const std::string& message,
    const std::string& pattern,
    int offset,
    RE2::ErrorCode code)
    : std::runtime_error(message),
      message_(message),
      pattern_(pattern),
      offset_(offset),
      code_(code) {}

static std::string unsupportedMessage(const std::string& pattern, size_t derived, size_t engine) {
    std::ostringstream msg;
    msg << "Unsupported pattern construct: derived " << derived
        << " capturing group(s) but RE2 reports " << engine << ": " << pattern;
    return msg.str();
}

UnsupportedPattern::UnsupportedPattern(
    const std::string& pattern,
    size_t derived_count,
    size_t engine_count)
    : std::runtime_error(unsupportedMessage(pattern, derived_count, engine_count)),
      pattern_(pattern),
      derived_count_(derived_count),
      engine_count_(engine_count) {}

ShapeMismatch::ShapeMismatch(size_t expected, size_t actual, const std::string& detail)
    : ContractViolation("Unexpected number of capturing groups: expected " +
                        std::to_string(expected) + ", got " + std::to_string(actual) +
                        (detail.empty() ? "" : " (" + detail + ")")),
      expected_(expected),
      actual_(actual) {}

RequiredGroupAbsent::RequiredGroupAbsent(int ordinal)
    : ContractViolation("Required capturing group " + std::to_string(ordinal) +
                        " did not participate in the match"),
      ordinal_(ordinal) {}

UnknownGroupName::UnknownGroupName(const std::string& name)
    : std::invalid_argument("No group with name <" + name + ">"),
      name_(name) {}

}  // namespace regshape

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
#include <cstddef>
#include <stdexcept>
#include <string>

namespace regshape {

/**
 * Pattern text rejected by the RE2 parser.
 *
 * what() is RE2's own diagnostic, unchanged (e.g. "missing ): (").
 * offset() is the index in the pattern the diagnostic refers to, or -1
 * when it cannot be located.
 */
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message,
                const std::string& pattern,
                int offset,
                RE2::ErrorCode code);

    const std::string& message() const { return message_; }
    const std::string& pattern() const { return pattern_; }
    int offset() const { return offset_; }
    RE2::ErrorCode code() const { return code_; }

private:
    std::string message_;
    std::string pattern_;
    int offset_;
    RE2::ErrorCode code_;
};

/**
 * Pattern is valid for RE2 but uses a construct the structure analyzer
 * reads differently (derived group count != engine group count).
 */
class UnsupportedPattern : public std::runtime_error {
public:
    UnsupportedPattern(const std::string& pattern, size_t derived_count, size_t engine_count);

    const std::string& pattern() const { return pattern_; }
    size_t derivedCount() const { return derived_count_; }
    size_t engineCount() const { return engine_count_; }

private:
    std::string pattern_;
    size_t derived_count_;
    size_t engine_count_;
};

/**
 * Schema contract broken by a match result.
 *
 * Always a defect in schema derivation (or a construct outside the
 * supported grammar), never a user input error.
 */
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Raw group count differs from the schema's slot count.
class ShapeMismatch : public ContractViolation {
public:
    ShapeMismatch(size_t expected, size_t actual, const std::string& detail);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// A Required slot received no value.
class RequiredGroupAbsent : public ContractViolation {
public:
    explicit RequiredGroupAbsent(int ordinal);

    int ordinal() const { return ordinal_; }

private:
    int ordinal_;
};

class UnknownGroupName : public std::invalid_argument {
public:
    explicit UnknownGroupName(const std::string& name);

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

}  // namespace regshape

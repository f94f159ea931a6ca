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

#include "pattern_options.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace regshape {
namespace api {

RE2::Options PatternOptions::toRE2Options() const {
    RE2::Options opts;

    opts.set_posix_syntax(posix_syntax);
    opts.set_longest_match(longest_match);
    opts.set_log_errors(log_errors);
    opts.set_literal(literal);
    opts.set_never_nl(never_nl);
    opts.set_dot_nl(dot_nl);
    opts.set_never_capture(never_capture);
    opts.set_case_sensitive(case_sensitive);
    opts.set_perl_classes(perl_classes);
    opts.set_word_boundary(word_boundary);
    opts.set_one_line(one_line);
    opts.set_encoding(utf8 ? RE2::Options::EncodingUTF8 : RE2::Options::EncodingLatin1);
    opts.set_max_mem(max_mem);

    return opts;
}

std::string PatternOptions::fingerprint() const {
    std::string f;
    f.reserve(32);

    f += posix_syntax   ? '1' : '0';
    f += longest_match  ? '1' : '0';
    f += log_errors     ? '1' : '0';
    f += literal        ? '1' : '0';
    f += never_nl       ? '1' : '0';
    f += dot_nl         ? '1' : '0';
    f += never_capture  ? '1' : '0';
    f += case_sensitive ? '1' : '0';
    f += perl_classes   ? '1' : '0';
    f += word_boundary  ? '1' : '0';
    f += one_line       ? '1' : '0';
    f += utf8 ? 'U' : 'L';
    f += std::to_string(max_mem);

    return f;
}

std::string PatternOptions::cacheKey(std::string_view pattern) const {
    std::string key = fingerprint();
    key += '/';
    key.append(pattern.data(), pattern.size());
    return key;
}

PatternOptions PatternOptions::fromJson(const std::string& json) {
    if (json.empty()) {
        return defaults();
    }

    PatternOptions opts = defaults();
    std::string encoding;

    try {
        nlohmann::json j = nlohmann::json::parse(json);

        // Parse each field (all optional)
        if (j.contains("case_sensitive"))  opts.case_sensitive = j["case_sensitive"];
        if (j.contains("posix_syntax"))    opts.posix_syntax = j["posix_syntax"];
        if (j.contains("longest_match"))   opts.longest_match = j["longest_match"];
        if (j.contains("log_errors"))      opts.log_errors = j["log_errors"];
        if (j.contains("literal"))         opts.literal = j["literal"];
        if (j.contains("never_nl"))        opts.never_nl = j["never_nl"];
        if (j.contains("dot_nl"))          opts.dot_nl = j["dot_nl"];
        if (j.contains("never_capture"))   opts.never_capture = j["never_capture"];
        if (j.contains("perl_classes"))    opts.perl_classes = j["perl_classes"];
        if (j.contains("word_boundary"))   opts.word_boundary = j["word_boundary"];
        if (j.contains("one_line"))        opts.one_line = j["one_line"];
        if (j.contains("max_mem"))         opts.max_mem = j["max_mem"].get<int64_t>();
        if (j.contains("encoding"))        encoding = j["encoding"].get<std::string>();

    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid options JSON: ") + e.what());
    }

    // Encoding (accept "UTF8" or "Latin1" string)
    if (!encoding.empty()) {
        if (encoding == "UTF8") {
            opts.utf8 = true;
        } else if (encoding == "Latin1") {
            opts.utf8 = false;
        } else {
            throw std::invalid_argument("encoding must be \"UTF8\" or \"Latin1\", got \"" +
                                        encoding + "\"");
        }
    }

    if (opts.max_mem <= 0) {
        throw std::invalid_argument("max_mem must be > 0");
    }

    return opts;
}

std::string PatternOptions::toJson() const {
    nlohmann::json j;

    j["case_sensitive"] = case_sensitive;
    j["encoding"] = utf8 ? "UTF8" : "Latin1";
    j["posix_syntax"] = posix_syntax;
    j["longest_match"] = longest_match;
    j["log_errors"] = log_errors;
    j["literal"] = literal;
    j["never_nl"] = never_nl;
    j["dot_nl"] = dot_nl;
    j["never_capture"] = never_capture;
    j["perl_classes"] = perl_classes;
    j["word_boundary"] = word_boundary;
    j["one_line"] = one_line;
    j["max_mem"] = max_mem;

    return j.dump();
}

PatternOptions PatternOptions::defaults() {
    PatternOptions opts;
    // All fields already initialized with defaults in struct definition
    return opts;
}

}  // namespace api
}  // namespace regshape

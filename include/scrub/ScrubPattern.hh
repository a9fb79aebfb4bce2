// Copyright (c) 2024-2026 The scrub authors
//
// This file is part of scrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef SCRUBPATTERN_HH
#define SCRUBPATTERN_HH

#include <scrub/Constants.h>
#include <scrub/DLL.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>

// A ScrubPattern is either a byte pattern or a text pattern.
//
// A byte pattern is a sequence of bytes with an optional mask of the same length. A window of
// data matches if, for every i, (window[i] & mask[i]) == pattern[i], or window[i] == pattern[i]
// when there is no mask. compile() clears the pattern bits that the mask does not cover.
//
// A text pattern is an ECMAScript regular expression, optionally case-insensitive. Text patterns
// only apply to data that is valid UTF-8 and are matched one line at a time. Data that is not
// valid UTF-8 never matches a text pattern.
//
// Patterns must be compiled before use. compile() throws ScrubExc with code scrub_e_validation if
// the pattern is malformed. Compiled patterns are immutable and may be shared between threads.
class ScrubPattern
{
  public:
    SCRUB_DLL
    static ScrubPattern bytes(
        std::string const& id,
        scrub_match_kind_e kind,
        std::string const& pattern,
        std::string const& mask = "",
        std::string const& description = "");
    SCRUB_DLL
    static ScrubPattern text(
        std::string const& id,
        scrub_match_kind_e kind,
        std::string const& regex,
        bool case_insensitive = false,
        std::string const& description = "");

    SCRUB_DLL
    void compile();
    SCRUB_DLL
    bool isCompiled() const;

    SCRUB_DLL
    std::string const& getId() const;
    SCRUB_DLL
    scrub_match_kind_e getKind() const;
    // scrub_det_byte_pattern or scrub_det_text_pattern
    SCRUB_DLL
    scrub_detector_e getDetector() const;
    SCRUB_DLL
    std::string const& getPattern() const;
    SCRUB_DLL
    std::string const& getMask() const;
    SCRUB_DLL
    std::string const& getDescription() const;
    SCRUB_DLL
    bool isCaseInsensitive() const;

    // Return the offsets [start, end) of the first match in data, if any. Throws
    // std::logic_error if the pattern has not been compiled.
    SCRUB_DLL
    std::optional<std::pair<size_t, size_t>> findIn(std::string const& data) const;

  private:
    ScrubPattern(
        std::string const& id,
        scrub_match_kind_e kind,
        scrub_detector_e detector,
        std::string const& pattern,
        std::string const& mask,
        bool case_insensitive,
        std::string const& description);

    std::optional<std::pair<size_t, size_t>> findBytes(std::string const& data) const;
    std::optional<std::pair<size_t, size_t>> findText(std::string const& data) const;

    std::string id;
    scrub_match_kind_e kind;
    scrub_detector_e detector;
    std::string pattern;
    std::string mask;
    bool case_insensitive;
    std::string description;
    bool compiled{false};
    std::shared_ptr<std::regex const> regex;
};

#endif // SCRUBPATTERN_HH

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


#ifndef SCRUBPATTERNSCANNER_HH
#define SCRUBPATTERNSCANNER_HH

#include <scrub/Constants.h>
#include <scrub/DLL.h>
#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubPattern.hh>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ScrubPatternScanner searches every object of a document for embedded files, metadata,
// JavaScript, form data, annotations, and traces left by the software that produced the
// document. It never modifies the document.
//
// Each object is examined in a fixed order and the first check that matches wins, so there is at
// most one match per object:
//
//  1. Built-in patterns, then custom patterns, against stream data
//  2. Structural checks on the object's dictionary and its nested dictionaries and arrays (/EF,
//     /JS, /Producer and /Creator, /FT, /Type /Annot)
//  3. Text patterns against dictionary strings
//  4. All patterns against the decoded data of /FlateDecode streams
//  5. Registered custom detectors, in order of name
//
// Built-in checks report confidence 1.0. A custom detector may report less; a confidence outside
// [0, 1] makes the object a scan failure. The confidence threshold in ScanningConfig is
// validated but not applied by scan(); use filterByConfidence to apply it.
//
// With parallel_scanning, objects are divided into contiguous ranges that are scanned
// concurrently. Results are merged after all ranges are finished and are identical to those of a
// sequential scan. Registered detectors must therefore be safe to call from several threads.
class ScrubPatternScanner
{
  public:
    struct MatchLocation
    {
        ScrubObjGen object_id;
        // Byte range [start, end) of the match within the scanned data
        size_t start{0};
        size_t end{0};
        // Describes what was scanned, e.g. "stream in object 9 0 R"
        std::string context;
        std::string context_before;
        std::string context_after;
    };

    struct AnalysisDetails
    {
        std::string content_type;
        // "utf-8" or "binary"
        std::string encoding;
        // The stream's /Filter or "none"
        std::string compression;
        // "length" and "entropy"
        std::map<std::string, std::string> properties;
    };

    struct PatternMatch
    {
        std::string pattern_id;
        scrub_match_kind_e kind{scrub_mk_custom};
        scrub_detector_e detector{scrub_det_custom};
        MatchLocation location;
        double confidence{1.0};
        std::map<std::string, std::string> metadata;
        AnalysisDetails analysis;
        // The software that left a trace: the matched text of application trace and text
        // pattern matches, or the /Producer or /Creator string
        std::string origin;

        SCRUB_DLL
        bool operator==(PatternMatch const& rhs) const;
        SCRUB_DLL
        bool operator!=(PatternMatch const& rhs) const;
    };

    struct ScanningConfig
    {
        ScanningConfig() {}
        bool scan_embedded_files{true};
        bool scan_metadata{true};
        bool scan_javascript{true};
        bool scan_form_data{true};
        bool scan_annotations{true};
        // Run after the built-in patterns. Compiled when the scan starts.
        std::vector<ScrubPattern> custom_patterns;
        // Must be in [0, 1]
        double confidence_threshold{0.75};
        // Nesting limit for structural checks
        int max_depth{10};
        bool parallel_scanning{true};
        // Number of bytes of context recorded on each side of a match
        size_t context_size{64};
        // Largest decoded size allowed for a single compressed stream. A stream that inflates
        // to more is a scan failure. Must be positive.
        unsigned long long max_decoded_size{64ULL * 1024 * 1024};
    };

    struct ScanningStats
    {
        size_t objects_scanned{0};
        size_t instances_found{0};
        size_t patterns_matched{0};
        long long duration_ms{0};
        size_t scan_failures{0};
    };

    typedef std::map<ScrubObjGen, PatternMatch> registry_t;
    typedef std::function<std::optional<PatternMatch>(ScrubObjGen, ScrubObject const&)>
        detector_fn;

    SCRUB_DLL
    ScrubPatternScanner();
    SCRUB_DLL
    ~ScrubPatternScanner();

    // Scan doc and return the match registry, which remains valid until the next call to scan.
    // Throws ScrubExc with code scrub_e_configuration if the configuration is invalid or
    // scrub_e_validation if a pattern is malformed; in either case no object has been examined.
    // Failures examining individual objects are logged as warnings and counted in
    // ScanningStats::scan_failures.
    SCRUB_DLL
    registry_t const&
    scan(ScrubDocument const& doc, ScanningConfig const& config = ScanningConfig());

    // Register or replace a custom detector.
    SCRUB_DLL
    void registerDetector(std::string const& name, detector_fn fn);
    SCRUB_DLL
    void unregisterDetector(std::string const& name);

    SCRUB_DLL
    registry_t const& getMatches() const;
    SCRUB_DLL
    ScanningStats const& getStats() const;

    SCRUB_DLL
    static void checkConfig(ScanningConfig const& config);
    // The built-in patterns enabled by config, in the order they are tried
    SCRUB_DLL
    static std::vector<ScrubPattern> builtinPatterns(ScanningConfig const& config);
    SCRUB_DLL
    static registry_t filterByConfidence(registry_t const& matches, double threshold);
    SCRUB_DLL
    static char const* kindName(scrub_match_kind_e kind);

  private:
    ScrubPatternScanner(ScrubPatternScanner const&) = delete;
    ScrubPatternScanner& operator=(ScrubPatternScanner const&) = delete;

    class Members;
    std::unique_ptr<Members> m;
};

#endif // SCRUBPATTERNSCANNER_HH

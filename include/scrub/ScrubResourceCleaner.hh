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


#ifndef SCRUBRESOURCECLEANER_HH
#define SCRUBRESOURCECLEANER_HH

#include <scrub/DLL.h>
#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubResourceUsage.hh>

#include <cstddef>
#include <memory>

// ScrubResourceCleaner removes resources (fonts, images, forms, patterns, color spaces, and
// graphics states) that no page uses, merges resources that are byte-for-byte identical, and
// prunes Resources dictionaries that become empty as a result. The document is modified in
// place.
//
// The page tree is analyzed before anything is changed. If the page tree is missing, contains a
// loop, or is nested more deeply than max_depth, clean() throws ScrubExc with code
// scrub_e_structure and the document is left untouched. Dangling resource references are
// reported as warnings through the document's logger and counted in
// CleaningStats::structural_errors; they do not stop the pass.
//
// Objects are always processed in ascending object id order. When identical resources are
// merged, the one with the lowest object id survives, and every reference to the others is
// rewritten to point to the survivor before the others are removed.
class ScrubResourceCleaner
{
  public:
    struct CleaningConfig
    {
        CleaningConfig() {}
        // Remove resources that are neither used by name nor referenced from a reachable
        // Resources dictionary
        bool remove_unused{true};
        // Remove Resources entries that point to objects that no longer exist
        bool clean_dictionaries{true};
        // When false, a duplicate that is still referenced anywhere is kept rather than having
        // its references rewritten
        bool update_references{true};
        bool merge_identical{true};
        bool remove_empty{true};
        int max_depth{ScrubResourceUsage::default_max_depth};
    };

    // Counters for the most recent call to clean()
    struct CleaningStats
    {
        size_t resources_processed{0};
        size_t resources_removed{0};
        size_t references_updated{0};
        unsigned long long bytes_saved{0};
        long long duration_ms{0};
        size_t structural_errors{0};
    };

    SCRUB_DLL
    ScrubResourceCleaner();
    SCRUB_DLL
    ~ScrubResourceCleaner();

    SCRUB_DLL
    void clean(ScrubDocument& doc, CleaningConfig const& config = CleaningConfig());

    SCRUB_DLL
    CleaningStats const& getStats() const;

    // Rewrite every reference to from in obj so that it refers to to. Return the number of
    // references rewritten.
    SCRUB_DLL
    static size_t rewriteReferences(ScrubObject& obj, ScrubObjGen from, ScrubObjGen to);
    // Return the number of references to og in obj.
    SCRUB_DLL
    static size_t countReferences(ScrubObject const& obj, ScrubObjGen og);

  private:
    ScrubResourceCleaner(ScrubResourceCleaner const&) = delete;
    ScrubResourceCleaner& operator=(ScrubResourceCleaner const&) = delete;

    class Members;
    std::unique_ptr<Members> m;
};

#endif // SCRUBRESOURCECLEANER_HH

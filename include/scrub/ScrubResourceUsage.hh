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


#ifndef SCRUBRESOURCEUSAGE_HH
#define SCRUBRESOURCEUSAGE_HH

#include <scrub/Constants.h>
#include <scrub/DLL.h>
#include <scrub/ScrubDocument.hh>

#include <map>
#include <set>
#include <string>
#include <vector>

// ScrubResourceUsage records which resources a document actually uses. analyze() walks the page
// tree depth-first from the page tree root and collects, per resource category, the names that
// appear in reachable Resources dictionaries, including Resources inherited from /Pages nodes and
// the Resources of any resource reached this way that has its own (Form XObjects, tiling patterns,
// Type3 fonts). It also records the ids of objects referenced directly from those dictionaries.
//
// Objects referenced from anywhere other than a Resources dictionary (for example an annotation
// appearance stream or a font's descendant fonts) are "pinned" and must never be treated as
// unused. The Resources of a pinned object count as used too.
//
// A ScrubResourceUsage is only valid for the state of the document at the time analyze() was
// called.
class ScrubResourceUsage
{
  public:
    static int const default_max_depth = ScrubDocument::default_max_page_depth;

    SCRUB_DLL
    ScrubResourceUsage() = default;

    // Throws ScrubExc with code scrub_e_structure if the document has no page tree, if the page
    // tree contains a loop, or if it is nested more deeply than max_depth. The document is not
    // modified. Dangling resource references are not errors; they are recorded as warnings.
    SCRUB_DLL
    void analyze(ScrubDocument const& doc, int max_depth = default_max_depth);

    // Determine the category of a resource object from its /Type and /Subtype entries.
    SCRUB_DLL
    static scrub_resource_e classify(ScrubObject const& obj);
    // Resources sub-dictionary key for a category, e.g. "/Font" or "/XObject"
    SCRUB_DLL
    static char const* categoryKey(scrub_resource_e category);
    // Human-readable category name, e.g. "font" or "image"
    SCRUB_DLL
    static char const* categoryName(scrub_resource_e category);

    SCRUB_DLL
    std::set<std::string> const& getUsedNames(scrub_resource_e category) const;
    SCRUB_DLL
    bool isNameUsed(scrub_resource_e category, std::string const& name) const;
    // True if og is referenced from a reachable Resources dictionary or is pinned
    SCRUB_DLL
    bool isObjectUsed(ScrubObjGen og) const;
    SCRUB_DLL
    bool isPinned(ScrubObjGen og) const;
    SCRUB_DLL
    ScrubObjGen::set const& getReferencedObjects() const;
    // Objects that serve as Resources containers or indirect Resources sub-dictionaries
    SCRUB_DLL
    ScrubObjGen::set const& getResourceContainers() const;
    SCRUB_DLL
    std::vector<std::string> const& getWarnings() const;

  private:
    void clear();
    void findResourceContainers(ScrubDocument const& doc);
    void findPinned(ScrubDocument const& doc);
    void collectPinned(ScrubObject const& obj, int depth);
    void walkPageTree(
        ScrubDocument const& doc, ScrubObjGen og, int depth, int max_depth, ScrubObjGen::set& seen);
    void collectResources(
        ScrubDocument const& doc, ScrubObject const& resources, std::string const& owner);
    void collectNestedResources(
        ScrubDocument const& doc, ScrubObject const& value, ScrubObject const& target);

    std::map<scrub_resource_e, std::set<std::string>> used_names;
    ScrubObjGen::set referenced;
    ScrubObjGen::set pinned;
    ScrubObjGen::set containers;
    // Objects whose Resources have already been collected
    ScrubObjGen::set expanded;
    std::vector<std::string> warnings;
};

#endif // SCRUBRESOURCEUSAGE_HH

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


#ifndef SCRUBDEPENDENCYGRAPH_HH
#define SCRUBDEPENDENCYGRAPH_HH

#include <scrub/DLL.h>
#include <scrub/ScrubDocument.hh>

#include <map>

// ScrubDependencyGraph maps each stream that has a /Resources entry to the set of objects
// referenced from within its Resources. Indirect Resources dictionaries and indirect
// sub-dictionaries are followed; the resources they name become edges. Only ids that exist in the
// document at build time are recorded.
//
// The graph is used to decide whether two resources may safely be merged: objects that depend on
// each other, directly or transitively, are never merged.
class ScrubDependencyGraph
{
  public:
    typedef std::map<ScrubObjGen, ScrubObjGen::set> graph_t;

    SCRUB_DLL
    ScrubDependencyGraph() = default;

    // Discard any existing contents and build the graph from doc.
    SCRUB_DLL
    void build(ScrubDocument const& doc);

    // Return the direct dependencies of og, which may be empty.
    SCRUB_DLL
    ScrubObjGen::set const& getDependencies(ScrubObjGen og) const;

    // True if from reaches to through one or more edges.
    SCRUB_DLL
    bool dependsOn(ScrubObjGen from, ScrubObjGen to) const;

    // Drop og as a node and as a dependency of every other node.
    SCRUB_DLL
    void removeObject(ScrubObjGen og);

    // Redirect every edge that points at from so that it points at to.
    SCRUB_DLL
    void replaceReferences(ScrubObjGen from, ScrubObjGen to);

    SCRUB_DLL
    graph_t const& getGraph() const;

  private:
    void collectReferences(
        ScrubDocument const& doc,
        ScrubObject const& obj,
        ScrubObjGen::set& result,
        ScrubObjGen::set& visited,
        int depth);

    graph_t graph;
};

#endif // SCRUBDEPENDENCYGRAPH_HH

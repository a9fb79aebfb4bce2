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


#ifndef SCRUBDOCUMENT_HH
#define SCRUBDOCUMENT_HH

#include <scrub/DLL.h>
#include <scrub/ScrubLogger.hh>
#include <scrub/ScrubObjGen.hh>
#include <scrub/ScrubObject.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

// A ScrubDocument owns the table of indirect objects of one document together with its trailer
// dictionary. Objects refer to each other through ScrubObject references; the document is the
// only owner of indirect objects.
//
// Object numbers are never reused while the document is alive. makeIndirectObject always
// allocates a number higher than any number the document has ever held.
//
// A ScrubDocument must not be used from more than one thread at a time, except that any number
// of threads may read it concurrently while nothing modifies it.
class ScrubDocument
{
  public:
    typedef std::map<ScrubObjGen, ScrubObject> table_t;

    SCRUB_DLL
    ScrubDocument();
    SCRUB_DLL
    ~ScrubDocument();

    // Create a document containing a catalog (/Type /Catalog) and an empty page tree root
    // (/Type /Pages /Kids [] /Count 0). The trailer's /Root points at the catalog.
    SCRUB_DLL
    static std::unique_ptr<ScrubDocument> emptyDocument();

    // Return a deep copy of the document. The copy starts out using the same logger.
    SCRUB_DLL
    std::unique_ptr<ScrubDocument> clone() const;

    SCRUB_DLL
    void setLogger(std::shared_ptr<ScrubLogger>);
    SCRUB_DLL
    std::shared_ptr<ScrubLogger> getLogger() const;

    // Write "WARNING: message" to the logger's warning channel.
    SCRUB_DLL
    void warn(std::string const& message) const;

    // Add obj to the table under a fresh object number and return a reference to it.
    SCRUB_DLL
    ScrubObject makeIndirectObject(ScrubObject const& obj);
    // Insert obj under og, replacing any object already there.
    SCRUB_DLL
    void replaceObject(ScrubObjGen og, ScrubObject const& obj);
    SCRUB_DLL
    bool hasObject(ScrubObjGen og) const;
    // Return nullptr if there is no such object.
    SCRUB_DLL
    ScrubObject* getObject(ScrubObjGen og);
    SCRUB_DLL
    ScrubObject const* getObject(ScrubObjGen og) const;
    // If obj is a reference, return its target, or nullptr if the reference dangles. Otherwise
    // return &obj.
    SCRUB_DLL
    ScrubObject* resolve(ScrubObject& obj);
    SCRUB_DLL
    ScrubObject const* resolve(ScrubObject const& obj) const;
    SCRUB_DLL
    void removeObject(ScrubObjGen og);
    // Object ids in ascending order
    SCRUB_DLL
    std::vector<ScrubObjGen> getObjectIDs() const;
    SCRUB_DLL
    size_t getObjectCount() const;
    SCRUB_DLL
    table_t& getObjectTable();
    SCRUB_DLL
    table_t const& getObjectTable() const;

    SCRUB_DLL
    ScrubObject& getTrailer();
    SCRUB_DLL
    ScrubObject const& getTrailer() const;
    // The catalog. Throws ScrubExc if the trailer has no valid /Root.
    SCRUB_DLL
    ScrubObject& getRoot();
    SCRUB_DLL
    ScrubObject const& getRoot() const;
    // The id of the Info dictionary or ScrubObjGen() if the trailer has no /Info reference. The
    // id may dangle.
    SCRUB_DLL
    ScrubObjGen getInfo() const;
    SCRUB_DLL
    void setInfo(ScrubObjGen og);
    // The id of the page tree root, i.e. the target of /Root -> /Pages, or ScrubObjGen() if
    // there is none.
    SCRUB_DLL
    ScrubObjGen getPageTreeRoot() const;

    // Make page indirect if needed, append it to the page tree root's /Kids, and set its
    // /Parent and /Type. Return the page's id.
    SCRUB_DLL
    ScrubObjGen addPage(ScrubObject const& page);
    // Page tree nesting allowed by default when walking the page tree
    static int const default_max_page_depth = 64;

    // Return the ids of all /Page objects in document order. Cycles and dangling kids are
    // skipped. Nodes nested more than max_depth levels below the root are skipped with a warning.
    SCRUB_DLL
    std::vector<ScrubObjGen> getAllPages(int max_depth = default_max_page_depth) const;

  private:
    ScrubDocument(ScrubDocument const&) = delete;
    ScrubDocument& operator=(ScrubDocument const&) = delete;

    void getAllPagesInternal(
        ScrubObjGen node,
        int depth,
        int max_depth,
        ScrubObjGen::set& visited,
        std::vector<ScrubObjGen>& result) const;

    class Members
    {
        friend class ScrubDocument;

      public:
        SCRUB_DLL
        ~Members() = default;

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<ScrubLogger> log;
        table_t objects;
        ScrubObject trailer;
        int max_id{0};
    };

    std::unique_ptr<Members> m;
};

#endif // SCRUBDOCUMENT_HH

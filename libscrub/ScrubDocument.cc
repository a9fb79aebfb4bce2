#include <scrub/ScrubDocument.hh>

#include <scrub/ScrubExc.hh>

ScrubDocument::Members::Members() :
    log(ScrubLogger::defaultLogger()),
    trailer(ScrubObject::newDictionary())
{
}

ScrubDocument::ScrubDocument() :
    m(new Members())
{
}

ScrubDocument::~ScrubDocument() = default;

std::unique_ptr<ScrubDocument>
ScrubDocument::emptyDocument()
{
    std::unique_ptr<ScrubDocument> doc(new ScrubDocument());
    auto pages = doc->makeIndirectObject(ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Pages")},
         {"/Kids", ScrubObject::newArray()},
         {"/Count", ScrubObject::newInteger(0)}}));
    auto root = doc->makeIndirectObject(ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Catalog")}, {"/Pages", pages}}));
    doc->m->trailer.replaceKey("/Root", root);
    return doc;
}

std::unique_ptr<ScrubDocument>
ScrubDocument::clone() const
{
    std::unique_ptr<ScrubDocument> result(new ScrubDocument());
    result->m->log = m->log;
    result->m->objects = m->objects;
    result->m->trailer = m->trailer;
    result->m->max_id = m->max_id;
    return result;
}

void
ScrubDocument::setLogger(std::shared_ptr<ScrubLogger> l)
{
    if (!l) {
        throw std::logic_error("ScrubDocument::setLogger called with a null logger");
    }
    m->log = l;
}

std::shared_ptr<ScrubLogger>
ScrubDocument::getLogger() const
{
    return m->log;
}

void
ScrubDocument::warn(std::string const& message) const
{
    m->log->warn("WARNING: " + message + "\n");
}

ScrubObject
ScrubDocument::makeIndirectObject(ScrubObject const& obj)
{
    if (obj.isReference()) {
        throw std::logic_error("ScrubDocument::makeIndirectObject called with a reference");
    }
    ScrubObjGen og(m->max_id + 1, 0);
    replaceObject(og, obj);
    return ScrubObject::newReference(og);
}

void
ScrubDocument::replaceObject(ScrubObjGen og, ScrubObject const& obj)
{
    if (!og.isIndirect()) {
        throw std::logic_error("ScrubDocument::replaceObject called with the null object id");
    }
    if (obj.isReference()) {
        throw std::logic_error("ScrubDocument::replaceObject called with a reference");
    }
    m->objects[og] = obj;
    if (og.getObj() > m->max_id) {
        m->max_id = og.getObj();
    }
}

bool
ScrubDocument::hasObject(ScrubObjGen og) const
{
    return m->objects.count(og) > 0;
}

ScrubObject*
ScrubDocument::getObject(ScrubObjGen og)
{
    auto iter = m->objects.find(og);
    return iter == m->objects.end() ? nullptr : &iter->second;
}

ScrubObject const*
ScrubDocument::getObject(ScrubObjGen og) const
{
    auto iter = m->objects.find(og);
    return iter == m->objects.end() ? nullptr : &iter->second;
}

ScrubObject*
ScrubDocument::resolve(ScrubObject& obj)
{
    if (obj.isReference()) {
        return getObject(obj.getRef());
    }
    return &obj;
}

ScrubObject const*
ScrubDocument::resolve(ScrubObject const& obj) const
{
    if (obj.isReference()) {
        return getObject(obj.getRef());
    }
    return &obj;
}

void
ScrubDocument::removeObject(ScrubObjGen og)
{
    m->objects.erase(og);
}

std::vector<ScrubObjGen>
ScrubDocument::getObjectIDs() const
{
    std::vector<ScrubObjGen> result;
    result.reserve(m->objects.size());
    for (auto const& iter: m->objects) {
        result.push_back(iter.first);
    }
    return result;
}

size_t
ScrubDocument::getObjectCount() const
{
    return m->objects.size();
}

ScrubDocument::table_t&
ScrubDocument::getObjectTable()
{
    return m->objects;
}

ScrubDocument::table_t const&
ScrubDocument::getObjectTable() const
{
    return m->objects;
}

ScrubObject&
ScrubDocument::getTrailer()
{
    return m->trailer;
}

ScrubObject const&
ScrubDocument::getTrailer() const
{
    return m->trailer;
}

ScrubObject&
ScrubDocument::getRoot()
{
    auto const& root = m->trailer.getKey("/Root");
    ScrubObject* result = root.isReference() ? getObject(root.getRef()) : nullptr;
    if (result == nullptr || !result->isDictionary()) {
        throw ScrubExc(scrub_e_structure, "", "trailer", "unable to find /Root dictionary");
    }
    return *result;
}

ScrubObject const&
ScrubDocument::getRoot() const
{
    auto const& root = m->trailer.getKey("/Root");
    ScrubObject const* result = root.isReference() ? getObject(root.getRef()) : nullptr;
    if (result == nullptr || !result->isDictionary()) {
        throw ScrubExc(scrub_e_structure, "", "trailer", "unable to find /Root dictionary");
    }
    return *result;
}

ScrubObjGen
ScrubDocument::getInfo() const
{
    auto const& info = m->trailer.getKey("/Info");
    return info.isReference() ? info.getRef() : ScrubObjGen();
}

void
ScrubDocument::setInfo(ScrubObjGen og)
{
    if (og.isIndirect()) {
        m->trailer.replaceKey("/Info", ScrubObject::newReference(og));
    } else {
        m->trailer.removeKey("/Info");
    }
}

ScrubObjGen
ScrubDocument::getPageTreeRoot() const
{
    auto const& root = m->trailer.getKey("/Root");
    if (!root.isReference()) {
        return {};
    }
    auto catalog = getObject(root.getRef());
    if (catalog == nullptr || !catalog->isDictionary()) {
        return {};
    }
    auto const& pages = catalog->getKey("/Pages");
    return pages.isReference() ? pages.getRef() : ScrubObjGen();
}

ScrubObjGen
ScrubDocument::addPage(ScrubObject const& page)
{
    auto pages_og = getPageTreeRoot();
    auto pages = getObject(pages_og);
    if (pages == nullptr || !pages->isDictionary()) {
        throw ScrubExc(scrub_e_structure, "", "trailer", "document has no page tree root");
    }
    ScrubObjGen og;
    if (page.isReference()) {
        og = page.getRef();
    } else {
        og = makeIndirectObject(page).getRef();
    }
    auto page_obj = getObject(og);
    if (page_obj == nullptr || !page_obj->isDictionary()) {
        throw std::logic_error("ScrubDocument::addPage: page is not a dictionary");
    }
    page_obj->replaceKey("/Type", ScrubObject::newName("/Page"));
    page_obj->replaceKey("/Parent", ScrubObject::newReference(pages_og));

    if (!pages->getKey("/Kids").isArray()) {
        pages->replaceKey("/Kids", ScrubObject::newArray());
    }
    auto kids = pages->getKey("/Kids");
    kids.appendItem(ScrubObject::newReference(og));
    auto count = static_cast<long long>(kids.getArrayNItems());
    pages->replaceKey("/Kids", kids);
    pages->replaceKey("/Count", ScrubObject::newInteger(count));
    return og;
}

std::vector<ScrubObjGen>
ScrubDocument::getAllPages(int max_depth) const
{
    std::vector<ScrubObjGen> result;
    ScrubObjGen::set visited;
    getAllPagesInternal(getPageTreeRoot(), 0, max_depth, visited, result);
    return result;
}

void
ScrubDocument::getAllPagesInternal(
    ScrubObjGen node,
    int depth,
    int max_depth,
    ScrubObjGen::set& visited,
    std::vector<ScrubObjGen>& result) const
{
    if (depth > max_depth) {
        warn(
            "page tree node " + node.describe() + " is nested more than " +
            std::to_string(max_depth) + " levels deep; skipping");
        return;
    }
    if (!visited.add(node)) {
        return;
    }
    auto obj = getObject(node);
    if (obj == nullptr || !obj->isDictionary()) {
        return;
    }
    auto const& kids = obj->getKey("/Kids");
    if (kids.isArray()) {
        for (auto const& kid: kids.getArrayItems()) {
            if (kid.isReference()) {
                getAllPagesInternal(kid.getRef(), depth + 1, max_depth, visited, result);
            }
        }
    } else {
        result.push_back(node);
    }
}

#include <scrub/ScrubResourceUsage.hh>

#include <scrub/ScrubExc.hh>

namespace
{
    scrub_resource_e const categories[] = {
        scrub_res_font,
        scrub_res_image,
        scrub_res_form,
        scrub_res_pattern,
        scrub_res_colorspace,
        scrub_res_gstate};

    // Guards against pathologically deep direct objects when looking for references.
    int const max_nesting = 256;

    std::set<std::string> const empty_names;
} // namespace

void
ScrubResourceUsage::clear()
{
    used_names.clear();
    referenced.clear();
    pinned.clear();
    containers.clear();
    expanded.clear();
    warnings.clear();
}

scrub_resource_e
ScrubResourceUsage::classify(ScrubObject const& obj)
{
    if (!obj.hasDictionary()) {
        return scrub_res_none;
    }
    auto const& type = obj.getKey("/Type");
    auto const& subtype = obj.getKey("/Subtype");
    if (type.isNameAndEquals("/Font")) {
        return scrub_res_font;
    }
    if (type.isNameAndEquals("/XObject") || (obj.isStream() && type.isNull())) {
        if (subtype.isNameAndEquals("/Image")) {
            return scrub_res_image;
        }
        if (subtype.isNameAndEquals("/Form")) {
            return scrub_res_form;
        }
    }
    if (type.isNameAndEquals("/Pattern") || obj.hasKey("/PatternType")) {
        return scrub_res_pattern;
    }
    if (type.isNameAndEquals("/ColorSpace")) {
        return scrub_res_colorspace;
    }
    if (type.isNameAndEquals("/ExtGState")) {
        return scrub_res_gstate;
    }
    return scrub_res_none;
}

char const*
ScrubResourceUsage::categoryKey(scrub_resource_e category)
{
    switch (category) {
    case scrub_res_font:
        return "/Font";
    case scrub_res_image:
    case scrub_res_form:
        return "/XObject";
    case scrub_res_pattern:
        return "/Pattern";
    case scrub_res_colorspace:
        return "/ColorSpace";
    case scrub_res_gstate:
        return "/ExtGState";
    case scrub_res_none:
        break;
    }
    return "";
}

char const*
ScrubResourceUsage::categoryName(scrub_resource_e category)
{
    switch (category) {
    case scrub_res_font:
        return "font";
    case scrub_res_image:
        return "image";
    case scrub_res_form:
        return "form";
    case scrub_res_pattern:
        return "pattern";
    case scrub_res_colorspace:
        return "color space";
    case scrub_res_gstate:
        return "graphics state";
    case scrub_res_none:
        break;
    }
    return "none";
}

void
ScrubResourceUsage::analyze(ScrubDocument const& doc, int max_depth)
{
    clear();
    auto root = doc.getPageTreeRoot();
    if (!root.isIndirect()) {
        throw ScrubExc(scrub_e_structure, "clean", "trailer", "unable to find page tree root");
    }
    ScrubObjGen::set seen;
    walkPageTree(doc, root, 0, max_depth, seen);
    findResourceContainers(doc);
    findPinned(doc);

    // A pinned object with its own Resources, such as an annotation appearance stream, uses
    // whatever those Resources name.
    for (auto og: pinned) {
        auto obj = doc.getObject(og);
        if (obj != nullptr && obj->hasDictionary() && obj->hasKey("/Resources") &&
            expanded.add(og)) {
            collectResources(doc, obj->getKey("/Resources"), og.describe());
        }
    }
}

void
ScrubResourceUsage::walkPageTree(
    ScrubDocument const& doc, ScrubObjGen og, int depth, int max_depth, ScrubObjGen::set& seen)
{
    if (depth > max_depth) {
        throw ScrubExc(
            scrub_e_structure,
            "clean",
            og.describe(),
            "page tree is nested more than " + std::to_string(max_depth) + " levels deep");
    }
    if (!seen.add(og)) {
        throw ScrubExc(scrub_e_structure, "clean", og.describe(), "loop detected in page tree");
    }
    auto node = doc.getObject(og);
    if (node == nullptr) {
        warnings.push_back("page tree node " + og.describe() + " is missing; skipping");
        return;
    }
    if (!node->isDictionary()) {
        throw ScrubExc(
            scrub_e_structure, "clean", og.describe(), "page tree node is not a dictionary");
    }

    expanded.add(og);
    if (node->hasKey("/Resources")) {
        collectResources(doc, node->getKey("/Resources"), og.describe());
    }

    auto const& type = node->getKey("/Type");
    auto const& kids = node->getKey("/Kids");
    bool is_pages = type.isNameAndEquals("/Pages") || (type.isNull() && kids.isArray());
    if (!is_pages) {
        return;
    }
    if (!kids.isArray()) {
        throw ScrubExc(
            scrub_e_structure, "clean", og.describe(), "/Pages node has no /Kids array");
    }
    for (auto const& kid: kids.getArrayItems()) {
        if (!kid.isReference()) {
            warnings.push_back(
                "page tree node " + og.describe() + " has a direct kid; skipping");
            continue;
        }
        walkPageTree(doc, kid.getRef(), depth + 1, max_depth, seen);
    }
}

void
ScrubResourceUsage::collectResources(
    ScrubDocument const& doc, ScrubObject const& resources_in, std::string const& owner)
{
    auto resources = doc.resolve(resources_in);
    if (resources == nullptr) {
        warnings.push_back(
            "/Resources of " + owner + " references missing object " +
            resources_in.getRef().describe());
        return;
    }
    if (!resources->isDictionary()) {
        warnings.push_back("/Resources of " + owner + " is not a dictionary");
        return;
    }
    for (auto const& category_iter: resources->getDictAsMap()) {
        auto const& key = category_iter.first;
        bool is_xobject = (key == "/XObject");
        scrub_resource_e category = scrub_res_none;
        for (auto c: categories) {
            if (key == categoryKey(c)) {
                category = c;
                break;
            }
        }
        if (category == scrub_res_none) {
            continue;
        }
        auto sub = doc.resolve(category_iter.second);
        if (sub == nullptr) {
            warnings.push_back(
                key + " dictionary of " + owner + " references missing object " +
                category_iter.second.getRef().describe());
            continue;
        }
        if (!sub->isDictionary()) {
            continue;
        }
        for (auto const& res_iter: sub->getDictAsMap()) {
            auto const& name = res_iter.first;
            auto const& value = res_iter.second;
            ScrubObject const* target = &value;
            if (value.isReference()) {
                target = doc.getObject(value.getRef());
                if (target == nullptr) {
                    warnings.push_back(
                        "resource " + name + " of " + owner + " references missing object " +
                        value.getRef().describe() + "; skipping");
                    continue;
                }
                referenced.add(value.getRef());
            }
            if (!is_xobject) {
                used_names[category].insert(name);
            } else {
                auto xobject_category = classify(*target);
                if (xobject_category == scrub_res_image || xobject_category == scrub_res_form) {
                    used_names[xobject_category].insert(name);
                } else {
                    used_names[scrub_res_image].insert(name);
                    used_names[scrub_res_form].insert(name);
                }
            }
            collectNestedResources(doc, value, *target);
        }
    }
}

void
ScrubResourceUsage::collectNestedResources(
    ScrubDocument const& doc, ScrubObject const& value, ScrubObject const& target)
{
    // Form XObjects, tiling patterns and Type3 fonts carry Resources of their own.
    if (!(target.hasDictionary() && target.hasKey("/Resources"))) {
        return;
    }
    if (value.isReference()) {
        if (expanded.add(value.getRef())) {
            collectResources(doc, target.getKey("/Resources"), value.getRef().describe());
        }
    } else {
        auto const& nested = target.getKey("/Resources");
        if (nested.isReference() && !expanded.add(nested.getRef())) {
            return;
        }
        collectResources(doc, nested, "direct resource");
    }
}

void
ScrubResourceUsage::findResourceContainers(ScrubDocument const& doc)
{
    for (auto const& iter: doc.getObjectTable()) {
        auto const& obj = iter.second;
        if (!obj.hasDictionary()) {
            continue;
        }
        auto const& res_ref = obj.getKey("/Resources");
        auto resources = doc.resolve(res_ref);
        if (resources == nullptr || !resources->isDictionary()) {
            continue;
        }
        if (res_ref.isReference()) {
            containers.add(res_ref.getRef());
        }
        for (auto const& sub: resources->getDictAsMap()) {
            if (sub.second.isReference()) {
                auto target = doc.getObject(sub.second.getRef());
                if (target != nullptr && target->isDictionary() &&
                    classify(*target) == scrub_res_none) {
                    containers.add(sub.second.getRef());
                }
            }
        }
    }
}

void
ScrubResourceUsage::findPinned(ScrubDocument const& doc)
{
    collectPinned(doc.getTrailer(), 0);
    for (auto const& iter: doc.getObjectTable()) {
        if (containers.count(iter.first)) {
            continue;
        }
        collectPinned(iter.second, 0);
    }
}

void
ScrubResourceUsage::collectPinned(ScrubObject const& obj, int depth)
{
    if (depth > max_nesting) {
        return;
    }
    if (obj.isReference()) {
        pinned.add(obj.getRef());
    } else if (obj.isArray()) {
        for (auto const& item: obj.getArrayItems()) {
            collectPinned(item, depth + 1);
        }
    } else if (obj.hasDictionary()) {
        for (auto const& iter: obj.getDictAsMap()) {
            if (iter.first == "/Resources") {
                continue;
            }
            collectPinned(iter.second, depth + 1);
        }
    }
}

std::set<std::string> const&
ScrubResourceUsage::getUsedNames(scrub_resource_e category) const
{
    auto iter = used_names.find(category);
    return iter == used_names.end() ? empty_names : iter->second;
}

bool
ScrubResourceUsage::isNameUsed(scrub_resource_e category, std::string const& name) const
{
    return getUsedNames(category).count(name) > 0;
}

bool
ScrubResourceUsage::isObjectUsed(ScrubObjGen og) const
{
    return referenced.count(og) || pinned.count(og);
}

bool
ScrubResourceUsage::isPinned(ScrubObjGen og) const
{
    return pinned.count(og) > 0;
}

ScrubObjGen::set const&
ScrubResourceUsage::getReferencedObjects() const
{
    return referenced;
}

ScrubObjGen::set const&
ScrubResourceUsage::getResourceContainers() const
{
    return containers;
}

std::vector<std::string> const&
ScrubResourceUsage::getWarnings() const
{
    return warnings;
}

#include <scrub/ScrubResourceCleaner.hh>

#include <scrub/ScrubContentHasher.hh>
#include <scrub/ScrubDependencyGraph.hh>

#include <chrono>
#include <map>
#include <utility>
#include <vector>

namespace
{
    // Merging resources can make other resources identical (two forms that referred to two
    // identical fonts, for example), so merging repeats until nothing changes. Bound the number
    // of passes so that a pathological file can't make us loop for a long time.
    int const MAX_PASSES = 10;
} // namespace

class ScrubResourceCleaner::Members
{
    friend class ScrubResourceCleaner;

  public:
    Members() = default;

  private:
    Members(Members const&) = delete;

    void analyze(ScrubDocument& doc, bool count_warnings);
    void removeUnused(ScrubDocument& doc);
    void mergeIdentical(ScrubDocument& doc);
    void cleanDictionaries(ScrubDocument& doc);
    void removeEmpty(ScrubDocument& doc);
    void removeResource(ScrubDocument& doc, ScrubObjGen og, char const* reason);
    bool isReferenced(ScrubDocument const& doc, ScrubObjGen og) const;

    CleaningConfig config;
    CleaningStats stats;
    ScrubResourceUsage usage;
    ScrubDependencyGraph graph;
    std::map<ScrubObjGen, scrub_resource_e> resources;
};

ScrubResourceCleaner::ScrubResourceCleaner() :
    m(new Members())
{
}

ScrubResourceCleaner::~ScrubResourceCleaner() = default;

ScrubResourceCleaner::CleaningStats const&
ScrubResourceCleaner::getStats() const
{
    return m->stats;
}

size_t
ScrubResourceCleaner::rewriteReferences(ScrubObject& obj, ScrubObjGen from, ScrubObjGen to)
{
    size_t count = 0;
    if (obj.isReference()) {
        if (obj.getRef() == from) {
            obj = ScrubObject::newReference(to);
            ++count;
        }
    } else if (obj.isArray()) {
        for (auto& item: obj.getArrayItems()) {
            count += rewriteReferences(item, from, to);
        }
    } else if (obj.hasDictionary()) {
        for (auto& iter: obj.getDictAsMap()) {
            count += rewriteReferences(iter.second, from, to);
        }
    }
    return count;
}

size_t
ScrubResourceCleaner::countReferences(ScrubObject const& obj, ScrubObjGen og)
{
    size_t count = 0;
    if (obj.isReference()) {
        if (obj.getRef() == og) {
            ++count;
        }
    } else if (obj.isArray()) {
        for (auto const& item: obj.getArrayItems()) {
            count += countReferences(item, og);
        }
    } else if (obj.hasDictionary()) {
        for (auto const& iter: obj.getDictAsMap()) {
            count += countReferences(iter.second, og);
        }
    }
    return count;
}

void
ScrubResourceCleaner::clean(ScrubDocument& doc, CleaningConfig const& config)
{
    auto start = std::chrono::steady_clock::now();
    m->config = config;
    m->stats = CleaningStats();
    m->resources.clear();
    auto log = doc.getLogger();

    // Everything that can fail on a malformed page tree happens here, before the first change to
    // the document.
    m->analyze(doc, true);
    m->graph.build(doc);

    for (auto const& iter: doc.getObjectTable()) {
        auto category = ScrubResourceUsage::classify(iter.second);
        if (category != scrub_res_none) {
            m->resources[iter.first] = category;
            ++m->stats.resources_processed;
        }
    }
    log->debug(
        "clean: " + std::to_string(m->stats.resources_processed) + " resources in " +
        std::to_string(doc.getObjectCount()) + " objects");

    if (m->config.remove_unused) {
        m->removeUnused(doc);
    }
    if (m->config.merge_identical) {
        m->mergeIdentical(doc);
    }
    if (m->config.clean_dictionaries) {
        m->cleanDictionaries(doc);
    }
    if (m->config.remove_empty) {
        m->removeEmpty(doc);
    }

    m->resources.clear();
    m->stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start)
                               .count();
    log->debug(
        "clean: removed " + std::to_string(m->stats.resources_removed) + " resources, updated " +
        std::to_string(m->stats.references_updated) + " references, saved " +
        std::to_string(m->stats.bytes_saved) + " bytes");
}

void
ScrubResourceCleaner::Members::analyze(ScrubDocument& doc, bool count_warnings)
{
    usage.analyze(doc, config.max_depth);
    if (count_warnings) {
        for (auto const& w: usage.getWarnings()) {
            doc.warn(w);
            ++stats.structural_errors;
        }
    }
}

void
ScrubResourceCleaner::Members::removeResource(
    ScrubDocument& doc, ScrubObjGen og, char const* reason)
{
    auto obj = doc.getObject(og);
    if (obj == nullptr) {
        return;
    }
    doc.getLogger()->debug(
        std::string("clean: removing ") + reason + " " +
        ScrubResourceUsage::categoryName(resources[og]) + " " + og.describe());
    stats.bytes_saved += obj->getSerializedSize();
    ++stats.resources_removed;
    doc.removeObject(og);
    graph.removeObject(og);
    resources.erase(og);
}

void
ScrubResourceCleaner::Members::removeUnused(ScrubDocument& doc)
{
    // Removing an unused resource can leave objects it referred to without any referrer, so
    // repeat the analysis until a pass removes nothing.
    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        std::vector<ScrubObjGen> to_remove;
        for (auto const& iter: resources) {
            auto og = iter.first;
            auto obj = doc.getObject(og);
            if (obj == nullptr) {
                continue;
            }
            auto const& name = obj->getKey("/Name");
            if (name.isName() && usage.isNameUsed(iter.second, name.getName())) {
                continue;
            }
            if (usage.isObjectUsed(og)) {
                continue;
            }
            to_remove.push_back(og);
        }
        if (to_remove.empty()) {
            break;
        }
        for (auto og: to_remove) {
            removeResource(doc, og, "unused");
        }
        analyze(doc, false);
    }
}

bool
ScrubResourceCleaner::Members::isReferenced(ScrubDocument const& doc, ScrubObjGen og) const
{
    if (countReferences(doc.getTrailer(), og)) {
        return true;
    }
    for (auto const& iter: doc.getObjectTable()) {
        if (countReferences(iter.second, og)) {
            return true;
        }
    }
    return false;
}

void
ScrubResourceCleaner::Members::mergeIdentical(ScrubDocument& doc)
{
    ScrubContentHasher hasher;
    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        // resources is ordered by object id, so the first entry of each group is the lowest id.
        std::map<std::pair<scrub_resource_e, std::string>, std::vector<ScrubObjGen>> groups;
        for (auto const& iter: resources) {
            auto obj = doc.getObject(iter.first);
            if (obj == nullptr) {
                continue;
            }
            groups[{iter.second, hasher.hash(*obj)}].push_back(iter.first);
        }

        bool merged_any = false;
        for (auto const& group: groups) {
            auto const& ids = group.second;
            if (ids.size() < 2) {
                continue;
            }
            auto survivor = ids.at(0);
            for (size_t i = 1; i < ids.size(); ++i) {
                auto dup = ids.at(i);
                if (graph.dependsOn(survivor, dup) || graph.dependsOn(dup, survivor)) {
                    doc.getLogger()->debug(
                        "clean: not merging " + dup.describe() + " into " +
                        survivor.describe() + " because one depends on the other");
                    continue;
                }
                if (!config.update_references && isReferenced(doc, dup)) {
                    continue;
                }
                size_t updated = rewriteReferences(doc.getTrailer(), dup, survivor);
                for (auto& iter: doc.getObjectTable()) {
                    if (iter.first != dup) {
                        updated += rewriteReferences(iter.second, dup, survivor);
                    }
                }
                stats.references_updated += updated;
                graph.replaceReferences(dup, survivor);
                doc.getLogger()->debug(
                    "clean: merging " + dup.describe() + " into " + survivor.describe());
                removeResource(doc, dup, "duplicate");
                merged_any = true;
            }
        }
        if (!merged_any) {
            break;
        }
    }
}

void
ScrubResourceCleaner::Members::cleanDictionaries(ScrubDocument& doc)
{
    for (auto& iter: doc.getObjectTable()) {
        if (!iter.second.hasDictionary() || !iter.second.hasKey("/Resources")) {
            continue;
        }
        // The Resources value may be a reference to another object in the table. Pointers to
        // map entries remain valid since nothing is inserted or erased here.
        auto& res_value = iter.second.getDictAsMap()["/Resources"];
        auto res = doc.resolve(res_value);
        if (res == nullptr || !res->isDictionary()) {
            continue;
        }
        for (auto& sub_iter: res->getDictAsMap()) {
            auto sub = doc.resolve(sub_iter.second);
            if (sub == nullptr || !sub->isDictionary()) {
                continue;
            }
            auto& entries = sub->getDictAsMap();
            for (auto e = entries.begin(); e != entries.end();) {
                if (e->second.isReference() && !doc.hasObject(e->second.getRef())) {
                    doc.getLogger()->debug(
                        "clean: removing dangling " + sub_iter.first + " entry " + e->first +
                        " from " + iter.first.describe());
                    e = entries.erase(e);
                    ++stats.references_updated;
                } else {
                    ++e;
                }
            }
        }
    }
}

void
ScrubResourceCleaner::Members::removeEmpty(ScrubDocument& doc)
{
    ScrubObjGen::set candidates;
    for (auto& iter: doc.getObjectTable()) {
        if (!iter.second.hasDictionary() || !iter.second.hasKey("/Resources")) {
            continue;
        }
        auto& owner = iter.second.getDictAsMap();
        auto& res_value = owner["/Resources"];
        auto res = doc.resolve(res_value);
        if (res == nullptr || !res->isDictionary()) {
            continue;
        }
        auto& res_dict = res->getDictAsMap();
        for (auto sub_iter = res_dict.begin(); sub_iter != res_dict.end();) {
            auto sub = doc.resolve(sub_iter->second);
            bool empty = (sub != nullptr) &&
                ((sub->isDictionary() && sub->getDictAsMap().empty()) ||
                 (sub->isArray() && sub->getArrayNItems() == 0));
            if (!empty) {
                ++sub_iter;
                continue;
            }
            if (sub_iter->second.isReference()) {
                candidates.add(sub_iter->second.getRef());
            }
            doc.getLogger()->debug(
                "clean: removing empty " + sub_iter->first + " from resources of " +
                iter.first.describe());
            sub_iter = res_dict.erase(sub_iter);
        }
        if (res_dict.empty()) {
            if (res_value.isReference()) {
                candidates.add(res_value.getRef());
            }
            doc.getLogger()->debug(
                "clean: removing empty resources from " + iter.first.describe());
            owner.erase("/Resources");
        }
    }

    // Indirect containers that were emptied are removed once nothing refers to them any more.
    for (auto og: candidates) {
        if (!isReferenced(doc, og)) {
            doc.getLogger()->debug("clean: removing empty container " + og.describe());
            doc.removeObject(og);
            graph.removeObject(og);
        }
    }
}

#include <scrub/ScrubDependencyGraph.hh>

#include <scrub/ScrubResourceUsage.hh>

#include <deque>

namespace
{
    int const max_nesting = 256;
    ScrubObjGen::set const no_dependencies;
} // namespace

void
ScrubDependencyGraph::build(ScrubDocument const& doc)
{
    graph.clear();
    for (auto const& iter: doc.getObjectTable()) {
        auto const& obj = iter.second;
        if (!(obj.isStream() && obj.hasKey("/Resources"))) {
            continue;
        }
        ScrubObjGen::set deps;
        ScrubObjGen::set visited;
        visited.add(iter.first);
        collectReferences(doc, obj.getKey("/Resources"), deps, visited, 0);
        deps.erase(iter.first);
        graph[iter.first] = deps;
    }
}

void
ScrubDependencyGraph::collectReferences(
    ScrubDocument const& doc,
    ScrubObject const& obj,
    ScrubObjGen::set& result,
    ScrubObjGen::set& visited,
    int depth)
{
    if (depth > max_nesting) {
        return;
    }
    if (obj.isReference()) {
        auto og = obj.getRef();
        auto target = doc.getObject(og);
        if (target == nullptr) {
            return;
        }
        result.add(og);
        // Follow indirect containers such as an indirect /Font dictionary, but stop at the
        // resources themselves. Their own dependencies are separate nodes.
        if (target->isDictionary() && ScrubResourceUsage::classify(*target) == scrub_res_none &&
            visited.add(og)) {
            collectReferences(doc, *target, result, visited, depth + 1);
        }
    } else if (obj.isArray()) {
        for (auto const& item: obj.getArrayItems()) {
            collectReferences(doc, item, result, visited, depth + 1);
        }
    } else if (obj.hasDictionary()) {
        for (auto const& iter: obj.getDictAsMap()) {
            collectReferences(doc, iter.second, result, visited, depth + 1);
        }
    }
}

ScrubObjGen::set const&
ScrubDependencyGraph::getDependencies(ScrubObjGen og) const
{
    auto iter = graph.find(og);
    return iter == graph.end() ? no_dependencies : iter->second;
}

bool
ScrubDependencyGraph::dependsOn(ScrubObjGen from, ScrubObjGen to) const
{
    ScrubObjGen::set visited;
    std::deque<ScrubObjGen> queue;
    queue.push_back(from);
    visited.add(from);
    while (!queue.empty()) {
        auto cur = queue.front();
        queue.pop_front();
        for (auto const& dep: getDependencies(cur)) {
            if (dep == to) {
                return true;
            }
            if (visited.add(dep)) {
                queue.push_back(dep);
            }
        }
    }
    return false;
}

void
ScrubDependencyGraph::removeObject(ScrubObjGen og)
{
    graph.erase(og);
    for (auto& iter: graph) {
        iter.second.erase(og);
    }
}

void
ScrubDependencyGraph::replaceReferences(ScrubObjGen from, ScrubObjGen to)
{
    for (auto& iter: graph) {
        if (iter.second.count(from)) {
            iter.second.erase(from);
            if (iter.first != to) {
                iter.second.add(to);
            }
        }
    }
}

ScrubDependencyGraph::graph_t const&
ScrubDependencyGraph::getGraph() const
{
    return graph;
}

#include <scrub/assert_test.h>

#include <scrub/ScrubDependencyGraph.hh>
#include <scrub/ScrubDocument.hh>
#include <iostream>

typedef ScrubObject O;

static O
form(O const& resources)
{
    return O::newStream(
        {{"/Type", O::newName("/XObject")},
         {"/Subtype", O::newName("/Form")},
         {"/Resources", resources}},
        "q Q");
}

int
main()
{
    auto doc = ScrubDocument::emptyDocument();
    auto font = doc->makeIndirectObject(O::newDictionary({{"/Type", O::newName("/Font")}}));
    auto descriptor = doc->makeIndirectObject(O::newDictionary());
    doc->getObject(font.getRef())->replaceKey("/FontDescriptor", descriptor);
    auto font_dict = doc->makeIndirectObject(O::newDictionary({{"/F1", font}}));

    // fm1 uses font through an indirect /Font dictionary.
    auto fm1 = doc->makeIndirectObject(form(O::newDictionary({{"/Font", font_dict}})));
    // fm2 uses fm1, fm3 uses fm2.
    auto fm2 = doc->makeIndirectObject(
        form(O::newDictionary({{"/XObject", O::newDictionary({{"/Fm1", fm1}})}})));
    auto fm3 = doc->makeIndirectObject(
        form(O::newDictionary({{"/XObject", O::newDictionary({{"/Fm2", fm2}})}})));
    // Dangling references and self-references don't become edges.
    auto fm4 = doc->makeIndirectObject(O::newStream());
    doc->getObject(fm4.getRef())
        ->replaceKey(
            "/Resources",
            O::newDictionary(
                {{"/XObject",
                  O::newDictionary(
                      {{"/Self", fm4}, {"/Gone", O::newReference(ScrubObjGen(99, 0))}})}}));

    ScrubDependencyGraph graph;
    graph.build(*doc);
    assert(graph.getGraph().size() == 4);

    auto const& deps1 = graph.getDependencies(fm1.getRef());
    assert(deps1.size() == 2);
    assert(deps1.count(font_dict.getRef()) && deps1.count(font.getRef()));
    // Resources are not followed into; their own dependencies are separate nodes.
    assert(!deps1.count(descriptor.getRef()));
    assert(graph.getDependencies(fm4.getRef()).empty());
    assert(graph.getDependencies(font.getRef()).empty());

    assert(graph.dependsOn(fm1.getRef(), font.getRef()));
    assert(graph.dependsOn(fm3.getRef(), font.getRef()));
    assert(graph.dependsOn(fm3.getRef(), fm1.getRef()));
    assert(!graph.dependsOn(fm1.getRef(), fm3.getRef()));
    assert(!graph.dependsOn(font.getRef(), fm1.getRef()));

    auto fm1_copy = doc->makeIndirectObject(form(O::newDictionary({{"/Font", font_dict}})));
    graph.build(*doc);
    graph.replaceReferences(fm1.getRef(), fm1_copy.getRef());
    assert(graph.getDependencies(fm2.getRef()).count(fm1_copy.getRef()));
    assert(!graph.getDependencies(fm2.getRef()).count(fm1.getRef()));
    assert(graph.dependsOn(fm3.getRef(), fm1_copy.getRef()));

    graph.removeObject(fm2.getRef());
    assert(!graph.getGraph().count(fm2.getRef()));
    assert(graph.getDependencies(fm3.getRef()).empty());
    assert(!graph.dependsOn(fm3.getRef(), font.getRef()));

    // Rebuilding starts from scratch.
    graph.build(*doc);
    assert(graph.dependsOn(fm3.getRef(), font.getRef()));

    std::cout << "assertions passed\n";
    return 0;
}

#include <scrub/assert_test.h>

#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubResourceUsage.hh>
#include <iostream>

typedef ScrubObject O;

static O
font(std::string const& name)
{
    return O::newDictionary(
        {{"/Type", O::newName("/Font")},
         {"/Subtype", O::newName("/Type1")},
         {"/Name", O::newName(name)},
         {"/BaseFont", O::newName("/Helvetica")}});
}

static void
test_classify()
{
    assert(ScrubResourceUsage::classify(font("/F1")) == scrub_res_font);
    assert(
        ScrubResourceUsage::classify(O::newStream(
            {{"/Type", O::newName("/XObject")}, {"/Subtype", O::newName("/Image")}})) ==
        scrub_res_image);
    // /Type is optional on XObject streams.
    assert(
        ScrubResourceUsage::classify(O::newStream({{"/Subtype", O::newName("/Form")}})) ==
        scrub_res_form);
    assert(
        ScrubResourceUsage::classify(O::newDictionary({{"/PatternType", O::newInteger(1)}})) ==
        scrub_res_pattern);
    assert(
        ScrubResourceUsage::classify(O::newDictionary({{"/Type", O::newName("/ExtGState")}})) ==
        scrub_res_gstate);
    assert(
        ScrubResourceUsage::classify(O::newDictionary({{"/Type", O::newName("/ColorSpace")}})) ==
        scrub_res_colorspace);
    assert(ScrubResourceUsage::classify(O::newDictionary()) == scrub_res_none);
    assert(ScrubResourceUsage::classify(O::newInteger(1)) == scrub_res_none);
    assert(std::string(ScrubResourceUsage::categoryKey(scrub_res_image)) == "/XObject");
    assert(std::string(ScrubResourceUsage::categoryKey(scrub_res_form)) == "/XObject");
    assert(std::string(ScrubResourceUsage::categoryName(scrub_res_gstate)) == "graphics state");
}

static void
test_usage()
{
    auto doc = ScrubDocument::emptyDocument();
    auto pages = doc->getPageTreeRoot();

    auto f1 = doc->makeIndirectObject(font("/F1"));
    auto descendant = doc->makeIndirectObject(font("/D1"));
    doc->getObject(f1.getRef())->replaceKey("/DescendantFonts", O::newArray({descendant}));
    auto f2 = doc->makeIndirectObject(font("/F2"));
    auto unused = doc->makeIndirectObject(font("/F7"));
    auto form = doc->makeIndirectObject(O::newStream(
        {{"/Type", O::newName("/XObject")},
         {"/Subtype", O::newName("/Form")},
         {"/Resources", O::newDictionary({{"/Font", O::newDictionary({{"/F2", f2}})}})}},
        "BT /F2 1 Tf ET"));
    auto cs = doc->makeIndirectObject(O::newArray({O::newName("/ICCBased")}));
    auto f3 = doc->makeIndirectObject(font("/F3"));
    auto font_dict = doc->makeIndirectObject(O::newDictionary({{"/F3", f3}}));
    auto unknown_xobject = doc->makeIndirectObject(O::newDictionary());

    // Resources inherited from the page tree root
    doc->getObject(pages)->replaceKey(
        "/Resources", O::newDictionary({{"/ColorSpace", O::newDictionary({{"/CS0", cs}})}}));
    doc->addPage(O::newDictionary(
        {{"/Resources",
          O::newDictionary(
              {{"/Font", O::newDictionary({{"/F1", f1}})},
               {"/XObject", O::newDictionary({{"/Fm1", form}, {"/X9", unknown_xobject}})}})}}));
    doc->addPage(O::newDictionary({{"/Resources", O::newDictionary({{"/Font", font_dict}})}}));

    ScrubResourceUsage usage;
    usage.analyze(*doc);
    assert(usage.getWarnings().empty());
    auto const& fonts = usage.getUsedNames(scrub_res_font);
    assert(fonts.size() == 3);
    assert(fonts.count("/F1") && fonts.count("/F2") && fonts.count("/F3"));
    assert(usage.isNameUsed(scrub_res_form, "/Fm1"));
    assert(!usage.isNameUsed(scrub_res_image, "/Fm1"));
    // An XObject that can't be classified counts as both.
    assert(usage.isNameUsed(scrub_res_image, "/X9"));
    assert(usage.isNameUsed(scrub_res_form, "/X9"));
    assert(usage.isNameUsed(scrub_res_colorspace, "/CS0"));
    assert(usage.getUsedNames(scrub_res_pattern).empty());

    assert(usage.isObjectUsed(f1.getRef()));
    assert(usage.isObjectUsed(f2.getRef()));
    assert(usage.isObjectUsed(f3.getRef()));
    assert(usage.isObjectUsed(form.getRef()));
    assert(usage.isObjectUsed(cs.getRef()));
    assert(!usage.isObjectUsed(unused.getRef()));

    // Referenced from outside any Resources dictionary
    assert(usage.isPinned(descendant.getRef()));
    assert(usage.isObjectUsed(descendant.getRef()));
    assert(!usage.isPinned(f1.getRef()));
    assert(!usage.isPinned(f3.getRef()));

    assert(usage.getResourceContainers().count(font_dict.getRef()));
    assert(!usage.getResourceContainers().count(f3.getRef()));

    // The document is not modified.
    assert(doc->hasObject(unused.getRef()));
}

static void
test_warnings()
{
    auto doc = ScrubDocument::emptyDocument();
    auto pages = doc->getPageTreeRoot();
    doc->addPage(O::newDictionary(
        {{"/Resources",
          O::newDictionary(
              {{"/Font", O::newDictionary({{"/F9", O::newReference(ScrubObjGen(99, 0))}})}})}}));
    auto kids = doc->getObject(pages)->getKey("/Kids");
    kids.appendItem(O::newReference(ScrubObjGen(98, 0)));
    kids.appendItem(O::newDictionary());
    doc->getObject(pages)->replaceKey("/Kids", kids);

    ScrubResourceUsage usage;
    usage.analyze(*doc);
    assert(usage.getWarnings().size() == 3);
    assert(usage.getUsedNames(scrub_res_font).empty());
    for (auto const& w: usage.getWarnings()) {
        std::cout << "warning: " << w << "\n";
    }
}

static void
expect_structure_error(
    ScrubDocument const& doc, int max_depth = ScrubResourceUsage::default_max_depth)
{
    ScrubResourceUsage usage;
    try {
        usage.analyze(doc, max_depth);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_structure);
        assert(e.getPhase() == "clean");
        std::cout << "structure error: " << e.what() << "\n";
    }
}

static void
test_structure_errors()
{
    // No page tree
    ScrubDocument bare;
    expect_structure_error(bare);

    // Loop
    auto doc = ScrubDocument::emptyDocument();
    auto pages = doc->getPageTreeRoot();
    auto inner = doc->makeIndirectObject(O::newDictionary(
        {{"/Type", O::newName("/Pages")}, {"/Kids", O::newArray({O::newReference(pages)})}}));
    doc->getObject(pages)->replaceKey("/Kids", O::newArray({inner}));
    expect_structure_error(*doc);

    // Too deep
    doc = ScrubDocument::emptyDocument();
    pages = doc->getPageTreeRoot();
    auto leaf = doc->makeIndirectObject(O::newDictionary({{"/Type", O::newName("/Page")}}));
    inner = doc->makeIndirectObject(
        O::newDictionary({{"/Type", O::newName("/Pages")}, {"/Kids", O::newArray({leaf})}}));
    doc->getObject(pages)->replaceKey("/Kids", O::newArray({inner}));
    ScrubResourceUsage usage;
    usage.analyze(*doc, 2);
    expect_structure_error(*doc, 1);

    // Node that isn't a dictionary
    doc = ScrubDocument::emptyDocument();
    pages = doc->getPageTreeRoot();
    auto bogus = doc->makeIndirectObject(O::newInteger(12));
    doc->getObject(pages)->replaceKey("/Kids", O::newArray({bogus}));
    expect_structure_error(*doc);
}

int
main()
{
    test_classify();
    test_usage();
    test_warnings();
    test_structure_errors();
    std::cout << "assertions passed\n";
    return 0;
}

#include <scrub/assert_test.h>

#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubLogger.hh>
#include <scrub/ScrubResourceCleaner.hh>
#include <iostream>
#include <sstream>

typedef ScrubObject O;

static O
font(std::string const& name, std::string const& base_font = "/Helvetica")
{
    return O::newDictionary(
        {{"/Type", O::newName("/Font")},
         {"/Subtype", O::newName("/Type1")},
         {"/Name", O::newName(name)},
         {"/BaseFont", O::newName(base_font)}});
}

static O
image(std::string const& name, std::string const& data = "\x80")
{
    return O::newStream(
        {{"/Type", O::newName("/XObject")},
         {"/Subtype", O::newName("/Image")},
         {"/Name", O::newName(name)},
         {"/Width", O::newInteger(1)},
         {"/Height", O::newInteger(1)},
         {"/BitsPerComponent", O::newInteger(8)},
         {"/ColorSpace", O::newName("/DeviceGray")}},
        data);
}

static O
ref(int id)
{
    return O::newReference(ScrubObjGen(id, 0));
}

// One page using font 5 as /F1 and images 9 and 12 as /Im1 and /Im2. Font 7 is unused, and
// images 9 and 12 are identical.
static std::unique_ptr<ScrubDocument>
make_document()
{
    auto doc = ScrubDocument::emptyDocument();
    doc->replaceObject(ScrubObjGen(5, 0), font("/F1"));
    doc->replaceObject(ScrubObjGen(7, 0), font("/F2"));
    doc->replaceObject(ScrubObjGen(9, 0), image("/Im1"));
    doc->replaceObject(ScrubObjGen(12, 0), image("/Im2"));
    doc->addPage(O::newDictionary(
        {{"/Resources",
          O::newDictionary(
              {{"/Font", O::newDictionary({{"/F1", ref(5)}})},
               {"/XObject", O::newDictionary({{"/Im1", ref(9)}, {"/Im2", ref(12)}})}})},
         {"/Contents", O::newArray()}}));
    return doc;
}

static O const&
page_resources(ScrubDocument& doc)
{
    auto page = doc.getAllPages().at(0);
    return doc.getObject(page)->getKey("/Resources");
}

static void
test_clean()
{
    auto doc = make_document();
    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    auto const& stats = cleaner.getStats();
    assert(!doc->hasObject(ScrubObjGen(7, 0)));
    assert(!doc->hasObject(ScrubObjGen(12, 0)));
    assert(doc->hasObject(ScrubObjGen(5, 0)));
    assert(doc->hasObject(ScrubObjGen(9, 0)));
    auto const& xobjects = page_resources(*doc).getKey("/XObject");
    assert(xobjects.getKey("/Im1").getRef() == ScrubObjGen(9, 0));
    assert(xobjects.getKey("/Im2").getRef() == ScrubObjGen(9, 0));
    assert(stats.resources_processed == 4);
    assert(stats.resources_removed == 2);
    assert(stats.references_updated == 1);
    assert(stats.bytes_saved > 0);
    assert(stats.structural_errors == 0);
    assert(stats.duration_ms >= 0);

    // Cleaning again changes nothing.
    auto before = doc->clone();
    cleaner.clean(*doc);
    assert(cleaner.getStats().resources_removed == 0);
    assert(cleaner.getStats().references_updated == 0);
    assert(doc->getObjectTable() == before->getObjectTable());
    assert(doc->getTrailer() == before->getTrailer());
}

static void
test_config()
{
    // Nothing enabled
    auto doc = make_document();
    auto before = doc->clone();
    ScrubResourceCleaner::CleaningConfig config;
    config.remove_unused = false;
    config.merge_identical = false;
    config.clean_dictionaries = false;
    config.remove_empty = false;
    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc, config);
    assert(cleaner.getStats().resources_processed == 4);
    assert(cleaner.getStats().resources_removed == 0);
    assert(doc->getObjectTable() == before->getObjectTable());

    // Referenced duplicates are kept when references may not be rewritten.
    doc = make_document();
    config = ScrubResourceCleaner::CleaningConfig();
    config.update_references = false;
    cleaner.clean(*doc, config);
    assert(cleaner.getStats().resources_removed == 1);
    assert(!doc->hasObject(ScrubObjGen(7, 0)));
    assert(doc->hasObject(ScrubObjGen(12, 0)));
    assert(
        page_resources(*doc).getKey("/XObject").getKey("/Im2").getRef() == ScrubObjGen(12, 0));

    // Merging only. Fonts 5 and 7 differ only in /Name, so the unused one is merged away too.
    doc = make_document();
    config = ScrubResourceCleaner::CleaningConfig();
    config.remove_unused = false;
    cleaner.clean(*doc, config);
    assert(cleaner.getStats().resources_removed == 2);
    assert(cleaner.getStats().references_updated == 1);
    assert(!doc->hasObject(ScrubObjGen(7, 0)));
    assert(!doc->hasObject(ScrubObjGen(12, 0)));
    assert(page_resources(*doc).getKey("/Font").getKey("/F1").getRef() == ScrubObjGen(5, 0));
}

static void
test_cascade()
{
    // Graphics state 20 is unused and is the only thing referring to font 21, so removing it
    // makes the font unused as well.
    auto doc = make_document();
    doc->replaceObject(
        ScrubObjGen(20, 0),
        O::newDictionary(
            {{"/Type", O::newName("/ExtGState")},
             {"/Font", O::newArray({ref(21), O::newInteger(12)})}}));
    doc->replaceObject(ScrubObjGen(21, 0), font("/F21", "/Symbol"));
    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    assert(!doc->hasObject(ScrubObjGen(20, 0)));
    assert(!doc->hasObject(ScrubObjGen(21, 0)));
    assert(cleaner.getStats().resources_removed == 4);
}

static void
test_pinned()
{
    // A font referenced from an annotation's appearance is not unused even though no Resources
    // dictionary names it.
    auto doc = make_document();
    doc->replaceObject(ScrubObjGen(30, 0), font("/Helv", "/Courier"));
    auto page = doc->getAllPages().at(0);
    doc->getObject(page)->replaceKey(
        "/Annots",
        O::newArray({O::newDictionary(
            {{"/Type", O::newName("/Annot")},
             {"/Subtype", O::newName("/FreeText")},
             {"/DR", O::newDictionary({{"/Font", O::newDictionary({{"/Helv", ref(30)}})}})}})}));
    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    assert(doc->hasObject(ScrubObjGen(30, 0)));
    assert(cleaner.getStats().resources_removed == 2);
}

static void
add_page_resource(
    ScrubDocument& doc, std::string const& category, std::string const& name, int id)
{
    auto page = doc.getAllPages().at(0);
    auto resources = doc.getObject(page)->getKey("/Resources");
    auto sub = resources.hasKey(category) ? resources.getKey(category) : O::newDictionary();
    sub.replaceKey(name, ref(id));
    resources.replaceKey(category, sub);
    doc.getObject(page)->replaceKey("/Resources", resources);
}

static void
test_pattern_resources()
{
    // Image 60 is named only by the Resources of tiling pattern 50.
    auto doc = make_document();
    doc->replaceObject(ScrubObjGen(60, 0), image("/Im9", "\x40"));
    doc->replaceObject(
        ScrubObjGen(50, 0),
        O::newStream(
            {{"/Type", O::newName("/Pattern")},
             {"/PatternType", O::newInteger(1)},
             {"/PaintType", O::newInteger(1)},
             {"/Resources",
              O::newDictionary({{"/XObject", O::newDictionary({{"/Im9", ref(60)}})}})}},
            "/Im9 Do"));
    add_page_resource(*doc, "/Pattern", "/P1", 50);

    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    assert(doc->hasObject(ScrubObjGen(50, 0)));
    assert(doc->hasObject(ScrubObjGen(60, 0)));
    auto const& pattern_resources = doc->getObject(ScrubObjGen(50, 0))->getKey("/Resources");
    assert(pattern_resources.getKey("/XObject").getKey("/Im9").getRef() == ScrubObjGen(60, 0));
    assert(cleaner.getStats().resources_removed == 2);
    assert(cleaner.getStats().structural_errors == 0);
}

static void
test_type3_font_resources()
{
    // Type3 font 52 draws image 61 from its glyph procedure.
    auto doc = make_document();
    doc->replaceObject(ScrubObjGen(53, 0), O::newStream({}, "/Im Do"));
    doc->replaceObject(ScrubObjGen(61, 0), image("/Im", "\x20"));
    doc->replaceObject(
        ScrubObjGen(52, 0),
        O::newDictionary(
            {{"/Type", O::newName("/Font")},
             {"/Subtype", O::newName("/Type3")},
             {"/CharProcs", O::newDictionary({{"/a", ref(53)}})},
             {"/Resources",
              O::newDictionary({{"/XObject", O::newDictionary({{"/Im", ref(61)}})}})}}));
    add_page_resource(*doc, "/Font", "/T3", 52);

    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    assert(doc->hasObject(ScrubObjGen(52, 0)));
    assert(doc->hasObject(ScrubObjGen(53, 0)));
    assert(doc->hasObject(ScrubObjGen(61, 0)));
    auto const& font_resources = doc->getObject(ScrubObjGen(52, 0))->getKey("/Resources");
    assert(font_resources.getKey("/XObject").getKey("/Im").getRef() == ScrubObjGen(61, 0));
    assert(cleaner.getStats().resources_removed == 2);
}

static void
test_appearance_resources()
{
    // Font 62 is named only by the Resources of widget appearance stream 70, which no page
    // Resources dictionary mentions.
    auto doc = make_document();
    doc->replaceObject(ScrubObjGen(62, 0), font("/Helv", "/Courier"));
    doc->replaceObject(
        ScrubObjGen(70, 0),
        O::newStream(
            {{"/Type", O::newName("/XObject")},
             {"/Subtype", O::newName("/Form")},
             {"/Resources",
              O::newDictionary({{"/Font", O::newDictionary({{"/Helv", ref(62)}})}})}},
            "BT /Helv 10 Tf (x) Tj ET"));
    auto page = doc->getAllPages().at(0);
    doc->getObject(page)->replaceKey(
        "/Annots",
        O::newArray({O::newDictionary(
            {{"/Type", O::newName("/Annot")},
             {"/Subtype", O::newName("/Widget")},
             {"/AP", O::newDictionary({{"/N", ref(70)}})}})}));

    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    assert(doc->hasObject(ScrubObjGen(70, 0)));
    assert(doc->hasObject(ScrubObjGen(62, 0)));
    auto const& ap_resources = doc->getObject(ScrubObjGen(70, 0))->getKey("/Resources");
    assert(ap_resources.getKey("/Font").getKey("/Helv").getRef() == ScrubObjGen(62, 0));
    assert(cleaner.getStats().resources_removed == 2);
}

static void
test_dependent_forms()
{
    // Forms 40 and 41 hash identically, but 40 uses 41, so they must not be merged.
    auto doc = make_document();
    auto form = O::newStream(
        {{"/Type", O::newName("/XObject")},
         {"/Subtype", O::newName("/Form")},
         {"/Resources", O::newDictionary({{"/XObject", O::newDictionary({{"/Fm", ref(41)}})}})}},
        "/Fm Do");
    doc->replaceObject(ScrubObjGen(40, 0), form);
    doc->replaceObject(ScrubObjGen(41, 0), form);
    auto page = doc->getAllPages().at(0);
    auto resources = doc->getObject(page)->getKey("/Resources");
    auto xobjects = resources.getKey("/XObject");
    xobjects.replaceKey("/FmA", ref(40));
    resources.replaceKey("/XObject", xobjects);
    doc->getObject(page)->replaceKey("/Resources", resources);

    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    assert(doc->hasObject(ScrubObjGen(40, 0)));
    assert(doc->hasObject(ScrubObjGen(41, 0)));
    assert(cleaner.getStats().resources_removed == 2);
}

static void
test_dangling_and_empty()
{
    std::ostringstream out;
    std::ostringstream err;
    auto log = ScrubLogger::create();
    log->setOutputStreams(&out, &err);

    auto doc = ScrubDocument::emptyDocument();
    doc->setLogger(log);
    doc->replaceObject(ScrubObjGen(5, 0), font("/F1"));
    // Indirect Resources whose only entry dangles
    auto res = doc->makeIndirectObject(
        O::newDictionary({{"/Font", O::newDictionary({{"/F9", ref(99)}})}}));
    auto page1 = doc->addPage(O::newDictionary({{"/Resources", res}}));
    auto page2 = doc->addPage(O::newDictionary(
        {{"/Resources",
          O::newDictionary(
              {{"/Font", O::newDictionary({{"/F1", ref(5)}})},
               {"/Pattern", O::newDictionary()},
               {"/Properties", O::newArray()}})}}));

    ScrubResourceCleaner cleaner;
    cleaner.clean(*doc);
    auto const& stats = cleaner.getStats();
    assert(stats.structural_errors == 1);
    assert(stats.references_updated == 1);
    assert(err.str().find("WARNING: ") != std::string::npos);
    assert(err.str().find("99 0 R") != std::string::npos);

    assert(!doc->getObject(page1)->hasKey("/Resources"));
    assert(!doc->hasObject(res.getRef()));
    auto const& res2 = doc->getObject(page2)->getKey("/Resources");
    assert(res2.getKeys().size() == 1);
    assert(res2.hasKey("/Font"));
    assert(doc->hasObject(ScrubObjGen(5, 0)));
}

static void
test_structure_error()
{
    auto doc = make_document();
    auto pages = doc->getPageTreeRoot();
    auto kids = doc->getObject(pages)->getKey("/Kids");
    kids.appendItem(O::newReference(pages));
    doc->getObject(pages)->replaceKey("/Kids", kids);
    auto before = doc->clone();

    ScrubResourceCleaner cleaner;
    try {
        cleaner.clean(*doc);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_structure);
        std::cout << e.what() << "\n";
    }
    assert(doc->getObjectTable() == before->getObjectTable());
    assert(doc->hasObject(ScrubObjGen(7, 0)));
}

static void
test_references()
{
    auto obj = O::newDictionary(
        {{"/A", ref(3)},
         {"/B", O::newArray({ref(3), ref(4), O::newDictionary({{"/C", ref(3)}})})}});
    assert(ScrubResourceCleaner::countReferences(obj, ScrubObjGen(3, 0)) == 3);
    assert(ScrubResourceCleaner::countReferences(obj, ScrubObjGen(4, 0)) == 1);
    auto updated =
        ScrubResourceCleaner::rewriteReferences(obj, ScrubObjGen(3, 0), ScrubObjGen(4, 0));
    assert(updated == 3);
    assert(ScrubResourceCleaner::countReferences(obj, ScrubObjGen(3, 0)) == 0);
    assert(ScrubResourceCleaner::countReferences(obj, ScrubObjGen(4, 0)) == 4);
    assert(obj.unparse() == "<< /A 4 0 R /B [ 4 0 R 4 0 R << /C 4 0 R >> ] >>");
}

int
main()
{
    test_clean();
    test_config();
    test_cascade();
    test_pinned();
    test_pattern_resources();
    test_type3_font_resources();
    test_appearance_resources();
    test_dependent_forms();
    test_dangling_and_empty();
    test_structure_error();
    test_references();
    std::cout << "assertions passed\n";
    return 0;
}

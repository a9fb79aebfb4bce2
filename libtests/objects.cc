#include <scrub/assert_test.h>

#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubLogger.hh>
#include <scrub/ScrubObjGen.hh>
#include <scrub/ScrubObject.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

static void
test_objgen()
{
    ScrubObjGen a(7, 0);
    ScrubObjGen b(7, 1);
    ScrubObjGen c(12, 0);
    assert(a < b && b < c);
    assert(a == ScrubObjGen(7, 0));
    assert(a != b);
    assert(!ScrubObjGen().isIndirect());
    assert(a.describe() == "7 0 R");
    assert(b.unparse(' ') == "7 1");
    std::ostringstream os;
    os << c;
    assert(os.str() == "12,0");

    ScrubObjGen::set seen;
    assert(seen.add(a));
    assert(!seen.add(a));
    assert(seen.add(ScrubObjGen()));
    assert(seen.size() == 1);
    seen.erase(a);
    assert(seen.empty());

    std::unordered_set<ScrubObjGen> hashed{a, b, c, a};
    assert(hashed.size() == 3);
}

static void
test_scalars()
{
    auto n = ScrubObject::newNull();
    assert(n.isNull() && n.unparse() == "null");
    assert(ScrubObject().isNull());
    assert(ScrubObject::newBool(true).unparse() == "true");
    assert(ScrubObject::newInteger(-12).getIntValue() == -12);
    assert(ScrubObject::newReal(1.5).unparse() == "1.5");
    assert(ScrubObject::newReal(3.0).unparse() == "3");
    assert(ScrubObject::newInteger(3).getNumericValue() == 3.0);
    assert(ScrubObject::newName("/Font").isNameAndEquals("/Font"));
    assert(ScrubObject::newString("a(b)\\").unparse() == "(a\\(b\\)\\\\)");
    assert(ScrubObject::newString(std::string("\x01\xff", 2)).unparse() == "<01ff>");
    assert(ScrubObject::newReference(ScrubObjGen(3, 0)).unparse() == "3 0 R");
    assert(std::string(ScrubObject::newArray().getTypeName()) == "array");

    try {
        ScrubObject::newName("Font");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ScrubObject::newInteger(1).getName();
        assert(false);
    } catch (std::logic_error& e) {
        assert(std::string(e.what()).find("integer") != std::string::npos);
    }
    try {
        ScrubObject::newReference(ScrubObjGen());
        assert(false);
    } catch (std::logic_error&) {
    }
}

static void
test_containers()
{
    auto arr = ScrubObject::newArray({ScrubObject::newInteger(1), ScrubObject::newName("/X")});
    assert(arr.getArrayNItems() == 2);
    arr.appendItem(ScrubObject::newBool(false));
    arr.setArrayItem(0, ScrubObject::newInteger(2));
    assert(arr.unparse() == "[ 2 /X false ]");
    arr.eraseItem(1);
    assert(arr.unparse() == "[ 2 false ]");
    assert(arr.getArrayItem(10).isNull());

    auto dict = ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Font")}, {"/Name", ScrubObject::newName("/F1")}});
    assert(dict.hasKey("/Type"));
    assert(dict.getKey("/Missing").isNull());
    assert(dict.isDictionaryOfType("/Font"));
    assert(!dict.isDictionaryOfType("/Font", "/Type1"));
    dict.replaceKey("/Subtype", ScrubObject::newName("/Type1"));
    assert(dict.isDictionaryOfType("/Font", "/Type1"));
    assert(dict.unparse() == "<< /Name /F1 /Subtype /Type1 /Type /Font >>");
    dict.removeKey("/Name");
    assert(dict.getKeys().size() == 2);

    auto stream = ScrubObject::newStream({{"/Subtype", ScrubObject::newName("/Image")}}, "abc");
    assert(stream.isStream() && stream.hasDictionary());
    stream.replaceStreamData("abcdef");
    assert(stream.getStreamData() == "abcdef");
    assert(stream.getKey("/Length").getIntValue() == 6);
    assert(stream.unparse() == "<< /Length 6 /Subtype /Image >> stream");
    assert(stream.getSerializedSize() > stream.unparse().size() + 6);

    auto copy = stream;
    assert(copy == stream);
    copy.replaceStreamData("x");
    assert(copy != stream);
}

static void
test_document()
{
    auto doc = ScrubDocument::emptyDocument();
    auto pages = doc->getPageTreeRoot();
    assert(pages.isIndirect());
    assert(doc->getObject(pages)->isDictionaryOfType("/Pages"));
    assert(doc->getRoot().isDictionaryOfType("/Catalog"));
    assert(doc->getObjectCount() == 2);

    auto page = doc->addPage(ScrubObject::newDictionary());
    auto page2 = doc->addPage(ScrubObject::newDictionary());
    assert(doc->getObject(pages)->getKey("/Count").getIntValue() == 2);
    assert(doc->getObject(page)->getKey("/Parent").getRef() == pages);
    auto all = doc->getAllPages();
    assert(all.size() == 2 && all.at(0) == page && all.at(1) == page2);

    auto ref = doc->makeIndirectObject(ScrubObject::newInteger(5));
    auto og = ref.getRef();
    assert(doc->resolve(ref)->getIntValue() == 5);
    doc->removeObject(og);
    assert(doc->resolve(ref) == nullptr);
    // Object numbers are never reused.
    auto ref2 = doc->makeIndirectObject(ScrubObject::newInteger(6));
    assert(ref2.getRef().getObj() > og.getObj());

    auto ids = doc->getObjectIDs();
    for (size_t i = 1; i < ids.size(); ++i) {
        assert(ids.at(i - 1) < ids.at(i));
    }

    assert(!doc->getInfo().isIndirect());
    doc->setInfo(ScrubObjGen(99, 0));
    assert(doc->getInfo() == ScrubObjGen(99, 0));
    doc->setInfo(ScrubObjGen());
    assert(!doc->getTrailer().hasKey("/Info"));

    auto clone = doc->clone();
    clone->removeObject(page);
    assert(doc->hasObject(page));
    assert(!clone->hasObject(page));

    ScrubDocument bare;
    try {
        bare.getRoot();
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_structure);
    }
}

static void
test_page_tree_depth()
{
    std::ostringstream out;
    std::ostringstream err;
    auto log = ScrubLogger::create();
    log->setOutputStreams(&out, &err);

    // root -> inner -> leaf, plus a loop back to the root
    auto doc = ScrubDocument::emptyDocument();
    doc->setLogger(log);
    auto pages = doc->getPageTreeRoot();
    auto leaf = doc->makeIndirectObject(
        ScrubObject::newDictionary({{"/Type", ScrubObject::newName("/Page")}}));
    auto inner = doc->makeIndirectObject(ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Pages")},
         {"/Kids", ScrubObject::newArray({leaf, ScrubObject::newReference(pages)})}}));
    doc->getObject(pages)->replaceKey("/Kids", ScrubObject::newArray({inner}));

    auto all = doc->getAllPages();
    assert(all.size() == 1 && all.at(0) == leaf.getRef());
    assert(err.str().empty());

    all = doc->getAllPages(2);
    assert(all.size() == 1);
    all = doc->getAllPages(1);
    assert(all.empty());
    assert(err.str().find("WARNING: ") != std::string::npos);
    assert(err.str().find(leaf.getRef().describe()) != std::string::npos);
}

int
main()
{
    test_objgen();
    test_scalars();
    test_containers();
    test_document();
    test_page_tree_depth();
    std::cout << "assertions passed\n";
    return 0;
}

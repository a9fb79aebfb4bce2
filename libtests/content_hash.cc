#include <scrub/assert_test.h>

#include <scrub/ScrubContentHasher.hh>
#include <scrub/ScrubObject.hh>
#include <iostream>

static ScrubObject
image(std::string const& name, std::string const& data)
{
    auto img = ScrubObject::newStream(
        {{"/Type", ScrubObject::newName("/XObject")},
         {"/Subtype", ScrubObject::newName("/Image")},
         {"/Width", ScrubObject::newInteger(2)},
         {"/Height", ScrubObject::newInteger(2)}},
        data);
    if (!name.empty()) {
        img.replaceKey("/Name", ScrubObject::newName(name));
    }
    return img;
}

int
main()
{
    // Known value: sha256("7:integer1:5")
    assert(
        ScrubContentHasher::hashObject(ScrubObject::newInteger(5)) ==
        "3b447f092d16faaeded44345fcbc27119350cbcdbf1c923c52dc49e45f54a81d");

    ScrubContentHasher hasher;
    auto a = image("/Im1", "\x01\x02\x03\x04");
    auto b = image("/Im2", "\x01\x02\x03\x04");
    auto c = image("/Im1", "\x01\x02\x03\x05");
    auto h = hasher.hash(a);
    assert(h.size() == 64);
    // The hasher is reusable and deterministic.
    assert(hasher.hash(a) == h);
    // /Name and /Length don't participate.
    assert(hasher.hash(b) == h);
    b.replaceKey("/Length", ScrubObject::newInteger(999));
    assert(hasher.hash(b) == h);
    // Data and other keys do.
    assert(hasher.hash(c) != h);
    b.replaceKey("/Width", ScrubObject::newInteger(3));
    assert(hasher.hash(b) != h);

    // A dictionary doesn't collide with a stream that has the same dictionary.
    auto dict = ScrubObject::newDictionary(a.getDictAsMap());
    assert(hasher.hash(dict) != h);

    // Key and value boundaries are unambiguous.
    auto d1 = ScrubObject::newDictionary({{"/AB", ScrubObject::newName("/C")}});
    auto d2 = ScrubObject::newDictionary({{"/A", ScrubObject::newName("/BC")}});
    assert(hasher.hash(d1) != hasher.hash(d2));

    // References hash by id, not by target.
    auto f1 = ScrubObject::newDictionary(
        {{"/Type", ScrubObject::newName("/Font")},
         {"/FontDescriptor", ScrubObject::newReference(ScrubObjGen(10, 0))}});
    auto f2 = f1;
    assert(hasher.hash(f1) == hasher.hash(f2));
    f2.replaceKey("/FontDescriptor", ScrubObject::newReference(ScrubObjGen(11, 0)));
    assert(hasher.hash(f1) != hasher.hash(f2));

    // Dictionary order of insertion doesn't matter.
    auto o1 = ScrubObject::newDictionary();
    o1.replaceKey("/X", ScrubObject::newInteger(1));
    o1.replaceKey("/Y", ScrubObject::newInteger(2));
    auto o2 = ScrubObject::newDictionary();
    o2.replaceKey("/Y", ScrubObject::newInteger(2));
    o2.replaceKey("/X", ScrubObject::newInteger(1));
    assert(hasher.hash(o1) == hasher.hash(o2));

    std::cout << "assertions passed\n";
    return 0;
}

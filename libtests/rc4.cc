#include <scrub/assert_test.h>

#include <scrub/Pl_RC4.hh>
#include <scrub/Pl_String.hh>
#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>
#include <cstring>
#include <iostream>
#include <stdexcept>

static void
test_rc4()
{
    // Convert in place through the static helper
    std::string data = "potato";
    RC4::process("quack", data);
    assert(ScrubUtil::hex_encode(data) == "a56fe7272b5c");
    RC4::process("quack", data);
    assert(data == "potato");

    // Discarding the first 128 bytes of keystream
    data = "potato";
    RC4::process("quack", data, 128);
    assert(ScrubUtil::hex_encode(data) == "fbe5f21b2323");

    std::string key;
    for (int i = 0; i < 32; ++i) {
        key.append(1, static_cast<char>(i));
    }
    data = "test data";
    RC4::process(key, data, 128);
    assert(ScrubUtil::hex_encode(data) == "6618b964ef4de10300");

    // Separate output buffer
    RC4 r(ScrubUtil::unsigned_char_pointer("quack"), 5);
    unsigned char out[6];
    r.process(ScrubUtil::unsigned_char_pointer("potato"), 6, out);
    assert(memcmp(out, "\xa5\x6f\xe7\x27\x2b\x5c", 6) == 0);

    std::string empty;
    RC4::process("quack", empty);
    assert(empty.empty());

    try {
        RC4 bad(ScrubUtil::unsigned_char_pointer(""), 0);
        assert(false);
    } catch (std::runtime_error&) {
    }
}

static void
test_pipeline()
{
    // A small buffer forces the input through in several pieces.
    std::string result;
    Pl_String s("out", nullptr, result);
    Pl_RC4 rc4("rc4", &s, "quack", 128, 2);
    rc4.writeString("pot");
    rc4.writeString("ato");
    rc4.finish();
    assert(ScrubUtil::hex_encode(result) == "fbe5f21b2323");
    try {
        rc4.writeString("more");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        Pl_RC4 no_next("rc4", nullptr, "quack");
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    for (auto const& name: ScrubCryptoProvider::getRegisteredImpls()) {
        ScrubCryptoProvider::setDefaultProvider(name);
        test_rc4();
        test_pipeline();
    }
    ScrubCryptoProvider::setDefaultProvider(initial);
    std::cout << "assertions passed\n";
    return 0;
}

#include <scrub/assert_test.h>

#include <scrub/Pl_SHA2.hh>
#include <scrub/Pl_String.hh>
#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>
#include <cstring>
#include <iostream>
#include <stdexcept>

static void
test(Pl_SHA2& sha2, char const* description, int bits, char const* input, std::string const& output)
{
    sha2.resetBits(bits);
    sha2.write(ScrubUtil::unsigned_char_pointer(input), strlen(input));
    sha2.finish();
    std::cout << description << ": ";
    if (output == sha2.getHexDigest()) {
        std::cout << "passed\n";
    } else {
        std::cout << "failed\n"
                  << "  expected: " << output << "\n"
                  << "  actual:   " << sha2.getHexDigest() << "\n";
    }
    assert(output == sha2.getHexDigest());
}

static void
test_provider(std::string const& name)
{
    std::cout << "provider " << name << "\n";
    ScrubCryptoProvider::setDefaultProvider(name);
    Pl_SHA2 sha2;
    std::string million_a(1000000, 'a');
    test(sha2, "256 empty", 256, "",
         "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    test(sha2, "256 short", 256, "abc",
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    test(sha2, "256 long", 256,
         "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
         "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    test(sha2, "256 million", 256, million_a.c_str(),
         "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
    test(sha2, "384 short", 384, "abc",
         "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded163"
         "1a8b605a43ff5bed8086072ba1e7cc2358baeca134c825a7");
    test(sha2, "512 short", 512, "abc",
         "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
         "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

    // Reusing the pipeline after finish starts a fresh digest.
    Pl_SHA2 reuse(256);
    reuse.writeString("The quick brown fox ");
    reuse.writeString("jumps over the lazy dog");
    reuse.finish();
    assert(
        reuse.getHexDigest() ==
        "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
    reuse.writeString("abc");
    reuse.finish();
    assert(
        reuse.getHexDigest() ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(reuse.getRawDigest().size() == 32);

    // Data passes through to the next pipeline unchanged.
    std::string passed;
    Pl_String out("out", nullptr, passed);
    Pl_SHA2 tee(256, &out);
    tee.writeString("abc");
    tee.finish();
    assert(passed == "abc");

    Pl_SHA2 busy(256);
    busy.writeString("x");
    try {
        busy.getHexDigest();
        assert(false);
    } catch (std::logic_error&) {
    }
    Pl_SHA2 unset;
    try {
        unset.writeString("x");
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    for (auto const& name: ScrubCryptoProvider::getRegisteredImpls()) {
        test_provider(name);
    }
    ScrubCryptoProvider::setDefaultProvider(initial);
    std::cout << "assertions passed\n";
    return 0;
}

#include <scrub/assert_test.h>

#include <scrub/Pl_AES_CBC.hh>
#include <scrub/Pl_String.hh>
#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>
#include <iostream>
#include <stdexcept>

static std::string const static_iv = "0e1c2a38465462707e8c9aa8b6c4d2e0";

static void
test_vectors()
{
    Pl_AES_CBC::useStaticIV();

    auto key128 = ScrubUtil::hex_decode("000102030405060708090a0b0c0d0e0f");
    auto ct = Pl_AES_CBC::encrypt(key128, "test data");
    assert(ScrubUtil::hex_encode(ct) == static_iv + "c3151a67a2314669e8c8e7a4a0dbac26");
    assert(Pl_AES_CBC::decrypt(key128, ct) == "test data");

    // A full block of input gets a full block of padding.
    auto key256 = ScrubUtil::hex_decode(
        "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
    ct = Pl_AES_CBC::encrypt(key256, "0123456789abcdef");
    assert(
        ScrubUtil::hex_encode(ct) ==
        static_iv + "6dd1cf7ba10519ee3695855509f5bd32ca87982527a7ed5ff11f6d5cde3f0ff7");
    assert(Pl_AES_CBC::decrypt(key256, ct) == "0123456789abcdef");

    // Empty input encrypts to the IV and one padding block.
    ct = Pl_AES_CBC::encrypt(key256, "");
    assert(ct.size() == 32);
    assert(Pl_AES_CBC::decrypt(key256, ct).empty());
}

static void
test_explicit_iv()
{
    auto key = std::string(24, '\x11');
    std::string iv(16, '\x42');
    std::string result;
    Pl_String s("out", nullptr, result);
    Pl_AES_CBC aes("aes", &s, true, key);
    aes.setIV(iv);
    aes.writeString("written in ");
    aes.writeString("two parts");
    aes.finish();
    assert(result.substr(0, 16) == iv);
    assert(result.size() == 16 + 32);
    assert(Pl_AES_CBC::decrypt(key, result) == "written in two parts");

    try {
        aes.setIV("short");
        assert(false);
    } catch (std::logic_error&) {
    }
}

static void
test_errors()
{
    try {
        Pl_AES_CBC::encrypt("not a valid key", "data");
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "bad key: " << e.what() << "\n";
    }

    auto key = std::string(16, 'k');
    auto ct = Pl_AES_CBC::encrypt(key, "some plain text");
    try {
        Pl_AES_CBC::decrypt(key, ct.substr(0, ct.size() - 3));
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "truncated: " << e.what() << "\n";
    }
    try {
        Pl_AES_CBC::decrypt(key, ct.substr(0, 16));
        assert(false);
    } catch (std::runtime_error&) {
    }

    // The wrong key either breaks the padding or yields garbage.
    auto wrong = std::string(16, 'w');
    bool threw = false;
    std::string garbage;
    try {
        garbage = Pl_AES_CBC::decrypt(wrong, ct);
    } catch (std::runtime_error&) {
        threw = true;
    }
    assert(threw || garbage != "some plain text");
}

int
main()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    for (auto const& name: ScrubCryptoProvider::getRegisteredImpls()) {
        ScrubCryptoProvider::setDefaultProvider(name);
        test_vectors();
        test_explicit_iv();
        test_errors();
    }
    ScrubCryptoProvider::setDefaultProvider(initial);
    std::cout << "assertions passed\n";
    return 0;
}

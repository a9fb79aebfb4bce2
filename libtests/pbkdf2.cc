#include <scrub/assert_test.h>

#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>
#include <iostream>
#include <stdexcept>

static void
test_derive(std::string const& name)
{
    auto crypto = ScrubCryptoProvider::getImpl(name);
    auto key = crypto->PBKDF2_derive(
        "0123456789abcdef0123456789abcdef", "scrub-test-salt!", 10000, 32);
    assert(
        ScrubUtil::hex_encode(key) ==
        "005c8d4b1a9524728378488c77db6ca8335173e461c8a791d1686553b6b20cf4");

    // A shorter key is a prefix of the longer one.
    auto short_key = crypto->PBKDF2_derive(
        "0123456789abcdef0123456789abcdef", "scrub-test-salt!", 10000, 16);
    assert(short_key == key.substr(0, 16));

    auto other = crypto->PBKDF2_derive(
        "0123456789abcdef0123456789abcdef", "another-salt-val", 10000, 32);
    assert(other != key);

    try {
        crypto->PBKDF2_derive("password", "scrub-test-salt!", 0, 32);
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        crypto->PBKDF2_derive("password", "scrub-test-salt!", 1, 0);
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    for (auto const& name: ScrubCryptoProvider::getRegisteredImpls()) {
        std::cout << "provider " << name << "\n";
        test_derive(name);
    }
    std::cout << "assertions passed\n";
    return 0;
}

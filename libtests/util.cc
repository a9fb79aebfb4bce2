#include <scrub/assert_test.h>

#include <scrub/ScrubUtil.hh>
#include <cmath>
#include <iostream>
#include <stdexcept>

static void
hex_test()
{
    assert(ScrubUtil::hex_encode("\x01\xab\xff") == "01abff");
    assert(ScrubUtil::hex_decode("01ABff") == "\x01\xab\xff");
    assert(ScrubUtil::hex_decode("3c 3f 78 70") == "<?xp");
    // An odd digit count is padded with 0
    assert(ScrubUtil::hex_decode("414") == "A@");
}

static void
utf8_test()
{
    assert(ScrubUtil::is_utf8(""));
    assert(ScrubUtil::is_utf8("plain ascii"));
    assert(ScrubUtil::is_utf8("caf\xc3\xa9"));
    assert(ScrubUtil::is_utf8("\xf0\x9f\x98\x80"));
    assert(!ScrubUtil::is_utf8("\xff\xfe"));
    // truncated sequence
    assert(!ScrubUtil::is_utf8("caf\xc3"));
    // overlong encoding of '/'
    assert(!ScrubUtil::is_utf8("\xc0\xaf"));
    // UTF-16 surrogate
    assert(!ScrubUtil::is_utf8("\xed\xa0\x80"));
    // beyond U+10FFFF
    assert(!ScrubUtil::is_utf8("\xf4\x90\x80\x80"));
}

static void
entropy_test()
{
    assert(ScrubUtil::shannon_entropy("") == 0.0);
    assert(ScrubUtil::shannon_entropy("aaaa") == 0.0);
    assert(std::fabs(ScrubUtil::shannon_entropy("abab") - 1.0) < 1e-9);
    std::string all;
    for (int i = 0; i < 256; ++i) {
        all += static_cast<char>(i);
    }
    assert(std::fabs(ScrubUtil::shannon_entropy(all) - 8.0) < 1e-9);
}

static void
random_test()
{
    auto a = ScrubUtil::random_bytes(16);
    auto b = ScrubUtil::random_bytes(16);
    assert(a.size() == 16 && b.size() == 16);
    assert(a != b);
}

static void
env_test()
{
    std::string value;
    assert(!ScrubUtil::get_env("SCRUB_TEST_SURELY_NOT_SET", &value));
    assert(ScrubUtil::get_env("PATH"));
}

int
main()
{
    hex_test();
    utf8_test();
    entropy_test();
    random_test();
    env_test();
    std::cout << "assertions passed\n";
    return 0;
}

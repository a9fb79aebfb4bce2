#include <scrub/assert_test.h>

#include <scrub/Pl_Flate.hh>
#include <scrub/Pl_String.hh>
#include <scrub/ScrubUtil.hh>
#include <iostream>
#include <stdexcept>

static std::string const compressed_hex =
    "789c730a51d07733543034520849533037523007b15214343c527372f21554555dfddd14caf38b72"
    "52341542b2145c43b80024480c67";
static std::string const expected = "BT /F1 12 Tf 72 712 Td (Hello %%EOF world) Tj ET\n";

static std::string
inflate(
    std::string const& data,
    std::string* warnings = nullptr,
    unsigned int bufsize = 65536,
    unsigned long long limit = 0)
{
    std::string result;
    Pl_String out("out", nullptr, result);
    Pl_Flate inflate("inflate", &out, bufsize);
    inflate.setMemoryLimit(limit);
    if (warnings) {
        inflate.setWarnCallback([warnings](char const* msg, int) { *warnings += msg; });
    }
    inflate.writeString(data);
    inflate.finish();
    return result;
}

int
main()
{
    auto compressed = ScrubUtil::hex_decode(compressed_hex);
    assert(inflate(compressed) == expected);

    // Tiny output buffer and input delivered a byte at a time
    std::string result;
    Pl_String out("out", nullptr, result);
    Pl_Flate small("inflate", &out, 3);
    for (auto ch: compressed) {
        small.writeString(std::string(1, ch));
    }
    small.finish();
    assert(result == expected);

    // Truncated input produces a warning and the data that could be recovered.
    std::string warnings;
    auto partial = inflate(compressed.substr(0, compressed.size() - 8), &warnings);
    assert(!warnings.empty());
    assert(expected.compare(0, partial.size(), partial) == 0);

    try {
        inflate("this is not zlib data");
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << "garbage: " << e.what() << "\n";
    }

    // The limit applies per pipeline and counts every byte produced, across buffer refills.
    try {
        inflate(compressed, nullptr, 65536, 10);
        assert(false);
    } catch (std::runtime_error& e) {
        std::cout << e.what() << "\n";
    }
    try {
        inflate(compressed, nullptr, 16, expected.size() - 1);
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()).find("exceeds") != std::string::npos);
    }
    assert(inflate(compressed, nullptr, 16, expected.size()) == expected);
    {
        std::string discard;
        Pl_String out("out", nullptr, discard);
        Pl_Flate unlimited("inflate", &out);
        assert(unlimited.getMemoryLimit() == 0);
    }

    try {
        Pl_Flate no_next("inflate", nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }

    std::cout << "assertions passed\n";
    return 0;
}

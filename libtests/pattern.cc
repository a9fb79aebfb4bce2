#include <scrub/assert_test.h>

#include <scrub/ScrubExc.hh>
#include <scrub/ScrubPattern.hh>
#include <iostream>
#include <stdexcept>

static void
expect_invalid(ScrubPattern p)
{
    try {
        p.compile();
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_validation);
        assert(e.getObject() == p.getId());
        std::cout << "invalid: " << e.what() << "\n";
    }
    assert(!p.isCompiled());
}

static void
test_bytes()
{
    auto p = ScrubPattern::bytes("eof", scrub_mk_embedded_file, "%%EOF", "", "end marker");
    assert(!p.isCompiled());
    try {
        p.findIn("%%EOF");
        assert(false);
    } catch (std::logic_error&) {
    }
    p.compile();
    assert(p.isCompiled());
    assert(p.getDetector() == scrub_det_byte_pattern);
    assert(p.getKind() == scrub_mk_embedded_file);
    assert(p.getDescription() == "end marker");

    auto r = p.findIn("abc%%EOFdef%%EOF");
    assert(r && r->first == 3 && r->second == 8);
    assert(!p.findIn("%%EO"));
    assert(!p.findIn(""));

    // Mask: the second byte is ignored.
    auto masked = ScrubPattern::bytes(
        "masked", scrub_mk_custom, std::string("\x41\x00", 2), std::string("\xff\x00", 2));
    masked.compile();
    r = masked.findIn("zzAqzz");
    assert(r && r->first == 2 && r->second == 4);
    r = masked.findIn(std::string("A\xff", 2));
    assert(r && r->first == 0);
    assert(!masked.findIn("zzzA"));
    assert(!masked.findIn("aaaa"));

    // Mask selecting the high nibble
    auto nibble = ScrubPattern::bytes(
        "nibble", scrub_mk_custom, std::string("\x40", 1), std::string("\xf0", 1));
    nibble.compile();
    r = nibble.findIn("12AB");
    assert(r && r->first == 2);
    assert(!nibble.findIn("1234"));
}

static void
test_text()
{
    auto p = ScrubPattern::text("adobe", scrub_mk_application_trace, "Adobe.*PDF", true);
    p.compile();
    assert(p.getDetector() == scrub_det_text_pattern);
    assert(p.isCaseInsensitive());
    auto r = p.findIn("made with ADOBE Acrobat pdf library");
    assert(r && r->first == 10 && r->second == 27);
    // Matches do not span lines.
    assert(!p.findIn("Adobe\nPDF"));
    r = p.findIn("line one\r\nAdobe PDF");
    assert(r && r->first == 10 && r->second == 19);
    // Not valid UTF-8
    assert(!p.findIn("Adobe PDF \xff"));

    auto sensitive = ScrubPattern::text("adobe", scrub_mk_application_trace, "Adobe.*PDF");
    sensitive.compile();
    assert(!sensitive.findIn("ADOBE PDF"));
    assert(sensitive.findIn("Adobe PDF"));

    // Empty matches are not matches.
    auto empty = ScrubPattern::text("empty", scrub_mk_custom, "x*");
    empty.compile();
    assert(!empty.findIn("abc"));
    r = empty.findIn("xxc");
    assert(r && r->first == 0 && r->second == 2);
}

static void
test_invalid()
{
    expect_invalid(ScrubPattern::bytes("empty", scrub_mk_custom, ""));
    expect_invalid(ScrubPattern::text("empty", scrub_mk_custom, ""));
    expect_invalid(ScrubPattern::bytes("short-mask", scrub_mk_custom, "AB", "\xff"));
    expect_invalid(ScrubPattern::text("regex", scrub_mk_custom, "(unclosed"));
    expect_invalid(ScrubPattern::text("regex", scrub_mk_custom, "[z-a]"));
}

static void
test_bits_outside_mask()
{
    auto p = ScrubPattern::bytes(
        "outside-mask", scrub_mk_custom, std::string("\x41\x01", 2), std::string("\xff\x00", 2));
    p.compile();
    assert(p.getPattern() == std::string("\x41\x00", 2));
    auto r = p.findIn(std::string("xxA\x7fyy", 6));
    assert(r && r->first == 2 && r->second == 4);
    assert(p.findIn(std::string("xxA\x01", 4)));
    assert(!p.findIn("xxB\x01"));
}

int
main()
{
    test_bytes();
    test_text();
    test_invalid();
    test_bits_outside_mask();
    std::cout << "assertions passed\n";
    return 0;
}

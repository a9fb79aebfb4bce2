#include <scrub/assert_test.h>

#include "test_keys.hh"

#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubJob.hh>
#include <scrub/ScrubLogger.hh>
#include <functional>
#include <iostream>
#include <sstream>

typedef ScrubObject O;

static std::string const passphrase = "0123456789abcdef0123456789abcdef";
static std::string const salt = "scrub-test-salt!";

static O
font(std::string const& name)
{
    return O::newDictionary(
        {{"/Type", O::newName("/Font")},
         {"/Subtype", O::newName("/Type1")},
         {"/Name", O::newName(name)},
         {"/BaseFont", O::newName("/Helvetica")}});
}

static O
image(std::string const& name)
{
    return O::newStream(
        {{"/Type", O::newName("/XObject")},
         {"/Subtype", O::newName("/Image")},
         {"/Name", O::newName(name)},
         {"/Width", O::newInteger(1)},
         {"/Height", O::newInteger(1)}},
        "\x80");
}

static O
ref(int id)
{
    return O::newReference(ScrubObjGen(id, 0));
}

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
               {"/XObject", O::newDictionary({{"/Im1", ref(9)}, {"/Im2", ref(12)}})}})}}));
    auto info = doc->makeIndirectObject(O::newDictionary(
        {{"/Producer", O::newString("Adobe PDF Library 15.0")},
         {"/Title", O::newString("Report")}}));
    doc->setInfo(info.getRef());
    auto xmp = doc->makeIndirectObject(O::newStream(
        {{"/Type", O::newName("/Metadata")}, {"/Subtype", O::newName("/XML")}},
        "<?xpacket begin=\"\"?><x:xmpmeta/><?xpacket end=\"w\"?>"));
    doc->getRoot().replaceKey("/Metadata", xmp);
    return doc;
}

static void
expect_config_error(std::function<void()> fn)
{
    try {
        fn();
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_configuration);
        assert(e.getPhase() == "configuration");
        std::cout << "configuration error: " << e.getMessageDetail() << "\n";
    }
}

static void
test_full_run()
{
    auto doc = make_document();
    auto info_og = doc->getInfo();
    ScrubJob j;
    j.config()
        ->parallelScanning(false)
        ->encryption()
        ->algorithm("aes-cbc")
        ->keyLength(256)
        ->key(passphrase)
        ->salt(salt)
        ->iterations(10000)
        ->endEncryption()
        ->signature()
        ->algorithm("rsa-pkcs1-sha256")
        ->certificate(rsa_certificate)
        ->privateKey(rsa_private_key)
        ->endSignature()
        ->checkConfiguration();
    j.run(*doc);

    // Scanning sees the document before anything is encrypted.
    auto const& matches = j.getMatches();
    assert(matches.size() == 2);
    assert(matches.at(info_og).pattern_id == "producer_trace");
    assert(matches.at(info_og).origin == "Adobe PDF Library 15.0");
    assert(j.getConfidentMatches().size() == 2);
    assert(j.getScanningStats().instances_found == 2);

    assert(j.getCleaningStats().resources_removed == 2);
    assert(!doc->hasObject(ScrubObjGen(7, 0)));
    assert(!doc->hasObject(ScrubObjGen(12, 0)));

    auto const& info = *doc->getObject(info_og);
    assert(info.getKey("/Producer").getStringValue() != "Adobe PDF Library 15.0");
    assert(j.getSecurityStats().fields_encrypted == 3);
    assert(j.getSecurityStats().fields_signed == 3);
    assert(j.getSignatures().size() == 3);
    assert(j.getSignatures().at(0).field == "/Producer");
}

static void
test_phases()
{
    auto doc = make_document();
    auto before = doc->clone();
    ScrubJob j;
    j.config()->noScan()->noClean();
    j.run(*doc);
    assert(j.getMatches().empty());
    assert(j.getCleaningStats().resources_processed == 0);
    assert(j.getSecurityStats().fields_encrypted == 0);
    assert(doc->getObjectTable() == before->getObjectTable());

    // Cleaning options reach the cleaner.
    ScrubJob k;
    k.config()->noScan()->updateReferences(false)->removeEmpty(false);
    k.run(*doc);
    assert(k.getCleaningStats().resources_removed == 1);
    assert(doc->hasObject(ScrubObjGen(12, 0)));

    // Scanning options and custom detectors reach the scanner.
    doc = make_document();
    ScrubJob s;
    s.config()->noClean()->scanMetadata(false)->customPattern(
        ScrubPattern::bytes("end_marker", scrub_mk_custom, "end="));
    s.registerDetector("font_detector", [](ScrubObjGen, ScrubObject const& obj) {
        std::optional<ScrubPatternScanner::PatternMatch> result;
        if (obj.isDictionaryOfType("/Font")) {
            ScrubPatternScanner::PatternMatch match;
            match.kind = scrub_mk_custom;
            match.confidence = 0.25;
            result = match;
        }
        return result;
    });
    s.run(*doc);
    auto const& matches = s.getMatches();
    assert(matches.size() == 3);
    assert(matches.at(ScrubObjGen(5, 0)).pattern_id == "font_detector");
    assert(matches.at(ScrubObjGen(7, 0)).pattern_id == "font_detector");
    auto xmp_og = doc->getRoot().getKey("/Metadata").getRef();
    assert(matches.at(xmp_og).pattern_id == "end_marker");
    assert(s.getConfidentMatches().size() == 1);
}

static void
test_errors()
{
    ScrubJob j;
    expect_config_error([&j]() { j.config()->confidenceThreshold(1.5); });
    expect_config_error([&j]() { j.config()->pageTreeDepth(0); });
    expect_config_error([&j]() { j.config()->scanDepth(-1); });
    expect_config_error([&j]() { j.config()->maxDecodedSize(0); });
    expect_config_error([&j]() {
        j.config()->customPattern(ScrubPattern::text("bad", scrub_mk_custom, "(unclosed"));
    });
    expect_config_error([&j]() { j.config()->encryption()->keyLength(100); });
    expect_config_error([&j]() { j.config()->encryption()->iterations(1000); });
    expect_config_error([&j]() { j.config()->encryption()->algorithm("des"); });
    expect_config_error([&j]() { j.config()->encryption()->key(passphrase)->endEncryption(); });
    expect_config_error([&j]() { j.config()->signature()->algorithm("dsa"); });
    expect_config_error(
        [&j]() { j.config()->signature()->certificate(rsa_certificate)->endSignature(); });

    // Detected when the handler is configured
    ScrubJob k;
    k.config()->encryption()->key(passphrase)->salt("short")->endEncryption();
    expect_config_error([&k]() { k.checkConfiguration(); });
    auto doc = make_document();
    expect_config_error([&k, &doc]() { k.run(*doc); });

    ScrubJob ec;
    ec.config()
        ->signature()
        ->algorithm("ecdsa-p256-sha256")
        ->certificate(ec_certificate)
        ->privateKey(ec_p384_private_key)
        ->endSignature();
    expect_config_error([&ec]() { ec.checkConfiguration(); });

    // A broken page tree stops the job in the clean phase.
    doc = make_document();
    auto pages = doc->getPageTreeRoot();
    auto kids = doc->getObject(pages)->getKey("/Kids");
    kids.appendItem(O::newReference(pages));
    doc->getObject(pages)->replaceKey("/Kids", kids);
    ScrubJob broken;
    try {
        broken.run(*doc);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_structure);
        assert(e.getPhase() == "clean");
    }
    assert(doc->hasObject(ScrubObjGen(7, 0)));
}

int
main()
{
    test_full_run();
    test_phases();
    test_errors();
    std::cout << "assertions passed\n";
    return 0;
}

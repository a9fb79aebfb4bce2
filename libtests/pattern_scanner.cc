#include <scrub/assert_test.h>

#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubLogger.hh>
#include <scrub/ScrubPatternScanner.hh>
#include <scrub/ScrubUtil.hh>
#include <iostream>
#include <limits>
#include <sstream>

typedef ScrubObject O;
typedef ScrubPatternScanner S;

static std::string const flate_with_eof = ScrubUtil::hex_decode(
    "789c730a51d07733543034520849533037523007b15214343c527372f21554555dfddd14caf38b72"
    "52341542b2145c43b80024480c67");

static ScrubObjGen
og(int id)
{
    return {id, 0};
}

static std::unique_ptr<ScrubDocument>
make_document(std::shared_ptr<ScrubLogger> log)
{
    auto doc = ScrubDocument::emptyDocument();
    doc->setLogger(log);
    doc->replaceObject(og(3), O::newStream({}, "trailing bytes\n%%EOF\n"));
    doc->replaceObject(
        og(4),
        O::newDictionary(
            {{"/Producer", O::newString("Adobe PDF Library 15.0")},
             {"/Title", O::newString("Quarterly report")}}));
    doc->replaceObject(
        og(5),
        O::newDictionary(
            {{"/S", O::newName("/JavaScript")}, {"/JS", O::newString("app.alert(1)")}}));
    doc->replaceObject(
        og(6), O::newDictionary({{"/FT", O::newName("/Tx")}, {"/T", O::newString("name")}}));
    doc->replaceObject(
        og(7),
        O::newDictionary({{"/Type", O::newName("/Annot")}, {"/Subtype", O::newName("/Link")}}));
    doc->replaceObject(
        og(8),
        O::newDictionary(
            {{"/Type", O::newName("/Filespec")},
             {"/EF", O::newDictionary({{"/F", O::newReference(og(9))}})}}));
    doc->replaceObject(
        og(9), O::newStream({{"/Filter", O::newName("/FlateDecode")}}, flate_with_eof));
    doc->replaceObject(
        og(10),
        O::newStream(
            {{"/Type", O::newName("/Metadata")}, {"/Subtype", O::newName("/XML")}},
            "<?xpacket begin=\"\"?><x:xmpmeta/>"));
    doc->replaceObject(og(11), O::newDictionary({{"/Type", O::newName("/Font")}}));
    doc->replaceObject(
        og(12),
        O::newDictionary(
            {{"/Type", O::newName("/Outlines")},
             {"/Comment", O::newArray({O::newString("exported by Adobe InDesign PDF")})}}));
    return doc;
}

static std::shared_ptr<ScrubLogger>
quiet_logger(std::ostringstream& out, std::ostringstream& err)
{
    auto log = ScrubLogger::create();
    log->setOutputStreams(&out, &err);
    return log;
}

static void
test_single_eof()
{
    auto doc = ScrubDocument::emptyDocument();
    auto ref = doc->makeIndirectObject(O::newStream({}, "binary junk %%EOF"));
    S scanner;
    S::ScanningConfig config;
    auto const& matches = scanner.scan(*doc, config);
    assert(matches.size() == 1);
    auto const& match = matches.at(ref.getRef());
    assert(match.kind == scrub_mk_embedded_file);
    assert(match.confidence == 1.0);
    assert(match.pattern_id == "embedded_file");
    assert(match.detector == scrub_det_byte_pattern);
    assert(match.location.start == 12 && match.location.end == 17);
    assert(scanner.getStats().instances_found == 1);
    assert(scanner.getStats().objects_scanned == 3);
    assert(&scanner.getMatches() == &matches);
}

static void
test_full_scan()
{
    std::ostringstream out;
    std::ostringstream err;
    auto doc = make_document(quiet_logger(out, err));
    S scanner;
    S::ScanningConfig config;
    config.parallel_scanning = false;
    auto const& matches = scanner.scan(*doc, config);
    for (auto const& iter: matches) {
        std::cout << iter.first.describe() << ": " << S::kindName(iter.second.kind) << " "
                  << iter.second.pattern_id << " (" << iter.second.location.context << ")\n";
    }
    assert(matches.size() == 9);
    assert(!matches.count(og(1)) && !matches.count(og(2)) && !matches.count(og(11)));

    auto const& eof = matches.at(og(3));
    assert(eof.location.context == "stream in object 3 0 R");
    assert(eof.location.start == 15 && eof.location.end == 20);
    assert(eof.location.context_before == "trailing bytes\n");
    assert(eof.location.context_after == "\n");
    assert(eof.analysis.content_type == "text/plain");
    assert(eof.analysis.encoding == "utf-8");
    assert(eof.analysis.compression == "none");
    assert(eof.analysis.properties.at("length") == "21");
    assert(eof.metadata.at("description") == "end-of-file marker");

    auto const& producer = matches.at(og(4));
    assert(producer.pattern_id == "producer_trace");
    assert(producer.kind == scrub_mk_application_trace);
    assert(producer.detector == scrub_det_structure);
    assert(producer.origin == "Adobe PDF Library 15.0");
    assert(producer.location.context == "dictionary key /Producer in object 4 0 R");
    assert(producer.metadata.at("key") == "/Producer");

    assert(matches.at(og(5)).kind == scrub_mk_javascript);
    assert(matches.at(og(5)).metadata.at("value") == "app.alert(1)");
    assert(matches.at(og(6)).kind == scrub_mk_form_data);
    assert(matches.at(og(7)).kind == scrub_mk_annotation);
    assert(matches.at(og(8)).kind == scrub_mk_embedded_file);
    assert(matches.at(og(8)).pattern_id == "embedded_file_spec");

    auto const& decoded = matches.at(og(9));
    assert(decoded.pattern_id == "embedded_file");
    assert(decoded.location.context == "decoded stream in object 9 0 R");
    assert(decoded.analysis.compression == "/FlateDecode");

    assert(matches.at(og(10)).kind == scrub_mk_metadata);
    assert(matches.at(og(10)).pattern_id == "xmp_packet");
    assert(matches.at(og(10)).analysis.content_type == "XML");

    auto const& trace = matches.at(og(12));
    assert(trace.pattern_id == "adobe_metadata");
    assert(trace.kind == scrub_mk_metadata);
    assert(trace.detector == scrub_det_text_pattern);
    assert(trace.origin == "Adobe InDesign PDF");
    assert(trace.location.context == "string /Comment in object 12 0 R");

    auto const& stats = scanner.getStats();
    assert(stats.objects_scanned == 12);
    assert(stats.instances_found == 9);
    assert(stats.patterns_matched == 8);
    assert(stats.scan_failures == 0);
    assert(err.str().empty());

    // Parallel scanning gives identical results.
    S parallel;
    config.parallel_scanning = true;
    assert(parallel.scan(*doc, config) == matches);
    assert(parallel.getStats().instances_found == 9);
    assert(parallel.getStats().patterns_matched == 8);
}

static void
test_config()
{
    std::ostringstream out;
    std::ostringstream err;
    auto doc = make_document(quiet_logger(out, err));
    S scanner;
    S::ScanningConfig config;
    config.scan_javascript = false;
    config.scan_annotations = false;
    config.scan_metadata = false;
    auto const& matches = scanner.scan(*doc, config);
    assert(!matches.count(og(4)));
    assert(!matches.count(og(5)));
    assert(!matches.count(og(7)));
    assert(!matches.count(og(10)));
    assert(!matches.count(og(12)));
    assert(matches.size() == 4);

    config = S::ScanningConfig();
    config.context_size = 4;
    scanner.scan(*doc, config);
    assert(scanner.getMatches().at(og(3)).location.context_before == "tes\n");

    // Structural checks stop at max_depth.
    auto nested = ScrubDocument::emptyDocument();
    nested->replaceObject(
        og(3),
        O::newDictionary(
            {{"/A", O::newDictionary({{"/B", O::newDictionary({{"/JS", O::newString("x")}})}})}}));
    config = S::ScanningConfig();
    assert(scanner.scan(*nested, config).size() == 1);
    config.max_depth = 1;
    assert(scanner.scan(*nested, config).empty());

    config = S::ScanningConfig();
    config.confidence_threshold = 1.5;
    try {
        scanner.scan(*doc, config);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_configuration);
    }
    assert(scanner.getMatches().empty());
    config.confidence_threshold = -0.1;
    try {
        S::checkConfig(config);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_configuration);
    }
    config = S::ScanningConfig();
    config.max_depth = -1;
    try {
        S::checkConfig(config);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_configuration);
    }

    config = S::ScanningConfig();
    config.custom_patterns.push_back(ScrubPattern::text("bad", scrub_mk_custom, "(oops"));
    try {
        scanner.scan(*doc, config);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_validation);
        assert(e.getObject() == "bad");
    }
    assert(scanner.getStats().objects_scanned == 0);

    config = S::ScanningConfig();
    config.max_decoded_size = 0;
    try {
        S::checkConfig(config);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_configuration);
    }

    auto builtins = S::builtinPatterns(S::ScanningConfig());
    assert(builtins.size() == 4);
    assert(builtins.at(0).getId() == "embedded_file");
    assert(builtins.at(3).getId() == "adobe_metadata");
    assert(builtins.at(3).getKind() == scrub_mk_metadata);
}

static void
test_stream_data_first()
{
    // Stream data is checked before the stream's dictionary.
    auto doc = ScrubDocument::emptyDocument();
    auto ref = doc->makeIndirectObject(O::newStream(
        {{"/Type", O::newName("/Annot")}, {"/Producer", O::newString("Writer")}},
        "payload %%EOF"));
    S scanner;
    auto const& match = scanner.scan(*doc).at(ref.getRef());
    assert(match.pattern_id == "embedded_file");
    assert(match.detector == scrub_det_byte_pattern);
    assert(match.location.context == "stream in object " + ref.getRef().describe());

    // Without a data match the dictionary is still examined.
    doc->replaceObject(ref.getRef(), O::newStream({{"/Type", O::newName("/Annot")}}, "payload"));
    assert(scanner.scan(*doc).at(ref.getRef()).kind == scrub_mk_annotation);
}

static void
test_decoded_size_limit()
{
    std::ostringstream out;
    std::ostringstream err;
    auto doc = ScrubDocument::emptyDocument();
    doc->setLogger(quiet_logger(out, err));
    // 4096 bytes of "A" compressed to 28
    auto ref = doc->makeIndirectObject(O::newStream(
        {{"/Filter", O::newName("/FlateDecode")}},
        ScrubUtil::hex_decode("78daedc1010d000000c2a06cef5fca1e0e28000000e0dd00ffad103d")));
    auto eof = doc->makeIndirectObject(O::newStream({}, "%%EOF"));

    S scanner;
    S::ScanningConfig config;
    scanner.scan(*doc, config);
    assert(scanner.getStats().scan_failures == 0);
    assert(err.str().empty());

    config.max_decoded_size = 1024;
    auto const& matches = scanner.scan(*doc, config);
    assert(scanner.getStats().scan_failures == 1);
    assert(!matches.count(ref.getRef()));
    // Other objects are still scanned.
    assert(matches.count(eof.getRef()));
    assert(
        err.str().find("WARNING: scan: object " + ref.getRef().describe() + ": ") !=
        std::string::npos);
    assert(err.str().find("exceeds 1024 bytes") != std::string::npos);
}

static void
test_detector_confidence()
{
    std::ostringstream out;
    std::ostringstream err;
    auto doc = ScrubDocument::emptyDocument();
    doc->setLogger(quiet_logger(out, err));
    auto ref = doc->makeIndirectObject(O::newDictionary({{"/Custom", O::newBool(true)}}));

    for (double confidence: {1.5, -0.25, std::numeric_limits<double>::quiet_NaN()}) {
        S scanner;
        scanner.registerDetector(
            "guess", [confidence](ScrubObjGen, ScrubObject const& obj) {
                std::optional<S::PatternMatch> result;
                if (obj.hasDictionary() && obj.hasKey("/Custom")) {
                    S::PatternMatch match;
                    match.confidence = confidence;
                    result = match;
                }
                return result;
            });
        auto const& matches = scanner.scan(*doc);
        assert(!matches.count(ref.getRef()));
        assert(scanner.getStats().scan_failures == 1);
        assert(S::filterByConfidence(matches, 0.0).empty());
    }
    assert(err.str().find("detector guess") != std::string::npos);

    // The bounds themselves are accepted.
    for (double confidence: {0.0, 1.0}) {
        S scanner;
        scanner.registerDetector("edge", [confidence](ScrubObjGen, ScrubObject const&) {
            std::optional<S::PatternMatch> result;
            S::PatternMatch match;
            match.confidence = confidence;
            result = match;
            return result;
        });
        auto const& matches = scanner.scan(*doc);
        assert(scanner.getStats().scan_failures == 0);
        assert(matches.at(ref.getRef()).confidence == confidence);
    }
}

static void
test_custom()
{
    std::ostringstream out;
    std::ostringstream err;
    auto doc = make_document(quiet_logger(out, err));
    doc->replaceObject(og(20), O::newStream({}, "author: jdoe@example.com"));
    doc->replaceObject(og(21), O::newDictionary({{"/Custom", O::newBool(true)}}));
    doc->replaceObject(
        og(22), O::newStream({{"/Filter", O::newName("/FlateDecode")}}, "not compressed"));

    S scanner;
    scanner.registerDetector("custom_key", [](ScrubObjGen id, ScrubObject const& obj) {
        std::optional<S::PatternMatch> result;
        if (obj.hasDictionary() && obj.hasKey("/Custom")) {
            S::PatternMatch match;
            match.kind = scrub_mk_user_trace;
            match.confidence = 0.5;
            match.location.context = "custom key";
            result = match;
        }
        return result;
    });
    S::ScanningConfig config;
    config.custom_patterns.push_back(
        ScrubPattern::bytes("email", scrub_mk_user_trace, "jdoe@", "", "user name"));
    auto const& matches = scanner.scan(*doc, config);

    auto const& email = matches.at(og(20));
    assert(email.pattern_id == "email");
    assert(email.kind == scrub_mk_user_trace);
    assert(email.location.context_after == "example.com");

    auto const& custom = matches.at(og(21));
    assert(custom.pattern_id == "custom_key");
    assert(custom.detector == scrub_det_custom);
    assert(custom.location.object_id == og(21));

    assert(!matches.count(og(22)));
    assert(scanner.getStats().scan_failures == 1);
    assert(err.str().find("WARNING: scan: object 22 0 R: ") != std::string::npos);

    auto confident = S::filterByConfidence(matches, 0.75);
    assert(confident.size() == matches.size() - 1);
    assert(!confident.count(og(21)));

    scanner.unregisterDetector("custom_key");
    assert(!scanner.scan(*doc, config).count(og(21)));
}

int
main()
{
    test_single_eof();
    test_full_scan();
    test_config();
    test_custom();
    test_stream_data_first();
    test_decoded_size_limit();
    test_detector_confidence();
    std::cout << "assertions passed\n";
    return 0;
}

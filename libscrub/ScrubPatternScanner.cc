#include <scrub/ScrubPatternScanner.hh>

#include <scrub/Pl_Flate.hh>
#include <scrub/Pl_String.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubUtil.hh>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <future>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

namespace
{
    typedef ScrubPatternScanner::PatternMatch PatternMatch;
    typedef ScrubPatternScanner::ScanningConfig ScanningConfig;

    struct ScanContext
    {
        ScrubDocument const& doc;
        ScanningConfig const& config;
        std::vector<ScrubPattern> const& patterns;
        std::vector<std::pair<std::string, ScrubPatternScanner::detector_fn>> const& detectors;
    };

    struct ObjectResult
    {
        std::optional<PatternMatch> match;
        bool failed{false};
        std::string failure;
        std::vector<std::string> warnings;
    };

    std::string
    sniff_content_type(std::string const& data)
    {
        static std::vector<std::pair<std::string, char const*>> const signatures = {
            {"%PDF-", "application/pdf"},
            {"\x89PNG", "image/png"},
            {std::string("\xff\xd8\xff", 3), "image/jpeg"},
            {"GIF8", "image/gif"},
            {"PK\x03\x04", "application/zip"},
            {"<?xpacket", "application/rdf+xml"},
            {"<x:xmpmeta", "application/rdf+xml"},
            {"<?xml", "application/xml"},
        };
        for (auto const& sig: signatures) {
            if (data.compare(0, sig.first.size(), sig.first) == 0) {
                return sig.second;
            }
        }
        return ScrubUtil::is_utf8(data) ? "text/plain" : "application/octet-stream";
    }

    std::string
    format_entropy(double entropy)
    {
        char buf[32];
        snprintf(buf, sizeof(buf), "%.4f", entropy);
        return buf;
    }

    ScrubPatternScanner::AnalysisDetails
    analyze_data(ScrubObject const& obj, std::string const& data)
    {
        ScrubPatternScanner::AnalysisDetails analysis;
        if (obj.hasDictionary() && obj.getKey("/Subtype").isName()) {
            analysis.content_type = obj.getKey("/Subtype").getName().substr(1);
        } else if (obj.isStream()) {
            analysis.content_type = sniff_content_type(data);
        } else {
            analysis.content_type = obj.getTypeName();
        }
        analysis.encoding = ScrubUtil::is_utf8(data) ? "utf-8" : "binary";
        if (obj.isStream() && obj.hasKey("/Filter")) {
            analysis.compression = obj.getKey("/Filter").unparse();
        } else {
            analysis.compression = "none";
        }
        analysis.properties["length"] = std::to_string(data.size());
        analysis.properties["entropy"] = format_entropy(ScrubUtil::shannon_entropy(data));
        return analysis;
    }

    PatternMatch
    make_match(
        ScanContext const& ctx,
        ScrubObjGen og,
        ScrubObject const& obj,
        std::string const& pattern_id,
        scrub_match_kind_e kind,
        scrub_detector_e detector,
        std::string const& data,
        std::pair<size_t, size_t> range,
        std::string const& context)
    {
        PatternMatch match;
        match.pattern_id = pattern_id;
        match.kind = kind;
        match.detector = detector;
        match.location.object_id = og;
        match.location.start = range.first;
        match.location.end = range.second;
        match.location.context = context;
        size_t before = std::min(range.first, ctx.config.context_size);
        match.location.context_before = data.substr(range.first - before, before);
        if (range.second < data.size()) {
            match.location.context_after = data.substr(range.second, ctx.config.context_size);
        }
        match.analysis = analyze_data(obj, data);
        return match;
    }

    PatternMatch
    make_structural_match(
        ScanContext const& ctx,
        ScrubObjGen og,
        ScrubObject const& dict,
        char const* pattern_id,
        scrub_match_kind_e kind,
        std::string const& key,
        std::string const& value)
    {
        auto match = make_match(
            ctx,
            og,
            dict,
            pattern_id,
            kind,
            scrub_det_structure,
            value,
            {0, value.size()},
            "dictionary key " + key + " in object " + og.describe());
        match.metadata["key"] = key;
        if (!value.empty()) {
            match.metadata["value"] = value;
        }
        return match;
    }

    std::optional<PatternMatch>
    check_structure(ScanContext const& ctx, ScrubObjGen og, ScrubObject const& obj, int depth)
    {
        if (depth > ctx.config.max_depth) {
            return std::nullopt;
        }
        auto const& cfg = ctx.config;
        if (obj.isArray()) {
            for (auto const& item: obj.getArrayItems()) {
                if (auto match = check_structure(ctx, og, item, depth + 1)) {
                    return match;
                }
            }
            return std::nullopt;
        }
        if (!obj.hasDictionary()) {
            return std::nullopt;
        }

        if (cfg.scan_embedded_files && obj.hasKey("/EF")) {
            return make_structural_match(
                ctx, og, obj, "embedded_file_spec", scrub_mk_embedded_file, "/EF", "");
        }
        if (cfg.scan_javascript) {
            auto const& js = obj.getKey("/JS");
            if (js.isString() || js.isReference()) {
                return make_structural_match(
                    ctx,
                    og,
                    obj,
                    "javascript_action",
                    scrub_mk_javascript,
                    "/JS",
                    js.isString() ? js.getStringValue() : "");
            }
        }
        if (cfg.scan_metadata) {
            for (auto key: {"/Producer", "/Creator"}) {
                auto const& value = obj.getKey(key);
                if (value.isString()) {
                    auto match = make_structural_match(
                        ctx,
                        og,
                        obj,
                        "producer_trace",
                        scrub_mk_application_trace,
                        key,
                        value.getStringValue());
                    match.origin = value.getStringValue();
                    return match;
                }
            }
        }
        if (cfg.scan_form_data && obj.hasKey("/FT")) {
            auto const& ft = obj.getKey("/FT");
            return make_structural_match(
                ctx,
                og,
                obj,
                "form_field",
                scrub_mk_form_data,
                "/FT",
                ft.isName() ? ft.getName() : "");
        }
        if (cfg.scan_annotations && obj.getKey("/Type").isNameAndEquals("/Annot")) {
            auto const& subtype = obj.getKey("/Subtype");
            return make_structural_match(
                ctx,
                og,
                obj,
                "annotation",
                scrub_mk_annotation,
                "/Type",
                subtype.isName() ? subtype.getName() : "");
        }

        for (auto const& iter: obj.getDictAsMap()) {
            if (auto match = check_structure(ctx, og, iter.second, depth + 1)) {
                return match;
            }
        }
        return std::nullopt;
    }

    std::optional<PatternMatch>
    check_patterns(
        ScanContext const& ctx,
        ScrubObjGen og,
        ScrubObject const& obj,
        std::string const& data,
        std::string const& context,
        bool text_only)
    {
        for (auto const& pattern: ctx.patterns) {
            if (text_only && pattern.getDetector() != scrub_det_text_pattern) {
                continue;
            }
            if (auto range = pattern.findIn(data)) {
                auto match = make_match(
                    ctx,
                    og,
                    obj,
                    pattern.getId(),
                    pattern.getKind(),
                    pattern.getDetector(),
                    data,
                    *range,
                    context);
                if (!pattern.getDescription().empty()) {
                    match.metadata["description"] = pattern.getDescription();
                }
                if (pattern.getKind() == scrub_mk_application_trace ||
                    pattern.getDetector() == scrub_det_text_pattern) {
                    match.origin = data.substr(range->first, range->second - range->first);
                }
                return match;
            }
        }
        return std::nullopt;
    }

    std::optional<PatternMatch>
    check_strings(
        ScanContext const& ctx,
        ScrubObjGen og,
        ScrubObject const& obj,
        ScrubObject const& value,
        std::string const& key,
        int depth)
    {
        if (depth > ctx.config.max_depth) {
            return std::nullopt;
        }
        if (value.isString()) {
            return check_patterns(
                ctx,
                og,
                obj,
                value.getStringValue(),
                "string " + key + " in object " + og.describe(),
                true);
        }
        if (value.isArray()) {
            for (auto const& item: value.getArrayItems()) {
                if (auto match = check_strings(ctx, og, obj, item, key, depth + 1)) {
                    return match;
                }
            }
        } else if (value.hasDictionary()) {
            for (auto const& iter: value.getDictAsMap()) {
                if (auto match = check_strings(ctx, og, obj, iter.second, iter.first, depth + 1)) {
                    return match;
                }
            }
        }
        return std::nullopt;
    }

    bool
    is_flate(ScrubObject const& stream)
    {
        auto const& filter = stream.getKey("/Filter");
        if (filter.isNameAndEquals("/FlateDecode")) {
            return true;
        }
        return filter.isArray() && filter.getArrayNItems() == 1 &&
            filter.getArrayItem(0).isNameAndEquals("/FlateDecode");
    }

    std::string
    inflate(
        ScanContext const& ctx,
        std::string const& data,
        ScrubObjGen og,
        std::vector<std::string>& warnings)
    {
        std::string result;
        Pl_String out("scan output", nullptr, result);
        Pl_Flate flate("scan inflate", &out);
        flate.setMemoryLimit(ctx.config.max_decoded_size);
        flate.setWarnCallback([&warnings, og](char const* msg, int) {
            warnings.push_back("object " + og.describe() + ": " + msg);
        });
        flate.writeString(data);
        flate.finish();
        return result;
    }

    std::optional<PatternMatch>
    scan_object(ScanContext const& ctx, ScrubObjGen og, ScrubObject const& obj, ObjectResult& r)
    {
        if (obj.isStream()) {
            auto const& data = obj.getStreamData();
            auto where = "stream in object " + og.describe();
            if (auto match = check_patterns(ctx, og, obj, data, where, false)) {
                return match;
            }
        }
        if (auto match = check_structure(ctx, og, obj, 0)) {
            return match;
        }
        if (obj.hasDictionary() || obj.isArray() || obj.isString()) {
            if (auto match = check_strings(ctx, og, obj, obj, "", 0)) {
                return match;
            }
        }
        if (obj.isStream() && is_flate(obj)) {
            auto decoded = inflate(ctx, obj.getStreamData(), og, r.warnings);
            if (auto match = check_patterns(
                    ctx, og, obj, decoded, "decoded stream in object " + og.describe(), false)) {
                return match;
            }
        }
        for (auto const& detector: ctx.detectors) {
            if (auto match = detector.second(og, obj)) {
                if (!(match->confidence >= 0.0 && match->confidence <= 1.0)) {
                    throw std::runtime_error(
                        "detector " + detector.first + " reported confidence " +
                        std::to_string(match->confidence) + ", which is not between 0 and 1");
                }
                match->detector = scrub_det_custom;
                if (match->pattern_id.empty()) {
                    match->pattern_id = detector.first;
                }
                if (!match->location.object_id.isIndirect()) {
                    match->location.object_id = og;
                }
                return match;
            }
        }
        return std::nullopt;
    }

    typedef std::vector<std::pair<ScrubObjGen, ObjectResult>> partial_t;

    partial_t
    scan_range(
        ScanContext const& ctx,
        std::vector<ScrubObjGen>::const_iterator begin,
        std::vector<ScrubObjGen>::const_iterator end)
    {
        partial_t results;
        for (auto iter = begin; iter != end; ++iter) {
            ObjectResult r;
            auto obj = ctx.doc.getObject(*iter);
            if (obj == nullptr) {
                continue;
            }
            try {
                r.match = scan_object(ctx, *iter, *obj, r);
            } catch (std::exception& e) {
                r.failed = true;
                r.failure = e.what();
            }
            results.emplace_back(*iter, std::move(r));
        }
        return results;
    }
} // namespace

class ScrubPatternScanner::Members
{
    friend class ScrubPatternScanner;

  public:
    Members() = default;

  private:
    Members(Members const&) = delete;

    std::map<std::string, detector_fn> detectors;
    registry_t matches;
    ScanningStats stats;
};

bool
ScrubPatternScanner::PatternMatch::operator==(PatternMatch const& rhs) const
{
    return pattern_id == rhs.pattern_id && kind == rhs.kind && detector == rhs.detector &&
        location.object_id == rhs.location.object_id && location.start == rhs.location.start &&
        location.end == rhs.location.end && location.context == rhs.location.context &&
        location.context_before == rhs.location.context_before &&
        location.context_after == rhs.location.context_after && confidence == rhs.confidence &&
        metadata == rhs.metadata && origin == rhs.origin &&
        analysis.content_type == rhs.analysis.content_type &&
        analysis.encoding == rhs.analysis.encoding &&
        analysis.compression == rhs.analysis.compression &&
        analysis.properties == rhs.analysis.properties;
}

bool
ScrubPatternScanner::PatternMatch::operator!=(PatternMatch const& rhs) const
{
    return !(*this == rhs);
}

ScrubPatternScanner::ScrubPatternScanner() :
    m(new Members())
{
}

ScrubPatternScanner::~ScrubPatternScanner() = default;

void
ScrubPatternScanner::registerDetector(std::string const& name, detector_fn fn)
{
    if (!fn) {
        throw std::logic_error("ScrubPatternScanner::registerDetector called with empty detector");
    }
    m->detectors[name] = fn;
}

void
ScrubPatternScanner::unregisterDetector(std::string const& name)
{
    m->detectors.erase(name);
}

ScrubPatternScanner::registry_t const&
ScrubPatternScanner::getMatches() const
{
    return m->matches;
}

ScrubPatternScanner::ScanningStats const&
ScrubPatternScanner::getStats() const
{
    return m->stats;
}

char const*
ScrubPatternScanner::kindName(scrub_match_kind_e kind)
{
    switch (kind) {
    case scrub_mk_embedded_file:
        return "EmbeddedFile";
    case scrub_mk_metadata:
        return "Metadata";
    case scrub_mk_javascript:
        return "JavaScript";
    case scrub_mk_form_data:
        return "FormData";
    case scrub_mk_annotation:
        return "Annotation";
    case scrub_mk_application_trace:
        return "ApplicationTrace";
    case scrub_mk_system_trace:
        return "SystemTrace";
    case scrub_mk_user_trace:
        return "UserTrace";
    case scrub_mk_custom:
        return "Custom";
    }
    return "Unknown";
}

void
ScrubPatternScanner::checkConfig(ScanningConfig const& config)
{
    if (!(config.confidence_threshold >= 0.0 && config.confidence_threshold <= 1.0)) {
        throw ScrubExc(
            scrub_e_configuration,
            "configuration",
            "",
            "confidence threshold must be between 0 and 1");
    }
    if (config.max_depth < 0) {
        throw ScrubExc(
            scrub_e_configuration, "configuration", "", "maximum depth may not be negative");
    }
    if (config.max_decoded_size == 0) {
        throw ScrubExc(
            scrub_e_configuration, "configuration", "", "maximum decoded size must be positive");
    }
}

std::vector<ScrubPattern>
ScrubPatternScanner::builtinPatterns(ScanningConfig const& config)
{
    std::vector<ScrubPattern> result;
    if (config.scan_embedded_files) {
        result.push_back(ScrubPattern::bytes(
            "embedded_file", scrub_mk_embedded_file, "%%EOF", "", "end-of-file marker"));
    }
    if (config.scan_metadata) {
        result.push_back(
            ScrubPattern::bytes("xmp_packet", scrub_mk_metadata, "<?xp", "", "XMP packet"));
        result.push_back(
            ScrubPattern::bytes("xmp_meta", scrub_mk_metadata, "<x:x", "", "XMP metadata"));
        result.push_back(ScrubPattern::text(
            "adobe_metadata", scrub_mk_metadata, "Adobe.*PDF", true, "Adobe PDF metadata"));
    }
    return result;
}

ScrubPatternScanner::registry_t
ScrubPatternScanner::filterByConfidence(registry_t const& matches, double threshold)
{
    registry_t result;
    for (auto const& iter: matches) {
        if (iter.second.confidence >= threshold) {
            result.insert(iter);
        }
    }
    return result;
}

ScrubPatternScanner::registry_t const&
ScrubPatternScanner::scan(ScrubDocument const& doc, ScanningConfig const& config)
{
    auto start = std::chrono::steady_clock::now();
    m->matches.clear();
    m->stats = ScanningStats();
    checkConfig(config);

    auto patterns = builtinPatterns(config);
    for (auto const& p: config.custom_patterns) {
        patterns.push_back(p);
    }
    for (auto& p: patterns) {
        p.compile();
    }
    std::vector<std::pair<std::string, detector_fn>> detectors(
        m->detectors.begin(), m->detectors.end());
    ScanContext ctx{doc, config, patterns, detectors};

    auto ids = doc.getObjectIDs();
    std::vector<partial_t> partials;
    size_t n_workers = 1;
    if (config.parallel_scanning) {
        n_workers = std::max(1U, std::thread::hardware_concurrency());
        n_workers = std::min(n_workers, ids.size());
    }
    if (n_workers <= 1) {
        partials.push_back(scan_range(ctx, ids.cbegin(), ids.cend()));
    } else {
        std::vector<std::future<partial_t>> futures;
        size_t chunk = (ids.size() + n_workers - 1) / n_workers;
        for (size_t first = 0; first < ids.size(); first += chunk) {
            size_t last = std::min(first + chunk, ids.size());
            auto begin = ids.cbegin() + static_cast<std::ptrdiff_t>(first);
            auto end = ids.cbegin() + static_cast<std::ptrdiff_t>(last);
            futures.push_back(std::async(std::launch::async, [&ctx, begin, end]() {
                return scan_range(ctx, begin, end);
            }));
        }
        for (auto& f: futures) {
            partials.push_back(f.get());
        }
    }

    // All logging happens here, after every worker has finished.
    auto log = doc.getLogger();
    std::set<std::string> matched_patterns;
    for (auto& partial: partials) {
        for (auto& entry: partial) {
            ++m->stats.objects_scanned;
            auto& r = entry.second;
            for (auto const& w: r.warnings) {
                doc.warn("scan: " + w);
            }
            if (r.failed) {
                ++m->stats.scan_failures;
                doc.warn("scan: object " + entry.first.describe() + ": " + r.failure);
                continue;
            }
            if (r.match) {
                log->debug(
                    "scan: " + std::string(kindName(r.match->kind)) + " (" +
                    r.match->pattern_id + ") in " + r.match->location.context);
                matched_patterns.insert(r.match->pattern_id);
                m->matches.emplace(entry.first, std::move(*r.match));
            }
        }
    }
    m->stats.instances_found = m->matches.size();
    m->stats.patterns_matched = matched_patterns.size();
    m->stats.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start)
                               .count();
    log->debug(
        "scan: " + std::to_string(m->stats.objects_scanned) + " objects, " +
        std::to_string(m->stats.instances_found) + " matches, " +
        std::to_string(m->stats.scan_failures) + " failures");
    return m->matches;
}

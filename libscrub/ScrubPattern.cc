#include <scrub/ScrubPattern.hh>

#include <scrub/ScrubExc.hh>
#include <scrub/ScrubUtil.hh>

#include <stdexcept>

ScrubPattern::ScrubPattern(
    std::string const& id,
    scrub_match_kind_e kind,
    scrub_detector_e detector,
    std::string const& pattern,
    std::string const& mask,
    bool case_insensitive,
    std::string const& description) :
    id(id),
    kind(kind),
    detector(detector),
    pattern(pattern),
    mask(mask),
    case_insensitive(case_insensitive),
    description(description)
{
}

ScrubPattern
ScrubPattern::bytes(
    std::string const& id,
    scrub_match_kind_e kind,
    std::string const& pattern,
    std::string const& mask,
    std::string const& description)
{
    return {id, kind, scrub_det_byte_pattern, pattern, mask, false, description};
}

ScrubPattern
ScrubPattern::text(
    std::string const& id,
    scrub_match_kind_e kind,
    std::string const& regex,
    bool case_insensitive,
    std::string const& description)
{
    return {id, kind, scrub_det_text_pattern, regex, "", case_insensitive, description};
}

void
ScrubPattern::compile()
{
    if (compiled) {
        return;
    }
    if (pattern.empty()) {
        throw ScrubExc(scrub_e_validation, "scan", id, "pattern is empty");
    }
    if (detector == scrub_det_byte_pattern) {
        if (!mask.empty()) {
            if (mask.size() != pattern.size()) {
                throw ScrubExc(
                    scrub_e_validation,
                    "scan",
                    id,
                    "mask length " + std::to_string(mask.size()) +
                        " does not match pattern length " + std::to_string(pattern.size()));
            }
            // Bits of the pattern outside of its mask can never match.
            for (size_t i = 0; i < pattern.size(); ++i) {
                pattern.at(i) = static_cast<char>(pattern.at(i) & mask.at(i));
            }
        }
    } else {
        auto flags = std::regex::ECMAScript;
        if (case_insensitive) {
            flags |= std::regex::icase;
        }
        try {
            regex = std::make_shared<std::regex const>(pattern, flags);
        } catch (std::regex_error& e) {
            throw ScrubExc(
                scrub_e_validation,
                "scan",
                id,
                "invalid regular expression " + pattern + ": " + e.what());
        }
    }
    compiled = true;
}

bool
ScrubPattern::isCompiled() const
{
    return compiled;
}

std::string const&
ScrubPattern::getId() const
{
    return id;
}

scrub_match_kind_e
ScrubPattern::getKind() const
{
    return kind;
}

scrub_detector_e
ScrubPattern::getDetector() const
{
    return detector;
}

std::string const&
ScrubPattern::getPattern() const
{
    return pattern;
}

std::string const&
ScrubPattern::getMask() const
{
    return mask;
}

std::string const&
ScrubPattern::getDescription() const
{
    return description;
}

bool
ScrubPattern::isCaseInsensitive() const
{
    return case_insensitive;
}

std::optional<std::pair<size_t, size_t>>
ScrubPattern::findIn(std::string const& data) const
{
    if (!compiled) {
        throw std::logic_error("ScrubPattern::findIn called on uncompiled pattern " + id);
    }
    if (detector == scrub_det_byte_pattern) {
        return findBytes(data);
    }
    return findText(data);
}

std::optional<std::pair<size_t, size_t>>
ScrubPattern::findBytes(std::string const& data) const
{
    size_t len = pattern.size();
    if (data.size() < len) {
        return std::nullopt;
    }
    if (mask.empty()) {
        auto pos = data.find(pattern);
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        return std::make_pair(pos, pos + len);
    }
    auto d = ScrubUtil::unsigned_char_pointer(data);
    auto p = ScrubUtil::unsigned_char_pointer(pattern);
    auto k = ScrubUtil::unsigned_char_pointer(mask);
    for (size_t start = 0; start + len <= data.size(); ++start) {
        size_t i = 0;
        while (i < len && (d[start + i] & k[i]) == p[i]) {
            ++i;
        }
        if (i == len) {
            return std::make_pair(start, start + len);
        }
    }
    return std::nullopt;
}

std::optional<std::pair<size_t, size_t>>
ScrubPattern::findText(std::string const& data) const
{
    if (!ScrubUtil::is_utf8(data)) {
        return std::nullopt;
    }
    // Match each line separately. This keeps the recursion depth of the regex engine bounded by
    // the line length rather than by the size of the data.
    size_t line_start = 0;
    while (line_start <= data.size()) {
        auto line_end = data.find_first_of("\r\n", line_start);
        if (line_end == std::string::npos) {
            line_end = data.size();
        }
        std::smatch m;
        auto begin = data.begin() + static_cast<std::string::difference_type>(line_start);
        auto end = data.begin() + static_cast<std::string::difference_type>(line_end);
        if (std::regex_search(begin, end, m, *regex) && m.length(0) > 0) {
            size_t start = line_start + static_cast<size_t>(m.position(0));
            return std::make_pair(start, start + static_cast<size_t>(m.length(0)));
        }
        line_start = line_end + 1;
    }
    return std::nullopt;
}

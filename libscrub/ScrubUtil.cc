#include <scrub/ScrubUtil.hh>

#include <scrub/ScrubCryptoProvider.hh>

#include <array>
#include <cmath>
#include <cstdlib>

namespace
{
    inline char
    hex_decode_char(char digit)
    {
        return digit <= '9' && digit >= '0'
            ? char(digit - '0')
            : (digit >= 'a' ? char(digit - 'a' + 10)
                            : (digit >= 'A' ? char(digit - 'A' + 10) : '\20'));
    }
} // namespace

std::string
ScrubUtil::hex_encode(std::string const& input)
{
    static auto constexpr hexchars = "0123456789abcdef";
    std::string result;
    result.reserve(2 * input.length());
    for (const char c: input) {
        result += hexchars[static_cast<unsigned char>(c) >> 4];
        result += hexchars[c & 0x0f];
    }
    return result;
}

std::string
ScrubUtil::hex_decode(std::string const& input)
{
    std::string result;
    bool first = true;
    char decoded = 0;
    for (auto ch: input) {
        ch = hex_decode_char(ch);
        if (ch < '\20') {
            if (first) {
                decoded = static_cast<char>(ch << 4);
                first = false;
            } else {
                result.push_back(decoded | ch);
                first = true;
            }
        }
    }
    if (!first) {
        result.push_back(decoded);
    }
    return result;
}

bool
ScrubUtil::get_env(std::string const& var, std::string* value)
{
    char* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }
    return true;
}

bool
ScrubUtil::is_utf8(std::string const& val)
{
    size_t pos = 0;
    size_t len = val.length();
    while (pos < len) {
        auto ch = static_cast<unsigned char>(val.at(pos++));
        if (ch < 0x80) {
            continue;
        }
        size_t bytes_needed = 0;
        unsigned long codepoint = 0;
        unsigned long min_codepoint = 0;
        if ((ch & 0xe0) == 0xc0) {
            bytes_needed = 1;
            codepoint = ch & 0x1f;
            min_codepoint = 0x80;
        } else if ((ch & 0xf0) == 0xe0) {
            bytes_needed = 2;
            codepoint = ch & 0x0f;
            min_codepoint = 0x800;
        } else if ((ch & 0xf8) == 0xf0) {
            bytes_needed = 3;
            codepoint = ch & 0x07;
            min_codepoint = 0x10000;
        } else {
            return false;
        }
        if (len - pos < bytes_needed) {
            return false;
        }
        for (size_t i = 0; i < bytes_needed; ++i) {
            auto cont = static_cast<unsigned char>(val.at(pos++));
            if ((cont & 0xc0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (cont & 0x3f);
        }
        if (codepoint < min_codepoint || codepoint > 0x10ffff ||
            (codepoint >= 0xd800 && codepoint <= 0xdfff)) {
            return false;
        }
    }
    return true;
}

void
ScrubUtil::initializeWithRandomBytes(unsigned char* data, size_t len)
{
    ScrubCryptoProvider::getImpl()->provideRandomData(data, len);
}

std::string
ScrubUtil::random_bytes(size_t len)
{
    std::string result(len, '\0');
    if (len) {
        initializeWithRandomBytes(unsigned_char_pointer(result), len);
    }
    return result;
}

double
ScrubUtil::shannon_entropy(std::string const& data)
{
    if (data.empty()) {
        return 0.0;
    }
    std::array<size_t, 256> counts{};
    for (auto ch: data) {
        ++counts[static_cast<unsigned char>(ch)];
    }
    double result = 0.0;
    auto total = static_cast<double>(data.size());
    for (auto c: counts) {
        if (c) {
            double p = static_cast<double>(c) / total;
            result -= p * std::log2(p);
        }
    }
    return result;
}

unsigned char*
ScrubUtil::unsigned_char_pointer(std::string& s)
{
    return reinterpret_cast<unsigned char*>(s.data());
}

unsigned char const*
ScrubUtil::unsigned_char_pointer(std::string const& s)
{
    return reinterpret_cast<unsigned char const*>(s.c_str());
}

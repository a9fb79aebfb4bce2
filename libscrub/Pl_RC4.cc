#include <scrub/Pl_RC4.hh>

#include <scrub/ScrubUtil.hh>
#include <stdexcept>

Pl_RC4::Pl_RC4(
    char const* identifier,
    Pipeline* next,
    std::string const& key,
    size_t drop,
    size_t out_bufsize) :
    Pipeline(identifier, next),
    outbuf(out_bufsize),
    out_bufsize(out_bufsize),
    rc4(ScrubUtil::unsigned_char_pointer(key), static_cast<int>(key.size()), drop)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_RC4 with nullptr as next");
    }
    if (!out_bufsize) {
        throw std::logic_error("Pl_RC4: out_bufsize must be greater than 0");
    }
}

void
Pl_RC4::write(unsigned char const* data, size_t len)
{
    if (outbuf.empty()) {
        throw std::logic_error(identifier + ": Pl_RC4: write() called after finish() called");
    }

    size_t bytes_left = len;
    unsigned char const* p = data;

    while (bytes_left > 0) {
        size_t bytes = (bytes_left < out_bufsize ? bytes_left : out_bufsize);
        bytes_left -= bytes;
        rc4.process(p, bytes, outbuf.data());
        p += bytes;
        getNext()->write(outbuf.data(), bytes);
    }
}

void
Pl_RC4::finish()
{
    outbuf.clear();
    getNext()->finish();
}

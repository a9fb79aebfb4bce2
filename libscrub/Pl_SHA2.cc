#include <scrub/Pl_SHA2.hh>

#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>
#include <stdexcept>

Pl_SHA2::Pl_SHA2(int bits, Pipeline* next) :
    Pipeline("sha2", next),
    in_progress(false),
    need_init(false),
    bits(0)
{
    if (bits) {
        resetBits(bits);
    }
}

void
Pl_SHA2::write(unsigned char const* buf, size_t len)
{
    if (!crypto) {
        throw std::logic_error("SHA2 pipeline written before bits were set");
    }
    if (!in_progress) {
        if (need_init) {
            // Reusing the pipeline after finish starts a new digest.
            crypto->SHA2_init(bits);
            need_init = false;
        }
        in_progress = true;
    }

    // Write in chunks in case len is too big to fit in an int. Assume int is at least 32 bits.
    static size_t const max_bytes = 1 << 30;
    size_t bytes_left = len;
    unsigned char const* data = buf;
    while (bytes_left > 0) {
        size_t bytes = (bytes_left >= max_bytes ? max_bytes : bytes_left);
        crypto->SHA2_update(data, bytes);
        bytes_left -= bytes;
        data += bytes;
    }

    if (getNext(true)) {
        getNext()->write(buf, len);
    }
}

void
Pl_SHA2::finish()
{
    if (getNext(true)) {
        getNext()->finish();
    }
    if (!crypto) {
        throw std::logic_error("SHA2 pipeline finished before bits were set");
    }
    if (need_init) {
        crypto->SHA2_init(bits);
    }
    crypto->SHA2_finalize();
    in_progress = false;
    need_init = true;
}

void
Pl_SHA2::resetBits(int bits)
{
    if (in_progress) {
        throw std::logic_error("bit reset requested for in-progress SHA2 Pipeline");
    }
    this->bits = bits;
    crypto = ScrubCryptoProvider::getImpl();
    crypto->SHA2_init(bits);
    need_init = false;
}

std::string
Pl_SHA2::getRawDigest()
{
    if (in_progress) {
        throw std::logic_error("digest requested for in-progress SHA2 Pipeline");
    }
    return crypto->SHA2_digest();
}

std::string
Pl_SHA2::getHexDigest()
{
    if (in_progress) {
        throw std::logic_error("digest requested for in-progress SHA2 Pipeline");
    }
    return ScrubUtil::hex_encode(getRawDigest());
}

#include <scrub/Pl_Flate.hh>

#include <climits>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

Pl_Flate::Members::Members(size_t out_bufsize) :
    outbuf(new unsigned char[out_bufsize]),
    out_bufsize(out_bufsize),
    initialized(false),
    zdata(nullptr)
{
    // Indirect through zdata to reach the z_stream so we don't have to include zlib.h in
    // Pl_Flate.hh.
    zdata = new z_stream;

    if (out_bufsize > UINT_MAX) {
        throw std::runtime_error(
            "Pl_Flate: zlib doesn't support buffer sizes larger than unsigned int");
    }

    z_stream& zstream = *(static_cast<z_stream*>(zdata));
    zstream.zalloc = nullptr;
    zstream.zfree = nullptr;
    zstream.opaque = nullptr;
    zstream.next_in = nullptr;
    zstream.avail_in = 0;
    zstream.next_out = outbuf.get();
    zstream.avail_out = static_cast<unsigned int>(out_bufsize);
}

Pl_Flate::Members::~Members()
{
    if (initialized) {
        inflateEnd(static_cast<z_stream*>(zdata));
    }
    delete static_cast<z_stream*>(zdata);
    zdata = nullptr;
}

Pl_Flate::Pl_Flate(char const* identifier, Pipeline* next, unsigned int out_bufsize_int) :
    Pipeline(identifier, next),
    m(new Members(static_cast<size_t>(out_bufsize_int)))
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Flate with nullptr as next");
    }
}

Pl_Flate::~Pl_Flate() = default;

void
Pl_Flate::setMemoryLimit(unsigned long long limit)
{
    m->memory_limit = limit;
}

unsigned long long
Pl_Flate::getMemoryLimit() const
{
    return m->memory_limit;
}

void
Pl_Flate::setWarnCallback(std::function<void(char const*, int)> callback)
{
    m->callback = callback;
}

void
Pl_Flate::warn(char const* msg, int code)
{
    if (m->callback != nullptr) {
        m->callback(msg, code);
    }
}

void
Pl_Flate::write(unsigned char const* data, size_t len)
{
    if (m->outbuf == nullptr) {
        throw std::logic_error(identifier + ": Pl_Flate: write() called after finish() called");
    }

    // Write in chunks in case len is too big to fit in an int. Assume int is at least 32 bits.
    static size_t const max_bytes = 1 << 30;
    size_t bytes_left = len;
    unsigned char const* buf = data;
    while (bytes_left > 0) {
        size_t bytes = (bytes_left >= max_bytes ? max_bytes : bytes_left);
        handleData(buf, bytes, Z_SYNC_FLUSH);
        bytes_left -= bytes;
        buf += bytes;
    }
}

void
Pl_Flate::handleData(unsigned char const* data, size_t len, int flush)
{
    if (len > UINT_MAX) {
        throw std::runtime_error("Pl_Flate: zlib doesn't support data blocks larger than int");
    }
    z_stream& zstream = *(static_cast<z_stream*>(m->zdata));
    // zlib is known not to modify the data pointed to by next_in but doesn't declare the field
    // value const unless compiled to do so.
    zstream.next_in = const_cast<unsigned char*>(data);
    zstream.avail_in = static_cast<unsigned int>(len);

    if (!m->initialized) {
        // inflateInit is a macro that uses old-style casts.
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
        int err = inflateInit(&zstream);
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif
        checkError("Init", err);
        m->initialized = true;
    }

    bool done = false;
    while (!done) {
        int err = inflate(&zstream, flush);
        if ((err != Z_OK) && zstream.msg && (strcmp(zstream.msg, "incorrect data check") == 0)) {
            // Other readers ignore this specific error. Combined with Z_SYNC_FLUSH this recovers
            // the data of some broken zlib streams.
            err = Z_STREAM_END;
        }
        switch (err) {
        case Z_BUF_ERROR:
            // Possible as a boundary condition: if the last call to inflate exactly filled the
            // output buffer, the next call could have nothing to do.
            warn("input stream is complete but output may still be valid", err);
            done = true;
            break;

        case Z_STREAM_END:
            done = true;
            // fall through

        case Z_OK:
            {
                if ((zstream.avail_in == 0) && (zstream.avail_out > 0)) {
                    // There is nothing left to read, and there was sufficient buffer space to
                    // write everything we needed, so we're done for now.
                    done = true;
                }
                uLong ready = static_cast<uLong>(m->out_bufsize - zstream.avail_out);
                if (ready > 0) {
                    if (m->memory_limit) {
                        m->written += ready;
                        if (m->written > m->memory_limit) {
                            throw std::runtime_error(
                                identifier + ": inflated data exceeds " +
                                std::to_string(m->memory_limit) + " bytes");
                        }
                    }
                    getNext()->write(m->outbuf.get(), ready);
                    zstream.next_out = m->outbuf.get();
                    zstream.avail_out = static_cast<unsigned int>(m->out_bufsize);
                }
            }
            break;

        default:
            checkError("data", err);
            break;
        }
    }
}

void
Pl_Flate::finish()
{
    if (m->outbuf.get()) {
        if (m->initialized) {
            z_stream& zstream = *(static_cast<z_stream*>(m->zdata));
            unsigned char buf[1];
            buf[0] = '\0';
            handleData(buf, 0, Z_FINISH);
            int err = inflateEnd(&zstream);
            m->initialized = false;
            checkError("End", err);
        }
        m->outbuf = nullptr;
    }
    getNext()->finish();
}

void
Pl_Flate::checkError(char const* prefix, int error_code)
{
    z_stream& zstream = *(static_cast<z_stream*>(m->zdata));
    if (error_code != Z_OK) {
        std::string msg = identifier + ": inflate: " + prefix + ": ";

        if (zstream.msg) {
            msg += zstream.msg;
        } else {
            switch (error_code) {
            case Z_ERRNO:
                msg += "zlib system error";
                break;

            case Z_STREAM_ERROR:
                msg += "zlib stream error";
                break;

            case Z_DATA_ERROR:
                msg += "zlib data error";
                break;

            case Z_MEM_ERROR:
                msg += "zlib memory error";
                break;

            case Z_BUF_ERROR:
                msg += "zlib buffer error";
                break;

            case Z_VERSION_ERROR:
                msg += "zlib version error";
                break;

            default:
                msg += std::string("zlib unknown error (") + std::to_string(error_code) + ")";
                break;
            }
        }

        throw std::runtime_error(msg);
    }
}

#include <scrub/Pl_AES_CBC.hh>

#include <scrub/Pl_String.hh>
#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>
#include <cstring>
#include <stdexcept>
#include <string>

bool Pl_AES_CBC::use_static_iv = false;

Pl_AES_CBC::Pl_AES_CBC(
    char const* identifier, Pipeline* next, bool encrypt, std::string const& key) :
    Pipeline(identifier, next),
    key(key),
    crypto(ScrubCryptoProvider::getImpl()),
    encrypt_mode(encrypt)
{
    if (!(key.size() == 16 || key.size() == 24 || key.size() == 32)) {
        throw std::runtime_error("unsupported AES key length");
    }
    block.fill(0);
    outbuf.fill(0);
    cbc_block.fill(0);
}

void
Pl_AES_CBC::setIV(std::string const& iv)
{
    if (iv.size() != buf_size) {
        throw std::logic_error(
            "Pl_AES_CBC: specified initialization vector size in bytes must be " +
            std::to_string(buf_size));
    }
    specified_iv = iv;
}

void
Pl_AES_CBC::useStaticIV()
{
    use_static_iv = true;
}

std::string
Pl_AES_CBC::encrypt(std::string const& key, std::string const& data)
{
    std::string result;
    Pl_String s("aes output", nullptr, result);
    Pl_AES_CBC aes("aes encrypt", &s, true, key);
    aes.writeString(data);
    aes.finish();
    return result;
}

std::string
Pl_AES_CBC::decrypt(std::string const& key, std::string const& data)
{
    std::string result;
    Pl_String s("aes output", nullptr, result);
    Pl_AES_CBC aes("aes decrypt", &s, false, key);
    aes.writeString(data);
    aes.finish();
    return result;
}

void
Pl_AES_CBC::write(unsigned char const* data, size_t len)
{
    inbuf.append(reinterpret_cast<char const*>(data), len);
}

void
Pl_AES_CBC::finish()
{
    out.clear();
    if (encrypt_mode) {
        encryptBuffer();
    } else {
        decryptBuffer();
    }
    inbuf.clear();
    getNext()->write(reinterpret_cast<unsigned char const*>(out.data()), out.size());
    getNext()->finish();
    out.clear();
}

void
Pl_AES_CBC::encryptBuffer()
{
    initializeVector();
    out.append(reinterpret_cast<char const*>(cbc_block.data()), buf_size);
    crypto->rijndael_init(
        true,
        reinterpret_cast<unsigned char const*>(key.data()),
        key.size(),
        true,
        cbc_block.data());

    size_t full_blocks = inbuf.size() / buf_size;
    char const* p = inbuf.data();
    for (size_t i = 0; i < full_blocks; ++i) {
        std::memcpy(block.data(), p, buf_size);
        flush(block.data(), false);
        p += buf_size;
    }

    // PKCS#7: always pad, with a full block if the input is a multiple of the block size
    size_t bytes_left = inbuf.size() - (full_blocks * buf_size);
    auto pad = static_cast<unsigned char>(buf_size - bytes_left);
    std::memcpy(block.data(), p, bytes_left);
    std::memset(block.data() + bytes_left, pad, pad);
    flush(block.data(), false);
    crypto->rijndael_finalize();
}

void
Pl_AES_CBC::decryptBuffer()
{
    if (inbuf.size() < 2 * buf_size || (inbuf.size() % buf_size) != 0) {
        throw std::runtime_error(
            identifier + ": AES cipher text is not a whole number of blocks after the IV");
    }
    // Take the first block of input as the initialization vector. Don't write it to output.
    std::memcpy(cbc_block.data(), inbuf.data(), buf_size);
    crypto->rijndael_init(
        false,
        reinterpret_cast<unsigned char const*>(key.data()),
        key.size(),
        true,
        cbc_block.data());

    size_t blocks = inbuf.size() / buf_size;
    char const* p = inbuf.data() + buf_size;
    for (size_t i = 1; i < blocks; ++i) {
        std::memcpy(block.data(), p, buf_size);
        flush(block.data(), i + 1 == blocks);
        p += buf_size;
    }
    crypto->rijndael_finalize();
}

void
Pl_AES_CBC::flush(unsigned char* in, bool strip_padding)
{
    crypto->rijndael_process(in, outbuf.data());
    unsigned int bytes = buf_size;
    if (strip_padding) {
        unsigned char last = outbuf[buf_size - 1];
        bool valid = (last >= 1 && last <= buf_size);
        for (unsigned int i = 1; valid && i <= last; ++i) {
            if (outbuf[buf_size - i] != last) {
                valid = false;
            }
        }
        if (!valid) {
            throw std::runtime_error(identifier + ": invalid padding in AES cipher text");
        }
        bytes -= last;
    }
    out.append(reinterpret_cast<char const*>(outbuf.data()), bytes);
}

void
Pl_AES_CBC::initializeVector()
{
    if (!specified_iv.empty()) {
        std::memcpy(cbc_block.data(), specified_iv.data(), buf_size);
    } else if (use_static_iv) {
        for (unsigned int i = 0; i < buf_size; ++i) {
            cbc_block[i] = static_cast<unsigned char>(14U * (1U + i));
        }
    } else {
        ScrubUtil::initializeWithRandomBytes(cbc_block.data(), buf_size);
    }
}

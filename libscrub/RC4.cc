#include <scrub/RC4.hh>

#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubUtil.hh>

#include <stdexcept>
#include <vector>

RC4::RC4(unsigned char const* key_data, int key_len, size_t drop) :
    crypto(ScrubCryptoProvider::getImpl())
{
    if (key_len < 1 || key_len > 256) {
        throw std::runtime_error("unsupported RC4 key length");
    }
    crypto->RC4_init(key_data, key_len);
    if (drop) {
        std::vector<unsigned char> discard(drop, 0);
        crypto->RC4_process(discard.data(), discard.size(), discard.data());
    }
}

void
RC4::process(unsigned char const* in_data, size_t len, unsigned char* out_data)
{
    crypto->RC4_process(in_data, len, out_data);
}

void
RC4::process(std::string const& key, std::string& data, size_t drop)
{
    RC4 rc4(ScrubUtil::unsigned_char_pointer(key), static_cast<int>(key.size()), drop);
    if (!data.empty()) {
        auto p = ScrubUtil::unsigned_char_pointer(data);
        rc4.process(p, data.size(), p);
    }
}

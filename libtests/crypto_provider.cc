#include <scrub/assert_test.h>

#include <scrub/Pl_SHA2.hh>
#include <scrub/ScrubCryptoImpl.hh>
#include <scrub/ScrubCryptoProvider.hh>
#include <iostream>
#include <stdexcept>

// This is a dummy crypto implementation that only implements a SHA-2 digest. It doesn't work, but
// it enables us to exercise the wiring of registering, querying, and setting a crypto provider.
class Potato: public ScrubCryptoImpl
{
  public:
    void
    provideRandomData(unsigned char* data, size_t len) override
    {
    }
    void
    SHA2_init(int bits) override
    {
    }
    void
    SHA2_update(unsigned char const* data, size_t len) override
    {
    }
    void
    SHA2_finalize() override
    {
    }
    std::string
    SHA2_digest() override
    {
        return "0123456789abcdef";
    }
    std::string
    PBKDF2_derive(
        std::string const& password, std::string const& salt, int iterations, size_t key_len)
        override
    {
        return std::string(key_len, 'p');
    }
    void
    RC4_init(unsigned char const* key_data, int key_len) override
    {
    }
    void
    RC4_process(unsigned char const* in_data, size_t len, unsigned char* out_data) override
    {
    }
    void
    RC4_finalize() override
    {
    }
    void
    rijndael_init(
        bool encrypt,
        unsigned char const* key_data,
        size_t key_len,
        bool cbc_mode,
        unsigned char* cbc_block) override
    {
    }
    void
    rijndael_process(unsigned char* in_data, unsigned char* out_data) override
    {
    }
    void
    rijndael_finalize() override
    {
    }
    std::string
    signature_sign(
        scrub_signature_e alg, std::string const& private_key_pem, std::string const& data) override
    {
        return "potato";
    }
    bool
    signature_verify(
        scrub_signature_e alg,
        std::string const& public_pem,
        std::string const& data,
        std::string const& signature) override
    {
        return signature == "potato";
    }
};

int
main()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    auto registered = ScrubCryptoProvider::getRegisteredImpls();
    assert(registered.count(initial));

    ScrubCryptoProvider::registerImpl<Potato>("potato");
    assert(ScrubCryptoProvider::getRegisteredImpls().count("potato"));
    ScrubCryptoProvider::setDefaultProvider("potato");
    assert(ScrubCryptoProvider::getDefaultProvider() == "potato");

    Pl_SHA2 sha2(256);
    sha2.writeString("quack"); // anything
    sha2.finish();
    // hex for 0123456789abcdef
    assert(sha2.getHexDigest() == "30313233343536373839616263646566");
    assert(ScrubCryptoProvider::getImpl()->PBKDF2_derive("k", "s", 1, 4) == "pppp");

    try {
        ScrubCryptoProvider::setDefaultProvider("rutabaga");
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ScrubCryptoProvider::getImpl("rutabaga");
        assert(false);
    } catch (std::logic_error&) {
    }

    ScrubCryptoProvider::setDefaultProvider(initial);
    assert(ScrubCryptoProvider::getDefaultProvider() == initial);
    std::cout << "assertions passed\n";
    return 0;
}

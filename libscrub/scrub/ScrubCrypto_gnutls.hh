#ifndef SCRUBCRYPTO_GNUTLS_HH
#define SCRUBCRYPTO_GNUTLS_HH

#include <scrub/ScrubCryptoImpl.hh>
#include <memory>

// gnutls headers must be last to prevent them from interfering with other headers. gnutls.h has
// to be included first.
#include <gnutls/gnutls.h>
// This comment prevents clang-format from putting crypto.h before gnutls.h
#include <gnutls/abstract.h>
#include <gnutls/crypto.h>

class ScrubCrypto_gnutls: public ScrubCryptoImpl
{
  public:
    ScrubCrypto_gnutls();

    ~ScrubCrypto_gnutls() override;

    void provideRandomData(unsigned char* data, size_t len) override;

    void SHA2_init(int bits) override;
    void SHA2_update(unsigned char const* data, size_t len) override;
    void SHA2_finalize() override;
    std::string SHA2_digest() override;

    std::string PBKDF2_derive(
        std::string const& password,
        std::string const& salt,
        int iterations,
        size_t key_len) override;

    void RC4_init(unsigned char const* key_data, int key_len) override;
    void RC4_process(
        unsigned char const* in_data, size_t len, unsigned char* out_data = 0) override;
    void RC4_finalize() override;

    void rijndael_init(
        bool encrypt,
        unsigned char const* key_data,
        size_t key_len,
        bool cbc_mode,
        unsigned char* cbc_block) override;
    void rijndael_process(unsigned char* in_data, unsigned char* out_data) override;
    void rijndael_finalize() override;

    std::string signature_sign(
        scrub_signature_e alg,
        std::string const& private_key_pem,
        std::string const& data) override;
    bool signature_verify(
        scrub_signature_e alg,
        std::string const& public_pem,
        std::string const& data,
        std::string const& signature) override;

  private:
    void badBits();

    gnutls_hash_hd_t hash_ctx;
    gnutls_cipher_hd_t cipher_ctx;
    int sha2_bits;
    bool encrypt;
    bool cbc_mode;
    char digest[64];
    unsigned char const* aes_key_data;
    size_t aes_key_len;
};

#endif // SCRUBCRYPTO_GNUTLS_HH

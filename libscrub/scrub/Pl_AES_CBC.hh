#ifndef PL_AES_CBC_HH
#define PL_AES_CBC_HH

#include <scrub/Pipeline.hh>
#include <scrub/ScrubCryptoImpl.hh>

#include <array>
#include <memory>
#include <string>

// This pipeline implements AES-128, AES-192, and AES-256 in CBC mode with PKCS#7 padding. When
// encrypting, a full block of padding is added if the input is a multiple of 16 bytes, and the
// initialization vector is written in front of the cipher text. When decrypting, the first block
// of input is taken as the initialization vector and the padding is removed.
//
// Input is buffered and processed when finish() is called.
class Pl_AES_CBC final: public Pipeline
{
  public:
    // key must be 16, 24, or 32 bytes
    Pl_AES_CBC(char const* identifier, Pipeline* next, bool encrypt, std::string const& key);
    ~Pl_AES_CBC() final = default;

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

    // Specify an initialization vector instead of generating a random one. It is still written
    // in front of the cipher text.
    void setIV(std::string const& iv);

    // For testing only: use a fixed initialization vector
    static void useStaticIV();

    // Convenience wrappers around a one-shot pipeline
    static std::string encrypt(std::string const& key, std::string const& data);
    static std::string decrypt(std::string const& key, std::string const& data);

  private:
    void encryptBuffer();
    void decryptBuffer();
    void initializeVector();
    void flush(unsigned char* in, bool strip_padding);

    static unsigned int const buf_size = ScrubCryptoImpl::rijndael_buf_size;
    static bool use_static_iv;

    std::string key;
    std::shared_ptr<ScrubCryptoImpl> crypto;
    bool encrypt_mode;
    std::string inbuf;
    std::string out;
    std::array<unsigned char, buf_size> block;
    std::array<unsigned char, buf_size> outbuf;
    std::array<unsigned char, buf_size> cbc_block;
    std::string specified_iv;
};

#endif // PL_AES_CBC_HH

#ifndef RC4_HH
#define RC4_HH

#include <scrub/ScrubCryptoImpl.hh>
#include <cstring>
#include <memory>
#include <string>

class RC4
{
  public:
    // The first drop bytes of keystream are generated and discarded before any data is
    // processed. RC4-drop128 uses drop = 128.
    RC4(unsigned char const* key_data, int key_len, size_t drop = 0);

    // It is safe to pass the same pointer to in_data and out_data to encrypt/decrypt in place
    void process(unsigned char const* in_data, size_t len, unsigned char* out_data);

    // Encrypt or decrypt data in place
    static void process(std::string const& key, std::string& data, size_t drop = 0);

  private:
    std::shared_ptr<ScrubCryptoImpl> crypto;
};

#endif // RC4_HH

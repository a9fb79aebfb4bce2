#include <scrub/ScrubCrypto_gnutls.hh>

#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace
{
    typedef std::unique_ptr<
        std::remove_pointer<gnutls_privkey_t>::type,
        decltype(&gnutls_privkey_deinit)>
        privkey_ptr;
    typedef std::unique_ptr<
        std::remove_pointer<gnutls_pubkey_t>::type,
        decltype(&gnutls_pubkey_deinit)>
        pubkey_ptr;

    gnutls_datum_t
    as_datum(std::string const& s)
    {
        gnutls_datum_t d;
        d.data = reinterpret_cast<unsigned char*>(const_cast<char*>(s.data()));
        d.size = static_cast<unsigned int>(s.size());
        return d;
    }
} // namespace

static void
check_gnutls(int code, char const* what)
{
    if (code < 0) {
        throw std::runtime_error(
            std::string("gnutls: ") + what + " error: " + std::string(gnutls_strerror(code)));
    }
}

static void
check_pk_algorithm(int pk, unsigned int bits, scrub_signature_e alg)
{
    if (alg == scrub_sig_rsa_pkcs1_sha256) {
        if (pk != GNUTLS_PK_RSA) {
            throw std::runtime_error("key is not an RSA key");
        }
    } else if (pk != GNUTLS_PK_ECDSA) {
        throw std::runtime_error("key is not an EC key");
    } else if (bits != 256) {
        throw std::runtime_error("EC key is not on the P-256 curve");
    }
}

static gnutls_sign_algorithm_t
sign_algorithm(scrub_signature_e alg)
{
    return alg == scrub_sig_rsa_pkcs1_sha256 ? GNUTLS_SIGN_RSA_SHA256 : GNUTLS_SIGN_ECDSA_SHA256;
}

ScrubCrypto_gnutls::ScrubCrypto_gnutls() :
    hash_ctx(nullptr),
    cipher_ctx(nullptr),
    sha2_bits(0),
    encrypt(false),
    cbc_mode(false),
    aes_key_data(nullptr),
    aes_key_len(0)
{
    memset(digest, 0, sizeof(digest));
}

ScrubCrypto_gnutls::~ScrubCrypto_gnutls()
{
    if (hash_ctx) {
        gnutls_hash_deinit(hash_ctx, digest);
    }
    if (cipher_ctx) {
        gnutls_cipher_deinit(cipher_ctx);
    }
    aes_key_data = nullptr;
    aes_key_len = 0;
}

void
ScrubCrypto_gnutls::provideRandomData(unsigned char* data, size_t len)
{
    check_gnutls(gnutls_rnd(GNUTLS_RND_KEY, data, len), "random number generation");
}

void
ScrubCrypto_gnutls::SHA2_init(int bits)
{
    SHA2_finalize();
    gnutls_digest_algorithm_t alg = GNUTLS_DIG_UNKNOWN;
    switch (bits) {
    case 256:
        alg = GNUTLS_DIG_SHA256;
        break;
    case 384:
        alg = GNUTLS_DIG_SHA384;
        break;
    case 512:
        alg = GNUTLS_DIG_SHA512;
        break;
    default:
        badBits();
        break;
    }
    sha2_bits = bits;
    int code = gnutls_hash_init(&hash_ctx, alg);
    if (code < 0) {
        hash_ctx = nullptr;
        check_gnutls(code, "SHA2");
    }
}

void
ScrubCrypto_gnutls::SHA2_update(unsigned char const* data, size_t len)
{
    check_gnutls(gnutls_hash(hash_ctx, data, len), "SHA2");
}

void
ScrubCrypto_gnutls::SHA2_finalize()
{
    if (hash_ctx) {
        gnutls_hash_deinit(hash_ctx, digest);
        hash_ctx = nullptr;
    }
}

std::string
ScrubCrypto_gnutls::SHA2_digest()
{
    std::string result;
    switch (sha2_bits) {
    case 256:
        result = std::string(digest, 32);
        break;
    case 384:
        result = std::string(digest, 48);
        break;
    case 512:
        result = std::string(digest, 64);
        break;
    default:
        badBits();
        break;
    }
    return result;
}

std::string
ScrubCrypto_gnutls::PBKDF2_derive(
    std::string const& password, std::string const& salt, int iterations, size_t key_len)
{
    if (iterations < 1 || key_len == 0) {
        throw std::logic_error("invalid PBKDF2 parameters");
    }
    auto key = as_datum(password);
    auto salt_datum = as_datum(salt);
    std::string result(key_len, '\0');
    check_gnutls(
        gnutls_pbkdf2(
            GNUTLS_MAC_SHA256,
            &key,
            &salt_datum,
            static_cast<unsigned int>(iterations),
            result.data(),
            key_len),
        "PBKDF2");
    return result;
}

void
ScrubCrypto_gnutls::RC4_init(unsigned char const* key_data, int key_len)
{
    RC4_finalize();
    gnutls_datum_t key;
    key.data = const_cast<unsigned char*>(key_data);
    key.size = static_cast<unsigned int>(key_len);

    int code = gnutls_cipher_init(&cipher_ctx, GNUTLS_CIPHER_ARCFOUR_128, &key, nullptr);
    if (code < 0) {
        cipher_ctx = nullptr;
        check_gnutls(code, "RC4");
    }
}

void
ScrubCrypto_gnutls::RC4_process(unsigned char const* in_data, size_t len, unsigned char* out_data)
{
    if (out_data == nullptr) {
        out_data = const_cast<unsigned char*>(in_data);
    }
    check_gnutls(gnutls_cipher_encrypt2(cipher_ctx, in_data, len, out_data, len), "RC4");
}

void
ScrubCrypto_gnutls::RC4_finalize()
{
    if (cipher_ctx) {
        gnutls_cipher_deinit(cipher_ctx);
        cipher_ctx = nullptr;
    }
}

void
ScrubCrypto_gnutls::rijndael_init(
    bool encrypt,
    unsigned char const* key_data,
    size_t key_len,
    bool cbc_mode,
    unsigned char* cbc_block)
{
    rijndael_finalize();
    this->encrypt = encrypt;
    this->cbc_mode = cbc_mode;
    if (!cbc_mode) {
        // Save the key so we can re-initialize.
        aes_key_data = key_data;
        aes_key_len = key_len;
    }

    gnutls_cipher_algorithm_t alg = GNUTLS_CIPHER_UNKNOWN;
    switch (key_len) {
    case 16:
        alg = GNUTLS_CIPHER_AES_128_CBC;
        break;
    case 24:
        alg = GNUTLS_CIPHER_AES_192_CBC;
        break;
    case 32:
        alg = GNUTLS_CIPHER_AES_256_CBC;
        break;
    default:
        throw std::logic_error("unsupported key length: " + std::to_string(key_len * 8));
    }

    gnutls_datum_t cipher_key;
    gnutls_datum_t iv;
    cipher_key.data = const_cast<unsigned char*>(key_data);
    cipher_key.size = static_cast<unsigned int>(gnutls_cipher_get_key_size(alg));
    iv.data = cbc_block;
    iv.size = rijndael_buf_size;

    int code = gnutls_cipher_init(&cipher_ctx, alg, &cipher_key, &iv);
    if (code < 0) {
        cipher_ctx = nullptr;
        check_gnutls(code, "AES");
    }
}

void
ScrubCrypto_gnutls::rijndael_process(unsigned char* in_data, unsigned char* out_data)
{
    if (encrypt) {
        check_gnutls(
            gnutls_cipher_encrypt2(
                cipher_ctx, in_data, rijndael_buf_size, out_data, rijndael_buf_size),
            "AES");
    } else {
        check_gnutls(
            gnutls_cipher_decrypt2(
                cipher_ctx, in_data, rijndael_buf_size, out_data, rijndael_buf_size),
            "AES");
    }

    // Gnutls doesn't support AES in ECB (non-CBC) mode, but the result is the same as if you
    // just reset the cbc block to all zeroes each time.
    if (!cbc_mode) {
        static unsigned char zeroes[16] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        rijndael_init(encrypt, aes_key_data, aes_key_len, false, zeroes);
    }
}

void
ScrubCrypto_gnutls::rijndael_finalize()
{
    if (cipher_ctx) {
        gnutls_cipher_deinit(cipher_ctx);
        cipher_ctx = nullptr;
    }
}

std::string
ScrubCrypto_gnutls::signature_sign(
    scrub_signature_e alg, std::string const& private_key_pem, std::string const& data)
{
    gnutls_privkey_t raw = nullptr;
    check_gnutls(gnutls_privkey_init(&raw), "private key");
    privkey_ptr key(raw, gnutls_privkey_deinit);

    auto pem = as_datum(private_key_pem);
    check_gnutls(
        gnutls_privkey_import_x509_raw(key.get(), &pem, GNUTLS_X509_FMT_PEM, nullptr, 0),
        "private key import");
    unsigned int bits = 0;
    check_pk_algorithm(gnutls_privkey_get_pk_algorithm(key.get(), &bits), bits, alg);

    auto in = as_datum(data);
    gnutls_datum_t sig = {nullptr, 0};
    check_gnutls(gnutls_privkey_sign_data(key.get(), GNUTLS_DIG_SHA256, 0, &in, &sig), "sign");
    std::string result(reinterpret_cast<char*>(sig.data), sig.size);
    gnutls_free(sig.data);
    return result;
}

bool
ScrubCrypto_gnutls::signature_verify(
    scrub_signature_e alg,
    std::string const& public_pem,
    std::string const& data,
    std::string const& signature)
{
    gnutls_pubkey_t raw = nullptr;
    check_gnutls(gnutls_pubkey_init(&raw), "public key");
    pubkey_ptr key(raw, gnutls_pubkey_deinit);

    auto pem = as_datum(public_pem);
    // Accept either a certificate or a bare SubjectPublicKeyInfo
    if (gnutls_pubkey_import_x509_raw(key.get(), &pem, GNUTLS_X509_FMT_PEM, 0) < 0) {
        key.reset();
        check_gnutls(gnutls_pubkey_init(&raw), "public key");
        key.reset(raw);
        check_gnutls(
            gnutls_pubkey_import(key.get(), &pem, GNUTLS_X509_FMT_PEM), "public key import");
    }
    unsigned int bits = 0;
    check_pk_algorithm(gnutls_pubkey_get_pk_algorithm(key.get(), &bits), bits, alg);

    auto in = as_datum(data);
    auto sig = as_datum(signature);
    return gnutls_pubkey_verify_data2(key.get(), sign_algorithm(alg), 0, &in, &sig) >= 0;
}

void
ScrubCrypto_gnutls::badBits()
{
    throw std::logic_error("SHA2 (gnutls) has bits != 256, 384, or 512");
}

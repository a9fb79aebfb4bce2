#include <scrub/ScrubCrypto_openssl.hh>

#include <climits>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#ifdef SCRUB_OPENSSL_1
# include <openssl/ec.h>
#else
# include <openssl/core_names.h>
# include <openssl/provider.h>
#endif
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif

#ifndef SCRUB_OPENSSL_1
namespace
{
    class RC4Loader
    {
      public:
        static EVP_CIPHER const* getRC4();
        ~RC4Loader();

      private:
        RC4Loader();
        OSSL_PROVIDER* legacy;
        OSSL_LIB_CTX* libctx;
        EVP_CIPHER* rc4;
    };
} // namespace

EVP_CIPHER const*
RC4Loader::getRC4()
{
    static auto loader = std::shared_ptr<RC4Loader>(new RC4Loader());
    return loader->rc4;
}

RC4Loader::RC4Loader()
{
    libctx = OSSL_LIB_CTX_new();
    if (libctx == nullptr) {
        throw std::runtime_error("unable to create openssl library context");
    }
    legacy = OSSL_PROVIDER_load(libctx, "legacy");
    if (legacy == nullptr) {
        OSSL_LIB_CTX_free(libctx);
        throw std::runtime_error("unable to load openssl legacy provider");
    }
    rc4 = EVP_CIPHER_fetch(libctx, "RC4", nullptr);
    if (rc4 == nullptr) {
        OSSL_PROVIDER_unload(legacy);
        OSSL_LIB_CTX_free(libctx);
        throw std::runtime_error("unable to load openssl rc4 algorithm");
    }
}

RC4Loader::~RC4Loader()
{
    EVP_CIPHER_free(rc4);
    OSSL_PROVIDER_unload(legacy);
    OSSL_LIB_CTX_free(libctx);
}
#endif // not SCRUB_OPENSSL_1

namespace
{
    typedef std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey_ptr;
    typedef std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md_ctx_ptr;
    typedef std::unique_ptr<BIO, decltype(&BIO_free)> bio_ptr;
    typedef std::unique_ptr<X509, decltype(&X509_free)> x509_ptr;
} // namespace

static void
bad_bits(int bits)
{
    throw std::logic_error(std::string("unsupported key length: ") + std::to_string(bits));
}

static void
check_openssl(int status)
{
    if (status != 1) {
        // OpenSSL creates a "queue" of errors; copy the first (innermost) error to the exception
        // message.
        char buf[256] = "";
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        std::string what = "OpenSSL error: ";
        what += buf;
        ERR_clear_error();
        throw std::runtime_error(what);
    }
    ERR_clear_error();
}

static bio_ptr
memory_bio(std::string const& pem)
{
    bio_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio) {
        throw std::runtime_error("OpenSSL error: unable to allocate memory buffer");
    }
    return bio;
}

// Reject keys whose type doesn't match the requested signature algorithm
static void
check_key_type(EVP_PKEY* pkey, scrub_signature_e alg)
{
#ifdef SCRUB_OPENSSL_1
    int base_id = EVP_PKEY_base_id(pkey);
#else
    int base_id = EVP_PKEY_get_base_id(pkey);
#endif
    if (alg == scrub_sig_rsa_pkcs1_sha256) {
        if (base_id != EVP_PKEY_RSA) {
            throw std::runtime_error("key is not an RSA key");
        }
        return;
    }
    if (base_id != EVP_PKEY_EC) {
        throw std::runtime_error("key is not an EC key");
    }
#ifdef SCRUB_OPENSSL_1
    EC_KEY const* ec = EVP_PKEY_get0_EC_KEY(pkey);
    if (ec == nullptr || EC_GROUP_get_curve_name(EC_KEY_get0_group(ec)) != NID_X9_62_prime256v1) {
        throw std::runtime_error("EC key is not on the P-256 curve");
    }
#else
    char group[80] = "";
    size_t group_len = 0;
    if (EVP_PKEY_get_group_name(pkey, group, sizeof(group), &group_len) != 1 ||
        std::string(group, group_len) != SN_X9_62_prime256v1) {
        ERR_clear_error();
        throw std::runtime_error("EC key is not on the P-256 curve");
    }
#endif
}

static pkey_ptr
load_public_key(std::string const& pem)
{
    {
        auto bio = memory_bio(pem);
        x509_ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), X509_free);
        if (cert) {
            pkey_ptr pkey(X509_get_pubkey(cert.get()), EVP_PKEY_free);
            if (pkey) {
                ERR_clear_error();
                return pkey;
            }
        }
    }
    {
        auto bio = memory_bio(pem);
        pkey_ptr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
        if (pkey) {
            ERR_clear_error();
            return pkey;
        }
    }
    ERR_clear_error();
    throw std::runtime_error("OpenSSL error: unable to read certificate or public key");
}

ScrubCrypto_openssl::ScrubCrypto_openssl() :
    md_ctx(EVP_MD_CTX_new()),
    cipher_ctx(EVP_CIPHER_CTX_new()),
    sha2_bits(0)
{
    memset(md_out, 0, sizeof(md_out));
    EVP_MD_CTX_init(md_ctx);
    EVP_CIPHER_CTX_init(cipher_ctx);
}

ScrubCrypto_openssl::~ScrubCrypto_openssl()
{
    EVP_MD_CTX_reset(md_ctx);
    EVP_CIPHER_CTX_reset(cipher_ctx);
    EVP_CIPHER_CTX_free(cipher_ctx);
    EVP_MD_CTX_free(md_ctx);
}

void
ScrubCrypto_openssl::provideRandomData(unsigned char* data, size_t len)
{
    if (len > INT_MAX) {
        throw std::logic_error("random data request too large");
    }
    check_openssl(RAND_bytes(data, static_cast<int>(len)));
}

void
ScrubCrypto_openssl::SHA2_init(int bits)
{
    const EVP_MD* md = nullptr;
    switch (bits) {
    case 256:
        md = EVP_sha256();
        break;
    case 384:
        md = EVP_sha384();
        break;
    case 512:
        md = EVP_sha512();
        break;
    default:
        bad_bits(bits);
        return;
    }
    sha2_bits = static_cast<size_t>(bits);
    check_openssl(EVP_MD_CTX_reset(md_ctx));
    check_openssl(EVP_DigestInit_ex(md_ctx, md, nullptr));
}

void
ScrubCrypto_openssl::SHA2_update(unsigned char const* data, size_t len)
{
    check_openssl(EVP_DigestUpdate(md_ctx, data, len));
}

void
ScrubCrypto_openssl::SHA2_finalize()
{
#ifdef SCRUB_OPENSSL_1
    auto md = EVP_MD_CTX_md(md_ctx);
#else
    auto md = EVP_MD_CTX_get0_md(md_ctx);
#endif
    if (md) {
        check_openssl(EVP_DigestFinal(md_ctx, md_out + 0, nullptr));
    }
}

std::string
ScrubCrypto_openssl::SHA2_digest()
{
    return std::string(reinterpret_cast<char*>(md_out), sha2_bits / 8);
}

std::string
ScrubCrypto_openssl::PBKDF2_derive(
    std::string const& password, std::string const& salt, int iterations, size_t key_len)
{
    if (iterations < 1 || key_len == 0 || key_len > INT_MAX) {
        throw std::logic_error("invalid PBKDF2 parameters");
    }
    std::string result(key_len, '\0');
    check_openssl(PKCS5_PBKDF2_HMAC(
        password.data(),
        static_cast<int>(password.size()),
        reinterpret_cast<unsigned char const*>(salt.data()),
        static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(key_len),
        reinterpret_cast<unsigned char*>(result.data())));
    return result;
}

void
ScrubCrypto_openssl::RC4_init(unsigned char const* key_data, int key_len)
{
#ifdef SCRUB_OPENSSL_1
    static auto const rc4 = EVP_rc4();
#else
    static auto const rc4 = RC4Loader::getRC4();
#endif
    check_openssl(EVP_CIPHER_CTX_reset(cipher_ctx));
    check_openssl(EVP_EncryptInit_ex(cipher_ctx, rc4, nullptr, nullptr, nullptr));
    check_openssl(EVP_CIPHER_CTX_set_key_length(cipher_ctx, key_len));
    check_openssl(EVP_EncryptInit_ex(cipher_ctx, nullptr, nullptr, key_data, nullptr));
}

void
ScrubCrypto_openssl::RC4_process(unsigned char const* in_data, size_t len, unsigned char* out_data)
{
    if (out_data == nullptr) {
        out_data = const_cast<unsigned char*>(in_data);
    }
    int out_len = static_cast<int>(len);
    check_openssl(EVP_EncryptUpdate(cipher_ctx, out_data, &out_len, in_data, out_len));
}

void
ScrubCrypto_openssl::RC4_finalize()
{
    if (EVP_CIPHER_CTX_cipher(cipher_ctx)) {
        check_openssl(EVP_CIPHER_CTX_reset(cipher_ctx));
    }
}

void
ScrubCrypto_openssl::rijndael_init(
    bool encrypt,
    unsigned char const* key_data,
    size_t key_len,
    bool cbc_mode,
    unsigned char* cbc_block)
{
    const EVP_CIPHER* cipher = nullptr;
    switch (key_len) {
    case 32:
        cipher = cbc_mode ? EVP_aes_256_cbc() : EVP_aes_256_ecb();
        break;
    case 24:
        cipher = cbc_mode ? EVP_aes_192_cbc() : EVP_aes_192_ecb();
        break;
    case 16:
        cipher = cbc_mode ? EVP_aes_128_cbc() : EVP_aes_128_ecb();
        break;
    default:
        bad_bits(static_cast<int>(key_len * 8));
        return;
    }

    check_openssl(EVP_CIPHER_CTX_reset(cipher_ctx));
    check_openssl(EVP_CipherInit_ex(cipher_ctx, cipher, nullptr, key_data, cbc_block, encrypt));
    check_openssl(EVP_CIPHER_CTX_set_padding(cipher_ctx, 0));
}

void
ScrubCrypto_openssl::rijndael_process(unsigned char* in_data, unsigned char* out_data)
{
    int len = ScrubCryptoImpl::rijndael_buf_size;
    check_openssl(EVP_CipherUpdate(cipher_ctx, out_data, &len, in_data, len));
}

void
ScrubCrypto_openssl::rijndael_finalize()
{
    if (EVP_CIPHER_CTX_cipher(cipher_ctx)) {
        check_openssl(EVP_CIPHER_CTX_reset(cipher_ctx));
    }
}

std::string
ScrubCrypto_openssl::signature_sign(
    scrub_signature_e alg, std::string const& private_key_pem, std::string const& data)
{
    auto bio = memory_bio(private_key_pem);
    pkey_ptr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!pkey) {
        ERR_clear_error();
        throw std::runtime_error("OpenSSL error: unable to read private key");
    }
    check_key_type(pkey.get(), alg);

    md_ctx_ptr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("OpenSSL error: unable to allocate digest context");
    }
    check_openssl(EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()));
    auto in = reinterpret_cast<unsigned char const*>(data.data());
    size_t sig_len = 0;
    check_openssl(EVP_DigestSign(ctx.get(), nullptr, &sig_len, in, data.size()));
    std::string result(sig_len, '\0');
    check_openssl(EVP_DigestSign(
        ctx.get(), reinterpret_cast<unsigned char*>(result.data()), &sig_len, in, data.size()));
    result.resize(sig_len);
    return result;
}

bool
ScrubCrypto_openssl::signature_verify(
    scrub_signature_e alg,
    std::string const& public_pem,
    std::string const& data,
    std::string const& signature)
{
    auto pkey = load_public_key(public_pem);
    check_key_type(pkey.get(), alg);

    md_ctx_ptr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("OpenSSL error: unable to allocate digest context");
    }
    check_openssl(EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()));
    int status = EVP_DigestVerify(
        ctx.get(),
        reinterpret_cast<unsigned char const*>(signature.data()),
        signature.size(),
        reinterpret_cast<unsigned char const*>(data.data()),
        data.size());
    // 0 is a mismatch; a negative value means the signature couldn't even be parsed, which is
    // also a mismatch from the caller's point of view.
    ERR_clear_error();
    return status == 1;
}

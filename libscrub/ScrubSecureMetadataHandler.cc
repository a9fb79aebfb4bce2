#include <scrub/ScrubSecureMetadataHandler.hh>

#include <scrub/Pl_AES_CBC.hh>
#include <scrub/RC4.hh>
#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubExc.hh>

#include <algorithm>
#include <chrono>
#include <functional>

namespace
{
    // RC4-drop128 discards this many bytes of key stream before use.
    size_t const rc4_drop = 128;

    std::string const self_test_message = "scrub signature self-test";

    void
    wipe(std::string& s)
    {
        std::fill(s.begin(), s.end(), '\0');
        s.clear();
    }

    ScrubExc
    config_error(std::string const& message)
    {
        return {scrub_e_configuration, "configuration", "", message};
    }
} // namespace

class ScrubSecureMetadataHandler::Members
{
    friend class ScrubSecureMetadataHandler;

  public:
    Members() = default;
    ~Members()
    {
        wipe(encryption.key);
    }

  private:
    Members(Members const&) = delete;

    // Run fn, translating library failures into ScrubExc.
    std::string cryptoOp(std::string const& object, std::function<std::string()> fn);
    void requireEncryption() const;
    void requireSignature() const;
    std::string encrypt(std::string const& data, scrub_encryption_e algorithm);
    std::string decrypt(std::string const& data, scrub_encryption_e algorithm);
    std::string sign(std::string const& data);
    void processInfo(ScrubDocument& doc);
    void processXMP(ScrubDocument& doc);
    static ScrubObjGen findMetadataStream(ScrubDocument const& doc);

    bool have_encryption{false};
    bool have_signature{false};
    EncryptionSettings encryption;
    SignatureSettings signature;
    SecurityStats stats;
    std::vector<FieldSignature> last_signatures;
};

ScrubSecureMetadataHandler::ScrubSecureMetadataHandler() :
    m(new Members())
{
}

ScrubSecureMetadataHandler::~ScrubSecureMetadataHandler() = default;

scrub_encryption_e
ScrubSecureMetadataHandler::parseEncryptionAlgorithm(std::string const& name)
{
    if (name == "aes-cbc") {
        return scrub_enc_aes_cbc;
    } else if (name == "rc4-drop128") {
        return scrub_enc_rc4_drop128;
    }
    throw config_error("unknown encryption algorithm " + name);
}

scrub_signature_e
ScrubSecureMetadataHandler::parseSignatureAlgorithm(std::string const& name)
{
    if (name == "rsa-pkcs1-sha256") {
        return scrub_sig_rsa_pkcs1_sha256;
    } else if (name == "ecdsa-p256-sha256") {
        return scrub_sig_ecdsa_p256_sha256;
    }
    throw config_error("unknown signature algorithm " + name);
}

char const*
ScrubSecureMetadataHandler::encryptionAlgorithmName(scrub_encryption_e algorithm)
{
    switch (algorithm) {
    case scrub_enc_aes_cbc:
        return "aes-cbc";
    case scrub_enc_rc4_drop128:
        return "rc4-drop128";
    }
    return "unknown";
}

char const*
ScrubSecureMetadataHandler::signatureAlgorithmName(scrub_signature_e algorithm)
{
    switch (algorithm) {
    case scrub_sig_rsa_pkcs1_sha256:
        return "rsa-pkcs1-sha256";
    case scrub_sig_ecdsa_p256_sha256:
        return "ecdsa-p256-sha256";
    }
    return "unknown";
}

void
ScrubSecureMetadataHandler::configureEncryption(EncryptionSettings settings)
{
    try {
        if (!(settings.algorithm == scrub_enc_aes_cbc ||
              settings.algorithm == scrub_enc_rc4_drop128)) {
            throw config_error("unknown encryption algorithm");
        }
        if (!(settings.key_length == 128 || settings.key_length == 192 ||
              settings.key_length == 256)) {
            throw config_error(
                "key length must be 128, 192, or 256 bits; got " +
                std::to_string(settings.key_length));
        }
        if (settings.key.size() * 8 != static_cast<size_t>(settings.key_length)) {
            throw config_error(
                "key must be exactly " + std::to_string(settings.key_length / 8) +
                " bytes; got " + std::to_string(settings.key.size()));
        }
        if (settings.salt.size() < min_salt_length) {
            throw config_error(
                "salt must be at least " + std::to_string(min_salt_length) + " bytes");
        }
        if (settings.iterations < min_iterations) {
            throw config_error(
                "iteration count must be at least " + std::to_string(min_iterations) +
                "; got " + std::to_string(settings.iterations));
        }
        std::string derived;
        try {
            derived = ScrubCryptoProvider::getImpl()->PBKDF2_derive(
                settings.key,
                settings.salt,
                settings.iterations,
                static_cast<size_t>(settings.key_length / 8));
        } catch (std::runtime_error& e) {
            throw config_error(std::string("key derivation failed: ") + e.what());
        }
        if (derived.size() * 8 != static_cast<size_t>(settings.key_length)) {
            throw config_error("key derivation produced a key of the wrong length");
        }
        wipe(settings.key);
        settings.key = derived;
        wipe(derived);
    } catch (...) {
        wipe(settings.key);
        throw;
    }
    wipe(m->encryption.key);
    m->encryption = std::move(settings);
    m->have_encryption = true;
}

void
ScrubSecureMetadataHandler::configureSignature(SignatureSettings const& settings)
{
    if (!(settings.algorithm == scrub_sig_rsa_pkcs1_sha256 ||
          settings.algorithm == scrub_sig_ecdsa_p256_sha256)) {
        throw config_error("unknown signature algorithm");
    }
    if (settings.certificate.empty()) {
        throw config_error("a certificate or public key is required for signing");
    }
    if (settings.private_key.empty()) {
        throw config_error("a private key is required for signing");
    }
    if (settings.algorithm == scrub_sig_ecdsa_p256_sha256) {
        bool verified = false;
        try {
            auto crypto = ScrubCryptoProvider::getImpl();
            auto sig = crypto->signature_sign(
                settings.algorithm, settings.private_key, self_test_message);
            verified = crypto->signature_verify(
                settings.algorithm, settings.certificate, self_test_message, sig);
        } catch (std::runtime_error& e) {
            throw config_error(std::string("ECDSA key pair self-test failed: ") + e.what());
        }
        if (!verified) {
            throw config_error(
                "ECDSA key pair self-test failed: certificate does not match private key");
        }
    }
    m->signature = settings;
    m->have_signature = true;
}

bool
ScrubSecureMetadataHandler::hasEncryption() const
{
    return m->have_encryption;
}

bool
ScrubSecureMetadataHandler::hasSignature() const
{
    return m->have_signature;
}

ScrubSecureMetadataHandler::EncryptionSettings const&
ScrubSecureMetadataHandler::getEncryptionSettings() const
{
    m->requireEncryption();
    return m->encryption;
}

ScrubSecureMetadataHandler::SignatureSettings const&
ScrubSecureMetadataHandler::getSignatureSettings() const
{
    m->requireSignature();
    return m->signature;
}

void
ScrubSecureMetadataHandler::Members::requireEncryption() const
{
    if (!have_encryption) {
        throw config_error("encryption has not been configured");
    }
}

void
ScrubSecureMetadataHandler::Members::requireSignature() const
{
    if (!have_signature) {
        throw config_error("signing has not been configured");
    }
}

std::string
ScrubSecureMetadataHandler::Members::cryptoOp(
    std::string const& object, std::function<std::string()> fn)
{
    try {
        return fn();
    } catch (ScrubExc&) {
        throw;
    } catch (std::runtime_error& e) {
        ++stats.crypto_failures;
        throw ScrubExc(scrub_e_crypto, "secure", object, e.what());
    }
}

std::string
ScrubSecureMetadataHandler::Members::encrypt(
    std::string const& data, scrub_encryption_e algorithm)
{
    if (algorithm == scrub_enc_aes_cbc) {
        return Pl_AES_CBC::encrypt(encryption.key, data);
    }
    std::string result = data;
    RC4::process(encryption.key, result, rc4_drop);
    return result;
}

std::string
ScrubSecureMetadataHandler::Members::decrypt(
    std::string const& data, scrub_encryption_e algorithm)
{
    if (algorithm == scrub_enc_aes_cbc) {
        return Pl_AES_CBC::decrypt(encryption.key, data);
    }
    std::string result = data;
    RC4::process(encryption.key, result, rc4_drop);
    return result;
}

std::string
ScrubSecureMetadataHandler::Members::sign(std::string const& data)
{
    return ScrubCryptoProvider::getImpl()->signature_sign(
        signature.algorithm, signature.private_key, data);
}

std::string
ScrubSecureMetadataHandler::encryptData(std::string const& data)
{
    m->requireEncryption();
    return encryptData(data, m->encryption.algorithm);
}

std::string
ScrubSecureMetadataHandler::encryptData(std::string const& data, scrub_encryption_e algorithm)
{
    m->requireEncryption();
    return m->cryptoOp("", [this, &data, algorithm]() { return m->encrypt(data, algorithm); });
}

std::string
ScrubSecureMetadataHandler::decryptData(std::string const& data)
{
    m->requireEncryption();
    return decryptData(data, m->encryption.algorithm);
}

std::string
ScrubSecureMetadataHandler::decryptData(std::string const& data, scrub_encryption_e algorithm)
{
    m->requireEncryption();
    return m->cryptoOp("", [this, &data, algorithm]() { return m->decrypt(data, algorithm); });
}

std::string
ScrubSecureMetadataHandler::signData(std::string const& data)
{
    m->requireSignature();
    return m->cryptoOp("", [this, &data]() { return m->sign(data); });
}

bool
ScrubSecureMetadataHandler::verifySignature(std::string const& data, std::string const& signature)
{
    m->requireSignature();
    ++m->stats.verifications_performed;
    try {
        return ScrubCryptoProvider::getImpl()->signature_verify(
            m->signature.algorithm, m->signature.certificate, data, signature);
    } catch (std::runtime_error& e) {
        ++m->stats.crypto_failures;
        throw ScrubExc(scrub_e_crypto, "secure", "", e.what());
    }
}

std::vector<ScrubSecureMetadataHandler::FieldSignature> const&
ScrubSecureMetadataHandler::getLastSignatures() const
{
    return m->last_signatures;
}

ScrubSecureMetadataHandler::SecurityStats const&
ScrubSecureMetadataHandler::getStats() const
{
    return m->stats;
}

ScrubObjGen
ScrubSecureMetadataHandler::Members::findMetadataStream(ScrubDocument const& doc)
{
    auto is_xmp = [](ScrubObject const* obj) {
        return obj != nullptr && obj->isStream() && obj->isDictionaryOfType("/Metadata", "/XML");
    };
    auto root_ref = doc.getTrailer().getKey("/Root");
    auto root = doc.resolve(root_ref);
    if (root_ref.isReference() && root != nullptr && root->isDictionary()) {
        auto const& md = root->getKey("/Metadata");
        if (md.isReference() && is_xmp(doc.getObject(md.getRef()))) {
            return md.getRef();
        }
    }
    for (auto const& iter: doc.getObjectTable()) {
        if (is_xmp(&iter.second)) {
            return iter.first;
        }
    }
    return {};
}

void
ScrubSecureMetadataHandler::Members::processInfo(ScrubDocument& doc)
{
    auto og = doc.getInfo();
    if (!og.isIndirect()) {
        return;
    }
    auto info = doc.getObject(og);
    if (info == nullptr || !info->isDictionary()) {
        doc.warn("secure: /Info references missing object " + og.describe() + "; skipping");
        return;
    }
    for (auto& iter: info->getDictAsMap()) {
        if (!iter.second.isString()) {
            continue;
        }
        auto object = og.describe() + " " + iter.first;
        std::string data = iter.second.getStringValue();
        if (have_encryption) {
            data = cryptoOp(
                object, [this, &data]() { return encrypt(data, encryption.algorithm); });
            iter.second = ScrubObject::newString(data);
            ++stats.fields_encrypted;
        }
        if (have_signature) {
            auto sig = cryptoOp(object, [this, &data]() { return sign(data); });
            last_signatures.push_back({og, iter.first, sig});
            ++stats.fields_signed;
        }
        doc.getLogger()->debug("secure: processed " + object);
    }
}

void
ScrubSecureMetadataHandler::Members::processXMP(ScrubDocument& doc)
{
    auto og = findMetadataStream(doc);
    if (!og.isIndirect()) {
        return;
    }
    auto stream = doc.getObject(og);
    auto object = og.describe();
    std::string data = stream->getStreamData();
    if (have_encryption) {
        data = cryptoOp(object, [this, &data]() { return encrypt(data, encryption.algorithm); });
        stream->replaceStreamData(data);
        ++stats.fields_encrypted;
    }
    if (have_signature) {
        auto sig = cryptoOp(object, [this, &data]() { return sign(data); });
        last_signatures.push_back({og, "", sig});
        ++stats.fields_signed;
    }
    doc.getLogger()->debug("secure: processed XMP metadata " + object);
}

void
ScrubSecureMetadataHandler::processMetadata(ScrubDocument& doc)
{
    if (!(m->have_encryption || m->have_signature)) {
        throw config_error("neither encryption nor signing has been configured");
    }
    auto start = std::chrono::steady_clock::now();
    m->last_signatures.clear();
    try {
        m->processInfo(doc);
        m->processXMP(doc);
    } catch (...) {
        m->stats.duration_ms += std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - start)
                                    .count();
        throw;
    }
    m->stats.duration_ms += std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
}

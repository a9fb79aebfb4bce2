#include <scrub/assert_test.h>

#include "test_keys.hh"

#include <scrub/ScrubCryptoProvider.hh>
#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubExc.hh>
#include <scrub/ScrubLogger.hh>
#include <scrub/ScrubSecureMetadataHandler.hh>
#include <scrub/ScrubUtil.hh>
#include <functional>
#include <iostream>
#include <sstream>

typedef ScrubSecureMetadataHandler H;
typedef ScrubObject O;

static std::string const passphrase = "0123456789abcdef0123456789abcdef";
static std::string const salt = "scrub-test-salt!";
static std::string const derived_hex =
    "005c8d4b1a9524728378488c77db6ca8335173e461c8a791d1686553b6b20cf4";

static H::EncryptionSettings
encryption_settings(scrub_encryption_e algorithm = scrub_enc_aes_cbc)
{
    H::EncryptionSettings s;
    s.algorithm = algorithm;
    s.key_length = 256;
    s.key = passphrase;
    s.salt = salt;
    s.iterations = 10000;
    return s;
}

static H::SignatureSettings
signature_settings(scrub_signature_e algorithm)
{
    H::SignatureSettings s;
    s.algorithm = algorithm;
    if (algorithm == scrub_sig_rsa_pkcs1_sha256) {
        s.certificate = rsa_certificate;
        s.private_key = rsa_private_key;
    } else {
        s.certificate = ec_certificate;
        s.private_key = ec_private_key;
    }
    return s;
}

static void
expect_config_error(std::function<void()> fn)
{
    try {
        fn();
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_configuration);
        std::cout << "configuration error: " << e.getMessageDetail() << "\n";
    }
}

static void
test_names()
{
    assert(H::parseEncryptionAlgorithm("aes-cbc") == scrub_enc_aes_cbc);
    assert(H::parseEncryptionAlgorithm("rc4-drop128") == scrub_enc_rc4_drop128);
    assert(H::parseSignatureAlgorithm("rsa-pkcs1-sha256") == scrub_sig_rsa_pkcs1_sha256);
    assert(H::parseSignatureAlgorithm("ecdsa-p256-sha256") == scrub_sig_ecdsa_p256_sha256);
    assert(std::string(H::encryptionAlgorithmName(scrub_enc_rc4_drop128)) == "rc4-drop128");
    assert(std::string(H::signatureAlgorithmName(scrub_sig_ecdsa_p256_sha256)) ==
           "ecdsa-p256-sha256");
    expect_config_error([]() { H::parseEncryptionAlgorithm("des"); });
    expect_config_error([]() { H::parseSignatureAlgorithm("dsa"); });
}

static void
test_configure_encryption()
{
    H h;
    assert(!h.hasEncryption());
    expect_config_error([&h]() { h.getEncryptionSettings(); });
    expect_config_error([&h]() { h.encryptData("x"); });

    h.configureEncryption(encryption_settings());
    assert(h.hasEncryption());
    // Only the derived key is kept.
    assert(ScrubUtil::hex_encode(h.getEncryptionSettings().key) == derived_hex);

    auto s = encryption_settings();
    s.key_length = 100;
    expect_config_error([&h, s]() { h.configureEncryption(s); });
    s = encryption_settings();
    s.key = "too short";
    expect_config_error([&h, s]() { h.configureEncryption(s); });
    s = encryption_settings();
    s.key_length = 128;
    expect_config_error([&h, s]() { h.configureEncryption(s); });
    s = encryption_settings();
    s.salt = "short salt";
    expect_config_error([&h, s]() { h.configureEncryption(s); });
    s = encryption_settings();
    s.iterations = 1000;
    expect_config_error([&h, s]() { h.configureEncryption(s); });

    // Failed configuration leaves the previous settings alone.
    assert(h.hasEncryption());
    assert(h.getEncryptionSettings().iterations == 10000);
    assert(ScrubUtil::hex_encode(h.getEncryptionSettings().key) == derived_hex);

    s = encryption_settings();
    s.key_length = 128;
    s.key = passphrase.substr(0, 16);
    h.configureEncryption(s);
    assert(h.getEncryptionSettings().key.size() == 16);
}

static void
test_encryption()
{
    H h;
    h.configureEncryption(encryption_settings());

    auto aes = h.encryptData("test data");
    assert(aes.size() == 32);
    // Every call uses a fresh initialization vector.
    assert(h.encryptData("test data") != aes);
    assert(h.decryptData(aes) == "test data");
    assert(h.decryptData(h.encryptData("")) == "");

    auto rc4 = h.encryptData("test data", scrub_enc_rc4_drop128);
    assert(ScrubUtil::hex_encode(rc4) == "c019ee0a7e47159ad4");
    assert(h.decryptData(rc4, scrub_enc_rc4_drop128) == "test data");

    H rc4_handler;
    rc4_handler.configureEncryption(encryption_settings(scrub_enc_rc4_drop128));
    assert(rc4_handler.encryptData("test data") == rc4);

    try {
        h.decryptData("not a multiple of the block size");
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_crypto);
        assert(e.getPhase() == "secure");
    }
    assert(h.getStats().crypto_failures == 1);
}

static void
test_signatures()
{
    for (auto alg: {scrub_sig_rsa_pkcs1_sha256, scrub_sig_ecdsa_p256_sha256}) {
        H h;
        assert(!h.hasSignature());
        expect_config_error([&h]() { h.signData("x"); });
        h.configureSignature(signature_settings(alg));
        assert(h.hasSignature());
        assert(h.getSignatureSettings().algorithm == alg);

        auto sig = h.signData("signed content");
        assert(!sig.empty());
        assert(h.verifySignature("signed content", sig));
        assert(!h.verifySignature("signed content!", sig));
        auto tampered = sig;
        tampered[tampered.size() / 2] ^= 0x01;
        assert(!h.verifySignature("signed content", tampered));
        assert(h.getStats().verifications_performed == 3);
    }

    // A bare public key works as well as a certificate.
    H h;
    auto s = signature_settings(scrub_sig_rsa_pkcs1_sha256);
    s.certificate = rsa_public_key;
    h.configureSignature(s);
    assert(h.verifySignature("abc", h.signData("abc")));
    s = signature_settings(scrub_sig_ecdsa_p256_sha256);
    s.certificate = ec_public_key;
    h.configureSignature(s);
    assert(h.verifySignature("abc", h.signData("abc")));

    s = signature_settings(scrub_sig_ecdsa_p256_sha256);
    s.private_key = ec_p384_private_key;
    expect_config_error([&h, s]() { h.configureSignature(s); });
    s = signature_settings(scrub_sig_ecdsa_p256_sha256);
    s.private_key = rsa_private_key;
    expect_config_error([&h, s]() { h.configureSignature(s); });
    s = signature_settings(scrub_sig_rsa_pkcs1_sha256);
    s.certificate.clear();
    expect_config_error([&h, s]() { h.configureSignature(s); });
    s = signature_settings(scrub_sig_rsa_pkcs1_sha256);
    s.private_key.clear();
    expect_config_error([&h, s]() { h.configureSignature(s); });
    // The last good configuration is still in effect.
    assert(h.getSignatureSettings().certificate == ec_public_key);

    // Signing with a key of the wrong type is a crypto failure.
    H mismatched;
    s = signature_settings(scrub_sig_rsa_pkcs1_sha256);
    s.private_key = ec_private_key;
    mismatched.configureSignature(s);
    try {
        mismatched.signData("abc");
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_crypto);
    }
    assert(mismatched.getStats().crypto_failures == 1);
}

static std::unique_ptr<ScrubDocument>
make_document()
{
    auto doc = ScrubDocument::emptyDocument();
    auto info = doc->makeIndirectObject(O::newDictionary(
        {{"/Title", O::newString("Quarterly report")},
         {"/Author", O::newString("J. Doe")},
         {"/Trapped", O::newName("/False")},
         {"/Pages", O::newInteger(12)}}));
    doc->setInfo(info.getRef());
    auto xmp = doc->makeIndirectObject(O::newStream(
        {{"/Type", O::newName("/Metadata")}, {"/Subtype", O::newName("/XML")}},
        "<x:xmpmeta><dc:creator>J. Doe</dc:creator></x:xmpmeta>"));
    doc->getRoot().replaceKey("/Metadata", xmp);
    return doc;
}

static void
test_process()
{
    H h;
    auto doc = make_document();
    expect_config_error([&h, &doc]() { h.processMetadata(*doc); });

    h.configureEncryption(encryption_settings());
    h.configureSignature(signature_settings(scrub_sig_rsa_pkcs1_sha256));
    h.processMetadata(*doc);

    auto const& info = *doc->getObject(doc->getInfo());
    auto title = info.getKey("/Title").getStringValue();
    assert(title != "Quarterly report");
    assert(h.decryptData(title) == "Quarterly report");
    assert(h.decryptData(info.getKey("/Author").getStringValue()) == "J. Doe");
    assert(info.getKey("/Trapped").isNameAndEquals("/False"));
    assert(info.getKey("/Pages").getIntValue() == 12);

    auto xmp_og = doc->getRoot().getKey("/Metadata").getRef();
    auto const& xmp = *doc->getObject(xmp_og);
    assert(
        h.decryptData(xmp.getStreamData()) ==
        "<x:xmpmeta><dc:creator>J. Doe</dc:creator></x:xmpmeta>");
    auto length = static_cast<long long>(xmp.getStreamData().size());
    assert(xmp.getKey("/Length").getIntValue() == length);

    // Signatures cover the encrypted bytes.
    auto const& sigs = h.getLastSignatures();
    assert(sigs.size() == 3);
    assert(sigs.at(0).field == "/Author");
    assert(sigs.at(1).field == "/Title");
    assert(sigs.at(1).object_id == doc->getInfo());
    assert(h.verifySignature(title, sigs.at(1).signature));
    assert(sigs.at(2).field.empty());
    assert(sigs.at(2).object_id == xmp_og);
    assert(h.verifySignature(xmp.getStreamData(), sigs.at(2).signature));

    auto const& stats = h.getStats();
    assert(stats.fields_encrypted == 3);
    assert(stats.fields_signed == 3);
    assert(stats.verifications_performed == 2);
    assert(stats.crypto_failures == 0);

    // Signing only leaves the values alone.
    H signer;
    signer.configureSignature(signature_settings(scrub_sig_ecdsa_p256_sha256));
    doc = make_document();
    signer.processMetadata(*doc);
    auto const& plain = *doc->getObject(doc->getInfo());
    assert(plain.getKey("/Title").getStringValue() == "Quarterly report");
    assert(signer.getLastSignatures().size() == 3);
    assert(signer.verifySignature("Quarterly report", signer.getLastSignatures().at(1).signature));
    assert(signer.getStats().fields_encrypted == 0);
}

static void
test_process_edge_cases()
{
    std::ostringstream out;
    std::ostringstream err;
    auto log = ScrubLogger::create();
    log->setOutputStreams(&out, &err);

    // Dangling /Info and an XMP stream that the catalog doesn't point to
    auto doc = ScrubDocument::emptyDocument();
    doc->setLogger(log);
    doc->setInfo(ScrubObjGen(99, 0));
    auto xmp = doc->makeIndirectObject(O::newStream(
        {{"/Type", O::newName("/Metadata")}, {"/Subtype", O::newName("/XML")}}, "<?xpacket?>"));

    H h;
    h.configureEncryption(encryption_settings(scrub_enc_rc4_drop128));
    h.processMetadata(*doc);
    assert(err.str().find("WARNING: secure: /Info references missing object 99 0 R") == 0);
    auto const& data = doc->getObject(xmp.getRef())->getStreamData();
    assert(data.size() == 11);
    assert(data != "<?xpacket?>");
    assert(h.decryptData(data) == "<?xpacket?>");
    assert(h.getStats().fields_encrypted == 1);
    assert(h.getLastSignatures().empty());

    // No metadata at all
    auto empty = ScrubDocument::emptyDocument();
    H h2;
    h2.configureEncryption(encryption_settings());
    h2.processMetadata(*empty);
    assert(h2.getStats().fields_encrypted == 0);
}

int
main()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    for (auto const& name: ScrubCryptoProvider::getRegisteredImpls()) {
        std::cout << "provider " << name << "\n";
        ScrubCryptoProvider::setDefaultProvider(name);
        test_names();
        test_configure_encryption();
        test_encryption();
        test_signatures();
        test_process();
        test_process_edge_cases();
    }
    ScrubCryptoProvider::setDefaultProvider(initial);
    std::cout << "assertions passed\n";
    return 0;
}

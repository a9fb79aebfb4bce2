// Copyright (c) 2024-2026 The scrub authors
//
// This file is part of scrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef SCRUBSECUREMETADATAHANDLER_HH
#define SCRUBSECUREMETADATAHANDLER_HH

#include <scrub/Constants.h>
#include <scrub/DLL.h>
#include <scrub/ScrubDocument.hh>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// ScrubSecureMetadataHandler encrypts and signs a document's metadata: the string entries of the
// Info dictionary and the payload of the XMP metadata stream.
//
// Encryption uses either AES in CBC mode or RC4 with the first 128 bytes of key stream dropped.
// The key is never used as given: configureEncryption runs PBKDF2-HMAC-SHA256 over it and the
// configured salt, and only the derived key is kept. AES output is a random 16-byte
// initialization vector, generated separately for every field, followed by the PKCS#7-padded
// cipher text. RC4 output has the same length as its input.
//
// Signatures are RSA PKCS#1 v1.5 or ECDSA on P-256, both over SHA-256, and are computed over the
// bytes as they are after encryption. Signatures are counted and retained in memory (see
// getLastSignatures) but are not written into the document.
//
// Configuration errors throw ScrubExc with code scrub_e_configuration and leave any previous
// configuration in place. Failures of the underlying crypto library throw ScrubExc with code
// scrub_e_crypto.
//
// A handler must not be used by more than one thread at a time.
class ScrubSecureMetadataHandler
{
  public:
    static int const min_iterations = 10000;
    static size_t const min_salt_length = 16;

    struct EncryptionSettings
    {
        scrub_encryption_e algorithm{scrub_enc_aes_cbc};
        // In bits: 128, 192, or 256
        int key_length{256};
        // Must be exactly key_length bits. Replaced by the derived key once configured.
        std::string key;
        std::string salt;
        int iterations{100000};
    };

    struct SignatureSettings
    {
        scrub_signature_e algorithm{scrub_sig_rsa_pkcs1_sha256};
        // PEM-encoded X.509 certificate or public key
        std::string certificate;
        // PEM-encoded private key
        std::string private_key;
    };

    // Counters accumulate over the life of the handler.
    struct SecurityStats
    {
        size_t fields_encrypted{0};
        size_t fields_signed{0};
        size_t verifications_performed{0};
        size_t crypto_failures{0};
        long long duration_ms{0};
    };

    struct FieldSignature
    {
        ScrubObjGen object_id;
        // Info dictionary key, or empty for the XMP stream
        std::string field;
        std::string signature;
    };

    SCRUB_DLL
    ScrubSecureMetadataHandler();
    SCRUB_DLL
    ~ScrubSecureMetadataHandler();

    // settings is taken by value; the passphrase in the handler's copy is overwritten with zero
    // bytes before being replaced by the derived key.
    SCRUB_DLL
    void configureEncryption(EncryptionSettings settings);
    // For ECDSA, sign and verify a test message to make sure the key pair works together.
    SCRUB_DLL
    void configureSignature(SignatureSettings const& settings);

    SCRUB_DLL
    bool hasEncryption() const;
    SCRUB_DLL
    bool hasSignature() const;
    // Throw ScrubExc if the corresponding settings have not been configured.
    SCRUB_DLL
    EncryptionSettings const& getEncryptionSettings() const;
    SCRUB_DLL
    SignatureSettings const& getSignatureSettings() const;

    // Encrypt and/or sign the Info dictionary's strings and the XMP metadata stream of doc. A
    // dangling /Info reference is reported as a warning and skipped. Processing stops at the
    // first crypto failure; fields processed before the failure stay modified.
    SCRUB_DLL
    void processMetadata(ScrubDocument& doc);

    SCRUB_DLL
    std::string encryptData(std::string const& data);
    SCRUB_DLL
    std::string encryptData(std::string const& data, scrub_encryption_e algorithm);
    SCRUB_DLL
    std::string decryptData(std::string const& data);
    SCRUB_DLL
    std::string decryptData(std::string const& data, scrub_encryption_e algorithm);
    SCRUB_DLL
    std::string signData(std::string const& data);
    SCRUB_DLL
    bool verifySignature(std::string const& data, std::string const& signature);

    // Signatures computed by the most recent call to processMetadata
    SCRUB_DLL
    std::vector<FieldSignature> const& getLastSignatures() const;
    SCRUB_DLL
    SecurityStats const& getStats() const;

    SCRUB_DLL
    static scrub_encryption_e parseEncryptionAlgorithm(std::string const& name);
    SCRUB_DLL
    static scrub_signature_e parseSignatureAlgorithm(std::string const& name);
    SCRUB_DLL
    static char const* encryptionAlgorithmName(scrub_encryption_e algorithm);
    SCRUB_DLL
    static char const* signatureAlgorithmName(scrub_signature_e algorithm);

  private:
    ScrubSecureMetadataHandler(ScrubSecureMetadataHandler const&) = delete;
    ScrubSecureMetadataHandler& operator=(ScrubSecureMetadataHandler const&) = delete;

    class Members;
    std::unique_ptr<Members> m;
};

#endif // SCRUBSECUREMETADATAHANDLER_HH

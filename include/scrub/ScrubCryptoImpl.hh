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

#ifndef SCRUBCRYPTOIMPL_HH
#define SCRUBCRYPTOIMPL_HH

#include <scrub/Constants.h>
#include <scrub/DLL.h>
#include <string>

// This class is part of scrub's pluggable crypto provider support. Most users won't need to know
// or care about this class, but you can use it if you want to supply your own crypto
// implementation. See also ScrubCryptoProvider.hh.
//
// Failures inside an implementation are reported by throwing std::runtime_error. Callers in the
// library translate these into ScrubExc where a phase is known.
class SCRUB_DLL_CLASS ScrubCryptoImpl
{
  public:
    SCRUB_DLL
    ScrubCryptoImpl() = default;

    SCRUB_DLL
    virtual ~ScrubCryptoImpl() = default;

    // Random Number Generation

    SCRUB_DLL
    virtual void provideRandomData(unsigned char* data, size_t len) = 0;

    // Hashing

    SCRUB_DLL
    virtual void SHA2_init(int bits) = 0;
    SCRUB_DLL
    virtual void SHA2_update(unsigned char const* data, size_t len) = 0;
    SCRUB_DLL
    virtual void SHA2_finalize() = 0;
    SCRUB_DLL
    virtual std::string SHA2_digest() = 0;

    // Key Derivation

    // PBKDF2 with HMAC-SHA256 as the pseudo-random function. Returns exactly key_len bytes.
    SCRUB_DLL
    virtual std::string PBKDF2_derive(
        std::string const& password, std::string const& salt, int iterations, size_t key_len) = 0;

    // Encryption/Decryption

    // out_data = 0 means to encrypt/decrypt in place
    SCRUB_DLL
    virtual void RC4_init(unsigned char const* key_data, int key_len) = 0;
    SCRUB_DLL
    virtual void
    RC4_process(unsigned char const* in_data, size_t len, unsigned char* out_data = 0) = 0;
    SCRUB_DLL
    virtual void RC4_finalize() = 0;

    // key_len is 16, 24, or 32 bytes for AES-128, AES-192, or AES-256
    static size_t constexpr rijndael_buf_size = 16;
    SCRUB_DLL
    virtual void rijndael_init(
        bool encrypt,
        unsigned char const* key_data,
        size_t key_len,
        bool cbc_mode,
        unsigned char* cbc_block) = 0;
    SCRUB_DLL
    virtual void rijndael_process(unsigned char* in_data, unsigned char* out_data) = 0;
    SCRUB_DLL
    virtual void rijndael_finalize() = 0;

    // Signatures

    // Sign data with a PEM-encoded private key. The key type must match the algorithm; for ECDSA
    // the key must be on the P-256 curve. ECDSA signatures are DER-encoded.
    SCRUB_DLL
    virtual std::string signature_sign(
        scrub_signature_e alg, std::string const& private_key_pem, std::string const& data) = 0;

    // Verify a signature using a PEM-encoded X.509 certificate or public key. Returns false if
    // the signature does not match. Throws if the key material can't be used.
    SCRUB_DLL
    virtual bool signature_verify(
        scrub_signature_e alg,
        std::string const& public_pem,
        std::string const& data,
        std::string const& signature) = 0;
};

#endif // SCRUBCRYPTOIMPL_HH

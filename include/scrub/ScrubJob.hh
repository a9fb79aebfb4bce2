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


#ifndef SCRUBJOB_HH
#define SCRUBJOB_HH

#include <scrub/DLL.h>
#include <scrub/ScrubDocument.hh>
#include <scrub/ScrubPattern.hh>
#include <scrub/ScrubPatternScanner.hh>
#include <scrub/ScrubResourceCleaner.hh>
#include <scrub/ScrubSecureMetadataHandler.hh>

#include <memory>
#include <string>
#include <vector>

// ScrubJob runs the sanitization phases over a document in a fixed order: scan, so that traces
// in the original document are recorded, then clean, then secure. Each phase can be turned off.
// The secure phase runs only if encryption or signing has been configured.
//
// Configure a job through the Config object returned by config(). Its methods return a pointer to
// the Config (or to a nested EncConfig or SigConfig) so that calls can be chained:
//
//   ScrubJob j;
//   j.config()
//       ->mergeIdentical(false)
//       ->encryption()
//       ->algorithm("aes-cbc")
//       ->key(passphrase)
//       ->salt(salt)
//       ->endEncryption()
//       ->checkConfiguration();
//   j.run(doc);
//
// Invalid values throw ScrubExc with code scrub_e_configuration as soon as they are given.
// Errors raised while running carry the name of the phase that failed.
class ScrubJob
{
  public:
    class Config;

    class EncConfig
    {
        friend class ScrubJob;
        friend class Config;

      public:
        SCRUB_DLL
        Config* endEncryption();
        // "aes-cbc" or "rc4-drop128"
        SCRUB_DLL
        EncConfig* algorithm(std::string const& parameter);
        SCRUB_DLL
        EncConfig* keyLength(int bits);
        SCRUB_DLL
        EncConfig* key(std::string const& parameter);
        SCRUB_DLL
        EncConfig* salt(std::string const& parameter);
        SCRUB_DLL
        EncConfig* iterations(int count);

      private:
        EncConfig(Config*);
        EncConfig(EncConfig const&) = delete;

        Config* config;
        ScrubSecureMetadataHandler::EncryptionSettings settings;
    };

    class SigConfig
    {
        friend class ScrubJob;
        friend class Config;

      public:
        SCRUB_DLL
        Config* endSignature();
        // "rsa-pkcs1-sha256" or "ecdsa-p256-sha256"
        SCRUB_DLL
        SigConfig* algorithm(std::string const& parameter);
        SCRUB_DLL
        SigConfig* certificate(std::string const& pem);
        SCRUB_DLL
        SigConfig* privateKey(std::string const& pem);

      private:
        SigConfig(Config*);
        SigConfig(SigConfig const&) = delete;

        Config* config;
        ScrubSecureMetadataHandler::SignatureSettings settings;
    };

    class Config
    {
        friend class ScrubJob;

      public:
        // Validate the job as configured so far. This also derives the encryption key, so it
        // may take a noticeable amount of time.
        SCRUB_DLL
        void checkConfiguration();

        SCRUB_DLL
        Config* noScan();
        SCRUB_DLL
        Config* noClean();

        // Cleaning options
        SCRUB_DLL
        Config* removeUnused(bool);
        SCRUB_DLL
        Config* cleanDictionaries(bool);
        SCRUB_DLL
        Config* updateReferences(bool);
        SCRUB_DLL
        Config* mergeIdentical(bool);
        SCRUB_DLL
        Config* removeEmpty(bool);
        SCRUB_DLL
        Config* pageTreeDepth(int);

        // Scanning options
        SCRUB_DLL
        Config* scanEmbeddedFiles(bool);
        SCRUB_DLL
        Config* scanMetadata(bool);
        SCRUB_DLL
        Config* scanJavascript(bool);
        SCRUB_DLL
        Config* scanFormData(bool);
        SCRUB_DLL
        Config* scanAnnotations(bool);
        SCRUB_DLL
        Config* customPattern(ScrubPattern const&);
        SCRUB_DLL
        Config* confidenceThreshold(double);
        SCRUB_DLL
        Config* scanDepth(int);
        SCRUB_DLL
        Config* parallelScanning(bool);
        SCRUB_DLL
        Config* contextSize(size_t);
        SCRUB_DLL
        Config* maxDecodedSize(unsigned long long);

        SCRUB_DLL
        EncConfig* encryption();
        SCRUB_DLL
        SigConfig* signature();

      private:
        Config() = delete;
        Config(Config const&) = delete;
        Config(ScrubJob& job) :
            o(job)
        {
        }
        ScrubJob& o;
    };
    friend class Config;

    SCRUB_DLL
    ScrubJob();
    SCRUB_DLL
    ~ScrubJob();

    SCRUB_DLL
    std::shared_ptr<Config> config();

    SCRUB_DLL
    void checkConfiguration();

    // Register a custom detector for the scan phase. See ScrubPatternScanner.
    SCRUB_DLL
    void registerDetector(std::string const& name, ScrubPatternScanner::detector_fn fn);

    SCRUB_DLL
    void run(ScrubDocument& doc);

    SCRUB_DLL
    ScrubPatternScanner::registry_t const& getMatches() const;
    // Matches at or above the configured confidence threshold
    SCRUB_DLL
    ScrubPatternScanner::registry_t getConfidentMatches() const;
    SCRUB_DLL
    ScrubPatternScanner::ScanningStats const& getScanningStats() const;
    SCRUB_DLL
    ScrubResourceCleaner::CleaningStats const& getCleaningStats() const;
    SCRUB_DLL
    ScrubSecureMetadataHandler::SecurityStats const& getSecurityStats() const;
    SCRUB_DLL
    std::vector<ScrubSecureMetadataHandler::FieldSignature> const& getSignatures() const;

  private:
    ScrubJob(ScrubJob const&) = delete;
    ScrubJob& operator=(ScrubJob const&) = delete;

    class Members
    {
        friend class ScrubJob;

      public:
        SCRUB_DLL
        ~Members();

      private:
        Members();
        Members(Members const&) = delete;

        bool do_scan{true};
        bool do_clean{true};
        ScrubResourceCleaner::CleaningConfig cleaning;
        ScrubPatternScanner::ScanningConfig scanning;
        bool encryption_pending{false};
        ScrubSecureMetadataHandler::EncryptionSettings encryption;
        bool signature_pending{false};
        ScrubSecureMetadataHandler::SignatureSettings signature;
        std::shared_ptr<EncConfig> enc_config;
        std::shared_ptr<SigConfig> sig_config;
        ScrubPatternScanner scanner;
        ScrubResourceCleaner cleaner;
        ScrubSecureMetadataHandler handler;
    };
    std::unique_ptr<Members> m;
};

#endif // SCRUBJOB_HH

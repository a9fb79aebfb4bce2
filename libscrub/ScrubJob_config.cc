#include <scrub/ScrubJob.hh>

#include <scrub/ScrubExc.hh>

#include <algorithm>

namespace
{
    void
    usage(std::string const& message)
    {
        throw ScrubExc(scrub_e_configuration, "configuration", "", message);
    }
} // namespace

void
ScrubJob::Config::checkConfiguration()
{
    o.checkConfiguration();
}

ScrubJob::Config*
ScrubJob::Config::noScan()
{
    o.m->do_scan = false;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::noClean()
{
    o.m->do_clean = false;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::removeUnused(bool val)
{
    o.m->cleaning.remove_unused = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::cleanDictionaries(bool val)
{
    o.m->cleaning.clean_dictionaries = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::updateReferences(bool val)
{
    o.m->cleaning.update_references = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::mergeIdentical(bool val)
{
    o.m->cleaning.merge_identical = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::removeEmpty(bool val)
{
    o.m->cleaning.remove_empty = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::pageTreeDepth(int depth)
{
    if (depth < 1) {
        usage("page tree depth must be at least 1");
    }
    o.m->cleaning.max_depth = depth;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanEmbeddedFiles(bool val)
{
    o.m->scanning.scan_embedded_files = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanMetadata(bool val)
{
    o.m->scanning.scan_metadata = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanJavascript(bool val)
{
    o.m->scanning.scan_javascript = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanFormData(bool val)
{
    o.m->scanning.scan_form_data = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanAnnotations(bool val)
{
    o.m->scanning.scan_annotations = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::customPattern(ScrubPattern const& pattern)
{
    auto p = pattern;
    // Report a bad pattern now rather than when the scan starts.
    try {
        p.compile();
    } catch (ScrubExc& e) {
        usage("invalid custom pattern " + p.getId() + ": " + e.getMessageDetail());
    }
    o.m->scanning.custom_patterns.push_back(p);
    return this;
}

ScrubJob::Config*
ScrubJob::Config::confidenceThreshold(double threshold)
{
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        usage("confidence threshold must be between 0 and 1");
    }
    o.m->scanning.confidence_threshold = threshold;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::scanDepth(int depth)
{
    if (depth < 0) {
        usage("scan depth may not be negative");
    }
    o.m->scanning.max_depth = depth;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::parallelScanning(bool val)
{
    o.m->scanning.parallel_scanning = val;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::contextSize(size_t size)
{
    o.m->scanning.context_size = size;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::maxDecodedSize(unsigned long long size)
{
    if (size == 0) {
        usage("maximum decoded size must be positive");
    }
    o.m->scanning.max_decoded_size = size;
    return this;
}

ScrubJob::EncConfig*
ScrubJob::Config::encryption()
{
    o.m->enc_config = std::shared_ptr<EncConfig>(new EncConfig(this));
    return o.m->enc_config.get();
}

ScrubJob::SigConfig*
ScrubJob::Config::signature()
{
    o.m->sig_config = std::shared_ptr<SigConfig>(new SigConfig(this));
    return o.m->sig_config.get();
}

ScrubJob::EncConfig::EncConfig(Config* c) :
    config(c)
{
}

ScrubJob::Config*
ScrubJob::EncConfig::endEncryption()
{
    if (settings.key.empty()) {
        usage("encryption requires a key");
    }
    if (settings.salt.empty()) {
        usage("encryption requires a salt");
    }
    config->o.m->encryption = settings;
    config->o.m->encryption_pending = true;
    std::fill(settings.key.begin(), settings.key.end(), '\0');
    settings.key.clear();
    return config;
}

ScrubJob::EncConfig*
ScrubJob::EncConfig::algorithm(std::string const& parameter)
{
    settings.algorithm = ScrubSecureMetadataHandler::parseEncryptionAlgorithm(parameter);
    return this;
}

ScrubJob::EncConfig*
ScrubJob::EncConfig::keyLength(int bits)
{
    if (!(bits == 128 || bits == 192 || bits == 256)) {
        usage("encryption key length must be 128, 192, or 256");
    }
    settings.key_length = bits;
    return this;
}

ScrubJob::EncConfig*
ScrubJob::EncConfig::key(std::string const& parameter)
{
    settings.key = parameter;
    return this;
}

ScrubJob::EncConfig*
ScrubJob::EncConfig::salt(std::string const& parameter)
{
    settings.salt = parameter;
    return this;
}

ScrubJob::EncConfig*
ScrubJob::EncConfig::iterations(int count)
{
    if (count < ScrubSecureMetadataHandler::min_iterations) {
        usage(
            "iteration count must be at least " +
            std::to_string(ScrubSecureMetadataHandler::min_iterations));
    }
    settings.iterations = count;
    return this;
}

ScrubJob::SigConfig::SigConfig(Config* c) :
    config(c)
{
}

ScrubJob::Config*
ScrubJob::SigConfig::endSignature()
{
    if (settings.certificate.empty() || settings.private_key.empty()) {
        usage("signing requires a certificate and a private key");
    }
    config->o.m->signature = settings;
    config->o.m->signature_pending = true;
    return config;
}

ScrubJob::SigConfig*
ScrubJob::SigConfig::algorithm(std::string const& parameter)
{
    settings.algorithm = ScrubSecureMetadataHandler::parseSignatureAlgorithm(parameter);
    return this;
}

ScrubJob::SigConfig*
ScrubJob::SigConfig::certificate(std::string const& pem)
{
    settings.certificate = pem;
    return this;
}

ScrubJob::SigConfig*
ScrubJob::SigConfig::privateKey(std::string const& pem)
{
    settings.private_key = pem;
    return this;
}

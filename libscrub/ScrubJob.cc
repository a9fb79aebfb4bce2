#include <scrub/ScrubJob.hh>

#include <scrub/ScrubExc.hh>

#include <algorithm>

ScrubJob::Members::Members() = default;

ScrubJob::Members::~Members()
{
    std::fill(encryption.key.begin(), encryption.key.end(), '\0');
}

ScrubJob::ScrubJob() :
    m(new Members())
{
}

ScrubJob::~ScrubJob() = default;

std::shared_ptr<ScrubJob::Config>
ScrubJob::config()
{
    return std::shared_ptr<Config>(new Config(*this));
}

void
ScrubJob::registerDetector(std::string const& name, ScrubPatternScanner::detector_fn fn)
{
    m->scanner.registerDetector(name, fn);
}

void
ScrubJob::checkConfiguration()
{
    ScrubPatternScanner::checkConfig(m->scanning);
    for (auto p: m->scanning.custom_patterns) {
        p.compile();
    }
    if (m->cleaning.max_depth < 1) {
        throw ScrubExc(
            scrub_e_configuration, "configuration", "", "page tree depth must be at least 1");
    }
    if (m->encryption_pending) {
        m->handler.configureEncryption(m->encryption);
        std::fill(m->encryption.key.begin(), m->encryption.key.end(), '\0');
        m->encryption = ScrubSecureMetadataHandler::EncryptionSettings();
        m->encryption_pending = false;
    }
    if (m->signature_pending) {
        m->handler.configureSignature(m->signature);
        m->signature_pending = false;
    }
}

void
ScrubJob::run(ScrubDocument& doc)
{
    checkConfiguration();
    auto log = doc.getLogger();
    if (m->do_scan) {
        log->debug("job: scan");
        m->scanner.scan(doc, m->scanning);
    }
    if (m->do_clean) {
        log->debug("job: clean");
        m->cleaner.clean(doc, m->cleaning);
    }
    if (m->handler.hasEncryption() || m->handler.hasSignature()) {
        log->debug("job: secure");
        m->handler.processMetadata(doc);
    }
}

ScrubPatternScanner::registry_t const&
ScrubJob::getMatches() const
{
    return m->scanner.getMatches();
}

ScrubPatternScanner::registry_t
ScrubJob::getConfidentMatches() const
{
    return ScrubPatternScanner::filterByConfidence(
        m->scanner.getMatches(), m->scanning.confidence_threshold);
}

ScrubPatternScanner::ScanningStats const&
ScrubJob::getScanningStats() const
{
    return m->scanner.getStats();
}

ScrubResourceCleaner::CleaningStats const&
ScrubJob::getCleaningStats() const
{
    return m->cleaner.getStats();
}

ScrubSecureMetadataHandler::SecurityStats const&
ScrubJob::getSecurityStats() const
{
    return m->handler.getStats();
}

std::vector<ScrubSecureMetadataHandler::FieldSignature> const&
ScrubJob::getSignatures() const
{
    return m->handler.getLastSignatures();
}

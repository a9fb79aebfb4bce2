#include <scrub/ScrubContentHasher.hh>

#include <scrub/Pl_SHA2.hh>

class ScrubContentHasher::Members
{
    friend class ScrubContentHasher;

  public:
    Members() :
        sha2(256)
    {
    }

  private:
    Members(Members const&) = delete;

    void
    writeField(std::string const& value)
    {
        // Length-prefix each field so that adjacent fields cannot run together.
        sha2 << std::to_string(value.size()) << ":" << value;
    }

    Pl_SHA2 sha2;
};

ScrubContentHasher::ScrubContentHasher() :
    m(new Members())
{
}

ScrubContentHasher::~ScrubContentHasher() = default;

std::string
ScrubContentHasher::hash(ScrubObject const& obj)
{
    m->writeField(obj.getTypeName());
    if (obj.hasDictionary()) {
        for (auto const& iter: obj.getDictAsMap()) {
            if (iter.first == "/Name" || iter.first == "/Length") {
                continue;
            }
            m->writeField(iter.first);
            m->writeField(iter.second.unparse());
        }
        if (obj.isStream()) {
            m->writeField(obj.getStreamData());
        }
    } else {
        m->writeField(obj.unparse());
    }
    m->sha2.finish();
    return m->sha2.getHexDigest();
}

std::string
ScrubContentHasher::hashObject(ScrubObject const& obj)
{
    ScrubContentHasher hasher;
    return hasher.hash(obj);
}

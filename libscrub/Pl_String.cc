#include <scrub/Pl_String.hh>

class Pl_String::Members
{
  public:
    Members(std::string& s) :
        s(s)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

    std::string& s;
};

Pl_String::Pl_String(char const* identifier, Pipeline* next, std::string& s) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>(s))
{
}

// Must be explicit and not inline so the Members destructor is emitted here
Pl_String::~Pl_String() = default;

void
Pl_String::write(unsigned char const* buf, size_t len)
{
    if (!len) {
        return;
    }
    m->s.append(reinterpret_cast<char const*>(buf), len);
    if (getNext(true)) {
        getNext()->write(buf, len);
    }
}

void
Pl_String::finish()
{
    if (getNext(true)) {
        getNext()->finish();
    }
}

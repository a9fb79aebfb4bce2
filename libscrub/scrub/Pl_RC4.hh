#ifndef PL_RC4_HH
#define PL_RC4_HH

#include <scrub/Pipeline.hh>

#include <scrub/RC4.hh>

#include <vector>

class Pl_RC4 final: public Pipeline
{
  public:
    static size_t const def_bufsize = 65536;

    Pl_RC4(
        char const* identifier,
        Pipeline* next,
        std::string const& key,
        size_t drop = 0,
        size_t out_bufsize = def_bufsize);
    ~Pl_RC4() final = default;

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

  private:
    std::vector<unsigned char> outbuf;
    size_t out_bufsize;
    RC4 rc4;
};

#endif // PL_RC4_HH

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

#ifndef PL_FLATE_HH
#define PL_FLATE_HH

#include <scrub/Pipeline.hh>
#include <functional>
#include <memory>
#include <string>

// Inflates zlib-compressed (FlateDecode) data. scrub never compresses; this pipeline only exists
// so that compressed streams can be scanned in decoded form.
class SCRUB_DLL_CLASS Pl_Flate: public Pipeline
{
  public:
    static unsigned int const def_bufsize = 65536;

    SCRUB_DLL
    Pl_Flate(char const* identifier, Pipeline* next, unsigned int out_bufsize = def_bufsize);
    SCRUB_DLL
    ~Pl_Flate() override;

    // Limit the number of bytes this pipeline may produce. Exceeding the limit throws
    // std::runtime_error. 0, the default, means unlimited.
    SCRUB_DLL
    void setMemoryLimit(unsigned long long limit);
    SCRUB_DLL
    unsigned long long getMemoryLimit() const;

    SCRUB_DLL
    void write(unsigned char const* data, size_t len) override;
    SCRUB_DLL
    void finish() override;

    // Called with a message and zlib error code for conditions that don't prevent decoding
    SCRUB_DLL
    void setWarnCallback(std::function<void(char const*, int)> callback);

  private:
    SCRUB_DLL_PRIVATE
    void handleData(unsigned char const* data, size_t len, int flush);
    SCRUB_DLL_PRIVATE
    void checkError(char const* prefix, int error_code);
    SCRUB_DLL_PRIVATE
    void warn(char const*, int error_code);

    class SCRUB_DLL_PRIVATE Members
    {
        friend class Pl_Flate;

      public:
        Members(size_t out_bufsize);
        ~Members();

      private:
        Members(Members const&) = delete;

        std::unique_ptr<unsigned char[]> outbuf;
        size_t out_bufsize;
        bool initialized;
        void* zdata;
        unsigned long long written{0};
        unsigned long long memory_limit{0};
        std::function<void(char const*, int)> callback;
    };

    std::unique_ptr<Members> m;
};

#endif // PL_FLATE_HH

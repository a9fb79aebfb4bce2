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

// Generalized byte pipeline. A Pipeline receives bytes through write() and may pass them on,
// possibly transformed, to the next Pipeline. finish() signals that no more data is coming.
// Hashing, encryption, decompression, and logger output in scrub are all written as
// pipelines so they can be chained and redirected freely.
//
// Pipelines are not copyable. The caller owns every pipeline in a chain and must keep each one
// alive for as long as its predecessor may write to it.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <scrub/DLL.h>

#include <memory>
#include <string>

class SCRUB_DLL_CLASS Pipeline
{
  public:
    SCRUB_DLL
    Pipeline(char const* identifier, Pipeline* next);

    SCRUB_DLL
    virtual ~Pipeline() = default;

    // Subclasses should implement write and finish to do their jobs and then, if they are not
    // end-of-line pipelines, call getNext()->write or getNext()->finish.
    SCRUB_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    SCRUB_DLL
    virtual void finish() = 0;
    SCRUB_DLL
    std::string getIdentifier() const;

    // Convenience methods for writing other types of data without casting. The methods that take
    // char const* expect null-terminated C strings and do not write the null terminators.
    SCRUB_DLL
    void writeCStr(char const* cstr);
    SCRUB_DLL
    void writeString(std::string const&);
    // This allows *p << "x" << "y" but is not intended to be a general purpose << compatible
    // with ostream.
    SCRUB_DLL
    Pipeline& operator<<(char const* cstr);
    SCRUB_DLL
    Pipeline& operator<<(std::string const&);
    SCRUB_DLL
    Pipeline& operator<<(int);
    SCRUB_DLL
    Pipeline& operator<<(long);
    SCRUB_DLL
    Pipeline& operator<<(long long);
    SCRUB_DLL
    Pipeline& operator<<(unsigned int);
    SCRUB_DLL
    Pipeline& operator<<(unsigned long);
    SCRUB_DLL
    Pipeline& operator<<(unsigned long long);

    // Overloaded write to reduce casting
    SCRUB_DLL
    void write(char const* data, size_t len);

  protected:
    SCRUB_DLL
    Pipeline* getNext(bool allow_null = false);
    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // PIPELINE_HH

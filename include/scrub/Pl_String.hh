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

// End-of-line or pass-through pipeline that appends everything written to it to a string. The
// string is owned by the caller and must outlive the pipeline. Used to capture logger output and
// cipher text.

#ifndef PL_STRING_HH
#define PL_STRING_HH

#include <scrub/Pipeline.hh>

#include <string>

class SCRUB_DLL_CLASS Pl_String: public Pipeline
{
  public:
    SCRUB_DLL
    Pl_String(char const* identifier, Pipeline* next, std::string& s);
    SCRUB_DLL
    ~Pl_String() override;

    SCRUB_DLL
    void write(unsigned char const* buf, size_t len) override;
    SCRUB_DLL
    void finish() override;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_STRING_HH

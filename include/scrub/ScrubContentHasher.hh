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


#ifndef SCRUBCONTENTHASHER_HH
#define SCRUBCONTENTHASHER_HH

#include <scrub/DLL.h>
#include <scrub/ScrubObject.hh>

#include <memory>
#include <string>

// Compute a SHA-256 digest over the semantically relevant bytes of an object, suitable for
// detecting byte-identical resources. The digest covers the object's type, its dictionary
// entries in sorted key order, and its stream data. The /Name and /Length entries are excluded
// since they differ between otherwise identical resources. References are hashed by object id,
// not by the content of their targets.
//
// A ScrubContentHasher may be reused for any number of objects but must not be shared between
// threads.
class ScrubContentHasher
{
  public:
    SCRUB_DLL
    ScrubContentHasher();
    SCRUB_DLL
    ~ScrubContentHasher();

    // Return the digest as a lowercase hexadecimal string.
    SCRUB_DLL
    std::string hash(ScrubObject const& obj);

    // Convenience function that uses a temporary hasher
    SCRUB_DLL
    static std::string hashObject(ScrubObject const& obj);

  private:
    ScrubContentHasher(ScrubContentHasher const&) = delete;
    ScrubContentHasher& operator=(ScrubContentHasher const&) = delete;

    class Members;
    std::unique_ptr<Members> m;
};

#endif // SCRUBCONTENTHASHER_HH

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

#ifndef SCRUBUTIL_HH
#define SCRUBUTIL_HH

#include <scrub/DLL.h>

#include <cstddef>
#include <string>

namespace ScrubUtil
{
    // Return a string containing the byte representation of the hexadecimal encoded value of
    // input. Lower-case hex digits are used.
    SCRUB_DLL
    std::string hex_encode(std::string const&);

    // Return a string containing the byte representation of hex, which consists of pairs of
    // hexadecimal digits. Non-hex characters are ignored. An odd trailing digit is treated as if
    // followed by 0.
    SCRUB_DLL
    std::string hex_decode(std::string const&);

    // If the environment variable var is set, return true and, if value is not null, store its
    // value there.
    SCRUB_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    // Return true if the string is well-formed UTF-8. Overlong encodings, surrogates, and code
    // points above U+10FFFF are rejected.
    SCRUB_DLL
    bool is_utf8(std::string const&);

    // Fill data with len cryptographically strong random bytes from the default crypto
    // provider.
    SCRUB_DLL
    void initializeWithRandomBytes(unsigned char* data, size_t len);

    SCRUB_DLL
    std::string random_bytes(size_t len);

    // Shannon entropy of the data in bits per byte, between 0 and 8
    SCRUB_DLL
    double shannon_entropy(std::string const&);

    SCRUB_DLL
    unsigned char* unsigned_char_pointer(std::string& s);
    SCRUB_DLL
    unsigned char const* unsigned_char_pointer(std::string const& s);
}; // namespace ScrubUtil

#endif // SCRUBUTIL_HH

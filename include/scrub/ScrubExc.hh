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

#ifndef SCRUBEXC_HH
#define SCRUBEXC_HH

#include <scrub/DLL.h>

#include <scrub/Constants.h>
#include <stdexcept>
#include <string>

class SCRUB_DLL_CLASS ScrubExc: public std::runtime_error
{
  public:
    // phase is the operation that failed: "configuration", "clean", "scan", or "secure". object
    // describes the object involved, such as "7 0 R", and may be empty.
    SCRUB_DLL
    ScrubExc(
        scrub_error_code_e error_code,
        std::string const& phase,
        std::string const& object,
        std::string const& message);

    SCRUB_DLL
    ~ScrubExc() noexcept override = default;

    // To get a complete error string, call what(), provided by std::exception. The accessors
    // below return the original values used to create the exception. Only the error code and
    // message are guaranteed to have non-zero/empty values.
    //
    // There is no lookup code that maps numeric error codes into strings. The numeric error
    // code is just another way to get at the underlying issue, but it is more
    // programmer-friendly than trying to parse a string that is subject to change.

    SCRUB_DLL
    scrub_error_code_e getErrorCode() const;
    SCRUB_DLL
    std::string const& getPhase() const;
    SCRUB_DLL
    std::string const& getObject() const;
    SCRUB_DLL
    std::string const& getMessageDetail() const;

  private:
    SCRUB_DLL_PRIVATE
    static std::string createWhat(
        std::string const& phase, std::string const& object, std::string const& message);

    // This class does not use the Members pattern to avoid needless memory allocations during
    // exception handling.

    scrub_error_code_e error_code;
    std::string phase;
    std::string object;
    std::string message;
};

#endif // SCRUBEXC_HH

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

#ifndef SCRUBLOGGER_HH
#define SCRUBLOGGER_HH

#include <scrub/DLL.h>
#include <scrub/Pipeline.hh>
#include <iostream>
#include <memory>

class ScrubLogger
{
  public:
    SCRUB_DLL
    static std::shared_ptr<ScrubLogger> create();

    // Return the default logger. In general, you should use the default logger. A separate logger
    // is useful when documents are processed on different threads and their output has to be
    // captured separately. (A single ScrubDocument can't be safely used from multiple threads,
    // but separate documents on separate threads are fine.)
    SCRUB_DLL
    static std::shared_ptr<ScrubLogger> defaultLogger();

    // Defaults:
    //
    // info -- standard output
    // warn -- whatever error points to
    // error -- standard error
    //
    // "info" is used for diagnostic and debug messages, "warn" for recoverable conditions such
    // as a skipped dangling reference, and "error" for errors. On deletion, finish() is called
    // for the standard output and standard error pipelines, which flushes output. If you supply
    // any custom pipelines, you must call finish() on them yourself.

    SCRUB_DLL
    void info(char const*);
    SCRUB_DLL
    void info(std::string const&);
    SCRUB_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

    SCRUB_DLL
    void warn(char const*);
    SCRUB_DLL
    void warn(std::string const&);
    SCRUB_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

    SCRUB_DLL
    void error(char const*);
    SCRUB_DLL
    void error(std::string const&);
    SCRUB_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);

    // Debug messages go to info, prefixed with "scrub: ", and only when debugging is enabled.
    // Debugging is initially enabled if the SCRUB_DEBUG environment variable is set.
    SCRUB_DLL
    void debug(std::string const&);
    SCRUB_DLL
    void setDebug(bool);
    SCRUB_DLL
    bool getDebug() const;

    SCRUB_DLL
    std::shared_ptr<Pipeline> standardOutput();
    SCRUB_DLL
    std::shared_ptr<Pipeline> standardError();
    SCRUB_DLL
    std::shared_ptr<Pipeline> discard();

    // Passing a null pointer resets to default
    SCRUB_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    SCRUB_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    SCRUB_DLL
    void setError(std::shared_ptr<Pipeline>);

    // Shortcut for logic to reset output to new output/error streams. out_stream is used for
    // info, err_stream is used for error, and warning is cleared so that it follows error.
    SCRUB_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

  private:
    ScrubLogger();
    std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);

    class Members
    {
        friend class ScrubLogger;

      public:
        SCRUB_DLL
        ~Members();

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<Pipeline> p_discard;
        std::shared_ptr<Pipeline> p_stdout;
        std::shared_ptr<Pipeline> p_stderr;
        std::shared_ptr<Pipeline> p_info;
        std::shared_ptr<Pipeline> p_warn;
        std::shared_ptr<Pipeline> p_error;
        bool debug;
    };
    std::shared_ptr<Members> m;
};

#endif // SCRUBLOGGER_HH

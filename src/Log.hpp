// Verbosity-gated logging to an output and an error stream.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace treedupes
{

/// Line oriented logger.
/// Informational lines go to out when the verbosity level is high enough,
/// warnings and errors always go to err. Lines from different threads never interleave.
class Log
{
public:
    explicit Log(unsigned verbose_ = 0, std::ostream& out_ = std::cout, std::ostream& err_ = std::cerr)
        : verbose(verbose_), out(out_), err(err_) {}

    /// Print msg if the verbosity is at least level.
    void info(const std::string& msg, unsigned level = 1);

    /// Print "Warning: msg".
    void warning(const std::string& msg);

    /// Print "Error: msg".
    void error(const std::string& msg);

    /// Write text unconditionally to the output stream, without appending a newline.
    /// Used for the progress line, which rewrites itself with a carriage return.
    void write(const std::string& text);

    unsigned getVerbose() const { return verbose; }

    /// Number of warnings and errors printed so far.
    size_t getNumWarnings() const;

private:
    unsigned verbose;
    std::ostream& out;
    std::ostream& err;
    mutable std::mutex mutex;
    size_t numWarnings = 0;
};

} // namespace treedupes

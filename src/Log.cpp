// Verbosity-gated logging to an output and an error stream.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Log.hpp"

namespace treedupes
{

void Log::info(const std::string& msg, unsigned level)
{
    if (verbose < level)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    out << msg << "\n" << std::flush;
}

void Log::warning(const std::string& msg)
{
    std::lock_guard<std::mutex> lock(mutex);
    numWarnings++;
    err << "Warning: " << msg << "\n" << std::flush;
}

void Log::error(const std::string& msg)
{
    std::lock_guard<std::mutex> lock(mutex);
    numWarnings++;
    err << "Error: " << msg << "\n" << std::flush;
}

void Log::write(const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex);
    out << text << std::flush;
}

size_t Log::getNumWarnings() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return numWarnings;
}

} // namespace treedupes

// Sequential, deterministic directory tree traversal.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Channel.hpp"
#include "Log.hpp"
#include "ScanTypes.hpp"
#include <stop_token>

namespace treedupes
{

/// Walk a directory tree in a single thread.
/// Regular files are sent to the file channel (after incrementing filesFound),
/// directories other than the root are sent to the directory channel.
/// Entries of one directory are visited in lexical order, a directory is sent before its contents.
/// Symlinks are neither followed nor reported.
class TreeWalker
{
public:
    TreeWalker(fs::path root_, ScanCounters& counters_, Log& log_)
        : root(std::move(root_)), counters(counters_), log(log_) {}

    /// Walk the whole tree.
    /// Closes filePaths and dirPaths before returning, whatever the outcome.
    /// Unreadable subdirectories are skipped with a warning.
    /// A missing or unreadable root yields a failed outcome, a stop request a cancelled outcome.
    Outcome walk(Channel<fs::path>& filePaths, Channel<fs::path>& dirPaths, std::stop_token stopToken);

    /// Walk the whole tree, then publish the outcome on outcomeChannel and close it.
    void run(Channel<fs::path>& filePaths, Channel<fs::path>& dirPaths, Channel<Outcome>& outcomeChannel, std::stop_token stopToken);

private:
    enum class Step
    {
        Continue,
        Stop
    };

    /// Visit all entries of dirPath, recursing into subdirectories.
    Step walkDir(const fs::path& dirPath, Channel<fs::path>& filePaths, Channel<fs::path>& dirPaths, std::stop_token stopToken);

    /// Read and sort the entries of one directory.
    bool listDir(const fs::path& dirPath, std::vector<fs::directory_entry>& entries);

    fs::path root;
    ScanCounters& counters;
    Log& log;
};

} // namespace treedupes

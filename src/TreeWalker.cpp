// Sequential, deterministic directory tree traversal.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "TreeWalker.hpp"
#include "MiscUtils.hpp"
#include <algorithm>
#include <system_error>

namespace treedupes
{

Outcome TreeWalker::walk(Channel<fs::path>& filePaths, Channel<fs::path>& dirPaths, std::stop_token stopToken)
{
    Outcome outcome;
    std::error_code ec;
    if (stopToken.stop_requested())
    {
        outcome = Outcome::cancelled();
    }
    else if (!fs::exists(root, ec))
    {
        if (ec)
        {
            outcome = Outcome::failed("Error accessing " + root.string() + ": " + ec.message());
        }
        else
        {
            outcome = Outcome::failed("Path '" + root.string() + "' does not exist.");
        }
    }
    else if (!fs::is_directory(root, ec))
    {
        outcome = Outcome::failed("Path '" + root.string() + "' is not a directory.");
    }
    else
    {
        fs::directory_iterator rootIt(root, ec);
        if (ec)
        {
            outcome = Outcome::failed("Error while reading directory " + root.string() + ": " + ec.message());
        }
        else if (walkDir(root, filePaths, dirPaths, stopToken) == Step::Stop)
        {
            outcome = Outcome::cancelled();
        }
    }
    filePaths.close();
    dirPaths.close();
    return outcome;
}

void TreeWalker::run(Channel<fs::path>& filePaths, Channel<fs::path>& dirPaths, Channel<Outcome>& outcomeChannel, std::stop_token stopToken)
{
    Outcome outcome = walk(filePaths, dirPaths, stopToken);
    if (!outcome.isOk())
    {
        log.info("Walk of " + root.string() + " ended: " + outcome.message);
    }
    // The outcome channel holds one item and is written exactly once, so this send never blocks.
    if (!outcomeChannel.send(std::move(outcome), std::stop_token()))
    {
        log.error("Failed to publish walk outcome for " + root.string());
    }
    outcomeChannel.close();
}

TreeWalker::Step TreeWalker::walkDir(const fs::path& dirPath, Channel<fs::path>& filePaths, Channel<fs::path>& dirPaths, std::stop_token stopToken)
{
    std::vector<fs::directory_entry> entries;
    if (!listDir(dirPath, entries))
    {
        return Step::Continue;
    }

    for (const auto& entry : entries)
    {
        bool isDir = false;
        bool isRegular = false;
        try
        {
            auto type = ut1::getFileType(entry, false);
            isDir = (type == ut1::FT_DIR);
            isRegular = (type == ut1::FT_REGULAR);
        }
        catch (const std::exception& e)
        {
            log.warning("Error accessing " + entry.path().string() + ": " + e.what());
            continue;
        }

        if (isDir)
        {
            if (stopToken.stop_requested() || !dirPaths.send(entry.path(), stopToken))
            {
                return Step::Stop;
            }
            if (walkDir(entry.path(), filePaths, dirPaths, stopToken) == Step::Stop)
            {
                return Step::Stop;
            }
        }
        else if (isRegular)
        {
            if (stopToken.stop_requested())
            {
                return Step::Stop;
            }
            counters.filesFound++;
            if (!filePaths.send(entry.path(), stopToken))
            {
                return Step::Stop;
            }
        }
    }
    return Step::Continue;
}

bool TreeWalker::listDir(const fs::path& dirPath, std::vector<fs::directory_entry>& entries)
{
    std::error_code ec;
    fs::directory_iterator it(dirPath, ec);
    if (ec)
    {
        log.warning("Error accessing " + dirPath.string() + ": " + ec.message() + ", skipping.");
        return false;
    }
    fs::directory_iterator end;
    while (it != end)
    {
        entries.push_back(*it);
        it.increment(ec);
        if (ec)
        {
            log.warning("Error while reading directory " + dirPath.string() + ": " + ec.message());
            break;
        }
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b)
    {
        return a.path().filename() < b.path().filename();
    });
    return true;
}

} // namespace treedupes

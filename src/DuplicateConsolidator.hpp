// Replace duplicate files by hardlinks to one original per digest group.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "Log.hpp"
#include "ScanTypes.hpp"
#include <system_error>

namespace treedupes
{

class DuplicateConsolidator
{
public:
    /// State of one duplicate candidate.
    /// Unchecked -> AlreadyLinked | NeedsLink -> Removed -> Linked | RemovedButLinkFailed.
    /// Skipped is reached on any failure before the candidate was removed.
    enum class LinkState
    {
        Unchecked,
        AlreadyLinked,
        NeedsLink,
        Removed,
        Linked,
        RemovedButLinkFailed,
        Skipped
    };

    struct Stats
    {
        uint64_t replacedFiles{};
        uint64_t alreadyLinked{};
        uint64_t skipped{};
        uint64_t dataLossRisks{};
        uint64_t reclaimedBytes{};
    };

    static constexpr uint64_t kDefaultMaxHardlinks = 60000;

    explicit DuplicateConsolidator(Log& log_, uint64_t maxHardlinks_ = kDefaultMaxHardlinks)
        : log(log_), maxHardlinks(maxHardlinks_) {}

    virtual ~DuplicateConsolidator() = default;

    /// For each group, hardlink every path after the first one to the first one.
    /// Failures are logged and skip only the affected candidate (or group).
    /// Once the original has maxHardlinks links the remaining candidates of the group
    /// are skipped, except those that already are links to it.
    /// Running this twice on the same tree replaces nothing the second time.
    Stats consolidate(const DigestGroups& groups);

    /// Replace candidate by a hardlink to original, unless both already are the same file.
    /// Returns the terminal state reached.
    LinkState consolidateCandidate(const fs::path& original, const fs::path& candidate);

    const Stats& getStats() const { return stats; }

protected:
    /// Filesystem primitives used to replace a candidate.
    virtual void createHardLink(const fs::path& target, const fs::path& link, std::error_code& ec);
    virtual void renameFile(const fs::path& from, const fs::path& to, std::error_code& ec);
    virtual void removeFile(const fs::path& path, std::error_code& ec);

private:
    /// Find an unused temporary name next to target.
    static bool getTempPath(const fs::path& target, fs::path& temp);

    Log& log;
    uint64_t maxHardlinks;
    Stats stats;
};

} // namespace treedupes

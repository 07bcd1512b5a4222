// Replace duplicate files by hardlinks to one original per digest group.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "DuplicateConsolidator.hpp"
#include "MiscUtils.hpp"
#include <system_error>

namespace treedupes
{

DuplicateConsolidator::Stats DuplicateConsolidator::consolidate(const DigestGroups& groups)
{
    stats = Stats();
    for (const auto& [hex, paths] : groups)
    {
        if (paths.size() < 2)
        {
            continue;
        }
        const fs::path& original = paths.front();
        bool groupBlocked = false;
        for (size_t i = 1; i < paths.size(); i++)
        {
            const fs::path& candidate = paths[i];

            // Existing links count as done even when the original reached the link limit.
            std::error_code ec;
            if (fs::equivalent(original, candidate, ec))
            {
                log.info("Skipping already linked file " + candidate.string());
                stats.alreadyLinked++;
                continue;
            }
            if (groupBlocked)
            {
                stats.skipped++;
                continue;
            }

            ec.clear();
            uint64_t linkCount = fs::hard_link_count(original, ec);
            if (ec)
            {
                log.warning("Failed to read hardlink count for " + original.string() + ": " + ec.message());
                groupBlocked = true;
                stats.skipped++;
                continue;
            }
            if (linkCount >= maxHardlinks)
            {
                log.warning(original.string() + " has " + ut1::toStr(linkCount) + " hardlinks (>= " + ut1::toStr(maxHardlinks) + "), skipping.");
                groupBlocked = true;
                stats.skipped++;
                continue;
            }

            uint64_t size = fs::file_size(candidate, ec);
            if (ec)
            {
                size = 0;
            }
            switch (consolidateCandidate(original, candidate))
            {
                case LinkState::Linked:
                    stats.replacedFiles++;
                    stats.reclaimedBytes += size;
                    break;
                case LinkState::AlreadyLinked:
                    stats.alreadyLinked++;
                    break;
                case LinkState::RemovedButLinkFailed:
                    stats.dataLossRisks++;
                    break;
                default:
                    stats.skipped++;
                    break;
            }
        }
    }
    return stats;
}

DuplicateConsolidator::LinkState DuplicateConsolidator::consolidateCandidate(const fs::path& original, const fs::path& candidate)
{
    std::error_code ec;
    if (!fs::is_regular_file(fs::symlink_status(candidate, ec)))
    {
        log.warning(candidate.string() + " is no longer a regular file, skipping.");
        return LinkState::Skipped;
    }
    bool sameFile = fs::equivalent(original, candidate, ec);
    if (ec)
    {
        log.warning("Could not check hardlink status of " + candidate.string() + ": " + ec.message());
        return LinkState::Skipped;
    }
    if (sameFile)
    {
        log.info("Skipping already linked file " + candidate.string());
        return LinkState::AlreadyLinked;
    }

    // NeedsLink: link the original to a temporary name first, then rename it over the candidate.
    // The rename removes the candidate and puts the link in place in one step.
    fs::path temp;
    if (!getTempPath(candidate, temp))
    {
        log.warning("No temporary path available for " + candidate.string());
        return LinkState::Skipped;
    }
    createHardLink(original, temp, ec);
    if (ec)
    {
        log.warning("Failed to create hardlink from " + original.string() + " to " + candidate.string() + ": " + ec.message());
        return LinkState::Skipped;
    }
    renameFile(temp, candidate, ec);
    if (!ec)
    {
        log.info("Hardlinked " + candidate.string() + " -> " + original.string());
        return LinkState::Linked;
    }

    // Rename refused to replace the candidate: remove it explicitly and retry.
    std::error_code rmEc;
    removeFile(candidate, rmEc);
    if (rmEc)
    {
        std::error_code tempEc;
        fs::remove(temp, tempEc);
        log.warning("Failed to remove duplicate file " + candidate.string() + ": " + rmEc.message());
        return LinkState::Skipped;
    }
    renameFile(temp, candidate, ec);
    if (ec)
    {
        log.error("Removed " + candidate.string() + " but failed to link it to " + original.string() + ": " + ec.message()
                  + ". Its content is still available as " + temp.string() + ".");
        return LinkState::RemovedButLinkFailed;
    }
    log.info("Hardlinked " + candidate.string() + " -> " + original.string());
    return LinkState::Linked;
}

void DuplicateConsolidator::createHardLink(const fs::path& target, const fs::path& link, std::error_code& ec)
{
    fs::create_hard_link(target, link, ec);
}

void DuplicateConsolidator::renameFile(const fs::path& from, const fs::path& to, std::error_code& ec)
{
    fs::rename(from, to, ec);
}

void DuplicateConsolidator::removeFile(const fs::path& path, std::error_code& ec)
{
    fs::remove(path, ec);
}

bool DuplicateConsolidator::getTempPath(const fs::path& target, fs::path& temp)
{
    std::error_code ec;
    for (int i = 0; i < 100; i++)
    {
        temp = target;
        temp += ".treedupes_link_tmp";
        if (i > 0)
        {
            temp += ut1::toStr(i);
        }
        if (!fs::exists(fs::symlink_status(temp, ec)))
        {
            return true;
        }
    }
    return false;
}

} // namespace treedupes

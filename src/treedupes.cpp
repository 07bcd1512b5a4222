// treedupes - Find duplicate files in directory trees
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "MiscUtils.hpp"
#include "CommandLineParser.hpp"
#include "Digest.hpp"
#include "DuplicateConsolidator.hpp"
#include "Log.hpp"
#include "ProgressTracker.hpp"
#include "Report.hpp"
#include "ScanPipeline.hpp"
#include "SignalWatcher.hpp"
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <exception>
#include <iostream>
#include <mutex>
#include <stop_token>
#include <thread>

using namespace treedupes;

static unsigned clVerbose = 0;

static constexpr int kExitCancelled = 130;

/// Cancel the scan after the given number of seconds.
static void watchTimeout(std::stop_token stopToken, unsigned seconds, std::stop_source scanStop, Log& log)
{
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stopToken, std::chrono::seconds(seconds), [] { return false; });
    if (!stopToken.stop_requested())
    {
        log.warning("Timeout of " + ut1::toStr(seconds) + "s reached, cancelling.");
        scanStop.request_stop();
    }
}

/// Main.
/// Entry point for treedupes.
int main(int argc, char *argv[])
{
    // Command line options.
    const char *usage = "Find duplicate files in a directory tree by content digest and optionally replace them by hardlinks.\n"
                        "\n"
                        "Usage: $programName [OPTIONS] [DIR]\n"
                        "\n"
                        "DIR defaults to the current directory. All sizes may be specified with kMGTPE suffixes indicating powers of 1024.";
    ut1::CommandLineParser cl("treedupes", usage,
        "\n$programName version $version *** Copyright (c) 2026 Johannes Overmann",
        "0.1.0");

    unsigned hardwareThreads = std::thread::hardware_concurrency();
    if (hardwareThreads == 0)
    {
        hardwareThreads = 1;
    }

    cl.addHeader("\nOptions:\n");
    cl.addOption('a', "algo", "Hashing algorithm to use (xxh3, sha256 or md5).", "NAME", "xxh3");
    cl.addOption('j', "workers", "Number of concurrent hashing workers.", "N", ut1::toStr(hardwareThreads));
    cl.addOption('q', "queue-size", "Capacity of the queues between walker, workers and aggregator.", "N", "64");
    cl.addOption(' ', "bufsize", "Buffer size for reading files while hashing.", "N", "1M");
    cl.addOption(' ', "hardlink", "Replace duplicate files with hardlinks to the first file of each group.");
    cl.addOption('d', "dry-run", "Show which files --hardlink would replace, but do not modify files.");
    cl.addOption(' ', "max-hardlinks", "Maximum allowed hardlink count for the original file (with --hardlink).", "N", "60000");
    cl.addOption('t', "timeout", "Cancel the scan after N seconds (0 = no timeout).", "N", "0");
    cl.addOption('l', "list-dirs", "Also list all directories found below DIR.");
    cl.addOption('p', "progress", "Print progress once per second. Specify twice to print one line per update.");
    cl.addOption('W', "width", "Max width for progress line.", "N", "199");
    cl.addOption('v', "verbose", "Increase verbosity. Specify multiple times to be more verbose.");

    // Parse command line options.
    cl.parse(argc, argv);
    clVerbose = cl.getCount("verbose");
    Log log(clVerbose);

    try
    {
        ScanOptions options;
        options.numWorkers = cl.getUInt("workers");
        options.queueSize = cl.getUInt("queue-size");
        uint64_t bufSize = ut1::strToU64(cl.getStr("bufsize"));
        if (options.numWorkers < 1)
        {
            cl.error("Number of workers must be at least 1.");
        }
        if (options.queueSize < 1)
        {
            cl.error("--queue-size must be at least 1.");
        }
        if (bufSize == 0)
        {
            cl.error("--bufsize must be greater than 0.");
        }
        if (cl("dry-run") && !cl("hardlink"))
        {
            cl.error("--dry-run requires --hardlink.");
        }
        if (cl.getArgs().size() > 1)
        {
            cl.error("Please specify at most one directory.");
        }

        DigestAlgorithm algorithm = DigestAlgorithm::Xxh3;
        try
        {
            algorithm = parseDigestAlgorithm(cl.getStr("algo"));
        }
        catch (const std::invalid_argument& e)
        {
            cl.error(e.what());
        }
        DigestFunction digestFunction = makeDigestFunction(algorithm, static_cast<size_t>(bufSize));

        fs::path root;
        if (cl.getArgs().empty())
        {
            root = fs::current_path();
            log.info("No directory specified, using current directory: " + root.string());
        }
        else
        {
            root = cl.getArgs()[0];
            if (!ut1::fsExists(root))
            {
                cl.error("Path '" + root.string() + "' does not exist.");
            }
            if (!ut1::fsIsDirectory(root.string()))
            {
                cl.error("Path '" + root.string() + "' is not a directory.");
            }
        }
        log.info("Using " + getDigestAlgorithmName(algorithm) + " with " + ut1::toStr(options.numWorkers) + " hashing workers.");

        // Created before any other thread, so that signals reach the watcher thread only.
        std::stop_source scanStop;
        SignalWatcher signalWatcher({SIGINT, SIGTERM}, scanStop, log);
        signalWatcher.start();
        std::jthread timeoutWatcher;
        unsigned timeout = cl.getUInt("timeout");
        if (timeout > 0)
        {
            timeoutWatcher = std::jthread([&log, timeout, scanStop](std::stop_token stopToken) { watchTimeout(stopToken, timeout, scanStop, log); });
        }

        ScanCounters counters;
        unsigned progressCount = cl.getCount("progress");
        ProgressTracker progress(counters, log, cl.getUInt("width"), progressCount > 1);
        if (progressCount > 0)
        {
            progress.start();
        }

        double start = ut1::getTimeSec();
        ScanResult result = runScan(root, digestFunction, options, counters, scanStop.get_token(), log);
        double elapsed = ut1::getTimeSec() - start;
        if (progressCount > 0)
        {
            progress.finish();
        }
        // From here on Ctrl+C terminates immediately, also during consolidation.
        signalWatcher.stop();
        timeoutWatcher.request_stop();

        if (result.outcome.isCancelled())
        {
            log.warning("Operation cancelled, results are partial.");
            printStatList(getScanStats(result, counters, elapsed));
            return kExitCancelled;
        }
        if (result.outcome.isFailed())
        {
            std::cerr << "Error: File scanning/hashing failed: " << result.outcome.message << "\n";
            return 1;
        }

        printDuplicates(result.duplicates);
        if (cl("list-dirs"))
        {
            std::cout << "\ndirs:\n";
            printDirectories(result.directories);
        }
        std::cout << "\n";
        printStatList(getScanStats(result, counters, elapsed));

        if (cl("hardlink"))
        {
            if (cl("dry-run"))
            {
                std::cout << "\n";
                printDryRun(result.duplicates);
            }
            else
            {
                DuplicateConsolidator consolidator(log, ut1::strToU64(cl.getStr("max-hardlinks")));
                DuplicateConsolidator::Stats stats = consolidator.consolidate(result.duplicates);
                std::cout << "\nhardlink:\n";
                printStatList(getConsolidationStats(stats));
            }
        }

        if (clVerbose)
        {
            std::cout << "Done.\n";
        }
    }
    catch (const std::exception& e)
    {
        cl.error(e.what());
    }

    return 0;
}

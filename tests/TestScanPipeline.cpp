// Tests for the complete scan pipeline on real directory trees.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ScanPipeline.hpp"
#include "MiscUtils.hpp"
#include "TempTree.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <sstream>
#include <stdexcept>

using namespace treedupes;
using treedupes::test::TempTree;

namespace
{

class ScanPipelineTest : public ::testing::Test
{
protected:
    ScanResult scan(const DigestFunction& digestFunction, size_t numWorkers, std::stop_token stopToken = std::stop_token())
    {
        ScanOptions options;
        options.numWorkers = numWorkers;
        options.queueSize = 4;
        return runScan(tree.path(), digestFunction, options, counters, stopToken, log);
    }

    /// Two copies of "alpha" (one in a subdir) and one "beta".
    void writeAlphaBeta()
    {
        tree.write("a.txt", "alpha");
        tree.write("b.txt", "beta");
        tree.write("sub/c.txt", "alpha");
    }

    TempTree tree;
    std::ostringstream out;
    std::ostringstream err;
    Log log{0, out, err};
    ScanCounters counters;
    DigestFunction sha256 = makeDigestFunction(DigestAlgorithm::Sha256);
};

/// Digest function failing for one specific file name.
DigestFunction failingFor(const std::string& name, DigestFunction inner)
{
    return [name, inner](const fs::path& path)
    {
        if (path.filename() == name)
        {
            throw std::runtime_error("simulated read error");
        }
        return inner(path);
    };
}

} // namespace

TEST_F(ScanPipelineTest, FindsDuplicatesWithManyWorkers)
{
    writeAlphaBeta();
    ScanResult result = scan(sha256, 4);

    EXPECT_TRUE(result.outcome.isOk());
    EXPECT_EQ(counters.filesFound.load(), 3u);
    EXPECT_EQ(counters.filesHashed.load(), 3u);
    ASSERT_EQ(result.duplicates.size(), 1u);
    const std::vector<fs::path>& group = result.duplicates.begin()->second;
    EXPECT_EQ(result.duplicates.begin()->first, toHex(calcHash<HashSha256>("alpha")));
    std::vector<fs::path> sorted = group;
    std::sort(sorted.begin(), sorted.end());
    std::vector<fs::path> expected = {tree.path() / "a.txt", tree.path() / "sub/c.txt"};
    EXPECT_EQ(sorted, expected);
    EXPECT_EQ(result.uniqueDigests, 2u);
    std::vector<fs::path> expectedDirs = {tree.path() / "sub"};
    EXPECT_EQ(result.directories, expectedDirs);
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(ScanPipelineTest, SingleWorkerKeepsWalkOrder)
{
    writeAlphaBeta();
    ScanResult result = scan(sha256, 1);

    ASSERT_EQ(result.duplicates.size(), 1u);
    std::vector<fs::path> expected = {tree.path() / "a.txt", tree.path() / "sub/c.txt"};
    EXPECT_EQ(result.duplicates.begin()->second, expected);
}

TEST_F(ScanPipelineTest, PathDigestsMatchFileContents)
{
    writeAlphaBeta();
    tree.write("sub/deep/d.txt", "gamma");
    ScanResult result = scan(sha256, 3);

    ASSERT_EQ(result.pathDigests.size(), 4u);
    for (const auto& [path, digest] : result.pathDigests)
    {
        EXPECT_EQ(digest, calcHash<HashSha256>(ut1::readFile(path))) << path;
    }
}

TEST_F(ScanPipelineTest, UnreadableSubdirIsSkipped)
{
    tree.write("outside.txt", "x");
    tree.write("locked/inside.txt", "x");
    if (!tree.lockDir("locked"))
    {
        // Root bypasses directory permissions, so this path is only covered when the
        // suite runs as a regular user.
        GTEST_SKIP() << "Directory permissions are not enforced for this user.";
    }
    ScanResult result = scan(sha256, 2);

    EXPECT_TRUE(result.outcome.isOk());
    EXPECT_EQ(counters.filesFound.load(), 1u);
    EXPECT_EQ(counters.filesHashed.load(), 1u);
    EXPECT_TRUE(result.duplicates.empty());
}

TEST_F(ScanPipelineTest, HashFailureExcludesOnlyCopy)
{
    tree.write("a", "alpha");
    tree.write("b", "alpha");
    tree.write("c", "beta");
    ScanResult result = scan(failingFor("b", sha256), 2);

    EXPECT_TRUE(result.outcome.isOk());
    EXPECT_EQ(counters.filesFound.load(), 3u);
    EXPECT_EQ(counters.filesHashed.load(), 2u);
    EXPECT_TRUE(result.duplicates.empty());
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].path, tree.path() / "b");
    EXPECT_NE(err.str().find("simulated read error"), std::string::npos);
}

TEST_F(ScanPipelineTest, HashFailureKeepsRemainingPair)
{
    tree.write("a", "alpha");
    tree.write("b", "alpha");
    tree.write("c", "alpha");
    ScanResult result = scan(failingFor("b", sha256), 2);

    EXPECT_EQ(counters.filesHashed.load(), 2u);
    ASSERT_EQ(result.duplicates.size(), 1u);
    EXPECT_EQ(result.duplicates.begin()->second.size(), 2u);
}

TEST_F(ScanPipelineTest, AlreadyCancelled)
{
    writeAlphaBeta();
    std::stop_source stopSource;
    stopSource.request_stop();
    ScanResult result = scan(sha256, 2, stopSource.get_token());

    EXPECT_TRUE(result.outcome.isCancelled());
    EXPECT_EQ(counters.filesHashed.load(), 0u);
    EXPECT_TRUE(result.duplicates.empty());
}

TEST_F(ScanPipelineTest, CancelDuringScan)
{
    for (int i = 0; i < 50; i++)
    {
        tree.write("f" + ut1::toStr(i), "same");
    }
    std::stop_source stopSource;
    std::atomic<int> calls{0};
    DigestFunction stopAfterFirst = [&](const fs::path& path)
    {
        if (++calls == 1)
        {
            stopSource.request_stop();
        }
        return sha256(path);
    };
    ScanResult result = scan(stopAfterFirst, 2, stopSource.get_token());

    EXPECT_TRUE(result.outcome.isCancelled());
    EXPECT_LT(counters.filesFound.load(), 50u);
    EXPECT_LE(counters.filesHashed.load(), counters.filesFound.load());
}

TEST_F(ScanPipelineTest, InvalidConfigurationThrows)
{
    EXPECT_THROW(scan(DigestFunction(), 1), std::invalid_argument);
    EXPECT_THROW(scan(sha256, 0), std::invalid_argument);
    ScanOptions options;
    options.queueSize = 0;
    EXPECT_THROW(runScan(tree.path(), sha256, options, counters, std::stop_token(), log), std::invalid_argument);
}

TEST_F(ScanPipelineTest, MissingRootFails)
{
    ScanOptions options;
    ScanResult result = runScan(tree.path() / "missing", sha256, options, counters, std::stop_token(), log);
    EXPECT_TRUE(result.outcome.isFailed());
    EXPECT_NE(result.outcome.message.find("does not exist"), std::string::npos);
    EXPECT_EQ(counters.filesFound.load(), 0u);
}

TEST_F(ScanPipelineTest, EmptyTree)
{
    ScanResult result = scan(makeDigestFunction(DigestAlgorithm::Xxh3), 4);
    EXPECT_TRUE(result.outcome.isOk());
    EXPECT_EQ(counters.filesFound.load(), 0u);
    EXPECT_TRUE(result.duplicates.empty());
    EXPECT_TRUE(result.directories.empty());
}

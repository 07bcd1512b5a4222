// Unit tests for TreeWalker.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "TreeWalker.hpp"
#include "TempTree.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using namespace treedupes;
using treedupes::test::TempTree;

namespace
{

/// Drain a closed channel into a vector.
std::vector<fs::path> drainAll(Channel<fs::path>& channel)
{
    std::vector<fs::path> r;
    while (std::optional<fs::path> path = channel.receive(std::stop_token()))
    {
        r.push_back(*path);
    }
    return r;
}

class TreeWalkerTest : public ::testing::Test
{
protected:
    TempTree tree;
    std::ostringstream out;
    std::ostringstream err;
    Log log{0, out, err};
    ScanCounters counters;
    Channel<fs::path> files{1000};
    Channel<fs::path> dirs{1000};
};

} // namespace

TEST_F(TreeWalkerTest, LexicalPreOrder)
{
    tree.write("b.txt", "b");
    tree.write("a.txt", "a");
    tree.write("sub/c.txt", "c");
    tree.write("sub/a.txt", "a");
    tree.mkdir("z");
    tree.mkdir("sub/deeper");

    TreeWalker walker(tree.path(), counters, log);
    Outcome outcome = walker.walk(files, dirs, std::stop_token());

    EXPECT_TRUE(outcome.isOk());
    EXPECT_TRUE(files.isClosed());
    EXPECT_TRUE(dirs.isClosed());
    std::vector<fs::path> expectedFiles = {
        tree.path() / "a.txt",
        tree.path() / "b.txt",
        tree.path() / "sub/a.txt",
        tree.path() / "sub/c.txt"
    };
    std::vector<fs::path> expectedDirs = {
        tree.path() / "sub",
        tree.path() / "sub/deeper",
        tree.path() / "z"
    };
    EXPECT_EQ(drainAll(files), expectedFiles);
    EXPECT_EQ(drainAll(dirs), expectedDirs);
    EXPECT_EQ(counters.filesFound.load(), 4u);
    EXPECT_EQ(counters.filesHashed.load(), 0u);
}

TEST_F(TreeWalkerTest, SymlinksAreIgnored)
{
    fs::path target = tree.write("a.txt", "a");
    fs::path dir = tree.mkdir("dir");
    tree.write("dir/inner.txt", "inner");
    fs::create_symlink(target, tree.path() / "link.txt");
    fs::create_directory_symlink(dir, tree.path() / "linkdir");

    TreeWalker walker(tree.path(), counters, log);
    EXPECT_TRUE(walker.walk(files, dirs, std::stop_token()).isOk());

    std::vector<fs::path> expectedFiles = {tree.path() / "a.txt", tree.path() / "dir/inner.txt"};
    std::vector<fs::path> expectedDirs = {tree.path() / "dir"};
    EXPECT_EQ(drainAll(files), expectedFiles);
    EXPECT_EQ(drainAll(dirs), expectedDirs);
    EXPECT_EQ(counters.filesFound.load(), 2u);
}

TEST_F(TreeWalkerTest, MissingRootFails)
{
    TreeWalker walker(tree.path() / "nonexistent", counters, log);
    Outcome outcome = walker.walk(files, dirs, std::stop_token());
    EXPECT_TRUE(outcome.isFailed());
    EXPECT_NE(outcome.message.find("does not exist"), std::string::npos);
    EXPECT_TRUE(files.isClosed());
    EXPECT_TRUE(dirs.isClosed());
}

TEST_F(TreeWalkerTest, InaccessibleRootReportsError)
{
    // A name component longer than NAME_MAX makes stat() fail with ENAMETOOLONG, also for root.
    TreeWalker walker(tree.path() / std::string(300, 'x'), counters, log);
    Outcome outcome = walker.walk(files, dirs, std::stop_token());
    EXPECT_TRUE(outcome.isFailed());
    EXPECT_EQ(outcome.message.find("does not exist"), std::string::npos);
    EXPECT_NE(outcome.message.find("Error accessing"), std::string::npos);
    EXPECT_TRUE(files.isClosed());
    EXPECT_TRUE(dirs.isClosed());
}

TEST_F(TreeWalkerTest, RootIsFileFails)
{
    fs::path file = tree.write("file", "x");
    TreeWalker walker(file, counters, log);
    EXPECT_TRUE(walker.walk(files, dirs, std::stop_token()).isFailed());
    EXPECT_EQ(counters.filesFound.load(), 0u);
}

TEST_F(TreeWalkerTest, AlreadyCancelledEmitsNothing)
{
    tree.write("a.txt", "a");
    tree.mkdir("sub");
    std::stop_source stopSource;
    stopSource.request_stop();

    TreeWalker walker(tree.path(), counters, log);
    Outcome outcome = walker.walk(files, dirs, stopSource.get_token());
    EXPECT_TRUE(outcome.isCancelled());
    EXPECT_TRUE(drainAll(files).empty());
    EXPECT_TRUE(drainAll(dirs).empty());
    EXPECT_EQ(counters.filesFound.load(), 0u);
}

TEST_F(TreeWalkerTest, UnreadableSubdirIsSkipped)
{
    tree.write("readable.txt", "r");
    tree.write("locked/hidden.txt", "h");
    if (!tree.lockDir("locked"))
    {
        // Root bypasses directory permissions, so this path is only covered when the
        // suite runs as a regular user.
        GTEST_SKIP() << "Directory permissions are not enforced for this user.";
    }

    TreeWalker walker(tree.path(), counters, log);
    EXPECT_TRUE(walker.walk(files, dirs, std::stop_token()).isOk());
    std::vector<fs::path> expectedFiles = {tree.path() / "readable.txt"};
    EXPECT_EQ(drainAll(files), expectedFiles);
    EXPECT_EQ(counters.filesFound.load(), 1u);
    EXPECT_NE(err.str().find("Warning: Error accessing"), std::string::npos);
}

TEST_F(TreeWalkerTest, StopUnblocksWalkerOnFullChannel)
{
    for (int i = 0; i < 10; i++)
    {
        tree.write("f" + std::to_string(i), "x");
    }
    Channel<fs::path> smallFiles(1);
    std::stop_source stopSource;
    Outcome outcome;
    TreeWalker walker(tree.path(), counters, log);
    std::thread walkerThread([&] { outcome = walker.walk(smallFiles, dirs, stopSource.get_token()); });

    // The first path fills the channel, the second send blocks until stop is requested.
    while (counters.filesFound.load() < 2)
    {
        std::this_thread::yield();
    }
    stopSource.request_stop();
    walkerThread.join();

    EXPECT_TRUE(outcome.isCancelled());
    EXPECT_TRUE(smallFiles.isClosed());
    EXPECT_EQ(smallFiles.size(), 1u);
    EXPECT_EQ(counters.filesFound.load(), 2u);
}

TEST_F(TreeWalkerTest, RunPublishesOutcome)
{
    tree.write("a.txt", "a");
    Channel<Outcome> outcomeChannel(1);
    TreeWalker walker(tree.path(), counters, log);
    walker.run(files, dirs, outcomeChannel, std::stop_token());

    std::optional<Outcome> outcome = outcomeChannel.receive(std::stop_token());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->isOk());
    EXPECT_TRUE(outcomeChannel.isClosed());
    EXPECT_FALSE(outcomeChannel.receive(std::stop_token()).has_value());
}

#include <gtest/gtest.h>

#include "disk_usage_core.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <grp.h>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using dustr::du::aggregate;
using dustr::du::AggregateOptions;
using dustr::du::ScanErrorKind;
using dustr::du::UnitMode;

namespace
{

class TempTree
{
public:
    TempTree()
    {
        root = fs::temp_directory_path() /
               ("dustr-test-" + std::to_string(::getpid()) + "-" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root);
    }

    ~TempTree()
    {
        std::error_code ec;
        for (const auto &path : locked)
            fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
        fs::remove_all(root, ec);
    }

    fs::path dir(const std::string &relative)
    {
        fs::path path = root / relative;
        fs::create_directories(path);
        return path;
    }

    fs::path file(const std::string &relative, std::size_t bytes)
    {
        fs::path path = root / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << std::string(bytes, 'x');
        return path;
    }

    fs::path lock(const std::string &relative)
    {
        fs::path path = dir(relative);
        fs::permissions(path, fs::perms::none, fs::perm_options::replace);
        locked.push_back(path);
        return path;
    }

    // Opens everything except the locked directories to other users.
    void shareReadAccess()
    {
        fs::permissions(root, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                  fs::perms::others_read | fs::perms::others_exec);
        for (fs::recursive_directory_iterator it(root), end; it != end; ++it)
        {
            const fs::path &path = it->path();
            if (it->is_symlink())
                continue;
            if (std::find(locked.begin(), locked.end(), path) != locked.end())
            {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_directory())
                fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                          fs::perms::others_read | fs::perms::others_exec);
            else
                fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                                          fs::perms::others_read);
        }
    }

    fs::path root;

private:
    std::vector<fs::path> locked;
};

constexpr uid_t kNobody = 65534;

// Permission bits do not apply to root, so as root the body runs in a child
// process that has dropped to the nobody user.
::testing::AssertionResult runUnprivileged(TempTree &tree, const std::function<void()> &body)
{
    if (::geteuid() != 0)
    {
        body();
        return ::testing::AssertionSuccess();
    }

    tree.shareReadAccess();
    std::fflush(nullptr);
    pid_t pid = ::fork();
    if (pid < 0)
        return ::testing::AssertionFailure() << "fork failed";
    if (pid == 0)
    {
        if (::setgroups(0, nullptr) != 0 || ::setresgid(kNobody, kNobody, kNobody) != 0 ||
            ::setresuid(kNobody, kNobody, kNobody) != 0)
            ::_exit(2);
        int status = 0;
        try
        {
            body();
            status = ::testing::Test::HasFailure() ? 1 : 0;
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "unexpected exception: %s\n", e.what());
            status = 1;
        }
        std::fflush(nullptr);
        ::_exit(status);
    }

    int status = 0;
    if (::waitpid(pid, &status, 0) != pid)
        return ::testing::AssertionFailure() << "waitpid failed";
    if (!WIFEXITED(status))
        return ::testing::AssertionFailure() << "unprivileged child did not exit normally";
    switch (WEXITSTATUS(status))
    {
    case 0:
        return ::testing::AssertionSuccess();
    case 2:
        return ::testing::AssertionFailure() << "could not switch to uid " << kNobody;
    default:
        return ::testing::AssertionFailure() << "checks failed as uid " << kNobody;
    }
}

} // namespace

TEST(DiskUsageAggregate, SumsKilobytesAndInodesPerDirectChild)
{
    TempTree tree;
    tree.file("a.txt", 2048);
    tree.file("b/c.txt", 100);

    auto bytes = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    ASSERT_TRUE(bytes.ok());
    EXPECT_TRUE(bytes.errors.empty());
    ASSERT_EQ(bytes.metrics.size(), 2u);
    EXPECT_EQ(bytes.metrics.at("a.txt"), 2u);
    EXPECT_EQ(bytes.metrics.at("b"), 0u);

    auto inodes = aggregate(tree.root, UnitMode::Inodes);
    ASSERT_TRUE(inodes.ok());
    EXPECT_EQ(inodes.metrics.at("a.txt"), 1u);
    EXPECT_EQ(inodes.metrics.at("b"), 2u);
}

TEST(DiskUsageAggregate, TruncatesEachFileBeforeSummingAtAnyDepth)
{
    TempTree tree;
    tree.file("deep/one/two/three/almost.bin", 1023);
    tree.file("deep/one/exact.bin", 1024);
    tree.file("deep/three.bin", 3000);
    tree.file("flat.bin", 3000);

    auto result = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metrics.at("deep"), 3u);
    EXPECT_EQ(result.metrics.at("flat.bin"), 2u);
}

TEST(DiskUsageAggregate, CountsEveryObjectInInodeMode)
{
    TempTree tree;
    tree.file("src/a.cpp", 10);
    tree.file("src/b.cpp", 10);
    tree.file("src/nested/c.cpp", 10);
    tree.dir("src/nested/empty");

    auto result = aggregate(tree.root, UnitMode::Inodes);
    ASSERT_TRUE(result.ok());
    // src, a.cpp, b.cpp, nested, c.cpp, empty
    EXPECT_EQ(result.metrics.at("src"), 6u);
}

TEST(DiskUsageAggregate, EmptyDirectoryCountsOnlyItself)
{
    TempTree tree;
    tree.dir("empty");

    EXPECT_EQ(aggregate(tree.root, UnitMode::BytesAsKilobytes).metrics.at("empty"), 0u);
    EXPECT_EQ(aggregate(tree.root, UnitMode::Inodes).metrics.at("empty"), 1u);
}

TEST(DiskUsageAggregate, EmptyRootYieldsEmptyMaps)
{
    TempTree tree;

    auto result = aggregate(tree.root, UnitMode::Inodes);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.metrics.empty());
    EXPECT_TRUE(result.errors.empty());
}

TEST(DiskUsageAggregate, IncludesHiddenEntries)
{
    TempTree tree;
    tree.file(".profile", 4096);
    tree.file("visible/.cache", 2048);

    auto result = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metrics.at(".profile"), 4u);
    EXPECT_EQ(result.metrics.at("visible"), 2u);
}

TEST(DiskUsageAggregate, DoesNotFollowSymlinks)
{
    TempTree tree;
    for (int i = 0; i < 8; ++i)
        tree.file("big/blob" + std::to_string(i), 8192);
    fs::create_directory_symlink(tree.root / "big", tree.root / "link");
    fs::create_symlink(tree.root / "missing-target", tree.root / "dangling");
    tree.dir("holder");
    fs::create_directory_symlink(tree.root / "holder", tree.root / "holder" / "loop");

    auto bytes = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    ASSERT_TRUE(bytes.ok());
    EXPECT_EQ(bytes.metrics.at("big"), 64u);
    EXPECT_EQ(bytes.metrics.at("link"), 0u);
    EXPECT_EQ(bytes.metrics.at("dangling"), 0u);
    EXPECT_EQ(bytes.metrics.at("holder"), 0u);
    EXPECT_TRUE(bytes.errors.empty());

    auto inodes = aggregate(tree.root, UnitMode::Inodes);
    EXPECT_EQ(inodes.metrics.at("big"), 9u);
    EXPECT_EQ(inodes.metrics.at("link"), 1u);
    EXPECT_EQ(inodes.metrics.at("dangling"), 1u);
    EXPECT_EQ(inodes.metrics.at("holder"), 2u);
}

TEST(DiskUsageAggregate, TreatsFifosAsLeaves)
{
    TempTree tree;
    fs::path fifo = tree.root / "pipe";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);
    tree.dir("nested");
    ASSERT_EQ(::mkfifo((tree.root / "nested" / "pipe").c_str(), 0600), 0);

    auto inodes = aggregate(tree.root, UnitMode::Inodes);
    ASSERT_TRUE(inodes.ok());
    EXPECT_EQ(inodes.metrics.at("pipe"), 1u);
    EXPECT_EQ(inodes.metrics.at("nested"), 2u);

    auto bytes = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    EXPECT_EQ(bytes.metrics.at("pipe"), 0u);
}

TEST(DiskUsageAggregate, RepeatedScansAreIdentical)
{
    TempTree tree;
    tree.file("a/b/c", 5000);
    tree.file("a/d", 12000);
    tree.file("e", 70000);

    auto first = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    auto second = aggregate(tree.root, UnitMode::BytesAsKilobytes);
    EXPECT_EQ(first.metrics, second.metrics);
    EXPECT_EQ(aggregate(tree.root, UnitMode::Inodes).metrics, aggregate(tree.root, UnitMode::Inodes).metrics);
}

TEST(DiskUsageAggregate, WorkerCountDoesNotChangeResults)
{
    TempTree tree;
    for (int i = 0; i < 12; ++i)
    {
        const std::string name = "dir" + std::to_string(i);
        for (int j = 0; j <= i; ++j)
            tree.file(name + "/f" + std::to_string(j), 1024 * static_cast<std::size_t>(j + 1));
    }
    tree.file("top.bin", 4096);

    AggregateOptions sequential;
    sequential.jobs = 1;
    AggregateOptions parallel;
    parallel.jobs = 4;
    AggregateOptions automatic;
    automatic.jobs = 0;

    auto expected = aggregate(tree.root, UnitMode::BytesAsKilobytes, sequential);
    ASSERT_EQ(expected.metrics.size(), 13u);
    EXPECT_EQ(expected.metrics.at("dir2"), 6u);
    EXPECT_EQ(aggregate(tree.root, UnitMode::BytesAsKilobytes, parallel).metrics, expected.metrics);
    EXPECT_EQ(aggregate(tree.root, UnitMode::BytesAsKilobytes, automatic).metrics, expected.metrics);
}

TEST(DiskUsageAggregate, ReportsProgressOncePerDirectChild)
{
    TempTree tree;
    tree.file("a", 1);
    tree.file("b/c", 1);
    tree.dir("d");

    std::vector<std::size_t> seen;
    std::size_t reportedTotal = 0;
    AggregateOptions options;
    options.jobs = 2;
    options.progressCallback = [&](std::size_t done, std::size_t total) {
        seen.push_back(done);
        reportedTotal = total;
    };

    auto result = aggregate(tree.root, UnitMode::Inodes, options);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(seen, (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_EQ(reportedTotal, 3u);
}

TEST(DiskUsageAggregate, StopsWhenCancelled)
{
    TempTree tree;
    tree.file("a/b", 10);
    tree.file("c", 10);

    AggregateOptions options;
    options.cancelRequested = []() { return true; };

    auto result = aggregate(tree.root, UnitMode::Inodes, options);
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.metrics.empty());
}

TEST(DiskUsageAggregate, MissingRootFailsWithSingleRootError)
{
    auto result = aggregate("/nonexistent/dustr/path/that/does/not/exist", UnitMode::BytesAsKilobytes);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.metrics.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    const auto &error = result.errors.at(dustr::du::kRootErrorKey);
    EXPECT_EQ(error.kind, ScanErrorKind::RootNotFound);
    EXPECT_NE(error.message.find("not found"), std::string::npos);
}

TEST(DiskUsageAggregate, RegularFileRootIsRejected)
{
    TempTree tree;
    fs::path file = tree.file("plain.txt", 10);

    auto result = aggregate(file, UnitMode::Inodes);
    EXPECT_TRUE(result.metrics.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.at(dustr::du::kRootErrorKey).kind, ScanErrorKind::RootNotDirectory);
}

TEST(DiskUsageAggregate, UnlistableRootIsPermissionDenied)
{
    TempTree tree;
    fs::path locked = tree.lock("locked");

    EXPECT_TRUE(runUnprivileged(tree, [&]() {
        auto result = aggregate(locked, UnitMode::BytesAsKilobytes);
        EXPECT_TRUE(result.metrics.empty());
        ASSERT_EQ(result.errors.size(), 1u);
        EXPECT_EQ(result.errors.at(dustr::du::kRootErrorKey).kind, ScanErrorKind::RootPermissionDenied);
    }));
}

TEST(DiskUsageAggregate, DeniedDirectChildIsReportedOnlyAsError)
{
    TempTree tree;
    tree.file("normal.bin", 2048);
    tree.file("secret/inside.bin", 2048);
    tree.lock("secret");

    EXPECT_TRUE(runUnprivileged(tree, [&]() {
        auto result = aggregate(tree.root, UnitMode::BytesAsKilobytes);
        EXPECT_TRUE(result.ok());
        ASSERT_EQ(result.metrics.size(), 1u);
        EXPECT_EQ(result.metrics.at("normal.bin"), 2u);
        EXPECT_EQ(result.metrics.count("secret"), 0u);

        ASSERT_EQ(result.errors.size(), 1u);
        const auto &error = result.errors.at("secret");
        EXPECT_EQ(error.kind, ScanErrorKind::SubtreePermissionDenied);
        EXPECT_FALSE(error.partial);
        EXPECT_NE(error.message.find("Permission denied"), std::string::npos);
    }));
}

TEST(DiskUsageAggregate, NestedFailuresCollapseIntoOnePartialError)
{
    TempTree tree;
    tree.file("project/readable.bin", 4096);
    tree.lock("project/first");
    tree.lock("project/deeper/second");
    tree.file("sibling.bin", 1024);

    EXPECT_TRUE(runUnprivileged(tree, [&]() {
        auto bytes = aggregate(tree.root, UnitMode::BytesAsKilobytes);
        EXPECT_TRUE(bytes.ok());
        EXPECT_EQ(bytes.metrics.at("project"), 4u);
        EXPECT_EQ(bytes.metrics.at("sibling.bin"), 1u);
        ASSERT_EQ(bytes.errors.size(), 1u);
        const auto &error = bytes.errors.at("project");
        EXPECT_TRUE(error.partial);
        EXPECT_EQ(error.kind, ScanErrorKind::SubtreePermissionDenied);

        // project, readable.bin, deeper; both locked directories contribute nothing.
        auto inodes = aggregate(tree.root, UnitMode::Inodes);
        EXPECT_EQ(inodes.metrics.at("project"), 3u);
    }));
}

TEST(DiskUsageAggregate, ErrorCallbackSeesEveryNestedFailure)
{
    TempTree tree;
    tree.lock("top/one");
    tree.lock("top/two");

    EXPECT_TRUE(runUnprivileged(tree, [&]() {
        std::vector<fs::path> failures;
        AggregateOptions options;
        options.reportErrors = true;
        options.errorCallback = [&](const fs::path &path, const std::error_code &ec) {
            EXPECT_TRUE(ec == std::errc::permission_denied);
            failures.push_back(path);
        };

        auto result = aggregate(tree.root, UnitMode::Inodes, options);
        EXPECT_EQ(failures.size(), 2u);
        EXPECT_EQ(result.errors.size(), 1u);

        failures.clear();
        options.reportErrors = false;
        auto quiet = aggregate(tree.root, UnitMode::Inodes, options);
        EXPECT_EQ(quiet.errors.size(), 1u);
        EXPECT_TRUE(failures.empty());
    }));
}

TEST(DiskUsageAggregate, RecoversFromEntriesRemovedDuringScan)
{
    TempTree tree;
    for (const char *name : {"a", "b", "c"})
        tree.file(std::string(name) + "/inner/data.bin", 2048);

    AggregateOptions options;
    options.jobs = 1;
    options.progressCallback = [&](std::size_t done, std::size_t) {
        if (done != 1)
            return;
        std::error_code ec;
        for (const char *name : {"a", "b", "c"})
            fs::remove_all(tree.root / name, ec);
    };

    auto result = aggregate(tree.root, UnitMode::BytesAsKilobytes, options);
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.metrics.size(), 1u);
    EXPECT_EQ(result.metrics.begin()->second, 2u);
    const std::string measured = result.metrics.begin()->first;

    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors.count(measured), 0u);
    for (const auto &[name, error] : result.errors)
    {
        EXPECT_EQ(error.kind, ScanErrorKind::SubtreeVanished) << name;
        EXPECT_FALSE(error.partial) << name;
        EXPECT_EQ(error.path.filename().string(), name);
    }
}

TEST(DiskUsageAggregate, ConvertsBytesByTruncation)
{
    EXPECT_EQ(dustr::du::kilobytesFromBytes(0), 0u);
    EXPECT_EQ(dustr::du::kilobytesFromBytes(1023), 0u);
    EXPECT_EQ(dustr::du::kilobytesFromBytes(1024), 1u);
    EXPECT_EQ(dustr::du::kilobytesFromBytes(2047), 1u);
}

TEST(DiskUsageAggregate, NamesErrorKinds)
{
    EXPECT_STREQ(dustr::du::scanErrorKindName(ScanErrorKind::SubtreeVanished), "SubtreeVanished");
    EXPECT_TRUE(dustr::du::isPermissionError(ScanErrorKind::RootPermissionDenied));
    EXPECT_TRUE(dustr::du::isPermissionError(ScanErrorKind::SubtreePermissionDenied));
    EXPECT_FALSE(dustr::du::isPermissionError(ScanErrorKind::SubtreeVanished));
    EXPECT_TRUE(dustr::du::isRootError(ScanErrorKind::RootNotFound));
    EXPECT_FALSE(dustr::du::isRootError(ScanErrorKind::ClassificationFailed));
}

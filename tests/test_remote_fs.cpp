#include <gtest/gtest.h>
#include <transfer/remote_fs.hpp>
#include <transfer/directory_creator.hpp>
#include <transfer/directory_transfer.hpp>
#include <core/errors.hpp>
#include "fake_remote.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class RemoteFsTest : public ::testing::Test {
protected:
    fake::FakeSftp sftp;
    fs::path local_dir;

    void SetUp() override {
        local_dir = fs::temp_directory_path() / "shuttle_remote_fs_test";
        fs::remove_all(local_dir);
        fs::create_directories(local_dir);
    }

    void TearDown() override {
        fs::remove_all(local_dir);
    }

    std::string write_local(const std::string& name, const std::string& content) {
        auto path = local_dir / name;
        std::ofstream(path) << content;
        return path.string();
    }

    RemoteError run_expecting_failure(RemoteOp& op) {
        try {
            run_op(op, sftp);
        } catch (const SessionError& e) {
            return e.to_remote_error();
        }
        ADD_FAILURE() << "operation unexpectedly succeeded";
        return {};
    }
};

// ── mkdir ──────────────────────────────────────────────────

TEST_F(RemoteFsTest, MkdirCreatesMissingDirectory) {
    sftp.add_dir("/srv");
    EnsureDirectoryOp op(sftp, "/srv/app");
    run_op(op, sftp);
    EXPECT_TRUE(sftp.is_dir("/srv/app"));
    EXPECT_EQ(sftp.count("mkdir /srv/app"), 1);
}

TEST_F(RemoteFsTest, MkdirTwiceCreatesOnce) {
    sftp.add_dir("/srv");
    EnsureDirectoryOp first(sftp, "/srv/app");
    run_op(first, sftp);

    EnsureDirectoryOp second(sftp, "/srv/app");
    EXPECT_NO_THROW(run_op(second, sftp));
    EXPECT_EQ(sftp.count("mkdir /srv/app"), 1);
}

TEST_F(RemoteFsTest, MkdirOnExistingDirectoryHasNoSideEffect) {
    sftp.add_dir("/srv");
    EnsureDirectoryOp op(sftp, "/srv");
    run_op(op, sftp);
    EXPECT_EQ(sftp.count_prefix("mkdir"), 0);
}

TEST_F(RemoteFsTest, MkdirRepairsDeepMissingAncestors) {
    EnsureDirectoryOp op(sftp, "/a/b/c/d");
    run_op(op, sftp);

    EXPECT_TRUE(sftp.is_dir("/a"));
    EXPECT_TRUE(sftp.is_dir("/a/b"));
    EXPECT_TRUE(sftp.is_dir("/a/b/c"));
    EXPECT_TRUE(sftp.is_dir("/a/b/c/d"));

    // Each level: one failed attempt, then one successful retry (the root
    // level succeeds first time)
    EXPECT_EQ(sftp.count("mkdir /a/b/c/d"), 2);
    EXPECT_EQ(sftp.count("mkdir /a"), 1);
}

TEST_F(RemoteFsTest, MkdirOverFileFailsWithNotADirectory) {
    sftp.add_file("/srv");
    EnsureDirectoryOp op(sftp, "/srv");
    auto err = run_expecting_failure(op);
    EXPECT_EQ(err.kind, ErrorKind::RemoteNotADirectory);
    EXPECT_EQ(sftp.count_prefix("mkdir"), 0);
}

TEST_F(RemoteFsTest, MkdirDoesNotRetryOtherFailures) {
    sftp.add_dir("/srv");
    sftp.mkdir_failures["/srv/app"] = {{ErrorKind::ChannelFailure, EACCES, "Permission denied"}};

    EnsureDirectoryOp op(sftp, "/srv/app");
    auto err = run_expecting_failure(op);
    EXPECT_EQ(err.code, EACCES);
    EXPECT_EQ(err.message, "Permission denied");
    EXPECT_EQ(sftp.count("mkdir /srv/app"), 1);
    EXPECT_EQ(sftp.count_prefix("mkdir"), 1);
}

TEST_F(RemoteFsTest, MkdirRetriesOnlyOnce) {
    // The directory keeps reporting "No such file" even after its parent exists
    sftp.add_dir("/srv");
    sftp.mkdir_failures["/srv/app"] = {fake::no_such_file()};

    EnsureDirectoryOp op(sftp, "/srv/app");
    auto err = run_expecting_failure(op);
    EXPECT_TRUE(is_missing_ancestor(err));
    EXPECT_EQ(sftp.count("mkdir /srv/app"), 2);
}

TEST_F(RemoteFsTest, MissingAncestorRecognizedByCodeOrMessage) {
    EXPECT_TRUE(is_missing_ancestor({ErrorKind::ChannelFailure, ENOENT, "whatever"}));
    EXPECT_TRUE(is_missing_ancestor({ErrorKind::ChannelFailure, 0, "No such file"}));
    EXPECT_TRUE(is_missing_ancestor({ErrorKind::RemoteMissingAncestor, 0, ""}));
    EXPECT_FALSE(is_missing_ancestor({ErrorKind::ChannelFailure, EACCES, "Permission denied"}));
}

TEST_F(RemoteFsTest, MkdirWorksWithLatency) {
    sftp.latency = 3;
    EnsureDirectoryOp op(sftp, "/x/y");
    run_op(op, sftp);
    EXPECT_TRUE(sftp.is_dir("/x/y"));
    EXPECT_GT(sftp.waits, 0);
}

// ── putFile ────────────────────────────────────────────────

TEST_F(RemoteFsTest, PutFileUploadsContent) {
    sftp.add_dir("/srv");
    auto local = write_local("a.txt", "hello");

    PutFileOp op(sftp, local, "/srv/a.txt");
    run_op(op, sftp);
    EXPECT_EQ(sftp.content("/srv/a.txt"), "hello");
    EXPECT_EQ(sftp.count("put /srv/a.txt"), 1);
}

TEST_F(RemoteFsTest, PutFileCreatesMissingParentAndRetriesOnce) {
    auto local = write_local("a.txt", "data");

    PutFileOp op(sftp, local, "/srv/deep/a.txt");
    run_op(op, sftp);

    EXPECT_EQ(sftp.content("/srv/deep/a.txt"), "data");
    EXPECT_EQ(sftp.count("put /srv/deep/a.txt"), 2);
    EXPECT_TRUE(sftp.is_dir("/srv/deep"));
}

TEST_F(RemoteFsTest, PutFileFailsFastOnMissingLocal) {
    PutFileOp op(sftp, (local_dir / "absent.txt").string(), "/srv/absent.txt");
    auto err = run_expecting_failure(op);
    EXPECT_EQ(err.kind, ErrorKind::LocalNotFound);
    EXPECT_TRUE(sftp.calls.empty());
}

TEST_F(RemoteFsTest, PutFileDoesNotRetryOtherFailures) {
    sftp.add_dir("/srv");
    auto local = write_local("a.txt", "x");
    sftp.put_failures["/srv/a.txt"] = {{ErrorKind::ChannelFailure, ENOSPC, "No space left on device"}};

    PutFileOp op(sftp, local, "/srv/a.txt");
    auto err = run_expecting_failure(op);
    EXPECT_EQ(err.code, ENOSPC);
    EXPECT_EQ(sftp.count("put /srv/a.txt"), 1);
    EXPECT_EQ(sftp.count_prefix("mkdir"), 0);
}

TEST_F(RemoteFsTest, PutFileSecondMissingAncestorIsFinal) {
    sftp.add_dir("/srv");
    auto local = write_local("a.txt", "x");
    sftp.put_failures["/srv/a.txt"] = {fake::no_such_file()};

    PutFileOp op(sftp, local, "/srv/a.txt");
    auto err = run_expecting_failure(op);
    EXPECT_TRUE(is_missing_ancestor(err));
    EXPECT_EQ(sftp.count("put /srv/a.txt"), 2);
}

TEST_F(RemoteFsTest, SiblingPutsShareOneParentCreation) {
    // Latency keeps all four puts in flight when the parent turns out missing
    sftp.latency = 2;
    std::vector<std::unique_ptr<PutFileOp>> ops;
    std::vector<RemoteOp*> window;
    DirectoryCreator creator(sftp);
    for (int i = 0; i < 4; ++i) {
        auto local = write_local("f" + std::to_string(i), std::to_string(i));
        ops.push_back(std::make_unique<PutFileOp>(sftp, local, "/new/f" + std::to_string(i),
                                                  TransferOptions{}, &creator));
        window.push_back(ops.back().get());
    }

    std::vector<OpStatus> results(window.size(), OpStatus::Pending);
    run_window(window, sftp, [&](size_t i, OpStatus status) { results[i] = status; });

    EXPECT_EQ(sftp.count_prefix("put-end /new/"), 8);
    EXPECT_EQ(sftp.count("mkdir /new"), 1);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(results[i], OpStatus::Done);
        EXPECT_TRUE(sftp.is_file("/new/f" + std::to_string(i)));
    }
}

// ── getFile ────────────────────────────────────────────────

TEST_F(RemoteFsTest, GetFileHasNoRetry) {
    auto op = sftp.fast_get("/missing/file", (local_dir / "out").string(), {});
    auto err = run_expecting_failure(*op);
    EXPECT_TRUE(is_missing_ancestor(err));
    EXPECT_EQ(sftp.count("get /missing/file"), 1);
    EXPECT_EQ(sftp.count_prefix("mkdir"), 0);
}

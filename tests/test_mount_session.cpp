#include <gtest/gtest.h>

#include "swi/mount_session.hpp"
#include "testing.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace swi {
namespace {

namespace fs = std::filesystem;

class FakeSystemOps final : public MountSession::ISystemOps {
public:
    Result create_result = Result::Ok();
    Result mount_result = Result::Ok();
    Result unmount_result = Result::Ok();
    Result move_result = Result::Ok();
    std::string created_dir = "/tmp/fake-mount";

    mutable int create_calls = 0;
    mutable int mount_calls = 0;
    mutable int unmount_calls = 0;
    mutable int move_calls = 0;
    mutable int remove_calls = 0;
    mutable std::string last_options;

    Result CreateMountPoint(std::string_view, std::string_view, std::string& out_dir) const override {
        ++create_calls;
        if (!create_result.is_ok()) return create_result;
        out_dir = created_dir;
        return Result::Ok();
    }

    Result Mount(std::string_view, std::string_view, const MountOptions& options) const override {
        ++mount_calls;
        last_options = options.fs_type + "|" + options.options;
        return mount_result;
    }

    Result Unmount(std::string_view) const override {
        ++unmount_calls;
        return unmount_result;
    }

    Result MoveMount(std::string_view, std::string_view) const override {
        ++move_calls;
        return move_result;
    }

    void RemoveDirectory(std::string_view) const override {
        ++remove_calls;
    }
};

TEST(MountSessionTest, MountAndUnmountSuccess) {
    auto ops = std::make_shared<FakeSystemOps>();
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/mock", "/tmp", "swi-", MountOptions{"nfs", "ro,nolock"}, session);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(session.Dir(), ops->created_dir);
    EXPECT_EQ(ops->create_calls, 1);
    EXPECT_EQ(ops->mount_calls, 1);
    EXPECT_EQ(ops->last_options, "nfs|ro,nolock");

    auto unmount_res = session.Unmount();
    ASSERT_TRUE(unmount_res.is_ok()) << unmount_res.msg;
    EXPECT_TRUE(session.Dir().empty());
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, DestructorReleasesExactlyOnce) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session).is_ok());
    }
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);

    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session).is_ok());
        ASSERT_TRUE(session.Unmount().is_ok());
    }
    EXPECT_EQ(ops->unmount_calls, 2);
    EXPECT_EQ(ops->remove_calls, 2);
}

TEST(MountSessionTest, MountFailureCleansMountPoint) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->mount_result = Result::Fail(ErrorKind::TransportFailure, "mount exited with status 32", 32);
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::TransportFailure);
    EXPECT_NE(res.msg.find("mount exited with status 32"), std::string::npos);
    EXPECT_TRUE(session.Dir().empty());
    EXPECT_EQ(ops->create_calls, 1);
    EXPECT_EQ(ops->mount_calls, 1);
    EXPECT_EQ(ops->unmount_calls, 0);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, UnmountFailureLeavesDirectoryAndIsNotRetried) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session).is_ok());

        ops->unmount_result = Result::Fail(ErrorKind::TransportFailure, "busy", 32);
        auto unmount_res = session.Unmount();
        ASSERT_FALSE(unmount_res.is_ok());
        EXPECT_NE(unmount_res.msg.find("busy"), std::string::npos);
        EXPECT_EQ(ops->unmount_calls, 1);
        EXPECT_EQ(ops->remove_calls, 0);
    }
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(MountSessionTest, CreateMountPointFailureIsPropagated) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->create_result = Result::Fail(ErrorKind::Io, "mkdtemp failed", 2);
    MountSession session(ops);

    auto res = MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.msg, "mkdtemp failed");
    EXPECT_TRUE(session.Dir().empty());
    EXPECT_EQ(ops->create_calls, 1);
    EXPECT_EQ(ops->mount_calls, 0);
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(MountSessionTest, MoveTransfersActiveSession) {
    auto ops = std::make_shared<FakeSystemOps>();
    MountSession original(ops);
    ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, original).is_ok());

    MountSession moved(std::move(original));
    EXPECT_EQ(moved.Dir(), ops->created_dir);

    auto unmount_res = moved.Unmount();
    ASSERT_TRUE(unmount_res.is_ok()) << unmount_res.msg;
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, DisownedSessionIsNotReleased) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session).is_ok());
        session.Disown();
        EXPECT_FALSE(session.Owned());
        EXPECT_EQ(session.Dir(), ops->created_dir);
    }
    EXPECT_EQ(ops->unmount_calls, 0);
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(MountSessionTest, MoveToRelocatesAndDisowns) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session).is_ok());
        auto res = session.MoveTo("/mnt/onl/images");
        ASSERT_TRUE(res.is_ok()) << res.msg;
        EXPECT_EQ(session.Dir(), "/mnt/onl/images");
        EXPECT_FALSE(session.Owned());
    }
    EXPECT_EQ(ops->move_calls, 1);
    EXPECT_EQ(ops->unmount_calls, 0);
    EXPECT_EQ(ops->remove_calls, 1); // the emptied temp mount point
}

TEST(MountSessionTest, FailedMoveKeepsOwnership) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        MountSession session(ops);
        ASSERT_TRUE(MountSession::MountDevice("/dev/mock", "/tmp", "swi-", {}, session).is_ok());
        ops->move_result = Result::Fail(ErrorKind::TransportFailure, "mount exited with status 32", 32);
        EXPECT_FALSE(session.MoveTo("/mnt/onl/images").is_ok());
        EXPECT_TRUE(session.Owned());
    }
    EXPECT_EQ(ops->unmount_calls, 1);
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(MountSessionTest, ExceptionInBodyStillUnmountsThenRemoves) {
    testutil::TemporaryDirectory tmp;
    auto ops = std::make_shared<testutil::FakeMountOps>(tmp.Sub("mnt"));
    ops->on_mount = [](const std::string&, const std::string& dir) {
        testutil::WriteFile((fs::path(dir) / "images" / "foo.swi").string(), "swi");
    };

    std::string dir;
    EXPECT_THROW(
        {
            MountSession session(ops);
            EXPECT_TRUE(MountSession::MountDevice("/dev/sdb1", "", "swi-mnt-", {}, session).is_ok());
            dir = session.Dir();
            EXPECT_TRUE(ops->IsMounted(dir));
            throw std::runtime_error("body failed");
        },
        std::runtime_error);

    EXPECT_FALSE(ops->IsMounted(dir));
    EXPECT_FALSE(fs::exists(dir));
    ASSERT_GE(ops->calls.size(), 2u);
    EXPECT_EQ(ops->calls[ops->calls.size() - 2], "umount " + dir);
    EXPECT_EQ(ops->calls.back(), "rmdir " + dir);
}

TEST(CommandMountOpsTest, IssuesMountCommands) {
    testutil::TemporaryDirectory tmp;
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    CommandMountOps ops(runner);

    std::string dir;
    ASSERT_TRUE(ops.CreateMountPoint(tmp.Path(), "swi-mnt-", dir).is_ok());
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_EQ(fs::path(dir).parent_path().string(), tmp.Path());

    ASSERT_TRUE(ops.Mount("host:/export", dir, MountOptions{"nfs", "ro,nolock"}).is_ok());
    ASSERT_TRUE(ops.Mount("/dev/sdb1", dir, MountOptions{}).is_ok());
    ASSERT_TRUE(ops.MoveMount(dir, "/mnt/onl/images").is_ok());
    ASSERT_TRUE(ops.Unmount(dir).is_ok());
    ops.RemoveDirectory(dir);
    EXPECT_FALSE(fs::exists(dir));

    ASSERT_EQ(runner->commands.size(), 4u);
    EXPECT_EQ(runner->commands[0].argv,
              (std::vector<std::string>{"mount", "-t", "nfs", "-o", "ro,nolock", "host:/export", dir}));
    EXPECT_EQ(runner->commands[1].argv, (std::vector<std::string>{"mount", "/dev/sdb1", dir}));
    EXPECT_EQ(runner->commands[2].argv,
              (std::vector<std::string>{"mount", "--move", dir, "/mnt/onl/images"}));
    EXPECT_EQ(runner->commands[3].argv, (std::vector<std::string>{"umount", dir}));
}

} // namespace
} // namespace swi

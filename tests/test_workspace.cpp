#include <gtest/gtest.h>

#include "memtool/workspace.hpp"
#include "testing.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace aurix::memtool {
namespace {

namespace fs = std::filesystem;

class FakeSystemOps final : public Workspace::ISystemOps {
public:
    Result create_result = Result::Ok();
    Result write_result = Result::Ok();
    std::string created_dir = "/tmp/fake-workspace";

    mutable int create_calls = 0;
    mutable int write_calls = 0;
    mutable int remove_calls = 0;
    mutable std::string last_written;

    Result CreateTempDir(std::string_view, std::string_view, std::string& out_dir) const override {
        ++create_calls;
        if (!create_result.is_ok()) return create_result;
        out_dir = created_dir;
        return Result::Ok();
    }

    Result WriteFile(const std::string& path, std::string_view) const override {
        ++write_calls;
        last_written = path;
        return write_result;
    }

    void RemoveTree(std::string_view) const override {
        ++remove_calls;
    }
};

TEST(WorkspaceTest, AllocateAndReleaseOnDestruct) {
    auto ops = std::make_shared<FakeSystemOps>();
    {
        Workspace ws(ops);
        auto res = Workspace::Allocate("/tmp", "aurix-", ws);
        ASSERT_TRUE(res.is_ok()) << res.msg;
        EXPECT_EQ(ws.Dir(), ops->created_dir);
        EXPECT_TRUE(ws.Allocated());
        EXPECT_EQ(ws.Path("input.hex"), ops->created_dir + "/input.hex");
        EXPECT_EQ(ops->remove_calls, 0);
    }
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(WorkspaceTest, CreateFailureIsWorkspaceUnavailable) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->create_result = Result::Fail(13, "mkdtemp failed: Permission denied");
    Workspace ws(ops);

    auto res = Workspace::Allocate("/tmp", "aurix-", ws);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::WorkspaceUnavailable);
    EXPECT_EQ(res.err, 13);
    EXPECT_EQ(res.msg, "Cannot create temporary directory for memtool input: "
                       "mkdtemp failed: Permission denied");
    EXPECT_FALSE(ws.Allocated());
    EXPECT_EQ(ops->remove_calls, 0);
}

TEST(WorkspaceTest, WriteFileReportsPathInsideWorkspace) {
    auto ops = std::make_shared<FakeSystemOps>();
    Workspace ws(ops);
    ASSERT_TRUE(Workspace::Allocate("/tmp", "aurix-", ws).is_ok());

    std::string path;
    auto res = ws.WriteFile("batch.mtb", "connect\n", path);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(path, ops->created_dir + "/batch.mtb");
    EXPECT_EQ(ops->last_written, path);
}

TEST(WorkspaceTest, WriteFailureKeepsPathUnset) {
    auto ops = std::make_shared<FakeSystemOps>();
    ops->write_result = Result::Fail(28, "write failed");
    Workspace ws(ops);
    ASSERT_TRUE(Workspace::Allocate("/tmp", "aurix-", ws).is_ok());

    std::string path;
    auto res = ws.WriteFile("input.hex", "x", path);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, 28);
    EXPECT_TRUE(path.empty());
}

TEST(WorkspaceTest, WriteWithoutAllocationFails) {
    auto ops = std::make_shared<FakeSystemOps>();
    Workspace ws(ops);

    std::string path;
    auto res = ws.WriteFile("input.hex", "x", path);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(ops->write_calls, 0);
}

TEST(WorkspaceTest, MoveTransfersOwnership) {
    auto ops = std::make_shared<FakeSystemOps>();
    Workspace original(ops);
    ASSERT_TRUE(Workspace::Allocate("/tmp", "aurix-", original).is_ok());

    Workspace moved(std::move(original));
    EXPECT_EQ(moved.Dir(), ops->created_dir);
    EXPECT_FALSE(original.Allocated());

    moved.Release();
    EXPECT_EQ(ops->remove_calls, 1);
    moved.Release();
    EXPECT_EQ(ops->remove_calls, 1);
}

TEST(WorkspaceTest, RealDirectoryIsRemovedRecursively) {
    testutil::TemporaryDirectory tmp;
    std::string dir;
    {
        Workspace ws;
        auto res = Workspace::Allocate(tmp.Path(), "aurix-", ws);
        ASSERT_TRUE(res.is_ok()) << res.msg;
        dir = ws.Dir();
        EXPECT_TRUE(fs::path(dir).is_absolute());
        EXPECT_EQ(fs::path(dir).parent_path().string(), tmp.Path());
        EXPECT_EQ(fs::path(dir).filename().string().rfind("aurix-", 0), 0u);

        std::string path;
        ASSERT_TRUE(ws.WriteFile("input.hex", ":00000001FF\n", path).is_ok());
        EXPECT_EQ(testutil::ReadFile(path), ":00000001FF\n");
        fs::create_directories(dir + "/nested/deeper");
        testutil::WriteFile(dir + "/nested/deeper/file", "x");
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST(WorkspaceTest, TempRootThatIsAFileIsUnavailable) {
    testutil::TemporaryDirectory tmp;
    const std::string not_a_dir = tmp.Join("plain-file");
    testutil::WriteFile(not_a_dir, "x");

    Workspace ws;
    auto res = Workspace::Allocate(not_a_dir, "aurix-", ws);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::WorkspaceUnavailable);
    EXPECT_FALSE(ws.Allocated());
}

} // namespace
} // namespace aurix::memtool

// test_transfer_dispatcher.cpp — Тесты исполнения drag-and-drop

#include <gtest/gtest.h>
#include "SandboxFileSystem.h"
#include "twinpane/Transfer/TransferDispatcher.h"
#include "twinpane/Errors.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace TwinPane;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

class TransferDispatcherTest : public ::testing::Test {
protected:
    std::string tempDir;
    std::string localDir;
    EventLoop loop;
    std::shared_ptr<LocalFileSystem> localFs;
    std::shared_ptr<SandboxFileSystem> remoteFs;
    std::unique_ptr<TransferQueue> queue;
    std::unique_ptr<TransferDispatcher> dispatcher;

    void SetUp() override {
        tempDir = toForwardSlashes(fs::temp_directory_path().string()) + "/tp_dispatch_test_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        localDir = tempDir + "/local";
        fs::create_directories(localDir);
        fs::create_directories(tempDir + "/remote");

        localFs = std::make_shared<LocalFileSystem>();
        remoteFs = std::make_shared<SandboxFileSystem>(tempDir + "/remote");

        auto remote = remoteFs;
        RemoteFileSystemProvider provider =
            [remote](const std::string& hostId) -> std::shared_ptr<FileSystemOperations> {
                return hostId == "host-1" ? remote : nullptr;
            };
        queue = std::make_unique<TransferQueue>(loop, localFs, provider);
        dispatcher = std::make_unique<TransferDispatcher>(localFs, provider, *queue);
    }

    void TearDown() override {
        dispatcher.reset();
        queue.reset();
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    void writeFile(const std::string& path, const std::string& content) {
        fs::create_directories(fs::path(path).parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), {});
    }

    DropRequest drop(FileSystemKind from, FileSystemKind to, const std::string& targetPath, bool isCopy) {
        DropRequest request;
        request.hostId = "host-1";
        request.sourcePane = {PaneId::Left, from, ""};
        request.targetPane = {PaneId::Right, to, targetPath};
        request.targetPath = targetPath;
        request.isCopy = isCopy;
        return request;
    }

    bool waitForAll(TransferStatus status) {
        return loop.runUntil([&] {
            for (const auto& job : queue->getAllJobs()) {
                if (job.status != status) return false;
            }
            return true;
        }, 5000ms);
    }
};

TEST_F(TransferDispatcherTest, LocalMoveScenario) {
    writeFile(localDir + "/src/a.txt", "alpha");
    writeFile(localDir + "/src/b.txt", "beta");
    fs::create_directories(localDir + "/dst");

    DropRequest request = drop(FileSystemKind::Local, FileSystemKind::Local, localDir + "/dst", false);
    request.sourcePaths = {localDir + "/src/a.txt", localDir + "/src/b.txt"};

    auto result = dispatcher->dispatch(request);
    EXPECT_EQ(result.plan.route.operation, TransferOperation::LocalMove);
    EXPECT_TRUE(result.jobIds.empty());
    EXPECT_TRUE(queue->getAllJobs().empty());

    EXPECT_FALSE(fs::exists(localDir + "/src/a.txt"));
    EXPECT_EQ(readFile(localDir + "/dst/a.txt"), "alpha");
    EXPECT_EQ(readFile(localDir + "/dst/b.txt"), "beta");
}

TEST_F(TransferDispatcherTest, LocalCopyOfDirectory) {
    writeFile(localDir + "/album/1.jpg", "one");
    writeFile(localDir + "/album/raw/2.raw", "two");
    fs::create_directories(localDir + "/backup");

    DropRequest request = drop(FileSystemKind::Local, FileSystemKind::Local, localDir + "/backup", true);
    request.sourcePaths = {localDir + "/album"};
    dispatcher->dispatch(request);

    EXPECT_EQ(readFile(localDir + "/backup/album/raw/2.raw"), "two");
    EXPECT_TRUE(fs::exists(localDir + "/album/1.jpg"));
}

TEST_F(TransferDispatcherTest, RemoteCopyRunsOnRemoteSystem) {
    writeFile(remoteFs->toLocal("/etc/app.conf"), "conf");
    fs::create_directories(remoteFs->toLocal("/backup"));

    DropRequest request = drop(FileSystemKind::Remote, FileSystemKind::Remote, "/backup", true);
    request.sourcePaths = {"/etc/app.conf"};
    auto result = dispatcher->dispatch(request);

    EXPECT_EQ(result.plan.route.operation, TransferOperation::RemoteCopy);
    EXPECT_EQ(readFile(remoteFs->toLocal("/backup/app.conf")), "conf");
    EXPECT_NE(std::find(remoteFs->calls.begin(), remoteFs->calls.end(), "copy"), remoteFs->calls.end());
}

TEST_F(TransferDispatcherTest, CrossSystemCopyScenario) {
    writeFile(localDir + "/upload.txt", "payload");

    DropRequest request = drop(FileSystemKind::Local, FileSystemKind::Remote, "/incoming", true);
    fs::create_directories(remoteFs->toLocal("/incoming"));
    request.sourcePaths = {localDir + "/upload.txt"};

    auto result = dispatcher->dispatch(request);
    EXPECT_EQ(result.plan.route.operation, TransferOperation::Upload);
    ASSERT_EQ(result.jobIds.size(), 1u);

    auto job = queue->getJob(result.jobIds[0]);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->type, TransferType::Upload);
    EXPECT_EQ(job->remotePath, "/incoming/upload.txt");
    EXPECT_EQ(job->localPath, localDir + "/upload.txt");

    ASSERT_TRUE(waitForAll(TransferStatus::Completed));
    EXPECT_EQ(readFile(remoteFs->toLocal("/incoming/upload.txt")), "payload");
    EXPECT_TRUE(fs::exists(localDir + "/upload.txt"));
}

TEST_F(TransferDispatcherTest, DirectoryDownloadExpandsIntoJobs) {
    writeFile(remoteFs->toLocal("/project/readme.md"), "readme");
    writeFile(remoteFs->toLocal("/project/src/main.cpp"), "int main() {}");
    writeFile(remoteFs->toLocal("/project/src/util/helpers.h"), "#pragma once");

    DropRequest request = drop(FileSystemKind::Remote, FileSystemKind::Local, localDir, true);
    request.sourcePaths = {"/project"};

    auto result = dispatcher->dispatch(request);
    EXPECT_EQ(result.plan.route.operation, TransferOperation::Download);
    EXPECT_EQ(result.jobIds.size(), 3u);
    EXPECT_TRUE(fs::is_directory(localDir + "/project/src/util"));

    ASSERT_TRUE(waitForAll(TransferStatus::Completed));
    EXPECT_EQ(readFile(localDir + "/project/readme.md"), "readme");
    EXPECT_EQ(readFile(localDir + "/project/src/util/helpers.h"), "#pragma once");
}

TEST_F(TransferDispatcherTest, UnknownHostIsRejected) {
    writeFile(localDir + "/file.txt", "x");

    DropRequest request = drop(FileSystemKind::Local, FileSystemKind::Remote, "/", true);
    request.hostId = "ghost";
    request.sourcePaths = {localDir + "/file.txt"};

    try {
        dispatcher->dispatch(request);
        FAIL() << "Expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::HostNotFound);
    }
    EXPECT_TRUE(queue->getAllJobs().empty());
}

TEST_F(TransferDispatcherTest, FirstFailingStepAbortsPlan) {
    writeFile(localDir + "/ok.txt", "ok");
    fs::create_directories(localDir + "/dst");

    DropRequest request = drop(FileSystemKind::Local, FileSystemKind::Local, localDir + "/dst", true);
    request.sourcePaths = {localDir + "/missing.txt", localDir + "/ok.txt"};

    EXPECT_THROW(dispatcher->dispatch(request), FileOperationError);
    EXPECT_FALSE(fs::exists(localDir + "/dst/ok.txt"));
}

// test_json_contracts.cpp — Контракты JSON для UI
// Имена полей должны совпадать с тем, что ожидает фронтенд

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "twinpane/Rpc/JsonCodec.h"
#include "twinpane/Rpc/RpcProtocol.h"

using json = nlohmann::json;

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// FileEntry
// ═══════════════════════════════════════════════════════════

TEST(FileEntryJsonTest, HasCorrectFieldNames) {
    FileEntry entry;
    entry.name = "notes.txt";
    entry.path = "/home/user/notes.txt";
    entry.size = 120;
    entry.modTime = 1700000000000;
    entry.permissions = "-rw-r--r--";
    entry.owner = "user";
    entry.group = "staff";

    json j = toJson(entry);

    EXPECT_EQ(j["name"], "notes.txt");
    EXPECT_EQ(j["path"], "/home/user/notes.txt");
    EXPECT_EQ(j["size"], 120);
    EXPECT_EQ(j["type"], "-");
    EXPECT_EQ(j["modTime"], 1700000000000);
    EXPECT_EQ(j["permissions"], "-rw-r--r--");
    EXPECT_EQ(j["owner"], "user");
    EXPECT_EQ(j["group"], "staff");
    EXPECT_FALSE(j.contains("symlinkTarget"));
}

TEST(FileEntryJsonTest, SymlinkCarriesTarget) {
    FileEntry entry;
    entry.name = "current";
    entry.type = FileType::Symlink;
    entry.symlinkTarget = "/opt/app-2.1";

    json j = toJson(entry);
    EXPECT_EQ(j["type"], "l");
    EXPECT_EQ(j["symlinkTarget"], "/opt/app-2.1");
}

// ═══════════════════════════════════════════════════════════
// TransferJob
// ═══════════════════════════════════════════════════════════

TEST(TransferJobJsonTest, HasCorrectFieldNames) {
    TransferJob job;
    job.id = "job-1";
    job.type = TransferType::Upload;
    job.hostId = "host-1";
    job.filename = "photo.jpg";
    job.localPath = "/tmp/photo.jpg";
    job.remotePath = "/srv/photo.jpg";
    job.size = 4096;
    job.bytesTransferred = 1024;
    job.progress = 25;
    job.status = TransferStatus::Active;
    job.priority = 3;

    json j = toJson(job);

    EXPECT_EQ(j["id"], "job-1");
    EXPECT_EQ(j["type"], "upload");
    EXPECT_EQ(j["hostId"], "host-1");
    EXPECT_EQ(j["filename"], "photo.jpg");
    EXPECT_EQ(j["localPath"], "/tmp/photo.jpg");
    EXPECT_EQ(j["remotePath"], "/srv/photo.jpg");
    EXPECT_EQ(j["size"], 4096);
    EXPECT_EQ(j["bytesTransferred"], 1024);
    EXPECT_EQ(j["progress"], 25);
    EXPECT_EQ(j["status"], "active");
    EXPECT_EQ(j["priority"], 3);
    EXPECT_TRUE(j.contains("speed"));
    EXPECT_TRUE(j.contains("createdAt"));
    EXPECT_TRUE(j.contains("startedAt"));
    EXPECT_TRUE(j.contains("completedAt"));

    // Необязательные поля отсутствуют, а не null
    EXPECT_FALSE(j.contains("error"));
    EXPECT_FALSE(j.contains("conflict"));
}

TEST(TransferJobJsonTest, ConflictAndErrorWhenSet) {
    TransferJob job;
    job.id = "job-2";
    job.status = TransferStatus::Paused;
    job.error = "Disk full";
    job.conflict = TransferConflict{"job-2", "/srv/a.bin", "/tmp/a.bin", 10, 20};

    json j = toJson(job);

    EXPECT_EQ(j["error"], "Disk full");
    ASSERT_TRUE(j["conflict"].is_object());
    EXPECT_EQ(j["conflict"]["transferId"], "job-2");
    EXPECT_EQ(j["conflict"]["sourceFile"], "/srv/a.bin");
    EXPECT_EQ(j["conflict"]["targetPath"], "/tmp/a.bin");
    EXPECT_EQ(j["conflict"]["targetSize"], 10);
    EXPECT_EQ(j["conflict"]["targetModTime"], 20);
}

TEST(TransferJobJsonTest, FromJsonFillsDefaults) {
    json j = {
        {"type", "download"},
        {"hostId", "host-1"},
        {"filename", "log.txt"},
        {"remotePath", "/var/log/log.txt"},
        {"localPath", "/tmp/log.txt"}
    };

    TransferJob job = transferJobFromJson(j);
    EXPECT_EQ(job.type, TransferType::Download);
    EXPECT_EQ(job.hostId, "host-1");
    EXPECT_TRUE(job.id.empty());
    EXPECT_EQ(job.size, 0);
    EXPECT_EQ(job.priority, 1);
    EXPECT_EQ(job.status, TransferStatus::Pending);
}

TEST(TransferJobJsonTest, FromJsonRejectsUnknownType) {
    try {
        transferJobFromJson({{"type", "teleport"}});
        FAIL() << "Expected FileOperationError";
    } catch (const FileOperationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidParams);
    }
    EXPECT_THROW(transferJobFromJson(json::array()), FileOperationError);
    EXPECT_THROW(transferJobFromJson({{"type", "upload"}, {"size", "big"}}), json::exception);
}

TEST(TransferJobJsonTest, SummaryAndStep) {
    TransferQueueSummary summary{2, 1500.0, 4};
    json s = toJson(summary);
    EXPECT_EQ(s["activeCount"], 2);
    EXPECT_EQ(s["totalSpeed"], 1500.0);
    EXPECT_EQ(s["queuedCount"], 4);

    TransferStep step{TransferOperation::Upload, "/tmp/a", "/srv/a"};
    json st = toJson(step);
    EXPECT_EQ(st["operation"], "upload");
    EXPECT_EQ(st["sourcePath"], "/tmp/a");
    EXPECT_EQ(st["destinationPath"], "/srv/a");
}

// ═══════════════════════════════════════════════════════════
// DropRequest
// ═══════════════════════════════════════════════════════════

TEST(DropRequestJsonTest, TargetPathDefaultsToPaneDirectory) {
    json j = {
        {"hostId", "host-1"},
        {"sourcePaths", {"/tmp/a.txt", "/tmp/b.txt"}},
        {"sourcePane", {{"paneId", "left"}, {"system", "local"}, {"currentPath", "/tmp"}}},
        {"targetPane", {{"paneId", "right"}, {"system", "remote"}, {"currentPath", "/srv"}}}
    };

    DropRequest request = dropRequestFromJson(j);
    EXPECT_EQ(request.sourcePaths.size(), 2u);
    EXPECT_EQ(request.sourcePane.system, FileSystemKind::Local);
    EXPECT_EQ(request.targetPane.paneId, PaneId::Right);
    EXPECT_EQ(request.targetPane.system, FileSystemKind::Remote);
    EXPECT_EQ(request.targetPath, "/srv");
    EXPECT_TRUE(request.isCopy);
}

TEST(DropRequestJsonTest, UnknownSystemIsInvalidParams) {
    json j = {
        {"sourcePaths", json::array()},
        {"sourcePane", {{"system", "cloud"}}},
        {"targetPane", {{"system", "local"}}}
    };
    EXPECT_THROW(dropRequestFromJson(j), FileOperationError);
    EXPECT_THROW(dropRequestFromJson(json::object()), json::exception);
}

// ═══════════════════════════════════════════════════════════
// Envelopes
// ═══════════════════════════════════════════════════════════

TEST(EnvelopeJsonTest, RequestShape) {
    json j = json::parse(EnvelopeCodec::serialize(RpcRequest{"id-1", "sftp.ls", {{"path", "/"}}}));
    EXPECT_EQ(j["type"], "rpc-request");
    EXPECT_EQ(j["request"]["id"], "id-1");
    EXPECT_EQ(j["request"]["method"], "sftp.ls");
    EXPECT_EQ(j["request"]["params"]["path"], "/");
}

TEST(EnvelopeJsonTest, ResponseShape) {
    RpcResponse ok;
    ok.id = "id-2";
    ok.result = {{"done", true}};
    json j = json::parse(EnvelopeCodec::serialize(ok));
    EXPECT_EQ(j["type"], "rpc-response");
    EXPECT_EQ(j["response"]["result"]["done"], true);
    EXPECT_FALSE(j["response"].contains("error"));

    RpcResponse failed;
    failed.id = "id-3";
    failed.error = RpcError{ErrorCode::FileNotFound, "No such file", nullptr};
    j = json::parse(EnvelopeCodec::serialize(failed));
    EXPECT_EQ(j["response"]["error"]["code"], -32005);
    EXPECT_EQ(j["response"]["error"]["message"], "No such file");
    EXPECT_FALSE(j["response"]["error"].contains("data"));
    EXPECT_FALSE(j["response"].contains("result"));
}

TEST(EnvelopeJsonTest, NotificationShape) {
    json j = json::parse(EnvelopeCodec::serialize(RpcNotification{"transfer.update", {{"id", "job-1"}}}));
    EXPECT_EQ(j["type"], "rpc-notification");
    EXPECT_EQ(j["notification"]["method"], "transfer.update");
    EXPECT_EQ(j["notification"]["params"]["id"], "job-1");
}

TEST(EnvelopeJsonTest, ParseErrors) {
    try {
        EnvelopeCodec::parse("[1,2");
        FAIL() << "Expected RpcProtocolError";
    } catch (const RpcProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ParseError);
    }
    try {
        EnvelopeCodec::parse(R"({"type":"rpc-bogus"})");
        FAIL() << "Expected RpcProtocolError";
    } catch (const RpcProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidRequest);
        EXPECT_TRUE(e.requestId().empty());
    }
}

TEST(EnvelopeJsonTest, UnknownErrorCodeBecomesInternal) {
    auto envelope = EnvelopeCodec::parse(
        R"({"type":"rpc-response","response":{"id":"x","error":{"code":12345,"message":"odd"}}})");
    ASSERT_EQ(envelope.type, EnvelopeType::Response);
    ASSERT_TRUE(envelope.response.error.has_value());
    EXPECT_EQ(envelope.response.error->code, ErrorCode::InternalError);
}

TEST(RpcMethodNamesTest, RoundTripAndUnknown) {
    EXPECT_STREQ(rpcMethodName(RpcMethod::TransferResolveConflict), "transfer.resolveConflict");
    EXPECT_STREQ(rpcMethodName(RpcMethod::SftpRemove), "sftp.rm");
    EXPECT_EQ(rpcMethodFromName("context.calculateChecksum").value_or(RpcMethod::SftpList),
              RpcMethod::ContextCalculateChecksum);
    EXPECT_FALSE(rpcMethodFromName("sftp.teleport").has_value());
}

} // namespace TwinPane

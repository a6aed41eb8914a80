// test_engine_config.cpp — Тесты настроек, строковых представлений и кодов ошибок

#include <gtest/gtest.h>
#include "twinpane/EngineConfig.h"
#include "twinpane/Errors.h"
#include "twinpane/Types.h"
#include <nlohmann/json.hpp>
#include <filesystem>

using namespace TwinPane;

// ═══════════════════════════════════════════════════════════
// EngineConfig
// ═══════════════════════════════════════════════════════════

TEST(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(config.rpcTimeoutMs, 30000);
    EXPECT_EQ(config.chunkSize, 64 * 1024);
    EXPECT_EQ(config.maxConcurrentTransfers, 5);
    EXPECT_EQ(config.maxConcurrentPerHost, 3);
    EXPECT_DOUBLE_EQ(config.speedSmoothing, 0.3);
    EXPECT_EQ(config.logLevel, "info");
}

TEST(EngineConfigTest, PartialJsonKeepsDefaults) {
    auto config = EngineConfig::fromJson(R"({"chunkSize": 1024, "logLevel": "debug"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->chunkSize, 1024);
    EXPECT_EQ(config->logLevel, "debug");
    EXPECT_EQ(config->rpcTimeoutMs, 30000);
    EXPECT_EQ(config->maxConcurrentPerHost, 3);
}

TEST(EngineConfigTest, RejectsInvalidInput) {
    EXPECT_FALSE(EngineConfig::fromJson("").has_value());
    EXPECT_FALSE(EngineConfig::fromJson("{broken").has_value());
    EXPECT_FALSE(EngineConfig::fromJson("[1, 2]").has_value());
    EXPECT_FALSE(EngineConfig::fromJson(R"({"chunkSize": "big"})").has_value());
}

TEST(EngineConfigTest, RejectsOutOfRange) {
    EXPECT_FALSE(EngineConfig::fromJson(R"({"maxConcurrentTransfers": 0})").has_value());
    EXPECT_FALSE(EngineConfig::fromJson(R"({"maxConcurrentPerHost": -1})").has_value());
    EXPECT_FALSE(EngineConfig::fromJson(R"({"speedSmoothing": 1.5})").has_value());
    EXPECT_FALSE(EngineConfig::fromJson(R"({"rpcTimeoutMs": 0})").has_value());
    EXPECT_FALSE(EngineConfig::fromJson(R"({"logLevel": "loud"})").has_value());
    EXPECT_TRUE(EngineConfig::fromJson(R"({"logLevel": "off"})").has_value());
}

TEST(EngineConfigTest, ToJsonRoundTrip) {
    EngineConfig config;
    config.maxConcurrentTransfers = 7;
    config.speedSmoothing = 0.5;
    config.logLevel = "warn";

    auto parsed = EngineConfig::fromJson(config.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->maxConcurrentTransfers, 7);
    EXPECT_DOUBLE_EQ(parsed->speedSmoothing, 0.5);
    EXPECT_EQ(parsed->logLevel, "warn");

    auto j = nlohmann::json::parse(config.toJson());
    EXPECT_TRUE(j.contains("progressThrottleMs"));
    EXPECT_TRUE(j.contains("speedSampleIntervalMs"));
}

// ═══════════════════════════════════════════════════════════
// Строковые представления
// ═══════════════════════════════════════════════════════════

TEST(TypesTest, TransferStatusStrings) {
    EXPECT_STREQ(transferStatusToString(TransferStatus::Cancelled), "cancelled");
    EXPECT_EQ(transferStatusFromString("PAUSED").value_or(TransferStatus::Error), TransferStatus::Paused);
    EXPECT_FALSE(transferStatusFromString("sleeping").has_value());

    EXPECT_TRUE(isTerminal(TransferStatus::Completed));
    EXPECT_TRUE(isTerminal(TransferStatus::Error));
    EXPECT_TRUE(isTerminal(TransferStatus::Cancelled));
    EXPECT_FALSE(isTerminal(TransferStatus::Paused));
    EXPECT_FALSE(isTerminal(TransferStatus::Active));
}

TEST(TypesTest, EnumStrings) {
    EXPECT_STREQ(fileSystemKindToString(FileSystemKind::Remote), "remote");
    EXPECT_FALSE(fileSystemKindFromString("ftp").has_value());

    EXPECT_EQ(fileTypeToChar(FileType::Directory), 'd');
    EXPECT_EQ(fileTypeFromChar('l'), FileType::Symlink);
    EXPECT_EQ(fileTypeFromChar('?'), FileType::Regular);

    EXPECT_EQ(conflictActionFromString("Rename").value_or(ConflictAction::Skip), ConflictAction::Rename);
    EXPECT_FALSE(conflictActionFromString("merge").has_value());

    EXPECT_EQ(hashAlgorithmFromString("SHA1").value_or(HashAlgorithm::Md5), HashAlgorithm::Sha1);
    EXPECT_FALSE(hashAlgorithmFromString("crc32").has_value());

    EXPECT_EQ(paneIdFromString("right"), PaneId::Right);
    EXPECT_EQ(paneIdFromString("middle"), PaneId::Left);
}

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

TEST(ErrorsTest, WireValues) {
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::ParseError), -32700);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::MethodNotFound), -32601);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::RequestTimeout), -32000);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::HostNotFound), -32001);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::OperationFailed), -32006);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::RequestCancelled), -32099);

    EXPECT_EQ(errorCodeFromInt(-32004), ErrorCode::PermissionDenied);
    EXPECT_EQ(errorCodeFromInt(42), ErrorCode::InternalError);
    EXPECT_STREQ(errorCodeName(ErrorCode::CredentialNotFound), "CredentialNotFound");
}

TEST(ErrorsTest, ClassifyMessages) {
    EXPECT_EQ(classifyErrorMessage("Host not found: alpha"), ErrorCode::HostNotFound);
    EXPECT_EQ(classifyErrorMessage("Credential not found for bob"), ErrorCode::CredentialNotFound);
    EXPECT_EQ(classifyErrorMessage("File not found"), ErrorCode::FileNotFound);
    EXPECT_EQ(classifyErrorMessage("EACCES: permission denied"), ErrorCode::PermissionDenied);
    EXPECT_EQ(classifyErrorMessage("Could not connect to server"), ErrorCode::ConnectionFailed);
    EXPECT_EQ(classifyErrorMessage("Something odd"), ErrorCode::OperationFailed);
}

TEST(ErrorsTest, ClassifyExceptions) {
    EXPECT_EQ(classifyException(FileOperationError(ErrorCode::HostNotFound, "whatever")),
              ErrorCode::HostNotFound);

    std::filesystem::filesystem_error denied(
        "open", std::make_error_code(std::errc::permission_denied));
    EXPECT_EQ(classifyException(denied), ErrorCode::PermissionDenied);

    EXPECT_EQ(classifyException(std::runtime_error("file not found: /x")), ErrorCode::FileNotFound);

    auto error = makeFileError("Failed to read /x", std::make_error_code(std::errc::no_such_file_or_directory));
    EXPECT_EQ(error.code(), ErrorCode::FileNotFound);
    EXPECT_EQ(std::string(error.what()).rfind("Failed to read /x: ", 0), 0u);
}

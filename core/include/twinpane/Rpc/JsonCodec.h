// JsonCodec.h — JSON-представление моделей для конвертов RPC

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Transfer/TransferRouter.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace TwinPane {

TP_API nlohmann::json toJson(const FileEntry& entry);
TP_API nlohmann::json toJson(const std::vector<FileEntry>& entries);
TP_API nlohmann::json toJson(const TransferJob& job);
TP_API nlohmann::json toJson(const std::vector<TransferJob>& jobs);
TP_API nlohmann::json toJson(const TransferConflict& conflict);
TP_API nlohmann::json toJson(const TransferQueueSummary& summary);
TP_API nlohmann::json toJson(const TransferStep& step);

/// Частично заполненная задача из transfer.addJob; отсутствующие поля получают значения по умолчанию.
/// @throws FileOperationError(InvalidParams) для неизвестных type/status
/// @throws nlohmann::json::exception при неверных типах полей
TP_API TransferJob transferJobFromJson(const nlohmann::json& j);

TP_API PaneState paneStateFromJson(const nlohmann::json& j);
TP_API DropRequest dropRequestFromJson(const nlohmann::json& j);

} // namespace TwinPane

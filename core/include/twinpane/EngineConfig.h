// EngineConfig.h — Настройки движка передач

#pragma once

#include "export.h"
#include <cstdint>
#include <optional>
#include <string>

namespace TwinPane {

struct TP_API EngineConfig {
    int32_t rpcTimeoutMs = 30000;           // Таймаут RPC-запроса
    int64_t chunkSize = 64 * 1024;          // Размер блока за один шаг цикла
    int32_t maxConcurrentTransfers = 5;
    int32_t maxConcurrentPerHost = 3;
    double speedSmoothing = 0.3;            // Коэффициент EMA (0..1]
    int32_t speedSampleIntervalMs = 250;
    int32_t progressThrottleMs = 100;
    std::string logLevel = "info";          // trace|debug|info|warn|error|off

    /// Разобрать JSON; отсутствующие поля получают значения по умолчанию.
    /// nullopt, если JSON некорректен или значение вне допустимого диапазона.
    static std::optional<EngineConfig> fromJson(const std::string& json);
    std::string toJson() const;
};

/// Применить уровень логирования к spdlog; false для неизвестного имени
TP_API bool applyLogLevel(const std::string& level);

} // namespace TwinPane

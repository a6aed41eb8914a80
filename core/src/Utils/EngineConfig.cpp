// EngineConfig.cpp — Разбор настроек движка

#include "twinpane/EngineConfig.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace TwinPane {

using json = nlohmann::json;

std::optional<EngineConfig> EngineConfig::fromJson(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object()) {
            return std::nullopt;
        }

        EngineConfig c;
        c.rpcTimeoutMs = j.value("rpcTimeoutMs", c.rpcTimeoutMs);
        c.chunkSize = j.value("chunkSize", c.chunkSize);
        c.maxConcurrentTransfers = j.value("maxConcurrentTransfers", c.maxConcurrentTransfers);
        c.maxConcurrentPerHost = j.value("maxConcurrentPerHost", c.maxConcurrentPerHost);
        c.speedSmoothing = j.value("speedSmoothing", c.speedSmoothing);
        c.speedSampleIntervalMs = j.value("speedSampleIntervalMs", c.speedSampleIntervalMs);
        c.progressThrottleMs = j.value("progressThrottleMs", c.progressThrottleMs);
        c.logLevel = j.value("logLevel", c.logLevel);

        if (c.rpcTimeoutMs <= 0 || c.chunkSize <= 0 ||
            c.maxConcurrentTransfers <= 0 || c.maxConcurrentPerHost <= 0 ||
            c.speedSmoothing <= 0.0 || c.speedSmoothing > 1.0 ||
            c.speedSampleIntervalMs < 0 || c.progressThrottleMs < 0) {
            spdlog::warn("EngineConfig: Value out of range in {}", jsonStr);
            return std::nullopt;
        }
        if (spdlog::level::from_str(c.logLevel) == spdlog::level::off && c.logLevel != "off") {
            spdlog::warn("EngineConfig: Unknown log level '{}'", c.logLevel);
            return std::nullopt;
        }
        return c;
    } catch (const json::exception& e) {
        spdlog::warn("EngineConfig: Malformed config: {}", e.what());
        return std::nullopt;
    }
}

std::string EngineConfig::toJson() const {
    json j = {
        {"rpcTimeoutMs", rpcTimeoutMs},
        {"chunkSize", chunkSize},
        {"maxConcurrentTransfers", maxConcurrentTransfers},
        {"maxConcurrentPerHost", maxConcurrentPerHost},
        {"speedSmoothing", speedSmoothing},
        {"speedSampleIntervalMs", speedSampleIntervalMs},
        {"progressThrottleMs", progressThrottleMs},
        {"logLevel", logLevel}
    };
    return j.dump();
}

bool applyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

} // namespace TwinPane

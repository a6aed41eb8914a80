// twinpane_c.cpp — реализация C API для встраивания в UI

#include "ffi_internal.h"
#include "twinpane/twinpane_c.h"
#include "twinpane/core.h"
#include "twinpane/FileSystem/LocalFileSystem.h"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>
#include <memory>

using namespace TwinPane;

// ═══════════════════════════════════════════════════════════
// Thread-local error state for proper C API error handling
// ═══════════════════════════════════════════════════════════

thread_local TPError g_lastError = TP_OK;
thread_local std::string g_lastErrorMessage;

void setLastError(TPError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != TP_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

char* alloc_string(const std::string& str) {
    return tp_strdup(str.c_str());
}

static HostHolder* toHolder(TPHost host) {
    return reinterpret_cast<HostHolder*>(host);
}

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

extern "C" {

const char* tp_version(void) {
    return TwinPane::VERSION;
}

const char* tp_error_message(TPError error) {
    switch (error) {
        case TP_OK: return "Success";
        case TP_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case TP_ERROR_IO: return "I/O error";
        case TP_ERROR_NOT_FOUND: return "Not found";
        case TP_ERROR_CLOSED: return "Host is closed";
        case TP_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

TPError tp_last_error(void) {
    return g_lastError;
}

const char* tp_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void tp_clear_error(void) {
    g_lastError = TP_OK;
    g_lastErrorMessage.clear();
}

void tp_free_string(char* str) {
    std::free(str);
}

TPError tp_set_log_level(const char* level) {
    if (!level) {
        setLastError(TP_ERROR_INVALID_ARGUMENT, "Null log level");
        return TP_ERROR_INVALID_ARGUMENT;
    }
    if (!applyLogLevel(level)) {
        setLastError(TP_ERROR_INVALID_ARGUMENT, std::string("Unknown log level: ") + level);
        return TP_ERROR_INVALID_ARGUMENT;
    }
    clearLastError();
    return TP_OK;
}

// ═══════════════════════════════════════════════════════════
// Host
// ═══════════════════════════════════════════════════════════

TPHost tp_host_create(const char* config_json,
                      TPMessageCallback callback,
                      void* user_data,
                      TPError* out_error) {
    if (!callback) {
        setLastError(TP_ERROR_INVALID_ARGUMENT, "Null message callback");
        if (out_error) *out_error = TP_ERROR_INVALID_ARGUMENT;
        return nullptr;
    }

    EngineConfig config;
    if (config_json) {
        auto parsed = EngineConfig::fromJson(config_json);
        if (!parsed) {
            setLastError(TP_ERROR_INVALID_ARGUMENT, "Invalid engine config");
            if (out_error) *out_error = TP_ERROR_INVALID_ARGUMENT;
            return nullptr;
        }
        config = *parsed;
    }
    applyLogLevel(config.logLevel);

    try {
        auto holder = std::make_unique<HostHolder>();
        holder->channel = std::make_shared<CallbackChannel>(
            holder->loop,
            [callback, user_data](const std::string& message) {
                callback(message.c_str(), user_data);
            });

        // Транспорт к удалённым хостам подключается только из C++
        RemoteFileSystemProvider noRemotes = [](const std::string&) {
            return std::shared_ptr<FileSystemOperations>();
        };
        holder->engine = std::make_unique<EngineHost>(
            holder->loop, holder->channel, std::make_shared<LocalFileSystem>(),
            std::move(noRemotes), config);

        HostHolder* raw = holder.get();
        holder->thread = std::thread([raw]() { raw->loop.run(); });

        spdlog::info("TwinPane {}: Host started", TwinPane::VERSION);
        clearLastError();
        if (out_error) *out_error = TP_OK;
        return reinterpret_cast<TPHost>(holder.release());
    } catch (const std::exception& e) {
        setLastError(TP_ERROR_INTERNAL, e.what());
        if (out_error) *out_error = TP_ERROR_INTERNAL;
        return nullptr;
    }
}

void tp_host_destroy(TPHost host) {
    if (!host) return;
    std::unique_ptr<HostHolder> holder(toHolder(host));

    // Остановка выполняется в потоке движка, чтобы не пересекаться с обработчиками
    HostHolder* raw = holder.get();
    raw->loop.post([raw]() {
        raw->engine->shutdown();
        raw->channel->close();
        raw->loop.stop();
    });
    if (raw->thread.joinable()) {
        raw->thread.join();
    }
    spdlog::info("TwinPane: Host stopped");
}

TPError tp_host_post_message(TPHost host, const char* envelope_json) {
    if (!host || !envelope_json) {
        setLastError(TP_ERROR_INVALID_ARGUMENT, "Null host or message");
        return TP_ERROR_INVALID_ARGUMENT;
    }
    if (!toHolder(host)->channel->deliver(envelope_json)) {
        setLastError(TP_ERROR_CLOSED, "Host is closed");
        return TP_ERROR_CLOSED;
    }
    clearLastError();
    return TP_OK;
}

char* tp_host_config_json(TPHost host) {
    if (!host) {
        setLastError(TP_ERROR_INVALID_ARGUMENT, "Null host");
        return nullptr;
    }
    clearLastError();
    return alloc_string(toHolder(host)->engine->config().toJson());
}

} // extern "C"

// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef TP_FFI_INTERNAL_H
#define TP_FFI_INTERNAL_H

#include "twinpane/twinpane_c.h"
#include "twinpane/EngineConfig.h"
#include "twinpane/EngineHost.h"
#include "twinpane/Rpc/EventLoop.h"
#include "twinpane/Rpc/MessageChannel.h"
#include <memory>
#include <string>
#include <thread>

#ifdef _WIN32
    #define tp_strdup _strdup
#else
    #define tp_strdup strdup
#endif

// Thread-local error state
extern thread_local TPError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Note: default argument only in declaration, not in definition
void setLastError(TPError error, const std::string& message = "");
inline void clearLastError() { setLastError(TP_OK); }

char* alloc_string(const std::string& str);

// ═══════════════════════════════════════════════════════════
// HostHolder — движок вместе с циклом событий и его потоком
// ═══════════════════════════════════════════════════════════

/// Порядок полей важен: engine уничтожается раньше channel и loop
struct HostHolder {
    TwinPane::EventLoop loop;
    std::shared_ptr<TwinPane::CallbackChannel> channel;
    std::unique_ptr<TwinPane::EngineHost> engine;
    std::thread thread;
};

#endif // TP_FFI_INTERNAL_H

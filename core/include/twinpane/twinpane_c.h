// twinpane_c.h — C API для встраивания движка в UI
// Обмен идёт JSON-конвертами rpc-request / rpc-response / rpc-notification

#ifndef TWINPANE_C_H
#define TWINPANE_C_H

#include "export.h"
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct TPHost_* TPHost;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    TP_OK = 0,
    TP_ERROR_INVALID_ARGUMENT = 1,
    TP_ERROR_IO = 3,
    TP_ERROR_NOT_FOUND = 4,
    TP_ERROR_CLOSED = 5,            // Хост уже остановлен
    TP_ERROR_INTERNAL = 99
} TPError;

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
TP_API const char* tp_version(void);

/// Возвращает текстовое описание ошибки
TP_API const char* tp_error_message(TPError error);

/// Получить последнюю ошибку (thread-local)
TP_API TPError tp_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
TP_API const char* tp_last_error_message(void);

/// Очистить состояние ошибки
TP_API void tp_clear_error(void);

/// Освобождает строку, выделенную библиотекой
TP_API void tp_free_string(char* str);

/// Уровень логирования: trace|debug|info|warn|error|off
TP_API TPError tp_set_log_level(const char* level);

// ═══════════════════════════════════════════════════════════
// Host
// ═══════════════════════════════════════════════════════════

/// Исходящий конверт от движка. Вызывается из потока движка;
/// строка действительна только на время вызова.
typedef void (*TPMessageCallback)(const char* envelope_json, void* user_data);

/// Запустить движок в собственном потоке
/// @param config_json JSON EngineConfig или NULL для значений по умолчанию
/// @note Удалённые хосты через C API не подключаются: методы с hostId
///       завершаются ошибкой -32004 (host not found).
TP_API TPHost tp_host_create(const char* config_json,
                             TPMessageCallback callback,
                             void* user_data,
                             TPError* out_error);

/// Остановить движок: незавершённые передачи отменяются, поток завершается.
/// После возврата callback больше не вызывается.
TP_API void tp_host_destroy(TPHost host);

/// Передать входящий конверт (rpc-request) в движок
/// @return TP_OK, TP_ERROR_CLOSED если хост остановлен
TP_API TPError tp_host_post_message(TPHost host, const char* envelope_json);

/// Текущая конфигурация хоста в JSON; освободить через tp_free_string
TP_API char* tp_host_config_json(TPHost host);

#ifdef __cplusplus
}
#endif

#endif // TWINPANE_C_H

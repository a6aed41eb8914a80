// TransferQueue.h — Очередь задач передачи файлов

#pragma once

#include "../export.h"
#include "../EngineConfig.h"
#include "../Models.h"
#include "../FileSystem/FileSystemOperations.h"
#include "../Rpc/EventLoop.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TwinPane {

/// Владеет задачами, их состояниями и прогрессом.
///
/// Переходы: pending → active → {completed | error | cancelled},
/// active ⇄ paused, pending → cancelled. Из терминальных состояний выхода нет.
/// Если файл назначения существует, задача переходит в paused с conflict
/// и ждёт resolveConflict().
///
/// Каждая активная задача продвигается на один блок (chunkSize) за шаг цикла,
/// поэтому пауза и отмена срабатывают на границе блока.
/// Все методы вызываются в потоке цикла событий.
class TP_API TransferQueue {
public:
    using JobCallback = std::function<void(const TransferJob& job)>;
    using QueueCallback = std::function<void(const std::vector<TransferJob>& jobs,
                                             const TransferQueueSummary& summary)>;
    using ConflictCallback = std::function<void(const TransferConflict& conflict)>;

    TransferQueue(EventLoop& loop,
                  std::shared_ptr<FileSystemOperations> localFs,
                  RemoteFileSystemProvider remoteProvider,
                  EngineConfig config = {});
    ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Управление задачами
    // ═══════════════════════════════════════════════════════════

    /// Добавить задачу: id, filename и createdAt заполняются при отсутствии,
    /// статус и прогресс сбрасываются
    /// @throws FileOperationError(InvalidParams) без путей/hostId или при повторном id
    TransferJob addJob(TransferJob job);

    /// Только из active; иначе ничего не делает
    bool pauseJob(const std::string& jobId);

    /// Только из paused (без конфликта); продолжает с уже записанного смещения.
    /// Без свободного слота задача остаётся paused до освобождения лимита
    bool resumeJob(const std::string& jobId);

    /// Из pending/active/paused; частично записанный файл остаётся
    bool cancelJob(const std::string& jobId);

    /// Удалить завершённые задачи; сбрасывает решение "для всех"
    /// @return Количество удалённых
    size_t clearCompleted();

    /// Решение по конфликту; применяется сразу или когда освободится слот
    /// @param applyToAll Использовать action для следующих конфликтов
    bool resolveConflict(const std::string& jobId, ConflictAction action, bool applyToAll);

    /// Отменить все незавершённые задачи (завершение процесса)
    void dispose();

    // ═══════════════════════════════════════════════════════════
    // Состояние
    // ═══════════════════════════════════════════════════════════

    std::optional<TransferJob> getJob(const std::string& jobId) const;

    /// В порядке добавления
    std::vector<TransferJob> getAllJobs() const;

    /// Пересчитывается при каждом вызове
    TransferQueueSummary getSummary() const;

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    /// Изменение задачи; прогресс не чаще progressThrottleMs или шага в 1%
    void onJobUpdated(JobCallback callback);

    /// Изменение состава или состояний очереди
    void onQueueChanged(QueueCallback callback);

    void onConflict(ConflictCallback callback);

private:
    class Impl;
    std::shared_ptr<Impl> m_impl;
};

} // namespace TwinPane

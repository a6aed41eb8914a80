// TransferQueue.cpp — Очередь задач передачи файлов

#include "twinpane/Transfer/TransferQueue.h"
#include "twinpane/Transfer/SpeedEstimator.h"
#include "twinpane/Transfer/TransferRouter.h"
#include "twinpane/FileSystem/PathUtils.h"
#include "twinpane/Rpc/RpcProtocol.h"
#include "twinpane/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <map>

namespace TwinPane {

using Clock = std::chrono::steady_clock;

static int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ═══════════════════════════════════════════════════════════
// Job state
// ═══════════════════════════════════════════════════════════

struct QueuedTransfer {
    TransferJob job;
    size_t order = 0;

    std::shared_ptr<FileSystemOperations> source;
    std::shared_ptr<FileSystemOperations> destination;
    std::unique_ptr<FileReader> reader;
    std::unique_ptr<FileWriter> writer;

    SpeedEstimator speed;
    bool stepScheduled = false;

    // Paused-задача ждёт свободный слот
    bool resumeRequested = false;
    std::optional<ConflictAction> pendingDecision;

    Clock::time_point lastNotify;
    int32_t lastNotifiedProgress = 0;

    QueuedTransfer(TransferJob j, size_t o, const EngineConfig& config)
        : job(std::move(j)), order(o),
          speed(config.speedSmoothing, config.speedSampleIntervalMs) {}
};

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class TransferQueue::Impl : public std::enable_shared_from_this<TransferQueue::Impl> {
public:
    Impl(EventLoop& loop, std::shared_ptr<FileSystemOperations> localFs,
         RemoteFileSystemProvider remoteProvider, EngineConfig config)
        : m_loop(loop), m_localFs(std::move(localFs)),
          m_remoteProvider(std::move(remoteProvider)), m_config(std::move(config)),
          m_buffer(static_cast<size_t>(m_config.chunkSize)) {}

    // ═══════════════════════════════════════════════════════════
    // Public operations
    // ═══════════════════════════════════════════════════════════

    TransferJob addJob(TransferJob job) {
        if (m_disposed) {
            throw FileOperationError(ErrorCode::OperationFailed, "Transfer queue is disposed");
        }
        if (job.localPath.empty() || job.remotePath.empty() || job.hostId.empty()) {
            throw FileOperationError(ErrorCode::InvalidParams,
                "Invalid params: transfer job requires localPath, remotePath and hostId");
        }
        if (job.id.empty()) {
            job.id = generateRequestId();
        } else if (m_jobs.count(job.id)) {
            throw FileOperationError(ErrorCode::InvalidParams, "Invalid params: duplicate job id " + job.id);
        }
        if (job.filename.empty()) {
            job.filename = baseName(job.sourcePath());
        }
        if (job.createdAt == 0) {
            job.createdAt = nowMs();
        }
        job.status = TransferStatus::Pending;
        job.progress = 0;
        job.bytesTransferred = 0;
        job.speed = 0.0;
        job.error.reset();
        job.conflict.reset();
        job.startedAt = 0;
        job.completedAt = 0;

        auto state = std::make_unique<QueuedTransfer>(job, m_nextOrder++, m_config);
        m_order.push_back(job.id);
        m_jobs.emplace(job.id, std::move(state));

        spdlog::info("TransferQueue: Added {} job {} ({} -> {})",
                     transferTypeToString(job.type), job.id, job.sourcePath(), job.destinationPath());

        emitJobUpdated(job);
        emitQueueChanged();
        scheduleProcessing();
        return job;
    }

    bool pauseJob(const std::string& jobId) {
        QueuedTransfer* state = find(jobId);
        if (!state || state->job.status != TransferStatus::Active) {
            return false;
        }

        state->job.status = TransferStatus::Paused;
        state->job.speed = 0.0;
        spdlog::info("TransferQueue: Job {} paused at {} bytes", jobId, state->job.bytesTransferred);

        emitJobUpdated(state->job);
        emitQueueChanged();
        scheduleProcessing();
        return true;
    }

    bool resumeJob(const std::string& jobId) {
        QueuedTransfer* state = find(jobId);
        if (!state || state->job.status != TransferStatus::Paused) {
            return false;
        }
        if (state->job.conflict) {
            spdlog::debug("TransferQueue: Job {} awaits conflict resolution", jobId);
            return false;
        }
        if (state->resumeRequested || state->pendingDecision) {
            return false;
        }

        if (!hasFreeSlot(state->job.hostId)) {
            state->resumeRequested = true;
            spdlog::info("TransferQueue: Job {} waits for a free slot to resume", jobId);
            scheduleProcessing();
            return true;
        }

        continueTransfer(*state);
        emitQueueChanged();
        return true;
    }

    bool cancelJob(const std::string& jobId) {
        QueuedTransfer* state = find(jobId);
        if (!state || isTerminal(state->job.status)) {
            return false;
        }

        finish(*state, TransferStatus::Cancelled);
        spdlog::info("TransferQueue: Job {} cancelled", jobId);

        emitJobUpdated(state->job);
        emitQueueChanged();
        scheduleProcessing();
        return true;
    }

    size_t clearCompleted() {
        size_t removed = 0;
        for (auto it = m_order.begin(); it != m_order.end();) {
            auto jobIt = m_jobs.find(*it);
            if (jobIt != m_jobs.end() && isTerminal(jobIt->second->job.status)) {
                m_jobs.erase(jobIt);
                it = m_order.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        m_applyToAll.reset();

        spdlog::debug("TransferQueue: Cleared {} finished jobs", removed);
        emitQueueChanged();
        return removed;
    }

    bool resolveConflict(const std::string& jobId, ConflictAction action, bool applyToAll) {
        QueuedTransfer* state = find(jobId);
        if (!state || !state->job.conflict || state->job.status != TransferStatus::Paused) {
            spdlog::warn("TransferQueue: No pending conflict for job {}", jobId);
            return false;
        }

        if (applyToAll) {
            m_applyToAll = action;
        }
        spdlog::info("TransferQueue: Conflict for job {} resolved with {}{}",
                     jobId, conflictActionToString(action), applyToAll ? " (all)" : "");

        state->job.conflict.reset();
        if (action == ConflictAction::Skip || hasFreeSlot(state->job.hostId)) {
            continueWithDecision(*state, action);
        } else {
            state->pendingDecision = action;
            spdlog::info("TransferQueue: Job {} waits for a free slot", jobId);
            emitJobUpdated(state->job);
            scheduleProcessing();
        }
        emitQueueChanged();
        return true;
    }

    void dispose() {
        size_t cancelled = 0;
        // Слушатель может вызвать clearCompleted и изменить m_order
        const std::vector<std::string> ids = m_order;
        for (const auto& id : ids) {
            QueuedTransfer* state = find(id);
            if (state && !isTerminal(state->job.status)) {
                finish(*state, TransferStatus::Cancelled);
                emitJobUpdated(state->job);
                ++cancelled;
            }
        }
        m_disposed = true;
        if (cancelled > 0) {
            spdlog::info("TransferQueue: Disposed, {} jobs cancelled", cancelled);
            emitQueueChanged();
        }
    }

    std::vector<TransferJob> getAllJobs() const {
        std::vector<TransferJob> jobs;
        jobs.reserve(m_order.size());
        for (const auto& id : m_order) {
            jobs.push_back(m_jobs.at(id)->job);
        }
        return jobs;
    }

    TransferQueueSummary getSummary() const {
        TransferQueueSummary summary;
        for (const auto& [id, state] : m_jobs) {
            if (state->job.status == TransferStatus::Active) {
                ++summary.activeCount;
                summary.totalSpeed += state->job.speed;
            } else if (state->job.status == TransferStatus::Pending) {
                ++summary.queuedCount;
            }
        }
        return summary;
    }

    QueuedTransfer* find(const std::string& jobId) {
        auto it = m_jobs.find(jobId);
        return it == m_jobs.end() ? nullptr : it->second.get();
    }

    const QueuedTransfer* find(const std::string& jobId) const {
        auto it = m_jobs.find(jobId);
        return it == m_jobs.end() ? nullptr : it->second.get();
    }

    // ═══════════════════════════════════════════════════════════
    // Scheduling
    // ═══════════════════════════════════════════════════════════

    void scheduleProcessing() {
        if (m_processScheduled || m_disposed) return;
        m_processScheduled = true;

        std::weak_ptr<Impl> weak = shared_from_this();
        m_loop.post([weak]() {
            if (auto self = weak.lock()) {
                self->processQueue();
            }
        });
    }

    void scheduleStep(QueuedTransfer& state) {
        if (state.stepScheduled) return;
        state.stepScheduled = true;

        std::weak_ptr<Impl> weak = shared_from_this();
        std::string id = state.job.id;
        m_loop.post([weak, id]() {
            if (auto self = weak.lock()) {
                self->step(id);
            }
        });
    }

    static bool waitsForSlot(const QueuedTransfer& state) {
        return state.job.status == TransferStatus::Paused &&
               (state.resumeRequested || state.pendingDecision.has_value());
    }

    bool hasFreeSlot(const std::string& hostId) const {
        int32_t totalActive = 0;
        int32_t hostActive = 0;
        for (const auto& [id, state] : m_jobs) {
            if (state->job.status == TransferStatus::Active) {
                ++totalActive;
                if (state->job.hostId == hostId) ++hostActive;
            }
        }
        return totalActive < m_config.maxConcurrentTransfers &&
               hostActive < m_config.maxConcurrentPerHost;
    }

    /// Запустить pending-задачи и отложенные возобновления
    /// в порядке приоритета в пределах лимитов
    void processQueue() {
        m_processScheduled = false;

        int32_t totalActive = 0;
        std::map<std::string, int32_t> perHost;
        std::vector<QueuedTransfer*> candidates;
        for (const auto& [id, state] : m_jobs) {
            if (state->job.status == TransferStatus::Active) {
                ++totalActive;
                ++perHost[state->job.hostId];
            } else if (state->job.status == TransferStatus::Pending || waitsForSlot(*state)) {
                candidates.push_back(state.get());
            }
        }

        std::sort(candidates.begin(), candidates.end(), [](const QueuedTransfer* a, const QueuedTransfer* b) {
            if (a->job.priority != b->job.priority) return a->job.priority > b->job.priority;
            if (a->job.createdAt != b->job.createdAt) return a->job.createdAt < b->job.createdAt;
            return a->order < b->order;
        });

        for (QueuedTransfer* state : candidates) {
            if (totalActive >= m_config.maxConcurrentTransfers) break;
            if (perHost[state->job.hostId] >= m_config.maxConcurrentPerHost) continue;

            ++totalActive;
            ++perHost[state->job.hostId];
            if (state->job.status == TransferStatus::Pending) {
                start(*state);
            } else if (state->pendingDecision) {
                continueWithDecision(*state, *state->pendingDecision);
                emitQueueChanged();
            } else {
                continueTransfer(*state);
                emitQueueChanged();
            }
        }
    }

    /// Paused → Active с продолжением с уже записанного смещения
    void continueTransfer(QueuedTransfer& state) {
        state.resumeRequested = false;
        state.job.status = TransferStatus::Active;
        state.speed.reset(Clock::now());
        spdlog::info("TransferQueue: Job {} resumed at {} bytes", state.job.id, state.job.bytesTransferred);

        emitJobUpdated(state.job);
        scheduleStep(state);
    }

    void continueWithDecision(QueuedTransfer& state, ConflictAction action) {
        state.pendingDecision.reset();
        state.job.status = TransferStatus::Active;
        state.speed.reset(Clock::now());
        try {
            if (applyDecision(state, action)) {
                scheduleStep(state);
            } else {
                scheduleProcessing();
            }
            emitJobUpdated(state.job);
        } catch (const std::exception& e) {
            fail(state, e.what());
        }
    }

    void start(QueuedTransfer& state) {
        TransferJob& job = state.job;
        job.status = TransferStatus::Active;
        job.startedAt = nowMs();
        state.speed.reset(Clock::now());

        try {
            // upload: local → remote, download: remote → local
            TransferRoute route = TransferRouter::route(job.sourceSystem(), job.destinationSystem(), true);
            state.source = filesystemFor(route.source, job.hostId);
            state.destination = filesystemFor(route.destination, job.hostId);

            FileEntry info = state.source->stat(job.sourcePath());
            if (info.isDirectory()) {
                throw FileOperationError(ErrorCode::OperationFailed,
                    "Cannot transfer directory " + job.sourcePath() + " as a single job");
            }
            job.size = info.size;

            spdlog::info("TransferQueue: Job {} started via {} ({} bytes)",
                         job.id, transferOperationToString(route.operation), job.size);

            if (state.destination->exists(job.destinationPath())) {
                if (m_applyToAll) {
                    if (applyDecision(state, *m_applyToAll)) {
                        scheduleStep(state);
                    } else {
                        scheduleProcessing();
                    }
                } else {
                    raiseConflict(state);
                    return;
                }
            } else {
                openStreams(state, 0);
                scheduleStep(state);
            }
        } catch (const std::exception& e) {
            fail(state, e.what());
            return;
        }

        emitJobUpdated(job);
        emitQueueChanged();
    }

    // ═══════════════════════════════════════════════════════════
    // Conflicts
    // ═══════════════════════════════════════════════════════════

    void raiseConflict(QueuedTransfer& state) {
        TransferJob& job = state.job;
        FileEntry target = state.destination->stat(job.destinationPath());

        TransferConflict conflict;
        conflict.transferId = job.id;
        conflict.sourceFile = job.sourcePath();
        conflict.targetPath = job.destinationPath();
        conflict.targetSize = target.size;
        conflict.targetModTime = target.modTime;

        job.status = TransferStatus::Paused;
        job.conflict = conflict;
        spdlog::info("TransferQueue: Job {} paused, {} already exists", job.id, conflict.targetPath);

        emitJobUpdated(job);
        if (m_onConflict) {
            m_onConflict(conflict);
        }
        emitQueueChanged();
        scheduleProcessing();
    }

    /// @return false если задача завершена решением (skip)
    bool applyDecision(QueuedTransfer& state, ConflictAction action) {
        TransferJob& job = state.job;

        switch (action) {
            case ConflictAction::Skip:
                finish(state, TransferStatus::Cancelled);
                spdlog::info("TransferQueue: Job {} skipped", job.id);
                return false;

            case ConflictAction::Rename: {
                auto destination = state.destination;
                std::string renamed = nextFreePath(job.destinationPath(),
                    [&destination](const std::string& p) { return destination->exists(p); });
                if (job.isUpload()) {
                    job.remotePath = renamed;
                } else {
                    job.localPath = renamed;
                }
                job.filename = baseName(renamed);
                openStreams(state, 0);
                return true;
            }

            case ConflictAction::Resume: {
                FileEntry target = state.destination->stat(job.destinationPath());
                if (target.size > 0 && target.size < job.size) {
                    openStreams(state, target.size);
                } else {
                    openStreams(state, 0);
                }
                return true;
            }

            case ConflictAction::Overwrite:
            default:
                openStreams(state, 0);
                return true;
        }
    }

    void openStreams(QueuedTransfer& state, int64_t offset) {
        TransferJob& job = state.job;
        state.reader = state.source->openRead(job.sourcePath(), offset);
        state.writer = state.destination->openWrite(job.destinationPath(), offset > 0);
        job.bytesTransferred = offset;
        job.progress = computeProgress(job);
        state.lastNotify = Clock::now();
        state.lastNotifiedProgress = job.progress;
        if (offset > 0) {
            spdlog::info("TransferQueue: Job {} resumes at offset {}", job.id, offset);
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Transfer stepping
    // ═══════════════════════════════════════════════════════════

    void step(const std::string& jobId) {
        QueuedTransfer* state = find(jobId);
        if (!state) return;
        state->stepScheduled = false;

        TransferJob& job = state->job;
        if (job.status != TransferStatus::Active) {
            return;  // Пауза/отмена на границе блока
        }

        try {
            if (!state->reader || !state->writer) {
                throw FileOperationError(ErrorCode::InternalError, "Transfer streams are not open");
            }

            size_t n = state->reader->read(m_buffer.data(), m_buffer.size());
            if (n == 0) {
                complete(*state);
                return;
            }

            state->writer->write(m_buffer.data(), n);
            job.bytesTransferred += static_cast<int64_t>(n);
            if (job.bytesTransferred > job.size) {
                job.size = job.bytesTransferred;  // Источник вырос во время передачи
            }
            job.speed = state->speed.addBytes(static_cast<int64_t>(n), Clock::now());
            job.progress = computeProgress(job);

            notifyProgressThrottled(*state);
            scheduleStep(*state);
        } catch (const std::exception& e) {
            fail(*state, e.what());
        }
    }

    void complete(QueuedTransfer& state) {
        TransferJob& job = state.job;
        state.writer->close();
        state.reader.reset();
        state.writer.reset();

        job.size = job.bytesTransferred;
        job.progress = 100;
        job.speed = 0.0;
        job.status = TransferStatus::Completed;
        job.completedAt = nowMs();

        spdlog::info("TransferQueue: Job {} completed ({} bytes)", job.id, job.bytesTransferred);

        emitJobUpdated(job);
        emitQueueChanged();
        scheduleProcessing();
    }

    void fail(QueuedTransfer& state, const std::string& message) {
        spdlog::error("TransferQueue: Job {} failed: {}", state.job.id, message);
        state.job.error = message;
        finish(state, TransferStatus::Error);

        emitJobUpdated(state.job);
        emitQueueChanged();
        scheduleProcessing();
    }

    /// Перевести в терминальное состояние и закрыть потоки
    void finish(QueuedTransfer& state, TransferStatus status) {
        state.resumeRequested = false;
        state.pendingDecision.reset();
        state.job.status = status;
        state.job.speed = 0.0;
        state.job.conflict.reset();
        state.job.completedAt = nowMs();

        state.reader.reset();
        if (state.writer) {
            try {
                state.writer->close();
            } catch (const std::exception& e) {
                spdlog::warn("TransferQueue: Closing destination of job {} failed: {}",
                             state.job.id, e.what());
            }
            state.writer.reset();
        }
    }

    static int32_t computeProgress(const TransferJob& job) {
        if (job.size <= 0) return 0;
        int64_t percent = job.bytesTransferred * 100 / job.size;
        return static_cast<int32_t>(std::min<int64_t>(percent, 99));
    }

    /// Уведомлять не чаще progressThrottleMs или при изменении на 1%
    void notifyProgressThrottled(QueuedTransfer& state) {
        auto now = Clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - state.lastNotify).count();
        int32_t progressChange = state.job.progress - state.lastNotifiedProgress;

        if (elapsed >= m_config.progressThrottleMs || progressChange >= 1) {
            state.lastNotify = now;
            state.lastNotifiedProgress = state.job.progress;
            emitJobUpdated(state.job);
        }
    }

    std::shared_ptr<FileSystemOperations> filesystemFor(FileSystemKind kind, const std::string& hostId) {
        if (kind == FileSystemKind::Local) {
            return m_localFs;
        }
        return requireRemote(m_remoteProvider, hostId);
    }

    // ═══════════════════════════════════════════════════════════
    // Notifications
    // ═══════════════════════════════════════════════════════════

    void emitJobUpdated(const TransferJob& job) {
        if (m_onJobUpdated) {
            m_onJobUpdated(job);
        }
    }

    void emitQueueChanged() {
        if (m_onQueueChanged) {
            m_onQueueChanged(getAllJobs(), getSummary());
        }
    }

    EventLoop& m_loop;
    std::shared_ptr<FileSystemOperations> m_localFs;
    RemoteFileSystemProvider m_remoteProvider;
    EngineConfig m_config;
    std::vector<char> m_buffer;

    std::map<std::string, std::unique_ptr<QueuedTransfer>> m_jobs;
    std::vector<std::string> m_order;
    size_t m_nextOrder = 0;

    std::optional<ConflictAction> m_applyToAll;
    bool m_processScheduled = false;
    bool m_disposed = false;

    JobCallback m_onJobUpdated;
    QueueCallback m_onQueueChanged;
    ConflictCallback m_onConflict;
};

// ═══════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════

// Задачи в цикле держат weak_ptr на Impl
TransferQueue::TransferQueue(EventLoop& loop,
                             std::shared_ptr<FileSystemOperations> localFs,
                             RemoteFileSystemProvider remoteProvider,
                             EngineConfig config)
    : m_impl(std::make_shared<Impl>(loop, std::move(localFs), std::move(remoteProvider), std::move(config))) {}

TransferQueue::~TransferQueue() = default;

TransferJob TransferQueue::addJob(TransferJob job) {
    return m_impl->addJob(std::move(job));
}

bool TransferQueue::pauseJob(const std::string& jobId) {
    return m_impl->pauseJob(jobId);
}

bool TransferQueue::resumeJob(const std::string& jobId) {
    return m_impl->resumeJob(jobId);
}

bool TransferQueue::cancelJob(const std::string& jobId) {
    return m_impl->cancelJob(jobId);
}

size_t TransferQueue::clearCompleted() {
    return m_impl->clearCompleted();
}

bool TransferQueue::resolveConflict(const std::string& jobId, ConflictAction action, bool applyToAll) {
    return m_impl->resolveConflict(jobId, action, applyToAll);
}

void TransferQueue::dispose() {
    m_impl->dispose();
}

std::optional<TransferJob> TransferQueue::getJob(const std::string& jobId) const {
    const QueuedTransfer* state = m_impl->find(jobId);
    if (!state) return std::nullopt;
    return state->job;
}

std::vector<TransferJob> TransferQueue::getAllJobs() const {
    return m_impl->getAllJobs();
}

TransferQueueSummary TransferQueue::getSummary() const {
    return m_impl->getSummary();
}

void TransferQueue::onJobUpdated(JobCallback callback) {
    m_impl->m_onJobUpdated = std::move(callback);
}

void TransferQueue::onQueueChanged(QueueCallback callback) {
    m_impl->m_onQueueChanged = std::move(callback);
}

void TransferQueue::onConflict(ConflictCallback callback) {
    m_impl->m_onConflict = std::move(callback);
}

} // namespace TwinPane

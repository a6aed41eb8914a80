// EventLoop.h — Однопоточный кооперативный цикл событий

#pragma once

#include "../export.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace TwinPane {

/// Очередь задач + таймеры. post/postDelayed/cancelTimer/stop можно вызывать
/// из любого потока; задачи исполняются только в потоке, крутящем цикл.
class TP_API EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Планирование
    // ═══════════════════════════════════════════════════════════

    void post(Task task);

    /// @return ID таймера для cancelTimer
    TimerId postDelayed(std::chrono::milliseconds delay, Task task);

    /// @return false если таймер уже сработал или отменён
    bool cancelTimer(TimerId id);

    // ═══════════════════════════════════════════════════════════
    // Исполнение
    // ═══════════════════════════════════════════════════════════

    /// Выполнить готовые задачи и наступившие таймеры (один проход)
    /// @return Количество выполненных задач
    size_t runPending();

    /// Крутить цикл заданное время
    void runFor(std::chrono::milliseconds duration);

    /// Крутить цикл, пока predicate не вернёт true или не истечёт timeout
    bool runUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

    /// Крутить до stop()
    void run();
    void stop();

    /// Задачи и таймеры, ожидающие исполнения
    size_t pendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace TwinPane

// EventLoop.cpp — Однопоточный кооперативный цикл событий

#include "twinpane/Rpc/EventLoop.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>

namespace TwinPane {

using Clock = std::chrono::steady_clock;

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class EventLoop::Impl {
public:
    mutable std::mutex mutex;
    std::condition_variable wakeup;

    std::deque<Task> tasks;
    std::set<std::pair<Clock::time_point, TimerId>> deadlines;
    std::map<TimerId, Task> timers;
    TimerId nextTimerId = 1;

    std::atomic<bool> stopRequested{false};

    size_t runPending() {
        std::deque<Task> ready;
        {
            std::lock_guard lock(mutex);
            auto now = Clock::now();
            // Наступившие таймеры идут после уже поставленных задач
            ready.swap(tasks);
            while (!deadlines.empty() && deadlines.begin()->first <= now) {
                TimerId id = deadlines.begin()->second;
                deadlines.erase(deadlines.begin());
                auto it = timers.find(id);
                if (it != timers.end()) {
                    ready.push_back(std::move(it->second));
                    timers.erase(it);
                }
            }
        }

        for (auto& task : ready) {
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("EventLoop: Task threw: {}", e.what());
            } catch (...) {
                spdlog::error("EventLoop: Task threw unknown exception");
            }
        }
        return ready.size();
    }

    /// Ждать новую задачу, ближайший таймер или limit
    void waitForWork(Clock::time_point limit) {
        std::unique_lock lock(mutex);
        if (!tasks.empty() || stopRequested) {
            return;
        }
        Clock::time_point until = limit;
        if (!deadlines.empty() && deadlines.begin()->first < until) {
            until = deadlines.begin()->first;
        }
        wakeup.wait_until(lock, until, [this] {
            return !tasks.empty() || stopRequested.load();
        });
    }
};

// ═══════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════

EventLoop::EventLoop() : m_impl(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard lock(m_impl->mutex);
        m_impl->tasks.push_back(std::move(task));
    }
    m_impl->wakeup.notify_all();
}

EventLoop::TimerId EventLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard lock(m_impl->mutex);
        id = m_impl->nextTimerId++;
        m_impl->timers.emplace(id, std::move(task));
        m_impl->deadlines.emplace(Clock::now() + delay, id);
    }
    m_impl->wakeup.notify_all();
    return id;
}

bool EventLoop::cancelTimer(TimerId id) {
    std::lock_guard lock(m_impl->mutex);
    // Запись в deadlines останется и будет проигнорирована при срабатывании
    return m_impl->timers.erase(id) > 0;
}

size_t EventLoop::runPending() {
    return m_impl->runPending();
}

void EventLoop::runFor(std::chrono::milliseconds duration) {
    auto deadline = Clock::now() + duration;
    m_impl->stopRequested = false;
    while (!m_impl->stopRequested && Clock::now() < deadline) {
        if (m_impl->runPending() == 0) {
            m_impl->waitForWork(deadline);
        }
    }
}

bool EventLoop::runUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    m_impl->stopRequested = false;
    while (!predicate()) {
        if (m_impl->stopRequested || Clock::now() >= deadline) {
            return predicate();
        }
        if (m_impl->runPending() == 0) {
            m_impl->waitForWork(deadline);
        }
    }
    return true;
}

void EventLoop::run() {
    spdlog::debug("EventLoop: Started");
    m_impl->stopRequested = false;
    while (!m_impl->stopRequested) {
        if (m_impl->runPending() == 0) {
            m_impl->waitForWork(Clock::now() + std::chrono::hours(1));
        }
    }
    spdlog::debug("EventLoop: Stopped");
}

void EventLoop::stop() {
    m_impl->stopRequested = true;
    m_impl->wakeup.notify_all();
}

size_t EventLoop::pendingCount() const {
    std::lock_guard lock(m_impl->mutex);
    return m_impl->tasks.size() + m_impl->timers.size();
}

} // namespace TwinPane

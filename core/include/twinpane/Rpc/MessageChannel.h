// MessageChannel.h — Односторонний асинхронный канал текстовых сообщений

#pragma once

#include "../export.h"
#include "EventLoop.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace TwinPane {

/// Канал доставляет сообщения асинхронно, через цикл событий получателя
class TP_API MessageChannel {
public:
    using MessageHandler = std::function<void(const std::string& message)>;

    virtual ~MessageChannel() = default;

    /// @return false если канал закрыт
    virtual bool postMessage(const std::string& message) = 0;

    /// Обработчик входящих сообщений; nullptr снимает обработчик
    virtual void onMessage(MessageHandler handler) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

// ═══════════════════════════════════════════════════════════
// LoopbackChannel — пара связанных концов в одном процессе
// ═══════════════════════════════════════════════════════════

class TP_API LoopbackChannel : public MessageChannel,
                               public std::enable_shared_from_this<LoopbackChannel> {
public:
    /// Сообщение, отправленное в first, приходит обработчику second, и наоборот.
    /// Закрытие любого конца закрывает оба.
    static std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
    createPair(EventLoop& loop);

    explicit LoopbackChannel(EventLoop& loop);

    bool postMessage(const std::string& message) override;
    void onMessage(MessageHandler handler) override;
    void close() override;
    bool isOpen() const override;

private:
    void deliver(const std::string& message);

    EventLoop& m_loop;
    mutable std::mutex m_mutex;
    std::weak_ptr<LoopbackChannel> m_peer;
    MessageHandler m_handler;
    bool m_open = true;
};

// ═══════════════════════════════════════════════════════════
// CallbackChannel — граница с внешним UI (C API)
// ═══════════════════════════════════════════════════════════

/// Исходящие сообщения отдаются в sink; входящие приходят через deliver()
/// из любого потока и исполняются в цикле событий.
class TP_API CallbackChannel : public MessageChannel {
public:
    using Sink = std::function<void(const std::string& message)>;

    CallbackChannel(EventLoop& loop, Sink sink);

    bool postMessage(const std::string& message) override;
    void onMessage(MessageHandler handler) override;
    void close() override;
    bool isOpen() const override;

    /// Входящее сообщение от UI; false если канал закрыт
    bool deliver(const std::string& message);

private:
    EventLoop& m_loop;
    Sink m_sink;
    mutable std::mutex m_mutex;
    std::shared_ptr<MessageHandler> m_handler;
    bool m_open = true;
};

} // namespace TwinPane

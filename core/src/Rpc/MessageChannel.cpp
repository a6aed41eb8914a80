// MessageChannel.cpp — Реализации каналов сообщений

#include "twinpane/Rpc/MessageChannel.h"
#include <spdlog/spdlog.h>

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// LoopbackChannel
// ═══════════════════════════════════════════════════════════

std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
LoopbackChannel::createPair(EventLoop& loop) {
    auto first = std::make_shared<LoopbackChannel>(loop);
    auto second = std::make_shared<LoopbackChannel>(loop);
    first->m_peer = second;
    second->m_peer = first;
    return {first, second};
}

LoopbackChannel::LoopbackChannel(EventLoop& loop) : m_loop(loop) {}

bool LoopbackChannel::postMessage(const std::string& message) {
    std::shared_ptr<LoopbackChannel> peer;
    {
        std::lock_guard lock(m_mutex);
        if (!m_open) return false;
        peer = m_peer.lock();
    }
    if (!peer || !peer->isOpen()) {
        return false;
    }

    std::weak_ptr<LoopbackChannel> weakPeer = peer;
    m_loop.post([weakPeer, message]() {
        if (auto target = weakPeer.lock()) {
            target->deliver(message);
        }
    });
    return true;
}

void LoopbackChannel::deliver(const std::string& message) {
    MessageHandler handler;
    {
        std::lock_guard lock(m_mutex);
        if (!m_open) return;
        handler = m_handler;
    }
    if (handler) {
        handler(message);
    } else {
        spdlog::debug("LoopbackChannel: No handler, message dropped");
    }
}

void LoopbackChannel::onMessage(MessageHandler handler) {
    std::lock_guard lock(m_mutex);
    m_handler = std::move(handler);
}

void LoopbackChannel::close() {
    std::shared_ptr<LoopbackChannel> peer;
    {
        std::lock_guard lock(m_mutex);
        if (!m_open) return;
        m_open = false;
        peer = m_peer.lock();
    }
    if (peer) {
        peer->close();
    }
}

bool LoopbackChannel::isOpen() const {
    std::lock_guard lock(m_mutex);
    return m_open;
}

// ═══════════════════════════════════════════════════════════
// CallbackChannel
// ═══════════════════════════════════════════════════════════

CallbackChannel::CallbackChannel(EventLoop& loop, Sink sink)
    : m_loop(loop), m_sink(std::move(sink)) {}

bool CallbackChannel::postMessage(const std::string& message) {
    {
        std::lock_guard lock(m_mutex);
        if (!m_open || !m_sink) return false;
    }
    m_sink(message);
    return true;
}

void CallbackChannel::onMessage(MessageHandler handler) {
    std::lock_guard lock(m_mutex);
    m_handler = handler ? std::make_shared<MessageHandler>(std::move(handler)) : nullptr;
}

void CallbackChannel::close() {
    std::lock_guard lock(m_mutex);
    m_open = false;
    m_handler.reset();
}

bool CallbackChannel::isOpen() const {
    std::lock_guard lock(m_mutex);
    return m_open;
}

bool CallbackChannel::deliver(const std::string& message) {
    std::weak_ptr<MessageHandler> weakHandler;
    {
        std::lock_guard lock(m_mutex);
        if (!m_open) return false;
        weakHandler = m_handler;
    }
    m_loop.post([weakHandler, message]() {
        if (auto handler = weakHandler.lock()) {
            (*handler)(message);
        } else {
            spdlog::debug("CallbackChannel: No handler, message dropped");
        }
    });
    return true;
}

} // namespace TwinPane

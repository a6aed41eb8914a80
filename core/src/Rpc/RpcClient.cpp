// RpcClient.cpp — Корреляция запросов и ответов

#include "twinpane/Rpc/RpcClient.h"
#include <spdlog/spdlog.h>
#include <map>

namespace TwinPane {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class RpcClient::Impl {
public:
    struct PendingRequest {
        std::string method;
        ResponseCallback callback;
        EventLoop::TimerId timer = 0;
    };

    Impl(EventLoop& loop, std::shared_ptr<MessageChannel> channel, int defaultTimeoutMs)
        : m_loop(loop), m_channel(std::move(channel)), m_defaultTimeoutMs(defaultTimeoutMs) {}

    std::string request(const std::string& method, json params,
                        ResponseCallback callback, std::optional<int> timeoutMs) {
        std::string id = generateRequestId();
        int timeout = timeoutMs.value_or(m_defaultTimeoutMs);

        RpcRequest req{id, method, std::move(params)};
        std::string text = EnvelopeCodec::serialize(req);

        if (!m_channel || !m_channel->postMessage(text)) {
            spdlog::warn("RpcClient: Channel unavailable, {} rejected", method);
            RpcResponse response;
            response.id = id;
            response.error = RpcError{ErrorCode::ConnectionFailed,
                                      "Message channel is not available", nullptr};
            // Ответ всегда асинхронный
            m_loop.post([callback = std::move(callback), response]() {
                if (callback) callback(response);
            });
            return id;
        }

        PendingRequest pending;
        pending.method = method;
        pending.callback = std::move(callback);
        pending.timer = m_loop.postDelayed(std::chrono::milliseconds(timeout),
            [this, id, method, timeout]() { onTimeout(id, method, timeout); });
        m_pending.emplace(id, std::move(pending));

        spdlog::debug("RpcClient: Sent {} ({})", method, id);
        return id;
    }

    void onTimeout(const std::string& id, const std::string& method, int timeoutMs) {
        auto it = m_pending.find(id);
        if (it == m_pending.end()) return;

        auto callback = std::move(it->second.callback);
        m_pending.erase(it);

        spdlog::warn("RpcClient: {} timed out after {}ms", method, timeoutMs);
        RpcResponse response;
        response.id = id;
        response.error = RpcError{ErrorCode::RequestTimeout,
            "RPC request timeout after " + std::to_string(timeoutMs) + "ms: " + method, nullptr};
        if (callback) callback(response);
    }

    void handleResponse(const RpcResponse& response) {
        auto it = m_pending.find(response.id);
        if (it == m_pending.end()) {
            spdlog::warn("RpcClient: Received response for unknown request {}", response.id);
            return;
        }

        m_loop.cancelTimer(it->second.timer);
        auto callback = std::move(it->second.callback);
        m_pending.erase(it);

        if (callback) callback(response);
    }

    void cancelAll() {
        auto pending = std::move(m_pending);
        m_pending.clear();

        for (auto& [id, entry] : pending) {
            m_loop.cancelTimer(entry.timer);
            RpcResponse response;
            response.id = id;
            response.error = RpcError{ErrorCode::RequestCancelled, "Request cancelled", nullptr};
            if (entry.callback) entry.callback(response);
        }
        if (!pending.empty()) {
            spdlog::info("RpcClient: Cancelled {} pending requests", pending.size());
        }
    }

    void handleMessage(const std::string& text) {
        Envelope envelope;
        try {
            envelope = EnvelopeCodec::parse(text);
        } catch (const RpcProtocolError& e) {
            spdlog::warn("RpcClient: Dropping malformed message: {}", e.what());
            return;
        }

        switch (envelope.type) {
            case EnvelopeType::Response:
                handleResponse(envelope.response);
                break;
            case EnvelopeType::Notification:
                if (m_onNotification) {
                    m_onNotification(envelope.notification);
                }
                break;
            case EnvelopeType::Request:
                spdlog::debug("RpcClient: Ignoring request {}", envelope.request.method);
                break;
        }
    }

    EventLoop& m_loop;
    std::shared_ptr<MessageChannel> m_channel;
    int m_defaultTimeoutMs;
    std::map<std::string, PendingRequest> m_pending;
    NotificationCallback m_onNotification;
};

// ═══════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════

RpcClient::RpcClient(EventLoop& loop, std::shared_ptr<MessageChannel> channel, int defaultTimeoutMs)
    : m_impl(std::make_unique<Impl>(loop, std::move(channel), defaultTimeoutMs)) {
    if (m_impl->m_channel) {
        Impl* impl = m_impl.get();
        m_impl->m_channel->onMessage([impl](const std::string& text) {
            impl->handleMessage(text);
        });
    }
}

RpcClient::~RpcClient() {
    // Снять обработчик канала до разрушения Impl
    if (m_impl->m_channel) {
        m_impl->m_channel->onMessage(nullptr);
    }
    for (auto& [id, entry] : m_impl->m_pending) {
        m_impl->m_loop.cancelTimer(entry.timer);
    }
}

std::string RpcClient::request(const std::string& method, json params,
                               ResponseCallback callback, std::optional<int> timeoutMs) {
    return m_impl->request(method, std::move(params), std::move(callback), timeoutMs);
}

std::string RpcClient::request(RpcMethod method, json params,
                               ResponseCallback callback, std::optional<int> timeoutMs) {
    return m_impl->request(rpcMethodName(method), std::move(params), std::move(callback), timeoutMs);
}

std::future<json> RpcClient::call(RpcMethod method, json params, std::optional<int> timeoutMs) {
    auto promise = std::make_shared<std::promise<json>>();
    auto future = promise->get_future();

    m_impl->request(rpcMethodName(method), std::move(params),
        [promise](const RpcResponse& response) {
            if (response.error) {
                promise->set_exception(std::make_exception_ptr(RpcException(*response.error)));
            } else {
                promise->set_value(response.result);
            }
        }, timeoutMs);

    return future;
}

void RpcClient::cancelAll() {
    m_impl->cancelAll();
}

size_t RpcClient::pendingCount() const {
    return m_impl->m_pending.size();
}

void RpcClient::onNotification(NotificationCallback callback) {
    m_impl->m_onNotification = std::move(callback);
}

void RpcClient::handleMessage(const std::string& text) {
    m_impl->handleMessage(text);
}

} // namespace TwinPane

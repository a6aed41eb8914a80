// RpcRouter.cpp — Реестр обработчиков и отправка ответов

#include "twinpane/Rpc/RpcRouter.h"
#include <spdlog/spdlog.h>
#include <map>
#include <stdexcept>

namespace TwinPane {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// Responder
// ═══════════════════════════════════════════════════════════

struct Responder::State {
    std::string requestId;
    std::string method;
    Send send;
    bool settled = false;
};

Responder::Responder(std::string requestId, std::string method, Send send)
    : m_state(std::make_shared<State>()) {
    m_state->requestId = std::move(requestId);
    m_state->method = std::move(method);
    m_state->send = std::move(send);
}

void Responder::resolve(json result) {
    if (m_state->settled) {
        spdlog::warn("RpcRouter: Duplicate response for {} ({}) ignored",
                     m_state->method, m_state->requestId);
        return;
    }
    m_state->settled = true;

    RpcResponse response;
    response.id = m_state->requestId;
    response.result = std::move(result);
    m_state->send(response);
}

void Responder::reject(ErrorCode code, const std::string& message, json data) {
    if (m_state->settled) {
        spdlog::warn("RpcRouter: Duplicate response for {} ({}) ignored",
                     m_state->method, m_state->requestId);
        return;
    }
    m_state->settled = true;

    RpcResponse response;
    response.id = m_state->requestId;
    response.error = RpcError{code, message, std::move(data)};
    m_state->send(response);
}

void Responder::fail(const std::exception& e) {
    RpcError error = RpcRouter::errorFromException(e);
    spdlog::error("RpcRouter: {} failed: {}", m_state->method, error.message);
    reject(error.code, error.message, error.data);
}

bool Responder::settled() const {
    return m_state->settled;
}

const std::string& Responder::requestId() const {
    return m_state->requestId;
}

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class RpcRouter::Impl {
public:
    explicit Impl(std::shared_ptr<MessageChannel> channel) : m_channel(std::move(channel)) {}

    void send(const std::string& text) {
        if (!m_channel) {
            spdlog::error("RpcRouter: No channel set, message dropped");
            return;
        }
        if (!m_channel->postMessage(text)) {
            spdlog::warn("RpcRouter: Channel closed, message dropped");
        }
    }

    void sendResponse(const RpcResponse& response) {
        send(EnvelopeCodec::serialize(response));
    }

    void sendError(const std::string& id, ErrorCode code, const std::string& message) {
        RpcResponse response;
        response.id = id;
        response.error = RpcError{code, message, nullptr};
        sendResponse(response);
    }

    void addHandler(RpcMethod method, AsyncHandler handler) {
        if (!handler) {
            throw std::invalid_argument(std::string("Empty handler for ") + rpcMethodName(method));
        }
        if (m_handlers.count(method)) {
            throw std::invalid_argument(std::string("Handler already registered: ") + rpcMethodName(method));
        }
        m_handlers.emplace(method, std::move(handler));
        spdlog::debug("RpcRouter: Registered {}", rpcMethodName(method));
    }

    void handleRequest(const RpcRequest& request) {
        auto method = rpcMethodFromName(request.method);
        auto it = method ? m_handlers.find(*method) : m_handlers.end();
        if (it == m_handlers.end()) {
            spdlog::warn("RpcRouter: Method not found: {}", request.method);
            sendError(request.id, ErrorCode::MethodNotFound, "Method not found: " + request.method);
            return;
        }

        spdlog::debug("RpcRouter: Handling {} ({})", request.method, request.id);
        Responder responder(request.id, request.method,
                            [this](const RpcResponse& response) { sendResponse(response); });

        try {
            it->second(request.params, responder);
        } catch (const std::exception& e) {
            // Синхронная ошибка; если ответ уже ушёл, только лог
            if (responder.settled()) {
                spdlog::error("RpcRouter: {} threw after responding: {}", request.method, e.what());
            } else {
                responder.fail(e);
            }
        } catch (...) {
            if (responder.settled()) {
                spdlog::error("RpcRouter: {} threw unknown exception after responding", request.method);
            } else {
                spdlog::error("RpcRouter: {} threw unknown exception", request.method);
                responder.reject(ErrorCode::InternalError, "Unknown error", nullptr);
            }
        }
    }

    std::shared_ptr<MessageChannel> m_channel;
    std::map<RpcMethod, AsyncHandler> m_handlers;
};

// ═══════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════

RpcRouter::RpcRouter(std::shared_ptr<MessageChannel> channel)
    : m_impl(std::make_unique<Impl>(std::move(channel))) {
    if (m_impl->m_channel) {
        m_impl->m_channel->onMessage([this](const std::string& text) {
            handleMessage(text);
        });
    }
}

RpcRouter::~RpcRouter() {
    if (m_impl->m_channel) {
        m_impl->m_channel->onMessage(nullptr);
    }
}

void RpcRouter::registerHandler(RpcMethod method, Handler handler) {
    if (!handler) {
        throw std::invalid_argument(std::string("Empty handler for ") + rpcMethodName(method));
    }
    m_impl->addHandler(method, [handler = std::move(handler)](const json& params, Responder responder) {
        responder.resolve(handler(params));
    });
}

void RpcRouter::registerAsyncHandler(RpcMethod method, AsyncHandler handler) {
    m_impl->addHandler(method, std::move(handler));
}

bool RpcRouter::unregisterHandler(RpcMethod method) {
    return m_impl->m_handlers.erase(method) > 0;
}

bool RpcRouter::hasHandler(RpcMethod method) const {
    return m_impl->m_handlers.count(method) > 0;
}

std::vector<std::string> RpcRouter::registeredMethods() const {
    std::vector<std::string> names;
    names.reserve(m_impl->m_handlers.size());
    for (const auto& [method, handler] : m_impl->m_handlers) {
        names.emplace_back(rpcMethodName(method));
    }
    return names;
}

void RpcRouter::handleMessage(const std::string& text) {
    Envelope envelope;
    try {
        envelope = EnvelopeCodec::parse(text);
    } catch (const RpcProtocolError& e) {
        if (e.requestId().empty()) {
            spdlog::warn("RpcRouter: Dropping message: {}", e.what());
        } else {
            m_impl->sendError(e.requestId(), e.code(), e.what());
        }
        return;
    }

    if (envelope.type != EnvelopeType::Request) {
        spdlog::debug("RpcRouter: Ignoring non-request envelope");
        return;
    }
    m_impl->handleRequest(envelope.request);
}

void RpcRouter::handleRequest(const RpcRequest& request) {
    m_impl->handleRequest(request);
}

void RpcRouter::notify(const std::string& method, json params) {
    m_impl->send(EnvelopeCodec::serialize(RpcNotification{method, std::move(params)}));
}

RpcError RpcRouter::errorFromException(const std::exception& e) {
    if (dynamic_cast<const json::exception*>(&e)) {
        return RpcError{ErrorCode::InvalidParams, std::string("Invalid params: ") + e.what(), nullptr};
    }
    if (dynamic_cast<const std::invalid_argument*>(&e)) {
        return RpcError{ErrorCode::InvalidParams, e.what(), nullptr};
    }
    return RpcError{classifyException(e), e.what(), nullptr};
}

} // namespace TwinPane

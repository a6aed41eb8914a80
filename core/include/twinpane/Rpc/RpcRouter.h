// RpcRouter.h — Исполняющая сторона RPC: реестр обработчиков по методу

#pragma once

#include "../export.h"
#include "MessageChannel.h"
#include "RpcProtocol.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// Responder — ответ асинхронного обработчика
// ═══════════════════════════════════════════════════════════

/// Копируемый; отвечает ровно один раз, повторные вызовы игнорируются
class TP_API Responder {
public:
    using Send = std::function<void(const RpcResponse& response)>;

    Responder(std::string requestId, std::string method, Send send);

    void resolve(nlohmann::json result);
    void reject(ErrorCode code, const std::string& message, nlohmann::json data = nullptr);

    /// Классифицировать исключение и ответить ошибкой
    void fail(const std::exception& e);

    bool settled() const;
    const std::string& requestId() const;

private:
    struct State;
    std::shared_ptr<State> m_state;
};

// ═══════════════════════════════════════════════════════════
// RpcRouter
// ═══════════════════════════════════════════════════════════

class TP_API RpcRouter {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json& params)>;
    using AsyncHandler = std::function<void(const nlohmann::json& params, Responder responder)>;

    /// Подписывается на входящие запросы канала
    explicit RpcRouter(std::shared_ptr<MessageChannel> channel);
    ~RpcRouter();

    RpcRouter(const RpcRouter&) = delete;
    RpcRouter& operator=(const RpcRouter&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Регистрация
    // ═══════════════════════════════════════════════════════════

    /// @throws std::invalid_argument для пустого обработчика или повторного метода
    void registerHandler(RpcMethod method, Handler handler);
    void registerAsyncHandler(RpcMethod method, AsyncHandler handler);

    bool unregisterHandler(RpcMethod method);
    bool hasHandler(RpcMethod method) const;
    std::vector<std::string> registeredMethods() const;

    // ═══════════════════════════════════════════════════════════
    // Обработка
    // ═══════════════════════════════════════════════════════════

    /// Обработать входящий конверт; ответ уходит в канал
    void handleMessage(const std::string& text);
    void handleRequest(const RpcRequest& request);

    /// Отправить уведомление (без ответа)
    void notify(const std::string& method, nlohmann::json params);

    /// Структурированная ошибка для исключения обработчика
    static RpcError errorFromException(const std::exception& e);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace TwinPane

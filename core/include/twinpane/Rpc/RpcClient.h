// RpcClient.h — Вызывающая сторона RPC: корреляция запросов и ответов

#pragma once

#include "../export.h"
#include "EventLoop.h"
#include "MessageChannel.h"
#include "RpcProtocol.h"
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace TwinPane {

/// Ошибка удалённого вызова (в т.ч. таймаут и отмена)
class TP_API RpcException : public std::runtime_error {
public:
    explicit RpcException(const RpcError& error)
        : std::runtime_error(error.message), m_code(error.code), m_data(error.data) {}

    ErrorCode code() const { return m_code; }
    const nlohmann::json& data() const { return m_data; }

private:
    ErrorCode m_code;
    nlohmann::json m_data;
};

/// Превращает канал сообщений в вызовы с ожиданием ответа.
/// Все методы, кроме конструктора, вызываются в потоке цикла событий.
class TP_API RpcClient {
public:
    using ResponseCallback = std::function<void(const RpcResponse& response)>;
    using NotificationCallback = std::function<void(const RpcNotification& notification)>;

    /// Подписывается на входящие сообщения канала
    RpcClient(EventLoop& loop, std::shared_ptr<MessageChannel> channel,
              int defaultTimeoutMs = DEFAULT_RPC_TIMEOUT_MS);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Запросы
    // ═══════════════════════════════════════════════════════════

    /// Отправить запрос; callback вызывается ровно один раз
    /// (ответ, таймаут, отмена или закрытый канал)
    /// @return ID запроса
    std::string request(const std::string& method, nlohmann::json params,
                        ResponseCallback callback,
                        std::optional<int> timeoutMs = std::nullopt);

    std::string request(RpcMethod method, nlohmann::json params,
                        ResponseCallback callback,
                        std::optional<int> timeoutMs = std::nullopt);

    /// Future с результатом; ошибка приходит как RpcException
    std::future<nlohmann::json> call(RpcMethod method, nlohmann::json params,
                                     std::optional<int> timeoutMs = std::nullopt);

    /// Отклонить все ожидающие запросы с RequestCancelled
    void cancelAll();

    size_t pendingCount() const;

    // ═══════════════════════════════════════════════════════════
    // Входящие
    // ═══════════════════════════════════════════════════════════

    void onNotification(NotificationCallback callback);

    /// Обработать входящий конверт (ответ или уведомление)
    void handleMessage(const std::string& text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace TwinPane

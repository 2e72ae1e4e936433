// ==============================================================================
// fleethunt/notification.hpp - События завершения задач hunt
// ==============================================================================
//
// Назначение:
// - HuntEvent: payload события (hunt, клиент, исход)
// - NotificationSink: интерфейс публикации Publish(event_name, payload)
// - EventBus: in-process реализация с подписчиками по имени события
//
// Ошибки подписчиков не влияют на состояние hunt: EventBus перехватывает
// исключения каждого подписчика и пишет предупреждение.
//
// ==============================================================================

#ifndef FLEETHUNT_NOTIFICATION_HPP
#define FLEETHUNT_NOTIFICATION_HPP

#include <cstdint>
#include <fleethunt/platform.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleethunt::output {
class Writer;
}

namespace fleethunt::hunt {

/// Payload события завершения задачи клиента
struct HuntEvent {
    std::string hunt_id;
    std::string hunt_name;
    std::string client_id;
    std::string outcome;  // "success" | "badness" | "error"
    std::string message;  // текст ошибки для "error"
    platform::Timestamp timestamp = 0;

    /// JSON представление (RapidJSON)
    std::string to_json() const;
};

/// Получатель событий
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void publish(const std::string& event_name, const HuntEvent& event) = 0;
};

/// Подписчики по имени события
class EventBus : public NotificationSink {
public:
    using Listener = std::function<void(const HuntEvent&)>;
    using ListenerId = std::uint64_t;

    explicit EventBus(output::Writer* writer = nullptr) : writer_(writer) {}

    /// Подписаться на событие; возвращает id для unsubscribe
    ListenerId subscribe(const std::string& event_name, Listener listener);

    /// @return false если id не найден
    bool unsubscribe(ListenerId id);

    /// Вызвать всех подписчиков события (вне блокировки)
    void publish(const std::string& event_name, const HuntEvent& event) override;

    std::size_t listener_count(const std::string& event_name) const;

    /// Количество вызовов подписчиков, завершившихся исключением
    std::uint64_t failed_deliveries() const;

private:
    struct Subscription {
        ListenerId id = 0;
        Listener listener;
    };

    output::Writer* writer_;
    mutable std::mutex mutex_;
    ListenerId next_id_ = 1;
    std::uint64_t failed_ = 0;
    std::unordered_map<std::string, std::vector<Subscription>> listeners_;
};

}  // namespace fleethunt::hunt

#endif  // FLEETHUNT_NOTIFICATION_HPP

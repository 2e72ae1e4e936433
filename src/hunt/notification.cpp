// ==============================================================================
// notification.cpp - События завершения задач hunt
// ==============================================================================

#include <fleethunt/notification.hpp>
#include <fleethunt/output.hpp>

#include <algorithm>
#include <exception>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace fleethunt::hunt {

// ============================================================================
// HuntEvent
// ============================================================================

std::string HuntEvent::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("hunt_id");
    writer.String(hunt_id.c_str(), static_cast<rapidjson::SizeType>(hunt_id.size()));
    writer.Key("hunt_name");
    writer.String(hunt_name.c_str(), static_cast<rapidjson::SizeType>(hunt_name.size()));
    writer.Key("client_id");
    writer.String(client_id.c_str(), static_cast<rapidjson::SizeType>(client_id.size()));
    writer.Key("outcome");
    writer.String(outcome.c_str(), static_cast<rapidjson::SizeType>(outcome.size()));
    if (!message.empty()) {
        writer.Key("message");
        writer.String(message.c_str(), static_cast<rapidjson::SizeType>(message.size()));
    }
    writer.Key("timestamp");
    writer.Int64(timestamp);
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

// ============================================================================
// EventBus
// ============================================================================

EventBus::ListenerId EventBus::subscribe(const std::string& event_name, Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    listeners_[event_name].push_back(Subscription{id, std::move(listener)});
    return id;
}

bool EventBus::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, subs] : listeners_) {
        auto it = std::find_if(subs.begin(), subs.end(),
                               [id](const Subscription& s) { return s.id == id; });
        if (it != subs.end()) {
            subs.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const std::string& event_name, const HuntEvent& event) {
    // Копия списка: подписчик может подписываться/отписываться во время вызова
    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(event_name);
        if (it == listeners_.end()) {
            return;
        }
        targets = it->second;
    }

    for (const auto& sub : targets) {
        try {
            sub.listener(event);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++failed_;
            }
            if (writer_ != nullptr) {
                writer_->warn("listener for '" + event_name + "' failed on client " +
                              event.client_id + ": " + e.what());
            }
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++failed_;
            }
            if (writer_ != nullptr) {
                writer_->warn("listener for '" + event_name + "' failed on client " +
                              event.client_id + ": unknown exception");
            }
        }
    }
}

std::size_t EventBus::listener_count(const std::string& event_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(event_name);
    return it != listeners_.end() ? it->second.size() : 0;
}

std::uint64_t EventBus::failed_deliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

}  // namespace fleethunt::hunt

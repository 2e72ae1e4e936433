// ==============================================================================
// assignment.cpp - Учёт назначений (hunt, client)
// ==============================================================================

#include <fleethunt/assignment.hpp>
#include <functional>

namespace fleethunt::foreman {

std::size_t AssignmentStore::KeyHash::operator()(const Key& key) const {
    const std::size_t h1 = std::hash<std::string>{}(key.first);
    const std::size_t h2 = std::hash<std::string>{}(key.second);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

AssignmentStore::Shard& AssignmentStore::shard_for(const Key& key) {
    return shards_[KeyHash{}(key) % SHARD_COUNT];
}

const AssignmentStore::Shard& AssignmentStore::shard_for(const Key& key) const {
    return shards_[KeyHash{}(key) % SHARD_COUNT];
}

bool AssignmentStore::try_assign(const std::string& hunt_id, const std::string& client_id) {
    Key key{hunt_id, client_id};
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.keys.insert(std::move(key)).second;
}

bool AssignmentStore::contains(const std::string& hunt_id, const std::string& client_id) const {
    const Key key{hunt_id, client_id};
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.keys.count(key) > 0;
}

std::size_t AssignmentStore::count(const std::string& hunt_id) const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& key : shard.keys) {
            if (key.first == hunt_id) {
                ++total;
            }
        }
    }
    return total;
}

std::size_t AssignmentStore::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.keys.size();
    }
    return total;
}

}  // namespace fleethunt::foreman

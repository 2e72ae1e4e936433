// ==============================================================================
// fleethunt/assignment.hpp - Учёт назначений (hunt, client)
// ==============================================================================
//
// Назначение:
// - AssignmentStore: атомарный check-and-set для пары (hunt_id, client_id)
// - Наличие записи означает, что dispatch уже произошёл ровно один раз
// - Записи живут всё время жизни hunt (в том числе через Pause/Run)
//
// Записи распределены по шардам; каждый шард под своим mutex, поэтому
// check-in разных клиентов не сериализуются одной блокировкой.
//
// ==============================================================================

#ifndef FLEETHUNT_ASSIGNMENT_HPP
#define FLEETHUNT_ASSIGNMENT_HPP

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

namespace fleethunt::foreman {

class AssignmentStore {
public:
    AssignmentStore() = default;

    AssignmentStore(const AssignmentStore&) = delete;
    AssignmentStore& operator=(const AssignmentStore&) = delete;

    /// Записать назначение, если его ещё нет
    /// @return true если запись создана этим вызовом (первый dispatch)
    bool try_assign(const std::string& hunt_id, const std::string& client_id);

    /// Проверить наличие назначения
    bool contains(const std::string& hunt_id, const std::string& client_id) const;

    /// Количество назначений hunt
    std::size_t count(const std::string& hunt_id) const;

    /// Общее количество назначений
    std::size_t size() const;

private:
    static constexpr std::size_t SHARD_COUNT = 16;

    /// Пара (hunt_id, client_id); id не склеиваются в строку, поэтому
    /// произвольные символы в id не приводят к коллизиям
    using Key = std::pair<std::string, std::string>;

    struct KeyHash {
        std::size_t operator()(const Key& key) const;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_set<Key, KeyHash> keys;
    };

    Shard& shard_for(const Key& key);
    const Shard& shard_for(const Key& key) const;

    std::array<Shard, SHARD_COUNT> shards_;
};

}  // namespace fleethunt::foreman

#endif  // FLEETHUNT_ASSIGNMENT_HPP

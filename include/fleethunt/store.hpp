// ==============================================================================
// fleethunt/store.hpp - Attribute store (внешний коллаборатор)
// ==============================================================================
//
// Назначение:
// - AttributeStore: интерфейс хранилища объектов с многозначной историей
//   атрибутов (append-only лог на пару (urn, attribute))
// - MemoryStore: потокобезопасная in-memory реализация (тесты, CLI)
// - unique_values: чтение лога как множества (дедупликация при чтении)
//
// ==============================================================================

#ifndef FLEETHUNT_STORE_HPP
#define FLEETHUNT_STORE_HPP

#include <fleethunt/platform.hpp>
#include <fleethunt/value.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleethunt::store {

using platform::Timestamp;

/// Одна версия значения атрибута
struct Entry {
    Value value;
    Timestamp timestamp = 0;
};

class AttributeStore;

// ----------------------------------------------------------------------------
// Object - объект, открытый через AttributeStore::open
// ----------------------------------------------------------------------------

/// Лёгкий handle: urn + ссылка на store
class Object {
public:
    Object(AttributeStore& store, std::string urn) : store_(store), urn_(std::move(urn)) {}

    const std::string& urn() const { return urn_; }

    std::optional<Value> get(const std::string& attribute) const;
    std::vector<Entry> history(const std::string& attribute) const;
    void set(const std::string& attribute, Value value);
    void append(const std::string& attribute, Value value);

private:
    AttributeStore& store_;
    std::string urn_;
};

// ----------------------------------------------------------------------------
// AttributeStore
// ----------------------------------------------------------------------------

class AttributeStore {
public:
    virtual ~AttributeStore() = default;

    /// Открыть объект (создаётся лениво при первой записи)
    Object open(std::string urn) { return Object(*this, std::move(urn)); }

    /// Последнее значение атрибута
    virtual std::optional<Value> get(const std::string& urn, const std::string& attribute) const = 0;

    /// Вся история атрибута в порядке записи
    virtual std::vector<Entry> history(const std::string& urn,
                                       const std::string& attribute) const = 0;

    /// Заменить историю атрибута одним значением
    virtual void set(const std::string& urn, const std::string& attribute, Value value) = 0;

    /// Добавить значение в историю атрибута
    virtual void append(const std::string& urn, const std::string& attribute, Value value) = 0;

    /// Удалить атрибут целиком
    virtual void erase(const std::string& urn, const std::string& attribute) = 0;
};

/// Значения истории без повторов, в порядке первого появления
std::vector<Value> unique_values(const AttributeStore& store, const std::string& urn,
                                 const std::string& attribute);

// ----------------------------------------------------------------------------
// MemoryStore
// ----------------------------------------------------------------------------

class MemoryStore : public AttributeStore {
public:
    explicit MemoryStore(platform::Clock clock = platform::system_clock());

    std::optional<Value> get(const std::string& urn, const std::string& attribute) const override;
    std::vector<Entry> history(const std::string& urn,
                               const std::string& attribute) const override;
    void set(const std::string& urn, const std::string& attribute, Value value) override;
    void append(const std::string& urn, const std::string& attribute, Value value) override;
    void erase(const std::string& urn, const std::string& attribute) override;

    /// Количество объектов (для тестов)
    std::size_t object_count() const;

private:
    using Attributes = std::unordered_map<std::string, std::vector<Entry>>;

    platform::Clock clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Attributes> objects_;
};

}  // namespace fleethunt::store

#endif  // FLEETHUNT_STORE_HPP

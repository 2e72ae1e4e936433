// ==============================================================================
// fleethunt/client.hpp - Запись клиента (агента) и схема атрибутов
// ==============================================================================
//
// Назначение:
// - ClientRecord: id + атрибуты агента (изменяются извне, здесь только чтение)
// - AttributeSchema: набор распознаваемых атрибутов и их типов;
//   правила валидируются по схеме при создании, не при matching
//
// ==============================================================================

#ifndef FLEETHUNT_CLIENT_HPP
#define FLEETHUNT_CLIENT_HPP

#include <fleethunt/value.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleethunt::client {

// ----------------------------------------------------------------------------
// Стандартные имена атрибутов
// ----------------------------------------------------------------------------

/// Строка идентификации агента ("GRR Monitor ...")
constexpr const char* ATTR_GRR_CLIENT = "GRR client";
constexpr const char* ATTR_CLIENT_NAME = "Client Name";
constexpr const char* ATTR_HOSTNAME = "Hostname";
constexpr const char* ATTR_SYSTEM = "System";
constexpr const char* ATTR_RELEASE = "Release";
constexpr const char* ATTR_ARCHITECTURE = "Architecture";
constexpr const char* ATTR_CLIENT_VERSION = "Client Version";
constexpr const char* ATTR_LABELS = "Labels";
constexpr const char* ATTR_CLOCK = "Clock";
constexpr const char* ATTR_INSTALL_DATE = "Install Date";
constexpr const char* ATTR_LAST_BOOT_TIME = "Last Boot Time";

// ----------------------------------------------------------------------------
// ClientRecord
// ----------------------------------------------------------------------------

/// Снимок атрибутов агента на момент check-in
struct ClientRecord {
    std::string id;
    std::unordered_map<std::string, Value> attributes;

    /// Значение атрибута или nullptr
    const Value* find(const std::string& name) const {
        auto it = attributes.find(name);
        return it != attributes.end() ? &it->second : nullptr;
    }

    ClientRecord& set(const std::string& name, Value value) {
        attributes[name] = std::move(value);
        return *this;
    }
};

// ----------------------------------------------------------------------------
// AttributeSchema
// ----------------------------------------------------------------------------

/// Распознаваемые атрибуты клиента
class AttributeSchema {
public:
    AttributeSchema() = default;

    /// Схема со стандартными атрибутами (строковые + целочисленные)
    static const AttributeSchema& defaults();

    /// Зарегистрировать атрибут
    AttributeSchema& add(std::string name, Value::Type type);

    /// Тип атрибута или nullopt, если атрибут не распознан
    std::optional<Value::Type> find(const std::string& name) const;

    bool contains(const std::string& name) const { return types_.count(name) > 0; }

    /// Имена всех атрибутов (отсортированы)
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, Value::Type> types_;
};

}  // namespace fleethunt::client

#endif  // FLEETHUNT_CLIENT_HPP

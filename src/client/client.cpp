// ==============================================================================
// client.cpp - Схема атрибутов клиента
// ==============================================================================

#include <algorithm>
#include <fleethunt/client.hpp>

namespace fleethunt::client {

const AttributeSchema& AttributeSchema::defaults() {
    static const AttributeSchema schema = [] {
        AttributeSchema s;
        s.add(ATTR_GRR_CLIENT, Value::Type::String)
            .add(ATTR_CLIENT_NAME, Value::Type::String)
            .add(ATTR_HOSTNAME, Value::Type::String)
            .add(ATTR_SYSTEM, Value::Type::String)
            .add(ATTR_RELEASE, Value::Type::String)
            .add(ATTR_ARCHITECTURE, Value::Type::String)
            .add(ATTR_CLIENT_VERSION, Value::Type::String)
            .add(ATTR_LABELS, Value::Type::String)
            .add(ATTR_CLOCK, Value::Type::Int)
            .add(ATTR_INSTALL_DATE, Value::Type::Int)
            .add(ATTR_LAST_BOOT_TIME, Value::Type::Int);
        return s;
    }();
    return schema;
}

AttributeSchema& AttributeSchema::add(std::string name, Value::Type type) {
    types_[std::move(name)] = type;
    return *this;
}

std::optional<Value::Type> AttributeSchema::find(const std::string& name) const {
    auto it = types_.find(name);
    if (it == types_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> AttributeSchema::names() const {
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto& [name, type] : types_) {
        (void)type;
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace fleethunt::client

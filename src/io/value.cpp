// ==============================================================================
// value.cpp - Реализация Value
// ==============================================================================

#include <cmath>
#include <fleethunt/value.hpp>
#include <stdexcept>

namespace fleethunt {

std::string Value::to_string() const {
    switch (type()) {
    case Type::Int:
        return std::to_string(as_int());
    case Type::Double: {
        std::string s = std::to_string(as_double());
        // Убираем хвостовые нули: "1.500000" -> "1.5"
        auto dot = s.find('.');
        if (dot != std::string::npos) {
            while (!s.empty() && s.back() == '0') {
                s.pop_back();
            }
            if (!s.empty() && s.back() == '.') {
                s.pop_back();
            }
        }
        return s;
    }
    case Type::String:
        return as_string();
    case Type::Null:
    default:
        return "";
    }
}

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
    case Type::Int:
        return as_int() == other.as_int();
    case Type::Double:
        return as_double() == other.as_double();
    case Type::String:
        return as_string() == other.as_string();
    case Type::Null:
    default:
        return true;
    }
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------
//
// Порядок приоритета для чисел: Int64 → Double. UInt64 вне диапазона Int64
// не представим и отвергается.
//

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsNumber()) {
        if (json.IsInt64()) {
            return Value(static_cast<std::int64_t>(json.GetInt64()));
        }
        if (json.IsUint64()) {
            throw std::invalid_argument("integer attribute value out of range");
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    throw std::invalid_argument("attribute value must be a string, a number or null");
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    switch (type()) {
    case Type::Int:
        out.SetInt64(as_int());
        return;
    case Type::Double: {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }
    case Type::String: {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }
    case Type::Null:
    default:
        out.SetNull();
        return;
    }
}

const char* to_string(Value::Type type) {
    switch (type) {
    case Value::Type::Int:
        return "integer";
    case Value::Type::Double:
        return "float";
    case Value::Type::String:
        return "string";
    case Value::Type::Null:
    default:
        return "null";
    }
}

}  // namespace fleethunt

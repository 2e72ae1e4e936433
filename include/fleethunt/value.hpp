// ==============================================================================
// fleethunt/value.hpp - Значение атрибута
// ==============================================================================
//
// Назначение:
// - Значение атрибута клиента или записи attribute store
// - Явная типизация: Null / Int / Double / String
// - Конверсия из/в RapidJSON Value (персистентность правил, JSON вывод)
//
// ==============================================================================

#ifndef FLEETHUNT_VALUE_HPP
#define FLEETHUNT_VALUE_HPP

#include <cstdint>
#include <string>
#include <variant>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace fleethunt {

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

/// Значение атрибута (скаляр)
class Value {
public:
    struct Null {};
    using Int64 = std::int64_t;
    using Double = double;
    using String = std::string;

    /// Тип значения (для валидации правил и сообщений об ошибках)
    enum class Type { Null, Int, Double, String };

private:
    std::variant<Null, Int64, Double, String> data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}

    explicit Value(std::int64_t v) : data_(v) {}

    explicit Value(int v) : data_(static_cast<Int64>(v)) {}

    explicit Value(double v) : data_(v) {}

    explicit Value(std::string v) : data_(std::move(v)) {}

    explicit Value(const char* v) : data_(std::string(v)) {}

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    Type type() const { return static_cast<Type>(data_.index()); }

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// Получить int64 значение (undefined behavior если не is_int())
    Int64 as_int() const { return std::get<Int64>(data_); }

    /// Получить double значение (undefined behavior если не is_double())
    Double as_double() const { return std::get<Double>(data_); }

    /// Получить string значение (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    const Int64* get_int() const { return std::get_if<Int64>(&data_); }

    const Double* get_double() const { return std::get_if<Double>(&data_); }

    const String* get_string() const { return std::get_if<String>(&data_); }

    /// Текстовое представление (для таблиц и логов)
    std::string to_string() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value
    /// @throw std::invalid_argument для массивов/объектов/bool
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;
};

/// Имя типа для сообщений об ошибках
const char* to_string(Value::Type type);

}  // namespace fleethunt

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // FLEETHUNT_VALUE_HPP

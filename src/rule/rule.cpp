// ==============================================================================
// rule.cpp - Правила Foreman: создание, валидация, matching, JSON
// ==============================================================================

#include <fleethunt/error.hpp>
#include <fleethunt/rule.hpp>

#include <charconv>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace fleethunt::rule {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

void require_attribute(const std::string& name, Value::Type expected,
                       const client::AttributeSchema& schema) {
    auto type = schema.find(name);
    if (!type) {
        throw ValidationError("unknown attribute '" + name + "' in rule");
    }
    if (*type != expected) {
        throw ValidationError("attribute '" + name + "' is " + fleethunt::to_string(*type) +
                              ", rule expects " + fleethunt::to_string(expected));
    }
}

/// Целочисленное значение атрибута; строка допускается, если это целое число
std::optional<std::int64_t> integer_value(const Value& value) {
    if (const auto* i = value.get_int()) {
        return *i;
    }
    if (const auto* s = value.get_string()) {
        std::int64_t parsed = 0;
        const char* begin = s->data();
        const char* end = begin + s->size();
        auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (ec == std::errc() && ptr == end && begin != end) {
            return parsed;
        }
    }
    return std::nullopt;
}

const rapidjson::Value& member(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        throw ValidationError(std::string("rule JSON is missing '") + name + "'");
    }
    return it->value;
}

std::string string_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsString()) {
        throw ValidationError(std::string("rule JSON field '") + name + "' must be a string");
    }
    return std::string(v.GetString(), v.GetStringLength());
}

std::int64_t int_member(const rapidjson::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.IsInt64()) {
        throw ValidationError(std::string("rule JSON field '") + name + "' must be an integer");
    }
    return v.GetInt64();
}

void add_string(rapidjson::Value& obj, const char* name, const std::string& value,
                rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), alloc);
    obj.AddMember(rapidjson::StringRef(name), v, alloc);
}

}  // namespace

// ============================================================================
// Создание предикатов
// ============================================================================

RegexRule make_regex_rule(std::string attribute_name, std::string pattern,
                          const client::AttributeSchema& schema) {
    require_attribute(attribute_name, Value::Type::String, schema);

    RegexRule rule;
    rule.attribute_name = std::move(attribute_name);
    rule.pattern = std::move(pattern);
    try {
        rule.regex = std::regex(rule.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ValidationError("invalid regex '" + rule.pattern + "': " + e.what());
    }
    return rule;
}

IntegerRule make_integer_rule(std::string attribute_name, IntegerOperator op, std::int64_t value,
                              const client::AttributeSchema& schema) {
    require_attribute(attribute_name, Value::Type::Int, schema);

    IntegerRule rule;
    rule.attribute_name = std::move(attribute_name);
    rule.op = op;
    rule.value = value;
    return rule;
}

RuleGroup make_group(std::vector<Predicate> predicates) {
    RuleGroup group;
    for (auto& p : predicates) {
        std::visit(
            [&group](auto&& pred) {
                using T = std::decay_t<decltype(pred)>;
                if constexpr (std::is_same_v<T, RegexRule>) {
                    group.regex_rules.push_back(std::move(pred));
                } else {
                    group.integer_rules.push_back(std::move(pred));
                }
            },
            p);
    }
    return group;
}

// ============================================================================
// Сравнение
// ============================================================================

bool operator==(const RegexRule& a, const RegexRule& b) {
    // std::regex не сравним: сравниваем исходный pattern
    return a.attribute_name == b.attribute_name && a.pattern == b.pattern;
}

bool operator==(const IntegerRule& a, const IntegerRule& b) {
    return a.attribute_name == b.attribute_name && a.op == b.op && a.value == b.value;
}

bool operator==(const RuleGroup& a, const RuleGroup& b) {
    return a.regex_rules == b.regex_rules && a.integer_rules == b.integer_rules;
}

bool operator==(const ForemanRule& a, const ForemanRule& b) {
    return a.group == b.group && a.action.hunt_id == b.action.hunt_id &&
           a.action.hunt_name == b.action.hunt_name &&
           a.action.client_limit == b.action.client_limit && a.created == b.created &&
           a.expires == b.expires && a.description == b.description;
}

// ============================================================================
// Валидация
// ============================================================================

void validate(const RuleGroup& group, const client::AttributeSchema& schema) {
    if (group.empty()) {
        throw ValidationError("rule group must contain at least one predicate");
    }
    for (const auto& r : group.regex_rules) {
        require_attribute(r.attribute_name, Value::Type::String, schema);
    }
    for (const auto& r : group.integer_rules) {
        require_attribute(r.attribute_name, Value::Type::Int, schema);
    }
}

// ============================================================================
// Matching
// ============================================================================

bool matches(const RegexRule& rule, const client::ClientRecord& client) {
    const Value* value = client.find(rule.attribute_name);
    if (value == nullptr || value->is_null()) {
        return false;
    }
    if (const auto* s = value->get_string()) {
        return std::regex_match(*s, rule.regex);
    }
    // Атрибут изменён извне и стал числом: сравниваем текстовое представление
    return std::regex_match(value->to_string(), rule.regex);
}

bool matches(const IntegerRule& rule, const client::ClientRecord& client) {
    const Value* value = client.find(rule.attribute_name);
    if (value == nullptr) {
        return false;
    }
    auto actual = integer_value(*value);
    if (!actual) {
        return false;
    }
    switch (rule.op) {
    case IntegerOperator::LessThan:
        return *actual < rule.value;
    case IntegerOperator::Equal:
        return *actual == rule.value;
    case IntegerOperator::GreaterThan:
        return *actual > rule.value;
    }
    return false;
}

bool matches(const RuleGroup& group, const client::ClientRecord& client) {
    for (const auto& r : group.regex_rules) {
        if (!matches(r, client)) {
            return false;
        }
    }
    for (const auto& r : group.integer_rules) {
        if (!matches(r, client)) {
            return false;
        }
    }
    return true;
}

bool matches_any(const std::vector<RuleGroup>& groups, const client::ClientRecord& client) {
    for (const auto& g : groups) {
        if (matches(g, client)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Строковые представления
// ============================================================================

IntegerOperator parse_operator(std::string_view s) {
    if (s == "LESS_THAN") {
        return IntegerOperator::LessThan;
    }
    if (s == "EQUAL") {
        return IntegerOperator::Equal;
    }
    if (s == "GREATER_THAN") {
        return IntegerOperator::GreaterThan;
    }
    throw ValidationError("unknown integer operator '" + std::string(s) + "'");
}

std::string to_string(IntegerOperator op) {
    switch (op) {
    case IntegerOperator::LessThan:
        return "LESS_THAN";
    case IntegerOperator::Equal:
        return "EQUAL";
    case IntegerOperator::GreaterThan:
        return "GREATER_THAN";
    }
    return "EQUAL";
}

std::string describe(const RuleGroup& group) {
    std::string result;
    auto append = [&result](const std::string& part) {
        if (!result.empty()) {
            result += " AND ";
        }
        result += part;
    };

    for (const auto& r : group.regex_rules) {
        append(r.attribute_name + " =~ " + r.pattern);
    }
    for (const auto& r : group.integer_rules) {
        const char* sym = r.op == IntegerOperator::LessThan  ? " < "
                          : r.op == IntegerOperator::Equal ? " == "
                                                           : " > ";
        append(r.attribute_name + sym + std::to_string(r.value));
    }
    return result;
}

// ============================================================================
// JSON
// ============================================================================
//
// Формат:
// {"hunt_id": "...", "hunt_name": "...", "client_limit": 0,
//  "created": 0, "expires": 0, "description": "...",
//  "regex_rules": [{"attribute_name": "...", "attribute_regex": "..."}],
//  "integer_rules": [{"attribute_name": "...", "operator": "...", "value": 0}]}
//

std::string to_json(const ForemanRule& rule) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    add_string(doc, "hunt_id", rule.action.hunt_id, alloc);
    add_string(doc, "hunt_name", rule.action.hunt_name, alloc);
    doc.AddMember("client_limit", rule.action.client_limit, alloc);
    doc.AddMember("created", static_cast<std::int64_t>(rule.created), alloc);
    doc.AddMember("expires", static_cast<std::int64_t>(rule.expires), alloc);
    add_string(doc, "description", rule.description, alloc);

    rapidjson::Value regex_rules(rapidjson::kArrayType);
    for (const auto& r : rule.group.regex_rules) {
        rapidjson::Value item(rapidjson::kObjectType);
        add_string(item, "attribute_name", r.attribute_name, alloc);
        add_string(item, "attribute_regex", r.pattern, alloc);
        regex_rules.PushBack(item, alloc);
    }
    doc.AddMember("regex_rules", regex_rules, alloc);

    rapidjson::Value integer_rules(rapidjson::kArrayType);
    for (const auto& r : rule.group.integer_rules) {
        rapidjson::Value item(rapidjson::kObjectType);
        add_string(item, "attribute_name", r.attribute_name, alloc);
        add_string(item, "operator", to_string(r.op), alloc);
        item.AddMember("value", static_cast<std::int64_t>(r.value), alloc);
        integer_rules.PushBack(item, alloc);
    }
    doc.AddMember("integer_rules", integer_rules, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

ForemanRule from_json(std::string_view json, const client::AttributeSchema& schema) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw ValidationError(std::string("invalid rule JSON: ") +
                              rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw ValidationError("rule JSON must be an object");
    }

    ForemanRule rule;
    rule.action.hunt_id = string_member(doc, "hunt_id");
    rule.action.hunt_name = string_member(doc, "hunt_name");
    std::int64_t limit = int_member(doc, "client_limit");
    if (limit < 0 || limit > static_cast<std::int64_t>(UINT32_MAX)) {
        throw ValidationError("rule JSON client_limit out of range");
    }
    rule.action.client_limit = static_cast<std::uint32_t>(limit);
    rule.created = int_member(doc, "created");
    rule.expires = int_member(doc, "expires");
    rule.description = string_member(doc, "description");

    const auto& regex_rules = member(doc, "regex_rules");
    const auto& integer_rules = member(doc, "integer_rules");
    if (!regex_rules.IsArray() || !integer_rules.IsArray()) {
        throw ValidationError("rule JSON predicates must be arrays");
    }

    for (const auto& item : regex_rules.GetArray()) {
        rule.group.regex_rules.push_back(make_regex_rule(
            string_member(item, "attribute_name"), string_member(item, "attribute_regex"), schema));
    }
    for (const auto& item : integer_rules.GetArray()) {
        rule.group.integer_rules.push_back(make_integer_rule(
            string_member(item, "attribute_name"), parse_operator(string_member(item, "operator")),
            int_member(item, "value"), schema));
    }

    validate(rule.group, schema);
    return rule;
}

}  // namespace fleethunt::rule

// ==============================================================================
// fleethunt/rule.hpp - Правила Foreman и их сопоставление с клиентами
// ==============================================================================
//
// Назначение:
// - RegexRule / IntegerRule: предикаты над атрибутами клиента
// - RuleGroup: конъюнкция предикатов (один вызов Hunt::add_rule)
// - ForemanRule: группа + действие (hunt) + created/expires
// - Сопоставление (matches) и валидация по AttributeSchema
// - JSON сериализация для персистентности таблицы правил
//
// Семантика:
// - предикаты внутри группы объединяются через AND
// - группы одного hunt объединяются через OR
// - regex: полное совпадение строки (std::regex_match), с учётом регистра
// - имя атрибута проверяется при создании правила, не при matching
//
// ==============================================================================

#ifndef FLEETHUNT_RULE_HPP
#define FLEETHUNT_RULE_HPP

#include <cstdint>
#include <fleethunt/client.hpp>
#include <fleethunt/platform.hpp>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fleethunt::rule {

using platform::Timestamp;

// ============================================================================
// Предикаты
// ============================================================================

/// Оператор сравнения для IntegerRule
enum class IntegerOperator { LessThan, Equal, GreaterThan };

/// Предикат: строковое значение атрибута полностью совпадает с regex
struct RegexRule {
    std::string attribute_name;
    std::string pattern;
    std::regex regex;  // скомпилированный pattern
};

/// Предикат: целочисленное значение атрибута <op> value
struct IntegerRule {
    std::string attribute_name;
    IntegerOperator op = IntegerOperator::Equal;
    std::int64_t value = 0;
};

using Predicate = std::variant<RegexRule, IntegerRule>;

/// Создать RegexRule
/// @throw ValidationError если атрибут не распознан, не строковый или regex некорректен
RegexRule make_regex_rule(std::string attribute_name, std::string pattern,
                          const client::AttributeSchema& schema = client::AttributeSchema::defaults());

/// Создать IntegerRule
/// @throw ValidationError если атрибут не распознан или не целочисленный
IntegerRule make_integer_rule(std::string attribute_name, IntegerOperator op, std::int64_t value,
                              const client::AttributeSchema& schema = client::AttributeSchema::defaults());

// ============================================================================
// RuleGroup
// ============================================================================

/// Конъюнктивная группа предикатов (одна OR-ветвь hunt)
struct RuleGroup {
    std::vector<RegexRule> regex_rules;
    std::vector<IntegerRule> integer_rules;

    bool empty() const { return regex_rules.empty() && integer_rules.empty(); }

    std::size_t size() const { return regex_rules.size() + integer_rules.size(); }
};

/// Собрать группу из набора предикатов
RuleGroup make_group(std::vector<Predicate> predicates);

bool operator==(const RegexRule& a, const RegexRule& b);
bool operator==(const IntegerRule& a, const IntegerRule& b);
bool operator==(const RuleGroup& a, const RuleGroup& b);

/// Проверить группу по схеме
/// @throw ValidationError при пустой группе, неизвестном атрибуте или несовпадении типа
void validate(const RuleGroup& group, const client::AttributeSchema& schema);

// ============================================================================
// ForemanRule
// ============================================================================

/// Действие, запускаемое при совпадении правила
struct Action {
    std::string hunt_id;
    std::string hunt_name;
    std::uint32_t client_limit = 0;  // 0 = без ограничения
};

/// Правило в активной таблице Foreman
struct ForemanRule {
    RuleGroup group;
    Action action;
    Timestamp created = 0;
    Timestamp expires = 0;
    std::string description;
};

bool operator==(const ForemanRule& a, const ForemanRule& b);

/// Истекло ли правило к моменту now
inline bool is_expired(const ForemanRule& rule, Timestamp now) {
    return now >= rule.expires;
}

// ============================================================================
// Matching (RuleMatcher)
// ============================================================================

bool matches(const RegexRule& rule, const client::ClientRecord& client);

bool matches(const IntegerRule& rule, const client::ClientRecord& client);

/// Все предикаты группы истинны
bool matches(const RuleGroup& group, const client::ClientRecord& client);

/// Хотя бы одна группа совпала
bool matches_any(const std::vector<RuleGroup>& groups, const client::ClientRecord& client);

// ============================================================================
// Строковые представления
// ============================================================================

/// "LESS_THAN" | "EQUAL" | "GREATER_THAN"
/// @throw ValidationError если строка не распознана
IntegerOperator parse_operator(std::string_view s);

std::string to_string(IntegerOperator op);

/// Человекочитаемое описание группы: `Client Name =~ GRR AND Clock > 5`
std::string describe(const RuleGroup& group);

// ============================================================================
// JSON (RapidJSON)
// ============================================================================

/// Сериализовать правило в JSON строку
std::string to_json(const ForemanRule& rule);

/// Восстановить правило из JSON строки
/// @throw ValidationError при некорректном JSON или несовместимом правиле
ForemanRule from_json(std::string_view json,
                      const client::AttributeSchema& schema = client::AttributeSchema::defaults());

}  // namespace fleethunt::rule

#endif  // FLEETHUNT_RULE_HPP

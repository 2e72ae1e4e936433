// ==============================================================================
// fleethunt/rule_store.hpp - Активная таблица правил Foreman
// ==============================================================================
//
// Назначение:
// - RuleStore: таблица ForemanRule, в которую hunt публикует свои правила
// - Читатели (check-in) получают неизменяемый snapshot; запись заменяет
//   snapshot целиком (copy-on-write), поэтому частично обновлённая группа
//   правил никогда не видна
// - save/restore: персистентность таблицы в AttributeStore (JSON строки)
//
// Таблица может содержать "чужие" правила (без зарегистрированного hunt):
// они переживают Stop других hunt.
//
// ==============================================================================

#ifndef FLEETHUNT_RULE_STORE_HPP
#define FLEETHUNT_RULE_STORE_HPP

#include <cstddef>
#include <fleethunt/rule.hpp>
#include <fleethunt/store.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fleethunt::output {
class Writer;
}

namespace fleethunt::foreman {

/// urn объекта Foreman в AttributeStore
constexpr const char* FOREMAN_URN = "foreman";

/// Атрибут с JSON правилами (по одному значению истории на правило)
constexpr const char* ATTR_RULES = "RULES";

class RuleStore {
public:
    using Snapshot = std::shared_ptr<const std::vector<rule::ForemanRule>>;

    explicit RuleStore(output::Writer* writer = nullptr);

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    /// Заменить все правила hunt_id на rules (идемпотентно)
    void publish(const std::string& hunt_id, std::vector<rule::ForemanRule> rules);

    /// Удалить правила hunt_id
    /// @return количество удалённых правил
    std::size_t remove(const std::string& hunt_id);

    /// Добавить одиночное правило; точный дубликат игнорируется
    /// @return false если такое правило уже есть
    bool add(rule::ForemanRule rule);

    /// Текущий неизменяемый снимок таблицы
    Snapshot snapshot() const;

    std::size_t size() const;

    /// Количество правил hunt_id
    std::size_t count(const std::string& hunt_id) const;

    /// Удалить истёкшие правила
    /// @return количество удалённых
    std::size_t prune_expired(platform::Timestamp now);

    void clear();

    /// Сохранить таблицу под urn (заменяет прежнее содержимое)
    void save(store::AttributeStore& store, const std::string& urn = FOREMAN_URN) const;

    /// Заменить таблицу содержимым store
    /// @return количество восстановленных правил
    /// @throw ValidationError при некорректном JSON правила
    std::size_t restore(const store::AttributeStore& store, const std::string& urn = FOREMAN_URN,
                        const client::AttributeSchema& schema = client::AttributeSchema::defaults());

private:
    output::Writer* writer_;
    mutable std::shared_mutex mutex_;
    Snapshot rules_;
};

}  // namespace fleethunt::foreman

#endif  // FLEETHUNT_RULE_STORE_HPP

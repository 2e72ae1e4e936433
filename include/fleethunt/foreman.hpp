// ==============================================================================
// fleethunt/foreman.hpp - Foreman: назначение hunt клиентам при check-in
// ==============================================================================
//
// Назначение:
// - on_check_in: сопоставить клиента со всеми активными правилами и
//   запустить совпавшие hunt (не более одного раза на пару hunt/клиент)
// - post_result: передать завершённую задачу её hunt
// - create_hunt: создать hunt, связанный с таблицей правил Foreman
//
// Foreman не владеет состоянием: RuleStore, AssignmentStore и HuntRegistry
// внедряются при создании, поэтому тесты строят изолированные экземпляры.
// Параллельные check-in разных клиентов не блокируют друг друга: чтение
// правил идёт по неизменяемому snapshot.
//
// ==============================================================================

#ifndef FLEETHUNT_FOREMAN_HPP
#define FLEETHUNT_FOREMAN_HPP

#include <cstddef>
#include <fleethunt/assignment.hpp>
#include <fleethunt/client.hpp>
#include <fleethunt/hunt.hpp>
#include <fleethunt/platform.hpp>
#include <fleethunt/rule_store.hpp>
#include <memory>

namespace fleethunt::output {
class Writer;
}

namespace fleethunt::foreman {

class Foreman {
public:
    Foreman(RuleStore& rules, AssignmentStore& assignments, hunt::HuntRegistry& hunts,
            output::Writer* writer = nullptr, platform::Clock clock = platform::system_clock());

    Foreman(const Foreman&) = delete;
    Foreman& operator=(const Foreman&) = delete;

    /// Обработать check-in клиента
    /// @return количество новых dispatch
    /// @throw ValidationError если у клиента нет id
    std::size_t on_check_in(const client::ClientRecord& client);

    /// Передать результат задачи hunt
    /// @return false если hunt неизвестен или исход клиента уже записан
    bool post_result(const hunt::TaskResult& result);

    /// Создать и зарегистрировать hunt (с часами и Writer этого Foreman)
    /// @throw ValidationError при некорректной конфигурации
    std::shared_ptr<hunt::Hunt> create_hunt(hunt::HuntConfig config,
                                            std::shared_ptr<hunt::Dispatcher> dispatcher,
                                            hunt::HuntServices services = hunt::HuntServices());

    /// Удалить истёкшие правила
    std::size_t prune_expired();

    RuleStore& rules() { return rules_; }
    AssignmentStore& assignments() { return assignments_; }
    hunt::HuntRegistry& hunts() { return hunts_; }

private:
    RuleStore& rules_;
    AssignmentStore& assignments_;
    hunt::HuntRegistry& hunts_;
    output::Writer* writer_;
    platform::Clock clock_;
};

}  // namespace fleethunt::foreman

#endif  // FLEETHUNT_FOREMAN_HPP

// ==============================================================================
// fleethunt/approval.hpp - Двухсторонний approval для операций с hunt
// ==============================================================================
//
// Назначение:
// - Token: идентичность вызывающего (username + supervisor override)
// - Approval: запись (hunt, requester, approver, reason) REQUESTED -> GRANTED
// - ApprovalGate: request / grant / check / state
//
// Правила:
// - повторный request с тем же (hunt, requester, reason) возвращает
//   существующую запись
// - grant выполняет любая идентичность, отличная от requester; reason должен
//   точно совпасть с открытым запросом
// - GRANTED терминален, отзыва нет
// - check проходит для supervisor или при GRANTED записи, покрывающей действие;
//   иначе AuthorizationError
//
// ==============================================================================

#ifndef FLEETHUNT_APPROVAL_HPP
#define FLEETHUNT_APPROVAL_HPP

#include <fleethunt/platform.hpp>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace fleethunt::output {
class Writer;
}

namespace fleethunt::approval {

// ----------------------------------------------------------------------------
// Действия и состояния
// ----------------------------------------------------------------------------

/// Защищённые переходы жизненного цикла hunt
enum class ProtectedAction { Run, Pause, Modify, Stop };

/// "RUN" | "PAUSE" | "MODIFY" | "STOP"
const char* to_string(ProtectedAction action);

/// @throw ValidationError если строка не распознана
ProtectedAction parse_action(std::string_view s);

/// Все защищённые действия (покрытие запроса по умолчанию)
const std::vector<ProtectedAction>& all_actions();

enum class ApprovalState { Unrequested, Requested, Granted };

/// "UNREQUESTED" | "REQUESTED" | "GRANTED"
const char* to_string(ApprovalState state);

// ----------------------------------------------------------------------------
// Token
// ----------------------------------------------------------------------------

/// Идентичность вызывающего
struct Token {
    std::string username;
    bool supervisor = false;  // административный override
};

// ----------------------------------------------------------------------------
// Approval
// ----------------------------------------------------------------------------

struct Approval {
    std::string hunt_id;
    std::string requester;
    std::string approver;  // предложенный approver из запроса
    std::string reason;
    std::vector<ProtectedAction> actions;

    bool granted = false;
    std::string granted_by;
    platform::Timestamp requested_at = 0;
    platform::Timestamp granted_at = 0;

    bool covers(ProtectedAction action) const;

    ApprovalState state() const {
        return granted ? ApprovalState::Granted : ApprovalState::Requested;
    }
};

// ----------------------------------------------------------------------------
// ApprovalGate
// ----------------------------------------------------------------------------

class ApprovalGate {
public:
    explicit ApprovalGate(output::Writer* writer = nullptr,
                          platform::Clock clock = platform::system_clock());

    ApprovalGate(const ApprovalGate&) = delete;
    ApprovalGate& operator=(const ApprovalGate&) = delete;

    /// Создать запрос (или вернуть существующий для той же тройки)
    /// @throw ValidationError при пустых полях или requester == approver
    Approval request(const std::string& hunt_id, const std::string& requester,
                     const std::string& approver, const std::string& reason,
                     const std::vector<ProtectedAction>& actions = all_actions());

    /// Одобрить запрос requester с данным reason
    /// @throw ValidationError если approver == requester или запрос не найден
    Approval grant(const std::string& hunt_id, const std::string& approver,
                   const std::string& requester, const std::string& reason);

    /// Проверить право actor выполнить action над hunt
    /// @throw AuthorizationError без override и без подходящего GRANTED approval
    void check(const std::string& hunt_id, const Token& actor, ProtectedAction action) const;

    /// Неисключающий вариант check
    bool is_authorized(const std::string& hunt_id, const Token& actor,
                       ProtectedAction action) const;

    /// GRANTED если хотя бы одна запись пары одобрена, иначе REQUESTED/UNREQUESTED
    ApprovalState state(const std::string& hunt_id, const std::string& requester) const;

    std::optional<Approval> find(const std::string& hunt_id, const std::string& requester,
                                 const std::string& reason) const;

    /// Все записи hunt
    std::vector<Approval> approvals(const std::string& hunt_id) const;

private:
    using Key = std::tuple<std::string, std::string, std::string>;  // hunt, requester, reason

    output::Writer* writer_;
    platform::Clock clock_;
    mutable std::shared_mutex mutex_;
    std::map<Key, Approval> records_;
};

}  // namespace fleethunt::approval

#endif  // FLEETHUNT_APPROVAL_HPP

// ==============================================================================
// fleethunt/hunt.hpp - Hunt: жизненный цикл, dispatch, учёт исходов
// ==============================================================================
//
// Назначение:
// - HuntState: CONSTRUCTED -> RUNNING <-> PAUSED -> STOPPED (терминальное)
// - Outcome: Success | Badness | TaskError (ошибка клиента - значение,
//   а не исключение)
// - Dispatcher: внедряемая capability StartClient(hunt_id, client_id, limit)
// - Hunt: правила, лимит клиентов, множества started/finished/errored/badness,
//   статистика ресурсов, журнал и ошибки клиентов
// - HuntRegistry: hunt по id
//
// Конкурентность:
// - переходы и dispatch одного hunt сериализуются mutex hunt
// - исходы разных клиентов пишутся в разные шарды и не блокируют друг друга
// - статистика ресурсов под собственной блокировкой (ResourceUsageStats)
//
// ==============================================================================

#ifndef FLEETHUNT_HUNT_HPP
#define FLEETHUNT_HUNT_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fleethunt/approval.hpp>
#include <fleethunt/assignment.hpp>
#include <fleethunt/client.hpp>
#include <fleethunt/notification.hpp>
#include <fleethunt/platform.hpp>
#include <fleethunt/rule.hpp>
#include <fleethunt/rule_store.hpp>
#include <fleethunt/stats.hpp>
#include <fleethunt/store.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace fleethunt::output {
class Writer;
}

namespace fleethunt::hunt {

using platform::Timestamp;

// ============================================================================
// Константы
// ============================================================================

/// Верхняя граница client_limit
constexpr std::uint32_t MAX_CLIENT_LIMIT = 1000;

/// Время жизни правил hunt по умолчанию: 31 день
constexpr Timestamp DEFAULT_EXPIRY = 31LL * 24 * 3600 * platform::MICROS_PER_SECOND;

/// Атрибуты объекта hunt в AttributeStore (urn "hunts/<id>")
constexpr const char* ATTR_CLIENTS = "CLIENTS";
constexpr const char* ATTR_FINISHED = "FINISHED";
constexpr const char* ATTR_BADNESS = "BADNESS";
constexpr const char* ATTR_ERRORS = "ERRORS";
constexpr const char* ATTR_STATE = "STATE";

/// urn объекта hunt
std::string hunt_urn(const std::string& hunt_id);

/// Новый id вида "H:" + 8 hex цифр
std::string generate_hunt_id();

// ============================================================================
// Состояния
// ============================================================================

enum class HuntState { Constructed, Running, Paused, Stopped };

/// "CONSTRUCTED" | "RUNNING" | "PAUSED" | "STOPPED"
const char* to_string(HuntState state);

/// Состояние клиента в рамках hunt
enum class ClientStatus { Unknown, Running, Completed, Bad, Error };

/// "UNKNOWN" | "RUNNING" | "COMPLETED" | "BAD" | "ERROR"
const char* to_string(ClientStatus status);

// ============================================================================
// Outcome
// ============================================================================

/// Задача завершилась без находки
struct Success {};

/// Задача нашла что-то интересное (клиент попадает и в finished)
struct Badness {};

/// Задача завершилась ошибкой
struct TaskError {
    std::string message;
    std::string backtrace;
};

using Outcome = std::variant<Success, Badness, TaskError>;

/// "success" | "badness" | "error"
const char* outcome_name(const Outcome& outcome);

// ============================================================================
// Dispatch
// ============================================================================

/// Запрос на запуск задачи на клиенте
struct TaskRequest {
    std::string hunt_id;
    std::string client_id;
    std::uint32_t client_limit = 0;
};

/// Исполнитель: ставит удалённую задачу в очередь
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    /// Может бросить std::exception: клиент будет помечен как errored
    virtual void start_client(const TaskRequest& request) = 0;
};

/// Потокобезопасная очередь запросов; слой исполнения забирает их через drain
class QueueDispatcher : public Dispatcher {
public:
    void start_client(const TaskRequest& request) override;

    /// Забрать все накопленные запросы
    std::vector<TaskRequest> drain();

    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<TaskRequest> queue_;
};

/// Завершённая задача, пришедшая от слоя исполнения
struct TaskResult {
    std::string hunt_id;
    std::string client_id;
    std::string task_id;
    Outcome outcome;
    std::optional<stats::ResourceSample> usage;
};

// ============================================================================
// Конфигурация и коллабораторы
// ============================================================================

struct HuntConfig {
    std::string id;                 // пусто = generate_hunt_id()
    std::string name = "SampleHunt";
    std::string description;
    std::uint32_t client_limit = 0;  // 0 = без ограничения
    Timestamp expiry = DEFAULT_EXPIRY;
    std::string notification_event;  // пусто = без уведомлений
};

/// Необязательные коллабораторы hunt (nullptr = не используется)
struct HuntServices {
    store::AttributeStore* store = nullptr;
    NotificationSink* notifications = nullptr;
    approval::ApprovalGate* approvals = nullptr;  // nullptr = без ACL проверок
    output::Writer* writer = nullptr;
    const client::AttributeSchema* schema = nullptr;  // nullptr = defaults()
    platform::Clock clock = platform::system_clock();
};

/// Изменяемые параметры (Modify)
struct ModifyRequest {
    std::optional<std::uint32_t> client_limit;
    std::optional<Timestamp> expiry;
};

/// Результат попытки запустить hunt на клиенте
enum class StartResult { Started, AlreadyAssigned, LimitReached, NotRunning };

const char* to_string(StartResult result);

// ============================================================================
// Журнал
// ============================================================================

struct LogEntry {
    std::string client_id;
    std::string message;
    Timestamp timestamp = 0;
};

struct ErrorEntry {
    std::string client_id;
    std::string message;
    std::string backtrace;
    Timestamp timestamp = 0;
};

// ============================================================================
// HuntSummary
// ============================================================================

struct HuntSummary {
    std::string id;
    std::string name;
    HuntState state = HuntState::Constructed;
    std::size_t rule_count = 0;
    std::uint32_t client_limit = 0;
    std::size_t started = 0;
    std::size_t finished = 0;
    std::size_t errored = 0;
    std::size_t badness = 0;
    std::size_t outstanding = 0;
    stats::UsageStatsSnapshot usage;

    /// JSON представление (RapidJSON)
    std::string to_json() const;
};

// ============================================================================
// Hunt
// ============================================================================

class Hunt {
public:
    /// @throw ValidationError если client_limit > MAX_CLIENT_LIMIT или expiry <= 0
    Hunt(HuntConfig config, std::shared_ptr<Dispatcher> dispatcher, foreman::RuleStore& rules,
         foreman::AssignmentStore& assignments, HuntServices services = HuntServices());

    Hunt(const Hunt&) = delete;
    Hunt& operator=(const Hunt&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& notification_event() const { return notification_event_; }

    HuntState state() const;
    std::uint32_t client_limit() const;
    Timestamp expiry() const;

    // Правила
    // -------------------------------------------------------------------------

    /// Добавить OR-ветвь (предикаты группы объединяются через AND)
    /// @throw ValidationError при пустой/некорректной группе или STOPPED hunt
    void add_rule(rule::RuleGroup group);

    void add_rule(std::vector<rule::Predicate> predicates);

    std::vector<rule::RuleGroup> rules() const;

    // Жизненный цикл (проверяется ApprovalGate, если он задан)
    // -------------------------------------------------------------------------

    /// Опубликовать правила; повторный run в RUNNING ничего не делает
    /// @throw ValidationError для STOPPED hunt
    /// @throw AuthorizationError без approval
    void run(const approval::Token* actor = nullptr);

    /// Снять правила, сохранив назначения и исходы
    /// @throw ValidationError если hunt не RUNNING/PAUSED
    void pause(const approval::Token* actor = nullptr);

    /// Снять правила навсегда
    void stop(const approval::Token* actor = nullptr);

    /// Изменить лимит и/или время жизни правил; назначения не сбрасываются
    /// @throw ValidationError для STOPPED hunt или лимита > MAX_CLIENT_LIMIT
    void modify(const ModifyRequest& request, const approval::Token* actor = nullptr);

    // Dispatch
    // -------------------------------------------------------------------------

    /// Атомарно: проверка лимита + запись назначения + вызов Dispatcher
    StartResult try_start_client(const std::string& client_id);

    // Исходы
    // -------------------------------------------------------------------------

    /// Записать терминальный исход клиента
    /// @return false если у клиента уже есть исход (повтор игнорируется)
    bool record_outcome(const std::string& client_id, const Outcome& outcome);

    bool record_success(const std::string& client_id) { return record_outcome(client_id, Success{}); }
    bool record_badness(const std::string& client_id) { return record_outcome(client_id, Badness{}); }
    bool record_error(const std::string& client_id, const std::string& message,
                      const std::string& backtrace = std::string()) {
        return record_outcome(client_id, TaskError{message, backtrace});
    }

    /// Ошибка клиента с backtrace; для клиента с исходом только пишет в errors()
    /// @return true если клиент помечен как errored этим вызовом
    bool log_client_error(const std::string& client_id, const std::string& message,
                          const std::string& backtrace);

    /// Обработать завершённую задачу: статистика ресурсов + исход
    bool process_result(const TaskResult& result);

    /// Записать сообщение журнала
    void log_result(const std::string& client_id, const std::string& message);

    std::vector<LogEntry> logs(const std::optional<std::string>& client_id = std::nullopt) const;

    std::vector<ErrorEntry> errors(const std::optional<std::string>& client_id = std::nullopt) const;

    ClientStatus client_status(const std::string& client_id) const;

    /// Клиенты, запущенные без исхода; 0 после stop()
    std::size_t outstanding_requests() const;

    // Множества (отсортированы)
    // -------------------------------------------------------------------------

    std::vector<std::string> started_clients() const;
    std::vector<std::string> finished_clients() const;
    std::vector<std::string> errored_clients() const;
    std::vector<std::string> bad_clients() const;

    std::size_t started_count() const;
    std::size_t finished_count() const { return finished_count_.load(); }
    std::size_t errored_count() const { return errored_count_.load(); }
    std::size_t badness_count() const { return badness_count_.load(); }

    // Статистика
    // -------------------------------------------------------------------------

    stats::UsageStatsSnapshot usage_stats() const { return usage_.snapshot(); }

    stats::ResourceUsage get_resource_usage(const std::optional<std::string>& client_id,
                                            bool group_by_client) const;

    HuntSummary summary() const;

private:
    struct ClientState {
        ClientStatus status = ClientStatus::Unknown;  // Unknown = исхода нет
        std::vector<LogEntry> logs;
        std::vector<ErrorEntry> errors;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, ClientState> clients;
    };

    static constexpr std::size_t SHARD_COUNT = 16;

    Shard& shard_for(const std::string& client_id);
    const Shard& shard_for(const std::string& client_id) const;

    void authorize(approval::ProtectedAction action, const approval::Token* actor) const;

    /// Построить ForemanRule из групп и опубликовать (mutex_ захвачен)
    void publish_locked();

    void set_state_locked(HuntState state);

    void notify(const std::string& client_id, const Outcome& outcome);

    void mirror_append(const char* attribute, const std::string& client_id);

    std::vector<std::string> clients_with(ClientStatus a, ClientStatus b) const;

    const client::AttributeSchema& schema() const;

    std::string id_;
    std::string name_;
    std::string description_;
    std::string notification_event_;

    std::shared_ptr<Dispatcher> dispatcher_;
    foreman::RuleStore& rules_;
    foreman::AssignmentStore& assignments_;
    HuntServices services_;

    mutable std::mutex mutex_;
    HuntState state_ = HuntState::Constructed;
    std::uint32_t client_limit_ = 0;
    Timestamp expiry_ = DEFAULT_EXPIRY;
    std::vector<rule::RuleGroup> groups_;
    std::unordered_set<std::string> started_;

    std::array<Shard, SHARD_COUNT> shards_;
    std::atomic<std::size_t> finished_count_{0};
    std::atomic<std::size_t> errored_count_{0};
    std::atomic<std::size_t> badness_count_{0};

    stats::ResourceUsageStats usage_;
};

// ============================================================================
// HuntRegistry
// ============================================================================

class HuntRegistry {
public:
    /// @throw ValidationError если hunt с таким id уже зарегистрирован
    void add(std::shared_ptr<Hunt> hunt);

    /// nullptr если не найден
    std::shared_ptr<Hunt> find(const std::string& hunt_id) const;

    bool remove(const std::string& hunt_id);

    std::vector<std::shared_ptr<Hunt>> all() const;

    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Hunt>> hunts_;
};

}  // namespace fleethunt::hunt

#endif  // FLEETHUNT_HUNT_HPP

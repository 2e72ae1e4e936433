// ==============================================================================
// hunt.cpp - Hunt: жизненный цикл, dispatch, учёт исходов
// ==============================================================================
//
// Порядок блокировок: Hunt::mutex_ -> RuleStore / AssignmentStore.
// Шарды исходов берутся без mutex_ hunt; Dispatcher и подписчики
// вызываются вне всех блокировок hunt.
//
// ==============================================================================

#include <fleethunt/error.hpp>
#include <fleethunt/hunt.hpp>
#include <fleethunt/output.hpp>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <functional>
#include <limits>
#include <random>
#include <type_traits>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace fleethunt::hunt {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_metric(JsonWriter& w, const char* key, const stats::MetricSummary& m) {
    w.Key(key);
    w.StartObject();
    w.Key("num");
    w.Uint64(m.num);
    w.Key("mean");
    w.Double(m.mean);
    w.Key("stdev");
    w.Double(m.stdev);
    w.Key("histogram");
    w.StartArray();
    // counts[0] - underflow с нижней границей 0
    for (std::size_t i = 0; i < m.histogram.counts.size(); ++i) {
        w.StartObject();
        w.Key("lower_bound");
        w.Double(i == 0 ? 0.0 : m.histogram.bounds[i - 1]);
        w.Key("count");
        w.Uint64(m.histogram.counts[i]);
        w.EndObject();
    }
    w.EndArray();
    w.EndObject();
}

}  // namespace

// ============================================================================
// Строковые представления
// ============================================================================

std::string hunt_urn(const std::string& hunt_id) {
    return "hunts/" + hunt_id;
}

std::string generate_hunt_id() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "H:%08x", static_cast<unsigned>(dist(engine)));
    return buf;
}

const char* to_string(HuntState state) {
    switch (state) {
    case HuntState::Constructed:
        return "CONSTRUCTED";
    case HuntState::Running:
        return "RUNNING";
    case HuntState::Paused:
        return "PAUSED";
    case HuntState::Stopped:
        return "STOPPED";
    }
    return "CONSTRUCTED";
}

const char* to_string(ClientStatus status) {
    switch (status) {
    case ClientStatus::Unknown:
        return "UNKNOWN";
    case ClientStatus::Running:
        return "RUNNING";
    case ClientStatus::Completed:
        return "COMPLETED";
    case ClientStatus::Bad:
        return "BAD";
    case ClientStatus::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

const char* to_string(StartResult result) {
    switch (result) {
    case StartResult::Started:
        return "started";
    case StartResult::AlreadyAssigned:
        return "already assigned";
    case StartResult::LimitReached:
        return "limit reached";
    case StartResult::NotRunning:
        return "not running";
    }
    return "not running";
}

const char* outcome_name(const Outcome& outcome) {
    switch (outcome.index()) {
    case 0:
        return "success";
    case 1:
        return "badness";
    default:
        return "error";
    }
}

// ============================================================================
// QueueDispatcher
// ============================================================================

void QueueDispatcher::start_client(const TaskRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(request);
}

std::vector<TaskRequest> QueueDispatcher::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskRequest> out(queue_.begin(), queue_.end());
    queue_.clear();
    return out;
}

std::size_t QueueDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// HuntSummary
// ============================================================================

std::string HuntSummary::to_json() const {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);

    w.StartObject();
    write_string(w, "id", id);
    write_string(w, "name", name);
    write_string(w, "state", to_string(state));
    w.Key("rule_count");
    w.Uint64(rule_count);
    w.Key("client_limit");
    w.Uint(client_limit);
    w.Key("started");
    w.Uint64(started);
    w.Key("finished");
    w.Uint64(finished);
    w.Key("errored");
    w.Uint64(errored);
    w.Key("badness");
    w.Uint64(badness);
    w.Key("outstanding");
    w.Uint64(outstanding);

    write_metric(w, "user_cpu", usage.user_cpu);
    write_metric(w, "system_cpu", usage.system_cpu);
    write_metric(w, "network_bytes_sent", usage.network_bytes_sent);

    w.Key("worst_performers");
    w.StartArray();
    for (const auto& p : usage.worst_performers) {
        w.StartObject();
        write_string(w, "client_id", p.client_id);
        write_string(w, "task_id", p.task_id);
        w.Key("user_cpu_time");
        w.Double(p.user_cpu_time);
        w.Key("system_cpu_time");
        w.Double(p.system_cpu_time);
        w.Key("network_bytes_sent");
        w.Uint64(p.network_bytes_sent);
        w.EndObject();
    }
    w.EndArray();

    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ============================================================================
// Hunt: конструирование
// ============================================================================

Hunt::Hunt(HuntConfig config, std::shared_ptr<Dispatcher> dispatcher, foreman::RuleStore& rules,
           foreman::AssignmentStore& assignments, HuntServices services)
    : id_(config.id.empty() ? generate_hunt_id() : std::move(config.id)),
      name_(std::move(config.name)),
      description_(std::move(config.description)),
      notification_event_(std::move(config.notification_event)),
      dispatcher_(std::move(dispatcher)),
      rules_(rules),
      assignments_(assignments),
      services_(std::move(services)),
      client_limit_(config.client_limit),
      expiry_(config.expiry) {
    if (!dispatcher_) {
        throw ValidationError("hunt " + id_ + " requires a dispatcher");
    }
    if (client_limit_ > MAX_CLIENT_LIMIT) {
        throw ValidationError("client_limit " + std::to_string(client_limit_) +
                              " exceeds the maximum of " + std::to_string(MAX_CLIENT_LIMIT));
    }
    if (expiry_ <= 0) {
        throw ValidationError("hunt expiry must be positive");
    }
    if (!services_.clock) {
        services_.clock = platform::system_clock();
    }
    if (services_.store != nullptr) {
        services_.store->set(hunt_urn(id_), ATTR_STATE, Value(to_string(state_)));
    }
}

const client::AttributeSchema& Hunt::schema() const {
    return services_.schema != nullptr ? *services_.schema : client::AttributeSchema::defaults();
}

HuntState Hunt::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t Hunt::client_limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_limit_;
}

Timestamp Hunt::expiry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expiry_;
}

// ============================================================================
// Hunt: правила
// ============================================================================

void Hunt::add_rule(rule::RuleGroup group) {
    rule::validate(group, schema());

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HuntState::Stopped) {
        throw ValidationError("cannot add rules to stopped hunt " + id_);
    }
    groups_.push_back(std::move(group));
    if (state_ == HuntState::Running) {
        publish_locked();
    }
}

void Hunt::add_rule(std::vector<rule::Predicate> predicates) {
    add_rule(rule::make_group(std::move(predicates)));
}

std::vector<rule::RuleGroup> Hunt::rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_;
}

void Hunt::publish_locked() {
    const Timestamp now = services_.clock();
    // Насыщение: now + expiry_ не должно переполнять Timestamp
    const Timestamp expires = expiry_ > std::numeric_limits<Timestamp>::max() - now
                                  ? std::numeric_limits<Timestamp>::max()
                                  : now + expiry_;

    std::vector<rule::ForemanRule> published;
    published.reserve(groups_.size());
    for (const auto& group : groups_) {
        rule::ForemanRule r;
        r.group = group;
        r.action.hunt_id = id_;
        r.action.hunt_name = name_;
        r.action.client_limit = client_limit_;
        r.created = now;
        r.expires = expires;
        r.description = description_.empty() ? name_ : description_;
        published.push_back(std::move(r));
    }
    rules_.publish(id_, std::move(published));
}

// ============================================================================
// Hunt: жизненный цикл
// ============================================================================

void Hunt::authorize(approval::ProtectedAction action, const approval::Token* actor) const {
    if (services_.approvals == nullptr) {
        return;
    }
    const approval::Token anonymous;
    services_.approvals->check(id_, actor != nullptr ? *actor : anonymous, action);
}

void Hunt::set_state_locked(HuntState state) {
    state_ = state;
    if (services_.store != nullptr) {
        services_.store->set(hunt_urn(id_), ATTR_STATE, Value(to_string(state)));
    }
    if (services_.writer != nullptr) {
        services_.writer->info("hunt " + id_ + " (" + name_ + ") is now " + to_string(state));
    }
}

void Hunt::run(const approval::Token* actor) {
    authorize(approval::ProtectedAction::Run, actor);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HuntState::Stopped) {
        throw ValidationError("hunt " + id_ + " is stopped and cannot be run again");
    }
    if (state_ == HuntState::Running) {
        return;
    }
    publish_locked();
    set_state_locked(HuntState::Running);
}

void Hunt::pause(const approval::Token* actor) {
    authorize(approval::ProtectedAction::Pause, actor);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HuntState::Paused) {
        return;
    }
    if (state_ != HuntState::Running) {
        throw ValidationError("cannot pause hunt " + id_ + " in state " + to_string(state_));
    }
    rules_.remove(id_);
    set_state_locked(HuntState::Paused);
}

void Hunt::stop(const approval::Token* actor) {
    authorize(approval::ProtectedAction::Stop, actor);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HuntState::Stopped) {
        return;
    }
    rules_.remove(id_);
    set_state_locked(HuntState::Stopped);
}

void Hunt::modify(const ModifyRequest& request, const approval::Token* actor) {
    authorize(approval::ProtectedAction::Modify, actor);

    if (request.client_limit && *request.client_limit > MAX_CLIENT_LIMIT) {
        throw ValidationError("client_limit " + std::to_string(*request.client_limit) +
                              " exceeds the maximum of " + std::to_string(MAX_CLIENT_LIMIT));
    }
    if (request.expiry && *request.expiry <= 0) {
        throw ValidationError("hunt expiry must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HuntState::Stopped) {
        throw ValidationError("cannot modify stopped hunt " + id_);
    }
    if (request.client_limit) {
        client_limit_ = *request.client_limit;
    }
    if (request.expiry) {
        expiry_ = *request.expiry;
    }
    if (state_ == HuntState::Running) {
        publish_locked();
    }
    if (services_.writer != nullptr) {
        services_.writer->info("hunt " + id_ + " modified: client_limit=" +
                               std::to_string(client_limit_));
    }
}

// ============================================================================
// Hunt: dispatch
// ============================================================================

StartResult Hunt::try_start_client(const std::string& client_id) {
    std::uint32_t limit = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != HuntState::Running) {
            return StartResult::NotRunning;
        }
        if (assignments_.contains(id_, client_id)) {
            return StartResult::AlreadyAssigned;
        }
        // Назначение не записывается: клиент может быть взят после увеличения лимита
        if (client_limit_ > 0 && started_.size() >= client_limit_) {
            if (services_.writer != nullptr) {
                services_.writer->trace("hunt " + id_ + " reached client limit, skipping " +
                                        client_id);
            }
            return StartResult::LimitReached;
        }
        if (!assignments_.try_assign(id_, client_id)) {
            return StartResult::AlreadyAssigned;
        }
        started_.insert(client_id);
        limit = client_limit_;
    }

    mirror_append(ATTR_CLIENTS, client_id);

    try {
        dispatcher_->start_client(TaskRequest{id_, client_id, limit});
        if (services_.writer != nullptr) {
            services_.writer->debug("hunt " + id_ + " dispatched to " + client_id);
        }
    } catch (const std::exception& e) {
        record_outcome(client_id, TaskError{std::string("dispatch failed: ") + e.what(), ""});
    } catch (...) {
        record_outcome(client_id, TaskError{"dispatch failed: unknown exception", ""});
    }
    return StartResult::Started;
}

// ============================================================================
// Hunt: исходы
// ============================================================================

Hunt::Shard& Hunt::shard_for(const std::string& client_id) {
    return shards_[std::hash<std::string>{}(client_id) % SHARD_COUNT];
}

const Hunt::Shard& Hunt::shard_for(const std::string& client_id) const {
    return shards_[std::hash<std::string>{}(client_id) % SHARD_COUNT];
}

bool Hunt::record_outcome(const std::string& client_id, const Outcome& outcome) {
    const Timestamp now = services_.clock();
    {
        Shard& shard = shard_for(client_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        ClientState& st = shard.clients[client_id];
        if (st.status != ClientStatus::Unknown) {
            if (services_.writer != nullptr) {
                services_.writer->debug("hunt " + id_ + ": ignoring repeated outcome for " +
                                        client_id);
            }
            return false;
        }

        std::visit(
            [&](auto&& o) {
                using T = std::decay_t<decltype(o)>;
                if constexpr (std::is_same_v<T, Success>) {
                    st.status = ClientStatus::Completed;
                    ++finished_count_;
                } else if constexpr (std::is_same_v<T, Badness>) {
                    st.status = ClientStatus::Bad;
                    ++finished_count_;
                    ++badness_count_;
                } else {
                    st.status = ClientStatus::Error;
                    ++errored_count_;
                    st.errors.push_back(ErrorEntry{client_id, o.message, o.backtrace, now});
                }
            },
            outcome);
    }

    if (const auto* err = std::get_if<TaskError>(&outcome)) {
        mirror_append(ATTR_ERRORS, client_id);
        if (services_.writer != nullptr) {
            services_.writer->warn("hunt " + id_ + ": client " + client_id + " failed: " +
                                   err->message);
        }
    } else {
        if (std::holds_alternative<Badness>(outcome)) {
            mirror_append(ATTR_BADNESS, client_id);
        }
        mirror_append(ATTR_FINISHED, client_id);
        if (services_.writer != nullptr) {
            services_.writer->debug("hunt " + id_ + ": client " + client_id + " finished (" +
                                    outcome_name(outcome) + ")");
        }
    }

    notify(client_id, outcome);
    return true;
}

bool Hunt::log_client_error(const std::string& client_id, const std::string& message,
                            const std::string& backtrace) {
    if (record_outcome(client_id, TaskError{message, backtrace})) {
        return true;
    }

    // Клиент уже имеет исход: ошибка только попадает в журнал ошибок
    Shard& shard = shard_for(client_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.clients[client_id].errors.push_back(
        ErrorEntry{client_id, message, backtrace, services_.clock()});
    return false;
}

bool Hunt::process_result(const TaskResult& result) {
    if (!result.hunt_id.empty() && result.hunt_id != id_) {
        throw ValidationError("task result for hunt " + result.hunt_id + " posted to hunt " + id_);
    }
    // Повторный результат клиента не учитывается ни в исходах, ни в статистике
    if (!record_outcome(result.client_id, result.outcome)) {
        return false;
    }
    if (result.usage) {
        stats::ResourceSample sample = *result.usage;
        if (sample.client_id.empty()) {
            sample.client_id = result.client_id;
        }
        if (sample.task_id.empty()) {
            sample.task_id = result.task_id;
        }
        usage_.add(sample);
    }
    return true;
}

void Hunt::log_result(const std::string& client_id, const std::string& message) {
    Shard& shard = shard_for(client_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.clients[client_id].logs.push_back(LogEntry{client_id, message, services_.clock()});
}

std::vector<LogEntry> Hunt::logs(const std::optional<std::string>& client_id) const {
    std::vector<LogEntry> out;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [id, st] : shard.clients) {
            if (client_id && id != *client_id) {
                continue;
            }
            out.insert(out.end(), st.logs.begin(), st.logs.end());
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const LogEntry& a, const LogEntry& b) {
        return a.timestamp != b.timestamp ? a.timestamp < b.timestamp : a.client_id < b.client_id;
    });
    return out;
}

std::vector<ErrorEntry> Hunt::errors(const std::optional<std::string>& client_id) const {
    std::vector<ErrorEntry> out;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [id, st] : shard.clients) {
            if (client_id && id != *client_id) {
                continue;
            }
            out.insert(out.end(), st.errors.begin(), st.errors.end());
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ErrorEntry& a, const ErrorEntry& b) {
        return a.timestamp != b.timestamp ? a.timestamp < b.timestamp : a.client_id < b.client_id;
    });
    return out;
}

ClientStatus Hunt::client_status(const std::string& client_id) const {
    {
        const Shard& shard = shard_for(client_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.clients.find(client_id);
        if (it != shard.clients.end() && it->second.status != ClientStatus::Unknown) {
            return it->second.status;
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return started_.count(client_id) > 0 ? ClientStatus::Running : ClientStatus::Unknown;
}

std::size_t Hunt::outstanding_requests() const {
    std::vector<std::string> started;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == HuntState::Stopped) {
            return 0;
        }
        started.assign(started_.begin(), started_.end());
    }

    std::size_t outstanding = 0;
    for (const auto& id : started) {
        const Shard& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.clients.find(id);
        if (it == shard.clients.end() || it->second.status == ClientStatus::Unknown) {
            ++outstanding;
        }
    }
    return outstanding;
}

void Hunt::notify(const std::string& client_id, const Outcome& outcome) {
    if (notification_event_.empty() || services_.notifications == nullptr) {
        return;
    }

    HuntEvent event;
    event.hunt_id = id_;
    event.hunt_name = name_;
    event.client_id = client_id;
    event.outcome = outcome_name(outcome);
    if (const auto* err = std::get_if<TaskError>(&outcome)) {
        event.message = err->message;
    }
    event.timestamp = services_.clock();

    try {
        services_.notifications->publish(notification_event_, event);
    } catch (const std::exception& e) {
        if (services_.writer != nullptr) {
            services_.writer->warn("notification '" + notification_event_ + "' for client " +
                                   client_id + " failed: " + e.what());
        }
    } catch (...) {
        if (services_.writer != nullptr) {
            services_.writer->warn("notification '" + notification_event_ + "' for client " +
                                   client_id + " failed: unknown exception");
        }
    }
}

void Hunt::mirror_append(const char* attribute, const std::string& client_id) {
    if (services_.store != nullptr) {
        services_.store->append(hunt_urn(id_), attribute, Value(client_id));
    }
}

// ============================================================================
// Hunt: множества и статистика
// ============================================================================

std::vector<std::string> Hunt::clients_with(ClientStatus a, ClientStatus b) const {
    std::vector<std::string> out;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [id, st] : shard.clients) {
            if (st.status == a || st.status == b) {
                out.push_back(id);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> Hunt::started_clients() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.assign(started_.begin(), started_.end());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> Hunt::finished_clients() const {
    return clients_with(ClientStatus::Completed, ClientStatus::Bad);
}

std::vector<std::string> Hunt::errored_clients() const {
    return clients_with(ClientStatus::Error, ClientStatus::Error);
}

std::vector<std::string> Hunt::bad_clients() const {
    return clients_with(ClientStatus::Bad, ClientStatus::Bad);
}

std::size_t Hunt::started_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_.size();
}

stats::ResourceUsage Hunt::get_resource_usage(const std::optional<std::string>& client_id,
                                              bool group_by_client) const {
    return stats::get_resource_usage(usage_.samples(), client_id, group_by_client);
}

HuntSummary Hunt::summary() const {
    HuntSummary s;
    s.id = id_;
    s.name = name_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.state = state_;
        s.rule_count = groups_.size();
        s.client_limit = client_limit_;
        s.started = started_.size();
    }
    s.finished = finished_count_.load();
    s.errored = errored_count_.load();
    s.badness = badness_count_.load();
    s.outstanding = outstanding_requests();
    s.usage = usage_.snapshot();
    return s;
}

// ============================================================================
// HuntRegistry
// ============================================================================

void HuntRegistry::add(std::shared_ptr<Hunt> hunt) {
    if (!hunt) {
        throw ValidationError("cannot register a null hunt");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::string id = hunt->id();
    if (!hunts_.emplace(id, std::move(hunt)).second) {
        throw ValidationError("hunt " + id + " is already registered");
    }
}

std::shared_ptr<Hunt> HuntRegistry::find(const std::string& hunt_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = hunts_.find(hunt_id);
    return it != hunts_.end() ? it->second : nullptr;
}

bool HuntRegistry::remove(const std::string& hunt_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return hunts_.erase(hunt_id) > 0;
}

std::vector<std::shared_ptr<Hunt>> HuntRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Hunt>> out;
    out.reserve(hunts_.size());
    for (const auto& [id, hunt] : hunts_) {
        out.push_back(hunt);
    }
    std::sort(out.begin(), out.end(),
              [](const std::shared_ptr<Hunt>& a, const std::shared_ptr<Hunt>& b) {
                  return a->id() < b->id();
              });
    return out;
}

std::size_t HuntRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hunts_.size();
}

}  // namespace fleethunt::hunt

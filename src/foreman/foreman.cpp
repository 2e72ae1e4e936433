// ==============================================================================
// foreman.cpp - Foreman: назначение hunt клиентам при check-in
// ==============================================================================

#include <fleethunt/error.hpp>
#include <fleethunt/foreman.hpp>
#include <fleethunt/output.hpp>

namespace fleethunt::foreman {

Foreman::Foreman(RuleStore& rules, AssignmentStore& assignments, hunt::HuntRegistry& hunts,
                 output::Writer* writer, platform::Clock clock)
    : rules_(rules), assignments_(assignments), hunts_(hunts), writer_(writer),
      clock_(clock ? std::move(clock) : platform::system_clock()) {}

std::size_t Foreman::on_check_in(const client::ClientRecord& client) {
    if (client.id.empty()) {
        throw ValidationError("client check-in without client id");
    }

    const platform::Timestamp now = clock_();
    const RuleStore::Snapshot snapshot = rules_.snapshot();

    std::size_t dispatched = 0;
    bool saw_expired = false;
    for (const auto& r : *snapshot) {
        if (rule::is_expired(r, now)) {
            saw_expired = true;
            continue;
        }
        if (!rule::matches(r.group, client)) {
            continue;
        }

        auto target = hunts_.find(r.action.hunt_id);
        if (!target) {
            if (writer_ != nullptr) {
                writer_->trace("rule '" + r.description + "' matched " + client.id +
                               " but has no registered hunt");
            }
            continue;
        }

        if (target->try_start_client(client.id) == hunt::StartResult::Started) {
            ++dispatched;
        }
    }

    if (saw_expired) {
        rules_.prune_expired(now);
    }
    return dispatched;
}

bool Foreman::post_result(const hunt::TaskResult& result) {
    auto target = hunts_.find(result.hunt_id);
    if (!target) {
        if (writer_ != nullptr) {
            writer_->warn("result from " + result.client_id + " for unknown hunt " +
                          result.hunt_id + " ignored");
        }
        return false;
    }
    return target->process_result(result);
}

std::shared_ptr<hunt::Hunt> Foreman::create_hunt(hunt::HuntConfig config,
                                                 std::shared_ptr<hunt::Dispatcher> dispatcher,
                                                 hunt::HuntServices services) {
    if (services.writer == nullptr) {
        services.writer = writer_;
    }
    // created/expires правил и проверка истечения идут по одним часам
    services.clock = clock_;
    auto created = std::make_shared<hunt::Hunt>(std::move(config), std::move(dispatcher), rules_,
                                                assignments_, std::move(services));
    hunts_.add(created);
    return created;
}

std::size_t Foreman::prune_expired() {
    return rules_.prune_expired(clock_());
}

}  // namespace fleethunt::foreman

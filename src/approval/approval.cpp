// ==============================================================================
// approval.cpp - Двухсторонний approval для операций с hunt
// ==============================================================================

#include <fleethunt/approval.hpp>
#include <fleethunt/error.hpp>
#include <fleethunt/output.hpp>

#include <algorithm>
#include <mutex>

namespace fleethunt::approval {

// ============================================================================
// Действия и состояния
// ============================================================================

const char* to_string(ProtectedAction action) {
    switch (action) {
    case ProtectedAction::Run:
        return "RUN";
    case ProtectedAction::Pause:
        return "PAUSE";
    case ProtectedAction::Modify:
        return "MODIFY";
    case ProtectedAction::Stop:
        return "STOP";
    }
    return "RUN";
}

ProtectedAction parse_action(std::string_view s) {
    if (s == "RUN") {
        return ProtectedAction::Run;
    }
    if (s == "PAUSE") {
        return ProtectedAction::Pause;
    }
    if (s == "MODIFY") {
        return ProtectedAction::Modify;
    }
    if (s == "STOP") {
        return ProtectedAction::Stop;
    }
    throw ValidationError("unknown protected action '" + std::string(s) + "'");
}

const std::vector<ProtectedAction>& all_actions() {
    static const std::vector<ProtectedAction> actions = {
        ProtectedAction::Run, ProtectedAction::Pause, ProtectedAction::Modify,
        ProtectedAction::Stop};
    return actions;
}

const char* to_string(ApprovalState state) {
    switch (state) {
    case ApprovalState::Unrequested:
        return "UNREQUESTED";
    case ApprovalState::Requested:
        return "REQUESTED";
    case ApprovalState::Granted:
        return "GRANTED";
    }
    return "UNREQUESTED";
}

bool Approval::covers(ProtectedAction action) const {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

// ============================================================================
// ApprovalGate
// ============================================================================

ApprovalGate::ApprovalGate(output::Writer* writer, platform::Clock clock)
    : writer_(writer), clock_(std::move(clock)) {}

Approval ApprovalGate::request(const std::string& hunt_id, const std::string& requester,
                               const std::string& approver, const std::string& reason,
                               const std::vector<ProtectedAction>& actions) {
    if (hunt_id.empty()) {
        throw ValidationError("approval request requires a hunt id");
    }
    if (requester.empty() || approver.empty()) {
        throw ValidationError("approval request requires requester and approver");
    }
    if (reason.empty()) {
        throw ValidationError("approval request requires a reason");
    }
    if (requester == approver) {
        throw ValidationError("requester '" + requester + "' cannot approve own request");
    }
    if (actions.empty()) {
        throw ValidationError("approval request must cover at least one action");
    }

    Key key{hunt_id, requester, reason};
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it != records_.end()) {
        return it->second;
    }

    Approval record;
    record.hunt_id = hunt_id;
    record.requester = requester;
    record.approver = approver;
    record.reason = reason;
    record.actions = actions;
    record.requested_at = clock_();
    records_.emplace(std::move(key), record);

    if (writer_ != nullptr) {
        writer_->info("approval requested for hunt " + hunt_id + " by " + requester +
                      " (approver: " + approver + ", reason: " + reason + ")");
    }
    return record;
}

Approval ApprovalGate::grant(const std::string& hunt_id, const std::string& approver,
                             const std::string& requester, const std::string& reason) {
    if (approver.empty()) {
        throw ValidationError("approval grant requires an approver");
    }
    if (approver == requester) {
        throw ValidationError("approver '" + approver + "' cannot grant own request");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(Key{hunt_id, requester, reason});
    if (it == records_.end()) {
        throw ValidationError("no approval request for hunt " + hunt_id + " by " + requester +
                              " with reason '" + reason + "'");
    }

    Approval& record = it->second;
    if (!record.granted) {
        record.granted = true;
        record.granted_by = approver;
        record.granted_at = clock_();
        if (writer_ != nullptr) {
            writer_->info("approval granted for hunt " + hunt_id + " to " + requester + " by " +
                          approver);
        }
    }
    return record;
}

bool ApprovalGate::is_authorized(const std::string& hunt_id, const Token& actor,
                                 ProtectedAction action) const {
    if (actor.supervisor) {
        return true;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.lower_bound(Key{hunt_id, actor.username, std::string()});
    for (; it != records_.end(); ++it) {
        const auto& [h, r, reason] = it->first;
        if (h != hunt_id || r != actor.username) {
            break;
        }
        if (it->second.granted && it->second.covers(action)) {
            return true;
        }
    }
    return false;
}

void ApprovalGate::check(const std::string& hunt_id, const Token& actor,
                         ProtectedAction action) const {
    if (!is_authorized(hunt_id, actor, action)) {
        const std::string who = actor.username.empty() ? "anonymous" : actor.username;
        throw AuthorizationError(std::string(to_string(action)) + " on hunt " + hunt_id +
                                 " by " + who);
    }
}

ApprovalState ApprovalGate::state(const std::string& hunt_id, const std::string& requester) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ApprovalState result = ApprovalState::Unrequested;
    auto it = records_.lower_bound(Key{hunt_id, requester, std::string()});
    for (; it != records_.end(); ++it) {
        const auto& [h, r, reason] = it->first;
        if (h != hunt_id || r != requester) {
            break;
        }
        if (it->second.granted) {
            return ApprovalState::Granted;
        }
        result = ApprovalState::Requested;
    }
    return result;
}

std::optional<Approval> ApprovalGate::find(const std::string& hunt_id,
                                           const std::string& requester,
                                           const std::string& reason) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(Key{hunt_id, requester, reason});
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Approval> ApprovalGate::approvals(const std::string& hunt_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Approval> result;
    for (const auto& [key, record] : records_) {
        if (std::get<0>(key) == hunt_id) {
            result.push_back(record);
        }
    }
    return result;
}

}  // namespace fleethunt::approval

// ==============================================================================
// rule_store.cpp - Активная таблица правил Foreman
// ==============================================================================

#include <fleethunt/error.hpp>
#include <fleethunt/output.hpp>
#include <fleethunt/rule_store.hpp>

#include <algorithm>
#include <mutex>

namespace fleethunt::foreman {

RuleStore::RuleStore(output::Writer* writer)
    : writer_(writer), rules_(std::make_shared<const std::vector<rule::ForemanRule>>()) {}

void RuleStore::publish(const std::string& hunt_id, std::vector<rule::ForemanRule> rules) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto next = std::make_shared<std::vector<rule::ForemanRule>>();
    next->reserve(rules_->size() + rules.size());
    for (const auto& r : *rules_) {
        if (r.action.hunt_id != hunt_id) {
            next->push_back(r);
        }
    }
    const std::size_t published = rules.size();
    for (auto& r : rules) {
        next->push_back(std::move(r));
    }
    rules_ = std::move(next);

    if (writer_ != nullptr) {
        writer_->debug("published " + std::to_string(published) + " rule(s) for hunt " + hunt_id);
    }
}

std::size_t RuleStore::remove(const std::string& hunt_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto next = std::make_shared<std::vector<rule::ForemanRule>>();
    for (const auto& r : *rules_) {
        if (r.action.hunt_id != hunt_id) {
            next->push_back(r);
        }
    }
    const std::size_t removed = rules_->size() - next->size();
    rules_ = std::move(next);

    if (writer_ != nullptr && removed > 0) {
        writer_->debug("removed " + std::to_string(removed) + " rule(s) of hunt " + hunt_id);
    }
    return removed;
}

bool RuleStore::add(rule::ForemanRule rule) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (std::find(rules_->begin(), rules_->end(), rule) != rules_->end()) {
        return false;
    }
    auto next = std::make_shared<std::vector<rule::ForemanRule>>(*rules_);
    next->push_back(std::move(rule));
    rules_ = std::move(next);
    return true;
}

RuleStore::Snapshot RuleStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rules_;
}

std::size_t RuleStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rules_->size();
}

std::size_t RuleStore::count(const std::string& hunt_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(rules_->begin(), rules_->end(), [&hunt_id](const rule::ForemanRule& r) {
            return r.action.hunt_id == hunt_id;
        }));
}

std::size_t RuleStore::prune_expired(platform::Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto next = std::make_shared<std::vector<rule::ForemanRule>>();
    for (const auto& r : *rules_) {
        if (!rule::is_expired(r, now)) {
            next->push_back(r);
        }
    }
    const std::size_t pruned = rules_->size() - next->size();
    if (pruned > 0) {
        rules_ = std::move(next);
        if (writer_ != nullptr) {
            writer_->debug("pruned " + std::to_string(pruned) + " expired rule(s)");
        }
    }
    return pruned;
}

void RuleStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rules_ = std::make_shared<const std::vector<rule::ForemanRule>>();
}

void RuleStore::save(store::AttributeStore& store, const std::string& urn) const {
    Snapshot rules = snapshot();

    store.erase(urn, ATTR_RULES);
    for (const auto& r : *rules) {
        store.append(urn, ATTR_RULES, Value(rule::to_json(r)));
    }
}

std::size_t RuleStore::restore(const store::AttributeStore& store, const std::string& urn,
                               const client::AttributeSchema& schema) {
    auto next = std::make_shared<std::vector<rule::ForemanRule>>();
    for (const auto& entry : store.history(urn, ATTR_RULES)) {
        const auto* json = entry.value.get_string();
        if (json == nullptr) {
            throw ValidationError("foreman rule entry in '" + urn + "' is not a string");
        }
        next->push_back(rule::from_json(*json, schema));
    }

    const std::size_t restored = next->size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        rules_ = std::move(next);
    }
    if (writer_ != nullptr) {
        writer_->debug("restored " + std::to_string(restored) + " rule(s) from " + urn);
    }
    return restored;
}

}  // namespace fleethunt::foreman

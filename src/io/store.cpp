// ==============================================================================
// store.cpp - In-memory attribute store
// ==============================================================================

#include <fleethunt/store.hpp>
#include <mutex>

namespace fleethunt::store {

// ----------------------------------------------------------------------------
// Object
// ----------------------------------------------------------------------------

std::optional<Value> Object::get(const std::string& attribute) const {
    return store_.get(urn_, attribute);
}

std::vector<Entry> Object::history(const std::string& attribute) const {
    return store_.history(urn_, attribute);
}

void Object::set(const std::string& attribute, Value value) {
    store_.set(urn_, attribute, std::move(value));
}

void Object::append(const std::string& attribute, Value value) {
    store_.append(urn_, attribute, std::move(value));
}

// ----------------------------------------------------------------------------
// unique_values
// ----------------------------------------------------------------------------

std::vector<Value> unique_values(const AttributeStore& store, const std::string& urn,
                                 const std::string& attribute) {
    std::vector<Value> result;
    for (auto& entry : store.history(urn, attribute)) {
        bool seen = false;
        for (const auto& v : result) {
            if (v == entry.value) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            result.push_back(std::move(entry.value));
        }
    }
    return result;
}

// ----------------------------------------------------------------------------
// MemoryStore
// ----------------------------------------------------------------------------

MemoryStore::MemoryStore(platform::Clock clock) : clock_(std::move(clock)) {}

std::optional<Value> MemoryStore::get(const std::string& urn, const std::string& attribute) const {
    std::shared_lock lock(mutex_);
    auto obj = objects_.find(urn);
    if (obj == objects_.end()) {
        return std::nullopt;
    }
    auto attr = obj->second.find(attribute);
    if (attr == obj->second.end() || attr->second.empty()) {
        return std::nullopt;
    }
    return attr->second.back().value;
}

std::vector<Entry> MemoryStore::history(const std::string& urn,
                                        const std::string& attribute) const {
    std::shared_lock lock(mutex_);
    auto obj = objects_.find(urn);
    if (obj == objects_.end()) {
        return {};
    }
    auto attr = obj->second.find(attribute);
    if (attr == obj->second.end()) {
        return {};
    }
    return attr->second;
}

void MemoryStore::set(const std::string& urn, const std::string& attribute, Value value) {
    Timestamp now = clock_();
    std::unique_lock lock(mutex_);
    auto& entries = objects_[urn][attribute];
    entries.clear();
    entries.push_back(Entry{std::move(value), now});
}

void MemoryStore::append(const std::string& urn, const std::string& attribute, Value value) {
    Timestamp now = clock_();
    std::unique_lock lock(mutex_);
    objects_[urn][attribute].push_back(Entry{std::move(value), now});
}

void MemoryStore::erase(const std::string& urn, const std::string& attribute) {
    std::unique_lock lock(mutex_);
    auto obj = objects_.find(urn);
    if (obj != objects_.end()) {
        obj->second.erase(attribute);
    }
}

std::size_t MemoryStore::object_count() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

}  // namespace fleethunt::store

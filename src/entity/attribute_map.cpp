#include "entity/attribute_map.hpp"

#include <mutex>
#include <type_traits>

namespace xrayot {

void AttributeMap::put(const std::string& key, AttributeValue value) {
    std::unique_lock lock(mutex_);
    values_.insert_or_assign(key, std::move(value));
}

std::optional<AttributeValue> AttributeMap::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<AttributeMap> AttributeMap::get_map(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) return nullptr;
    if (const auto* nested = std::get_if<std::shared_ptr<AttributeMap>>(&it->second)) {
        return *nested;
    }
    return nullptr;
}

std::shared_ptr<AttributeMap> AttributeMap::child(const std::string& key) {
    {
        std::shared_lock lock(mutex_);
        const auto it = values_.find(key);
        if (it != values_.end()) {
            if (const auto* nested = std::get_if<std::shared_ptr<AttributeMap>>(&it->second)) {
                return *nested;
            }
        }
    }

    // Re-check under the write lock: another writer may have created it
    std::unique_lock lock(mutex_);
    auto& slot = values_[key];
    if (auto* nested = std::get_if<std::shared_ptr<AttributeMap>>(&slot)) {
        return *nested;
    }
    auto created = std::make_shared<AttributeMap>();
    slot = created;
    return created;
}

bool AttributeMap::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return values_.contains(key);
}

size_t AttributeMap::size() const {
    std::shared_lock lock(mutex_);
    return values_.size();
}

bool AttributeMap::empty() const {
    std::shared_lock lock(mutex_);
    return values_.empty();
}

std::vector<std::string> AttributeMap::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

nlohmann::json AttributeMap::to_json() const {
    // Snapshot first so nested locks are never taken while holding ours
    std::vector<std::pair<std::string, AttributeValue>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.assign(values_.begin(), values_.end());
    }

    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : snapshot) {
        std::visit([&out, &k = key](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::shared_ptr<AttributeMap>>) {
                out[k] = v ? v->to_json() : nlohmann::json::object();
            } else {
                out[k] = v;
            }
        }, value);
    }
    return out;
}

} // namespace xrayot

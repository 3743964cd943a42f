#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace xrayot {

class AttributeMap;

/**
 * @brief Value stored in an attribute container: a scalar or a nested map
 *
 * Numbers keep the type the caller supplied (integer or floating point).
 */
using AttributeValue = std::variant<
    std::string,
    bool,
    int64_t,
    double,
    std::shared_ptr<AttributeMap>>;

/**
 * @brief Thread-safe string -> AttributeValue map, nestable
 *
 * Backs every attribute container on a trace entity (annotations, aws,
 * http, sql, service, metadata). Spans running on different threads may
 * write into the same entity, so all access is guarded by a shared_mutex;
 * nested maps created through child() carry their own lock.
 */
class AttributeMap {
public:
    AttributeMap() = default;

    AttributeMap(const AttributeMap&) = delete;
    AttributeMap& operator=(const AttributeMap&) = delete;

    /// Store (or overwrite) a value, including replacing a nested map
    void put(const std::string& key, AttributeValue value);

    [[nodiscard]] std::optional<AttributeValue> get(const std::string& key) const;

    /**
     * @brief Typed lookup
     * @return nullopt if the key is absent or holds a different alternative
     */
    template<typename T>
    [[nodiscard]] std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        if (const auto* typed = std::get_if<T>(&*value)) {
            return *typed;
        }
        return std::nullopt;
    }

    /// Nested map under key, or nullptr if absent / scalar
    [[nodiscard]] std::shared_ptr<AttributeMap> get_map(const std::string& key) const;

    /**
     * @brief Fetch-or-create the nested map under key
     *
     * A scalar already stored under key is replaced by a fresh empty map.
     */
    std::shared_ptr<AttributeMap> child(const std::string& key);

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Deep copy into a JSON object (nested maps become nested objects)
    [[nodiscard]] nlohmann::json to_json() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, AttributeValue> values_;
};

} // namespace xrayot

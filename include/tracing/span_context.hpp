#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace xrayot {

/**
 * @brief Span identity plus baggage
 *
 * Owned by exactly one span. Copies are deep: a child seeded from its
 * parent's context gets its own baggage map, so later writes on either
 * side are not shared. Baggage access is locked because a span may be
 * handed to other threads.
 */
class SpanContext {
public:
    using Baggage = std::unordered_map<std::string, std::string>;

    SpanContext() = default;
    SpanContext(std::string span_id, Baggage baggage);

    SpanContext(const SpanContext& other);
    SpanContext& operator=(const SpanContext& other);

    [[nodiscard]] const std::string& span_id() const { return span_id_; }

    /**
     * @brief Root trace id from the X-Amzn-Trace-Id baggage item
     * @return empty string if the item is missing or malformed
     */
    [[nodiscard]] std::string trace_id() const;

    void set_baggage_item(const std::string& key, const std::string& value);
    [[nodiscard]] std::optional<std::string> get_baggage_item(const std::string& key) const;

    /// Snapshot copy of all baggage items
    [[nodiscard]] Baggage baggage() const;

    /// Visit items until f returns false
    void for_each_baggage_item(
        const std::function<bool(const std::string&, const std::string&)>& f) const;

private:
    std::string span_id_;
    mutable std::mutex mutex_;
    Baggage baggage_;
};

} // namespace xrayot

#pragma once

#include "entity/attribute_map.hpp"
#include "tracing/span_context.hpp"
#include "tracing/tags.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace xrayot {

class Entity;
class IRecorder;

/// Value of a structured log field; exception_ptr marks an error object
using LogValue = std::variant<std::string, bool, int64_t, double, std::exception_ptr>;
using LogFields = std::map<std::string, LogValue>;

// ============================================================================
// ISpan: vendor-neutral span surface
// ============================================================================

/**
 * @brief Abstract span: tags, logs, baggage, finish
 *
 * The four virtual set_tag overloads are the value kinds a tag can carry.
 * Convenience overloads (C strings, int, typed Tag<T>) forward to them;
 * implementations should bring them into scope with `using ISpan::set_tag`.
 */
class ISpan {
public:
    virtual ~ISpan() = default;

    [[nodiscard]] virtual const SpanContext& context() const = 0;

    virtual ISpan& set_tag(std::string_view key, const std::string& value) = 0;
    virtual ISpan& set_tag(std::string_view key, bool value) = 0;
    virtual ISpan& set_tag(std::string_view key, int64_t value) = 0;
    virtual ISpan& set_tag(std::string_view key, double value) = 0;

    ISpan& set_tag(std::string_view key, const char* value) {
        return set_tag(key, std::string(value));
    }
    ISpan& set_tag(std::string_view key, int value) {
        return set_tag(key, static_cast<int64_t>(value));
    }

    template<typename T>
    ISpan& set_tag(const Tag<T>& tag, const std::type_identity_t<T>& value) {
        return set_tag(tag.key, value);
    }

    virtual ISpan& log(const LogFields& fields) = 0;
    virtual ISpan& log(int64_t timestamp_micros, const LogFields& fields) = 0;

    /// Shorthand for log({{"message", event}})
    ISpan& log(const std::string& event) {
        return log(LogFields{{std::string(log_fields::MESSAGE), event}});
    }
    ISpan& log(int64_t timestamp_micros, const std::string& event) {
        return log(timestamp_micros, LogFields{{std::string(log_fields::MESSAGE), event}});
    }

    virtual ISpan& set_baggage_item(const std::string& key, const std::string& value) = 0;
    [[nodiscard]] virtual std::optional<std::string> get_baggage_item(const std::string& key) const = 0;

    virtual ISpan& set_operation_name(std::string_view name) = 0;

    /// Finish now; only the first finish on a span has any effect
    virtual void finish() = 0;
    virtual void finish(int64_t finish_micros) = 0;
};

// ============================================================================
// Span: ISpan backed by an X-Ray entity
// ============================================================================

/**
 * @brief Span wrapping one Segment or Subsegment
 *
 * Tags are routed either to a direct entity field (error/fault/throttle,
 * sampling, user, origin, parent id) or through TagResolver into one of
 * the entity's containers. The first finish() closes the entity; later
 * calls and concurrent losers are no-ops. Close failures of any type are
 * logged and never propagate, so finish() is safe in destructors.
 *
 * A span shares ownership of the recorder that created its entity and may
 * outlive the tracer.
 *
 * Operation names are fixed at creation: set_operation_name() throws
 * UnsupportedOperationError.
 */
class Span : public ISpan {
public:
    Span(std::shared_ptr<IRecorder> recorder, std::shared_ptr<Entity> entity, SpanContext context);

    using ISpan::set_tag;
    using ISpan::log;

    [[nodiscard]] const SpanContext& context() const override { return context_; }

    Span& set_tag(std::string_view key, const std::string& value) override;
    Span& set_tag(std::string_view key, bool value) override;
    Span& set_tag(std::string_view key, int64_t value) override;
    Span& set_tag(std::string_view key, double value) override;

    Span& log(const LogFields& fields) override;
    Span& log(int64_t timestamp_micros, const LogFields& fields) override;

    Span& set_baggage_item(const std::string& key, const std::string& value) override;
    [[nodiscard]] std::optional<std::string> get_baggage_item(const std::string& key) const override;

    /// @throws UnsupportedOperationError always
    Span& set_operation_name(std::string_view name) override;

    void finish() noexcept override;
    void finish(int64_t finish_micros) noexcept override;

    [[nodiscard]] bool is_finished() const { return finished_.load(); }

    /// Backing entity
    [[nodiscard]] const std::shared_ptr<Entity>& entity() const { return entity_; }

private:
    /// Store a value through the resolver; no direct-field handling
    void set_tag_any(std::string_view key, AttributeValue value);

    void finish_at(double end_seconds) noexcept;

    const std::shared_ptr<IRecorder> recorder_;
    const std::shared_ptr<Entity> entity_;
    SpanContext context_;
    std::atomic<bool> finished_{false};
};

} // namespace xrayot

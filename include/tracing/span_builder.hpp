#pragma once

#include "tracing/span.hpp"
#include "tracing/span_context.hpp"
#include "tracing/tags.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace xrayot {

class IRecorder;
class Scope;
class ScopeManager;

namespace references {

inline constexpr std::string_view CHILD_OF = "child_of";
inline constexpr std::string_view FOLLOWS_FROM = "follows_from";

} // namespace references

/**
 * @brief Fluent span factory; parent resolution happens in start()
 *
 * Parent, in order of precedence:
 *   1. explicit child_of reference with a live Span  -> that span's entity
 *   2. explicit child_of reference, context only     -> facade segment
 *   3. ignore_active_span()                          -> new root
 *   4. otherwise                                     -> recorder's current entity
 *
 * Only child_of references are supported; other kinds are dropped with a
 * warning, and a second child_of replaces the first. A live parent's
 * baggage is copied when start() runs.
 *
 * A builder is owned by the thread that created it and used once. It
 * borrows the tracer's scope manager and must not outlive the tracer.
 */
class SpanBuilder {
public:
    using TagValue = std::variant<std::string, bool, int64_t, double>;

    SpanBuilder(std::shared_ptr<IRecorder> recorder, ScopeManager& scope_manager,
                std::string operation_name);

    SpanBuilder& as_child_of(const SpanContext& parent);
    SpanBuilder& as_child_of(const std::shared_ptr<ISpan>& parent);
    SpanBuilder& add_reference(std::string_view reference_type, const SpanContext& context);

    SpanBuilder& ignore_active_span();

    /// Send the entity as soon as it starts, in addition to on finish
    SpanBuilder& send_on_start();

    SpanBuilder& with_tag(std::string_view key, const std::string& value);
    SpanBuilder& with_tag(std::string_view key, const char* value);
    SpanBuilder& with_tag(std::string_view key, bool value);
    SpanBuilder& with_tag(std::string_view key, int value);
    SpanBuilder& with_tag(std::string_view key, int64_t value);
    SpanBuilder& with_tag(std::string_view key, double value);

    template<typename T>
    SpanBuilder& with_tag(const Tag<T>& tag, const std::type_identity_t<T>& value) {
        return with_tag(tag.key, value);
    }

    /// Explicit start time, microseconds since the epoch
    SpanBuilder& with_start_timestamp(int64_t microseconds);

    [[nodiscard]] std::shared_ptr<Span> start();

    /// start() followed by ScopeManager::activate()
    std::shared_ptr<Scope> start_active(bool finish_on_close);

private:
    struct Reference {
        SpanContext context;
        std::shared_ptr<Span> span;
    };

    SpanBuilder& add_reference(std::string_view reference_type, Reference reference);

    std::shared_ptr<IRecorder> recorder_;
    ScopeManager& scope_manager_;
    const std::string operation_name_;

    std::map<std::string, Reference, std::less<>> references_;
    std::vector<std::pair<std::string, TagValue>> tags_;
    std::optional<int64_t> start_micros_;
    bool ignore_active_span_ = false;
    bool send_on_start_ = false;
};

} // namespace xrayot

#include "tracing/span.hpp"
#include "tracing/entity_projection.hpp"
#include "tracing/tag_resolver.hpp"
#include "entity/entity.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace xrayot {

namespace {

/// Log values stored as metadata; a stray exception_ptr keeps its what()
AttributeValue to_attribute(const LogValue& value) {
    return std::visit([](const auto& v) -> AttributeValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::exception_ptr>) {
            if (!v) return std::string{};
            try {
                std::rethrow_exception(v);
            } catch (const std::exception& e) {
                return std::string(e.what());
            } catch (...) {
                return std::string("unknown exception");
            }
        } else {
            return v;
        }
    }, value);
}

} // anonymous namespace

Span::Span(std::shared_ptr<IRecorder> recorder, std::shared_ptr<Entity> entity, SpanContext context)
    : recorder_(std::move(recorder)),
      entity_(std::move(entity)),
      context_(std::move(context)) {}

// ============================================================================
// Tags
// ============================================================================

Span& Span::set_tag(std::string_view key, const std::string& value) {
    if (key == tags::USER.key && entity_->is_segment()) {
        static_cast<Segment&>(*entity_).set_user(value);
    } else if (key == tags::ORIGIN.key && entity_->is_segment()) {
        static_cast<Segment&>(*entity_).set_origin(value);
    } else if (key == tags::PARENT_ID.key) {
        entity_->set_parent_id(value);
    } else {
        set_tag_any(key, value);
    }
    return *this;
}

Span& Span::set_tag(std::string_view key, bool value) {
    if (key == tags::ERROR.key) {
        entity_->set_error(value);
    } else if (key == tags::FAULT.key) {
        entity_->set_fault(value);
    } else if (key == tags::THROTTLE.key) {
        entity_->set_throttle(value);
    } else if (key == tags::IS_SAMPLED.key && entity_->is_segment()) {
        static_cast<Segment&>(*entity_).set_sampled(value);
    } else {
        set_tag_any(key, value);
    }
    return *this;
}

Span& Span::set_tag(std::string_view key, int64_t value) {
    set_tag_any(key, value);
    return *this;
}

Span& Span::set_tag(std::string_view key, double value) {
    set_tag_any(key, value);
    return *this;
}

void Span::set_tag_any(std::string_view key, AttributeValue value) {
    const auto dest = TagResolver::resolve(key);
    if (!project_tag(*entity_, dest, std::move(value))) {
        utils::log::debug(std::format("Tag '{}' dropped on entity {}", key, entity_->id()));
    }
}

// ============================================================================
// Logs
// ============================================================================

Span& Span::log(const LogFields& fields) {
    return log(utils::epoch_micros_now(), fields);
}

Span& Span::log(int64_t timestamp_micros, const LogFields& fields) {
    const auto err = fields.find(std::string(log_fields::ERROR_OBJECT));
    if (err != fields.end()) {
        if (const auto* ex = std::get_if<std::exception_ptr>(&err->second); ex && *ex) {
            entity_->add_exception(*ex);
            return *this;
        }
    }

    auto entry = std::make_shared<AttributeMap>();
    for (const auto& [name, value] : fields) {
        entry->put(name, to_attribute(value));
    }
    entity_->put_metadata(std::string(metadata_namespaces::LOG),
                          utils::format_iso8601_utc(timestamp_micros),
                          std::move(entry));
    return *this;
}

// ============================================================================
// Baggage / naming
// ============================================================================

Span& Span::set_baggage_item(const std::string& key, const std::string& value) {
    context_.set_baggage_item(key, value);
    return *this;
}

std::optional<std::string> Span::get_baggage_item(const std::string& key) const {
    return context_.get_baggage_item(key);
}

Span& Span::set_operation_name(std::string_view /*name*/) {
    throw UnsupportedOperationError(
        "Entity names cannot be changed after creation");
}

// ============================================================================
// Finish
// ============================================================================

void Span::finish() noexcept {
    finish_at(utils::epoch_seconds_now());
}

void Span::finish(int64_t finish_micros) noexcept {
    finish_at(utils::micros_to_epoch_seconds(finish_micros));
}

void Span::finish_at(double end_seconds) noexcept {
    bool expected = false;
    if (!finished_.compare_exchange_strong(expected, true)) {
        return;
    }

    try {
        entity_->set_end_time(end_seconds);
        entity_->close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to close entity {} ({}): {}",
                                      entity_->id(), entity_->name(), e.what()));
    } catch (...) {
        utils::log::error(std::format("Failed to close entity {} ({}): unknown error",
                                      entity_->id(), entity_->name()));
    }
}

} // namespace xrayot

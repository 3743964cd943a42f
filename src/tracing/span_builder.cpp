#include "tracing/span_builder.hpp"
#include "tracing/scope.hpp"
#include "entity/entity.hpp"
#include "entity/trace_header.hpp"
#include "recorder/recorder.hpp"
#include "core/utils.hpp"

#include <format>

namespace xrayot {

namespace {

/// Puts the recorder's current entity back when start() leaves
class TraceEntityRestorer {
public:
    explicit TraceEntityRestorer(IRecorder& recorder)
        : recorder_(recorder), saved_(recorder.get_trace_entity()) {}
    ~TraceEntityRestorer() { recorder_.set_trace_entity(saved_); }

    TraceEntityRestorer(const TraceEntityRestorer&) = delete;
    TraceEntityRestorer& operator=(const TraceEntityRestorer&) = delete;

    [[nodiscard]] const std::shared_ptr<Entity>& saved() const { return saved_; }

private:
    IRecorder& recorder_;
    const std::shared_ptr<Entity> saved_;
};

std::string trace_header_for(const Entity& entity) {
    TraceHeader header;
    header.root_trace_id = entity.trace_id();
    header.parent_id = entity.id();
    header.sampled = entity.parent_segment().is_sampled()
        ? TraceHeader::SampleDecision::SAMPLED
        : TraceHeader::SampleDecision::NOT_SAMPLED;
    return header.to_string();
}

} // anonymous namespace

SpanBuilder::SpanBuilder(std::shared_ptr<IRecorder> recorder, ScopeManager& scope_manager,
                         std::string operation_name)
    : recorder_(std::move(recorder)),
      scope_manager_(scope_manager),
      operation_name_(std::move(operation_name)) {}

// ============================================================================
// References
// ============================================================================

SpanBuilder& SpanBuilder::as_child_of(const SpanContext& parent) {
    return add_reference(references::CHILD_OF, Reference{parent, nullptr});
}

SpanBuilder& SpanBuilder::as_child_of(const std::shared_ptr<ISpan>& parent) {
    if (!parent) return *this;
    // A live span is kept so the child attaches to its entity and sees its
    // baggage as of start()
    if (auto span = std::dynamic_pointer_cast<Span>(parent)) {
        return add_reference(references::CHILD_OF, Reference{SpanContext{}, std::move(span)});
    }
    return add_reference(references::CHILD_OF, Reference{parent->context(), nullptr});
}

SpanBuilder& SpanBuilder::add_reference(std::string_view reference_type, const SpanContext& context) {
    return add_reference(reference_type, Reference{context, nullptr});
}

SpanBuilder& SpanBuilder::add_reference(std::string_view reference_type, Reference reference) {
    if (reference_type != references::CHILD_OF) {
        utils::log::warn(std::format(
            "Span '{}': reference type '{}' is not supported and will be ignored",
            operation_name_, reference_type));
        return *this;
    }

    if (const auto it = references_.find(reference_type); it != references_.end()) {
        utils::log::warn(std::format(
            "Span '{}': replacing existing '{}' reference; only one parent is supported",
            operation_name_, reference_type));
        it->second = std::move(reference);
    } else {
        references_.emplace(std::string(reference_type), std::move(reference));
    }
    return *this;
}

SpanBuilder& SpanBuilder::ignore_active_span() {
    ignore_active_span_ = true;
    return *this;
}

SpanBuilder& SpanBuilder::send_on_start() {
    send_on_start_ = true;
    return *this;
}

// ============================================================================
// Tags
// ============================================================================

SpanBuilder& SpanBuilder::with_tag(std::string_view key, const std::string& value) {
    tags_.emplace_back(std::string(key), value);
    return *this;
}

SpanBuilder& SpanBuilder::with_tag(std::string_view key, const char* value) {
    return with_tag(key, std::string(value));
}

SpanBuilder& SpanBuilder::with_tag(std::string_view key, bool value) {
    tags_.emplace_back(std::string(key), value);
    return *this;
}

SpanBuilder& SpanBuilder::with_tag(std::string_view key, int value) {
    return with_tag(key, static_cast<int64_t>(value));
}

SpanBuilder& SpanBuilder::with_tag(std::string_view key, int64_t value) {
    tags_.emplace_back(std::string(key), value);
    return *this;
}

SpanBuilder& SpanBuilder::with_tag(std::string_view key, double value) {
    tags_.emplace_back(std::string(key), value);
    return *this;
}

SpanBuilder& SpanBuilder::with_start_timestamp(int64_t microseconds) {
    start_micros_ = microseconds;
    return *this;
}

// ============================================================================
// Start
// ============================================================================

std::shared_ptr<Span> SpanBuilder::start() {
    TraceEntityRestorer restorer(*recorder_);

    std::shared_ptr<Entity> parent;
    SpanContext::Baggage baggage;

    const auto ref = references_.find(references::CHILD_OF);
    if (ref != references_.end() && ref->second.span) {
        parent = ref->second.span->entity();
        baggage = ref->second.span->context().baggage();
    } else if (ref != references_.end()) {
        // Remote parent: stand in for it with a facade seeded from its trace header
        TraceHeader header;
        if (const auto raw = ref->second.context.get_baggage_item(std::string(TraceHeader::HEADER_KEY))) {
            if (auto parsed = TraceHeader::parse(*raw)) {
                header = std::move(*parsed);
            }
        }
        parent = recorder_->make_facade_segment(header);
        baggage = ref->second.context.baggage();
    } else if (!ignore_active_span_) {
        parent = restorer.saved();
    }

    recorder_->set_trace_entity(parent);

    // Inside a host-managed context the top-level segment belongs to the
    // host, so a parentless span still becomes a subsegment
    std::shared_ptr<Entity> entity;
    if (!parent && recorder_->resolve_host_context() != HostContext::HOST_MANAGED) {
        entity = recorder_->begin_segment(operation_name_);
    } else {
        entity = recorder_->begin_subsegment(operation_name_);
    }

    entity->set_in_progress(true);
    entity->set_start_time(start_micros_
        ? utils::micros_to_epoch_seconds(*start_micros_)
        : utils::epoch_seconds_now());

    SpanContext context(entity->id(), std::move(baggage));
    context.set_baggage_item(std::string(TraceHeader::HEADER_KEY), trace_header_for(*entity));

    auto span = std::make_shared<Span>(recorder_, entity, std::move(context));
    for (const auto& tag : tags_) {
        std::visit([&span, &tag](const auto& v) { span->set_tag(tag.first, v); }, tag.second);
    }

    if (send_on_start_) {
        if (entity->is_segment()) {
            recorder_->send_segment(static_cast<const Segment&>(*entity));
        } else {
            recorder_->send_subsegment(static_cast<const Subsegment&>(*entity));
        }
    }

    utils::log::debug(std::format("Started span '{}' entity={} trace={}",
                                  operation_name_, entity->id(), entity->trace_id()));
    return span;
}

std::shared_ptr<Scope> SpanBuilder::start_active(bool finish_on_close) {
    return scope_manager_.activate(start(), finish_on_close);
}

} // namespace xrayot

#include "tracing/span_context.hpp"
#include "entity/trace_header.hpp"

namespace xrayot {

SpanContext::SpanContext(std::string span_id, Baggage baggage)
    : span_id_(std::move(span_id)),
      baggage_(std::move(baggage)) {}

SpanContext::SpanContext(const SpanContext& other)
    : span_id_(other.span_id_),
      baggage_(other.baggage()) {}

SpanContext& SpanContext::operator=(const SpanContext& other) {
    if (this == &other) return *this;
    Baggage copy = other.baggage();
    std::lock_guard<std::mutex> lock(mutex_);
    span_id_ = other.span_id_;
    baggage_ = std::move(copy);
    return *this;
}

std::string SpanContext::trace_id() const {
    const auto header = get_baggage_item(std::string(TraceHeader::HEADER_KEY));
    if (!header) return {};
    const auto parsed = TraceHeader::parse(*header);
    return parsed ? parsed->root_trace_id : std::string{};
}

void SpanContext::set_baggage_item(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    baggage_.insert_or_assign(key, value);
}

std::optional<std::string> SpanContext::get_baggage_item(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = baggage_.find(key);
    if (it == baggage_.end()) return std::nullopt;
    return it->second;
}

SpanContext::Baggage SpanContext::baggage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return baggage_;
}

void SpanContext::for_each_baggage_item(
    const std::function<bool(const std::string&, const std::string&)>& f) const {
    for (const auto& [key, value] : baggage()) {
        if (!f(key, value)) break;
    }
}

} // namespace xrayot

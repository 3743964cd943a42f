#include "entity/entity.hpp"
#include "entity/trace_header.hpp"
#include "recorder/recorder.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cxxabi.h>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <typeinfo>

namespace xrayot {

namespace {

std::string demangle(const char* mangled) {
    int status = 0;
    char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || !readable) {
        return mangled;
    }
    std::string result(readable);
    std::free(readable);
    return result;
}

void put_if_not_empty(nlohmann::json& out, const char* key, const AttributeMap& map) {
    if (!map.empty()) {
        out[key] = map.to_json();
    }
}

} // anonymous namespace

// ============================================================================
// Entity
// ============================================================================

Entity::Entity(IRecorder& creator, std::string name, std::string id)
    : creator_(creator),
      id_(std::move(id)),
      name_(std::move(name)) {}

std::string Entity::parent_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!parent_id_override_.empty()) {
        return parent_id_override_;
    }
    const auto p = parent();
    return p ? p->id() : std::string{};
}

void Entity::set_parent_id(std::string parent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    parent_id_override_ = std::move(parent_id);
}

void Entity::put_metadata(const std::string& ns, const std::string& key, AttributeValue value) {
    metadata_.child(ns)->put(key, std::move(value));
}

void Entity::add_exception(std::exception_ptr ex) {
    if (!ex) return;

    Cause cause;
    cause.id = TraceHeader::generate_entity_id();
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        cause.type = demangle(typeid(e).name());
        cause.message = e.what();
    } catch (...) {
        // Not derived from std::exception: nothing more to extract
        cause.type = "unknown";
        cause.message = "non-standard exception";
    }

    set_fault(true);
    std::lock_guard<std::mutex> lock(mutex_);
    causes_.push_back(std::move(cause));
}

std::vector<Cause> Entity::exceptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return causes_;
}

std::vector<std::shared_ptr<Subsegment>> Entity::subsegments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subsegments_;
}

void Entity::add_subsegment(std::shared_ptr<Subsegment> child) {
    child->parent_segment().increment_reference();
    std::lock_guard<std::mutex> lock(mutex_);
    subsegments_.push_back(std::move(child));
}

void Entity::remove_subsegment(const Subsegment& child) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(subsegments_, [&child](const auto& s) { return s.get() == &child; });
}

void Entity::mark_closed() {
    if (closed_.exchange(true)) {
        throw AlreadyEmittedError(
            std::format("Entity '{}' ({}) has already been closed", name_, id_));
    }
    if (end_time() == 0.0) {
        set_end_time(utils::epoch_seconds_now());
    }
    set_in_progress(false);
}

void Entity::release_subsegments() {
    std::vector<std::shared_ptr<Subsegment>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        children.swap(subsegments_);
    }
    for (const auto& child : children) {
        child->release_subsegments();
    }
}

nlohmann::json Entity::to_json() const {
    nlohmann::json out;
    out["name"] = name_;
    out["id"] = id_;
    out["start_time"] = start_time();

    if (is_in_progress() || end_time() == 0.0) {
        out["in_progress"] = true;
    } else {
        out["end_time"] = end_time();
    }

    if (is_error()) out["error"] = true;
    if (is_fault()) out["fault"] = true;
    if (is_throttle()) out["throttle"] = true;

    put_if_not_empty(out, "annotations", annotations_);
    put_if_not_empty(out, "aws", aws_);
    put_if_not_empty(out, "http", http_);
    put_if_not_empty(out, "sql", sql_);
    put_if_not_empty(out, "metadata", metadata_);

    const auto causes = exceptions();
    if (!causes.empty()) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& c : causes) {
            list.push_back({{"id", c.id}, {"type", c.type}, {"message", c.message}});
        }
        out["cause"] = {{"exceptions", std::move(list)}};
    }

    const auto children = subsegments();
    if (!children.empty()) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& child : children) {
            list.push_back(child->to_json());
        }
        out["subsegments"] = std::move(list);
    }
    return out;
}

// ============================================================================
// Segment
// ============================================================================

Segment::Segment(IRecorder& creator, std::string name, std::string trace_id)
    : Segment(creator, std::move(name), std::move(trace_id),
              TraceHeader::generate_entity_id(), false) {}

Segment::Segment(IRecorder& creator, std::string name, std::string trace_id,
                 std::string id, bool facade)
    : Entity(creator, std::move(name), std::move(id)),
      trace_id_(std::move(trace_id)),
      facade_(facade) {}

std::shared_ptr<Segment> Segment::make_facade(
    IRecorder& creator, std::string trace_id, std::string id, bool sampled) {
    // Private constructor: make_shared cannot reach it
    std::shared_ptr<Segment> facade(
        new Segment(creator, "facade", std::move(trace_id), std::move(id), true));
    facade->set_sampled(sampled);
    facade->set_in_progress(true);
    return facade;
}

std::string Segment::user() const {
    std::lock_guard<std::mutex> lock(segment_mutex_);
    return user_;
}

void Segment::set_user(std::string user) {
    std::lock_guard<std::mutex> lock(segment_mutex_);
    user_ = std::move(user);
}

std::string Segment::origin() const {
    std::lock_guard<std::mutex> lock(segment_mutex_);
    return origin_;
}

void Segment::set_origin(std::string origin) {
    std::lock_guard<std::mutex> lock(segment_mutex_);
    origin_ = std::move(origin);
}

void Segment::close() {
    if (facade_) {
        throw AlreadyEmittedError(
            std::format("Facade segment {} cannot be closed locally", id()));
    }
    mark_closed();

    if (creator_.get_trace_entity().get() == this) {
        creator_.set_trace_entity(nullptr);
    }

    if (reference_count() == 0) {
        emit();
    }
}

void Segment::emit() {
    if (facade_ || emitted_.exchange(true)) return;

    if (is_sampled()) {
        creator_.send_segment(*this);
    }
    release_subsegments();
}

nlohmann::json Segment::to_json() const {
    nlohmann::json out = Entity::to_json();
    out["trace_id"] = trace_id_;

    const std::string pid = parent_id();
    if (!pid.empty()) out["parent_id"] = pid;

    const std::string u = user();
    if (!u.empty()) out["user"] = u;

    const std::string o = origin();
    if (!o.empty()) out["origin"] = o;

    put_if_not_empty(out, "service", service_);
    return out;
}

// ============================================================================
// Subsegment
// ============================================================================

Subsegment::Subsegment(IRecorder& creator, std::string name, std::shared_ptr<Entity> parent)
    : Entity(creator, std::move(name), TraceHeader::generate_entity_id()),
      parent_(std::move(parent)),
      parent_segment_(std::static_pointer_cast<Segment>(
          parent_->parent_segment().shared_from_this())) {}

const std::string& Subsegment::trace_id() const {
    return parent_segment_->trace_id();
}

void Subsegment::close() {
    mark_closed();

    // Closing the current entity hands the slot back to the parent
    if (creator_.get_trace_entity().get() == this) {
        creator_.set_trace_entity(parent_);
    }

    if (parent_segment_->is_facade()) {
        // Nobody local will emit the facade: stream this subtree on its own
        creator_.send_subsegment(*this);
        parent_->remove_subsegment(*this);
        release_subsegments();
    }

    if (parent_segment_->decrement_reference() && parent_segment_->is_closed()) {
        parent_segment_->emit();
    }
}

nlohmann::json Subsegment::to_document() const {
    nlohmann::json out = to_json();
    out["type"] = "subsegment";
    out["trace_id"] = trace_id();
    out["parent_id"] = parent_id();
    return out;
}

} // namespace xrayot

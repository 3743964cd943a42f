#include "recorder/local_recorder.hpp"
#include "core/error.hpp"
#include "core/instance_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_map>

namespace xrayot {

namespace {

utils::InstanceRegistry& recorder_registry() {
    static utils::InstanceRegistry registry;
    return registry;
}

struct ThreadState {
    std::shared_ptr<Entity> current;
    std::shared_ptr<Segment> host_segment;
};

/// Per-thread state for every live recorder instance this thread has touched
std::unordered_map<uint64_t, ThreadState>& thread_states() {
    static thread_local std::unordered_map<uint64_t, ThreadState> states;
    static thread_local uint64_t seen_generation = 0;
    recorder_registry().prune(states, seen_generation);
    return states;
}

} // anonymous namespace

LocalRecorder::LocalRecorder(std::shared_ptr<IEmitter> emitter, HostContextResolver resolver)
    : instance_id_(recorder_registry().acquire()),
      emitter_(std::move(emitter)),
      resolver_(std::move(resolver)) {}

LocalRecorder::~LocalRecorder() {
    // Other threads drop their slots on their next access
    recorder_registry().retire(instance_id_);
    thread_states().erase(instance_id_);
}

std::shared_ptr<Entity> LocalRecorder::get_trace_entity() const {
    auto& states = thread_states();
    const auto it = states.find(instance_id_);
    return it == states.end() ? nullptr : it->second.current;
}

void LocalRecorder::set_trace_entity(std::shared_ptr<Entity> entity) {
    thread_states()[instance_id_].current = std::move(entity);
}

std::shared_ptr<Segment> LocalRecorder::begin_segment(const std::string& name) {
    if (get_trace_entity()) {
        utils::log::debug(std::format(
            "Beginning segment '{}' while another entity is current; replacing it", name));
    }

    auto segment = std::make_shared<Segment>(*this, name, TraceHeader::generate_trace_id());
    segment->set_start_time(utils::epoch_seconds_now());
    segment->set_in_progress(true);
    set_trace_entity(segment);
    return segment;
}

std::shared_ptr<Subsegment> LocalRecorder::begin_subsegment(const std::string& name) {
    std::shared_ptr<Entity> parent = get_trace_entity();
    if (!parent && resolve_host_context() == HostContext::HOST_MANAGED) {
        parent = host_segment();
    }
    if (!parent) {
        throw ContextMissingError(std::format(
            "Failed to begin subsegment '{}': no current segment or subsegment", name));
    }

    auto subsegment = std::make_shared<Subsegment>(*this, name, parent);
    subsegment->set_start_time(utils::epoch_seconds_now());
    subsegment->set_in_progress(true);
    parent->add_subsegment(subsegment);
    set_trace_entity(subsegment);
    return subsegment;
}

std::shared_ptr<Segment> LocalRecorder::make_facade_segment(const TraceHeader& header) {
    const std::string trace_id = header.has_root()
        ? header.root_trace_id
        : TraceHeader::generate_trace_id();
    const std::string id = header.parent_id.empty()
        ? TraceHeader::generate_entity_id()
        : header.parent_id;
    const bool sampled = header.sampled != TraceHeader::SampleDecision::NOT_SAMPLED;
    return Segment::make_facade(*this, trace_id, id, sampled);
}

HostContext LocalRecorder::resolve_host_context() const {
    return resolver_ ? resolver_() : HostContext::LOCAL;
}

std::shared_ptr<Segment> LocalRecorder::host_segment() {
    auto& state = thread_states()[instance_id_];
    if (!state.host_segment) {
        state.host_segment = make_facade_segment(TraceHeader{});
    }
    return state.host_segment;
}

void LocalRecorder::send_segment(const Segment& segment) {
    if (!emitter_) return;
    if (emitter_->send_segment(segment)) {
        segments_sent_.fetch_add(1);
    } else {
        utils::log::warn(std::format("Failed to send segment {} via {}",
                                     segment.id(), emitter_->name()));
    }
}

void LocalRecorder::send_subsegment(const Subsegment& subsegment) {
    if (!emitter_) return;
    if (emitter_->send_subsegment(subsegment)) {
        subsegments_sent_.fetch_add(1);
    } else {
        utils::log::warn(std::format("Failed to send subsegment {} via {}",
                                     subsegment.id(), emitter_->name()));
    }
}

} // namespace xrayot

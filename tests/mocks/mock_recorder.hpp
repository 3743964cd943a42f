#pragma once

#include "recorder/recorder.hpp"
#include "entity/entity.hpp"
#include "entity/trace_header.hpp"
#include "core/error.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace xrayot::testing {

/**
 * @brief Single-threaded recorder for span tests
 *
 * Keeps the current entity in a plain member, records what was sent and
 * can be told to fail transmissions (which surfaces as a failing close).
 */
class MockRecorder : public IRecorder {
public:
    [[nodiscard]] std::shared_ptr<Entity> get_trace_entity() const override { return current_; }
    void set_trace_entity(std::shared_ptr<Entity> entity) override { current_ = std::move(entity); }

    std::shared_ptr<Segment> begin_segment(const std::string& name) override {
        ++segments_begun_;
        auto segment = std::make_shared<Segment>(*this, name, TraceHeader::generate_trace_id());
        segment->set_in_progress(true);
        current_ = segment;
        return segment;
    }

    std::shared_ptr<Subsegment> begin_subsegment(const std::string& name) override {
        ++subsegments_begun_;
        auto parent = current_;
        if (!parent && host_managed_) {
            if (!host_segment_) host_segment_ = make_facade_segment(TraceHeader{});
            parent = host_segment_;
        }
        if (!parent) {
            throw ContextMissingError("no current entity for subsegment '" + name + "'");
        }
        auto subsegment = std::make_shared<Subsegment>(*this, name, parent);
        subsegment->set_in_progress(true);
        parent->add_subsegment(subsegment);
        current_ = subsegment;
        return subsegment;
    }

    [[nodiscard]] std::shared_ptr<Segment> make_facade_segment(const TraceHeader& header) override {
        ++facades_made_;
        return Segment::make_facade(
            *this,
            header.has_root() ? header.root_trace_id : TraceHeader::generate_trace_id(),
            header.parent_id.empty() ? TraceHeader::generate_entity_id() : header.parent_id,
            header.sampled != TraceHeader::SampleDecision::NOT_SAMPLED);
    }

    [[nodiscard]] HostContext resolve_host_context() const override {
        return host_managed_ ? HostContext::HOST_MANAGED : HostContext::LOCAL;
    }

    void send_segment(const Segment& segment) override {
        if (fail_sends_) throw std::runtime_error("mock transmission failure");
        sent_segments_.push_back(segment.id());
    }

    void send_subsegment(const Subsegment& subsegment) override {
        if (fail_sends_) throw std::runtime_error("mock transmission failure");
        sent_subsegments_.push_back(subsegment.id());
    }

    void set_host_managed(bool v) { host_managed_ = v; }
    void set_fail_sends(bool v) { fail_sends_ = v; }

    [[nodiscard]] const std::shared_ptr<Segment>& host_segment() const { return host_segment_; }
    [[nodiscard]] const std::vector<std::string>& sent_segments() const { return sent_segments_; }
    [[nodiscard]] const std::vector<std::string>& sent_subsegments() const { return sent_subsegments_; }
    [[nodiscard]] int segments_begun() const { return segments_begun_; }
    [[nodiscard]] int subsegments_begun() const { return subsegments_begun_; }
    [[nodiscard]] int facades_made() const { return facades_made_; }

private:
    std::shared_ptr<Entity> current_;
    std::shared_ptr<Segment> host_segment_;
    bool host_managed_ = false;
    bool fail_sends_ = false;
    std::vector<std::string> sent_segments_;
    std::vector<std::string> sent_subsegments_;
    int segments_begun_ = 0;
    int subsegments_begun_ = 0;
    int facades_made_ = 0;
};

} // namespace xrayot::testing

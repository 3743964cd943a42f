#include <catch2/catch_test_macros.hpp>
#include "entity/entity.hpp"
#include "recorder/local_recorder.hpp"
#include "core/error.hpp"
#include "mocks/mock_emitter.hpp"

#include <future>
#include <stdexcept>
#include <thread>

using namespace xrayot;
using xrayot::testing::MockEmitter;

// ============================================================================
// Recorder slot
// ============================================================================

TEST_CASE("LocalRecorder: begin_segment becomes current", "[recorder]") {
    auto emitter = std::make_shared<MockEmitter>();
    LocalRecorder recorder(emitter);

    REQUIRE(recorder.get_trace_entity() == nullptr);
    auto segment = recorder.begin_segment("root");
    REQUIRE(recorder.get_trace_entity() == segment);
    REQUIRE(segment->is_in_progress());
    REQUIRE(segment->start_time() > 0.0);
    REQUIRE(TraceHeader::is_valid_trace_id(segment->trace_id()));
    REQUIRE(segment->id().size() == 16);
}

TEST_CASE("LocalRecorder: subsegment parented to current entity", "[recorder]") {
    LocalRecorder recorder(std::make_shared<MockEmitter>());
    auto segment = recorder.begin_segment("root");
    auto child = recorder.begin_subsegment("child");
    auto grandchild = recorder.begin_subsegment("grandchild");

    REQUIRE(child->parent() == segment);
    REQUIRE(grandchild->parent() == child);
    REQUIRE(&grandchild->parent_segment() == segment.get());
    REQUIRE(grandchild->trace_id() == segment->trace_id());
    REQUIRE(grandchild->parent_id() == child->id());
    REQUIRE(segment->reference_count() == 2);
    REQUIRE(recorder.get_trace_entity() == grandchild);
}

TEST_CASE("LocalRecorder: subsegment without context", "[recorder]") {
    SECTION("Local context throws") {
        LocalRecorder recorder;
        REQUIRE_THROWS_AS(recorder.begin_subsegment("orphan"), ContextMissingError);
    }

    SECTION("Host-managed context attaches to the host facade") {
        LocalRecorder recorder(nullptr, [] { return HostContext::HOST_MANAGED; });
        auto child = recorder.begin_subsegment("invocation");
        REQUIRE(child->parent_segment().is_facade());
        REQUIRE(recorder.begin_subsegment("nested")->parent() == child);
    }
}

TEST_CASE("LocalRecorder: slots are per thread and per instance", "[recorder]") {
    LocalRecorder first;
    LocalRecorder second;
    auto segment = first.begin_segment("root");

    REQUIRE(second.get_trace_entity() == nullptr);

    std::shared_ptr<Entity> seen_on_other_thread = segment;
    std::thread([&] { seen_on_other_thread = first.get_trace_entity(); }).join();
    REQUIRE(seen_on_other_thread == nullptr);
}

TEST_CASE("LocalRecorder: slots on other threads are released after destruction", "[recorder]") {
    auto recorder = std::make_unique<LocalRecorder>(nullptr, [] { return HostContext::HOST_MANAGED; });
    std::weak_ptr<Entity> parked_host;
    std::promise<void> parked;
    std::promise<void> destroyed;
    auto destroyed_signal = destroyed.get_future();
    bool released = false;

    std::thread worker([&] {
        // Leaves the host facade both current and cached on this thread
        auto subsegment = recorder->begin_subsegment("parked");
        parked_host = subsegment->parent();
        subsegment->close();
        subsegment.reset();
        parked.set_value();

        destroyed_signal.wait();
        LocalRecorder other;
        released = other.get_trace_entity() == nullptr && parked_host.expired();
    });

    parked.get_future().wait();
    REQUIRE_FALSE(parked_host.expired());
    recorder.reset();
    destroyed.set_value();
    worker.join();

    REQUIRE(released);
}

// ============================================================================
// Close / emission
// ============================================================================

TEST_CASE("Entity: segment emitted once all subsegments close", "[entity]") {
    auto emitter = std::make_shared<MockEmitter>();
    LocalRecorder recorder(emitter);

    auto segment = recorder.begin_segment("root");
    auto child = recorder.begin_subsegment("child");

    // Closing the current subsegment hands the slot back to its parent
    child->close();
    REQUIRE(recorder.get_trace_entity() == segment);
    REQUIRE(emitter->segments().empty());

    segment->close();
    REQUIRE(recorder.get_trace_entity() == nullptr);
    REQUIRE(segment->is_emitted());

    const auto docs = emitter->segments();
    REQUIRE(docs.size() == 1);
    REQUIRE(docs[0]["name"] == "root");
    REQUIRE(docs[0]["trace_id"] == segment->trace_id());
    REQUIRE(docs[0]["subsegments"].size() == 1);
    REQUIRE(docs[0]["subsegments"][0]["name"] == "child");
    REQUIRE_FALSE(docs[0].contains("in_progress"));
    REQUIRE(recorder.segments_sent() == 1);

    // Tree released after emission
    REQUIRE(segment->subsegments().empty());
}

TEST_CASE("Entity: segment closed first waits for open subsegments", "[entity]") {
    auto emitter = std::make_shared<MockEmitter>();
    LocalRecorder recorder(emitter);

    auto segment = recorder.begin_segment("root");
    auto child = recorder.begin_subsegment("child");

    segment->close();
    REQUIRE_FALSE(segment->is_emitted());
    REQUIRE(emitter->segments().empty());

    child->close();
    REQUIRE(segment->is_emitted());
    REQUIRE(emitter->segments().size() == 1);
}

TEST_CASE("Entity: second close throws", "[entity]") {
    LocalRecorder recorder(std::make_shared<MockEmitter>());
    auto segment = recorder.begin_segment("root");
    segment->close();
    REQUIRE(segment->is_closed());
    REQUIRE_THROWS_AS(segment->close(), AlreadyEmittedError);
}

TEST_CASE("Entity: close keeps an explicit end time", "[entity]") {
    LocalRecorder recorder;
    auto segment = recorder.begin_segment("root");
    segment->set_end_time(1551016322.5);
    segment->close();
    REQUIRE(segment->end_time() == 1551016322.5);
    REQUIRE_FALSE(segment->is_in_progress());
}

TEST_CASE("Entity: unsampled segments are not sent", "[entity]") {
    auto emitter = std::make_shared<MockEmitter>();
    LocalRecorder recorder(emitter);
    auto segment = recorder.begin_segment("root");
    segment->set_sampled(false);
    segment->close();
    REQUIRE(segment->is_emitted());
    REQUIRE(emitter->segments().empty());
}

TEST_CASE("Entity: subsegments of a facade are streamed", "[entity]") {
    auto emitter = std::make_shared<MockEmitter>();
    LocalRecorder recorder(emitter);

    TraceHeader header;
    header.root_trace_id = "1-5759e988-bd862e3fe1be46a994272793";
    header.parent_id = "53995c3f42cd8ad8";
    header.sampled = TraceHeader::SampleDecision::SAMPLED;

    auto facade = recorder.make_facade_segment(header);
    REQUIRE(facade->is_facade());
    REQUIRE(facade->id() == "53995c3f42cd8ad8");
    REQUIRE(facade->trace_id() == header.root_trace_id);
    REQUIRE_THROWS_AS(facade->close(), AlreadyEmittedError);

    recorder.set_trace_entity(facade);
    auto child = recorder.begin_subsegment("remote-child");
    child->close();

    const auto docs = emitter->subsegments();
    REQUIRE(docs.size() == 1);
    REQUIRE(docs[0]["type"] == "subsegment");
    REQUIRE(docs[0]["trace_id"] == header.root_trace_id);
    REQUIRE(docs[0]["parent_id"] == "53995c3f42cd8ad8");
    REQUIRE(emitter->segments().empty());
    REQUIRE(facade->subsegments().empty());
    REQUIRE(recorder.subsegments_sent() == 1);
}

TEST_CASE("Entity: exceptions become causes and set fault", "[entity]") {
    LocalRecorder recorder;
    auto segment = recorder.begin_segment("root");

    try {
        throw std::invalid_argument("bad order id");
    } catch (...) {
        segment->add_exception(std::current_exception());
    }

    REQUIRE(segment->is_fault());
    REQUIRE_FALSE(segment->is_error());
    const auto causes = segment->exceptions();
    REQUIRE(causes.size() == 1);
    REQUIRE(causes[0].type == "std::invalid_argument");
    REQUIRE(causes[0].message == "bad order id");

    const auto json = segment->to_json();
    REQUIRE(json["cause"]["exceptions"][0]["message"] == "bad order id");
}

TEST_CASE("Entity: document carries segment fields", "[entity]") {
    LocalRecorder recorder;
    auto segment = recorder.begin_segment("root");
    segment->set_user("alice");
    segment->set_origin("AWS::EC2::Instance");
    segment->set_parent_id("53995c3f42cd8ad8");
    segment->set_error(true);
    segment->http().child("request")->put("method", std::string("GET"));

    const auto json = segment->to_json();
    REQUIRE(json["user"] == "alice");
    REQUIRE(json["origin"] == "AWS::EC2::Instance");
    REQUIRE(json["parent_id"] == "53995c3f42cd8ad8");
    REQUIRE(json["error"] == true);
    REQUIRE(json["in_progress"] == true);
    REQUIRE(json["http"]["request"]["method"] == "GET");
    REQUIRE_FALSE(json.contains("fault"));
}

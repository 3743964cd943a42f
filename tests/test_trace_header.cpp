#include <catch2/catch_test_macros.hpp>
#include "entity/trace_header.hpp"

using namespace xrayot;

// ============================================================================
// X-Amzn-Trace-Id Parsing
// ============================================================================

TEST_CASE("TraceHeader: parse full header", "[trace_header]") {
    auto header = TraceHeader::parse(
        "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=53995c3f42cd8ad8;Sampled=1");

    REQUIRE(header.has_value());
    REQUIRE(header->root_trace_id == "1-5759e988-bd862e3fe1be46a994272793");
    REQUIRE(header->parent_id == "53995c3f42cd8ad8");
    REQUIRE(header->sampled == TraceHeader::SampleDecision::SAMPLED);
}

TEST_CASE("TraceHeader: fields in any order with whitespace", "[trace_header]") {
    auto header = TraceHeader::parse(
        " Sampled=0 ; Root=1-5759e988-bd862e3fe1be46a994272793 ");

    REQUIRE(header.has_value());
    REQUIRE(header->root_trace_id == "1-5759e988-bd862e3fe1be46a994272793");
    REQUIRE(header->parent_id.empty());
    REQUIRE(header->sampled == TraceHeader::SampleDecision::NOT_SAMPLED);
}

TEST_CASE("TraceHeader: sampling requested", "[trace_header]") {
    auto header = TraceHeader::parse("Root=1-5759e988-bd862e3fe1be46a994272793;Sampled=?");
    REQUIRE(header.has_value());
    REQUIRE(header->sampled == TraceHeader::SampleDecision::REQUESTED);
}

TEST_CASE("TraceHeader: unknown fields are ignored", "[trace_header]") {
    auto header = TraceHeader::parse(
        "Root=1-5759e988-bd862e3fe1be46a994272793;Self=1-abc;Lineage=a:1");
    REQUIRE(header.has_value());
    REQUIRE(header->sampled == TraceHeader::SampleDecision::UNKNOWN);
}

TEST_CASE("TraceHeader: reject invalid headers", "[trace_header]") {
    SECTION("Missing root") {
        REQUIRE_FALSE(TraceHeader::parse("Parent=53995c3f42cd8ad8;Sampled=1").has_value());
    }

    SECTION("Empty") {
        REQUIRE_FALSE(TraceHeader::parse("").has_value());
    }

    SECTION("Malformed root") {
        REQUIRE_FALSE(TraceHeader::parse("Root=1-zzzz;Sampled=1").has_value());
    }

    SECTION("Short parent id") {
        REQUIRE_FALSE(TraceHeader::parse(
            "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=abc").has_value());
    }

    SECTION("Non-hex parent id") {
        REQUIRE_FALSE(TraceHeader::parse(
            "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=zzzzzzzzzzzzzzzz").has_value());
    }
}

// ============================================================================
// Serialization and Generation
// ============================================================================

TEST_CASE("TraceHeader: to_string", "[trace_header]") {
    TraceHeader header;
    header.root_trace_id = "1-5759e988-bd862e3fe1be46a994272793";
    header.parent_id = "53995c3f42cd8ad8";
    header.sampled = TraceHeader::SampleDecision::SAMPLED;

    REQUIRE(header.to_string() ==
            "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=53995c3f42cd8ad8;Sampled=1");

    header.parent_id.clear();
    header.sampled = TraceHeader::SampleDecision::UNKNOWN;
    REQUIRE(header.to_string() == "Root=1-5759e988-bd862e3fe1be46a994272793");
}

TEST_CASE("TraceHeader: serialized header parses back", "[trace_header]") {
    TraceHeader header;
    header.root_trace_id = TraceHeader::generate_trace_id();
    header.parent_id = TraceHeader::generate_entity_id();
    header.sampled = TraceHeader::SampleDecision::NOT_SAMPLED;

    auto parsed = TraceHeader::parse(header.to_string());
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->root_trace_id == header.root_trace_id);
    REQUIRE(parsed->parent_id == header.parent_id);
    REQUIRE(parsed->sampled == header.sampled);
}

TEST_CASE("TraceHeader: generated ids", "[trace_header]") {
    const auto trace_id = TraceHeader::generate_trace_id();
    REQUIRE(trace_id.size() == 35);
    REQUIRE(TraceHeader::is_valid_trace_id(trace_id));

    const auto id1 = TraceHeader::generate_entity_id();
    const auto id2 = TraceHeader::generate_entity_id();
    REQUIRE(id1.size() == 16);
    REQUIRE(id1 != id2);
    REQUIRE(TraceHeader::generate_trace_id() != trace_id);
}

TEST_CASE("TraceHeader: header key", "[trace_header]") {
    REQUIRE(TraceHeader::HEADER_KEY == "X-Amzn-Trace-Id");
}

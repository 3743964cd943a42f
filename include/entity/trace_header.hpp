#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace xrayot {

/**
 * @brief X-Ray trace header (X-Amzn-Trace-Id)
 *
 * Format: "Root={trace_id};Parent={parent_id};Sampled={0|1|?}"
 *   trace_id:  "1-{8 hex epoch seconds}-{24 hex random}"
 *   parent_id: 16 hex chars (id of the upstream segment / subsegment)
 *   Sampled:   1 = sampled, 0 = not sampled, ? = decision requested
 *
 * Only the header representation is handled here; carrier injection and
 * extraction are not supported by the tracer.
 */
struct TraceHeader {
    enum class SampleDecision { UNKNOWN, SAMPLED, NOT_SAMPLED, REQUESTED };

    static constexpr std::string_view HEADER_KEY = "X-Amzn-Trace-Id";

    std::string root_trace_id;
    std::string parent_id;
    SampleDecision sampled = SampleDecision::UNKNOWN;

    [[nodiscard]] bool has_root() const { return !root_trace_id.empty(); }

    /// Parse a header value; unknown fields are ignored, Root is required
    [[nodiscard]] static std::optional<TraceHeader> parse(std::string_view header);

    /// Serialize to header value (empty fields are omitted)
    [[nodiscard]] std::string to_string() const;

    /// Generate a fresh trace id: "1-{epoch hex}-{96 random bits}"
    [[nodiscard]] static std::string generate_trace_id();

    /// Generate a random 16-hex-char entity id
    [[nodiscard]] static std::string generate_entity_id();

    /// Validate the "1-xxxxxxxx-xxxxxxxxxxxxxxxxxxxxxxxx" shape
    [[nodiscard]] static bool is_valid_trace_id(std::string_view trace_id);
};

} // namespace xrayot

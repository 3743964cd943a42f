#pragma once

#include "entity/entity.hpp"
#include "entity/trace_header.hpp"

#include <memory>
#include <string>

namespace xrayot {

/**
 * @brief Whether the host process supplies its own top-level segment
 *
 * HOST_MANAGED: each invocation already runs inside a segment owned by the
 * execution environment (function-as-a-service hosts), so new work must be
 * recorded as subsegments even when no local parent exists.
 */
enum class HostContext {
    LOCAL,
    HOST_MANAGED
};

/**
 * @brief Backend tracing SDK as seen by the tracer
 *
 * The current-entity slot is per thread: get/set on one thread never affect
 * another. begin_segment / begin_subsegment install the new entity as the
 * current one; the subsegment is parented to whatever was current before.
 */
class IRecorder {
public:
    virtual ~IRecorder() = default;

    [[nodiscard]] virtual std::shared_ptr<Entity> get_trace_entity() const = 0;
    virtual void set_trace_entity(std::shared_ptr<Entity> entity) = 0;

    virtual std::shared_ptr<Segment> begin_segment(const std::string& name) = 0;

    /// @throws ContextMissingError when there is nothing to attach to
    virtual std::shared_ptr<Subsegment> begin_subsegment(const std::string& name) = 0;

    /// Placeholder root for a parent recorded outside this process
    [[nodiscard]] virtual std::shared_ptr<Segment> make_facade_segment(
        const TraceHeader& header) = 0;

    [[nodiscard]] virtual HostContext resolve_host_context() const = 0;

    /// Best-effort transmission; failures are not reported to callers
    virtual void send_segment(const Segment& segment) = 0;
    virtual void send_subsegment(const Subsegment& subsegment) = 0;
};

} // namespace xrayot

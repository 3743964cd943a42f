#pragma once

#include <string>

namespace xrayot {

class Segment;
class Subsegment;

/**
 * @brief Abstract interface for trace document destinations
 *
 * Called from whichever thread closes the last open entity of a trace.
 * Implementations must be safe to call concurrently.
 */
class IEmitter {
public:
    virtual ~IEmitter() = default;

    /// Send a complete segment tree. Returns true on success.
    [[nodiscard]] virtual bool send_segment(const Segment& segment) = 0;

    /// Send one subsegment document on its own. Returns true on success.
    [[nodiscard]] virtual bool send_subsegment(const Subsegment& subsegment) = 0;

    /// Human-readable emitter name for logging (e.g. "udp:127.0.0.1:2000")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace xrayot

#pragma once

#include "recorder/recorder.hpp"
#include "recorder/emitter.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace xrayot {

/**
 * @brief In-process recorder: entity factory, per-thread slot, emission
 *
 * The current-entity slot lives in thread-local storage keyed by a
 * per-instance id, so two recorders never see each other's state and no
 * lock is needed on the hot path. Slots a destroyed recorder left on other
 * threads are released by those threads on their next recorder access.
 * In HOST_MANAGED mode each thread gets a facade root segment standing in
 * for the segment owned by the execution environment.
 */
class LocalRecorder : public IRecorder {
public:
    using HostContextResolver = std::function<HostContext()>;

    /**
     * @param emitter destination for finished documents (nullptr = drop)
     * @param resolver host detection; defaults to HostContext::LOCAL
     */
    explicit LocalRecorder(std::shared_ptr<IEmitter> emitter = nullptr,
                           HostContextResolver resolver = nullptr);
    ~LocalRecorder() override;

    LocalRecorder(const LocalRecorder&) = delete;
    LocalRecorder& operator=(const LocalRecorder&) = delete;

    [[nodiscard]] std::shared_ptr<Entity> get_trace_entity() const override;
    void set_trace_entity(std::shared_ptr<Entity> entity) override;

    std::shared_ptr<Segment> begin_segment(const std::string& name) override;
    std::shared_ptr<Subsegment> begin_subsegment(const std::string& name) override;

    [[nodiscard]] std::shared_ptr<Segment> make_facade_segment(
        const TraceHeader& header) override;

    [[nodiscard]] HostContext resolve_host_context() const override;

    void send_segment(const Segment& segment) override;
    void send_subsegment(const Subsegment& subsegment) override;

    [[nodiscard]] uint64_t segments_sent() const { return segments_sent_.load(); }
    [[nodiscard]] uint64_t subsegments_sent() const { return subsegments_sent_.load(); }

private:
    /// Facade root for the host-managed context of the calling thread
    std::shared_ptr<Segment> host_segment();

    const uint64_t instance_id_;
    std::shared_ptr<IEmitter> emitter_;
    HostContextResolver resolver_;

    std::atomic<uint64_t> segments_sent_{0};
    std::atomic<uint64_t> subsegments_sent_{0};
};

} // namespace xrayot

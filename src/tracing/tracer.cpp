#include "tracing/tracer.hpp"
#include "config/config_loader.hpp"
#include "recorder/local_recorder.hpp"
#include "recorder/udp_emitter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace xrayot {

Tracer::Tracer(std::shared_ptr<IRecorder> recorder)
    : recorder_(std::move(recorder)),
      scope_manager_(*recorder_) {}

std::unique_ptr<Tracer> Tracer::from_config(const TracerConfig& config) {
    utils::log::set_level(utils::log::level_from_string(config.logging.level));

    std::shared_ptr<IEmitter> emitter;
    if (config.emitter.enabled) {
        emitter = std::make_shared<UdpEmitter>(UdpEmitter::Config{config.emitter.daemon_address});
    }

    LocalRecorder::HostContextResolver resolver;
    if (config.recorder.host_managed) {
        resolver = [] { return HostContext::HOST_MANAGED; };
    }

    utils::log::info(std::format("Tracer for service '{}': emitter={}, host_managed={}",
                                 config.service.name,
                                 emitter ? emitter->name() : std::string("disabled"),
                                 utils::booltostr(config.recorder.host_managed)));

    return std::make_unique<Tracer>(
        std::make_shared<LocalRecorder>(std::move(emitter), std::move(resolver)));
}

SpanBuilder Tracer::build_span(std::string operation_name) {
    return SpanBuilder(recorder_, scope_manager_, std::move(operation_name));
}

std::shared_ptr<Span> Tracer::active_span() const {
    return scope_manager_.active_span();
}

std::shared_ptr<Scope> Tracer::activate_span(const std::shared_ptr<ISpan>& span,
                                             bool finish_on_close) {
    return scope_manager_.activate(span, finish_on_close);
}

void Tracer::inject(const SpanContext& /*context*/, TextMap& /*carrier*/) {
    throw UnsupportedOperationError(
        "Context injection is not supported; propagate the X-Amzn-Trace-Id header instead");
}

SpanContext Tracer::extract(const TextMap& /*carrier*/) {
    throw UnsupportedOperationError(
        "Context extraction is not supported; propagate the X-Amzn-Trace-Id header instead");
}

// ============================================================================
// ScopedSpan
// ============================================================================

ScopedSpan::ScopedSpan(Tracer& tracer, std::string operation_name)
    : scope_(tracer.build_span(std::move(operation_name)).start_active(true)) {}

ScopedSpan::~ScopedSpan() {
    scope_->close();
}

} // namespace xrayot

#pragma once

#include "tracing/scope.hpp"
#include "tracing/span.hpp"
#include "tracing/span_builder.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace xrayot {

class IRecorder;
struct TracerConfig;

/// Carrier for text-map propagation formats
using TextMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Entry point for instrumented code
 *
 * Shares the recorder with the spans it starts and owns the scope manager.
 * Spans may outlive the tracer; builders and scopes borrow the scope
 * manager and must not.
 *
 * Context propagation goes through the backend's own trace header, so
 * inject() and extract() are not supported.
 */
class Tracer {
public:
    explicit Tracer(std::shared_ptr<IRecorder> recorder);

    /**
     * @brief Build a tracer from configuration
     *
     * Applies the log level, sets up a UDP emitter when enabled, and a
     * LocalRecorder honouring recorder.host_managed.
     */
    [[nodiscard]] static std::unique_ptr<Tracer> from_config(const TracerConfig& config);

    Tracer(const Tracer&) = delete;
    Tracer& operator=(const Tracer&) = delete;

    [[nodiscard]] SpanBuilder build_span(std::string operation_name);

    [[nodiscard]] ScopeManager& scope_manager() { return scope_manager_; }
    [[nodiscard]] IRecorder& recorder() { return *recorder_; }

    /// Span of the calling thread's active scope, or nullptr
    [[nodiscard]] std::shared_ptr<Span> active_span() const;

    std::shared_ptr<Scope> activate_span(const std::shared_ptr<ISpan>& span,
                                         bool finish_on_close = false);

    /// @throws UnsupportedOperationError always
    void inject(const SpanContext& context, TextMap& carrier);

    /// @throws UnsupportedOperationError always
    SpanContext extract(const TextMap& carrier);

private:
    std::shared_ptr<IRecorder> recorder_;
    ScopeManager scope_manager_;
};

/**
 * @brief RAII span helper: starts an active span on construction and
 * closes its scope (finishing the span) on destruction
 *
 * Usage:
 *   void Handler::fetch(Tracer& tracer) {
 *       ScopedSpan span(tracer, "fetch");
 *       span->set_tag(tags::HTTP_METHOD, "GET");
 *   } // span finished, previous scope restored
 */
class ScopedSpan {
public:
    ScopedSpan(Tracer& tracer, std::string operation_name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    Span* operator->() const { return scope_->span().get(); }
    [[nodiscard]] Span& span() const { return *scope_->span(); }

private:
    std::shared_ptr<Scope> scope_;
};

} // namespace xrayot

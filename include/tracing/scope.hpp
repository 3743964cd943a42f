#pragma once

#include <cstdint>
#include <memory>

namespace xrayot {

class IRecorder;
class ISpan;
class Span;
class ScopeManager;

/**
 * @brief Activation record of a span on one thread
 *
 * Scopes form a per-thread stack through their previous pointer. Closing a
 * scope restores the scope that was current when it was activated; closing
 * out of order is not detected and simply restores that captured state.
 */
class Scope {
public:
    Scope(ScopeManager& manager, std::shared_ptr<Scope> previous,
          std::shared_ptr<Span> span, bool finish_on_close);

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    /// Finish the span if requested, then make the previous scope current
    void close();

    [[nodiscard]] const std::shared_ptr<Span>& span() const { return span_; }
    [[nodiscard]] const std::shared_ptr<Scope>& previous() const { return previous_; }
    [[nodiscard]] bool finish_on_close() const { return finish_on_close_; }

private:
    ScopeManager& manager_;
    const std::shared_ptr<Scope> previous_;
    const std::shared_ptr<Span> span_;
    const bool finish_on_close_;
};

/**
 * @brief Per-thread active scope, kept in step with the recorder
 *
 * The current scope lives in thread-local storage keyed by manager
 * instance; scopes a destroyed manager left on other threads are released
 * on those threads' next access. set_current_scope() is the only place
 * that changes it, and it also points the recorder's current entity at the
 * scope's span (or clears it), so the two never drift apart.
 */
class ScopeManager {
public:
    explicit ScopeManager(IRecorder& recorder);
    ~ScopeManager();

    ScopeManager(const ScopeManager&) = delete;
    ScopeManager& operator=(const ScopeManager&) = delete;

    /**
     * @brief Push a scope for span on the calling thread
     *
     * Spans not created by this library cannot be bound to an entity: a
     * warning is logged and the current scope (possibly null) is returned.
     */
    std::shared_ptr<Scope> activate(const std::shared_ptr<ISpan>& span,
                                    bool finish_on_close = false);

    /// Current scope on the calling thread, or nullptr
    [[nodiscard]] std::shared_ptr<Scope> active() const;

    /// Span of the current scope on the calling thread, or nullptr
    [[nodiscard]] std::shared_ptr<Span> active_span() const;

    void set_current_scope(std::shared_ptr<Scope> scope);

private:
    IRecorder& recorder_;
    const uint64_t instance_id_;
};

} // namespace xrayot

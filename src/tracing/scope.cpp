#include "tracing/scope.hpp"
#include "tracing/span.hpp"
#include "recorder/recorder.hpp"
#include "core/instance_registry.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <format>
#include <typeinfo>
#include <unordered_map>

namespace xrayot {

namespace {

utils::InstanceRegistry& manager_registry() {
    static utils::InstanceRegistry registry;
    return registry;
}

std::unordered_map<uint64_t, std::shared_ptr<Scope>>& current_scopes() {
    static thread_local std::unordered_map<uint64_t, std::shared_ptr<Scope>> scopes;
    static thread_local uint64_t seen_generation = 0;
    manager_registry().prune(scopes, seen_generation);
    return scopes;
}

} // anonymous namespace

// ============================================================================
// Scope
// ============================================================================

Scope::Scope(ScopeManager& manager, std::shared_ptr<Scope> previous,
             std::shared_ptr<Span> span, bool finish_on_close)
    : manager_(manager),
      previous_(std::move(previous)),
      span_(std::move(span)),
      finish_on_close_(finish_on_close) {}

void Scope::close() {
    if (finish_on_close_ && span_) {
        span_->finish();
    }
    manager_.set_current_scope(previous_);
}

// ============================================================================
// ScopeManager
// ============================================================================

ScopeManager::ScopeManager(IRecorder& recorder)
    : recorder_(recorder),
      instance_id_(manager_registry().acquire()) {}

ScopeManager::~ScopeManager() {
    manager_registry().retire(instance_id_);
    current_scopes().erase(instance_id_);
}

std::shared_ptr<Scope> ScopeManager::activate(const std::shared_ptr<ISpan>& span,
                                              bool finish_on_close) {
    auto xray_span = std::dynamic_pointer_cast<Span>(span);
    if (!xray_span) {
        if (span) {
            utils::log::warn(std::format(
                "Cannot activate span of type {}: only xrayot::Span can be bound to an entity",
                typeid(*span).name()));
        } else {
            utils::log::warn("Cannot activate a null span");
        }
        return active();
    }

    auto scope = std::make_shared<Scope>(*this, active(), std::move(xray_span), finish_on_close);
    set_current_scope(scope);
    return scope;
}

std::shared_ptr<Scope> ScopeManager::active() const {
    auto& scopes = current_scopes();
    const auto it = scopes.find(instance_id_);
    return it == scopes.end() ? nullptr : it->second;
}

std::shared_ptr<Span> ScopeManager::active_span() const {
    const auto scope = active();
    return scope ? scope->span() : nullptr;
}

void ScopeManager::set_current_scope(std::shared_ptr<Scope> scope) {
    recorder_.set_trace_entity(scope && scope->span() ? scope->span()->entity() : nullptr);

    auto& scopes = current_scopes();
    if (scope) {
        scopes.insert_or_assign(instance_id_, std::move(scope));
    } else {
        scopes.erase(instance_id_);
    }
}

} // namespace xrayot

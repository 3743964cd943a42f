#pragma once

#include "entity/attribute_map.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xrayot {

class IRecorder;
class Segment;
class Subsegment;

/**
 * @brief One recorded exception ("cause" in the segment document)
 */
struct Cause {
    std::string id;
    std::string type;
    std::string message;
};

/**
 * @brief Node in the backend trace tree
 *
 * Strict tree: a Segment is a root (no parent), a Subsegment has exactly
 * one parent. Entities are created by an IRecorder and report back to it
 * when closed. Parents own their children until the enclosing segment has
 * been emitted; children keep their parent alive.
 *
 * Timing and flags are atomics and the attribute containers are
 * AttributeMaps, so a shared entity may be tagged from several threads.
 */
class Entity : public std::enable_shared_from_this<Entity> {
public:
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] virtual const std::string& trace_id() const = 0;

    /// Parent entity, nullptr for segments
    [[nodiscard]] virtual std::shared_ptr<Entity> parent() const = 0;

    /// Enclosing root segment (self for segments)
    [[nodiscard]] virtual Segment& parent_segment() = 0;
    [[nodiscard]] virtual const Segment& parent_segment() const = 0;

    [[nodiscard]] virtual bool is_segment() const = 0;

    /// Explicit parent id if one was set, else the structural parent's id
    [[nodiscard]] virtual std::string parent_id() const;
    void set_parent_id(std::string parent_id);

    // ---- Timing (epoch seconds) ------------------------------------------

    [[nodiscard]] double start_time() const { return start_time_.load(); }
    void set_start_time(double seconds) { start_time_.store(seconds); }

    [[nodiscard]] double end_time() const { return end_time_.load(); }
    void set_end_time(double seconds) { end_time_.store(seconds); }

    // ---- Flags -----------------------------------------------------------

    [[nodiscard]] bool is_in_progress() const { return in_progress_.load(); }
    void set_in_progress(bool v) { in_progress_.store(v); }

    [[nodiscard]] bool is_error() const { return error_.load(); }
    void set_error(bool v) { error_.store(v); }

    [[nodiscard]] bool is_fault() const { return fault_.load(); }
    void set_fault(bool v) { fault_.store(v); }

    [[nodiscard]] bool is_throttle() const { return throttle_.load(); }
    void set_throttle(bool v) { throttle_.store(v); }

    // ---- Attribute containers --------------------------------------------

    AttributeMap& annotations() { return annotations_; }
    AttributeMap& aws() { return aws_; }
    AttributeMap& http() { return http_; }
    AttributeMap& sql() { return sql_; }

    /// Namespace -> nested map
    AttributeMap& metadata() { return metadata_; }

    const AttributeMap& annotations() const { return annotations_; }
    const AttributeMap& aws() const { return aws_; }
    const AttributeMap& http() const { return http_; }
    const AttributeMap& sql() const { return sql_; }
    const AttributeMap& metadata() const { return metadata_; }

    void put_metadata(const std::string& ns, const std::string& key, AttributeValue value);

    // ---- Exceptions ------------------------------------------------------

    /**
     * @brief Record an exception as a cause and mark the entity as faulted
     *
     * std::exception subclasses keep their dynamic type name and what().
     */
    void add_exception(std::exception_ptr ex);
    [[nodiscard]] std::vector<Cause> exceptions() const;

    // ---- Children --------------------------------------------------------

    [[nodiscard]] std::vector<std::shared_ptr<Subsegment>> subsegments() const;
    void add_subsegment(std::shared_ptr<Subsegment> child);
    void remove_subsegment(const Subsegment& child);

    // ---- Lifecycle -------------------------------------------------------

    /**
     * @brief End the entity and hand it back to its recorder
     * @throws AlreadyEmittedError on a second call
     */
    virtual void close() = 0;

    [[nodiscard]] bool is_closed() const { return closed_.load(); }

    [[nodiscard]] IRecorder& creator() const { return creator_; }

    /// Segment-document JSON for this entity and its open children
    [[nodiscard]] virtual nlohmann::json to_json() const;

protected:
    Entity(IRecorder& creator, std::string name, std::string id);

    /// Flip the closed flag, stamp end time, clear in-progress
    void mark_closed();

    /// Drop child references (recursively) once the tree has been sent
    void release_subsegments();

    IRecorder& creator_;

private:
    const std::string id_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::string parent_id_override_;
    std::vector<Cause> causes_;
    std::vector<std::shared_ptr<Subsegment>> subsegments_;

    std::atomic<double> start_time_{0.0};
    std::atomic<double> end_time_{0.0};
    std::atomic<bool> in_progress_{false};
    std::atomic<bool> error_{false};
    std::atomic<bool> fault_{false};
    std::atomic<bool> throttle_{false};
    std::atomic<bool> closed_{false};

    AttributeMap annotations_;
    AttributeMap aws_;
    AttributeMap http_;
    AttributeMap sql_;
    AttributeMap metadata_;
};

/**
 * @brief Root entity of a trace
 *
 * Emitted once it is closed and every subsegment under it has closed.
 * A facade segment stands in for a parent living in another process: it
 * is never closed or emitted, and its subsegments are sent individually.
 */
class Segment : public Entity {
public:
    Segment(IRecorder& creator, std::string name, std::string trace_id);

    /// Placeholder for a remote parent with a known trace id / entity id
    [[nodiscard]] static std::shared_ptr<Segment> make_facade(
        IRecorder& creator, std::string trace_id, std::string id, bool sampled);

    [[nodiscard]] const std::string& trace_id() const override { return trace_id_; }
    [[nodiscard]] std::shared_ptr<Entity> parent() const override { return nullptr; }
    [[nodiscard]] Segment& parent_segment() override { return *this; }
    [[nodiscard]] const Segment& parent_segment() const override { return *this; }
    [[nodiscard]] bool is_segment() const override { return true; }

    /// Service container (segments only)
    AttributeMap& service() { return service_; }
    const AttributeMap& service() const { return service_; }

    [[nodiscard]] bool is_sampled() const { return sampled_.load(); }
    void set_sampled(bool v) { sampled_.store(v); }

    [[nodiscard]] std::string user() const;
    void set_user(std::string user);

    [[nodiscard]] std::string origin() const;
    void set_origin(std::string origin);

    [[nodiscard]] bool is_facade() const { return facade_; }
    [[nodiscard]] bool is_emitted() const { return emitted_.load(); }

    // Open subsegments anywhere under this segment
    void increment_reference() { reference_count_.fetch_add(1); }
    /// @return true when the count dropped to zero
    bool decrement_reference() { return reference_count_.fetch_sub(1) == 1; }
    [[nodiscard]] int reference_count() const { return reference_count_.load(); }

    void close() override;

    /// Send the finished tree (once) if sampled and not a facade
    void emit();

    [[nodiscard]] nlohmann::json to_json() const override;

private:
    Segment(IRecorder& creator, std::string name, std::string trace_id, std::string id, bool facade);

    const std::string trace_id_;
    const bool facade_ = false;

    std::atomic<bool> sampled_{true};
    std::atomic<bool> emitted_{false};
    std::atomic<int> reference_count_{0};

    mutable std::mutex segment_mutex_;
    std::string user_;
    std::string origin_;

    AttributeMap service_;
};

/**
 * @brief Child entity, always attached to exactly one parent
 */
class Subsegment : public Entity {
public:
    Subsegment(IRecorder& creator, std::string name, std::shared_ptr<Entity> parent);

    [[nodiscard]] const std::string& trace_id() const override;
    [[nodiscard]] std::shared_ptr<Entity> parent() const override { return parent_; }
    [[nodiscard]] Segment& parent_segment() override { return *parent_segment_; }
    [[nodiscard]] const Segment& parent_segment() const override { return *parent_segment_; }
    [[nodiscard]] bool is_segment() const override { return false; }

    void close() override;

    /// Standalone document (type, trace_id, parent_id) for streaming
    [[nodiscard]] nlohmann::json to_document() const;

private:
    const std::shared_ptr<Entity> parent_;
    const std::shared_ptr<Segment> parent_segment_;
};

} // namespace xrayot

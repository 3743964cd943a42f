#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace xrayot::utils {

/**
 * @brief Ids for objects that keep per-thread state in thread_local maps
 *
 * An owner can only erase its own entry on the thread that destroys it.
 * retire() bumps a generation counter; every thread calls prune() before
 * touching its map and drops entries of retired ids the first time it
 * sees a new generation.
 */
class InstanceRegistry {
public:
    [[nodiscard]] uint64_t acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = next_id_++;
        live_.insert(id);
        return id;
    }

    void retire(uint64_t id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            live_.erase(id);
        }
        generation_.fetch_add(1, std::memory_order_release);
    }

    /**
     * @brief Drop entries of retired ids from a map keyed by instance id
     * @param seen_generation per-thread marker, updated on return
     */
    template<typename Map>
    void prune(Map& entries, uint64_t& seen_generation) const {
        const uint64_t current = generation_.load(std::memory_order_acquire);
        if (current == seen_generation) return;

        std::vector<uint64_t> retired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : entries) {
                if (!live_.contains(entry.first)) retired.push_back(entry.first);
            }
        }
        // Entries are destroyed outside the lock
        for (const auto id : retired) {
            entries.erase(id);
        }
        seen_generation = current;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_set<uint64_t> live_;
    uint64_t next_id_ = 1;
    std::atomic<uint64_t> generation_{0};
};

} // namespace xrayot::utils

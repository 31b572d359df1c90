#pragma once

#include "taskmarket/Config.hpp"
#include "taskmarket/Types.hpp"
#include "taskmarket/core/Collaborators.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace taskmarket {

// Known task advertisements with time-to-live, plus the bookkeeping of
// tasks this node has outstanding requests for. Not internally locked: the
// owner serializes every call.
class TaskHeaderRegistry {
public:
    TaskHeaderRegistry(const Config& config,
                       const CapabilityFilter& capabilities,
                       const TaskOwnership& ownership);

    // Throws ValidationError for a malformed header. Returns false without
    // touching state when the id is known, locally owned or cooling down.
    bool add(TaskHeader header, TimePoint now);
    void remove(const TaskId& task_id, TimePoint now);
    void tick(TimePoint now);
    std::optional<TaskId> pick_random_supported();

    [[nodiscard]] bool contains(const TaskId& task_id) const;
    [[nodiscard]] std::optional<TaskHeader> find(const TaskId& task_id) const;
    [[nodiscard]] bool is_supported(const TaskId& task_id) const;
    [[nodiscard]] bool recently_removed(const TaskId& task_id) const;
    [[nodiscard]] std::vector<TaskHeader> snapshot() const;
    [[nodiscard]] std::size_t size() const noexcept { return headers_.size(); }

    // Starts or extends tracking of a task we asked work for. False when the
    // task has neither a header nor an active entry.
    bool note_request(const TaskId& task_id);
    // Drops one outstanding request; the entry is reaped once nothing is
    // outstanding and the header is gone. False when nothing was tracked.
    bool release_request(const TaskId& task_id);
    [[nodiscard]] std::optional<ActiveTaskEntry> active_entry(const TaskId& task_id) const;
    [[nodiscard]] std::size_t active_count() const noexcept { return active_.size(); }

private:
    const CapabilityFilter& capabilities_;
    const TaskOwnership& ownership_;
    std::chrono::seconds removed_cooldown_;
    std::unordered_map<TaskId, TaskHeader> headers_;
    std::vector<TaskId> supported_;
    std::unordered_map<TaskId, TimePoint> removed_;
    std::unordered_map<TaskId, ActiveTaskEntry> active_;
    std::mt19937 rng_;

    void reap_if_idle(const TaskId& task_id);
};

}  // namespace taskmarket

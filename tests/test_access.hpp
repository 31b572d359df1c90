#pragma once

#include "taskmarket/core/TaskSessionCoordinator.hpp"

#include <optional>
#include <string>

namespace taskmarket::test {

class CoordinatorTestAccess {
public:
    static std::optional<TaskId> pending_task(const TaskSessionCoordinator& coordinator, const SubtaskId& subtask_id) {
        auto guard = coordinator.coordination_lock();
        const auto it = coordinator.pending_verifications_.find(subtask_id);
        if (it == coordinator.pending_verifications_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    static std::optional<PeerId> task_owner(const TaskSessionCoordinator& coordinator, const SubtaskId& subtask_id) {
        auto guard = coordinator.coordination_lock();
        const auto it = coordinator.computing_.find(subtask_id);
        if (it == coordinator.computing_.end()) {
            return std::nullopt;
        }
        return it->second.owner_id;
    }

    static std::optional<PeerEndpoint> computing_peer(const TaskSessionCoordinator& coordinator,
                                                      const SubtaskId& subtask_id) {
        auto guard = coordinator.coordination_lock();
        const auto it = coordinator.requested_.find(subtask_id);
        if (it == coordinator.requested_.end()) {
            return std::nullopt;
        }
        return it->second.computing_peer;
    }
};

}  // namespace taskmarket::test

#pragma once

#include "taskmarket/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskmarket {

struct PaymentHandle {
    std::string id;
    SubtaskId subtask_id;
    Reward amount{0};
};

class PaymentService {
public:
    virtual ~PaymentService() = default;

    virtual PaymentHandle pay(const SubtaskId& subtask_id, Reward amount) = 0;
    virtual std::optional<Reward> reward_for(const SubtaskId& subtask_id) const = 0;
    virtual void collect_reward(const SubtaskId& subtask_id, Reward amount) = 0;
    // Requesters whose payment deadline passed since the previous call.
    virtual std::vector<PeerId> overdue_payers(TimePoint now) = 0;
};

class ReputationSink {
public:
    virtual ~ReputationSink() = default;

    virtual void apply(const PeerId& peer_id, TrustRole role, double delta) = 0;
};

class CapabilityFilter {
public:
    virtual ~CapabilityFilter() = default;

    virtual bool supports(const TaskHeader& header) const = 0;
};

// The local task manager: tasks this node published itself.
class TaskOwnership {
public:
    virtual ~TaskOwnership() = default;

    virtual bool owns(const TaskId& task_id) const = 0;
    virtual double trust_modifier(const SubtaskId& subtask_id) const = 0;
    virtual std::vector<TaskHeader> local_headers() const = 0;
};

// The local task computer, told when work it asked for will not arrive.
class LocalScheduler {
public:
    virtual ~LocalScheduler() = default;

    virtual void task_request_rejected(const TaskId& task_id, const std::string& reason) = 0;
    virtual void resource_request_rejected(const SubtaskId& subtask_id, const std::string& reason) = 0;
};

}  // namespace taskmarket

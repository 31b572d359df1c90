#pragma once

#include "taskmarket/Config.hpp"
#include "taskmarket/Types.hpp"
#include "taskmarket/core/Collaborators.hpp"
#include "taskmarket/delivery/ResultDeliveryQueue.hpp"
#include "taskmarket/network/Session.hpp"
#include "taskmarket/registry/TaskHeaderRegistry.hpp"
#include "taskmarket/trust/TrustLedger.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace taskmarket {

namespace test {
class CoordinatorTestAccess;
}

// Request/accept/reject/verify state machine for subtasks, on both sides of
// the exchange:
//  - computing side: request_task -> on_task_request_result -> request_resource
//    -> submit_result -> (delivery) -> verification_accepted / _rejected
//  - requester side: on_result_received -> accept / reject
//
// Every mutation of the registry, the subtask records and the pending
// verifications happens under the coordination lock. Sessions are opened and
// used outside of it; their completions take the lock again. Completions hold
// a pointer to the coordinator, so it must outlive every session it opened.
class TaskSessionCoordinator {
public:
    using ClockFunction = std::function<TimePoint()>;
    using CoordinationLock = std::unique_lock<std::recursive_mutex>;

    TaskSessionCoordinator(const Config& config,
                           TaskHeaderRegistry& registry,
                           TrustLedger& ledger,
                           ResultDeliveryQueue& results,
                           network::SessionOpener& sessions,
                           PaymentService& payments,
                           LocalScheduler& scheduler,
                           ClockFunction clock = &Clock::now);

    TaskSessionCoordinator(const TaskSessionCoordinator&) = delete;
    TaskSessionCoordinator& operator=(const TaskSessionCoordinator&) = delete;

    // Computing side.
    bool request_task(const PeerId& requester, const TaskId& task_id, const ComputeCapabilities& capabilities);
    bool on_task_request_result(const TaskId& task_id,
                                bool granted,
                                const SubtaskId& subtask_id,
                                const std::string& reason);
    bool request_resource(const SubtaskId& subtask_id,
                          const std::string& resource_descriptor,
                          const PeerEndpoint& owner);
    bool on_resource_request_result(const SubtaskId& subtask_id, bool ok, const std::string& reason);
    // Throws ValidationError for an empty payload or result type and
    // DuplicateResultError when the subtask is already queued, delivered or
    // resolved.
    void submit_result(const SubtaskId& subtask_id,
                       const TaskId& task_id,
                       ResultPayload payload,
                       std::string result_type,
                       const PeerEndpoint& owner);
    void deliver_result(const WaitingTaskResult& result);
    std::size_t flush_results(TimePoint now);
    // Both throw AlreadyResolvedError when the verification for subtask_id
    // was already consumed. Return false for a subtask never submitted.
    bool verification_accepted(const SubtaskId& subtask_id, std::string_view reward);
    bool verification_rejected(const SubtaskId& subtask_id, const std::string& reason);

    // Requester side.
    bool on_result_received(const SubtaskId& subtask_id, const TaskId& task_id, const PeerEndpoint& computing_peer);
    // Both throw AlreadyResolvedError when subtask_id was already accepted or
    // rejected. accept returns nullopt when the reward could not be paid; an
    // empty reward means the amount the payment service has on record.
    std::optional<PaymentHandle> accept(const SubtaskId& subtask_id, const PeerId& peer_id, std::string_view reward);
    void reject(const SubtaskId& subtask_id, const PeerId& peer_id, const std::string& reason);

    [[nodiscard]] std::optional<SubtaskState> computing_state(const SubtaskId& subtask_id) const;
    [[nodiscard]] std::optional<SubtaskState> requester_state(const SubtaskId& subtask_id) const;
    [[nodiscard]] bool awaiting_verification(const SubtaskId& subtask_id) const;
    [[nodiscard]] std::size_t pending_verification_count() const;

    [[nodiscard]] CoordinationLock coordination_lock() const;
    TimePoint now() const { return clock_(); }

private:
    friend class test::CoordinatorTestAccess;

    struct ComputingRecord {
        TaskId task_id;
        PeerId owner_id;
        SubtaskState state{SubtaskState::Requested};
    };

    struct RequesterRecord {
        TaskId task_id;
        PeerEndpoint computing_peer;
        SubtaskState state{SubtaskState::ResultSubmitted};
    };

    const Config& config_;
    TaskHeaderRegistry& registry_;
    TrustLedger& ledger_;
    ResultDeliveryQueue& results_;
    network::SessionOpener& sessions_;
    PaymentService& payments_;
    LocalScheduler& scheduler_;
    ClockFunction clock_;

    std::unordered_map<SubtaskId, ComputingRecord> computing_;
    std::unordered_map<SubtaskId, RequesterRecord> requested_;
    std::unordered_map<SubtaskId, TaskId> pending_verifications_;
    mutable std::recursive_mutex mutex_;

    void handle_task_session(const network::SessionOutcome& outcome, const TaskRequest& request);
    void fail_task_request(const TaskId& task_id, const std::string& reason);
    void handle_resource_session(const network::SessionOutcome& outcome,
                                 const SubtaskId& subtask_id,
                                 const std::string& resource_descriptor);
    void fail_resource_request(const SubtaskId& subtask_id, const std::string& reason);
    void handle_result_session(const network::SessionOutcome& outcome, const WaitingTaskResult& result);
    bool register_pending_verification(const WaitingTaskResult& result);
    void withdraw_pending_verification(const WaitingTaskResult& result);
    std::optional<TaskId> consume_verification(const SubtaskId& subtask_id);
    RequesterRecord* resolve_result(const SubtaskId& subtask_id, SubtaskState outcome);
    void notify_computing_peer(const PeerEndpoint& peer,
                               std::function<bool(network::Session&)> send,
                               std::string_view event);
};

}  // namespace taskmarket

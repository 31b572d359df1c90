#include "taskmarket/core/TaskSessionCoordinator.hpp"

#include "taskmarket/Errors.hpp"
#include "taskmarket/daemon/StructuredLogger.hpp"
#include "taskmarket/protocol/HeaderFields.hpp"

#include <utility>

namespace taskmarket {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

constexpr std::string_view kConnectionFailed = "Connection failed";

bool has_endpoint(const PeerEndpoint& peer) {
    return !peer.address.empty() && peer.port != 0;
}

}  // namespace

TaskSessionCoordinator::TaskSessionCoordinator(const Config& config,
                                               TaskHeaderRegistry& registry,
                                               TrustLedger& ledger,
                                               ResultDeliveryQueue& results,
                                               network::SessionOpener& sessions,
                                               PaymentService& payments,
                                               LocalScheduler& scheduler,
                                               ClockFunction clock)
    : config_(config),
      registry_(registry),
      ledger_(ledger),
      results_(results),
      sessions_(sessions),
      payments_(payments),
      scheduler_(scheduler),
      clock_(clock ? std::move(clock) : ClockFunction(&Clock::now)) {}

bool TaskSessionCoordinator::request_task(const PeerId& requester,
                                          const TaskId& task_id,
                                          const ComputeCapabilities& capabilities) {
    TaskRequest request{};
    request.requester_id = requester;
    request.task_id = task_id;
    request.capabilities = capabilities;

    std::string address;
    std::uint16_t port = 0;
    {
        CoordinationLock lock(mutex_);
        const auto header = registry_.find(task_id);
        if (!header.has_value()) {
            log_event(StructuredLogger::Level::Warning, "session.request.unknown_task", {{"task_id", task_id}});
            return false;
        }
        registry_.note_request(task_id);
        address = header->owner_address;
        port = header->owner_port;
    }

    log_event(StructuredLogger::Level::Info,
              "session.request.sent",
              {{"task_id", task_id}, {"owner", endpoint_to_string(address, port)}});

    sessions_.open_session(address, port, [this, request](network::SessionOutcome outcome) {
        handle_task_session(outcome, request);
    });
    return true;
}

void TaskSessionCoordinator::handle_task_session(const network::SessionOutcome& outcome, const TaskRequest& request) {
    if (!outcome.connected || !outcome.session) {
        fail_task_request(request.task_id, outcome.reason);
        return;
    }

    {
        CoordinationLock lock(mutex_);
        if (!registry_.contains(request.task_id)) {
            log_event(StructuredLogger::Level::Info, "session.request.moot", {{"task_id", request.task_id}});
            registry_.release_request(request.task_id);
            return;
        }
    }

    if (!outcome.session->request_task(request)) {
        fail_task_request(request.task_id, "request not acknowledged");
    }
}

void TaskSessionCoordinator::fail_task_request(const TaskId& task_id, const std::string& reason) {
    CoordinationLock lock(mutex_);
    log_event(StructuredLogger::Level::Warning,
              "session.request.failed",
              {{"task_id", task_id}, {"reason", reason}});

    registry_.release_request(task_id);
    if (!registry_.contains(task_id)) {
        return;
    }

    scheduler_.task_request_rejected(task_id, std::string(kConnectionFailed));
    registry_.remove(task_id, clock_());
    log_event(StructuredLogger::Level::Warning, "registry.header.evicted", {{"task_id", task_id}});
}

bool TaskSessionCoordinator::on_task_request_result(const TaskId& task_id,
                                                    bool granted,
                                                    const SubtaskId& subtask_id,
                                                    const std::string& reason) {
    CoordinationLock lock(mutex_);
    const auto entry = registry_.active_entry(task_id);
    if (!entry.has_value()) {
        log_event(StructuredLogger::Level::Warning, "session.grant.unexpected", {{"task_id", task_id}});
        return false;
    }

    if (!granted) {
        log_event(StructuredLogger::Level::Info, "session.request.refused", {{"task_id", task_id}, {"reason", reason}});
        registry_.release_request(task_id);
        scheduler_.task_request_rejected(task_id, reason);
        return true;
    }

    if (subtask_id.empty()) {
        log_event(StructuredLogger::Level::Warning, "session.grant.invalid", {{"task_id", task_id}});
        return false;
    }

    ComputingRecord record{};
    record.task_id = task_id;
    record.owner_id = entry->header.owner_id;
    record.state = SubtaskState::ResourceGranted;
    const auto [it, inserted] = computing_.try_emplace(subtask_id, std::move(record));
    if (!inserted) {
        log_event(StructuredLogger::Level::Warning, "session.grant.duplicate", {{"subtask_id", subtask_id}});
        return false;
    }

    log_event(StructuredLogger::Level::Info,
              "session.request.granted",
              {{"task_id", task_id}, {"subtask_id", subtask_id}});
    return true;
}

bool TaskSessionCoordinator::request_resource(const SubtaskId& subtask_id,
                                              const std::string& resource_descriptor,
                                              const PeerEndpoint& owner) {
    if (!has_endpoint(owner)) {
        log_event(StructuredLogger::Level::Warning, "session.resource.invalid_owner", {{"subtask_id", subtask_id}});
        return false;
    }

    log_event(StructuredLogger::Level::Info,
              "session.resource.requested",
              {{"subtask_id", subtask_id}, {"owner", endpoint_to_string(owner.address, owner.port)}});

    sessions_.open_session(owner.address, owner.port,
        [this, subtask_id, resource_descriptor](network::SessionOutcome outcome) {
            handle_resource_session(outcome, subtask_id, resource_descriptor);
        });
    return true;
}

void TaskSessionCoordinator::handle_resource_session(const network::SessionOutcome& outcome,
                                                     const SubtaskId& subtask_id,
                                                     const std::string& resource_descriptor) {
    if (!outcome.connected || !outcome.session) {
        fail_resource_request(subtask_id, outcome.reason);
        return;
    }
    if (!outcome.session->request_resource(subtask_id, resource_descriptor)) {
        fail_resource_request(subtask_id, "resource request not acknowledged");
    }
}

void TaskSessionCoordinator::fail_resource_request(const SubtaskId& subtask_id, const std::string& reason) {
    CoordinationLock lock(mutex_);
    log_event(StructuredLogger::Level::Warning,
              "session.resource.connect_failed",
              {{"subtask_id", subtask_id}, {"reason", reason}});

    scheduler_.resource_request_rejected(subtask_id, std::string(kConnectionFailed));

    const auto it = computing_.find(subtask_id);
    if (it == computing_.end() || !registry_.contains(it->second.task_id)) {
        return;
    }
    registry_.remove(it->second.task_id, clock_());
    log_event(StructuredLogger::Level::Warning, "registry.header.evicted", {{"task_id", it->second.task_id}});
}

bool TaskSessionCoordinator::on_resource_request_result(const SubtaskId& subtask_id,
                                                        bool ok,
                                                        const std::string& reason) {
    CoordinationLock lock(mutex_);
    const auto it = computing_.find(subtask_id);
    if (it == computing_.end()) {
        log_event(StructuredLogger::Level::Warning, "session.resource.unexpected", {{"subtask_id", subtask_id}});
        return false;
    }

    if (!ok) {
        log_event(StructuredLogger::Level::Info,
                  "session.resource.rejected",
                  {{"subtask_id", subtask_id}, {"reason", reason}});
        scheduler_.resource_request_rejected(subtask_id, reason);
        return true;
    }

    it->second.state = SubtaskState::Computing;
    return true;
}

void TaskSessionCoordinator::submit_result(const SubtaskId& subtask_id,
                                           const TaskId& task_id,
                                           ResultPayload payload,
                                           std::string result_type,
                                           const PeerEndpoint& owner) {
    if (subtask_id.empty() || payload.empty() || result_type.empty() || !has_endpoint(owner)) {
        log_event(StructuredLogger::Level::Warning, "session.result.invalid", {{"subtask_id", subtask_id}});
        throw ValidationError("wrong result format for subtask " + subtask_id);
    }

    CoordinationLock lock(mutex_);
    if (const auto it = computing_.find(subtask_id); it != computing_.end()) {
        const auto state = it->second.state;
        if (state == SubtaskState::ResultSubmitted || is_terminal(state)) {
            log_event(StructuredLogger::Level::Error,
                      "session.result.duplicate",
                      {{"subtask_id", subtask_id}, {"state", std::string(subtask_state_to_string(state))}});
            throw DuplicateResultError("result for subtask " + subtask_id + " was already "
                                       + std::string(subtask_state_to_string(state)));
        }
    }

    results_.enqueue(subtask_id, task_id, std::move(payload), std::move(result_type), owner.address, owner.port);

    auto& record = computing_[subtask_id];
    record.task_id = task_id;
    if (record.owner_id.empty()) {
        record.owner_id = owner.peer_id;
    }
    record.state = SubtaskState::Computing;
}

void TaskSessionCoordinator::deliver_result(const WaitingTaskResult& result) {
    sessions_.open_session(result.owner_address, result.owner_port, [this, result](network::SessionOutcome outcome) {
        handle_result_session(outcome, result);
    });
}

void TaskSessionCoordinator::handle_result_session(const network::SessionOutcome& outcome,
                                                   const WaitingTaskResult& result) {
    if (!outcome.connected || !outcome.session) {
        log_event(StructuredLogger::Level::Warning,
                  "session.result.connect_failed",
                  {{"subtask_id", result.subtask_id}, {"reason", outcome.reason}});
        results_.mark_failed(result.subtask_id, result.attempt, clock_());
        return;
    }

    // The owner may answer with a verdict before report_result returns.
    if (!register_pending_verification(result)) {
        return;
    }

    if (!outcome.session->report_result(result, config_.listen_address, config_.listen_port)) {
        withdraw_pending_verification(result);
        results_.mark_failed(result.subtask_id, result.attempt, clock_());
        return;
    }

    results_.acknowledge(result.subtask_id);
}

bool TaskSessionCoordinator::register_pending_verification(const WaitingTaskResult& result) {
    CoordinationLock lock(mutex_);
    if (!results_.is_current_attempt(result.subtask_id, result.attempt)) {
        log_event(StructuredLogger::Level::Info,
                  "session.result.stale_attempt",
                  {{"subtask_id", result.subtask_id}, {"attempt", std::to_string(result.attempt)}});
        return false;
    }

    auto& record = computing_[result.subtask_id];
    if (is_terminal(record.state)) {
        log_event(StructuredLogger::Level::Error, "session.result.already_resolved", {{"subtask_id", result.subtask_id}});
        results_.acknowledge(result.subtask_id);
        return false;
    }
    record.task_id = result.task_id;
    record.state = SubtaskState::ResultSubmitted;
    pending_verifications_[result.subtask_id] = result.task_id;
    return true;
}

void TaskSessionCoordinator::withdraw_pending_verification(const WaitingTaskResult& result) {
    CoordinationLock lock(mutex_);
    if (!results_.is_current_attempt(result.subtask_id, result.attempt)) {
        return;
    }
    if (pending_verifications_.erase(result.subtask_id) == 0) {
        return;
    }
    auto& record = computing_[result.subtask_id];
    if (record.state == SubtaskState::ResultSubmitted) {
        record.state = SubtaskState::Computing;
    }
}

std::size_t TaskSessionCoordinator::flush_results(TimePoint now) {
    return results_.flush(now, [this](const WaitingTaskResult& result) {
        deliver_result(result);
    });
}

std::optional<TaskId> TaskSessionCoordinator::consume_verification(const SubtaskId& subtask_id) {
    if (const auto it = pending_verifications_.find(subtask_id); it != pending_verifications_.end()) {
        auto task_id = it->second;
        pending_verifications_.erase(it);
        return task_id;
    }

    const auto record = computing_.find(subtask_id);
    if (record != computing_.end() && is_terminal(record->second.state)) {
        log_event(StructuredLogger::Level::Error,
                  "verification.already_resolved",
                  {{"subtask_id", subtask_id},
                   {"state", std::string(subtask_state_to_string(record->second.state))}});
        throw AlreadyResolvedError("verification for subtask " + subtask_id + " was already consumed");
    }

    log_event(StructuredLogger::Level::Warning, "verification.unexpected", {{"subtask_id", subtask_id}});
    return std::nullopt;
}

bool TaskSessionCoordinator::verification_accepted(const SubtaskId& subtask_id, std::string_view reward) {
    CoordinationLock lock(mutex_);
    const auto task_id = consume_verification(subtask_id);
    if (!task_id.has_value()) {
        return false;
    }

    auto& record = computing_[subtask_id];
    record.state = SubtaskState::Accepted;
    const auto requester = record.owner_id;

    try {
        const auto amount = protocol::parse_reward(reward);
        if (!amount.has_value()) {
            throw PaymentError("reward '" + std::string(reward) + "' for subtask " + subtask_id + " is not an amount");
        }
        payments_.collect_reward(subtask_id, *amount);
        log_event(StructuredLogger::Level::Info,
                  "payment.reward.collected",
                  {{"subtask_id", subtask_id}, {"amount", std::to_string(*amount)}});
    } catch (const PaymentError& error) {
        log_event(StructuredLogger::Level::Warning,
                  "payment.reward.invalid",
                  {{"subtask_id", subtask_id}, {"error", error.what()}});
    }

    registry_.release_request(*task_id);
    ledger_.increase_requesting(requester);
    log_event(StructuredLogger::Level::Info, "verification.accepted", {{"subtask_id", subtask_id}, {"task_id", *task_id}});
    return true;
}

bool TaskSessionCoordinator::verification_rejected(const SubtaskId& subtask_id, const std::string& reason) {
    CoordinationLock lock(mutex_);
    const auto task_id = consume_verification(subtask_id);
    if (!task_id.has_value()) {
        return false;
    }

    auto& record = computing_[subtask_id];
    record.state = SubtaskState::Rejected;
    const auto requester = record.owner_id;

    registry_.release_request(*task_id);
    ledger_.decrease_requesting(requester);
    if (registry_.contains(*task_id)) {
        registry_.remove(*task_id, clock_());
    }
    log_event(StructuredLogger::Level::Info,
              "verification.rejected",
              {{"subtask_id", subtask_id}, {"task_id", *task_id}, {"reason", reason}});
    return true;
}

bool TaskSessionCoordinator::on_result_received(const SubtaskId& subtask_id,
                                                const TaskId& task_id,
                                                const PeerEndpoint& computing_peer) {
    CoordinationLock lock(mutex_);
    auto [it, inserted] = requested_.try_emplace(subtask_id);
    if (!inserted && is_terminal(it->second.state)) {
        log_event(StructuredLogger::Level::Warning, "session.result.late", {{"subtask_id", subtask_id}});
        return false;
    }

    it->second.task_id = task_id;
    it->second.computing_peer = computing_peer;
    it->second.state = SubtaskState::VerificationPending;
    log_event(StructuredLogger::Level::Info,
              "session.result.received",
              {{"subtask_id", subtask_id}, {"peer", computing_peer.peer_id}});
    return true;
}

TaskSessionCoordinator::RequesterRecord* TaskSessionCoordinator::resolve_result(const SubtaskId& subtask_id,
                                                                                SubtaskState outcome) {
    auto [it, inserted] = requested_.try_emplace(subtask_id);
    if (!inserted && is_terminal(it->second.state)) {
        log_event(StructuredLogger::Level::Error,
                  "verification.already_resolved",
                  {{"subtask_id", subtask_id},
                   {"state", std::string(subtask_state_to_string(it->second.state))}});
        throw AlreadyResolvedError("result for subtask " + subtask_id + " was already "
                                   + std::string(subtask_state_to_string(it->second.state)));
    }
    it->second.state = outcome;
    return &it->second;
}

std::optional<PaymentHandle> TaskSessionCoordinator::accept(const SubtaskId& subtask_id,
                                                            const PeerId& peer_id,
                                                            std::string_view reward) {
    std::optional<PaymentHandle> handle;
    std::optional<PeerEndpoint> payee;
    {
        CoordinationLock lock(mutex_);
        auto* record = resolve_result(subtask_id, SubtaskState::Accepted);

        try {
            const auto amount = reward.empty() ? payments_.reward_for(subtask_id) : protocol::parse_reward(reward);
            if (!amount.has_value()) {
                throw PaymentError(reward.empty()
                                       ? "no reward on record for subtask " + subtask_id
                                       : "reward '" + std::string(reward) + "' for subtask " + subtask_id + " is not an amount");
            }
            handle = payments_.pay(subtask_id, *amount);
            log_event(StructuredLogger::Level::Info,
                      "payment.sent",
                      {{"subtask_id", subtask_id}, {"amount", std::to_string(*amount)}, {"payment", handle->id}});
        } catch (const PaymentError& error) {
            log_event(StructuredLogger::Level::Warning,
                      "payment.reward.invalid",
                      {{"subtask_id", subtask_id}, {"error", error.what()}});
        }

        ledger_.increase_computing(peer_id, subtask_id);
        if (handle.has_value() && has_endpoint(record->computing_peer)) {
            payee = record->computing_peer;
        }
    }

    if (payee.has_value()) {
        const auto amount = handle->amount;
        notify_computing_peer(*payee, [subtask_id, amount](network::Session& session) {
            return session.send_reward(subtask_id, amount);
        }, "session.reward");
    }
    return handle;
}

void TaskSessionCoordinator::reject(const SubtaskId& subtask_id, const PeerId& peer_id, const std::string& reason) {
    std::optional<PeerEndpoint> computing_peer;
    {
        CoordinationLock lock(mutex_);
        auto* record = resolve_result(subtask_id, SubtaskState::Rejected);
        ledger_.decrease_computing(peer_id, subtask_id);
        log_event(StructuredLogger::Level::Info,
                  "verification.result_rejected",
                  {{"subtask_id", subtask_id}, {"peer", peer_id}, {"reason", reason}});
        if (has_endpoint(record->computing_peer)) {
            computing_peer = record->computing_peer;
        }
    }

    if (computing_peer.has_value()) {
        notify_computing_peer(*computing_peer, [subtask_id](network::Session& session) {
            return session.send_result_rejected(subtask_id);
        }, "session.result_rejected");
    }
}

void TaskSessionCoordinator::notify_computing_peer(const PeerEndpoint& peer,
                                                   std::function<bool(network::Session&)> send,
                                                   std::string_view event) {
    sessions_.open_session(peer.address, peer.port,
        [peer, send = std::move(send), event = std::string(event)](network::SessionOutcome outcome) {
            if (!outcome.connected || !outcome.session) {
                log_event(StructuredLogger::Level::Warning,
                          event + ".connect_failed",
                          {{"peer", peer.peer_id}, {"reason", outcome.reason}});
                return;
            }
            if (!send(*outcome.session)) {
                log_event(StructuredLogger::Level::Warning, event + ".not_acknowledged", {{"peer", peer.peer_id}});
            }
        });
}

std::optional<SubtaskState> TaskSessionCoordinator::computing_state(const SubtaskId& subtask_id) const {
    CoordinationLock lock(mutex_);
    const auto it = computing_.find(subtask_id);
    if (it == computing_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::optional<SubtaskState> TaskSessionCoordinator::requester_state(const SubtaskId& subtask_id) const {
    CoordinationLock lock(mutex_);
    const auto it = requested_.find(subtask_id);
    if (it == requested_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

bool TaskSessionCoordinator::awaiting_verification(const SubtaskId& subtask_id) const {
    CoordinationLock lock(mutex_);
    return pending_verifications_.contains(subtask_id);
}

std::size_t TaskSessionCoordinator::pending_verification_count() const {
    CoordinationLock lock(mutex_);
    return pending_verifications_.size();
}

TaskSessionCoordinator::CoordinationLock TaskSessionCoordinator::coordination_lock() const {
    return CoordinationLock(mutex_);
}

}  // namespace taskmarket

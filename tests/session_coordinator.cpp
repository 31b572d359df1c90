#include "taskmarket/Errors.hpp"
#include "taskmarket/core/TaskSessionCoordinator.hpp"
#include "test_access.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <string>

using namespace std::chrono_literals;
using taskmarket::SubtaskState;
using taskmarket::test::CoordinatorTestAccess;

namespace {

struct Harness {
    taskmarket::Config config{taskmarket::test::make_config()};
    taskmarket::test::FakeCapabilityFilter capabilities;
    taskmarket::test::FakeTaskOwnership ownership;
    taskmarket::test::RecordingReputation reputation;
    taskmarket::test::FakePaymentService payments;
    taskmarket::test::RecordingScheduler scheduler;
    taskmarket::test::FakeSessionOpener opener;
    taskmarket::test::ManualClock clock;
    taskmarket::TaskHeaderRegistry registry{config, capabilities, ownership};
    taskmarket::TrustLedger ledger{config, reputation, ownership};
    taskmarket::ResultDeliveryQueue results{config};
    taskmarket::TaskSessionCoordinator coordinator{
        config, registry, ledger, results, opener, payments, scheduler, clock.function()};

    void advertise(const taskmarket::TaskId& task_id, const std::string& address) {
        auto header = taskmarket::test::make_header(task_id);
        header.owner_address = address;
        auto guard = coordinator.coordination_lock();
        const bool added = registry.add(header, clock.now());
        assert(added);
    }

    taskmarket::PeerEndpoint owner_of(const taskmarket::TaskId& task_id, const std::string& address) const {
        return taskmarket::PeerEndpoint{"owner-" + task_id, address, 40102};
    }

    // request -> grant -> submit -> delivered, leaving a pending verification.
    void deliver(const taskmarket::TaskId& task_id, const taskmarket::SubtaskId& subtask_id, const std::string& address) {
        advertise(task_id, address);
        assert(coordinator.request_task(config.node_id, task_id, {}));
        assert(coordinator.on_task_request_result(task_id, true, subtask_id, ""));
        coordinator.submit_result(subtask_id, task_id, {0xAA, 0xBB}, "data", owner_of(task_id, address));
        clock.advance(1s);
        assert(coordinator.flush_results(clock.now()) == 1);
        assert(coordinator.awaiting_verification(subtask_id));
    }
};

bool near(double lhs, double rhs) {
    return std::fabs(lhs - rhs) < 1e-9;
}

void connection_failure_evicts_task() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    h.opener.unreachable.insert("10.0.0.1:40102");

    // Fail-fast: one refused connection drops the task for good.
    assert(h.coordinator.request_task("node-self", "T1", {}));
    assert(!h.registry.contains("T1"));
    assert(!h.registry.active_entry("T1").has_value());
    assert(h.registry.recently_removed("T1"));
    assert(h.scheduler.task_rejections.size() == 1);
    assert(h.scheduler.task_rejections[0].first == "T1");
    assert(h.scheduler.task_rejections[0].second == "Connection failed");
}

void unacknowledged_request_evicts_task() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    h.opener.session->acknowledge = false;
    assert(h.coordinator.request_task("node-self", "T1", {}));
    assert(h.opener.session->task_requests.size() == 1);
    assert(!h.registry.contains("T1"));
    assert(h.scheduler.task_rejections.size() == 1);
}

void unknown_task_is_not_requested() {
    Harness h;
    assert(!h.coordinator.request_task("node-self", "ghost", {}));
    assert(h.opener.attempts.empty());
    assert(h.scheduler.task_rejections.empty());
}

void moot_request_is_ignored() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    h.opener.deferred = true;
    h.opener.unreachable.insert("10.0.0.1:40102");
    assert(h.coordinator.request_task("node-self", "T1", {}));
    assert(h.registry.active_entry("T1")->outstanding_requests == 1);
    {
        auto guard = h.coordinator.coordination_lock();
        h.registry.remove("T1", h.clock.now());
    }
    assert(h.opener.complete_pending() == 1);
    assert(h.scheduler.task_rejections.empty());
    assert(!h.registry.active_entry("T1").has_value());
}

void grant_and_resources() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    taskmarket::ComputeCapabilities caps{};
    caps.num_cores = 8;
    assert(h.coordinator.request_task("node-self", "T1", caps));
    assert(h.opener.session->task_requests.size() == 1);
    assert(h.opener.session->task_requests[0].requester_id == "node-self");
    assert(h.opener.session->task_requests[0].capabilities.num_cores == 8);
    assert(h.registry.active_entry("T1")->outstanding_requests == 1);

    assert(!h.coordinator.on_task_request_result("nope", true, "S0", ""));
    assert(h.coordinator.on_task_request_result("T1", true, "S1", ""));
    assert(h.coordinator.computing_state("S1") == SubtaskState::ResourceGranted);
    assert(CoordinatorTestAccess::task_owner(h.coordinator, "S1") == std::optional<std::string>("owner-T1"));
    assert(!h.coordinator.on_task_request_result("T1", true, "S1", ""));

    assert(h.coordinator.request_resource("S1", "resources.zip", h.owner_of("T1", "10.0.0.1")));
    assert(h.opener.session->resource_requests.size() == 1);
    assert(h.opener.session->resource_requests[0].second == "resources.zip");
    assert(h.coordinator.on_resource_request_result("S1", true, ""));
    assert(h.coordinator.computing_state("S1") == SubtaskState::Computing);

    assert(h.coordinator.on_resource_request_result("S1", false, "disk full"));
    assert(h.scheduler.resource_rejections.size() == 1);
    assert(h.scheduler.resource_rejections[0].second == "disk full");
    assert(!h.coordinator.on_resource_request_result("S9", true, ""));

    // A refused request releases the slot and tells the scheduler why.
    assert(h.coordinator.request_task("node-self", "T1", caps));
    assert(h.registry.active_entry("T1")->outstanding_requests == 2);
    assert(h.coordinator.on_task_request_result("T1", false, "", "no more subtasks"));
    assert(h.registry.active_entry("T1")->outstanding_requests == 1);
    assert(h.scheduler.task_rejections.back().second == "no more subtasks");
}

void resource_connection_failure_evicts_task() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    assert(h.coordinator.request_task("node-self", "T1", {}));
    assert(h.coordinator.on_task_request_result("T1", true, "S1", ""));

    h.opener.unreachable.insert("10.0.0.1:40102");
    assert(h.coordinator.request_resource("S1", "resources.zip", h.owner_of("T1", "10.0.0.1")));
    assert(h.scheduler.resource_rejections.size() == 1);
    assert(h.scheduler.resource_rejections[0].first == "S1");
    assert(h.scheduler.resource_rejections[0].second == "Connection failed");
    assert(!h.registry.contains("T1"));
}

void result_submission() {
    Harness h;
    const auto owner = h.owner_of("T1", "10.0.0.1");

    bool threw = false;
    try {
        h.coordinator.submit_result("S1", "T1", {}, "data", owner);
    } catch (const taskmarket::ValidationError&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        h.coordinator.submit_result("S1", "T1", {0x01}, "", owner);
    } catch (const taskmarket::ValidationError&) {
        threw = true;
    }
    assert(threw);
    assert(h.results.size() == 0);

    // An unreachable owner keeps the result queued with the backoff ceiling.
    h.opener.unreachable.insert("10.0.0.1:40102");
    h.coordinator.submit_result("S1", "T1", {0x01}, "data", owner);
    assert(h.coordinator.flush_results(h.clock.now()) == 1);
    assert(h.results.size() == 1);
    assert(h.results.find("S1")->retry_delay == h.config.max_result_resend_delay);
    assert(!h.coordinator.awaiting_verification("S1"));

    threw = false;
    try {
        h.coordinator.submit_result("S1", "T1", {0x01}, "data", owner);
    } catch (const taskmarket::DuplicateResultError&) {
        threw = true;
    }
    assert(threw);

    // Once the owner is back the next due flush delivers it.
    h.opener.unreachable.clear();
    h.clock.advance(10s);
    assert(h.coordinator.flush_results(h.clock.now()) == 0);
    h.clock.advance(h.config.max_result_resend_delay);
    assert(h.coordinator.flush_results(h.clock.now()) == 1);
    assert(h.results.size() == 0);
    assert(h.opener.session->reported_results.size() == 1);
    assert(h.opener.session->reply_endpoints[0].first == "10.0.0.99");
    assert(h.opener.session->reply_endpoints[0].second == 40103);
    assert(h.coordinator.computing_state("S1") == SubtaskState::ResultSubmitted);
    assert(CoordinatorTestAccess::pending_task(h.coordinator, "S1") == std::optional<std::string>("T1"));
}

void accepted_verification() {
    taskmarket::test::LogCapture log;
    Harness h;
    h.deliver("T1", "S1", "10.0.0.1");

    assert(h.coordinator.verification_accepted("S1", "40"));
    assert(h.coordinator.computing_state("S1") == SubtaskState::Accepted);
    assert(!h.coordinator.awaiting_verification("S1"));
    assert(h.payments.collected.size() == 1);
    assert(h.payments.collected[0].second == 40);
    assert(h.reputation.deltas.size() == 1);
    assert(h.reputation.deltas[0].peer == "owner-T1");
    assert(h.reputation.deltas[0].role == taskmarket::TrustRole::Requesting);
    assert(near(h.reputation.deltas[0].delta, 1.0));
    assert(h.registry.active_entry("T1")->outstanding_requests == 0);
    assert(h.registry.contains("T1"));

    // Garbled reward: no payment, trust still moves.
    h.deliver("T2", "S2", "10.0.0.2");
    assert(h.coordinator.verification_accepted("S2", "lots"));
    assert(h.payments.collected.size() == 1);
    assert(h.reputation.deltas.size() == 2);
    assert(log.contains("payment.reward.invalid"));

    assert(!h.coordinator.verification_accepted("never-sent", "1"));
}

void rejected_verification() {
    Harness h;
    h.deliver("T1", "S1", "10.0.0.1");

    assert(h.coordinator.verification_rejected("S1", "wrong result"));
    assert(h.coordinator.computing_state("S1") == SubtaskState::Rejected);
    assert(!h.registry.contains("T1"));
    assert(!h.registry.active_entry("T1").has_value());
    assert(h.reputation.deltas.size() == 1);
    assert(near(h.reputation.deltas[0].delta, -1.0));
}

void verification_consumed_once() {
    taskmarket::test::LogCapture log;
    Harness h;
    h.deliver("T1", "S1", "10.0.0.1");
    assert(h.coordinator.verification_rejected("S1", "mismatch"));

    bool threw = false;
    try {
        h.coordinator.verification_accepted("S1", "10");
    } catch (const taskmarket::AlreadyResolvedError& error) {
        threw = true;
        assert(error.code() == "E_ALREADY_RESOLVED");
    }
    assert(threw);
    assert(log.contains("verification.already_resolved"));

    threw = false;
    try {
        h.coordinator.verification_rejected("S1", "again");
    } catch (const taskmarket::AlreadyResolvedError&) {
        threw = true;
    }
    assert(threw);
    assert(h.reputation.deltas.size() == 1);
    assert(h.payments.collected.empty());
}

void resubmitting_a_delivered_result_fails() {
    Harness h;
    h.deliver("T1", "S1", "10.0.0.1");
    const auto owner = h.owner_of("T1", "10.0.0.1");

    bool threw = false;
    try {
        h.coordinator.submit_result("S1", "T1", {0x01}, "data", owner);
    } catch (const taskmarket::DuplicateResultError&) {
        threw = true;
    }
    assert(threw);
    assert(h.results.size() == 0);

    assert(h.coordinator.verification_accepted("S1", "5"));
    threw = false;
    try {
        h.coordinator.submit_result("S1", "T1", {0x01}, "data", owner);
    } catch (const taskmarket::DuplicateResultError&) {
        threw = true;
    }
    assert(threw);
    assert(h.results.size() == 0);
    assert(h.coordinator.flush_results(h.clock.now() + 1h) == 0);
    assert(!h.coordinator.awaiting_verification("S1"));
    assert(h.payments.collected.size() == 1);
    assert(h.reputation.deltas.size() == 1);
}

void verdict_during_report_is_consumed() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    assert(h.coordinator.request_task(h.config.node_id, "T1", {}));
    assert(h.coordinator.on_task_request_result("T1", true, "S1", ""));

    bool answered = false;
    h.opener.session->on_report = [&](const taskmarket::WaitingTaskResult& result) {
        answered = h.coordinator.verification_accepted(result.subtask_id, "9");
    };
    h.coordinator.submit_result("S1", "T1", {0x01}, "data", h.owner_of("T1", "10.0.0.1"));
    assert(h.coordinator.flush_results(h.clock.now()) == 1);

    assert(answered);
    assert(h.coordinator.computing_state("S1") == SubtaskState::Accepted);
    assert(!h.coordinator.awaiting_verification("S1"));
    assert(h.coordinator.pending_verification_count() == 0);
    assert(h.results.size() == 0);
    assert(h.registry.active_entry("T1")->outstanding_requests == 0);
    assert(h.payments.collected.size() == 1);
}

void unacknowledged_report_withdraws_verification() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    h.opener.session->acknowledge = false;
    h.coordinator.submit_result("S1", "T1", {0x01}, "data", h.owner_of("T1", "10.0.0.1"));
    assert(h.coordinator.flush_results(h.clock.now()) == 1);
    assert(h.opener.session->reported_results.size() == 1);
    assert(!h.coordinator.awaiting_verification("S1"));
    assert(h.coordinator.computing_state("S1") == SubtaskState::Computing);
    assert(h.results.size() == 1);
    assert(!h.results.find("S1")->in_flight);
}

void superseded_attempt_does_not_report() {
    Harness h;
    h.advertise("T1", "10.0.0.1");
    h.opener.deferred = true;
    h.coordinator.submit_result("S1", "T1", {0x01}, "data", h.owner_of("T1", "10.0.0.1"));
    assert(h.coordinator.flush_results(h.clock.now()) == 1);

    // The first connection hangs past the delivery timeout; a second starts.
    h.clock.advance(h.config.result_delivery_timeout);
    assert(h.coordinator.flush_results(h.clock.now()) == 0);
    h.clock.advance(h.config.max_result_resend_delay + 1s);
    assert(h.coordinator.flush_results(h.clock.now()) == 1);
    assert(h.opener.pending_count() == 2);

    assert(h.opener.complete_pending() == 2);
    assert(h.opener.session->reported_results.size() == 1);
    assert(h.opener.session->reported_results[0].attempt == 2);
    assert(h.results.size() == 0);
    assert(h.coordinator.pending_verification_count() == 1);
}

}  // namespace

int main() {
    connection_failure_evicts_task();
    unacknowledged_request_evicts_task();
    unknown_task_is_not_requested();
    moot_request_is_ignored();
    grant_and_resources();
    resource_connection_failure_evicts_task();
    result_submission();
    accepted_verification();
    rejected_verification();
    verification_consumed_once();
    resubmitting_a_delivered_result_fails();
    verdict_during_report_is_consumed();
    unacknowledged_report_withdraws_verification();
    superseded_attempt_does_not_report();
    return 0;
}

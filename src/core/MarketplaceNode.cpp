#include "taskmarket/core/MarketplaceNode.hpp"

#include "taskmarket/Errors.hpp"
#include "taskmarket/daemon/StructuredLogger.hpp"
#include "taskmarket/protocol/HeaderFields.hpp"

#include <chrono>
#include <exception>

namespace taskmarket {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

std::chrono::milliseconds sanitize_interval(std::chrono::milliseconds interval) {
    if (interval <= std::chrono::milliseconds::zero()) {
        return std::chrono::seconds(1);
    }
    return interval;
}

}  // namespace

MarketplaceNode::MarketplaceNode(Config config,
                                 NodeCollaborators collaborators,
                                 TaskSessionCoordinator::ClockFunction clock)
    : config_(std::move(config)),
      collaborators_(collaborators),
      registry_(config_, collaborators_.capabilities, collaborators_.ownership),
      ledger_(config_, collaborators_.reputation, collaborators_.ownership),
      results_(config_),
      coordinator_(config_,
                   registry_,
                   ledger_,
                   results_,
                   collaborators_.sessions,
                   collaborators_.payments,
                   collaborators_.scheduler,
                   std::move(clock)) {
    config_.sync_interval = sanitize_interval(config_.sync_interval);
}

MarketplaceNode::~MarketplaceNode() {
    stop();
}

void MarketplaceNode::tick() {
    tick(coordinator_.now());
}

void MarketplaceNode::tick(TimePoint now) {
    {
        auto lock = coordinator_.coordination_lock();
        registry_.tick(now);
    }

    const auto dispatched = coordinator_.flush_results(now);
    if (dispatched > 0) {
        log_event(StructuredLogger::Level::Debug, "node.results.flushed", {{"count", std::to_string(dispatched)}});
    }

    sweep_overdue_payments(now);
    run_sync_hooks();
}

void MarketplaceNode::sweep_overdue_payments(TimePoint now) {
    const auto overdue = collaborators_.payments.overdue_payers(now);
    if (overdue.empty()) {
        return;
    }

    auto lock = coordinator_.coordination_lock();
    for (const auto& peer : overdue) {
        log_event(StructuredLogger::Level::Warning, "payment.overdue", {{"peer", peer}});
        ledger_.decrease_requesting(peer);
    }
}

void MarketplaceNode::add_sync_hook(std::string name, SyncHook hook) {
    if (!hook) {
        return;
    }
    std::scoped_lock lock(hooks_mutex_);
    sync_hooks_.emplace_back(std::move(name), std::move(hook));
}

void MarketplaceNode::run_sync_hooks() {
    std::vector<std::pair<std::string, SyncHook>> hooks;
    {
        std::scoped_lock lock(hooks_mutex_);
        hooks = sync_hooks_;
    }

    for (const auto& [name, hook] : hooks) {
        try {
            hook();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Error,
                      "node.sync_hook.failed",
                      {{"hook", name}, {"error", ex.what()}});
        }
    }
}

void MarketplaceNode::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&MarketplaceNode::sync_loop, this);
    log_event(StructuredLogger::Level::Info,
              "node.started",
              {{"node_id", config_.node_id},
               {"interval_ms", std::to_string(config_.sync_interval.count())}});
}

void MarketplaceNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(wake_mutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    log_event(StructuredLogger::Level::Info, "node.stopped", {{"node_id", config_.node_id}});
}

void MarketplaceNode::sync_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            tick();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Error, "node.tick.failed", {{"error", ex.what()}});
        }

        std::unique_lock lock(wake_mutex_);
        wake_.wait_for(lock, config_.sync_interval, [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

bool MarketplaceNode::on_task_header_received(const HeaderFields& fields) {
    try {
        auto header = protocol::parse_task_header(fields, coordinator_.now());
        auto lock = coordinator_.coordination_lock();
        return registry_.add(std::move(header), coordinator_.now());
    } catch (const ValidationError& error) {
        log_event(StructuredLogger::Level::Warning, "registry.header.invalid", {{"error", error.what()}});
        return false;
    }
}

bool MarketplaceNode::on_task_request_result(const TaskId& task_id,
                                             bool granted,
                                             const SubtaskId& subtask_id,
                                             const std::string& reason) {
    return coordinator_.on_task_request_result(task_id, granted, subtask_id, reason);
}

bool MarketplaceNode::on_resource_request_result(const SubtaskId& subtask_id, bool ok, const std::string& reason) {
    return coordinator_.on_resource_request_result(subtask_id, ok, reason);
}

bool MarketplaceNode::on_verification_result(const SubtaskId& subtask_id,
                                             bool accepted,
                                             std::string_view reward_or_reason) {
    if (accepted) {
        return coordinator_.verification_accepted(subtask_id, reward_or_reason);
    }
    return coordinator_.verification_rejected(subtask_id, std::string(reward_or_reason));
}

bool MarketplaceNode::on_result_received(const SubtaskId& subtask_id,
                                         const TaskId& task_id,
                                         const PeerEndpoint& computing_peer) {
    return coordinator_.on_result_received(subtask_id, task_id, computing_peer);
}

std::vector<HeaderFields> MarketplaceNode::list_known_tasks() const {
    std::vector<HeaderFields> listing;
    {
        auto lock = coordinator_.coordination_lock();
        for (const auto& header : registry_.snapshot()) {
            listing.push_back(protocol::header_to_fields(header));
        }
    }
    for (const auto& header : collaborators_.ownership.local_headers()) {
        listing.push_back(protocol::header_to_fields(header));
    }
    return listing;
}

std::optional<TaskId> MarketplaceNode::request_random_task(const ComputeCapabilities& capabilities) {
    std::optional<TaskId> task_id;
    {
        auto lock = coordinator_.coordination_lock();
        task_id = registry_.pick_random_supported();
    }
    if (!task_id.has_value()) {
        log_event(StructuredLogger::Level::Debug, "node.request.no_supported_task");
        return std::nullopt;
    }
    if (!coordinator_.request_task(config_.node_id, *task_id, capabilities)) {
        return std::nullopt;
    }
    return task_id;
}

}  // namespace taskmarket

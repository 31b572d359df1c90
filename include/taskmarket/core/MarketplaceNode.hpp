#pragma once

#include "taskmarket/Config.hpp"
#include "taskmarket/Export.hpp"
#include "taskmarket/Types.hpp"
#include "taskmarket/core/Collaborators.hpp"
#include "taskmarket/core/TaskSessionCoordinator.hpp"
#include "taskmarket/delivery/ResultDeliveryQueue.hpp"
#include "taskmarket/network/Session.hpp"
#include "taskmarket/registry/TaskHeaderRegistry.hpp"
#include "taskmarket/trust/TrustLedger.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace taskmarket {

// External services the node drives but does not own.
struct NodeCollaborators {
    network::SessionOpener& sessions;
    PaymentService& payments;
    ReputationSink& reputation;
    CapabilityFilter& capabilities;
    TaskOwnership& ownership;
    LocalScheduler& scheduler;
};

class TASKMARKET_API MarketplaceNode {
public:
    using SyncHook = std::function<void()>;

    MarketplaceNode(Config config,
                    NodeCollaborators collaborators,
                    TaskSessionCoordinator::ClockFunction clock = &Clock::now);
    ~MarketplaceNode();

    MarketplaceNode(const MarketplaceNode&) = delete;
    MarketplaceNode& operator=(const MarketplaceNode&) = delete;

    // One synchronization pass: expire headers, flush queued results, sweep
    // overdue payers, then run the sync hooks in registration order. A hook
    // that throws is logged and the remaining hooks still run.
    void tick(TimePoint now);
    void tick();

    // Runs tick() every sync_interval on a worker thread until stop().
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    void add_sync_hook(std::string name, SyncHook hook);

    // Inbound messages.
    bool on_task_header_received(const HeaderFields& fields);
    bool on_task_request_result(const TaskId& task_id,
                                bool granted,
                                const SubtaskId& subtask_id,
                                const std::string& reason);
    bool on_resource_request_result(const SubtaskId& subtask_id, bool ok, const std::string& reason);
    bool on_verification_result(const SubtaskId& subtask_id, bool accepted, std::string_view reward_or_reason);
    bool on_result_received(const SubtaskId& subtask_id, const TaskId& task_id, const PeerEndpoint& computing_peer);

    // Outbound.
    std::vector<HeaderFields> list_known_tasks() const;
    std::optional<TaskId> request_random_task(const ComputeCapabilities& capabilities);

    const Config& config() const noexcept { return config_; }
    TaskHeaderRegistry& registry() noexcept { return registry_; }
    TrustLedger& ledger() noexcept { return ledger_; }
    ResultDeliveryQueue& results() noexcept { return results_; }
    TaskSessionCoordinator& coordinator() noexcept { return coordinator_; }

private:
    Config config_;
    NodeCollaborators collaborators_;
    TaskHeaderRegistry registry_;
    TrustLedger ledger_;
    ResultDeliveryQueue results_;
    TaskSessionCoordinator coordinator_;

    std::vector<std::pair<std::string, SyncHook>> sync_hooks_;
    std::mutex hooks_mutex_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    void sweep_overdue_payments(TimePoint now);
    void run_sync_hooks();
    void sync_loop();
};

}  // namespace taskmarket

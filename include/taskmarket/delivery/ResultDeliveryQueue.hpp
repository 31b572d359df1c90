#pragma once

#include "taskmarket/Config.hpp"
#include "taskmarket/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace taskmarket {

// Computed results waiting to reach their task owner. An entry leaves the
// queue only through acknowledge(); a failed attempt puts it back with the
// fixed resend delay.
class ResultDeliveryQueue {
public:
    using Dispatch = std::function<void(const WaitingTaskResult&)>;

    explicit ResultDeliveryQueue(const Config& config);

    ResultDeliveryQueue(const ResultDeliveryQueue&) = delete;
    ResultDeliveryQueue& operator=(const ResultDeliveryQueue&) = delete;

    // Throws DuplicateResultError when subtask_id is already queued.
    void enqueue(const SubtaskId& subtask_id,
                 const TaskId& task_id,
                 ResultPayload payload,
                 std::string result_type,
                 std::string owner_address,
                 std::uint16_t owner_port);

    // Starts one attempt for every idle entry whose resend delay elapsed.
    // The lock is released before dispatch runs, so dispatch may call
    // acknowledge() or mark_failed() synchronously. Returns the number of
    // attempts started.
    std::size_t flush(TimePoint now, const Dispatch& dispatch);

    bool acknowledge(const SubtaskId& subtask_id);
    // No-op unless attempt is the one currently in flight.
    bool mark_failed(const SubtaskId& subtask_id, std::uint64_t attempt, TimePoint now);
    [[nodiscard]] bool is_current_attempt(const SubtaskId& subtask_id, std::uint64_t attempt) const;

    [[nodiscard]] std::optional<WaitingTaskResult> find(const SubtaskId& subtask_id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t in_flight_count() const;
    [[nodiscard]] std::chrono::seconds max_resend_delay() const noexcept { return max_resend_delay_; }

private:
    std::chrono::seconds max_resend_delay_;
    std::chrono::seconds delivery_timeout_;
    std::map<SubtaskId, WaitingTaskResult> entries_;
    mutable std::mutex mutex_;
};

}  // namespace taskmarket

#include "taskmarket/delivery/ResultDeliveryQueue.hpp"

#include "taskmarket/Errors.hpp"
#include "taskmarket/daemon/StructuredLogger.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace taskmarket {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

constexpr std::chrono::seconds kMinResendDelay{std::chrono::seconds{1}};

std::chrono::seconds sanitize_delay(std::chrono::seconds value) {
    if (value < kMinResendDelay) {
        return kMinResendDelay;
    }
    return value;
}

void release_for_retry(WaitingTaskResult& entry, TimePoint now, std::chrono::seconds delay) {
    entry.in_flight = false;
    entry.last_send_attempt = now;
    entry.retry_delay = delay;
}

}  // namespace

ResultDeliveryQueue::ResultDeliveryQueue(const Config& config)
    : max_resend_delay_(sanitize_delay(config.max_result_resend_delay)),
      delivery_timeout_(sanitize_delay(config.result_delivery_timeout)) {}

void ResultDeliveryQueue::enqueue(const SubtaskId& subtask_id,
                                  const TaskId& task_id,
                                  ResultPayload payload,
                                  std::string result_type,
                                  std::string owner_address,
                                  std::uint16_t owner_port) {
    std::scoped_lock lock(mutex_);
    if (entries_.contains(subtask_id)) {
        log_event(StructuredLogger::Level::Error, "delivery.result.duplicate", {{"subtask_id", subtask_id}});
        throw DuplicateResultError("result for subtask " + subtask_id + " is already queued");
    }

    WaitingTaskResult entry{};
    entry.subtask_id = subtask_id;
    entry.task_id = task_id;
    entry.payload = std::move(payload);
    entry.result_type = std::move(result_type);
    entry.owner_address = std::move(owner_address);
    entry.owner_port = owner_port;
    entries_.emplace(subtask_id, std::move(entry));

    log_event(StructuredLogger::Level::Info,
              "delivery.result.queued",
              {{"subtask_id", subtask_id}, {"owner", endpoint_to_string(entries_.at(subtask_id).owner_address, owner_port)}});
}

std::size_t ResultDeliveryQueue::flush(TimePoint now, const Dispatch& dispatch) {
    std::vector<WaitingTaskResult> ready;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [subtask_id, entry] : entries_) {
            if (entry.in_flight) {
                if (now - entry.dispatched_at < delivery_timeout_) {
                    continue;
                }
                log_event(StructuredLogger::Level::Warning,
                          "delivery.result.timeout",
                          {{"subtask_id", subtask_id}});
                release_for_retry(entry, now, max_resend_delay_);
                continue;
            }
            if (now - entry.last_send_attempt <= entry.retry_delay) {
                continue;
            }
            entry.in_flight = true;
            entry.dispatched_at = now;
            entry.attempt += 1;
            ready.push_back(entry);
        }
    }

    for (const auto& entry : ready) {
        try {
            dispatch(entry);
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Warning,
                      "delivery.result.dispatch_error",
                      {{"subtask_id", entry.subtask_id}, {"error", ex.what()}});
            mark_failed(entry.subtask_id, entry.attempt, now);
        }
    }
    return ready.size();
}

bool ResultDeliveryQueue::acknowledge(const SubtaskId& subtask_id) {
    std::scoped_lock lock(mutex_);
    if (entries_.erase(subtask_id) == 0) {
        return false;
    }
    log_event(StructuredLogger::Level::Info, "delivery.result.delivered", {{"subtask_id", subtask_id}});
    return true;
}

bool ResultDeliveryQueue::mark_failed(const SubtaskId& subtask_id, std::uint64_t attempt, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(subtask_id);
    if (it == entries_.end()) {
        return false;
    }
    if (!it->second.in_flight || it->second.attempt != attempt) {
        log_event(StructuredLogger::Level::Debug,
                  "delivery.result.stale_failure",
                  {{"subtask_id", subtask_id}, {"attempt", std::to_string(attempt)}});
        return false;
    }
    release_for_retry(it->second, now, max_resend_delay_);
    log_event(StructuredLogger::Level::Warning,
              "delivery.result.failed",
              {{"subtask_id", subtask_id}, {"retry_in_s", std::to_string(max_resend_delay_.count())}});
    return true;
}

bool ResultDeliveryQueue::is_current_attempt(const SubtaskId& subtask_id, std::uint64_t attempt) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(subtask_id);
    return it != entries_.end() && it->second.in_flight && it->second.attempt == attempt;
}

std::optional<WaitingTaskResult> ResultDeliveryQueue::find(const SubtaskId& subtask_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(subtask_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ResultDeliveryQueue::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

std::size_t ResultDeliveryQueue::in_flight_count() const {
    std::scoped_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& [subtask_id, entry] : entries_) {
        if (entry.in_flight) {
            ++count;
        }
    }
    return count;
}

}  // namespace taskmarket

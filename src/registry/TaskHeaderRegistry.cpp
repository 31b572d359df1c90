#include "taskmarket/registry/TaskHeaderRegistry.hpp"

#include "taskmarket/daemon/StructuredLogger.hpp"
#include "taskmarket/protocol/HeaderFields.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace taskmarket {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

constexpr std::chrono::seconds kMinRemovedCooldown{std::chrono::seconds{1}};

std::chrono::seconds sanitize_cooldown(std::chrono::seconds value) {
    if (value < kMinRemovedCooldown) {
        return kMinRemovedCooldown;
    }
    return value;
}

std::mt19937::result_type seed_from_config(const Config& config) {
    if (config.rng_seed.has_value()) {
        return static_cast<std::mt19937::result_type>(*config.rng_seed);
    }
    std::random_device rd;
    return rd();
}

}  // namespace

TaskHeaderRegistry::TaskHeaderRegistry(const Config& config,
                                       const CapabilityFilter& capabilities,
                                       const TaskOwnership& ownership)
    : capabilities_(capabilities),
      ownership_(ownership),
      removed_cooldown_(sanitize_cooldown(config.removed_task_cooldown)),
      rng_(seed_from_config(config)) {}

bool TaskHeaderRegistry::add(TaskHeader header, TimePoint now) {
    protocol::validate_task_header(header);

    const auto& task_id = header.task_id;
    if (headers_.contains(task_id) || ownership_.owns(task_id)) {
        return false;
    }
    if (const auto it = removed_.find(task_id); it != removed_.end()) {
        if (now - it->second <= removed_cooldown_) {
            return false;
        }
        removed_.erase(it);
    }

    const bool supported = capabilities_.supports(header);
    log_event(StructuredLogger::Level::Info,
              "registry.header.added",
              {{"task_id", task_id},
               {"owner", header.owner_id},
               {"environment", header.environment},
               {"supported", supported ? "true" : "false"}});

    header.last_checked = now;
    const auto key = task_id;
    headers_.emplace(key, std::move(header));
    if (supported) {
        supported_.push_back(key);
    }
    return true;
}

void TaskHeaderRegistry::remove(const TaskId& task_id, TimePoint now) {
    if (headers_.erase(task_id) > 0) {
        log_event(StructuredLogger::Level::Info, "registry.header.removed", {{"task_id", task_id}});
    }
    supported_.erase(std::remove(supported_.begin(), supported_.end(), task_id), supported_.end());
    removed_[task_id] = now;
    reap_if_idle(task_id);
}

void TaskHeaderRegistry::tick(TimePoint now) {
    std::vector<TaskId> expired;
    for (auto& [task_id, header] : headers_) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - header.last_checked);
        if (elapsed > std::chrono::milliseconds::zero()) {
            header.ttl -= elapsed;
            header.last_checked = now;
        }
        if (header.ttl <= std::chrono::milliseconds::zero()) {
            expired.push_back(task_id);
        }
    }

    for (const auto& task_id : expired) {
        log_event(StructuredLogger::Level::Warning, "registry.header.expired", {{"task_id", task_id}});
        remove(task_id, now);
    }

    for (auto it = removed_.begin(); it != removed_.end();) {
        if (now - it->second > removed_cooldown_) {
            it = removed_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<TaskId> TaskHeaderRegistry::pick_random_supported() {
    if (supported_.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, supported_.size() - 1);
    return supported_[pick(rng_)];
}

bool TaskHeaderRegistry::contains(const TaskId& task_id) const {
    return headers_.contains(task_id);
}

std::optional<TaskHeader> TaskHeaderRegistry::find(const TaskId& task_id) const {
    const auto it = headers_.find(task_id);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TaskHeaderRegistry::is_supported(const TaskId& task_id) const {
    return std::find(supported_.begin(), supported_.end(), task_id) != supported_.end();
}

bool TaskHeaderRegistry::recently_removed(const TaskId& task_id) const {
    return removed_.contains(task_id);
}

std::vector<TaskHeader> TaskHeaderRegistry::snapshot() const {
    std::vector<TaskHeader> headers;
    headers.reserve(headers_.size());
    for (const auto& [task_id, header] : headers_) {
        headers.push_back(header);
    }
    std::sort(headers.begin(), headers.end(), [](const TaskHeader& lhs, const TaskHeader& rhs) {
        return lhs.task_id < rhs.task_id;
    });
    return headers;
}

bool TaskHeaderRegistry::note_request(const TaskId& task_id) {
    if (auto it = active_.find(task_id); it != active_.end()) {
        it->second.outstanding_requests += 1;
        return true;
    }

    const auto header = headers_.find(task_id);
    if (header == headers_.end()) {
        return false;
    }

    ActiveTaskEntry entry{};
    entry.task_id = task_id;
    entry.header = header->second;
    entry.outstanding_requests = 1;
    active_.emplace(task_id, std::move(entry));
    return true;
}

bool TaskHeaderRegistry::release_request(const TaskId& task_id) {
    const auto it = active_.find(task_id);
    if (it == active_.end()) {
        return false;
    }
    if (it->second.outstanding_requests > 0) {
        it->second.outstanding_requests -= 1;
    }
    reap_if_idle(task_id);
    return true;
}

std::optional<ActiveTaskEntry> TaskHeaderRegistry::active_entry(const TaskId& task_id) const {
    const auto it = active_.find(task_id);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TaskHeaderRegistry::reap_if_idle(const TaskId& task_id) {
    const auto it = active_.find(task_id);
    if (it == active_.end()) {
        return;
    }
    if (it->second.outstanding_requests == 0 && !headers_.contains(task_id)) {
        active_.erase(it);
    }
}

}  // namespace taskmarket

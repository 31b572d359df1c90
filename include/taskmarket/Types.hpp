#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskmarket {

using PeerId = std::string;
using TaskId = std::string;
using SubtaskId = std::string;
using Reward = std::uint64_t;
using ResultPayload = std::vector<std::uint8_t>;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Wire shape of a task advertisement: field name -> textual value.
using HeaderFields = std::unordered_map<std::string, std::string>;

struct TaskHeader {
    TaskId task_id;
    PeerId owner_id;
    std::string owner_address;
    std::uint16_t owner_port{0};
    std::string environment;
    std::chrono::milliseconds ttl{0};
    TimePoint last_checked{};
    std::chrono::seconds subtask_timeout{0};
    std::string min_version;
};

struct ActiveTaskEntry {
    TaskId task_id;
    TaskHeader header;
    std::size_t outstanding_requests{0};
};

struct WaitingTaskResult {
    SubtaskId subtask_id;
    TaskId task_id;
    ResultPayload payload;
    std::string result_type;
    TimePoint last_send_attempt{};
    std::chrono::seconds retry_delay{0};
    std::string owner_address;
    std::uint16_t owner_port{0};
    bool in_flight{false};
    TimePoint dispatched_at{};
    // Numbers dispatches; completions of a superseded attempt are ignored.
    std::uint64_t attempt{0};
};

struct PeerEndpoint {
    PeerId peer_id;
    std::string address;
    std::uint16_t port{0};
};

struct ComputeCapabilities {
    double estimated_performance{0.0};
    std::uint64_t max_resource_size{0};
    std::uint64_t max_memory_size{0};
    std::uint32_t num_cores{0};
};

struct TaskRequest {
    PeerId requester_id;
    TaskId task_id;
    ComputeCapabilities capabilities;
};

enum class TrustRole {
    Computing,
    Requesting
};

enum class SubtaskState {
    Requested,
    ResourceGranted,
    Computing,
    ResultSubmitted,
    VerificationPending,
    Accepted,
    Rejected
};

std::string_view trust_role_to_string(TrustRole role) noexcept;
std::string_view subtask_state_to_string(SubtaskState state) noexcept;
bool is_terminal(SubtaskState state) noexcept;
std::string endpoint_to_string(const std::string& address, std::uint16_t port);

}  // namespace taskmarket

#pragma once

#include "taskmarket/Types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace taskmarket::network {

// Request/response channel to one peer. Every call returns true once the
// remote side acknowledged the message.
class Session {
public:
    virtual ~Session() = default;

    virtual bool request_task(const TaskRequest& request) = 0;
    virtual bool request_resource(const SubtaskId& subtask_id, const std::string& resource_descriptor) = 0;
    virtual bool report_result(const WaitingTaskResult& result,
                               const std::string& reply_address,
                               std::uint16_t reply_port) = 0;
    virtual bool send_reward(const SubtaskId& subtask_id, Reward amount) = 0;
    virtual bool send_result_rejected(const SubtaskId& subtask_id) = 0;
};

struct SessionOutcome {
    bool connected{false};
    std::string reason;
    std::shared_ptr<Session> session;
};

class SessionOpener {
public:
    using Completion = std::function<void(SessionOutcome)>;

    virtual ~SessionOpener() = default;

    // Starts connecting and returns without waiting. on_complete runs exactly
    // once, on any thread, possibly before open_session returns.
    virtual void open_session(const std::string& address, std::uint16_t port, Completion on_complete) = 0;
};

}  // namespace taskmarket::network

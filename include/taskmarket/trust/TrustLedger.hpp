#pragma once

#include "taskmarket/Config.hpp"
#include "taskmarket/Types.hpp"
#include "taskmarket/core/Collaborators.hpp"

#include <string_view>

namespace taskmarket {

// Turns verification outcomes into bounded trust deltas for the reputation
// sink. Computing trust is graded by the task's trust modifier; requesting
// trust always swings by max_trust.
class TrustLedger {
public:
    TrustLedger(const Config& config, ReputationSink& sink, const TaskOwnership& ownership);

    [[nodiscard]] double bounded_delta(double raw) const noexcept;

    void increase_computing(const PeerId& peer_id, const SubtaskId& subtask_id);
    void decrease_computing(const PeerId& peer_id, const SubtaskId& subtask_id);
    void increase_requesting(const PeerId& peer_id);
    void decrease_requesting(const PeerId& peer_id);

    [[nodiscard]] double min_trust() const noexcept { return min_trust_; }
    [[nodiscard]] double max_trust() const noexcept { return max_trust_; }

private:
    ReputationSink& sink_;
    const TaskOwnership& ownership_;
    double min_trust_;
    double max_trust_;

    void forward(const PeerId& peer_id, TrustRole role, double delta, std::string_view event);
};

}  // namespace taskmarket

#include "taskmarket/trust/ReputationBook.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace taskmarket {

ReputationBook::ReputationBook(const Config& config)
    : min_score_(std::min(config.min_trust, config.max_trust)),
      max_score_(std::max(config.min_trust, config.max_trust)),
      initial_score_(std::clamp(config.initial_trust, min_score_, max_score_)) {}

void ReputationBook::apply(const PeerId& peer_id, TrustRole role, double delta) {
    if (!std::isfinite(delta)) {
        return;
    }

    std::scoped_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(peer_id);
    auto& entry = it->second;
    if (inserted) {
        entry.computing = initial_score_;
        entry.requesting = initial_score_;
    }

    auto& value = role == TrustRole::Computing ? entry.computing : entry.requesting;
    value = std::clamp(value + delta, min_score_, max_score_);
    entry.last_update = std::chrono::steady_clock::now();
}

double ReputationBook::score(const PeerId& peer_id, TrustRole role) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(peer_id);
    if (it == entries_.end()) {
        return initial_score_;
    }
    return role == TrustRole::Computing ? it->second.computing : it->second.requesting;
}

std::size_t ReputationBook::peer_count() const noexcept {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

}  // namespace taskmarket

#include "taskmarket/trust/TrustLedger.hpp"

#include "taskmarket/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace taskmarket {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

std::pair<double, double> sanitize_bounds(double min_value, double max_value) {
    if (!std::isfinite(min_value)) {
        min_value = 0.0;
    }
    if (!std::isfinite(max_value)) {
        max_value = 1.0;
    }
    if (min_value > max_value) {
        std::swap(min_value, max_value);
    }
    return {min_value, max_value};
}

}  // namespace

TrustLedger::TrustLedger(const Config& config, ReputationSink& sink, const TaskOwnership& ownership)
    : sink_(sink),
      ownership_(ownership) {
    const auto [min_value, max_value] = sanitize_bounds(config.min_trust, config.max_trust);
    min_trust_ = min_value;
    max_trust_ = max_value;
}

double TrustLedger::bounded_delta(double raw) const noexcept {
    if (std::isnan(raw)) {
        return min_trust_;
    }
    return std::clamp(raw, min_trust_, max_trust_);
}

void TrustLedger::increase_computing(const PeerId& peer_id, const SubtaskId& subtask_id) {
    const auto delta = bounded_delta(ownership_.trust_modifier(subtask_id));
    forward(peer_id, TrustRole::Computing, delta, "trust.computing.increase");
}

void TrustLedger::decrease_computing(const PeerId& peer_id, const SubtaskId& subtask_id) {
    const auto delta = bounded_delta(ownership_.trust_modifier(subtask_id));
    forward(peer_id, TrustRole::Computing, -delta, "trust.computing.decrease");
}

void TrustLedger::increase_requesting(const PeerId& peer_id) {
    forward(peer_id, TrustRole::Requesting, max_trust_, "trust.requesting.increase");
}

void TrustLedger::decrease_requesting(const PeerId& peer_id) {
    forward(peer_id, TrustRole::Requesting, -max_trust_, "trust.requesting.decrease");
}

void TrustLedger::forward(const PeerId& peer_id, TrustRole role, double delta, std::string_view event) {
    if (peer_id.empty()) {
        log_event(StructuredLogger::Level::Warning, event, {{"reason", "unknown peer"}});
        return;
    }
    log_event(StructuredLogger::Level::Debug, event, {{"peer", peer_id}, {"delta", std::to_string(delta)}});
    sink_.apply(peer_id, role, delta);
}

}  // namespace taskmarket

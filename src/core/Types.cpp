#include "taskmarket/Types.hpp"

#include <string>

namespace taskmarket {

std::string_view trust_role_to_string(TrustRole role) noexcept {
    switch (role) {
        case TrustRole::Computing:
            return "computing";
        case TrustRole::Requesting:
            return "requesting";
    }
    return "computing";
}

std::string_view subtask_state_to_string(SubtaskState state) noexcept {
    switch (state) {
        case SubtaskState::Requested:
            return "requested";
        case SubtaskState::ResourceGranted:
            return "resource_granted";
        case SubtaskState::Computing:
            return "computing";
        case SubtaskState::ResultSubmitted:
            return "result_submitted";
        case SubtaskState::VerificationPending:
            return "verification_pending";
        case SubtaskState::Accepted:
            return "accepted";
        case SubtaskState::Rejected:
            return "rejected";
    }
    return "requested";
}

bool is_terminal(SubtaskState state) noexcept {
    return state == SubtaskState::Accepted || state == SubtaskState::Rejected;
}

std::string endpoint_to_string(const std::string& address, std::uint16_t port) {
    if (address.find(':') != std::string::npos) {
        return "[" + address + "]:" + std::to_string(port);
    }
    return address + ":" + std::to_string(port);
}

}  // namespace taskmarket

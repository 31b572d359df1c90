#pragma once

#include "taskmarket/Types.hpp"

#include <optional>
#include <string_view>

namespace taskmarket::protocol {

inline constexpr std::string_view kFieldId = "id";
inline constexpr std::string_view kFieldOwner = "clientId";
inline constexpr std::string_view kFieldAddress = "address";
inline constexpr std::string_view kFieldPort = "port";
inline constexpr std::string_view kFieldEnvironment = "environment";
inline constexpr std::string_view kFieldTtl = "ttl";
inline constexpr std::string_view kFieldSubtaskTimeout = "subtaskTimeout";
inline constexpr std::string_view kFieldMinVersion = "minVersion";

// Builds a header from an advertisement. Throws ValidationError when a
// required field is missing or does not parse. last_checked is set to now.
TaskHeader parse_task_header(const HeaderFields& fields, TimePoint now);

// Inverse of parse_task_header; ttl is rendered in (fractional) seconds.
HeaderFields header_to_fields(const TaskHeader& header);

// Rejects empty ids, port 0 and non-positive ttl.
void validate_task_header(const TaskHeader& header);

// Non-negative integral amount; anything else yields nullopt.
std::optional<Reward> parse_reward(std::string_view text);

}  // namespace taskmarket::protocol

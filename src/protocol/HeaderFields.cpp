#include "taskmarket/protocol/HeaderFields.hpp"

#include "taskmarket/Errors.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>

namespace taskmarket::protocol {

namespace {

const std::string& required_field(const HeaderFields& fields, std::string_view name) {
    const auto it = fields.find(std::string(name));
    if (it == fields.end()) {
        throw ValidationError("task header is missing field '" + std::string(name) + "'");
    }
    return it->second;
}

double parse_seconds(const std::string& text, std::string_view name) {
    double value = 0.0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        throw ValidationError("task header field '" + std::string(name) + "' is not a number: " + text);
    }
    return value;
}

// Largest magnitude in seconds that still fits in milliseconds.
constexpr double kMaxSeconds = static_cast<double>(std::numeric_limits<std::int64_t>::max() / 1000);

double parse_bounded_seconds(const std::string& text, std::string_view name) {
    const auto value = parse_seconds(text, name);
    if (std::fabs(value) > kMaxSeconds) {
        throw ValidationError("task header field '" + std::string(name) + "' is out of range: " + text);
    }
    return value;
}

std::uint16_t parse_port(const std::string& text) {
    unsigned long value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || value == 0
        || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ValidationError("task header port is invalid: " + text);
    }
    return static_cast<std::uint16_t>(value);
}

std::string format_seconds(std::chrono::milliseconds value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << static_cast<double>(value.count()) / 1000.0;
    return oss.str();
}

}  // namespace

TaskHeader parse_task_header(const HeaderFields& fields, TimePoint now) {
    TaskHeader header{};
    header.task_id = required_field(fields, kFieldId);
    header.owner_id = required_field(fields, kFieldOwner);
    header.owner_address = required_field(fields, kFieldAddress);
    header.owner_port = parse_port(required_field(fields, kFieldPort));
    header.environment = required_field(fields, kFieldEnvironment);

    const auto ttl_seconds = parse_bounded_seconds(required_field(fields, kFieldTtl), kFieldTtl);
    header.ttl = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(ttl_seconds * 1000.0)));

    const auto timeout = parse_bounded_seconds(required_field(fields, kFieldSubtaskTimeout), kFieldSubtaskTimeout);
    if (timeout < 0.0) {
        throw ValidationError("task header subtaskTimeout is negative");
    }
    header.subtask_timeout = std::chrono::seconds(static_cast<std::int64_t>(timeout));

    if (const auto it = fields.find(std::string(kFieldMinVersion)); it != fields.end()) {
        header.min_version = it->second;
    }
    header.last_checked = now;

    validate_task_header(header);
    return header;
}

HeaderFields header_to_fields(const TaskHeader& header) {
    HeaderFields fields;
    fields.emplace(kFieldId, header.task_id);
    fields.emplace(kFieldOwner, header.owner_id);
    fields.emplace(kFieldAddress, header.owner_address);
    fields.emplace(kFieldPort, std::to_string(header.owner_port));
    fields.emplace(kFieldEnvironment, header.environment);
    fields.emplace(kFieldTtl, format_seconds(header.ttl));
    fields.emplace(kFieldSubtaskTimeout, std::to_string(header.subtask_timeout.count()));
    fields.emplace(kFieldMinVersion, header.min_version);
    return fields;
}

void validate_task_header(const TaskHeader& header) {
    if (header.task_id.empty()) {
        throw ValidationError("task header has an empty id");
    }
    if (header.owner_id.empty()) {
        throw ValidationError("task header " + header.task_id + " has no owner");
    }
    if (header.owner_address.empty() || header.owner_port == 0) {
        throw ValidationError("task header " + header.task_id + " has no owner endpoint");
    }
    if (header.ttl <= std::chrono::milliseconds::zero()) {
        throw ValidationError("task header " + header.task_id + " is already expired");
    }
}

std::optional<Reward> parse_reward(std::string_view text) {
    Reward value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace taskmarket::protocol

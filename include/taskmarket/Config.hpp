#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace taskmarket {

struct Config {
    std::string node_id;
    std::string listen_address{"127.0.0.1"};
    std::uint16_t listen_port{0};
    std::chrono::seconds removed_task_cooldown{std::chrono::seconds(240)};
    std::chrono::seconds max_result_resend_delay{std::chrono::seconds(30)};
    std::chrono::seconds result_delivery_timeout{std::chrono::minutes(2)};
    std::chrono::milliseconds sync_interval{std::chrono::seconds(1)};
    double min_trust{0.0};
    double max_trust{1.0};
    double initial_trust{0.5};
    std::optional<std::uint32_t> rng_seed{};
};

}  // namespace taskmarket

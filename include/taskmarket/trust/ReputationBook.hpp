#pragma once

#include "taskmarket/Config.hpp"
#include "taskmarket/Types.hpp"
#include "taskmarket/core/Collaborators.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace taskmarket {

// In-memory ReputationSink: one score per peer and role, clamped to the
// configured trust bounds.
class ReputationBook final : public ReputationSink {
public:
    explicit ReputationBook(const Config& config = {});

    void apply(const PeerId& peer_id, TrustRole role, double delta) override;

    [[nodiscard]] double score(const PeerId& peer_id, TrustRole role) const;
    [[nodiscard]] std::size_t peer_count() const noexcept;

private:
    struct Entry {
        double computing{0.0};
        double requesting{0.0};
        std::chrono::steady_clock::time_point last_update{};
    };

    double min_score_;
    double max_score_;
    double initial_score_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace taskmarket
